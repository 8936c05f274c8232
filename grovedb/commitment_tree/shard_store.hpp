// Copyright (C) 2025 The GroveDB C++ Authors
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <grovedb/commitment_tree/config.hpp>

#include <grovedb/commitment_tree/node.hpp>
#include <grovedb/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <utility>
#include <vector>

GROVEDB_COMMITMENT_TREE_NAMESPACE_BEGIN

using CheckpointId = uint32_t;

struct Checkpoint
{
    /// Last leaf position when the checkpoint was taken, empty for an empty
    /// tree
    std::optional<uint64_t> position;
    /// Marks to drop once this checkpoint is pruned
    std::set<uint64_t> marks_removed;

    bool operator==(Checkpoint const &) const = default;
};

/*
 * Persistence for the sharded tree. Shards are the subtrees rooted at level
 * SHARD_HEIGHT, addressed by their index; the cap is the tree above them.
 */
class ShardStore
{
public:
    virtual ~ShardStore() = default;

    virtual Result<std::optional<Tree>> get_shard(uint64_t index) = 0;
    virtual Result<void> put_shard(uint64_t index, Tree const &) = 0;
    /// Highest shard index written so far
    virtual Result<std::optional<uint64_t>> last_shard_index() = 0;
    virtual Result<std::vector<uint64_t>> shard_indices() = 0;

    /// Nil while nothing was stored
    virtual Result<Tree> get_cap() = 0;
    virtual Result<void> put_cap(Tree const &) = 0;

    virtual Result<void> add_checkpoint(CheckpointId, Checkpoint const &) = 0;
    virtual Result<size_t> checkpoint_count() = 0;
    virtual Result<std::optional<CheckpointId>> min_checkpoint_id() = 0;
    virtual Result<std::optional<CheckpointId>> max_checkpoint_id() = 0;
    virtual Result<std::optional<Checkpoint>> get_checkpoint(CheckpointId) = 0;
    /// Depth 0 is the most recent checkpoint
    virtual Result<std::optional<std::pair<CheckpointId, Checkpoint>>>
    get_checkpoint_at_depth(size_t depth) = 0;
    /// Returns false when the checkpoint does not exist
    virtual Result<bool>
    update_checkpoint(CheckpointId, Checkpoint const &) = 0;
    virtual Result<void> remove_checkpoint(CheckpointId) = 0;
};

class MemoryShardStore final : public ShardStore
{
    std::map<uint64_t, Tree> shards_;
    Tree cap_{make_nil()};
    std::map<CheckpointId, Checkpoint> checkpoints_;

public:
    Result<std::optional<Tree>> get_shard(uint64_t index) override;
    Result<void> put_shard(uint64_t index, Tree const &) override;
    Result<std::optional<uint64_t>> last_shard_index() override;
    Result<std::vector<uint64_t>> shard_indices() override;

    Result<Tree> get_cap() override;
    Result<void> put_cap(Tree const &) override;

    Result<void> add_checkpoint(CheckpointId, Checkpoint const &) override;
    Result<size_t> checkpoint_count() override;
    Result<std::optional<CheckpointId>> min_checkpoint_id() override;
    Result<std::optional<CheckpointId>> max_checkpoint_id() override;
    Result<std::optional<Checkpoint>> get_checkpoint(CheckpointId) override;
    Result<std::optional<std::pair<CheckpointId, Checkpoint>>>
    get_checkpoint_at_depth(size_t depth) override;
    Result<bool> update_checkpoint(CheckpointId, Checkpoint const &) override;
    Result<void> remove_checkpoint(CheckpointId) override;
};

GROVEDB_COMMITMENT_TREE_NAMESPACE_END
