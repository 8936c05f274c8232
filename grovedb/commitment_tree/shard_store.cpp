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

#include <grovedb/commitment_tree/shard_store.hpp>

#include <grovedb/commitment_tree/commitment_tree_error.hpp>

#include <quill/Quill.h>

#include <iterator>

GROVEDB_COMMITMENT_TREE_NAMESPACE_BEGIN

Result<std::optional<Tree>> MemoryShardStore::get_shard(uint64_t const index)
{
    auto const it = shards_.find(index);
    if (it == shards_.end()) {
        return std::optional<Tree>{};
    }
    return std::optional<Tree>{it->second};
}

Result<void>
MemoryShardStore::put_shard(uint64_t const index, Tree const &shard)
{
    shards_.insert_or_assign(index, shard);
    return outcome::success();
}

Result<std::optional<uint64_t>> MemoryShardStore::last_shard_index()
{
    if (shards_.empty()) {
        return std::optional<uint64_t>{};
    }
    return std::optional<uint64_t>{shards_.rbegin()->first};
}

Result<std::vector<uint64_t>> MemoryShardStore::shard_indices()
{
    std::vector<uint64_t> out;
    out.reserve(shards_.size());
    for (auto const &[index, shard] : shards_) {
        out.push_back(index);
    }
    return out;
}

Result<Tree> MemoryShardStore::get_cap()
{
    return cap_;
}

Result<void> MemoryShardStore::put_cap(Tree const &cap)
{
    cap_ = cap;
    return outcome::success();
}

Result<void> MemoryShardStore::add_checkpoint(
    CheckpointId const id, Checkpoint const &checkpoint)
{
    if (!checkpoints_.emplace(id, checkpoint).second) {
        LOG_ERROR("checkpoint {} already exists", id);
        return CommitmentTreeError::checkpoint_out_of_order;
    }
    return outcome::success();
}

Result<size_t> MemoryShardStore::checkpoint_count()
{
    return checkpoints_.size();
}

Result<std::optional<CheckpointId>> MemoryShardStore::min_checkpoint_id()
{
    if (checkpoints_.empty()) {
        return std::optional<CheckpointId>{};
    }
    return std::optional<CheckpointId>{checkpoints_.begin()->first};
}

Result<std::optional<CheckpointId>> MemoryShardStore::max_checkpoint_id()
{
    if (checkpoints_.empty()) {
        return std::optional<CheckpointId>{};
    }
    return std::optional<CheckpointId>{checkpoints_.rbegin()->first};
}

Result<std::optional<Checkpoint>>
MemoryShardStore::get_checkpoint(CheckpointId const id)
{
    auto const it = checkpoints_.find(id);
    if (it == checkpoints_.end()) {
        return std::optional<Checkpoint>{};
    }
    return std::optional<Checkpoint>{it->second};
}

Result<std::optional<std::pair<CheckpointId, Checkpoint>>>
MemoryShardStore::get_checkpoint_at_depth(size_t const depth)
{
    using R = std::optional<std::pair<CheckpointId, Checkpoint>>;
    if (depth >= checkpoints_.size()) {
        return R{};
    }
    auto const it = std::next(checkpoints_.rbegin(), static_cast<long>(depth));
    return R{*it};
}

Result<bool> MemoryShardStore::update_checkpoint(
    CheckpointId const id, Checkpoint const &checkpoint)
{
    auto const it = checkpoints_.find(id);
    if (it == checkpoints_.end()) {
        return false;
    }
    it->second = checkpoint;
    return true;
}

Result<void> MemoryShardStore::remove_checkpoint(CheckpointId const id)
{
    checkpoints_.erase(id);
    return outcome::success();
}

GROVEDB_COMMITMENT_TREE_NAMESPACE_END
