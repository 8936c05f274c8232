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

#include <grovedb/commitment_tree/merkle_hash.hpp>
#include <grovedb/commitment_tree/node.hpp>
#include <grovedb/commitment_tree/shard_store.hpp>
#include <grovedb/core/bytes.hpp>
#include <grovedb/core/result.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

GROVEDB_COMMITMENT_TREE_NAMESPACE_BEGIN

struct CommitmentTreeConfig
{
    size_t max_checkpoints{100};
};

/// What to keep of a leaf once later leaves are appended
struct Retention
{
    enum class Kind : uint8_t
    {
        ephemeral,
        marked,
        checkpoint,
    };

    Kind kind{Kind::ephemeral};
    CheckpointId checkpoint_id{0};
    bool mark{false};

    static Retention ephemeral() noexcept
    {
        return {};
    }

    static Retention marked() noexcept
    {
        return {.kind = Kind::marked, .checkpoint_id = 0, .mark = true};
    }

    static Retention
    checkpoint(CheckpointId const id, bool const mark = false) noexcept
    {
        return {.kind = Kind::checkpoint, .checkpoint_id = id, .mark = mark};
    }

    uint8_t flags() const noexcept
    {
        uint8_t f = mark ? MARKED : EPHEMERAL;
        if (kind == Kind::checkpoint) {
            f |= CHECKPOINT;
        }
        return f;
    }
};

/// Authentication path of a leaf, siblings from the leaf level upwards
struct MerklePath
{
    uint64_t position;
    std::array<bytes32_t, DEPTH> auth_path;

    bytes32_t root(
        bytes32_t const &leaf,
        MerkleHasher const & = default_merkle_hasher()) const;
};

/// The path in the form Orchard spends consume it
struct OrchardMerklePath
{
    uint32_t position;
    std::array<bytes32_t, DEPTH> auth_path;

    bytes32_t root(
        bytes32_t const &leaf,
        MerkleHasher const & = default_merkle_hasher()) const;
};

/*
 * Wallet side note commitment tree. Every leaf is appended, but only marked
 * leaves, checkpointed leaves and the current tip stay addressable; complete
 * subtrees without such leaves are pruned to their root. Checkpoints record
 * the tip so roots and witnesses can be produced as of earlier states; the
 * oldest ones are dropped beyond `max_checkpoints`.
 */
class ClientCommitmentTree
{
    ShardStore &store_;
    CommitmentTreeConfig config_;
    MerkleHasher const &hasher_;

    Result<std::optional<uint8_t>> leaf_flags(uint64_t position);
    Result<void> set_leaf_flags(uint64_t position, uint8_t flags);
    Result<void> prune_shard(uint64_t index, uint64_t tip);
    Result<void> prune_checkpoints();

    /// Root of the node at (level, index) with every position past `tip`
    /// treated as empty
    Result<bytes32_t> node_root(uint8_t level, uint64_t index, uint64_t tip);
    Result<bytes32_t>
    cap_root(Tree const &cap_node, uint8_t level, uint64_t start, uint64_t tip);

public:
    ClientCommitmentTree(
        ShardStore &, CommitmentTreeConfig const & = {},
        MerkleHasher const & = default_merkle_hasher());

    /// Appends a note commitment at the next position
    Result<void> append(bytes32_t const &cmx, Retention const &);

    /// Records the current tip under `id`. Returns false if `id` does not
    /// exceed every existing checkpoint id.
    Result<bool> checkpoint(CheckpointId id);

    Result<std::optional<uint64_t>> max_leaf_position();

    /// Root as of the checkpoint `depth` steps back (0 is the latest), or of
    /// the current tip when `depth` is empty. Empty if no such checkpoint.
    Result<std::optional<bytes32_t>>
    root_at_checkpoint_depth(std::optional<size_t> depth);

    /// Current root, the empty tree root when nothing was appended
    Result<bytes32_t> anchor();

    /// Path of a marked leaf as of the checkpoint `checkpoint_depth` steps
    /// back. Empty if the checkpoint does not exist or predates the leaf.
    Result<std::optional<MerklePath>>
    witness(uint64_t position, size_t checkpoint_depth);

    Result<std::optional<OrchardMerklePath>>
    orchard_witness(uint64_t position, size_t checkpoint_depth = 0);

    /// Unmarks a leaf now, or once checkpoint `as_of` is pruned. Returns
    /// false if the leaf is not marked.
    Result<bool>
    remove_mark(uint64_t position, std::optional<CheckpointId> as_of = {});
};

GROVEDB_COMMITMENT_TREE_NAMESPACE_END
