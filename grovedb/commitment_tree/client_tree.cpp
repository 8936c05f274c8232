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

#include <grovedb/commitment_tree/client_tree.hpp>

#include <grovedb/commitment_tree/commitment_tree_error.hpp>

#include <quill/Quill.h>

#include <utility>

GROVEDB_COMMITMENT_TREE_NAMESPACE_BEGIN

namespace
{
    constexpr uint64_t SHARD_SIZE = uint64_t{1} << SHARD_HEIGHT;

    constexpr uint64_t width(uint8_t const level) noexcept
    {
        return uint64_t{1} << level;
    }

    std::optional<uint64_t>
    max_position(Tree const &node, uint8_t const level, uint64_t const start)
    {
        switch (node->kind) {
        case NodeKind::nil:
            return std::nullopt;
        case NodeKind::leaf:
            return start + width(level) - 1;
        case NodeKind::parent:
            break;
        }
        uint8_t const child = level - 1;
        auto const right =
            max_position(node->right, child, start + width(child));
        if (right.has_value()) {
            return right;
        }
        return max_position(node->left, child, start);
    }

    // node at (to_level, to_start), empty when a pruned leaf covers it
    std::optional<Tree> descend(
        Tree node, uint8_t level, uint64_t start, uint8_t const to_level,
        uint64_t const to_start)
    {
        while (level > to_level) {
            if (node->is_leaf()) {
                return std::nullopt;
            }
            if (node->is_nil()) {
                return node;
            }
            --level;
            if (to_start >= start + width(level)) {
                start += width(level);
                node = node->right;
            }
            else {
                node = node->left;
            }
        }
        return node;
    }

    Result<Tree> replace_at(
        Tree const &node, uint8_t const level, uint64_t const start,
        uint8_t const to_level, uint64_t const to_start, Tree const &with,
        bool const keep_ann)
    {
        if (level == to_level) {
            return with;
        }
        if (node->is_leaf()) {
            LOG_ERROR(
                "position {} lies in a pruned subtree at level {}",
                to_start,
                level);
            return CommitmentTreeError::invalid_data;
        }
        Tree left = node->is_parent() ? node->left : make_nil();
        Tree right = node->is_parent() ? node->right : make_nil();
        uint8_t const child = level - 1;
        if (to_start >= start + width(child)) {
            BOOST_OUTCOME_TRY(
                right,
                replace_at(
                    right,
                    child,
                    start + width(child),
                    to_level,
                    to_start,
                    with,
                    keep_ann));
        }
        else {
            BOOST_OUTCOME_TRY(
                left,
                replace_at(
                    left, child, start, to_level, to_start, with, keep_ann));
        }
        return make_parent(
            keep_ann ? node->ann : std::nullopt,
            std::move(left),
            std::move(right));
    }

    std::optional<bytes32_t> known_root(Node const &node)
    {
        if (node.is_leaf()) {
            return node.hash;
        }
        return node.ann;
    }

    bool is_prunable(Node const &node, uint64_t const start, uint64_t const tip)
    {
        return node.is_leaf() && node.flags == EPHEMERAL && start != tip;
    }

    // collapses complete subtrees holding nothing retained into leaves, and
    // caches the root of complete subtrees that must stay expanded
    Tree prune(
        MerkleHasher const &hasher, Tree const &node, uint8_t const level,
        uint64_t const start, uint64_t const tip)
    {
        if (!node->is_parent()) {
            return node;
        }
        uint8_t const child = level - 1;
        uint64_t const mid = start + width(child);
        Tree left = prune(hasher, node->left, child, start, tip);
        Tree right = prune(hasher, node->right, child, mid, tip);
        if (start + width(level) - 1 > tip) {
            return make_parent(std::nullopt, std::move(left), std::move(right));
        }
        auto const lh = known_root(*left);
        auto const rh = known_root(*right);
        if (!lh.has_value() || !rh.has_value()) {
            return make_parent(node->ann, std::move(left), std::move(right));
        }
        auto const root = hasher.combine(child, *lh, *rh);
        if (is_prunable(*left, start, tip) && is_prunable(*right, mid, tip)) {
            return make_leaf(root, EPHEMERAL);
        }
        return make_parent(root, std::move(left), std::move(right));
    }

    Result<bytes32_t> subtree_root(
        MerkleHasher const &hasher, Tree const &node, uint8_t const level,
        uint64_t const start, uint64_t const tip)
    {
        if (start > tip) {
            return hasher.empty_root(level);
        }
        bool const complete = start + width(level) - 1 <= tip;
        switch (node->kind) {
        case NodeKind::nil:
            LOG_ERROR(
                "no data for level {} subtree at {} below tip {}",
                level,
                start,
                tip);
            return CommitmentTreeError::insufficient_history;
        case NodeKind::leaf:
            if (level == 0 || complete) {
                return node->hash;
            }
            LOG_ERROR(
                "level {} subtree at {} was pruned past tip {}",
                level,
                start,
                tip);
            return CommitmentTreeError::insufficient_history;
        case NodeKind::parent:
            break;
        }
        if (complete && node->ann.has_value()) {
            return *node->ann;
        }
        uint8_t const child = level - 1;
        BOOST_OUTCOME_TRY(
            auto const left,
            subtree_root(hasher, node->left, child, start, tip));
        BOOST_OUTCOME_TRY(
            auto const right,
            subtree_root(
                hasher, node->right, child, start + width(child), tip));
        return hasher.combine(child, left, right);
    }
}

bytes32_t
MerklePath::root(bytes32_t const &leaf, MerkleHasher const &hasher) const
{
    bytes32_t node = leaf;
    for (uint8_t level = 0; level < DEPTH; ++level) {
        node = ((position >> level) & 1)
                   ? hasher.combine(level, auth_path[level], node)
                   : hasher.combine(level, node, auth_path[level]);
    }
    return node;
}

bytes32_t OrchardMerklePath::root(
    bytes32_t const &leaf, MerkleHasher const &hasher) const
{
    return MerklePath{.position = position, .auth_path = auth_path}.root(
        leaf, hasher);
}

ClientCommitmentTree::ClientCommitmentTree(
    ShardStore &store, CommitmentTreeConfig const &config,
    MerkleHasher const &hasher)
    : store_{store}
    , config_{config}
    , hasher_{hasher}
{
}

Result<std::optional<uint64_t>> ClientCommitmentTree::max_leaf_position()
{
    BOOST_OUTCOME_TRY(auto const last, store_.last_shard_index());
    if (!last.has_value()) {
        return std::optional<uint64_t>{};
    }
    BOOST_OUTCOME_TRY(auto const shard, store_.get_shard(*last));
    if (!shard.has_value()) {
        return std::optional<uint64_t>{};
    }
    return max_position(*shard, SHARD_HEIGHT, *last * SHARD_SIZE);
}

Result<std::optional<uint8_t>>
ClientCommitmentTree::leaf_flags(uint64_t const position)
{
    uint64_t const index = position / SHARD_SIZE;
    BOOST_OUTCOME_TRY(auto const shard, store_.get_shard(index));
    if (!shard.has_value()) {
        return std::optional<uint8_t>{};
    }
    auto const leaf =
        descend(*shard, SHARD_HEIGHT, index * SHARD_SIZE, 0, position);
    if (!leaf.has_value() || !(*leaf)->is_leaf()) {
        return std::optional<uint8_t>{};
    }
    return std::optional<uint8_t>{(*leaf)->flags};
}

Result<void> ClientCommitmentTree::set_leaf_flags(
    uint64_t const position, uint8_t const flags)
{
    uint64_t const index = position / SHARD_SIZE;
    uint64_t const start = index * SHARD_SIZE;
    BOOST_OUTCOME_TRY(auto const shard, store_.get_shard(index));
    auto const leaf = shard.has_value()
                          ? descend(*shard, SHARD_HEIGHT, start, 0, position)
                          : std::nullopt;
    if (!leaf.has_value() || !(*leaf)->is_leaf()) {
        LOG_ERROR("leaf {} is not retained", position);
        return CommitmentTreeError::invalid_data;
    }
    BOOST_OUTCOME_TRY(
        auto const updated,
        replace_at(
            *shard,
            SHARD_HEIGHT,
            start,
            0,
            position,
            make_leaf((*leaf)->hash, flags),
            true));
    return store_.put_shard(index, updated);
}

Result<void>
ClientCommitmentTree::prune_shard(uint64_t const index, uint64_t const tip)
{
    BOOST_OUTCOME_TRY(auto const shard, store_.get_shard(index));
    if (!shard.has_value()) {
        return outcome::success();
    }
    return store_.put_shard(
        index,
        prune(hasher_, *shard, SHARD_HEIGHT, index * SHARD_SIZE, tip));
}

Result<void>
ClientCommitmentTree::append(bytes32_t const &cmx, Retention const &retention)
{
    if (!is_canonical(cmx)) {
        return CommitmentTreeError::invalid_field_element;
    }
    BOOST_OUTCOME_TRY(auto const tip, max_leaf_position());
    uint64_t const position = tip.has_value() ? *tip + 1 : 0;
    if (position >= MAX_LEAVES) {
        return CommitmentTreeError::tree_full;
    }
    if (retention.kind == Retention::Kind::checkpoint) {
        BOOST_OUTCOME_TRY(auto const max_id, store_.max_checkpoint_id());
        if (max_id.has_value() && retention.checkpoint_id <= *max_id) {
            LOG_ERROR(
                "checkpoint {} does not follow checkpoint {}",
                retention.checkpoint_id,
                *max_id);
            return CommitmentTreeError::checkpoint_out_of_order;
        }
    }

    uint64_t const index = position / SHARD_SIZE;
    uint64_t const start = index * SHARD_SIZE;
    BOOST_OUTCOME_TRY(auto const existing, store_.get_shard(index));
    BOOST_OUTCOME_TRY(
        auto const inserted,
        replace_at(
            existing.value_or(make_nil()),
            SHARD_HEIGHT,
            start,
            0,
            position,
            make_leaf(cmx, retention.flags()),
            false));
    auto const shard = prune(hasher_, inserted, SHARD_HEIGHT, start, position);
    BOOST_OUTCOME_TRY(store_.put_shard(index, shard));

    // the previous tip is no longer protected in its own shard
    if (tip.has_value() && *tip / SHARD_SIZE != index) {
        BOOST_OUTCOME_TRY(prune_shard(*tip / SHARD_SIZE, position));
    }

    if ((position + 1) % SHARD_SIZE == 0) {
        BOOST_OUTCOME_TRY(
            auto const shard_root,
            subtree_root(hasher_, shard, SHARD_HEIGHT, start, position));
        BOOST_OUTCOME_TRY(auto const cap, store_.get_cap());
        BOOST_OUTCOME_TRY(
            auto const updated,
            replace_at(
                cap,
                DEPTH,
                0,
                SHARD_HEIGHT,
                start,
                make_leaf(shard_root, EPHEMERAL),
                false));
        BOOST_OUTCOME_TRY(
            store_.put_cap(prune(hasher_, updated, DEPTH, 0, position)));
    }

    if (retention.kind == Retention::Kind::checkpoint) {
        BOOST_OUTCOME_TRY(store_.add_checkpoint(
            retention.checkpoint_id,
            Checkpoint{.position = position, .marks_removed = {}}));
        BOOST_OUTCOME_TRY(prune_checkpoints());
    }
    return outcome::success();
}

Result<bool> ClientCommitmentTree::checkpoint(CheckpointId const id)
{
    BOOST_OUTCOME_TRY(auto const max_id, store_.max_checkpoint_id());
    if (max_id.has_value() && id <= *max_id) {
        return false;
    }
    BOOST_OUTCOME_TRY(auto const tip, max_leaf_position());
    if (tip.has_value()) {
        BOOST_OUTCOME_TRY(auto const flags, leaf_flags(*tip));
        BOOST_OUTCOME_TRY(set_leaf_flags(
            *tip, static_cast<uint8_t>(flags.value_or(0) | CHECKPOINT)));
    }
    BOOST_OUTCOME_TRY(store_.add_checkpoint(
        id, Checkpoint{.position = tip, .marks_removed = {}}));
    BOOST_OUTCOME_TRY(prune_checkpoints());
    return true;
}

Result<void> ClientCommitmentTree::prune_checkpoints()
{
    BOOST_OUTCOME_TRY(auto count, store_.checkpoint_count());
    if (count <= config_.max_checkpoints) {
        return outcome::success();
    }
    BOOST_OUTCOME_TRY(auto const tip, max_leaf_position());
    for (; count > config_.max_checkpoints; --count) {
        BOOST_OUTCOME_TRY(auto const oldest, store_.min_checkpoint_id());
        if (!oldest.has_value()) {
            break;
        }
        BOOST_OUTCOME_TRY(
            auto const checkpoint, store_.get_checkpoint(*oldest));
        BOOST_OUTCOME_TRY(store_.remove_checkpoint(*oldest));
        if (!checkpoint.has_value()) {
            continue;
        }

        for (auto const position : checkpoint->marks_removed) {
            BOOST_OUTCOME_TRY(auto const flags, leaf_flags(position));
            if (flags.has_value() && (*flags & MARKED)) {
                BOOST_OUTCOME_TRY(set_leaf_flags(
                    position, static_cast<uint8_t>(*flags & ~MARKED)));
            }
        }

        if (checkpoint->position.has_value()) {
            // positions never decrease with ids, so only the next oldest
            // checkpoint can share this one's position
            BOOST_OUTCOME_TRY(auto const next_id, store_.min_checkpoint_id());
            std::optional<Checkpoint> next;
            if (next_id.has_value()) {
                BOOST_OUTCOME_TRY(next, store_.get_checkpoint(*next_id));
            }
            bool const shared =
                next.has_value() && next->position == checkpoint->position;
            BOOST_OUTCOME_TRY(
                auto const flags, leaf_flags(*checkpoint->position));
            if (!shared && flags.has_value() && (*flags & CHECKPOINT)) {
                BOOST_OUTCOME_TRY(set_leaf_flags(
                    *checkpoint->position,
                    static_cast<uint8_t>(*flags & ~CHECKPOINT)));
            }
        }
    }

    if (tip.has_value()) {
        BOOST_OUTCOME_TRY(auto const indices, store_.shard_indices());
        for (auto const index : indices) {
            BOOST_OUTCOME_TRY(prune_shard(index, *tip));
        }
    }
    return outcome::success();
}

Result<bytes32_t> ClientCommitmentTree::cap_root(
    Tree const &cap_node, uint8_t const level, uint64_t const start,
    uint64_t const tip)
{
    if (start > tip) {
        return hasher_.empty_root(level);
    }
    if (start + width(level) - 1 <= tip) {
        if (auto const known = known_root(*cap_node); known.has_value()) {
            return *known;
        }
    }
    if (level == SHARD_HEIGHT) {
        uint64_t const index = start / SHARD_SIZE;
        BOOST_OUTCOME_TRY(auto const shard, store_.get_shard(index));
        if (!shard.has_value()) {
            LOG_ERROR("shard {} is missing below tip {}", index, tip);
            return CommitmentTreeError::insufficient_history;
        }
        return subtree_root(hasher_, *shard, SHARD_HEIGHT, start, tip);
    }
    // a collapsed cap leaf says nothing about its parts, fall back to shards
    Tree const left = cap_node->is_parent() ? cap_node->left : make_nil();
    Tree const right = cap_node->is_parent() ? cap_node->right : make_nil();
    uint8_t const child = level - 1;
    BOOST_OUTCOME_TRY(auto const lh, cap_root(left, child, start, tip));
    BOOST_OUTCOME_TRY(
        auto const rh, cap_root(right, child, start + width(child), tip));
    return hasher_.combine(child, lh, rh);
}

Result<bytes32_t> ClientCommitmentTree::node_root(
    uint8_t const level, uint64_t const index, uint64_t const tip)
{
    uint64_t const start = index << level;
    if (start > tip) {
        return hasher_.empty_root(level);
    }
    if (level >= SHARD_HEIGHT) {
        BOOST_OUTCOME_TRY(auto const cap, store_.get_cap());
        auto const node = descend(cap, DEPTH, 0, level, start);
        return cap_root(node.value_or(make_nil()), level, start, tip);
    }
    uint64_t const shard_index = start / SHARD_SIZE;
    BOOST_OUTCOME_TRY(auto const shard, store_.get_shard(shard_index));
    if (!shard.has_value()) {
        LOG_ERROR("shard {} is missing below tip {}", shard_index, tip);
        return CommitmentTreeError::insufficient_history;
    }
    auto const node = descend(
        *shard, SHARD_HEIGHT, shard_index * SHARD_SIZE, level, start);
    if (!node.has_value()) {
        LOG_ERROR("level {} node {} was pruned", level, index);
        return CommitmentTreeError::insufficient_history;
    }
    return subtree_root(hasher_, *node, level, start, tip);
}

Result<std::optional<bytes32_t>> ClientCommitmentTree::root_at_checkpoint_depth(
    std::optional<size_t> const depth)
{
    std::optional<uint64_t> tip;
    if (depth.has_value()) {
        BOOST_OUTCOME_TRY(
            auto const checkpoint, store_.get_checkpoint_at_depth(*depth));
        if (!checkpoint.has_value()) {
            return std::optional<bytes32_t>{};
        }
        tip = checkpoint->second.position;
    }
    else {
        BOOST_OUTCOME_TRY(tip, max_leaf_position());
    }
    if (!tip.has_value()) {
        return std::optional<bytes32_t>{hasher_.empty_root(DEPTH)};
    }
    BOOST_OUTCOME_TRY(auto const cap, store_.get_cap());
    BOOST_OUTCOME_TRY(auto const root, cap_root(cap, DEPTH, 0, *tip));
    return std::optional<bytes32_t>{root};
}

Result<bytes32_t> ClientCommitmentTree::anchor()
{
    BOOST_OUTCOME_TRY(auto const root, root_at_checkpoint_depth(std::nullopt));
    return root.value_or(hasher_.empty_root(DEPTH));
}

Result<std::optional<MerklePath>> ClientCommitmentTree::witness(
    uint64_t const position, size_t const checkpoint_depth)
{
    BOOST_OUTCOME_TRY(
        auto const checkpoint,
        store_.get_checkpoint_at_depth(checkpoint_depth));
    if (!checkpoint.has_value() || !checkpoint->second.position.has_value() ||
        position > *checkpoint->second.position) {
        return std::optional<MerklePath>{};
    }
    uint64_t const tip = *checkpoint->second.position;
    BOOST_OUTCOME_TRY(auto const flags, leaf_flags(position));
    if (!flags.has_value() || !(*flags & MARKED)) {
        LOG_ERROR("position {} is not marked", position);
        return CommitmentTreeError::position_not_marked;
    }
    MerklePath path{.position = position, .auth_path = {}};
    for (uint8_t level = 0; level < DEPTH; ++level) {
        BOOST_OUTCOME_TRY(
            path.auth_path[level],
            node_root(level, (position >> level) ^ 1, tip));
    }
    return std::optional<MerklePath>{std::move(path)};
}

Result<std::optional<OrchardMerklePath>> ClientCommitmentTree::orchard_witness(
    uint64_t const position, size_t const checkpoint_depth)
{
    BOOST_OUTCOME_TRY(auto const path, witness(position, checkpoint_depth));
    if (!path.has_value()) {
        return std::optional<OrchardMerklePath>{};
    }
    return std::optional<OrchardMerklePath>{OrchardMerklePath{
        .position = static_cast<uint32_t>(path->position),
        .auth_path = path->auth_path}};
}

Result<bool> ClientCommitmentTree::remove_mark(
    uint64_t const position, std::optional<CheckpointId> const as_of)
{
    BOOST_OUTCOME_TRY(auto const flags, leaf_flags(position));
    if (!flags.has_value() || !(*flags & MARKED)) {
        return false;
    }
    if (as_of.has_value()) {
        BOOST_OUTCOME_TRY(auto checkpoint, store_.get_checkpoint(*as_of));
        if (!checkpoint.has_value()) {
            LOG_ERROR("checkpoint {} not found", *as_of);
            return CommitmentTreeError::checkpoint_not_found;
        }
        checkpoint->marks_removed.insert(position);
        BOOST_OUTCOME_TRY(store_.update_checkpoint(*as_of, *checkpoint));
        return true;
    }
    BOOST_OUTCOME_TRY(
        set_leaf_flags(position, static_cast<uint8_t>(*flags & ~MARKED)));
    BOOST_OUTCOME_TRY(auto const tip, max_leaf_position());
    if (tip.has_value()) {
        BOOST_OUTCOME_TRY(prune_shard(position / SHARD_SIZE, *tip));
    }
    return true;
}

GROVEDB_COMMITMENT_TREE_NAMESPACE_END
