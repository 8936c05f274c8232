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

#include <grovedb/merk/ops.hpp>

#include <grovedb/core/assert.h>
#include <grovedb/merk/hash.hpp>

#include <algorithm>
#include <cstdlib>
#include <utility>

GROVEDB_MERK_NAMESPACE_BEGIN

void KeyUpdates::append(KeyUpdates &&other)
{
    new_keys.merge(other.new_keys);
    updated_keys.merge(other.updated_keys);
    deleted_keys.insert(
        deleted_keys.end(),
        std::make_move_iterator(other.deleted_keys.begin()),
        std::make_move_iterator(other.deleted_keys.end()));
}

CostResult<std::unique_ptr<TreeNode>>
detach_loaded(TreeNode &tree, bool const left, NodeFetcher const &source)
{
    OperationCost cost;
    auto const *l = tree.link(left);
    if (!l) {
        return {std::unique_ptr<TreeNode>{}, cost};
    }
    if (l->is_reference()) {
        auto child = GROVEDB_COST_TRY(cost, source.fetch(*l));
        tree.load(left, std::move(child));
    }
    return {tree.detach(left), cost};
}

namespace
{
    using NodePtr = std::unique_ptr<TreeNode>;
    using ApplyResult = std::pair<NodePtr, KeyUpdates>;

    struct OpValue
    {
        bytes32_t value_hash;
        std::optional<uint32_t> value_defined_cost;
    };

    CostContext<OpValue> op_value(MerkOp const &op)
    {
        OperationCost cost;
        auto vh = value_hash(op.value).unwrap_add_cost(cost);
        std::optional<uint32_t> defined_cost;
        switch (op.kind) {
        case MerkOp::Kind::put:
            break;
        case MerkOp::Kind::put_with_specialized_cost:
            defined_cost = op.value_cost;
            break;
        case MerkOp::Kind::put_combined_reference:
            vh = combine_hash(vh, op.referenced_hash).unwrap_add_cost(cost);
            break;
        case MerkOp::Kind::put_layered_reference:
        case MerkOp::Kind::replace_layered_reference:
            vh = combine_hash(vh, op.referenced_hash).unwrap_add_cost(cost);
            defined_cost = op.value_cost;
            break;
        case MerkOp::Kind::del:
        case MerkOp::Kind::delete_layered:
            GROVEDB_ABORT("no value for a delete");
        }
        return {OpValue{vh, defined_cost}, cost};
    }

    CostResult<NodePtr> rotate(NodePtr tree, bool left, NodeFetcher const &);

    CostResult<NodePtr> maybe_balance(NodePtr tree, NodeFetcher const &source)
    {
        OperationCost cost;
        int const balance = tree->balance_factor();
        if (std::abs(balance) <= 1) {
            return {std::move(tree), cost};
        }
        bool const left = balance < 0;
        // heavier child leaning the other way needs a double rotation
        if (left == (tree->link(left)->balance_factor() > 0)) {
            auto child =
                GROVEDB_COST_TRY(cost, detach_loaded(*tree, left, source));
            child = GROVEDB_COST_TRY(
                cost, rotate(std::move(child), !left, source));
            tree->attach(left, std::move(child));
        }
        auto rotated =
            GROVEDB_COST_TRY(cost, rotate(std::move(tree), left, source));
        return {std::move(rotated), cost};
    }

    CostResult<NodePtr>
    rotate(NodePtr tree, bool const left, NodeFetcher const &source)
    {
        OperationCost cost;
        auto child = GROVEDB_COST_TRY(cost, detach_loaded(*tree, left, source));
        GROVEDB_ASSERT(child != nullptr);
        auto grandchild =
            GROVEDB_COST_TRY(cost, detach_loaded(*child, !left, source));
        tree->attach(left, std::move(grandchild));
        tree = GROVEDB_COST_TRY(cost, maybe_balance(std::move(tree), source));
        child->attach(!left, std::move(tree));
        auto balanced =
            GROVEDB_COST_TRY(cost, maybe_balance(std::move(child), source));
        return {std::move(balanced), cost};
    }

    CostResult<std::pair<NodePtr, NodePtr>>
    remove_edge(NodePtr tree, bool const left, NodeFetcher const &source)
    {
        OperationCost cost;
        if (tree->link(left)) {
            // not the edge yet
            auto child =
                GROVEDB_COST_TRY(cost, detach_loaded(*tree, left, source));
            auto [edge, rest] = GROVEDB_COST_TRY(
                cost, remove_edge(std::move(child), left, source));
            tree->attach(left, std::move(rest));
            tree =
                GROVEDB_COST_TRY(cost, maybe_balance(std::move(tree), source));
            return {
                std::pair<NodePtr, NodePtr>{std::move(edge), std::move(tree)},
                cost};
        }
        auto child = GROVEDB_COST_TRY(cost, detach_loaded(*tree, !left, source));
        return {
            std::pair<NodePtr, NodePtr>{std::move(tree), std::move(child)},
            cost};
    }

    // Fills the gap of a removed root with the edge of its taller side
    CostResult<NodePtr> promote_edge(
        NodePtr tree, bool const left, NodePtr attach,
        NodeFetcher const &source)
    {
        OperationCost cost;
        auto [edge, rest] =
            GROVEDB_COST_TRY(cost, remove_edge(std::move(tree), left, source));
        edge->attach(!left, std::move(rest));
        edge->attach(left, std::move(attach));
        auto balanced =
            GROVEDB_COST_TRY(cost, maybe_balance(std::move(edge), source));
        return {std::move(balanced), cost};
    }

    CostResult<NodePtr> remove(NodePtr tree, NodeFetcher const &source)
    {
        OperationCost cost;
        bool const has_left = tree->link(true) != nullptr;
        bool const has_right = tree->link(false) != nullptr;
        bool const left = tree->child_height(true) > tree->child_height(false);

        if (has_left && has_right) {
            auto tall =
                GROVEDB_COST_TRY(cost, detach_loaded(*tree, left, source));
            auto short_child =
                GROVEDB_COST_TRY(cost, detach_loaded(*tree, !left, source));
            auto promoted = GROVEDB_COST_TRY(
                cost,
                promote_edge(
                    std::move(tall), !left, std::move(short_child), source));
            return {std::move(promoted), cost};
        }
        if (has_left || has_right) {
            auto only = GROVEDB_COST_TRY(cost, detach_loaded(*tree, left, source));
            return {std::move(only), cost};
        }
        return {NodePtr{}, cost};
    }

    CostResult<ApplyResult> apply_sorted(
        NodePtr tree, std::span<BatchEntry const> batch, ApplyEnv const &env);

    CostResult<ApplyResult> recurse(
        NodePtr tree, std::span<BatchEntry const> batch, size_t const mid,
        bool const exclusive, KeyUpdates key_updates, ApplyEnv const &env)
    {
        OperationCost cost;
        auto const left_batch = batch.first(mid);
        auto const right_batch = batch.subspan(exclusive ? mid + 1 : mid);
        byte_string const old_root_key = tree->key();

        if (!left_batch.empty()) {
            auto child =
                GROVEDB_COST_TRY(cost, detach_loaded(*tree, true, env.source));
            auto [new_child, updates] = GROVEDB_COST_TRY(
                cost, apply_to(std::move(child), left_batch, env));
            key_updates.append(std::move(updates));
            tree->attach(true, std::move(new_child));
        }
        if (!right_batch.empty()) {
            auto child =
                GROVEDB_COST_TRY(cost, detach_loaded(*tree, false, env.source));
            auto [new_child, updates] = GROVEDB_COST_TRY(
                cost, apply_to(std::move(child), right_batch, env));
            key_updates.append(std::move(updates));
            tree->attach(false, std::move(new_child));
        }

        tree =
            GROVEDB_COST_TRY(cost, maybe_balance(std::move(tree), env.source));
        key_updates.updated_root_key_from =
            tree->key() != old_root_key ? std::optional{old_root_key}
                                        : std::nullopt;
        return {ApplyResult{std::move(tree), std::move(key_updates)}, cost};
    }

    CostResult<NodePtr>
    build(std::span<BatchEntry const> batch, ApplyEnv const &env)
    {
        OperationCost cost;
        if (batch.empty()) {
            return {NodePtr{}, cost};
        }
        size_t const mid = batch.size() / 2;
        auto const &[mid_key, mid_op] = batch[mid];

        if (mid_op.is_delete()) {
            // nothing to delete in a tree being built
            auto left = GROVEDB_COST_TRY(cost, build(batch.first(mid), env));
            auto const right_batch = batch.subspan(mid + 1);
            if (left) {
                auto [tree, updates] = GROVEDB_COST_TRY(
                    cost, apply_sorted(std::move(left), right_batch, env));
                return {std::move(tree), cost};
            }
            auto right = GROVEDB_COST_TRY(cost, build(right_batch, env));
            return {std::move(right), cost};
        }

        auto const v = op_value(mid_op).unwrap_add_cost(cost);
        auto node = TreeNode::make(
                        mid_key,
                        mid_op.value,
                        v.value_hash,
                        mid_op.feature_type,
                        v.value_defined_cost)
                        .unwrap_add_cost(cost);
        auto [tree, updates] = GROVEDB_COST_TRY(
            cost, recurse(std::move(node), batch, mid, true, {}, env));
        return {std::move(tree), cost};
    }

    CostResult<KeyValueStorageCost>
    deletion_cost(TreeNode const &tree, ApplyEnv const &env)
    {
        uint32_t const key_bytes = tree.key_storage_cost();
        uint32_t const value_bytes =
            tree.stored_value_cost().value_or(tree.value_storage_cost());
        std::pair<StorageRemovedBytes, StorageRemovedBytes> removed{
            StorageRemovedBytes::basic(key_bytes),
            StorageRemovedBytes::basic(value_bytes)};
        if (env.section_removal) {
            auto res = env.section_removal(tree.value(), key_bytes, value_bytes);
            if (res.has_error()) {
                return {std::move(res).as_failure(), OperationCost{}};
            }
            removed = std::move(res).value();
        }
        return {
            KeyValueStorageCost{
                .key_storage_cost = {.removed_bytes = std::move(removed.first)},
                .value_storage_cost =
                    {.removed_bytes = std::move(removed.second)},
                .new_node = false,
                .needs_value_verification = false},
            OperationCost{}};
    }

    CostResult<ApplyResult> apply_sorted(
        NodePtr tree, std::span<BatchEntry const> batch, ApplyEnv const &env)
    {
        OperationCost cost;
        auto const it = std::lower_bound(
            batch.begin(),
            batch.end(),
            tree->key(),
            [](BatchEntry const &e, byte_string const &k) {
                return e.first < k;
            });
        size_t const index = static_cast<size_t>(it - batch.begin());
        bool const found = it != batch.end() && it->first == tree->key();

        KeyUpdates key_updates;
        if (found) {
            auto const &op = it->second;
            if (op.is_delete()) {
                byte_string key = tree->key();
                auto const removal =
                    GROVEDB_COST_TRY(cost, deletion_cost(*tree, env));
                auto rest =
                    GROVEDB_COST_TRY(cost, remove(std::move(tree), env.source));
                auto [left_tree, left_updates] = GROVEDB_COST_TRY(
                    cost,
                    apply_to(std::move(rest), batch.first(index), env));
                auto [new_tree, right_updates] = GROVEDB_COST_TRY(
                    cost,
                    apply_to(
                        std::move(left_tree), batch.subspan(index + 1), env));
                left_updates.append(std::move(right_updates));
                left_updates.deleted_keys.emplace_back(key, removal);
                left_updates.updated_root_key_from = std::move(key);
                return {
                    ApplyResult{std::move(new_tree), std::move(left_updates)},
                    cost};
            }
            auto const v = op_value(op).unwrap_add_cost(cost);
            cost += tree->set_value(
                op.value, v.value_hash, op.feature_type, v.value_defined_cost);
            key_updates.updated_keys.insert(tree->key());
        }

        return recurse(
                   std::move(tree),
                   batch,
                   index,
                   found,
                   std::move(key_updates),
                   env)
            .add_cost(cost);
    }
}

CostResult<std::pair<std::unique_ptr<TreeNode>, KeyUpdates>> apply_to(
    std::unique_ptr<TreeNode> tree, std::span<BatchEntry const> batch,
    ApplyEnv const &env)
{
    OperationCost cost;
    if (batch.empty()) {
        return {ApplyResult{std::move(tree), KeyUpdates{}}, cost};
    }
    if (!tree) {
        auto built = GROVEDB_COST_TRY(cost, build(batch, env));
        KeyUpdates key_updates;
        for (auto const &[key, op] : batch) {
            if (!op.is_delete()) {
                key_updates.new_keys.insert(key);
            }
        }
        return {ApplyResult{std::move(built), std::move(key_updates)}, cost};
    }
    return apply_sorted(std::move(tree), batch, env).add_cost(cost);
}

GROVEDB_MERK_NAMESPACE_END
