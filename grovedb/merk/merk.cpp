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

#include <grovedb/merk/merk.hpp>

#include <grovedb/core/error.hpp>
#include <grovedb/core/hex_literal.hpp>
#include <grovedb/costs/key_value_storage_cost.hpp>
#include <grovedb/storage/storage_batch.hpp>

#include <quill/Quill.h>

#include <memory>
#include <utility>
#include <vector>

GROVEDB_MERK_NAMESPACE_BEGIN

namespace
{
    byte_string_view root_key_key()
    {
        return to_byte_string_view(ROOT_KEY_KEY);
    }

    KeyValueStorageCost node_cost_info(TreeNode const &node)
    {
        uint32_t const key_cost = node.key_storage_cost();
        uint32_t const value_cost = node.value_storage_cost();
        bool const verify = !node.value_defined_cost().has_value();
        auto const stored = node.stored_value_cost();
        if (!stored.has_value()) {
            return KeyValueStorageCost{
                .key_storage_cost = {.added_bytes = key_cost},
                .value_storage_cost = {.added_bytes = value_cost},
                .new_node = true,
                .needs_value_verification = verify};
        }
        StorageCost value_storage_cost;
        if (value_cost > *stored) {
            value_storage_cost.added_bytes = value_cost - *stored;
            value_storage_cost.replaced_bytes = *stored;
        }
        else if (value_cost < *stored) {
            value_storage_cost.replaced_bytes = value_cost;
            value_storage_cost.removed_bytes =
                StorageRemovedBytes::basic(*stored - value_cost);
        }
        else {
            value_storage_cost.replaced_bytes = value_cost;
        }
        return KeyValueStorageCost{
            .key_storage_cost = {.replaced_bytes = key_cost},
            .value_storage_cost = std::move(value_storage_cost),
            .new_node = false,
            .needs_value_verification = verify};
    }

    // Puts `node` and every descendant reached through an uncommitted link
    void write_nodes(TreeNode &node, storage::StorageBatch &batch)
    {
        batch.put(
            node.key(),
            node.encode(),
            node.children_sizes(),
            node_cost_info(node));
        node.set_stored_value_cost(node.value_storage_cost());
        for (bool const left : {true, false}) {
            auto *l = node.link(left);
            if (l && l->is_uncommitted()) {
                write_nodes(*l->tree(), batch);
            }
        }
    }
}

Merk::Merk(
    OpenKey, storage::StorageContext &storage, TreeType const tree_type,
    ValueDefinedCostFn value_defined_cost)
    : storage_{storage}
    , tree_type_{tree_type}
    , value_defined_cost_{std::move(value_defined_cost)}
{
}

CostResult<std::unique_ptr<Merk>> Merk::open(
    storage::StorageContext &storage, TreeType const tree_type,
    ValueDefinedCostFn value_defined_cost)
{
    OperationCost cost;
    auto merk = std::make_unique<Merk>(
        OpenKey{}, storage, tree_type, std::move(value_defined_cost));
    GROVEDB_COST_TRY(cost, merk->load_root());
    return {std::move(merk), cost};
}

CostResult<std::unique_ptr<TreeNode>>
Merk::load_node(byte_string_view const key) const
{
    OperationCost cost;
    auto const bytes = GROVEDB_COST_TRY(cost, storage_.get(key));
    if (!bytes.has_value()) {
        LOG_ERROR("merk node {} missing from storage", to_hex(key));
        return {Error::corrupted_data, cost};
    }
    auto node = GROVEDB_COST_TRY_NO_ADD(
        cost, TreeNode::decode(byte_string{key}, *bytes));
    if (value_defined_cost_) {
        node->set_value_defined_cost(value_defined_cost_(node->value()));
    }
    node->set_stored_value_cost(node->value_storage_cost());
    return {std::move(node), cost};
}

CostResult<void> Merk::load_root()
{
    OperationCost cost;
    tree_.reset();
    auto const root_key = GROVEDB_COST_TRY(cost, storage_.get_root(root_key_key()));
    if (root_key.has_value()) {
        tree_ = GROVEDB_COST_TRY(cost, load_node(*root_key));
    }
    return {outcome::success(), cost};
}

void Merk::reload_after_failure(OperationCost &cost)
{
    auto reloaded = load_root();
    cost += reloaded.cost;
    if (reloaded.value.has_error()) {
        LOG_ERROR(
            "merk reload after failed apply: {}",
            reloaded.value.error().message().c_str());
    }
}

CostResult<std::unique_ptr<TreeNode>> Merk::fetch(Link const &link) const
{
    return load_node(link.key());
}

CostResult<KeyUpdates> Merk::apply(
    std::span<BatchEntry const> const batch, std::span<AuxOp const> const aux,
    ApplyOptions const &options, SectionRemovalFn const &section_removal)
{
    OperationCost cost;
    for (size_t i = 0; i < batch.size(); ++i) {
        if (batch[i].first.size() > 255) {
            LOG_ERROR("merk key of {} bytes", batch[i].first.size());
            return {Error::invalid_input, cost};
        }
        if (i > 0 && !(batch[i - 1].first < batch[i].first)) {
            LOG_ERROR("merk batch not sorted or has duplicate keys");
            return {Error::invalid_input, cost};
        }
    }

    std::optional<uint32_t> const old_root_key_len =
        tree_ ? std::optional{static_cast<uint32_t>(tree_->key().size())}
              : std::nullopt;
    ApplyEnv const env{.source = *this, .section_removal = section_removal};
    auto applied = apply_to(std::move(tree_), batch, env);
    cost += applied.cost;
    if (applied.value.has_error()) {
        reload_after_failure(cost);
        return {std::move(applied.value).as_failure(), cost};
    }
    auto [tree, key_updates] = std::move(applied.value).assume_value();
    tree_ = std::move(tree);

    auto committed = commit(key_updates, aux, options, old_root_key_len);
    cost += committed.cost;
    if (committed.value.has_error()) {
        reload_after_failure(cost);
        return {std::move(committed.value).as_failure(), cost};
    }
    return {std::move(key_updates), cost};
}

CostResult<void> Merk::commit(
    KeyUpdates const &key_updates, std::span<AuxOp const> const aux,
    ApplyOptions const &options, std::optional<uint32_t> const old_root_key_len)
{
    OperationCost cost;
    storage::StorageBatch batch;
    bool const changed = !key_updates.new_keys.empty() ||
                         !key_updates.updated_keys.empty() ||
                         !key_updates.deleted_keys.empty();
    if (tree_ && changed) {
        GROVEDB_COST_TRY(cost, tree_->compute_hashes());
        write_nodes(*tree_, batch);
    }
    for (auto const &[key, cost_info] : key_updates.deleted_keys) {
        batch.del(key, cost_info);
    }

    std::optional<uint32_t> const new_root_key_len =
        tree_ ? std::optional{static_cast<uint32_t>(tree_->key().size())}
              : std::nullopt;
    if (tree_ && (changed || !old_root_key_len.has_value())) {
        std::optional<KeyValueStorageCost> root_cost;
        if (!options.base_root_storage_is_free) {
            root_cost = KeyValueStorageCost::for_updated_root_cost(
                old_root_key_len, *new_root_key_len);
        }
        batch.put_in(
            storage::Keyspace::roots,
            root_key_key(),
            tree_->key(),
            std::move(root_cost));
    }
    else if (!tree_ && old_root_key_len.has_value()) {
        std::optional<KeyValueStorageCost> root_cost;
        if (!options.base_root_storage_is_free) {
            root_cost = KeyValueStorageCost{
                .key_storage_cost =
                    {.removed_bytes =
                         StorageRemovedBytes::basic(ROOT_KEY_STORAGE_COST)},
                .value_storage_cost = {
                    .removed_bytes =
                        StorageRemovedBytes::basic(paid_len(*old_root_key_len))}};
        }
        batch.del_in(
            storage::Keyspace::roots, root_key_key(), std::move(root_cost));
    }

    for (auto const &op : aux) {
        if (op.value.has_value()) {
            batch.put_in(storage::Keyspace::aux, op.key, *op.value);
        }
        else {
            batch.del_in(storage::Keyspace::aux, op.key);
        }
    }

    GROVEDB_COST_TRY(cost, storage_.commit_batch(batch));
    LOG_DEBUG("merk commit of {} operations", batch.size());
    if (tree_) {
        tree_->mark_written();
        tree_->prune(MERK_CACHED_LEVELS);
    }
    return {outcome::success(), cost};
}

CostResult<TreeNode const *> Merk::find(
    byte_string_view const key, std::unique_ptr<TreeNode> &holder) const
{
    OperationCost cost;
    TreeNode const *node = tree_.get();
    while (node) {
        byte_string_view const node_key{node->key()};
        if (key == node_key) {
            break;
        }
        auto const *l = node->link(key < node_key);
        if (!l) {
            node = nullptr;
            break;
        }
        if (auto const *child = l->tree()) {
            node = child;
            continue;
        }
        // the previous holder may own `l`, so release it only afterwards
        auto fetched = GROVEDB_COST_TRY(cost, fetch(*l));
        holder = std::move(fetched);
        node = holder.get();
    }
    return {node, cost};
}

CostResult<TreeNode const *> Merk::walk(
    TreeNode const &node, bool const left,
    std::unique_ptr<TreeNode> &holder) const
{
    OperationCost cost;
    auto const *l = node.link(left);
    if (!l) {
        return {static_cast<TreeNode const *>(nullptr), cost};
    }
    if (auto const *child = l->tree()) {
        return {child, cost};
    }
    auto fetched = GROVEDB_COST_TRY(cost, fetch(*l));
    holder = std::move(fetched);
    return {static_cast<TreeNode const *>(holder.get()), cost};
}

CostResult<std::optional<byte_string>>
Merk::get(byte_string_view const key) const
{
    OperationCost cost;
    std::unique_ptr<TreeNode> holder;
    auto const *node = GROVEDB_COST_TRY(cost, find(key, holder));
    if (!node) {
        return {std::optional<byte_string>{}, cost};
    }
    return {std::optional{node->value()}, cost};
}

CostResult<std::optional<bytes32_t>>
Merk::get_value_hash(byte_string_view const key) const
{
    OperationCost cost;
    std::unique_ptr<TreeNode> holder;
    auto const *node = GROVEDB_COST_TRY(cost, find(key, holder));
    if (!node) {
        return {std::optional<bytes32_t>{}, cost};
    }
    return {std::optional{node->value_hash()}, cost};
}

CostResult<std::optional<bytes32_t>>
Merk::get_kv_hash(byte_string_view const key) const
{
    OperationCost cost;
    std::unique_ptr<TreeNode> holder;
    auto const *node = GROVEDB_COST_TRY(cost, find(key, holder));
    if (!node) {
        return {std::optional<bytes32_t>{}, cost};
    }
    return {std::optional{node->kv_hash()}, cost};
}

CostResult<std::optional<TreeFeatureType>>
Merk::get_feature_type(byte_string_view const key) const
{
    OperationCost cost;
    std::unique_ptr<TreeNode> holder;
    auto const *node = GROVEDB_COST_TRY(cost, find(key, holder));
    if (!node) {
        return {std::optional<TreeFeatureType>{}, cost};
    }
    return {std::optional{node->feature_type()}, cost};
}

CostResult<bytes32_t> Merk::root_hash() const
{
    if (!tree_) {
        return {NULL_HASH, OperationCost{}};
    }
    return tree_->hash();
}

Result<AggregateData> Merk::aggregate_data() const
{
    if (!tree_) {
        return AggregateData::empty(tree_type_);
    }
    return tree_->aggregate_data();
}

CostResult<void> Merk::clear()
{
    OperationCost cost;
    storage::StorageBatch batch;
    auto it = storage_.raw_iter(storage::Keyspace::data);
    for (it->seek_to_first(cost); it->valid(); it->next(cost)) {
        batch.del(*it->key(cost));
    }
    batch.del_in(storage::Keyspace::roots, root_key_key());
    GROVEDB_COST_TRY(cost, storage_.commit_batch(batch));
    tree_.reset();
    return {outcome::success(), cost};
}

GROVEDB_MERK_NAMESPACE_END
