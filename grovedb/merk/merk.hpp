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

#include <grovedb/merk/config.hpp>

#include <grovedb/core/byte_string.hpp>
#include <grovedb/core/bytes.hpp>
#include <grovedb/core/result.hpp>
#include <grovedb/costs/cost_context.hpp>
#include <grovedb/merk/ops.hpp>
#include <grovedb/merk/tree_feature_type.hpp>
#include <grovedb/merk/tree_node.hpp>
#include <grovedb/storage/storage_context.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <span>

GROVEDB_MERK_NAMESPACE_BEGIN

// Key of the stored root key in the roots keyspace
inline constexpr unsigned char ROOT_KEY_KEY[] = {'r'};

// Levels of the tree kept in memory after a commit
inline constexpr unsigned MERK_CACHED_LEVELS = 3;

struct ApplyOptions
{
    bool allow_deleting_non_empty_trees{false};
    bool base_root_storage_is_free{true};
};

/// Write to the aux keyspace; an absent value deletes the key
struct AuxOp
{
    byte_string key;
    std::optional<byte_string> value;
};

/// An AVL Merkle tree over one storage context. The root and its nearest
/// levels are cached in memory; deeper nodes are fetched on demand.
class Merk final : public NodeFetcher
{
    storage::StorageContext &storage_;
    TreeType tree_type_;
    ValueDefinedCostFn value_defined_cost_;
    std::unique_ptr<TreeNode> tree_;

    // only open() can name this, so every merk has its root loaded
    struct OpenKey
    {
        explicit OpenKey() = default;
    };

    CostResult<std::unique_ptr<TreeNode>> load_node(byte_string_view key) const;
    CostResult<void> load_root();
    CostResult<void> commit(
        KeyUpdates const &, std::span<AuxOp const> aux, ApplyOptions const &,
        std::optional<uint32_t> old_root_key_len);
    void reload_after_failure(OperationCost &);

public:
    Merk(OpenKey, storage::StorageContext &, TreeType, ValueDefinedCostFn);
    Merk(Merk const &) = delete;
    Merk &operator=(Merk const &) = delete;

    static CostResult<std::unique_ptr<Merk>> open(
        storage::StorageContext &, TreeType = TreeType::normal,
        ValueDefinedCostFn = {});

    /// Applies a batch sorted by key without duplicates, then commits it
    /// together with `aux`. On failure the tree is reloaded from storage.
    CostResult<KeyUpdates> apply(
        std::span<BatchEntry const> batch, std::span<AuxOp const> aux = {},
        ApplyOptions const & = {}, SectionRemovalFn const & = {});

    CostResult<std::optional<byte_string>> get(byte_string_view key) const;
    CostResult<std::optional<bytes32_t>>
    get_value_hash(byte_string_view key) const;
    CostResult<std::optional<bytes32_t>> get_kv_hash(byte_string_view key) const;
    CostResult<std::optional<TreeFeatureType>>
    get_feature_type(byte_string_view key) const;

    CostResult<bytes32_t> root_hash() const;

    // Walks to `key`; fetched nodes are kept alive by `holder`
    CostResult<TreeNode const *>
    find(byte_string_view key, std::unique_ptr<TreeNode> &holder) const;

    /// Child of `node` on one side, fetched into `holder` when not in
    /// memory; null when there is no child
    CostResult<TreeNode const *> walk(
        TreeNode const &node, bool left,
        std::unique_ptr<TreeNode> &holder) const;

    std::optional<byte_string> root_key() const
    {
        return tree_ ? std::optional{tree_->key()} : std::nullopt;
    }

    Result<AggregateData> aggregate_data() const;

    uint8_t height() const noexcept
    {
        return tree_ ? tree_->height() : 0;
    }

    bool is_empty() const noexcept
    {
        return tree_ == nullptr;
    }

    TreeType tree_type() const noexcept
    {
        return tree_type_;
    }

    // in-memory root, null for an empty tree
    TreeNode const *root() const noexcept
    {
        return tree_.get();
    }

    storage::StorageContext &storage() const noexcept
    {
        return storage_;
    }

    /// Removes every node and the stored root key
    CostResult<void> clear();

    CostResult<std::unique_ptr<TreeNode>> fetch(Link const &) const override;
};

GROVEDB_MERK_NAMESPACE_END
