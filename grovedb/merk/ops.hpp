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
#include <grovedb/costs/cost_context.hpp>
#include <grovedb/costs/key_value_storage_cost.hpp>
#include <grovedb/costs/storage_removed_bytes.hpp>
#include <grovedb/merk/tree_feature_type.hpp>
#include <grovedb/merk/tree_node.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <span>
#include <utility>
#include <vector>

GROVEDB_MERK_NAMESPACE_BEGIN

/// A single operation of a merk batch
struct MerkOp
{
    enum class Kind : uint8_t
    {
        put,
        put_with_specialized_cost,
        put_combined_reference,
        put_layered_reference,
        replace_layered_reference,
        del,
        delete_layered,
    };

    Kind kind{Kind::put};
    byte_string value{};
    TreeFeatureType feature_type{};
    // storage cost of the value, for specialized and layered puts
    uint32_t value_cost{0};
    // hash of the referenced value or of the child merk root
    bytes32_t referenced_hash{};

    static MerkOp put(byte_string value, TreeFeatureType const ft = {})
    {
        return {.kind = Kind::put, .value = std::move(value), .feature_type = ft};
    }

    static MerkOp put_with_specialized_cost(
        byte_string value, uint32_t const cost, TreeFeatureType const ft = {})
    {
        return {
            .kind = Kind::put_with_specialized_cost,
            .value = std::move(value),
            .feature_type = ft,
            .value_cost = cost};
    }

    static MerkOp put_combined_reference(
        byte_string value, bytes32_t const &referenced_hash,
        TreeFeatureType const ft = {})
    {
        return {
            .kind = Kind::put_combined_reference,
            .value = std::move(value),
            .feature_type = ft,
            .referenced_hash = referenced_hash};
    }

    static MerkOp put_layered_reference(
        byte_string value, uint32_t const cost, bytes32_t const &child_root,
        TreeFeatureType const ft = {})
    {
        return {
            .kind = Kind::put_layered_reference,
            .value = std::move(value),
            .feature_type = ft,
            .value_cost = cost,
            .referenced_hash = child_root};
    }

    static MerkOp replace_layered_reference(
        byte_string value, uint32_t const cost, bytes32_t const &child_root,
        TreeFeatureType const ft = {})
    {
        auto op = put_layered_reference(std::move(value), cost, child_root, ft);
        op.kind = Kind::replace_layered_reference;
        return op;
    }

    static MerkOp del()
    {
        return {.kind = Kind::del};
    }

    static MerkOp delete_layered()
    {
        return {.kind = Kind::delete_layered};
    }

    bool is_delete() const noexcept
    {
        return kind == Kind::del || kind == Kind::delete_layered;
    }
};

using BatchEntry = std::pair<byte_string, MerkOp>;
using MerkBatch = std::vector<BatchEntry>;

/// Keys touched by an apply and what it costs to remove the deleted ones
struct KeyUpdates
{
    std::set<byte_string> new_keys;
    std::set<byte_string> updated_keys;
    std::vector<std::pair<byte_string, std::optional<KeyValueStorageCost>>>
        deleted_keys;
    std::optional<byte_string> updated_root_key_from;

    void append(KeyUpdates &&other);
};

/// Produces the in-memory node behind a reference link
class NodeFetcher
{
public:
    virtual ~NodeFetcher() = default;

    virtual CostResult<std::unique_ptr<TreeNode>>
    fetch(Link const &link) const = 0;
};

/// Splits the bytes freed by a deletion into key and value removals, given
/// the deleted value and the key and value byte counts
using SectionRemovalFn =
    std::function<Result<std::pair<StorageRemovedBytes, StorageRemovedBytes>>(
        byte_string_view value, uint32_t key_bytes, uint32_t value_bytes)>;

/// Storage cost defined by a stored value itself, absent when the value is
/// charged by length
using ValueDefinedCostFn =
    std::function<std::optional<uint32_t>(byte_string_view value)>;

struct ApplyEnv
{
    NodeFetcher const &source;
    SectionRemovalFn const &section_removal;
};

/// Applies a sorted, duplicate free batch to `tree` (null for an empty
/// tree) and returns the new root
CostResult<std::pair<std::unique_ptr<TreeNode>, KeyUpdates>> apply_to(
    std::unique_ptr<TreeNode> tree, std::span<BatchEntry const> batch,
    ApplyEnv const &env);

/// Fetches the child on `left` if it is only referenced, then detaches it
CostResult<std::unique_ptr<TreeNode>>
detach_loaded(TreeNode &tree, bool left, NodeFetcher const &source);

GROVEDB_MERK_NAMESPACE_END
