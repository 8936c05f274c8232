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
#include <grovedb/costs/operation_cost.hpp>
#include <grovedb/merk/link.hpp>
#include <grovedb/merk/tree_feature_type.hpp>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <optional>

GROVEDB_MERK_NAMESPACE_BEGIN

/// One node of a merk: a key/value pair with its hashes, its feature type
/// and links to up to two children.
class TreeNode
{
    byte_string key_;
    byte_string value_;
    TreeFeatureType feature_type_;
    bytes32_t value_hash_;
    bytes32_t kv_hash_;
    // storage cost of the value when it is defined by the value itself
    // (subtrees) rather than by its length
    std::optional<uint32_t> value_defined_cost_;
    std::optional<Link> left_;
    std::optional<Link> right_;
    // value cost of the copy in storage, absent until first written
    std::optional<uint32_t> stored_value_cost_;

    std::optional<Link> &slot(bool const left) noexcept
    {
        return left ? left_ : right_;
    }

public:
    TreeNode(
        byte_string key, byte_string value, TreeFeatureType feature_type,
        bytes32_t const &value_hash, bytes32_t const &kv_hash,
        std::optional<uint32_t> value_defined_cost = std::nullopt);

    TreeNode(TreeNode const &) = delete;
    TreeNode &operator=(TreeNode const &) = delete;

    /// New node whose value hash is supplied by the caller
    static CostContext<std::unique_ptr<TreeNode>> make(
        byte_string key, byte_string value, bytes32_t const &value_hash,
        TreeFeatureType feature_type,
        std::optional<uint32_t> value_defined_cost = std::nullopt);

    /// New node hashing its own value
    static CostContext<std::unique_ptr<TreeNode>>
    make(byte_string key, byte_string value, TreeFeatureType feature_type);

    byte_string const &key() const noexcept
    {
        return key_;
    }

    byte_string const &value() const noexcept
    {
        return value_;
    }

    TreeFeatureType const &feature_type() const noexcept
    {
        return feature_type_;
    }

    bytes32_t const &value_hash() const noexcept
    {
        return value_hash_;
    }

    bytes32_t const &kv_hash() const noexcept
    {
        return kv_hash_;
    }

    std::optional<uint32_t> value_defined_cost() const noexcept
    {
        return value_defined_cost_;
    }

    void set_value_defined_cost(std::optional<uint32_t> const cost) noexcept
    {
        value_defined_cost_ = cost;
    }

    Link const *link(bool const left) const noexcept
    {
        auto const &s = left ? left_ : right_;
        return s.has_value() ? &*s : nullptr;
    }

    Link *link(bool const left) noexcept
    {
        auto &s = slot(left);
        return s.has_value() ? &*s : nullptr;
    }

    // in-memory child, null when absent or only referenced
    TreeNode *child(bool const left) const noexcept
    {
        auto const *l = link(left);
        return l ? l->tree() : nullptr;
    }

    bytes32_t const &child_hash(bool left) const;

    AggregateData child_aggregate_data(bool left) const;

    uint8_t child_height(bool const left) const noexcept
    {
        auto const *l = link(left);
        return l ? l->height() : 0;
    }

    ChildHeights child_heights() const noexcept
    {
        return {.left = child_height(true), .right = child_height(false)};
    }

    uint8_t height() const noexcept
    {
        auto const h = child_heights();
        return static_cast<uint8_t>(1 + std::max(h.left, h.right));
    }

    int balance_factor() const noexcept
    {
        return static_cast<int>(child_height(false)) -
               static_cast<int>(child_height(true));
    }

    size_t child_pending_writes(bool left) const noexcept;

    /// Own feature combined with the aggregates of both children
    Result<AggregateData> aggregate_data() const;

    CostResult<bytes32_t> hash() const;

    /// Attaches `child` (possibly null) as a modified link on an empty side
    void attach(bool left, std::unique_ptr<TreeNode> child);

    /// Detaches the in-memory child on `left`; the link must not be a
    /// reference
    std::unique_ptr<TreeNode> detach(bool left);

    /// Replaces a reference link by the fetched child
    void load(bool left, std::unique_ptr<TreeNode> child);

    /// Replaces the value and its hash, recomputing the kv hash
    OperationCost set_value(
        byte_string value, bytes32_t const &value_hash,
        TreeFeatureType feature_type,
        std::optional<uint32_t> value_defined_cost = std::nullopt);

    OperationCost put_value(byte_string value, TreeFeatureType feature_type);

    // Storage costs, with the key and its 32 byte context prefix
    uint32_t key_storage_cost() const noexcept;
    uint32_t value_storage_cost() const noexcept;

    std::optional<uint32_t> stored_value_cost() const noexcept
    {
        return stored_value_cost_;
    }

    void set_stored_value_cost(uint32_t const cost) noexcept
    {
        stored_value_cost_ = cost;
    }

    /// Hashes every modified descendant, turning modified links into
    /// uncommitted ones
    CostResult<void> compute_hashes();

    /// Marks every uncommitted descendant as written
    void mark_written();

    /// Turns every loaded link deeper than `keep_levels` into a reference
    void prune(unsigned keep_levels);

    ChildrenSizes children_sizes() const;

    // header | links | feature payload | kv_hash | value_hash | value
    byte_string encode() const;
    static Result<std::unique_ptr<TreeNode>>
    decode(byte_string key, byte_string_view enc);
};

GROVEDB_MERK_NAMESPACE_END
