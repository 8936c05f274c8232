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

#include <grovedb/core/config.hpp>

#include <grovedb/core/byte_string.hpp>
#include <grovedb/core/bytes.hpp>
#include <grovedb/core/result.hpp>
#include <grovedb/element/reference_path.hpp>
#include <grovedb/merk/proofs/query.hpp>
#include <grovedb/merk/tree_feature_type.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>

GROVEDB_NAMESPACE_BEGIN

/// First byte of every stored element. Part of the storage and proof
/// encodings; never reorder.
enum class ElementType : uint8_t
{
    item = 0,
    reference = 1,
    tree = 2,
    sum_item = 3,
    sum_tree = 4,
    big_sum_tree = 5,
    count_tree = 6,
    count_sum_tree = 7,
    provable_count_tree = 8,
    item_with_sum_item = 9,
    provable_count_sum_tree = 10,
    commitment_tree = 11,
    mmr_tree = 12,
    bulk_append_tree = 13,
};

inline constexpr uint8_t ELEMENT_TYPE_COUNT = 14;

Result<ElementType> element_type_of(byte_string_view serialized);

char const *element_type_name(ElementType);

constexpr bool is_any_item(ElementType const t) noexcept
{
    return t == ElementType::item || t == ElementType::sum_item ||
           t == ElementType::item_with_sum_item;
}

// trees whose contents live in a child merk
constexpr bool is_merk_tree(ElementType const t) noexcept
{
    switch (t) {
    case ElementType::tree:
    case ElementType::sum_tree:
    case ElementType::big_sum_tree:
    case ElementType::count_tree:
    case ElementType::count_sum_tree:
    case ElementType::provable_count_tree:
    case ElementType::provable_count_sum_tree:
        return true;
    default:
        return false;
    }
}

// trees whose contents are kept by a specialised engine, committed through
// the root stored in the element
constexpr bool is_non_merk_tree(ElementType const t) noexcept
{
    return t == ElementType::commitment_tree || t == ElementType::mmr_tree ||
           t == ElementType::bulk_append_tree;
}

constexpr bool is_any_tree(ElementType const t) noexcept
{
    return is_merk_tree(t) || is_non_merk_tree(t);
}

/// Proof node type of an element given whether its merk is a provable
/// count tree. Items have their value hash recomputed by the verifier;
/// references and trees carry a combined value hash.
constexpr merk::ProofNodeType
proof_node_type(ElementType const t, bool const provable_count) noexcept
{
    using merk::ProofNodeType;
    if (is_any_item(t)) {
        return provable_count ? ProofNodeType::kv_count : ProofNodeType::kv;
    }
    if (t == ElementType::reference) {
        return provable_count ? ProofNodeType::kv_ref_value_hash_count
                              : ProofNodeType::kv_ref_value_hash;
    }
    return provable_count ? ProofNodeType::kv_value_hash_feature_type
                          : ProofNodeType::kv_value_hash;
}

/// ProofNodeTypeFn for merks holding elements
merk::ProofNodeType
element_proof_node_type(byte_string_view value, bool provable_count);

// Specialised sizes of the element payloads, used for storage costs
inline constexpr uint32_t TREE_COST_SIZE = 3;
inline constexpr uint32_t SUM_ITEM_COST_SIZE = 11;
inline constexpr uint32_t SUM_TREE_COST_SIZE = 12;
inline constexpr uint32_t BIG_SUM_TREE_COST_SIZE = 19;
inline constexpr uint32_t COUNT_TREE_COST_SIZE = 12;
inline constexpr uint32_t COUNT_SUM_TREE_COST_SIZE = 21;
inline constexpr uint32_t COMMITMENT_TREE_COST_SIZE = 44;
inline constexpr uint32_t MMR_TREE_COST_SIZE = 43;
inline constexpr uint32_t BULK_APPEND_TREE_COST_SIZE = 44;

using ElementFlags = byte_string;
using MaxReferenceHop = std::optional<uint8_t>;

/// Cost an element declares for itself instead of its serialized length
struct ValueDefinedCost
{
    enum class Kind : uint8_t
    {
        // a tree, whose value hash is paid by its child root
        layered,
        // a sum item, charged a fixed width
        specialized,
    };

    Kind kind;
    uint32_t cost;

    bool operator==(ValueDefinedCost const &) const = default;
};

/// A value stored in a grove
struct Element
{
    struct Item
    {
        byte_string value;
        bool operator==(Item const &) const = default;
    };

    struct Reference
    {
        ReferencePathType path;
        MaxReferenceHop max_hop;
        bool operator==(Reference const &) const = default;
    };

    struct Tree
    {
        std::optional<byte_string> root_key;
        bool operator==(Tree const &) const = default;
    };

    struct SumItem
    {
        int64_t value;
        bool operator==(SumItem const &) const = default;
    };

    struct SumTree
    {
        std::optional<byte_string> root_key;
        int64_t sum;
        bool operator==(SumTree const &) const = default;
    };

    struct BigSumTree
    {
        std::optional<byte_string> root_key;
        merk::int128_t sum;
        bool operator==(BigSumTree const &) const = default;
    };

    struct CountTree
    {
        std::optional<byte_string> root_key;
        uint64_t count;
        bool operator==(CountTree const &) const = default;
    };

    struct CountSumTree
    {
        std::optional<byte_string> root_key;
        uint64_t count;
        int64_t sum;
        bool operator==(CountSumTree const &) const = default;
    };

    struct ProvableCountTree
    {
        std::optional<byte_string> root_key;
        uint64_t count;
        bool operator==(ProvableCountTree const &) const = default;
    };

    struct ItemWithSumItem
    {
        byte_string value;
        int64_t sum;
        bool operator==(ItemWithSumItem const &) const = default;
    };

    struct ProvableCountSumTree
    {
        std::optional<byte_string> root_key;
        uint64_t count;
        int64_t sum;
        bool operator==(ProvableCountSumTree const &) const = default;
    };

    struct CommitmentTree
    {
        bytes32_t state_root;
        uint64_t total_count;
        uint8_t chunk_power;
        bool operator==(CommitmentTree const &) const = default;
    };

    struct MmrTree
    {
        bytes32_t mmr_root;
        uint64_t mmr_size;
        bool operator==(MmrTree const &) const = default;
    };

    struct BulkAppendTree
    {
        bytes32_t state_root;
        uint64_t total_count;
        uint8_t chunk_power;
        bool operator==(BulkAppendTree const &) const = default;
    };

    // alternatives in ElementType order
    using Variant = std::variant<
        Item, Reference, Tree, SumItem, SumTree, BigSumTree, CountTree,
        CountSumTree, ProvableCountTree, ItemWithSumItem, ProvableCountSumTree,
        CommitmentTree, MmrTree, BulkAppendTree>;

    Variant data;
    std::optional<ElementFlags> flags;

    bool operator==(Element const &) const = default;

    static Element
    item(byte_string value, std::optional<ElementFlags> flags = std::nullopt)
    {
        return {Item{std::move(value)}, std::move(flags)};
    }

    static Element reference(
        ReferencePathType path, MaxReferenceHop const max_hop = std::nullopt,
        std::optional<ElementFlags> flags = std::nullopt)
    {
        return {Reference{std::move(path), max_hop}, std::move(flags)};
    }

    static Element empty_tree(std::optional<ElementFlags> flags = std::nullopt)
    {
        return {Tree{}, std::move(flags)};
    }

    static Element
    sum_item(int64_t const v, std::optional<ElementFlags> flags = std::nullopt)
    {
        return {SumItem{v}, std::move(flags)};
    }

    static Element
    empty_sum_tree(std::optional<ElementFlags> flags = std::nullopt)
    {
        return {SumTree{std::nullopt, 0}, std::move(flags)};
    }

    static Element
    empty_big_sum_tree(std::optional<ElementFlags> flags = std::nullopt)
    {
        return {BigSumTree{std::nullopt, 0}, std::move(flags)};
    }

    static Element
    empty_count_tree(std::optional<ElementFlags> flags = std::nullopt)
    {
        return {CountTree{std::nullopt, 0}, std::move(flags)};
    }

    static Element
    empty_count_sum_tree(std::optional<ElementFlags> flags = std::nullopt)
    {
        return {CountSumTree{std::nullopt, 0, 0}, std::move(flags)};
    }

    static Element
    empty_provable_count_tree(std::optional<ElementFlags> flags = std::nullopt)
    {
        return {ProvableCountTree{std::nullopt, 0}, std::move(flags)};
    }

    static Element item_with_sum_item(
        byte_string value, int64_t const sum,
        std::optional<ElementFlags> flags = std::nullopt)
    {
        return {ItemWithSumItem{std::move(value), sum}, std::move(flags)};
    }

    static Element empty_provable_count_sum_tree(
        std::optional<ElementFlags> flags = std::nullopt)
    {
        return {ProvableCountSumTree{std::nullopt, 0, 0}, std::move(flags)};
    }

    static Element empty_commitment_tree(
        uint8_t chunk_power, std::optional<ElementFlags> flags = std::nullopt);

    static Element
    empty_mmr_tree(std::optional<ElementFlags> flags = std::nullopt);

    static Element empty_bulk_append_tree(
        uint8_t chunk_power, std::optional<ElementFlags> flags = std::nullopt);

    ElementType type() const noexcept
    {
        return static_cast<ElementType>(data.index());
    }

    bool is_any_item() const noexcept
    {
        return GROVEDB_NAMESPACE::is_any_item(type());
    }

    bool is_reference() const noexcept
    {
        return type() == ElementType::reference;
    }

    bool is_any_tree() const noexcept
    {
        return GROVEDB_NAMESPACE::is_any_tree(type());
    }

    bool is_merk_tree() const noexcept
    {
        return GROVEDB_NAMESPACE::is_merk_tree(type());
    }

    /// Merk type of the child of a merk tree element
    std::optional<merk::TreeType> tree_type() const noexcept;

    /// Root key of the child merk, absent for empty trees and non trees
    std::optional<byte_string> root_key() const;

    /// Rewrites the child merk description of a merk tree element
    Result<void> set_root_key_and_aggregate(
        std::optional<byte_string> root_key, merk::AggregateData const &);

    /// Value of the item, or the referenced value of a resolved reference
    Result<byte_string_view> item_value() const;

    int64_t sum_value_or_default() const noexcept;
    merk::int128_t big_sum_value_or_default() const noexcept;
    uint64_t count_value_or_default() const noexcept;
    std::pair<uint64_t, int64_t> count_sum_value_or_default() const noexcept;

    /// Contribution of this element to a merk of type `parent`
    merk::TreeFeatureType
    tree_feature_type(merk::TreeType parent) const noexcept;

    std::optional<ElementFlags> const &get_flags() const noexcept
    {
        return flags;
    }

    uint32_t flags_cost() const noexcept;

    std::optional<ValueDefinedCost> value_defined_cost() const;

    /// What the merk charges for the stored value when the element defines
    /// its own cost
    std::optional<uint32_t> merk_value_cost() const;

    byte_string serialize() const;
    static Result<Element> deserialize(byte_string_view);

    std::string to_string() const;
};

/// ValueDefinedCostFn for merks holding elements
std::optional<uint32_t> element_merk_value_cost(byte_string_view serialized);

GROVEDB_NAMESPACE_END
