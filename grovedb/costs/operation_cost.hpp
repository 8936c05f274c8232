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

#include <grovedb/core/codec.hpp>
#include <grovedb/core/result.hpp>
#include <grovedb/costs/key_value_storage_cost.hpp>
#include <grovedb/costs/storage_cost.hpp>

#include <cstdint>
#include <optional>

GROVEDB_NAMESPACE_BEGIN

/// `n` plus the space of its own varint length prefix
constexpr uint32_t paid_len(uint32_t const n) noexcept
{
    return n + varint_size(n);
}

/// Leading byte of an encoded merk node holding the child presence flags
inline constexpr uint32_t NODE_HEADER_LEN = 1;

/// Encoded sizes of the links to the children of a node, used to separate
/// the node's own value bytes from the bytes that describe its children
struct ChildrenSizes
{
    std::optional<uint32_t> left;
    std::optional<uint32_t> right;
    // aggregate payload carried by the parent's link to this node
    uint32_t aggregate_len{0};
};

struct OperationCost
{
    uint32_t seek_count{0};
    StorageCost storage_cost{};
    uint64_t storage_loaded_bytes{0};
    uint32_t hash_node_calls{0};
    uint32_t sinsemilla_hash_calls{0};

    bool operator==(OperationCost const &) const = default;

    static OperationCost with_seek_count(uint32_t const n)
    {
        return {.seek_count = n};
    }

    static OperationCost with_storage_written_bytes(uint32_t const n)
    {
        return {.storage_cost = {.added_bytes = n}};
    }

    static OperationCost with_storage_loaded_bytes(uint64_t const n)
    {
        return {.storage_loaded_bytes = n};
    }

    static OperationCost with_storage_freed_bytes(uint32_t const n)
    {
        return {.storage_cost = {.removed_bytes = StorageRemovedBytes::basic(n)}};
    }

    static OperationCost with_hash_node_calls(uint32_t const n)
    {
        return {.hash_node_calls = n};
    }

    OperationCost &operator+=(OperationCost const &rhs)
    {
        seek_count += rhs.seek_count;
        storage_cost += rhs.storage_cost;
        storage_loaded_bytes += rhs.storage_loaded_bytes;
        hash_node_calls += rhs.hash_node_calls;
        sinsemilla_hash_calls += rhs.sinsemilla_hash_calls;
        return *this;
    }

    friend OperationCost operator+(OperationCost lhs, OperationCost const &rhs)
    {
        lhs += rhs;
        return lhs;
    }

    bool worse_or_eq_than(OperationCost const &other) const;

    /// Charges the storage for one key/value pair. Without `info` the pair
    /// is charged as newly added bytes; with `info` the supplied split is
    /// verified against the paid lengths and charged instead.
    Result<void> add_key_value_storage_costs(
        uint32_t key_len, uint32_t value_len,
        std::optional<ChildrenSizes> const &children_sizes,
        std::optional<KeyValueStorageCost> const &info);
};

GROVEDB_NAMESPACE_END
