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

#include <grovedb/costs/storage_cost.hpp>
#include <grovedb/costs/storage_removed_bytes.hpp>

#include <cstdint>
#include <optional>

GROVEDB_NAMESPACE_BEGIN

/// Prefix (32) + 1 for the 'r' marker + 1 for required space
inline constexpr uint32_t ROOT_KEY_STORAGE_COST = 34;

struct KeyValueStorageCost
{
    StorageCost key_storage_cost{};
    StorageCost value_storage_cost{};
    bool new_node{false};
    bool needs_value_verification{false};

    bool operator==(KeyValueStorageCost const &) const = default;

    KeyValueStorageCost &operator+=(KeyValueStorageCost const &rhs)
    {
        key_storage_cost += rhs.key_storage_cost;
        value_storage_cost += rhs.value_storage_cost;
        new_node &= rhs.new_node;
        needs_value_verification &= rhs.needs_value_verification;
        return *this;
    }

    StorageRemovedBytes combined_removed_bytes() const
    {
        return key_storage_cost.removed_bytes +
               value_storage_cost.removed_bytes;
    }

    /// Cost of rewriting the stored root key of a subtree whose root key
    /// length moves from `old_tree_key_len` (absent for a new subtree) to
    /// `tree_key_len`
    static KeyValueStorageCost for_updated_root_cost(
        std::optional<uint32_t> old_tree_key_len, uint32_t tree_key_len);
};

GROVEDB_NAMESPACE_END
