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

#include <grovedb/core/result.hpp>
#include <grovedb/costs/storage_removed_bytes.hpp>

#include <cstdint>

GROVEDB_NAMESPACE_BEGIN

enum class OperationStorageTransitionType : uint8_t
{
    None,
    InsertNew,
    UpdateBiggerSize,
    UpdateSmallerSize,
    UpdateSameSize,
    Replace,
    Delete,
};

struct StorageCost
{
    uint32_t added_bytes{0};
    uint32_t replaced_bytes{0};
    StorageRemovedBytes removed_bytes{};

    bool operator==(StorageCost const &) const = default;

    StorageCost &operator+=(StorageCost const &rhs)
    {
        added_bytes += rhs.added_bytes;
        replaced_bytes += rhs.replaced_bytes;
        removed_bytes += rhs.removed_bytes;
        return *this;
    }

    friend StorageCost operator+(StorageCost lhs, StorageCost const &rhs)
    {
        lhs += rhs;
        return lhs;
    }

    // added + replaced must equal len
    Result<void> verify(uint32_t len) const;

    // key costs are only verified for new nodes
    Result<void> verify_key_storage_cost(uint32_t len, bool new_node) const;

    bool worse_or_eq_than(StorageCost const &other) const;

    bool has_storage_change() const noexcept
    {
        return added_bytes != 0 || removed_bytes.total_removed_bytes() != 0;
    }

    OperationStorageTransitionType transition_type() const noexcept;
};

GROVEDB_NAMESPACE_END
