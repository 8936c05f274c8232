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

#include <grovedb/costs/storage_cost.hpp>

#include <grovedb/core/error.hpp>

#include <quill/Quill.h>

GROVEDB_NAMESPACE_BEGIN

Result<void> StorageCost::verify(uint32_t const len) const
{
    if (added_bytes + replaced_bytes != len) {
        LOG_WARNING(
            "storage cost mismatch: expected added {} replaced {} removed {}, "
            "actual total bytes {}",
            added_bytes,
            replaced_bytes,
            removed_bytes.total_removed_bytes(),
            len);
        return Error::storage_cost_mismatch;
    }
    return outcome::success();
}

Result<void> StorageCost::verify_key_storage_cost(
    uint32_t const len, bool const new_node) const
{
    if (new_node) {
        return verify(len);
    }
    return outcome::success();
}

bool StorageCost::worse_or_eq_than(StorageCost const &other) const
{
    return replaced_bytes >= other.replaced_bytes &&
           added_bytes >= other.added_bytes &&
           removed_bytes <= other.removed_bytes;
}

OperationStorageTransitionType StorageCost::transition_type() const noexcept
{
    bool const removal = removed_bytes.has_removal();
    if (added_bytes > 0) {
        if (removal) {
            return OperationStorageTransitionType::Replace;
        }
        if (replaced_bytes > 0) {
            return OperationStorageTransitionType::UpdateBiggerSize;
        }
        return OperationStorageTransitionType::InsertNew;
    }
    if (removal) {
        if (replaced_bytes > 0) {
            return OperationStorageTransitionType::UpdateSmallerSize;
        }
        return OperationStorageTransitionType::Delete;
    }
    if (replaced_bytes > 0) {
        return OperationStorageTransitionType::UpdateSameSize;
    }
    return OperationStorageTransitionType::None;
}

GROVEDB_NAMESPACE_END
