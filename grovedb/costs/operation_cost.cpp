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

#include <grovedb/costs/operation_cost.hpp>

#include <grovedb/core/codec.hpp>

#include <optional>

GROVEDB_NAMESPACE_BEGIN

bool OperationCost::worse_or_eq_than(OperationCost const &other) const
{
    return seek_count >= other.seek_count &&
           storage_cost.worse_or_eq_than(other.storage_cost) &&
           storage_loaded_bytes >= other.storage_loaded_bytes &&
           hash_node_calls >= other.hash_node_calls &&
           sinsemilla_hash_calls >= other.sinsemilla_hash_calls;
}

Result<void> OperationCost::add_key_value_storage_costs(
    uint32_t const key_len, uint32_t const value_len,
    std::optional<ChildrenSizes> const &children_sizes,
    std::optional<KeyValueStorageCost> const &info)
{
    uint32_t const paid_key_len = paid_len(key_len);

    uint32_t final_paid_value_len;
    if (info.has_value() && !info->needs_value_verification) {
        final_paid_value_len = info->value_storage_cost.added_bytes +
                               info->value_storage_cost.replaced_bytes;
    }
    else if (children_sizes.has_value()) {
        uint32_t own = value_len - NODE_HEADER_LEN;
        own -= children_sizes->left.value_or(0);
        own -= children_sizes->right.value_or(0);
        final_paid_value_len =
            paid_len(own) + key_len + 3 + children_sizes->aggregate_len;
    }
    else {
        final_paid_value_len = paid_len(value_len);
    }

    if (!info.has_value()) {
        storage_cost += StorageCost{.added_bytes = paid_key_len};
        storage_cost += StorageCost{.added_bytes = final_paid_value_len};
        return outcome::success();
    }
    BOOST_OUTCOME_TRY(info->key_storage_cost.verify_key_storage_cost(
        paid_key_len, info->new_node));
    BOOST_OUTCOME_TRY(info->value_storage_cost.verify(final_paid_value_len));
    storage_cost += info->key_storage_cost;
    storage_cost += info->value_storage_cost;
    return outcome::success();
}

GROVEDB_NAMESPACE_END
