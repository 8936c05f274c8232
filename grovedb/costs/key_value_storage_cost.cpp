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

#include <grovedb/costs/key_value_storage_cost.hpp>

#include <grovedb/core/codec.hpp>

GROVEDB_NAMESPACE_BEGIN

KeyValueStorageCost KeyValueStorageCost::for_updated_root_cost(
    std::optional<uint32_t> const old_tree_key_len,
    uint32_t const tree_key_len)
{
    uint32_t const new_bytes = tree_key_len + varint_size(tree_key_len);
    if (!old_tree_key_len.has_value()) {
        return KeyValueStorageCost{
            .key_storage_cost = {.added_bytes = ROOT_KEY_STORAGE_COST},
            .value_storage_cost = {.added_bytes = new_bytes},
            .new_node = true,
            .needs_value_verification = false};
    }
    uint32_t const old_bytes =
        *old_tree_key_len + varint_size(*old_tree_key_len);
    StorageCost value_storage_cost;
    if (tree_key_len < *old_tree_key_len) {
        value_storage_cost.replaced_bytes = new_bytes;
        value_storage_cost.removed_bytes =
            StorageRemovedBytes::basic(old_bytes - new_bytes);
    }
    else if (tree_key_len == *old_tree_key_len) {
        value_storage_cost.replaced_bytes = new_bytes;
    }
    else {
        value_storage_cost.added_bytes = new_bytes - old_bytes;
        value_storage_cost.replaced_bytes = old_bytes;
    }
    return KeyValueStorageCost{
        .key_storage_cost = {.replaced_bytes = ROOT_KEY_STORAGE_COST},
        .value_storage_cost = std::move(value_storage_cost),
        .new_node = false,
        .needs_value_verification = false};
}

GROVEDB_NAMESPACE_END
