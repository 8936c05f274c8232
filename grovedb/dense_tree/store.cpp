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

#include <grovedb/dense_tree/store.hpp>

#include <grovedb/core/codec.hpp>
#include <grovedb/storage/storage_batch.hpp>
#include <grovedb/storage/storage_context.hpp>

GROVEDB_DENSE_TREE_NAMESPACE_BEGIN

byte_string position_key(uint16_t const position)
{
    return to_be_bytes(position);
}

CostResult<std::optional<byte_string>>
MemDenseTreeStore::get_value(uint16_t const position)
{
    OperationCost cost = OperationCost::with_seek_count(1);
    auto const it = values_.find(position);
    if (it == values_.end()) {
        return {std::optional<byte_string>{}, cost};
    }
    cost.storage_loaded_bytes = it->second.size();
    return {std::optional<byte_string>{it->second}, cost};
}

CostResult<void> MemDenseTreeStore::put_value(
    uint16_t const position, byte_string_view const value)
{
    values_.insert_or_assign(position, byte_string{value});
    return {outcome::success(), OperationCost{}};
}

byte_string StorageDenseTreeStore::key(uint16_t const position) const
{
    byte_string k = key_prefix_;
    append_be(k, position);
    return k;
}

CostResult<std::optional<byte_string>>
StorageDenseTreeStore::get_value(uint16_t const position)
{
    if (auto const it = cache_.find(position); it != cache_.end()) {
        return {std::optional<byte_string>{it->second}, OperationCost{}};
    }
    return ctx_.get(key(position));
}

CostResult<void> StorageDenseTreeStore::put_value(
    uint16_t const position, byte_string_view const value)
{
    OperationCost cost;
    GROVEDB_COST_TRY(cost, ctx_.put(key(position), byte_string{value}));
    cache_.insert_or_assign(position, byte_string{value});
    return {outcome::success(), cost};
}

CostResult<void> StorageDenseTreeStore::clear(uint16_t const count)
{
    storage::StorageBatch batch;
    for (uint16_t pos = 0; pos < count; ++pos) {
        batch.del(key(pos));
    }
    cache_.clear();
    return ctx_.commit_batch(batch);
}

GROVEDB_DENSE_TREE_NAMESPACE_END
