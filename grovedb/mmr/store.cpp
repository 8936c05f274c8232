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

#include <grovedb/mmr/store.hpp>

#include <grovedb/mmr/helper.hpp>
#include <grovedb/mmr/mmr_error.hpp>
#include <grovedb/storage/storage_batch.hpp>
#include <grovedb/storage/storage_context.hpp>

#include <quill/Quill.h>

GROVEDB_MMR_NAMESPACE_BEGIN

CostResult<std::optional<MmrNode>>
MemMmrStore::element_at_position(uint64_t const pos)
{
    auto const it = nodes_.find(pos);
    if (it == nodes_.end()) {
        return {std::optional<MmrNode>{}, OperationCost::with_seek_count(1)};
    }
    OperationCost cost = OperationCost::with_seek_count(1);
    cost.storage_loaded_bytes = it->second.serialized_size();
    return {std::optional<MmrNode>{it->second}, cost};
}

CostResult<void>
MemMmrStore::append(uint64_t const pos, std::vector<MmrNode> elems)
{
    for (uint64_t i = 0; i < elems.size(); ++i) {
        nodes_.insert_or_assign(pos + i, std::move(elems[i]));
    }
    return {outcome::success(), OperationCost{}};
}

CostResult<std::optional<MmrNode>>
StorageMmrStore::element_at_position(uint64_t const pos)
{
    OperationCost cost;
    auto const bytes = GROVEDB_COST_TRY(cost, ctx_.get(mmr_node_key(pos)));
    if (!bytes.has_value()) {
        return {std::optional<MmrNode>{}, cost};
    }
    auto node = MmrNode::deserialize(*bytes);
    if (node.has_error()) {
        LOG_ERROR("mmr node at position {} does not decode", pos);
        return {MmrError::store_error, cost};
    }
    return {std::optional<MmrNode>{std::move(node).assume_value()}, cost};
}

CostResult<void>
StorageMmrStore::append(uint64_t const pos, std::vector<MmrNode> elems)
{
    OperationCost cost;
    storage::StorageBatch batch;
    for (uint64_t i = 0; i < elems.size(); ++i) {
        auto bytes = GROVEDB_COST_TRY_NO_ADD(cost, elems[i].serialize());
        batch.put(mmr_node_key(pos + i), std::move(bytes));
    }
    return ctx_.commit_batch(batch);
}

GROVEDB_MMR_NAMESPACE_END
