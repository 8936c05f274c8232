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

#include <grovedb/mmr/config.hpp>

#include <grovedb/costs/cost_context.hpp>
#include <grovedb/mmr/node.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

GROVEDB_NAMESPACE_BEGIN

namespace storage
{
    class StorageContext;
}

GROVEDB_NAMESPACE_END

GROVEDB_MMR_NAMESPACE_BEGIN

/// Position addressed node store backing a range
class MmrStore
{
public:
    virtual ~MmrStore() = default;

    virtual CostResult<std::optional<MmrNode>>
    element_at_position(uint64_t pos) = 0;

    /// Writes `elems` at consecutive positions starting at `pos`
    virtual CostResult<void>
    append(uint64_t pos, std::vector<MmrNode> elems) = 0;
};

class MemMmrStore final : public MmrStore
{
    std::map<uint64_t, MmrNode> nodes_;

public:
    CostResult<std::optional<MmrNode>>
    element_at_position(uint64_t pos) override;

    CostResult<void>
    append(uint64_t pos, std::vector<MmrNode> elems) override;

    size_t size() const noexcept
    {
        return nodes_.size();
    }
};

/// Nodes stored in the data keyspace of a storage context under their
/// 8 byte big endian position
class StorageMmrStore final : public MmrStore
{
    storage::StorageContext &ctx_;

public:
    explicit StorageMmrStore(storage::StorageContext &ctx)
        : ctx_{ctx}
    {
    }

    CostResult<std::optional<MmrNode>>
    element_at_position(uint64_t pos) override;

    CostResult<void>
    append(uint64_t pos, std::vector<MmrNode> elems) override;
};

GROVEDB_MMR_NAMESPACE_END
