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

#include <grovedb/dense_tree/config.hpp>

#include <grovedb/core/byte_string.hpp>
#include <grovedb/costs/cost_context.hpp>

#include <cstdint>
#include <map>
#include <optional>

GROVEDB_NAMESPACE_BEGIN

namespace storage
{
    class StorageContext;
}

GROVEDB_NAMESPACE_END

GROVEDB_DENSE_TREE_NAMESPACE_BEGIN

/// 2 byte big endian storage key of a position
byte_string position_key(uint16_t position);

/// Values of a dense tree by position
class DenseTreeStore
{
public:
    virtual ~DenseTreeStore() = default;

    virtual CostResult<std::optional<byte_string>>
    get_value(uint16_t position) = 0;

    virtual CostResult<void>
    put_value(uint16_t position, byte_string_view value) = 0;
};

class MemDenseTreeStore final : public DenseTreeStore
{
    std::map<uint16_t, byte_string> values_;

public:
    CostResult<std::optional<byte_string>>
    get_value(uint16_t position) override;

    CostResult<void>
    put_value(uint16_t position, byte_string_view value) override;
};

/// Values under `key_prefix || position_key(position)` in the data
/// keyspace of a storage context
class StorageDenseTreeStore final : public DenseTreeStore
{
    storage::StorageContext &ctx_;
    byte_string key_prefix_;
    std::map<uint16_t, byte_string> cache_;

    byte_string key(uint16_t position) const;

public:
    explicit StorageDenseTreeStore(
        storage::StorageContext &ctx, byte_string key_prefix = {})
        : ctx_{ctx}
        , key_prefix_{std::move(key_prefix)}
    {
    }

    CostResult<std::optional<byte_string>>
    get_value(uint16_t position) override;

    CostResult<void>
    put_value(uint16_t position, byte_string_view value) override;

    /// Deletes positions [0, count) and forgets cached values
    CostResult<void> clear(uint16_t count);
};

GROVEDB_DENSE_TREE_NAMESPACE_END
