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

#include <grovedb/storage/config.hpp>

#include <grovedb/core/byte_string.hpp>
#include <grovedb/costs/cost_context.hpp>
#include <grovedb/costs/operation_cost.hpp>
#include <grovedb/storage/storage_batch.hpp>

#include <memory>
#include <optional>

GROVEDB_STORAGE_NAMESPACE_BEGIN

/// Cursor over one keyspace of a storage context. Keys are reported
/// without the context prefix. Every movement costs one seek; reading a
/// key or value charges the loaded bytes.
class RawIterator
{
public:
    virtual ~RawIterator() = default;

    virtual void seek_to_first(OperationCost &) = 0;
    virtual void seek_to_last(OperationCost &) = 0;
    virtual void seek(byte_string_view key, OperationCost &) = 0;
    virtual void seek_for_prev(byte_string_view key, OperationCost &) = 0;
    virtual void next(OperationCost &) = 0;
    virtual void prev(OperationCost &) = 0;
    virtual bool valid() const = 0;
    virtual std::optional<byte_string> key(OperationCost &) const = 0;
    virtual std::optional<byte_string> value(OperationCost &) const = 0;
};

/// Prefix-scoped access to the backing key/value engine
class StorageContext
{
public:
    virtual ~StorageContext() = default;

    virtual CostResult<std::optional<byte_string>>
    get_in(Keyspace, byte_string_view key) = 0;

    /// Applies every operation of `batch` or none of them
    virtual CostResult<void> commit_batch(StorageBatch const &batch) = 0;

    virtual std::unique_ptr<RawIterator> raw_iter(Keyspace) = 0;

    CostResult<std::optional<byte_string>> get(byte_string_view const key)
    {
        return get_in(Keyspace::data, key);
    }

    CostResult<std::optional<byte_string>> get_aux(byte_string_view const key)
    {
        return get_in(Keyspace::aux, key);
    }

    CostResult<std::optional<byte_string>> get_root(byte_string_view const key)
    {
        return get_in(Keyspace::roots, key);
    }

    CostResult<std::optional<byte_string>> get_meta(byte_string_view const key)
    {
        return get_in(Keyspace::meta, key);
    }

    CostResult<void> put(byte_string_view const key, byte_string value)
    {
        StorageBatch batch;
        batch.put(key, std::move(value));
        return commit_batch(batch);
    }

    CostResult<void> put_aux(byte_string_view const key, byte_string value)
    {
        StorageBatch batch;
        batch.put_in(Keyspace::aux, key, std::move(value));
        return commit_batch(batch);
    }

    CostResult<void> put_meta(byte_string_view const key, byte_string value)
    {
        StorageBatch batch;
        batch.put_in(Keyspace::meta, key, std::move(value));
        return commit_batch(batch);
    }

    CostResult<void> del(byte_string_view const key)
    {
        StorageBatch batch;
        batch.del(key);
        return commit_batch(batch);
    }
};

GROVEDB_STORAGE_NAMESPACE_END
