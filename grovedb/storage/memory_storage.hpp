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
#include <grovedb/core/bytes.hpp>
#include <grovedb/storage/storage_batch.hpp>
#include <grovedb/storage/storage_context.hpp>

#include <array>
#include <cstddef>
#include <map>
#include <memory>
#include <span>

GROVEDB_STORAGE_NAMESPACE_BEGIN

/// Prefix of the storage context that holds the subtree at `path`
bytes32_t build_prefix(std::span<byte_string const> path);

/// Ordered in-memory key/value engine. Contexts created from it share the
/// same keyspaces, each context confined to its 32 byte prefix.
class MemoryStorage
{
    friend class MemoryStorageContext;

    using map_type = std::map<byte_string, byte_string>;

    std::array<map_type, KEYSPACE_COUNT> spaces_;

public:
    MemoryStorage() = default;
    MemoryStorage(MemoryStorage const &) = delete;
    MemoryStorage &operator=(MemoryStorage const &) = delete;

    std::unique_ptr<StorageContext> context(bytes32_t const &prefix);

    std::unique_ptr<StorageContext>
    context_for_path(std::span<byte_string const> const path)
    {
        return context(build_prefix(path));
    }

    size_t size(Keyspace const keyspace) const noexcept
    {
        return spaces_[static_cast<size_t>(keyspace)].size();
    }
};

class MemoryStorageContext final : public StorageContext
{
    MemoryStorage &db_;
    bytes32_t prefix_;

    byte_string prefixed(byte_string_view key) const;

public:
    MemoryStorageContext(MemoryStorage &db, bytes32_t const &prefix)
        : db_{db}
        , prefix_{prefix}
    {
    }

    CostResult<std::optional<byte_string>>
    get_in(Keyspace, byte_string_view key) override;

    CostResult<void> commit_batch(StorageBatch const &batch) override;

    std::unique_ptr<RawIterator> raw_iter(Keyspace) override;
};

/// Context whose data and aux keyspaces fail every access; used to check
/// that storage errors surface unchanged to the caller
class FailingDataStorageContext final : public StorageContext
{
    StorageContext &inner_;

public:
    explicit FailingDataStorageContext(StorageContext &inner)
        : inner_{inner}
    {
    }

    CostResult<std::optional<byte_string>>
    get_in(Keyspace, byte_string_view key) override;

    CostResult<void> commit_batch(StorageBatch const &batch) override;

    std::unique_ptr<RawIterator> raw_iter(Keyspace keyspace) override
    {
        return inner_.raw_iter(keyspace);
    }
};

GROVEDB_STORAGE_NAMESPACE_END
