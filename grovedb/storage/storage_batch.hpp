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
#include <grovedb/costs/key_value_storage_cost.hpp>
#include <grovedb/costs/operation_cost.hpp>

#include <cstdint>
#include <optional>
#include <vector>

GROVEDB_STORAGE_NAMESPACE_BEGIN

enum class Keyspace : uint8_t
{
    data,
    aux,
    roots,
    meta,
};

inline constexpr unsigned KEYSPACE_COUNT = 4;

struct BatchOperation
{
    enum class Kind : uint8_t
    {
        put,
        del,
    };

    Kind kind;
    Keyspace keyspace;
    byte_string key;
    byte_string value;
    std::optional<ChildrenSizes> children_sizes;
    std::optional<KeyValueStorageCost> cost_info;
};

/// Ordered list of pending writes against one storage context; applied
/// atomically by StorageContext::commit_batch
class StorageBatch
{
    std::vector<BatchOperation> ops_;

public:
    void put(
        byte_string_view const key, byte_string value,
        std::optional<ChildrenSizes> children_sizes = std::nullopt,
        std::optional<KeyValueStorageCost> cost_info = std::nullopt)
    {
        ops_.push_back(BatchOperation{
            .kind = BatchOperation::Kind::put,
            .keyspace = Keyspace::data,
            .key = byte_string{key},
            .value = std::move(value),
            .children_sizes = std::move(children_sizes),
            .cost_info = std::move(cost_info)});
    }

    void put_in(
        Keyspace const keyspace, byte_string_view const key, byte_string value,
        std::optional<KeyValueStorageCost> cost_info = std::nullopt)
    {
        ops_.push_back(BatchOperation{
            .kind = BatchOperation::Kind::put,
            .keyspace = keyspace,
            .key = byte_string{key},
            .value = std::move(value),
            .children_sizes = std::nullopt,
            .cost_info = std::move(cost_info)});
    }

    void del(
        byte_string_view const key,
        std::optional<KeyValueStorageCost> cost_info = std::nullopt)
    {
        del_in(Keyspace::data, key, std::move(cost_info));
    }

    void del_in(
        Keyspace const keyspace, byte_string_view const key,
        std::optional<KeyValueStorageCost> cost_info = std::nullopt)
    {
        ops_.push_back(BatchOperation{
            .kind = BatchOperation::Kind::del,
            .keyspace = keyspace,
            .key = byte_string{key},
            .value = {},
            .children_sizes = std::nullopt,
            .cost_info = std::move(cost_info)});
    }

    void append(StorageBatch &&other)
    {
        ops_.insert(
            ops_.end(),
            std::make_move_iterator(other.ops_.begin()),
            std::make_move_iterator(other.ops_.end()));
        other.ops_.clear();
    }

    bool empty() const noexcept
    {
        return ops_.empty();
    }

    size_t size() const noexcept
    {
        return ops_.size();
    }

    std::vector<BatchOperation> const &operations() const noexcept
    {
        return ops_;
    }
};

GROVEDB_STORAGE_NAMESPACE_END
