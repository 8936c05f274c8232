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

#include <grovedb/bulk_append/config.hpp>

#include <grovedb/core/byte_string.hpp>
#include <grovedb/core/bytes.hpp>
#include <grovedb/costs/cost_context.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

GROVEDB_NAMESPACE_BEGIN

namespace storage
{
    class StorageContext;
}

GROVEDB_NAMESPACE_END

GROVEDB_BULK_APPEND_NAMESPACE_BEGIN

/// (global position, value) pairs in ascending position order
using PositionedValues = std::vector<std::pair<uint64_t, byte_string>>;

inline constexpr unsigned char META_KEY[] = {'M'};
inline constexpr unsigned char BUFFER_KEY_PREFIX[] = {'b'};
inline constexpr size_t META_SIZE = sizeof(uint64_t) + sizeof(bytes32_t);

/// blake3("bulk_state" || mmr_root || buffer_hash)
bytes32_t compute_state_root(
    bytes32_t const &mmr_root, bytes32_t const &buffer_hash);

/// Size of an MMR holding `leaf_count` leaves
uint64_t leaf_count_to_mmr_size(uint64_t leaf_count) noexcept;

struct AppendResult
{
    bytes32_t state_root;
    uint64_t global_position;
    uint32_t hash_count;
    bool compacted;
};

/*
 * Append only log in two levels. Values first land in a dense buffer tree of
 * height `chunk_power`; the value that would overflow it completes a chunk of
 * 2^chunk_power entries, which is serialized into one blob and pushed as a
 * leaf of the chunk MMR, after which the buffer starts over.
 *
 * Within one storage context the MMR nodes sit under their 8 byte position
 * keys, buffer values under "b" || u16 position and the meta record
 * (mmr_size || buffer_hash) under "M". The total count is owned by the caller.
 */
class BulkAppendTree
{
    uint64_t total_count_;
    uint8_t chunk_power_;
    uint64_t mmr_size_;
    bytes32_t buffer_hash_;

    BulkAppendTree(
        uint64_t const total_count, uint8_t const chunk_power,
        uint64_t const mmr_size, bytes32_t const &buffer_hash)
        : total_count_{total_count}
        , chunk_power_{chunk_power}
        , mmr_size_{mmr_size}
        , buffer_hash_{buffer_hash}
    {
    }

    // moves the full buffer plus `last_value` into a new chunk
    CostResult<void>
    compact(storage::StorageContext &, byte_string_view last_value);

public:
    static Result<BulkAppendTree> create(uint8_t chunk_power);
    static Result<BulkAppendTree> from_state(
        uint64_t total_count, uint8_t chunk_power, uint64_t mmr_size,
        bytes32_t const &buffer_hash);

    /// Reads the meta record; a missing record is only valid when nothing
    /// was ever appended
    static CostResult<BulkAppendTree> load(
        storage::StorageContext &, uint64_t total_count, uint8_t chunk_power);

    uint8_t chunk_power() const noexcept
    {
        return chunk_power_;
    }

    uint64_t epoch_size() const noexcept
    {
        return uint64_t{1} << chunk_power_;
    }

    uint64_t total_count() const noexcept
    {
        return total_count_;
    }

    uint64_t chunk_count() const noexcept
    {
        return total_count_ / epoch_size();
    }

    uint16_t buffer_count() const noexcept
    {
        return static_cast<uint16_t>(total_count_ % epoch_size());
    }

    uint64_t mmr_size() const noexcept
    {
        return mmr_size_;
    }

    bytes32_t const &buffer_hash() const noexcept
    {
        return buffer_hash_;
    }

    std::array<unsigned char, META_SIZE> serialize_meta() const;
    static Result<std::pair<uint64_t, bytes32_t>>
    deserialize_meta(byte_string_view);

    CostResult<AppendResult>
    append(storage::StorageContext &, byte_string_view value);

    /// Zero hash while no chunk has completed
    CostResult<bytes32_t> mmr_root(storage::StorageContext &) const;

    CostResult<bytes32_t> state_root(storage::StorageContext &) const;

    /// Value at a global position, from its chunk blob or the buffer
    CostResult<std::optional<byte_string>>
    get_value(storage::StorageContext &, uint64_t position) const;

    /// Serialized blob of a completed chunk
    CostResult<std::optional<byte_string>>
    get_chunk_value(storage::StorageContext &, uint64_t chunk_index) const;

    /// Values at positions [start, end), clamped to the total count
    CostResult<PositionedValues>
    query_range(storage::StorageContext &, uint64_t start, uint64_t end) const;
};

GROVEDB_BULK_APPEND_NAMESPACE_END
