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

#include <grovedb/core/byte_string.hpp>
#include <grovedb/core/bytes.hpp>
#include <grovedb/core/result.hpp>

#include <cstdint>
#include <optional>

GROVEDB_MMR_NAMESPACE_BEGIN

/// blake3(0x00 || value)
bytes32_t leaf_hash(byte_string_view value);

/// blake3(0x01 || left || right)
bytes32_t merge_hash(bytes32_t const &left, bytes32_t const &right);

/// A node of the range. Leaves keep the value they commit to; a data leaf
/// carries a hash computed by its owner rather than leaf_hash(value).
class MmrNode
{
    bytes32_t hash_{};
    std::optional<byte_string> value_{};
    bool is_data_leaf_{false};

    MmrNode(
        bytes32_t const &hash, std::optional<byte_string> value,
        bool is_data_leaf)
        : hash_{hash}
        , value_{std::move(value)}
        , is_data_leaf_{is_data_leaf}
    {
    }

public:
    static MmrNode leaf(byte_string value);
    static MmrNode internal(bytes32_t const &hash);
    static MmrNode data_leaf(bytes32_t const &hash, byte_string data);
    static MmrNode merge(MmrNode const &left, MmrNode const &right);

    bytes32_t const &hash() const noexcept
    {
        return hash_;
    }

    std::optional<byte_string> const &value() const noexcept
    {
        return value_;
    }

    bool is_data_leaf() const noexcept
    {
        return is_data_leaf_;
    }

    uint64_t serialized_size() const noexcept
    {
        return value_.has_value() ? 37 + value_->size() : 33;
    }

    Result<byte_string> serialize() const;
    static Result<MmrNode> deserialize(byte_string_view);

    // nodes are identified by their hash alone
    bool operator==(MmrNode const &other) const noexcept
    {
        return hash_ == other.hash_;
    }
};

GROVEDB_MMR_NAMESPACE_END
