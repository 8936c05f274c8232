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
#include <grovedb/core/bytes.hpp>
#include <grovedb/core/result.hpp>

#include <cstdint>
#include <span>
#include <utility>

GROVEDB_DENSE_TREE_NAMESPACE_BEGIN

inline constexpr uint8_t MIN_HEIGHT = 1;
inline constexpr uint8_t MAX_HEIGHT = 16;

/// Hash of any position past the populated prefix, at every height
inline constexpr bytes32_t EMPTY_NODE_HASH = NULL_HASH;

Result<void> validate_height(uint8_t height);

constexpr uint64_t capacity_for_height(uint8_t const height) noexcept
{
    return (uint64_t{1} << height) - 1;
}

/// blake3(0x00 || value)
bytes32_t leaf_node_hash(byte_string_view value);

/// blake3(0x01 || blake3(value) || left || right)
bytes32_t internal_node_hash(
    bytes32_t const &value_hash, bytes32_t const &left,
    bytes32_t const &right);

/// Root of a perfect binary tree over `leaf_hashes`, whose count must be a
/// power of two
Result<bytes32_t> compute_dense_merkle_root(std::span<bytes32_t const>);

/// Root over blake3 of each value, plus the number of hashes computed
Result<std::pair<bytes32_t, uint32_t>>
compute_dense_merkle_root_from_values(std::span<byte_string const>);

GROVEDB_DENSE_TREE_NAMESPACE_END
