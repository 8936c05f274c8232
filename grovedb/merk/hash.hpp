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

#include <grovedb/merk/config.hpp>

#include <grovedb/core/byte_string.hpp>
#include <grovedb/core/bytes.hpp>
#include <grovedb/costs/cost_context.hpp>

#include <cstddef>
#include <cstdint>

GROVEDB_MERK_NAMESPACE_BEGIN

inline constexpr size_t HASH_BLOCK_SIZE = 64;

/// Hash calls charged for digesting `len` bytes
constexpr uint32_t hash_block_count(size_t const len) noexcept
{
    return len == 0 ? 1 : static_cast<uint32_t>(1 + (len - 1) / HASH_BLOCK_SIZE);
}

/// H(varint(len) ∥ value)
CostContext<bytes32_t> value_hash(byte_string_view value);

/// H(varint(len(key)) ∥ key ∥ value_hash(value))
CostContext<bytes32_t> kv_hash(byte_string_view key, byte_string_view value);

CostContext<bytes32_t>
kv_digest_to_kv_hash(byte_string_view key, bytes32_t const &value_hash);

CostContext<bytes32_t> node_hash(
    bytes32_t const &kv, bytes32_t const &left, bytes32_t const &right);

/// Node hash of provable-count trees; commits to the subtree count
CostContext<bytes32_t> node_hash_with_count(
    bytes32_t const &kv, bytes32_t const &left, bytes32_t const &right,
    uint64_t count);

CostContext<bytes32_t> combine_hash(bytes32_t const &a, bytes32_t const &b);

GROVEDB_MERK_NAMESPACE_END
