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
#include <grovedb/costs/cost_context.hpp>
#include <grovedb/dense_tree/store.hpp>
#include <grovedb/query/query.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

GROVEDB_DENSE_TREE_NAMESPACE_BEGIN

inline constexpr size_t MAX_PROOF_ELEMENTS = 100'000;
inline constexpr size_t MAX_PROOF_DECODE_SIZE = 100 * 1024 * 1024;

using ProvenEntries = std::vector<std::pair<uint16_t, byte_string>>;
using PositionHashes = std::vector<std::pair<uint16_t, bytes32_t>>;

/*
 * Inclusion proof for positions of a dense tree.
 *
 * Every proved position and all its ancestors form the expanded set.
 * Proved positions carry their value; the remaining ancestors carry only
 * the hash of their value, since that is all an internal node hash uses.
 * Children of the expanded set that lie outside it carry their subtree hash.
 */
struct DenseTreeProof
{
    uint8_t height{0};
    uint16_t count{0};
    ProvenEntries entries;
    PositionHashes node_value_hashes;
    PositionHashes node_hashes;

    /// Positions must be below `count`; repeats are collapsed
    static CostResult<DenseTreeProof> generate(
        uint8_t height, uint16_t count, std::span<uint16_t const> positions,
        DenseTreeStore &);

    /// Proves [start, end)
    static CostResult<DenseTreeProof> generate_range(
        uint8_t height, uint16_t count, uint16_t start, uint16_t end,
        DenseTreeStore &);

    /// Proves every position selected by `query`, whose keys are big endian
    /// positions
    static CostResult<DenseTreeProof> generate_for_query(
        uint8_t height, uint16_t count, query::Query const &,
        DenseTreeStore &);

    /// Proved entries below `count`, after checking the root
    Result<ProvenEntries> verify(bytes32_t const &expected_root) const;

    Result<std::pair<bytes32_t, ProvenEntries>> verify_and_get_root() const;

    byte_string encode() const;
    static Result<DenseTreeProof> decode(byte_string_view);
};

GROVEDB_DENSE_TREE_NAMESPACE_END
