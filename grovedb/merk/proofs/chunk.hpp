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

#include <grovedb/core/bytes.hpp>
#include <grovedb/core/result.hpp>
#include <grovedb/costs/cost_context.hpp>
#include <grovedb/merk/proofs/op.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

GROVEDB_MERK_NAMESPACE_BEGIN

class Merk;
class TreeNode;

inline constexpr bool LEFT = true;
inline constexpr bool RIGHT = false;

/// Inclusive range of chunk ids, bisected to locate a chunk; starts at 1
class BinaryRange
{
    size_t start_;
    size_t end_;

    BinaryRange(size_t const start, size_t const end)
        : start_{start}
        , end_{end}
    {
    }

public:
    static Result<BinaryRange> make(size_t start, size_t end);

    size_t start() const noexcept
    {
        return start_;
    }

    size_t end() const noexcept
    {
        return end_;
    }

    size_t len() const noexcept
    {
        return end_ - start_ + 1;
    }

    bool odd() const noexcept
    {
        return len() % 2 != 0;
    }

    // side holding `value`; empty when outside or when the range is odd
    std::optional<bool> which_half(size_t value) const noexcept;

    Result<BinaryRange> half(bool left) const;

    // drops the first id, returning it
    Result<std::pair<BinaryRange, size_t>> advance_start() const;
};

// Chunks have a fixed height of 2, the last one possibly shorter
std::vector<size_t> chunk_height_per_layer(size_t height);

size_t number_of_chunks(size_t height);

Result<size_t> number_of_chunks_under_chunk_id(size_t height, size_t chunk_id);

/// Path from the root to the root of chunk `chunk_id` (1 = left)
Result<std::vector<bool>>
generate_traversal_instruction(size_t height, size_t chunk_id);

std::string traversal_instruction_as_string(std::vector<bool> const &);

Result<size_t> chunk_layer(size_t height, size_t chunk_id);

Result<size_t> chunk_height(size_t height, size_t chunk_id);

/// The subtree under `node` down to `depth` levels. Nodes are shown with
/// their value hash and feature type; subtrees below the depth as hashes.
CostResult<std::vector<Op>>
create_chunk(Merk const &, TreeNode const &node, size_t depth);

/// Follows `instructions` from the root, then creates a chunk there
CostResult<std::vector<Op>> traverse_and_build_chunk(
    Merk const &, std::vector<bool> const &instructions, size_t depth);

/// Chunk `chunk_id` of the merk under the layer scheme above
CostResult<std::vector<Op>> create_chunk_by_id(Merk const &, size_t chunk_id);

/// The left spine with kv hashes and the right siblings as hashes, which
/// pins down the height of the tree
CostResult<std::vector<Op>> generate_height_proof(Merk const &);

Result<size_t>
verify_height_proof(std::span<Op const> proof, bytes32_t const &expected_root);

GROVEDB_MERK_NAMESPACE_END
