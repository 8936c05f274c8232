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
#include <grovedb/core/result.hpp>
#include <grovedb/costs/cost_context.hpp>
#include <grovedb/merk/proofs/op.hpp>
#include <grovedb/merk/proofs/tree.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

GROVEDB_MERK_NAMESPACE_BEGIN

class Merk;

/// Depth of a perfectly balanced tree holding `count` nodes
constexpr uint8_t calculate_tree_depth_from_count(uint64_t const count) noexcept
{
    uint8_t depth = 0;
    for (uint64_t c = count; c != 0; c >>= 1) {
        ++depth;
    }
    return depth;
}

/// Largest height an AVL tree of `count` nodes can have: the largest h whose
/// minimal node count N(h) = N(h-1) + N(h-2) + 1 is at most `count`
constexpr uint8_t max_avl_height(uint64_t const count) noexcept
{
    uint8_t h = 0;
    uint64_t prev = 0; // N(h - 1)
    uint64_t cur = 0; // N(h)
    while (true) {
        uint64_t const next = cur + prev + 1;
        if (next > count || next < cur) {
            return h;
        }
        prev = cur;
        cur = next;
        ++h;
    }
}

/// Splits `tree_depth` into chunks of at most `max_depth`, as evenly as
/// possible with the deeper chunks first
std::vector<uint8_t> calculate_chunk_depths(uint8_t tree_depth, uint8_t max_depth);

/// As calculate_chunk_depths, but the first chunk is at least `min_depth`
/// deep so that a trunk does not reveal the exact size of small trees
std::vector<uint8_t> calculate_chunk_depths_with_minimum(
    uint8_t tree_depth, uint8_t max_depth, uint8_t min_depth);

struct ChunkOptions
{
    uint8_t max_depth{8};
    std::optional<uint8_t> min_depth{};
};

struct TrunkQueryResult
{
    // first chunk of the tree, deeper subtrees shown as hashes
    std::vector<Op> proof;
    std::vector<uint8_t> chunk_depths;
    uint8_t tree_depth{0};

    /// Keys of the trunk nodes that have a hashed child
    std::vector<byte_string> terminal_node_keys() const;

    /// The terminal under which `key` must lie, empty when the key is in the
    /// proof or provably absent
    std::optional<byte_string> trace_key_to_terminal(byte_string_view key) const;

    /// Every hashed subtree must sit right below the first chunk
    Result<void> verify_terminal_nodes_at_expected_depth() const;

    /// Executes the proof, requiring it to commit to `expected_root`
    Result<std::unique_ptr<ProofTree>> verify(bytes32_t const &expected_root) const;
};

struct BranchQueryResult
{
    std::vector<Op> proof;
    byte_string branch_root_key;
    uint8_t returned_depth{0};
    bytes32_t branch_root_hash{};

    std::vector<byte_string> terminal_node_keys() const;
    std::optional<byte_string> trace_key_to_terminal(byte_string_view key) const;

    /// Executes the proof, requiring it to commit to `branch_root_hash`
    Result<std::unique_ptr<ProofTree>> verify() const;
};

CostResult<TrunkQueryResult> trunk_query(Merk const &, ChunkOptions const & = {});

/// The subtree rooted at `key` down to `depth` levels
CostResult<BranchQueryResult>
branch_query(Merk const &, byte_string_view key, uint8_t depth);

GROVEDB_MERK_NAMESPACE_END
