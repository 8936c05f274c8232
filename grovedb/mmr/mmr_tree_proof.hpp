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
#include <grovedb/mmr/node.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <utility>
#include <vector>

GROVEDB_MMR_NAMESPACE_BEGIN

/// (leaf index, value) pairs
using VerifiedLeaves = std::vector<std::pair<uint64_t, byte_string>>;

/// Fetches the node at a position; absent nodes are std::nullopt
using GetNodeFn =
    std::function<Result<std::optional<MmrNode>>(uint64_t pos)>;

inline constexpr size_t MAX_PROOF_DECODE_SIZE = 100 * 1024 * 1024;

/// Self contained proof of selected leaves of an MMR tree element: the
/// leaf values plus the sibling and peak hashes needed to rebuild the root
class MmrTreeProof
{
    uint64_t mmr_size_{0};
    VerifiedLeaves leaves_;
    std::vector<bytes32_t> proof_items_;

public:
    MmrTreeProof() = default;

    MmrTreeProof(
        uint64_t const mmr_size, VerifiedLeaves leaves,
        std::vector<bytes32_t> proof_items)
        : mmr_size_{mmr_size}
        , leaves_{std::move(leaves)}
        , proof_items_{std::move(proof_items)}
    {
    }

    uint64_t mmr_size() const noexcept
    {
        return mmr_size_;
    }

    VerifiedLeaves const &leaves() const noexcept
    {
        return leaves_;
    }

    std::vector<bytes32_t> const &proof_items() const noexcept
    {
        return proof_items_;
    }

    /// Proves `leaf_indices` (non empty, distinct, in range). Nodes are read
    /// lazily through `get_node`; a failure it reports is returned in
    /// preference to whatever the proof builder made of the missing node.
    static Result<MmrTreeProof> generate(
        uint64_t mmr_size, std::span<uint64_t const> leaf_indices,
        GetNodeFn const &get_node);

    /// Checks the proof against `expected_root` and returns the proven
    /// leaves, keeping only the first entry for any repeated index
    Result<VerifiedLeaves> verify(bytes32_t const &expected_root) const;

    /// As verify, returning the root the proof commits to instead
    Result<std::pair<bytes32_t, VerifiedLeaves>> verify_and_get_root() const;

    byte_string encode() const;
    static Result<MmrTreeProof> decode(byte_string_view);
};

GROVEDB_MMR_NAMESPACE_END
