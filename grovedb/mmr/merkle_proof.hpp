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

#include <grovedb/core/result.hpp>
#include <grovedb/mmr/node.hpp>

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

GROVEDB_MMR_NAMESPACE_BEGIN

/// (position, node) pairs being proven
using ProvenLeaves = std::vector<std::pair<uint64_t, MmrNode>>;

/// Folds peaks right to left into a single root. Empty input has no root.
std::optional<MmrNode> bag_peaks(std::vector<MmrNode> peaks);

/// Membership proof for leaves of a range of size `mmr_size`. The items are
/// the siblings needed per peak, in peak order, then the bagged peaks to
/// the right of the last proven one.
class MerkleProof
{
    uint64_t mmr_size_;
    std::vector<MmrNode> proof_;

public:
    MerkleProof(uint64_t mmr_size, std::vector<MmrNode> proof)
        : mmr_size_{mmr_size}
        , proof_{std::move(proof)}
    {
    }

    uint64_t mmr_size() const noexcept
    {
        return mmr_size_;
    }

    std::vector<MmrNode> const &proof_items() const noexcept
    {
        return proof_;
    }

    Result<MmrNode> calculate_root(ProvenLeaves leaves) const;

    /// Root of the range after appending `new_elem` at `new_pos`, computed
    /// from this proof of the range before the append
    Result<MmrNode> calculate_root_with_new_leaf(
        ProvenLeaves leaves, uint64_t new_pos, MmrNode new_elem,
        uint64_t new_mmr_size) const;

    Result<bool> verify(MmrNode const &root, ProvenLeaves leaves) const;

    /// Checks that this range extends `prev_root` by exactly `incremental`;
    /// the proof items must be the peaks of the previous range
    Result<bool> verify_incremental(
        MmrNode const &root, MmrNode const &prev_root,
        std::vector<MmrNode> incremental) const;
};

Result<std::vector<MmrNode>> calculate_peaks_hashes(
    ProvenLeaves leaves, uint64_t mmr_size,
    std::vector<MmrNode> const &proof_items);

GROVEDB_MMR_NAMESPACE_END
