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

#include <grovedb/costs/cost_context.hpp>
#include <grovedb/mmr/merkle_proof.hpp>
#include <grovedb/mmr/node.hpp>
#include <grovedb/mmr/store.hpp>

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

GROVEDB_MMR_NAMESPACE_BEGIN

/// Merkle mountain range of `mmr_size` nodes over `store`. Pushed nodes are
/// buffered until commit and are visible to reads before that.
class Mmr
{
    uint64_t mmr_size_;
    MmrStore &store_;
    std::vector<std::pair<uint64_t, std::vector<MmrNode>>> batch_;

    CostResult<MmrNode>
    find_element_at_position(uint64_t pos, std::vector<MmrNode> const &);

    Result<void> gen_proof_for_peak(
        std::vector<MmrNode> &proof, std::vector<uint64_t> positions,
        uint64_t peak_pos, OperationCost &);

public:
    Mmr(uint64_t const mmr_size, MmrStore &store)
        : mmr_size_{mmr_size}
        , store_{store}
    {
    }

    uint64_t mmr_size() const noexcept
    {
        return mmr_size_;
    }

    bool is_empty() const noexcept
    {
        return mmr_size_ == 0;
    }

    uint64_t leaf_count() const noexcept;

    CostResult<std::optional<MmrNode>> element_at_position(uint64_t pos);

    /// Appends a leaf, merging completed peaks; returns its position
    CostResult<uint64_t> push(MmrNode elem);

    CostResult<MmrNode> get_root();

    /// Proof for the leaves at `positions`
    CostResult<MerkleProof> gen_proof(std::vector<uint64_t> positions);

    CostResult<void> commit();
};

GROVEDB_MMR_NAMESPACE_END
