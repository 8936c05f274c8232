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

#include <grovedb/mmr/mmr.hpp>

#include <grovedb/mmr/helper.hpp>
#include <grovedb/mmr/mmr_error.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <deque>

GROVEDB_MMR_NAMESPACE_BEGIN

uint64_t Mmr::leaf_count() const noexcept
{
    return mmr_size_to_leaf_count(mmr_size_);
}

CostResult<std::optional<MmrNode>> Mmr::element_at_position(uint64_t const pos)
{
    for (auto it = batch_.rbegin(); it != batch_.rend(); ++it) {
        auto const &[start, elems] = *it;
        if (pos < start) {
            continue;
        }
        if (pos < start + elems.size()) {
            MmrNode const &elem = elems[pos - start];
            OperationCost cost = OperationCost::with_seek_count(1);
            cost.storage_loaded_bytes = elem.serialized_size();
            return {std::optional<MmrNode>{elem}, cost};
        }
        break;
    }
    return store_.element_at_position(pos);
}

CostResult<MmrNode> Mmr::find_element_at_position(
    uint64_t const pos, std::vector<MmrNode> const &pending)
{
    if (pos >= mmr_size_ && pos - mmr_size_ < pending.size()) {
        return {pending[pos - mmr_size_], OperationCost{}};
    }
    OperationCost cost;
    auto elem = GROVEDB_COST_TRY(cost, element_at_position(pos));
    if (!elem.has_value()) {
        LOG_ERROR("mmr node at position {} is missing", pos);
        return {MmrError::inconsistent_store, cost};
    }
    return {std::move(*elem), cost};
}

CostResult<uint64_t> Mmr::push(MmrNode elem)
{
    OperationCost cost;
    std::vector<MmrNode> elems;
    elems.push_back(std::move(elem));
    uint64_t const elem_pos = mmr_size_;
    uint64_t const peak_map = get_peak_map(mmr_size_);
    uint64_t pos = mmr_size_;
    uint64_t peak = 1;
    while ((peak_map & peak) != 0) {
        peak <<= 1;
        pos += 1;
        uint64_t const left_pos = pos - peak;
        auto const left =
            GROVEDB_COST_TRY(cost, find_element_at_position(left_pos, elems));
        MmrNode parent = MmrNode::merge(left, elems.back());
        elems.push_back(std::move(parent));
    }
    batch_.emplace_back(elem_pos, std::move(elems));
    mmr_size_ = pos + 1;
    return {elem_pos, cost};
}

CostResult<MmrNode> Mmr::get_root()
{
    OperationCost cost;
    if (mmr_size_ == 0) {
        return {MmrError::get_root_on_empty, cost};
    }
    std::vector<MmrNode> peaks;
    for (uint64_t const peak_pos : get_peaks(mmr_size_)) {
        auto elem = GROVEDB_COST_TRY(cost, element_at_position(peak_pos));
        if (!elem.has_value()) {
            LOG_ERROR("mmr peak at position {} is missing", peak_pos);
            return {MmrError::inconsistent_store, cost};
        }
        peaks.push_back(std::move(*elem));
    }
    auto root = bag_peaks(std::move(peaks));
    if (!root.has_value()) {
        return {MmrError::inconsistent_store, cost};
    }
    return {std::move(*root), cost};
}

Result<void> Mmr::gen_proof_for_peak(
    std::vector<MmrNode> &proof, std::vector<uint64_t> positions,
    uint64_t const peak_pos, OperationCost &cost)
{
    if (positions.size() == 1 && positions.front() == peak_pos) {
        return outcome::success();
    }
    auto fetch = [&](uint64_t const pos) -> Result<void> {
        BOOST_OUTCOME_TRY(
            auto elem, element_at_position(pos).unwrap_add_cost(cost));
        if (!elem.has_value()) {
            LOG_ERROR("mmr node at position {} is missing", pos);
            return MmrError::inconsistent_store;
        }
        proof.push_back(std::move(*elem));
        return outcome::success();
    };
    if (positions.empty()) {
        // the whole peak stands in for its subtree
        return fetch(peak_pos);
    }

    std::deque<std::pair<uint64_t, uint8_t>> queue;
    for (uint64_t const pos : positions) {
        queue.emplace_back(pos, 0);
    }
    while (!queue.empty()) {
        auto const [pos, height] = queue.front();
        queue.pop_front();
        if (pos == peak_pos) {
            if (queue.empty()) {
                break;
            }
            return MmrError::node_proofs_not_supported;
        }

        uint64_t sib_pos;
        uint64_t parent_pos;
        if (pos_height_in_tree(pos + 1) > height) {
            sib_pos = pos - sibling_offset(height);
            parent_pos = pos + 1;
        }
        else {
            sib_pos = pos + sibling_offset(height);
            parent_pos = pos + parent_offset(height);
        }

        if (!queue.empty() && queue.front().first == sib_pos) {
            queue.pop_front();
        }
        else {
            BOOST_OUTCOME_TRY(fetch(sib_pos));
        }
        if (parent_pos < peak_pos) {
            queue.emplace_back(parent_pos, static_cast<uint8_t>(height + 1));
        }
    }
    return outcome::success();
}

CostResult<MerkleProof> Mmr::gen_proof(std::vector<uint64_t> positions)
{
    OperationCost cost;
    if (positions.empty()) {
        return {MmrError::gen_proof_for_invalid_leaves, cost};
    }
    if (mmr_size_ == 1 && positions.size() == 1 && positions.front() == 0) {
        return {MerkleProof{mmr_size_, {}}, cost};
    }
    if (std::ranges::any_of(positions, [](uint64_t const pos) {
            return pos_height_in_tree(pos) > 0;
        })) {
        return {MmrError::node_proofs_not_supported, cost};
    }
    std::ranges::sort(positions);
    auto const dup = std::ranges::unique(positions);
    positions.erase(dup.begin(), dup.end());

    std::vector<MmrNode> proof;
    size_t bagging_track = 0;
    auto rest = positions.begin();
    for (uint64_t const peak_pos : get_peaks(mmr_size_)) {
        auto const end = std::find_if(
            rest, positions.end(), [&](uint64_t p) { return p > peak_pos; });
        std::vector<uint64_t> under_peak(rest, end);
        rest = end;
        bagging_track = under_peak.empty() ? bagging_track + 1 : 0;
        GROVEDB_COST_TRY_NO_ADD(
            cost,
            gen_proof_for_peak(proof, std::move(under_peak), peak_pos, cost));
    }
    if (rest != positions.end()) {
        return {MmrError::gen_proof_for_invalid_leaves, cost};
    }

    // peaks right of the last proven one are bagged into a single item
    if (bagging_track > 1) {
        auto const rhs_begin =
            proof.end() - static_cast<std::ptrdiff_t>(bagging_track);
        std::vector<MmrNode> rhs_peaks(
            std::make_move_iterator(rhs_begin),
            std::make_move_iterator(proof.end()));
        proof.erase(rhs_begin, proof.end());
        auto bagged = bag_peaks(std::move(rhs_peaks));
        if (!bagged.has_value()) {
            return {MmrError::inconsistent_store, cost};
        }
        proof.push_back(std::move(*bagged));
    }
    return {MerkleProof{mmr_size_, std::move(proof)}, cost};
}

CostResult<void> Mmr::commit()
{
    OperationCost cost;
    for (auto &[pos, elems] : batch_) {
        GROVEDB_COST_TRY(cost, store_.append(pos, std::move(elems)));
    }
    batch_.clear();
    return {outcome::success(), cost};
}

GROVEDB_MMR_NAMESPACE_END
