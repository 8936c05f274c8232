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

#include <grovedb/mmr/merkle_proof.hpp>

#include <grovedb/mmr/helper.hpp>
#include <grovedb/mmr/mmr_error.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <deque>
#include <tuple>

GROVEDB_MMR_NAMESPACE_BEGIN

namespace
{
    class ProofCursor
    {
        std::vector<MmrNode> const &items_;
        size_t next_{0};

    public:
        explicit ProofCursor(std::vector<MmrNode> const &items)
            : items_{items}
        {
        }

        MmrNode const *next() noexcept
        {
            return next_ < items_.size() ? &items_[next_++] : nullptr;
        }
    };

    Result<MmrNode> calculate_peak_root(
        ProvenLeaves leaves, uint64_t const peak_pos, ProofCursor &cursor)
    {
        std::deque<std::tuple<uint64_t, MmrNode, uint8_t>> queue;
        for (auto &[pos, node] : leaves) {
            queue.emplace_back(pos, std::move(node), 0);
        }

        while (!queue.empty()) {
            auto [pos, item, height] = std::move(queue.front());
            queue.pop_front();
            if (pos == peak_pos) {
                if (queue.empty()) {
                    return item;
                }
                LOG_ERROR("mmr proof reached peak {} with nodes left", peak_pos);
                return MmrError::invalid_proof;
            }

            uint8_t const next_height = pos_height_in_tree(pos + 1);
            bool const sibling_queued = [&] {
                uint64_t const sib_pos = next_height > height
                                             ? pos - sibling_offset(height)
                                             : pos + sibling_offset(height);
                return !queue.empty() && std::get<0>(queue.front()) == sib_pos;
            }();

            MmrNode sibling = MmrNode::internal(NULL_HASH);
            if (sibling_queued) {
                sibling = std::move(std::get<1>(queue.front()));
                queue.pop_front();
            }
            else {
                MmrNode const *const from_proof = cursor.next();
                if (from_proof == nullptr) {
                    LOG_ERROR("mmr proof is missing a sibling of {}", pos);
                    return MmrError::invalid_proof;
                }
                sibling = *from_proof;
            }

            uint64_t parent_pos;
            MmrNode parent = MmrNode::internal(NULL_HASH);
            if (next_height > height) {
                // right child
                parent_pos = pos + 1;
                parent = MmrNode::merge(sibling, item);
            }
            else {
                parent_pos = pos + parent_offset(height);
                parent = MmrNode::merge(item, sibling);
            }

            if (parent_pos > peak_pos) {
                LOG_ERROR(
                    "mmr proof climbs past peak {} to {}", peak_pos, parent_pos);
                return MmrError::invalid_proof;
            }
            queue.emplace_back(
                parent_pos, std::move(parent), static_cast<uint8_t>(height + 1));
        }
        LOG_ERROR("mmr proof never reached peak {}", peak_pos);
        return MmrError::invalid_proof;
    }
}

std::optional<MmrNode> bag_peaks(std::vector<MmrNode> peaks)
{
    while (peaks.size() > 1) {
        MmrNode right = std::move(peaks.back());
        peaks.pop_back();
        MmrNode left = std::move(peaks.back());
        peaks.pop_back();
        peaks.push_back(MmrNode::merge(right, left));
    }
    if (peaks.empty()) {
        return std::nullopt;
    }
    return std::move(peaks.front());
}

Result<std::vector<MmrNode>> calculate_peaks_hashes(
    ProvenLeaves leaves, uint64_t const mmr_size,
    std::vector<MmrNode> const &proof_items)
{
    if (std::ranges::any_of(leaves, [](auto const &leaf) {
            return pos_height_in_tree(leaf.first) > 0;
        })) {
        return MmrError::node_proofs_not_supported;
    }

    std::vector<MmrNode> peaks_hashes;
    if (mmr_size == 1 && leaves.size() == 1 && leaves.front().first == 0) {
        peaks_hashes.push_back(std::move(leaves.front().second));
        return peaks_hashes;
    }

    // first occurrence of a position wins
    std::ranges::stable_sort(
        leaves, {}, [](auto const &leaf) { return leaf.first; });
    auto const dup = std::ranges::unique(
        leaves, {}, [](auto const &leaf) { return leaf.first; });
    leaves.erase(dup.begin(), dup.end());

    ProofCursor cursor{proof_items};
    auto const peaks = get_peaks(mmr_size);
    peaks_hashes.reserve(peaks.size() + 1);
    auto rest = leaves.begin();
    for (uint64_t const peak_pos : peaks) {
        auto const end = std::find_if(rest, leaves.end(), [&](auto const &l) {
            return l.first > peak_pos;
        });
        ProvenLeaves under_peak(
            std::make_move_iterator(rest), std::make_move_iterator(end));
        rest = end;

        if (under_peak.size() == 1 && under_peak.front().first == peak_pos) {
            peaks_hashes.push_back(std::move(under_peak.front().second));
        }
        else if (under_peak.empty()) {
            MmrNode const *const peak = cursor.next();
            if (peak == nullptr) {
                // bagged into the trailing item, or absent
                break;
            }
            peaks_hashes.push_back(*peak);
        }
        else {
            BOOST_OUTCOME_TRY(
                auto root,
                calculate_peak_root(std::move(under_peak), peak_pos, cursor));
            peaks_hashes.push_back(std::move(root));
        }
    }

    if (rest != leaves.end()) {
        LOG_ERROR("mmr proof leaves lie beyond the last peak");
        return MmrError::invalid_proof;
    }
    if (MmrNode const *const rhs = cursor.next(); rhs != nullptr) {
        peaks_hashes.push_back(*rhs);
    }
    if (cursor.next() != nullptr) {
        LOG_ERROR("mmr proof has excess items");
        return MmrError::invalid_proof;
    }
    return peaks_hashes;
}

Result<MmrNode> MerkleProof::calculate_root(ProvenLeaves leaves) const
{
    BOOST_OUTCOME_TRY(
        auto peaks,
        calculate_peaks_hashes(std::move(leaves), mmr_size_, proof_));
    auto root = bag_peaks(std::move(peaks));
    if (!root.has_value()) {
        LOG_ERROR("mmr proof yields no peaks");
        return MmrError::invalid_proof;
    }
    return std::move(*root);
}

Result<MmrNode> MerkleProof::calculate_root_with_new_leaf(
    ProvenLeaves leaves, uint64_t const new_pos, MmrNode new_elem,
    uint64_t const new_mmr_size) const
{
    if (new_pos >= new_mmr_size) {
        LOG_ERROR(
            "new position {} is outside a range of size {}",
            new_pos,
            new_mmr_size);
        return MmrError::invalid_input;
    }
    uint8_t const pos_height = pos_height_in_tree(new_pos);
    uint8_t const next_height = pos_height_in_tree(new_pos + 1);
    if (next_height > pos_height) {
        // the new leaf is a right child: it merges with the old peaks
        BOOST_OUTCOME_TRY(
            auto peaks_hashes,
            calculate_peaks_hashes(std::move(leaves), mmr_size_, proof_));
        auto const peaks_pos = get_peaks(new_mmr_size);
        auto const it = std::ranges::find_if(
            peaks_pos, [new_pos](uint64_t const p) { return p >= new_pos; });
        if (it == peaks_pos.end()) {
            LOG_ERROR("new position {} exceeds every peak", new_pos);
            return MmrError::invalid_input;
        }
        auto const i = static_cast<size_t>(it - peaks_pos.begin());
        if (i > peaks_hashes.size()) {
            LOG_ERROR(
                "peak index {} out of range for {} peaks",
                i,
                peaks_hashes.size());
            return MmrError::invalid_input;
        }
        std::reverse(
            peaks_hashes.begin() + static_cast<std::ptrdiff_t>(i),
            peaks_hashes.end());
        MerkleProof const rebased{new_mmr_size, std::move(peaks_hashes)};
        ProvenLeaves single;
        single.emplace_back(new_pos, std::move(new_elem));
        return rebased.calculate_root(std::move(single));
    }
    leaves.emplace_back(new_pos, std::move(new_elem));
    MerkleProof const grown{new_mmr_size, proof_};
    return grown.calculate_root(std::move(leaves));
}

Result<bool>
MerkleProof::verify(MmrNode const &root, ProvenLeaves leaves) const
{
    BOOST_OUTCOME_TRY(auto const calculated, calculate_root(std::move(leaves)));
    return calculated == root;
}

Result<bool> MerkleProof::verify_incremental(
    MmrNode const &root, MmrNode const &prev_root,
    std::vector<MmrNode> incremental) const
{
    uint64_t const current_leaves = get_peak_map(mmr_size_);
    if (current_leaves <= incremental.size()) {
        LOG_ERROR(
            "{} incremental leaves exceed the {} leaves of the range",
            incremental.size(),
            current_leaves);
        return MmrError::invalid_proof;
    }
    uint64_t const prev_leaves = current_leaves - incremental.size();
    auto const prev_peaks =
        get_peaks(leaf_index_to_mmr_size(prev_leaves - 1));
    if (prev_peaks.size() != proof_.size()) {
        LOG_ERROR(
            "incremental proof has {} items for {} previous peaks",
            proof_.size(),
            prev_peaks.size());
        return MmrError::invalid_proof;
    }
    auto const current_peaks = get_peaks(mmr_size_);

    size_t reverse_index = prev_peaks.size() - 1;
    for (size_t i = 0; i < std::min(prev_peaks.size(), current_peaks.size());
         ++i) {
        if (prev_peaks[i] < current_peaks[i]) {
            reverse_index = i;
            break;
        }
    }
    std::vector<MmrNode> peaks = proof_;
    std::reverse(
        peaks.begin() + static_cast<std::ptrdiff_t>(reverse_index),
        peaks.end());

    auto const calculated_prev = bag_peaks(std::move(peaks));
    if (!calculated_prev.has_value()) {
        LOG_ERROR("incremental proof has no peaks to bag");
        return MmrError::invalid_proof;
    }
    if (!(*calculated_prev == prev_root)) {
        return false;
    }

    ProvenLeaves leaves;
    leaves.reserve(incremental.size());
    for (size_t i = 0; i < incremental.size(); ++i) {
        leaves.emplace_back(
            leaf_index_to_pos(prev_leaves + i), std::move(incremental[i]));
    }
    return verify(root, std::move(leaves));
}

GROVEDB_MMR_NAMESPACE_END
