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
#include <grovedb/core/codec.hpp>

#include <bit>
#include <cstdint>
#include <limits>
#include <vector>

// Position arithmetic over the post-order node array of a merkle mountain
// range. Leaves sit at height 0; a peak of height h spans 2^(h+1) - 1 nodes.

GROVEDB_MMR_NAMESPACE_BEGIN

constexpr uint64_t leaf_index_to_mmr_size(uint64_t const index) noexcept
{
    uint64_t const leaves_count = index + 1;
    return 2 * leaves_count -
           static_cast<uint64_t>(std::popcount(leaves_count));
}

constexpr uint64_t leaf_index_to_pos(uint64_t const index) noexcept
{
    return leaf_index_to_mmr_size(index) -
           static_cast<uint64_t>(std::countr_zero(index + 1)) - 1;
}

constexpr uint8_t pos_height_in_tree(uint64_t pos) noexcept
{
    if (pos == 0) {
        return 0;
    }
    uint64_t peak_size =
        std::numeric_limits<uint64_t>::max() >> std::countl_zero(pos);
    while (peak_size > 0) {
        if (pos >= peak_size) {
            pos -= peak_size;
        }
        peak_size >>= 1;
    }
    return static_cast<uint8_t>(pos);
}

constexpr uint64_t parent_offset(uint8_t const height) noexcept
{
    return uint64_t{2} << height;
}

constexpr uint64_t sibling_offset(uint8_t const height) noexcept
{
    return (uint64_t{2} << height) - 1;
}

/// Bit i set iff the range has a peak of height i; equals the leaf count
constexpr uint64_t get_peak_map(uint64_t const mmr_size) noexcept
{
    if (mmr_size == 0) {
        return 0;
    }
    uint64_t pos = mmr_size;
    uint64_t peak_size =
        std::numeric_limits<uint64_t>::max() >> std::countl_zero(pos);
    uint64_t peak_map = 0;
    while (peak_size > 0) {
        peak_map <<= 1;
        if (pos >= peak_size) {
            pos -= peak_size;
            peak_map |= 1;
        }
        peak_size >>= 1;
    }
    return peak_map;
}

/// Peak positions, highest peak first
inline std::vector<uint64_t> get_peaks(uint64_t const mmr_size)
{
    std::vector<uint64_t> peaks;
    if (mmr_size == 0) {
        return peaks;
    }
    uint64_t pos = mmr_size;
    uint64_t peak_size =
        std::numeric_limits<uint64_t>::max() >> std::countl_zero(pos);
    uint64_t peaks_sum = 0;
    while (peak_size > 0) {
        if (pos >= peak_size) {
            pos -= peak_size;
            peaks.push_back(peaks_sum + peak_size - 1);
            peaks_sum += peak_size;
        }
        peak_size >>= 1;
    }
    return peaks;
}

constexpr uint64_t mmr_size_to_leaf_count(uint64_t const mmr_size) noexcept
{
    return get_peak_map(mmr_size);
}

/// Hashes performed by pushing the leaf after `leaf_count` leaves: the leaf
/// hash plus one merge per peak it absorbs
constexpr uint32_t hash_count_for_push(uint64_t const leaf_count) noexcept
{
    return 1 + static_cast<uint32_t>(std::countr_one(leaf_count));
}

inline byte_string mmr_node_key(uint64_t const pos)
{
    return to_be_bytes(pos);
}

GROVEDB_MMR_NAMESPACE_END
