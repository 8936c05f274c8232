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

#include <grovedb/dense_tree/position_ranges.hpp>

#include <grovedb/core/codec.hpp>
#include <grovedb/core/hex_literal.hpp>
#include <grovedb/dense_tree/dense_tree_error.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <iterator>
#include <limits>

GROVEDB_DENSE_TREE_NAMESPACE_BEGIN

namespace
{
    uint64_t saturating_inc(uint64_t const v) noexcept
    {
        return v == std::numeric_limits<uint64_t>::max() ? v : v + 1;
    }
}

Result<uint64_t> bytes_to_position(byte_string_view const key)
{
    if (key.empty() || key.size() > sizeof(uint64_t)) {
        LOG_ERROR(
            "position key {} must be 1 to 8 bytes", to_hex(key));
        return DenseTreeError::invalid_input;
    }
    uint64_t pos = 0;
    for (auto const b : key) {
        pos = (pos << 8) | b;
    }
    return pos;
}

Result<PositionRanges>
query_to_ranges(query::Query const &query, uint64_t const total_count)
{
    if (query.has_subquery()) {
        LOG_ERROR("position queries cannot carry subqueries");
        return DenseTreeError::invalid_input;
    }
    PositionRanges ranges;
    for (auto const &item : query.items) {
        auto const [lower, exclusive] = item.lower_bound();
        auto const [upper, inclusive] = item.upper_bound();
        uint64_t start = 0;
        if (lower.has_value()) {
            BOOST_OUTCOME_TRY(start, bytes_to_position(*lower));
            if (exclusive) {
                start = saturating_inc(start);
            }
        }
        uint64_t end = total_count;
        if (upper.has_value()) {
            BOOST_OUTCOME_TRY(end, bytes_to_position(*upper));
            if (inclusive) {
                end = saturating_inc(end);
            }
        }
        end = std::min(end, total_count);
        if (start < end) {
            ranges.emplace_back(start, end);
        }
    }
    std::ranges::sort(ranges);
    PositionRanges merged;
    for (auto const &r : ranges) {
        if (!merged.empty() && r.first <= merged.back().second) {
            merged.back().second = std::max(merged.back().second, r.second);
        }
        else {
            merged.push_back(r);
        }
    }
    return merged;
}

bool in_ranges(uint64_t const position, PositionRanges const &ranges)
{
    auto const it = std::ranges::upper_bound(
        ranges, position, {}, &std::pair<uint64_t, uint64_t>::first);
    if (it == ranges.begin()) {
        return false;
    }
    return position < std::prev(it)->second;
}

uint64_t ranges_size(PositionRanges const &ranges) noexcept
{
    uint64_t n = 0;
    for (auto const &[start, end] : ranges) {
        n += end - start;
    }
    return n;
}

GROVEDB_DENSE_TREE_NAMESPACE_END
