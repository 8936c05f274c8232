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
#include <grovedb/core/result.hpp>
#include <grovedb/query/query.hpp>

#include <cstdint>
#include <utility>
#include <vector>

GROVEDB_DENSE_TREE_NAMESPACE_BEGIN

/// Half open [start, end) ranges of positions, sorted and disjoint
using PositionRanges = std::vector<std::pair<uint64_t, uint64_t>>;

/// Big endian position of a 1 to 8 byte query key
Result<uint64_t> bytes_to_position(byte_string_view);

/// Resolves the items of `query` against positions [0, total_count).
/// Queries with subqueries are rejected; out of range positions are dropped.
Result<PositionRanges>
query_to_ranges(query::Query const &, uint64_t total_count);

bool in_ranges(uint64_t position, PositionRanges const &);

/// Number of positions the ranges cover
uint64_t ranges_size(PositionRanges const &) noexcept;

GROVEDB_DENSE_TREE_NAMESPACE_END
