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

#include <grovedb/query/config.hpp>

#include <grovedb/core/byte_string.hpp>
#include <grovedb/core/result.hpp>

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

GROVEDB_QUERY_NAMESPACE_BEGIN

class QueryItem;

/* One endpoint of a range, totally ordered:
 * unbounded_start < every bounded endpoint < unbounded_end, and for equal
 * keys exclusive_end < inclusive < exclusive_start.
 */
struct RangeSetItem
{
    enum class Kind : uint8_t
    {
        unbounded_start,
        exclusive_end,
        inclusive,
        exclusive_start,
        unbounded_end,
    };

    Kind kind{Kind::unbounded_start};
    byte_string key{};

    static RangeSetItem unbounded_start()
    {
        return {.kind = Kind::unbounded_start};
    }

    static RangeSetItem unbounded_end()
    {
        return {.kind = Kind::unbounded_end};
    }

    static RangeSetItem inclusive(byte_string k)
    {
        return {.kind = Kind::inclusive, .key = std::move(k)};
    }

    static RangeSetItem exclusive_start(byte_string k)
    {
        return {.kind = Kind::exclusive_start, .key = std::move(k)};
    }

    static RangeSetItem exclusive_end(byte_string k)
    {
        return {.kind = Kind::exclusive_end, .key = std::move(k)};
    }

    bool is_unbounded() const noexcept
    {
        return kind == Kind::unbounded_start || kind == Kind::unbounded_end;
    }

    /// The endpoint on the other side of this one: an inclusive endpoint
    /// becomes exclusive and vice versa
    RangeSetItem invert(bool is_start) const;

    bool operator==(RangeSetItem const &) const = default;
    std::strong_ordering operator<=>(RangeSetItem const &) const;
};

struct RangeSetIntersection;

struct RangeSet
{
    RangeSetItem start;
    RangeSetItem end;

    QueryItem to_query_item() const;

    RangeSetIntersection intersect(RangeSet const &other) const;
};

struct RangeSetIntersection
{
    std::optional<RangeSet> in_both;
    std::optional<RangeSet> ours_left;
    std::optional<RangeSet> ours_right;
    std::optional<RangeSet> theirs_left;
    std::optional<RangeSet> theirs_right;
};

struct QueryItemIntersectionResult;

class QueryItem
{
public:
    enum class Kind : uint8_t
    {
        key = 0,
        range = 1,
        range_inclusive = 2,
        range_full = 3,
        range_from = 4,
        range_to = 5,
        range_to_inclusive = 6,
        range_after = 7,
        range_after_to = 8,
        range_after_to_inclusive = 9,
    };

    static constexpr uint8_t KIND_COUNT = 10;

private:
    Kind kind_;
    // the key itself for Kind::key
    byte_string start_;
    byte_string end_;

    QueryItem(Kind, byte_string start, byte_string end);

public:
    static QueryItem key(byte_string k);
    static QueryItem range(byte_string start, byte_string end);
    static QueryItem range_inclusive(byte_string start, byte_string end);
    static QueryItem range_full();
    static QueryItem range_from(byte_string start);
    static QueryItem range_to(byte_string end);
    static QueryItem range_to_inclusive(byte_string end);
    static QueryItem range_after(byte_string start);
    static QueryItem range_after_to(byte_string start, byte_string end);
    static QueryItem
    range_after_to_inclusive(byte_string start, byte_string end);

    Kind kind() const noexcept
    {
        return kind_;
    }

    /// Lower bound and whether it is excluded; no bound when unbounded
    std::pair<std::optional<byte_string_view>, bool> lower_bound() const;

    /// Upper bound and whether it is included; no bound when unbounded
    std::pair<std::optional<byte_string_view>, bool> upper_bound() const;

    bool lower_unbounded() const noexcept;
    bool upper_unbounded() const noexcept;

    bool is_key() const noexcept
    {
        return kind_ == Kind::key;
    }

    bool is_range() const noexcept
    {
        return kind_ != Kind::key;
    }

    // anything that cannot be enumerated byte by byte
    bool is_unbounded_range() const noexcept
    {
        return kind_ != Kind::key && kind_ != Kind::range &&
               kind_ != Kind::range_inclusive;
    }

    bool contains(byte_string_view key) const;

    /// Distinct keys of a key or a range over single byte keys
    Result<std::vector<byte_string>> keys() const;

    /// True when the union of both items is one contiguous range
    bool collides_with(QueryItem const &other) const;

    /// Smallest item covering both; meaningful for colliding items
    QueryItem merge(QueryItem const &other) const;

    RangeSet to_range_set() const;

    QueryItemIntersectionResult intersect(QueryItem const &other) const;

    void encode(byte_string &out) const;
    static Result<QueryItem> decode(byte_string_view &enc);

    std::string to_string() const;

    bool operator==(QueryItem const &) const = default;

    // orders by lower endpoint, then by upper endpoint
    std::strong_ordering operator<=>(QueryItem const &other) const;
};

struct QueryItemIntersectionResult
{
    std::optional<QueryItem> in_both;
    std::optional<QueryItem> ours_left;
    std::optional<QueryItem> ours_right;
    std::optional<QueryItem> theirs_left;
    std::optional<QueryItem> theirs_right;
};

GROVEDB_QUERY_NAMESPACE_END
