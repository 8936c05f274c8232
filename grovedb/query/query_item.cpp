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

#include <grovedb/query/query_item.hpp>

#include <grovedb/core/assert.h>
#include <grovedb/core/bincode.hpp>
#include <grovedb/core/codec.hpp>
#include <grovedb/core/error.hpp>
#include <grovedb/core/hex_literal.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <format>

GROVEDB_QUERY_NAMESPACE_BEGIN

namespace
{
    void append_key(byte_string &out, byte_string const &key)
    {
        bincode::append_varint(out, key.size());
        out += key;
    }

    Result<byte_string> consume_key(byte_string_view &enc)
    {
        BOOST_OUTCOME_TRY(auto const len, bincode::consume_varint(enc));
        if (len > enc.size()) {
            return Error::corrupted_data;
        }
        BOOST_OUTCOME_TRY(auto const key, consume_bytes(enc, len));
        return byte_string{key};
    }

    bool has_start(QueryItem::Kind const kind) noexcept
    {
        switch (kind) {
        case QueryItem::Kind::key:
        case QueryItem::Kind::range:
        case QueryItem::Kind::range_inclusive:
        case QueryItem::Kind::range_from:
        case QueryItem::Kind::range_after:
        case QueryItem::Kind::range_after_to:
        case QueryItem::Kind::range_after_to_inclusive:
            return true;
        default:
            return false;
        }
    }

    bool has_end(QueryItem::Kind const kind) noexcept
    {
        switch (kind) {
        case QueryItem::Kind::range:
        case QueryItem::Kind::range_inclusive:
        case QueryItem::Kind::range_to:
        case QueryItem::Kind::range_to_inclusive:
        case QueryItem::Kind::range_after_to:
        case QueryItem::Kind::range_after_to_inclusive:
            return true;
        default:
            return false;
        }
    }
}

RangeSetItem RangeSetItem::invert(bool const is_start) const
{
    switch (kind) {
    case Kind::inclusive:
        return is_start ? exclusive_start(key) : exclusive_end(key);
    case Kind::exclusive_start:
    case Kind::exclusive_end:
        return inclusive(key);
    case Kind::unbounded_start:
    case Kind::unbounded_end:
        return *this;
    }
    GROVEDB_ABORT("unreachable range set item");
}

std::strong_ordering RangeSetItem::operator<=>(RangeSetItem const &other) const
{
    if (is_unbounded() || other.is_unbounded()) {
        return kind <=> other.kind;
    }
    int const c = key.compare(other.key);
    if (c != 0) {
        return c < 0 ? std::strong_ordering::less
                     : std::strong_ordering::greater;
    }
    return kind <=> other.kind;
}

QueryItem RangeSet::to_query_item() const
{
    using K = RangeSetItem::Kind;
    switch (start.kind) {
    case K::inclusive:
        switch (end.kind) {
        case K::inclusive:
            if (start.key == end.key) {
                return QueryItem::key(start.key);
            }
            return QueryItem::range_inclusive(start.key, end.key);
        case K::exclusive_end:
            return QueryItem::range(start.key, end.key);
        case K::unbounded_end:
            return QueryItem::range_from(start.key);
        default:
            break;
        }
        break;
    case K::exclusive_start:
        switch (end.kind) {
        case K::inclusive:
            return QueryItem::range_after_to_inclusive(start.key, end.key);
        case K::exclusive_end:
            return QueryItem::range_after_to(start.key, end.key);
        case K::unbounded_end:
            return QueryItem::range_after(start.key);
        default:
            break;
        }
        break;
    case K::unbounded_start:
        switch (end.kind) {
        case K::inclusive:
            return QueryItem::range_to_inclusive(end.key);
        case K::exclusive_end:
            return QueryItem::range_to(end.key);
        case K::unbounded_end:
            return QueryItem::range_full();
        default:
            break;
        }
        break;
    default:
        break;
    }
    GROVEDB_ABORT("range set endpoints out of place");
}

RangeSetIntersection RangeSet::intersect(RangeSet const &other) const
{
    if (end < other.start) {
        return {.ours_left = *this, .theirs_right = other};
    }
    if (other.end < start) {
        return {.ours_right = *this, .theirs_left = other};
    }

    bool const ours_starts_first = start < other.start;
    RangeSetItem const &smaller_start = ours_starts_first ? start : other.start;
    RangeSetItem const &bigger_start = ours_starts_first ? other.start : start;
    bool const ours_ends_first = end < other.end;
    RangeSetItem const &smaller_end = ours_ends_first ? end : other.end;
    RangeSetItem const &larger_end = ours_ends_first ? other.end : end;

    RangeSetIntersection result{
        .in_both = RangeSet{.start = bigger_start, .end = smaller_end}};
    if (start != other.start) {
        RangeSet left{.start = smaller_start, .end = bigger_start.invert(false)};
        if (ours_starts_first) {
            result.ours_left = std::move(left);
        }
        else {
            result.theirs_left = std::move(left);
        }
    }
    if (end != other.end) {
        RangeSet right{.start = smaller_end.invert(true), .end = larger_end};
        if (ours_ends_first) {
            result.theirs_right = std::move(right);
        }
        else {
            result.ours_right = std::move(right);
        }
    }
    return result;
}

QueryItem::QueryItem(Kind const kind, byte_string start, byte_string end)
    : kind_{kind}
    , start_{std::move(start)}
    , end_{std::move(end)}
{
}

QueryItem QueryItem::key(byte_string k)
{
    return {Kind::key, std::move(k), {}};
}

QueryItem QueryItem::range(byte_string start, byte_string end)
{
    return {Kind::range, std::move(start), std::move(end)};
}

QueryItem QueryItem::range_inclusive(byte_string start, byte_string end)
{
    return {Kind::range_inclusive, std::move(start), std::move(end)};
}

QueryItem QueryItem::range_full()
{
    return {Kind::range_full, {}, {}};
}

QueryItem QueryItem::range_from(byte_string start)
{
    return {Kind::range_from, std::move(start), {}};
}

QueryItem QueryItem::range_to(byte_string end)
{
    return {Kind::range_to, {}, std::move(end)};
}

QueryItem QueryItem::range_to_inclusive(byte_string end)
{
    return {Kind::range_to_inclusive, {}, std::move(end)};
}

QueryItem QueryItem::range_after(byte_string start)
{
    return {Kind::range_after, std::move(start), {}};
}

QueryItem QueryItem::range_after_to(byte_string start, byte_string end)
{
    return {Kind::range_after_to, std::move(start), std::move(end)};
}

QueryItem
QueryItem::range_after_to_inclusive(byte_string start, byte_string end)
{
    return {Kind::range_after_to_inclusive, std::move(start), std::move(end)};
}

std::pair<std::optional<byte_string_view>, bool> QueryItem::lower_bound() const
{
    if (!has_start(kind_)) {
        return {std::nullopt, false};
    }
    bool const non_inclusive = kind_ == Kind::range_after ||
                               kind_ == Kind::range_after_to ||
                               kind_ == Kind::range_after_to_inclusive;
    return {byte_string_view{start_}, non_inclusive};
}

std::pair<std::optional<byte_string_view>, bool> QueryItem::upper_bound() const
{
    if (kind_ == Kind::key) {
        return {byte_string_view{start_}, true};
    }
    if (!has_end(kind_)) {
        return {std::nullopt, true};
    }
    bool const inclusive = kind_ == Kind::range_inclusive ||
                           kind_ == Kind::range_to_inclusive ||
                           kind_ == Kind::range_after_to_inclusive;
    return {byte_string_view{end_}, inclusive};
}

bool QueryItem::lower_unbounded() const noexcept
{
    return !has_start(kind_);
}

bool QueryItem::upper_unbounded() const noexcept
{
    return kind_ != Kind::key && !has_end(kind_);
}

bool QueryItem::contains(byte_string_view const key) const
{
    auto const [lower, non_inclusive] = lower_bound();
    auto const [upper, inclusive] = upper_bound();
    bool const above_lower =
        !lower.has_value() || (non_inclusive ? key > *lower : key >= *lower);
    bool const below_upper =
        !upper.has_value() || (inclusive ? key <= *upper : key < *upper);
    return above_lower && below_upper;
}

Result<std::vector<byte_string>> QueryItem::keys() const
{
    if (kind_ == Kind::key) {
        return std::vector<byte_string>{start_};
    }
    if (kind_ != Kind::range && kind_ != Kind::range_inclusive) {
        LOG_ERROR("distinct keys are not available for unbounded ranges");
        return Error::invalid_input;
    }
    if (start_.size() > 1 || end_.size() != 1) {
        LOG_ERROR(
            "distinct keys are not available for ranges over keys other "
            "than one byte");
        return Error::invalid_input;
    }
    std::vector<byte_string> keys;
    unsigned first = 0;
    if (start_.empty()) {
        keys.emplace_back();
    }
    else {
        first = start_[0];
    }
    unsigned const last = kind_ == Kind::range_inclusive
                              ? static_cast<unsigned>(end_[0]) + 1
                              : end_[0];
    for (unsigned i = first; i < last; ++i) {
        keys.emplace_back(1, static_cast<unsigned char>(i));
    }
    return keys;
}

RangeSet QueryItem::to_range_set() const
{
    RangeSetItem start = RangeSetItem::unbounded_start();
    if (kind_ == Kind::key) {
        return {
            .start = RangeSetItem::inclusive(start_),
            .end = RangeSetItem::inclusive(start_)};
    }
    if (has_start(kind_)) {
        start = lower_bound().second ? RangeSetItem::exclusive_start(start_)
                                     : RangeSetItem::inclusive(start_);
    }
    RangeSetItem end = RangeSetItem::unbounded_end();
    if (has_end(kind_)) {
        end = upper_bound().second ? RangeSetItem::inclusive(end_)
                                   : RangeSetItem::exclusive_end(end_);
    }
    return {.start = std::move(start), .end = std::move(end)};
}

bool QueryItem::collides_with(QueryItem const &other) const
{
    RangeSet const ours = to_range_set();
    RangeSet const theirs = other.to_range_set();
    if (ours.end < theirs.start) {
        return ours.end.invert(true) == theirs.start;
    }
    if (theirs.end < ours.start) {
        return theirs.end.invert(true) == ours.start;
    }
    return true;
}

QueryItem QueryItem::merge(QueryItem const &other) const
{
    RangeSet const ours = to_range_set();
    RangeSet const theirs = other.to_range_set();
    return RangeSet{
        .start = std::min(ours.start, theirs.start),
        .end = std::max(ours.end, theirs.end)}
        .to_query_item();
}

QueryItemIntersectionResult QueryItem::intersect(QueryItem const &other) const
{
    auto const r = to_range_set().intersect(other.to_range_set());
    auto const item = [](std::optional<RangeSet> const &s) {
        return s.has_value() ? std::optional{s->to_query_item()}
                             : std::nullopt;
    };
    return {
        .in_both = item(r.in_both),
        .ours_left = item(r.ours_left),
        .ours_right = item(r.ours_right),
        .theirs_left = item(r.theirs_left),
        .theirs_right = item(r.theirs_right)};
}

void QueryItem::encode(byte_string &out) const
{
    out.push_back(static_cast<unsigned char>(kind_));
    if (has_start(kind_)) {
        append_key(out, start_);
    }
    if (has_end(kind_)) {
        append_key(out, end_);
    }
}

Result<QueryItem> QueryItem::decode(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const tag, consume_byte(enc));
    if (tag >= KIND_COUNT) {
        LOG_ERROR("unknown query item tag {}", tag);
        return Error::corrupted_data;
    }
    auto const kind = static_cast<Kind>(tag);
    byte_string start;
    byte_string end;
    if (has_start(kind)) {
        BOOST_OUTCOME_TRY(auto s, consume_key(enc));
        start = std::move(s);
    }
    if (has_end(kind)) {
        BOOST_OUTCOME_TRY(auto e, consume_key(enc));
        end = std::move(e);
    }
    return QueryItem{kind, std::move(start), std::move(end)};
}

std::string QueryItem::to_string() const
{
    switch (kind_) {
    case Kind::key:
        return std::format("Key({})", to_hex(start_));
    case Kind::range:
        return std::format("Range({}..{})", to_hex(start_), to_hex(end_));
    case Kind::range_inclusive:
        return std::format(
            "RangeInclusive({}..={})", to_hex(start_), to_hex(end_));
    case Kind::range_full:
        return "RangeFull";
    case Kind::range_from:
        return std::format("RangeFrom({}..)", to_hex(start_));
    case Kind::range_to:
        return std::format("RangeTo(..{})", to_hex(end_));
    case Kind::range_to_inclusive:
        return std::format("RangeToInclusive(..={})", to_hex(end_));
    case Kind::range_after:
        return std::format("RangeAfter({}<..)", to_hex(start_));
    case Kind::range_after_to:
        return std::format("RangeAfterTo({}<..{})", to_hex(start_), to_hex(end_));
    case Kind::range_after_to_inclusive:
        return std::format(
            "RangeAfterToInclusive({}<..={})", to_hex(start_), to_hex(end_));
    }
    return {};
}

std::strong_ordering QueryItem::operator<=>(QueryItem const &other) const
{
    RangeSet const ours = to_range_set();
    RangeSet const theirs = other.to_range_set();
    if (auto const c = ours.start <=> theirs.start; c != 0) {
        return c;
    }
    return ours.end <=> theirs.end;
}

GROVEDB_QUERY_NAMESPACE_END
