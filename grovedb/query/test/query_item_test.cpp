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

#include <grovedb/core/byte_string.hpp>
#include <grovedb/core/error.hpp>
#include <grovedb/core/hex_literal.hpp>
#include <grovedb/query/query_item.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <random>
#include <vector>

using namespace grovedb;
using namespace grovedb::literals;
using namespace grovedb::query;

namespace
{
    byte_string b(unsigned char const c)
    {
        return byte_string(1, c);
    }

    QueryItem random_item(std::mt19937_64 &rng)
    {
        std::uniform_int_distribution<unsigned> bound(0, 9);
        unsigned char lo = static_cast<unsigned char>(bound(rng));
        unsigned char hi = static_cast<unsigned char>(bound(rng));
        if (lo > hi) {
            std::swap(lo, hi);
        }
        switch (rng() % QueryItem::KIND_COUNT) {
        case 0:
            return QueryItem::key(b(lo));
        case 1:
            return QueryItem::range(b(lo), b(static_cast<unsigned char>(hi + 1)));
        case 2:
            return QueryItem::range_inclusive(b(lo), b(hi));
        case 3:
            return QueryItem::range_full();
        case 4:
            return QueryItem::range_from(b(lo));
        case 5:
            return QueryItem::range_to(b(hi));
        case 6:
            return QueryItem::range_to_inclusive(b(hi));
        case 7:
            return QueryItem::range_after(b(lo));
        case 8:
            return QueryItem::range_after_to(
                b(lo), b(static_cast<unsigned char>(hi + 2)));
        default:
            return QueryItem::range_after_to_inclusive(
                b(lo), b(static_cast<unsigned char>(hi + 1)));
        }
    }

    bool contains(std::optional<QueryItem> const &item, byte_string const &key)
    {
        return item.has_value() && item->contains(key);
    }

    std::vector<byte_string> sample_keys()
    {
        std::vector<byte_string> keys{byte_string{}};
        for (unsigned char c = 0; c < 13; ++c) {
            keys.push_back(b(c));
            keys.push_back(byte_string{c, 0});
            keys.push_back(byte_string{c, 0xff});
        }
        return keys;
    }
}

TEST(QueryItemTest, bounds)
{
    auto const item = QueryItem::range_after_to_inclusive(b(2), b(5));
    auto const [lower, non_inclusive] = item.lower_bound();
    auto const [upper, inclusive] = item.upper_bound();
    ASSERT_TRUE(lower.has_value());
    EXPECT_EQ(*lower, b(2));
    EXPECT_TRUE(non_inclusive);
    ASSERT_TRUE(upper.has_value());
    EXPECT_EQ(*upper, b(5));
    EXPECT_TRUE(inclusive);

    EXPECT_TRUE(QueryItem::range_to(b(1)).lower_unbounded());
    EXPECT_FALSE(QueryItem::range_to(b(1)).upper_unbounded());
    EXPECT_TRUE(QueryItem::range_full().upper_unbounded());
    EXPECT_FALSE(QueryItem::key(b(1)).upper_unbounded());
}

TEST(QueryItemTest, contains)
{
    auto const item = QueryItem::range(b(2), b(5));
    EXPECT_FALSE(item.contains(b(1)));
    EXPECT_TRUE(item.contains(b(2)));
    EXPECT_TRUE(item.contains(byte_string{4, 9}));
    EXPECT_FALSE(item.contains(b(5)));

    auto const after = QueryItem::range_after(b(2));
    EXPECT_FALSE(after.contains(b(2)));
    EXPECT_TRUE(after.contains(byte_string{2, 0}));

    EXPECT_TRUE(QueryItem::range_full().contains(byte_string{}));
    EXPECT_TRUE(QueryItem::key(b(7)).contains(b(7)));
    EXPECT_FALSE(QueryItem::key(b(7)).contains(byte_string{7, 0}));
}

TEST(QueryItemTest, keys_of_single_byte_ranges)
{
    auto const keys = QueryItem::range(b(1), b(4)).keys();
    ASSERT_FALSE(keys.has_error());
    EXPECT_EQ(keys.value(), (std::vector<byte_string>{b(1), b(2), b(3)}));

    auto const inclusive = QueryItem::range_inclusive(b(1), b(3)).keys();
    ASSERT_FALSE(inclusive.has_error());
    EXPECT_EQ(inclusive.value().size(), 3u);

    auto const from_empty = QueryItem::range(byte_string{}, b(2)).keys();
    ASSERT_FALSE(from_empty.has_error());
    EXPECT_EQ(
        from_empty.value(), (std::vector<byte_string>{byte_string{}, b(0), b(1)}));

    auto const top = QueryItem::range_inclusive(b(254), b(255)).keys();
    ASSERT_FALSE(top.has_error());
    EXPECT_EQ(top.value(), (std::vector<byte_string>{b(254), b(255)}));

    auto const wide = QueryItem::range(b(1), byte_string{4, 0}).keys();
    ASSERT_TRUE(wide.has_error());
    EXPECT_EQ(wide.error(), Error::invalid_input);

    EXPECT_TRUE(QueryItem::range_from(b(1)).keys().has_error());
}

TEST(QueryItemTest, range_set_item_order)
{
    auto const incl = RangeSetItem::inclusive(b(5));
    auto const ex_start = RangeSetItem::exclusive_start(b(5));
    auto const ex_end = RangeSetItem::exclusive_end(b(5));
    EXPECT_LT(ex_end, incl);
    EXPECT_LT(incl, ex_start);
    EXPECT_LT(ex_end, ex_start);
    EXPECT_LT(RangeSetItem::unbounded_start(), ex_end);
    EXPECT_LT(ex_start, RangeSetItem::unbounded_end());
    EXPECT_LT(RangeSetItem::exclusive_start(b(4)), ex_end);
    EXPECT_LT(incl, RangeSetItem::exclusive_end(b(6)));
}

TEST(QueryItemTest, intersect_overlapping)
{
    auto const ours = QueryItem::range_inclusive(b(1), b(5));
    auto const theirs = QueryItem::range_inclusive(b(3), b(7));
    auto const r = ours.intersect(theirs);
    EXPECT_EQ(r.in_both, QueryItem::range_inclusive(b(3), b(5)));
    EXPECT_EQ(r.ours_left, QueryItem::range(b(1), b(3)));
    EXPECT_FALSE(r.ours_right.has_value());
    EXPECT_FALSE(r.theirs_left.has_value());
    EXPECT_EQ(r.theirs_right, QueryItem::range_after_to_inclusive(b(5), b(7)));
}

TEST(QueryItemTest, intersect_disjoint)
{
    auto const ours = QueryItem::range(b(1), b(3));
    auto const theirs = QueryItem::range_from(b(3));
    auto const r = ours.intersect(theirs);
    EXPECT_FALSE(r.in_both.has_value());
    EXPECT_EQ(r.ours_left, ours);
    EXPECT_EQ(r.theirs_right, theirs);
}

TEST(QueryItemTest, intersect_single_key_piece)
{
    auto const r = QueryItem::range_after(b(3)).intersect(
        QueryItem::range_from(b(3)));
    EXPECT_EQ(r.in_both, QueryItem::range_after(b(3)));
    EXPECT_EQ(r.theirs_left, QueryItem::key(b(3)));
    EXPECT_FALSE(r.ours_left.has_value());
    EXPECT_FALSE(r.ours_right.has_value());
    EXPECT_FALSE(r.theirs_right.has_value());
}

TEST(QueryItemTest, intersection_partitions_union)
{
    std::mt19937_64 rng{0x5eed};
    auto const keys = sample_keys();
    for (int round = 0; round < 2000; ++round) {
        auto const x = random_item(rng);
        auto const y = random_item(rng);
        auto const r = x.intersect(y);
        for (auto const &key : keys) {
            bool const in_x = x.contains(key);
            bool const in_y = y.contains(key);
            bool const ours = contains(r.ours_left, key) ||
                              contains(r.ours_right, key);
            bool const theirs = contains(r.theirs_left, key) ||
                                contains(r.theirs_right, key);
            ASSERT_EQ(contains(r.in_both, key), in_x && in_y)
                << x.to_string() << " & " << y.to_string() << " at "
                << to_hex(key);
            ASSERT_EQ(ours, in_x && !in_y)
                << x.to_string() << " & " << y.to_string() << " at "
                << to_hex(key);
            ASSERT_EQ(theirs, in_y && !in_x)
                << x.to_string() << " & " << y.to_string() << " at "
                << to_hex(key);
            // pieces never overlap
            ASSERT_FALSE(contains(r.ours_left, key) && contains(r.ours_right, key));
            ASSERT_FALSE(
                contains(r.theirs_left, key) && contains(r.theirs_right, key));
        }
    }
}

TEST(QueryItemTest, collide_and_merge)
{
    auto const range = QueryItem::range(b(1), b(3));
    EXPECT_TRUE(range.collides_with(QueryItem::key(b(3))));
    EXPECT_TRUE(range.collides_with(QueryItem::key(b(2))));
    EXPECT_FALSE(range.collides_with(QueryItem::key(b(4))));
    EXPECT_FALSE(range.collides_with(QueryItem::range_after(b(3))));
    EXPECT_TRUE(
        QueryItem::range_to_inclusive(b(3)).collides_with(
            QueryItem::range_after(b(3))));

    EXPECT_EQ(
        range.merge(QueryItem::key(b(3))),
        QueryItem::range_inclusive(b(1), b(3)));
    EXPECT_EQ(
        QueryItem::range_to_inclusive(b(3)).merge(QueryItem::range_after(b(3))),
        QueryItem::range_full());
    EXPECT_EQ(
        QueryItem::range_after(b(1)).merge(QueryItem::range(b(2), b(9))),
        QueryItem::range_after(b(1)));
}

TEST(QueryItemTest, order_by_lower_bound)
{
    EXPECT_LT(QueryItem::range_to(b(9)), QueryItem::key(b(0)));
    EXPECT_LT(QueryItem::key(b(1)), QueryItem::range_after(b(1)));
    EXPECT_LT(QueryItem::key(b(1)), QueryItem::range_inclusive(b(1), b(2)));
}

TEST(QueryItemTest, encode_decode)
{
    byte_string out;
    QueryItem::range_after_to(b(1), 0xaabb_hex).encode(out);
    EXPECT_EQ(out, 0x08010102aabb_hex);

    byte_string_view enc{out};
    auto const decoded = QueryItem::decode(enc);
    ASSERT_FALSE(decoded.has_error());
    EXPECT_EQ(decoded.value(), QueryItem::range_after_to(b(1), 0xaabb_hex));
    EXPECT_TRUE(enc.empty());

    byte_string const bad = 0x0a_hex;
    byte_string_view bad_enc{bad};
    EXPECT_TRUE(QueryItem::decode(bad_enc).has_error());
}
