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

#include <grovedb/core/bincode.hpp>
#include <grovedb/core/byte_string.hpp>
#include <grovedb/core/codec.hpp>
#include <grovedb/core/error.hpp>
#include <grovedb/core/hex_literal.hpp>
#include <grovedb/query/query.hpp>
#include <grovedb/query/query_item.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
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
}

TEST(QueryTest, insert_item_merges_colliding_items)
{
    Query query;
    query.insert_item(QueryItem::key(b(7)));
    query.insert_item(QueryItem::range(b(1), b(3)));
    query.insert_key(b(3));
    ASSERT_EQ(query.items.size(), 2u);
    EXPECT_EQ(query.items[0], QueryItem::range_inclusive(b(1), b(3)));
    EXPECT_EQ(query.items[1], QueryItem::key(b(7)));

    query.insert_item(QueryItem::range_from(b(5)));
    ASSERT_EQ(query.items.size(), 2u);
    EXPECT_EQ(query.items[1], QueryItem::range_from(b(5)));

    query.insert_item(QueryItem::range_after_to(b(3), b(5)));
    ASSERT_EQ(query.items.size(), 1u);
    EXPECT_EQ(query.items[0], QueryItem::range_from(b(1)));
}

TEST(QueryTest, subquery_lookup_on_key)
{
    Query query = Query::new_range_full();
    EXPECT_FALSE(query.has_subquery_on_key(b(1), false));
    EXPECT_TRUE(query.has_subquery_on_key(b(1), true));

    query.add_conditional_subquery(
        QueryItem::key(b(1)), Path{b(9)}, std::nullopt);
    EXPECT_FALSE(query.has_subquery_on_key(b(1), false));
    EXPECT_TRUE(query.has_subquery_or_subquery_path_on_key(b(1), false));
    EXPECT_FALSE(query.has_subquery_or_subquery_path_on_key(b(2), false));
    ASSERT_NE(query.subquery_branch_for_key(b(1)), nullptr);
    EXPECT_EQ(query.subquery_branch_for_key(b(2)), nullptr);

    query.set_subquery(Query::new_single_key(b(4)));
    EXPECT_TRUE(query.has_subquery_on_key(b(2), false));
    EXPECT_EQ(
        query.subquery_branch_for_key(b(2)), &query.default_subquery_branch);
}

TEST(QueryTest, terminal_keys_without_subquery)
{
    Query query = Query::new_single_query_item(QueryItem::range(b(1), b(4)));
    std::vector<TerminalKey> result;
    auto const n = query.terminal_keys(Path{b(0xaa)}, 10, result);
    ASSERT_FALSE(n.has_error());
    EXPECT_EQ(n.value(), 3u);
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[0].first, Path{b(0xaa)});
    EXPECT_EQ(result[2].second, b(3));
}

TEST(QueryTest, terminal_keys_limit)
{
    Query query = Query::new_single_query_item(QueryItem::range(b(1), b(4)));
    std::vector<TerminalKey> result;
    auto const n = query.terminal_keys({}, 2, result);
    ASSERT_TRUE(n.has_error());
    EXPECT_EQ(n.error(), Error::request_amount_exceeded);
}

TEST(QueryTest, terminal_keys_unbounded)
{
    Query query = Query::new_range_full();
    std::vector<TerminalKey> result;
    auto const n = query.terminal_keys({}, 100, result);
    ASSERT_TRUE(n.has_error());
    EXPECT_EQ(n.error(), Error::not_supported);
}

TEST(QueryTest, terminal_keys_follow_branches)
{
    Query query;
    query.insert_key(0x61_hex);
    query.insert_key(0x62_hex);
    query.add_conditional_subquery(
        QueryItem::key(0x61_hex), Path{0x78_hex, 0x79_hex}, std::nullopt);
    query.set_subquery(Query::new_single_key(0x6b_hex));

    std::vector<TerminalKey> result;
    auto const n = query.terminal_keys({}, 10, result);
    ASSERT_FALSE(n.has_error());
    EXPECT_EQ(n.value(), 2u);
    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0].first, (Path{0x61_hex, 0x78_hex}));
    EXPECT_EQ(result[0].second, 0x79_hex);
    EXPECT_EQ(result[1].first, Path{0x62_hex});
    EXPECT_EQ(result[1].second, 0x6b_hex);
}

TEST(QueryTest, max_depth)
{
    Query leaf = Query::new_single_key(b(1));
    EXPECT_EQ(leaf.max_depth(), 1);

    Query middle = Query::new_range_full();
    middle.set_subquery_path(Path{b(2), b(3)});
    middle.set_subquery(leaf);
    EXPECT_EQ(middle.max_depth(), 4);

    Query top = Query::new_range_full();
    top.add_conditional_subquery(QueryItem::key(b(0)), std::nullopt, middle);
    EXPECT_EQ(top.max_depth(), 5);
}

TEST(QueryTest, max_depth_beyond_recursion_limit)
{
    Query query = Query::new_single_key(b(0));
    for (int i = 0; i < 300; ++i) {
        Query outer = Query::new_single_key(b(0));
        outer.set_subquery(std::move(query));
        query = std::move(outer);
    }
    EXPECT_FALSE(query.max_depth().has_value());
}

TEST(QueryTest, copies_are_deep)
{
    Query query = Query::new_range_full();
    query.set_subquery(Query::new_single_key(b(1)));
    Query copy = query;
    copy.default_subquery_branch.subquery->insert_key(b(2));
    EXPECT_EQ(query.default_subquery_branch.subquery->items.size(), 1u);
    EXPECT_EQ(copy.default_subquery_branch.subquery->items.size(), 2u);
    EXPECT_FALSE(query == copy);
}

TEST(QueryTest, merge_with)
{
    Query ours = Query::new_single_key(b(1));
    Query theirs = Query::new_single_key(b(2));
    theirs.set_subquery(Query::new_single_key(b(9)));
    ours.merge_with(theirs);
    ASSERT_EQ(ours.items.size(), 2u);
    EXPECT_FALSE(ours.has_subquery_on_key(b(1), false));
    EXPECT_TRUE(ours.has_subquery_on_key(b(2), false));
}

TEST(QueryTest, encode_decode)
{
    Query query;
    query.insert_key(b(1));
    query.insert_item(QueryItem::range_after(b(5)));
    query.set_subquery_key(b(7));
    Query sub = Query::new_range_full();
    sub.left_to_right = false;
    query.add_conditional_subquery(QueryItem::key(b(1)), std::nullopt, sub);
    query.add_parent_tree_on_subquery = true;

    auto const enc = query.encode();
    EXPECT_EQ(enc[0], QUERY_ENCODING_VERSION);
    auto const decoded = Query::decode(enc);
    ASSERT_FALSE(decoded.has_error());
    EXPECT_EQ(decoded.value(), query);

    byte_string trailing = enc;
    trailing.push_back(0);
    EXPECT_TRUE(Query::decode(trailing).has_error());

    byte_string version = enc;
    version[0] = 2;
    auto const bad = Query::decode(version);
    ASSERT_TRUE(bad.has_error());
    EXPECT_EQ(bad.error(), Error::version_mismatch);
}

TEST(QueryTest, decode_rejects_too_many_branches)
{
    // version, no items, empty default branch, 1025 branches
    byte_string enc{QUERY_ENCODING_VERSION, 0, 0, 0};
    bincode::append_varint(enc, MAX_CONDITIONAL_SUBQUERY_BRANCHES + 1);
    for (size_t i = 0; i < MAX_CONDITIONAL_SUBQUERY_BRANCHES + 1; ++i) {
        QueryItem::key(b(static_cast<unsigned char>(i))).encode(enc);
        enc.push_back(0);
        enc.push_back(0);
    }
    enc.push_back(1);
    enc.push_back(0);
    auto const decoded = Query::decode(enc);
    ASSERT_TRUE(decoded.has_error());
    EXPECT_EQ(decoded.error(), Error::invalid_input);
}
