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

#include <grovedb/bulk_append/proof.hpp>
#include <grovedb/commitment_tree/commitment_tree.hpp>
#include <grovedb/commitment_tree/frontier.hpp>
#include <grovedb/core/blake3.hpp>
#include <grovedb/core/byte_string.hpp>
#include <grovedb/core/bytes.hpp>
#include <grovedb/core/codec.hpp>
#include <grovedb/core/error.hpp>
#include <grovedb/core/hex_literal.hpp>
#include <grovedb/element/element.hpp>
#include <grovedb/grove/grove_db.hpp>
#include <grovedb/mmr/mmr_tree_proof.hpp>
#include <grovedb/query/query.hpp>
#include <grovedb/query/query_item.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

using namespace grovedb;
using namespace grovedb::literals;

namespace
{
    byte_string data(unsigned const i)
    {
        return to_byte_string("data_" + std::to_string(i));
    }

    byte_string position(uint8_t const p)
    {
        return byte_string(1, p);
    }

    bytes32_t note(uint64_t const i)
    {
        byte_string in;
        append_be(in, i);
        auto h = blake3(in);
        h.bytes[31] &= 0x3f;
        return h;
    }

    byte_string payload(unsigned const i)
    {
        return byte_string(
            commitment_tree::CIPHERTEXT_PAYLOAD_SIZE,
            static_cast<unsigned char>(i));
    }

    class GroveTreeOpsTest : public ::testing::Test
    {
    protected:
        GroveDb db;

        void insert(Path const &path, byte_string const &key, Element element)
        {
            auto const res = db.insert(path, key, std::move(element));
            ASSERT_TRUE(res.value.has_value());
        }

        template <class T>
        T tree_element(Path const &path, byte_string const &key)
        {
            auto const res = db.get_raw(path, key);
            EXPECT_TRUE(res.value.has_value());
            auto const *v = std::get_if<T>(&res.value.value().data);
            EXPECT_NE(v, nullptr);
            return v ? *v : T{};
        }
    };
}

TEST_F(GroveTreeOpsTest, mmr_append_updates_the_element)
{
    insert({}, "m"_bytes, Element::empty_mmr_tree());
    auto const before = db.root_hash().value.value();

    for (unsigned i = 0; i < 3; ++i) {
        auto const res = db.mmr_tree_append({}, "m"_bytes, data(i));
        ASSERT_TRUE(res.value.has_value());
        EXPECT_EQ(res.value.value().leaf_index, i);
    }
    auto const root = db.mmr_tree_root_hash({}, "m"_bytes).value.value();
    auto const element = tree_element<Element::MmrTree>({}, "m"_bytes);
    EXPECT_EQ(element.mmr_root, root);
    EXPECT_EQ(element.mmr_size, 4u);
    EXPECT_NE(db.root_hash().value.value(), before);

    EXPECT_EQ(db.mmr_tree_leaf_count({}, "m"_bytes).value.value(), 3u);
    EXPECT_EQ(db.mmr_tree_get_value({}, "m"_bytes, 1).value.value(), data(1));
    EXPECT_FALSE(
        db.mmr_tree_get_value({}, "m"_bytes, 3).value.value().has_value());
}

TEST_F(GroveTreeOpsTest, mmr_leaves_prove_against_the_element_root)
{
    insert({}, "t"_bytes, Element::empty_tree());
    insert({"t"_bytes}, "m"_bytes, Element::empty_mmr_tree());
    for (unsigned i = 0; i < 7; ++i) {
        ASSERT_TRUE(
            db.mmr_tree_append({"t"_bytes}, "m"_bytes, data(i))
                .value.has_value());
    }
    auto const root = tree_element<Element::MmrTree>({"t"_bytes}, "m"_bytes)
                          .mmr_root;

    std::vector<uint64_t> const indices{0, 5};
    auto const proof =
        db.prove_mmr_tree_leaves({"t"_bytes}, "m"_bytes, indices);
    ASSERT_TRUE(proof.value.has_value());
    auto const leaves = proof.value.value().verify(root);
    ASSERT_TRUE(leaves.has_value());
    ASSERT_EQ(leaves.value().size(), 2u);
    EXPECT_EQ(leaves.value()[0].first, 0u);
    EXPECT_EQ(leaves.value()[0].second, data(0));
    EXPECT_EQ(leaves.value()[1].first, 5u);
    EXPECT_EQ(leaves.value()[1].second, data(5));
    EXPECT_TRUE(proof.value.value().verify(NULL_HASH).has_error());
}

TEST_F(GroveTreeOpsTest, operations_check_the_element_type)
{
    insert({}, "i"_bytes, Element::item("v"_bytes));
    insert({}, "m"_bytes, Element::empty_mmr_tree());
    EXPECT_EQ(
        db.mmr_tree_append({}, "i"_bytes, data(0)).value.error(),
        Error::wrong_element_type);
    EXPECT_EQ(
        db.bulk_append({}, "m"_bytes, data(0)).value.error(),
        Error::wrong_element_type);
    EXPECT_EQ(
        db.commitment_tree_anchor({}, "m"_bytes).value.error(),
        Error::wrong_element_type);
    EXPECT_EQ(
        db.mmr_tree_append({}, "none"_bytes, data(0)).value.error(),
        Error::path_key_not_found);

    // non merk trees hold no elements
    EXPECT_EQ(
        db.insert({"m"_bytes}, "k"_bytes, Element::item("v"_bytes))
            .value.error(),
        Error::invalid_path);
    EXPECT_TRUE(db.insert({}, "b"_bytes, Element::empty_bulk_append_tree(0))
                    .value.has_error());
}

TEST_F(GroveTreeOpsTest, bulk_append_values_and_proof)
{
    insert({}, "t"_bytes, Element::empty_tree());
    insert({"t"_bytes}, "b"_bytes, Element::empty_bulk_append_tree(2));

    bytes32_t last_root{};
    for (unsigned i = 0; i < 6; ++i) {
        auto const res = db.bulk_append({"t"_bytes}, "b"_bytes, data(i));
        ASSERT_TRUE(res.value.has_value());
        EXPECT_EQ(res.value.value().global_position, i);
        last_root = res.value.value().state_root;
    }
    auto const element =
        tree_element<Element::BulkAppendTree>({"t"_bytes}, "b"_bytes);
    EXPECT_EQ(element.state_root, last_root);
    EXPECT_EQ(element.total_count, 6u);
    EXPECT_EQ(element.chunk_power, 2);

    EXPECT_EQ(db.bulk_count({"t"_bytes}, "b"_bytes).value.value(), 6u);
    EXPECT_EQ(
        db.bulk_get_value({"t"_bytes}, "b"_bytes, 4).value.value(), data(4));
    EXPECT_EQ(
        db.bulk_get_value({"t"_bytes}, "b"_bytes, 1).value.value(), data(1));
    EXPECT_TRUE(
        db.bulk_get_chunk({"t"_bytes}, "b"_bytes, 0).value.value().has_value());
    EXPECT_FALSE(
        db.bulk_get_chunk({"t"_bytes}, "b"_bytes, 1).value.value().has_value());

    auto const query = query::Query::new_single_query_item(
        query::QueryItem::range(position(0), position(6)));
    auto const proof =
        db.prove_bulk_append_query({"t"_bytes}, "b"_bytes, query);
    ASSERT_TRUE(proof.value.has_value());
    auto const values =
        proof.value.value().verify_against_query(last_root, 2, 6, query);
    ASSERT_TRUE(values.has_value());
    ASSERT_EQ(values.value().size(), 6u);
    for (unsigned i = 0; i < 6; ++i) {
        EXPECT_EQ(values.value()[i].first, i);
        EXPECT_EQ(values.value()[i].second, data(i));
    }
}

TEST_F(GroveTreeOpsTest, commitment_tree_anchor_and_records)
{
    insert({}, "ct"_bytes, Element::empty_commitment_tree(2));

    commitment_tree::CommitmentFrontier frontier;
    bytes32_t last_state{};
    for (unsigned i = 0; i < 5; ++i) {
        auto const res =
            db.commitment_tree_append({}, "ct"_bytes, note(i), payload(i));
        ASSERT_TRUE(res.value.has_value());
        EXPECT_EQ(res.value.value().global_position, i);
        last_state = res.value.value().state_root;
        ASSERT_TRUE(frontier.append(note(i)).value.has_value());
    }
    EXPECT_EQ(
        db.commitment_tree_anchor({}, "ct"_bytes).value.value(),
        frontier.root_hash());

    auto const element =
        tree_element<Element::CommitmentTree>({}, "ct"_bytes);
    EXPECT_EQ(element.state_root, last_state);
    EXPECT_EQ(element.total_count, 5u);

    byte_string record;
    append_bytes32(record, note(3));
    record += payload(3);
    EXPECT_EQ(
        db.commitment_tree_get_value({}, "ct"_bytes, 3).value.value(), record);

    auto const query = query::Query::new_single_query_item(
        query::QueryItem::range(position(1), position(4)));
    auto const proof =
        db.prove_commitment_tree_query({}, "ct"_bytes, query);
    ASSERT_TRUE(proof.value.has_value());
    EXPECT_EQ(proof.value.value().sinsemilla_root(), frontier.root_hash());
    auto const values =
        proof.value.value().verify_against_query(last_state, 2, 5, query);
    ASSERT_TRUE(values.has_value());
    ASSERT_EQ(values.value().size(), 3u);
    EXPECT_EQ(values.value()[2].first, 3u);
    EXPECT_EQ(values.value()[2].second, record);
}

TEST_F(GroveTreeOpsTest, grove_proof_reaches_the_plugin_root)
{
    insert({}, "m"_bytes, Element::empty_mmr_tree());
    ASSERT_TRUE(
        db.mmr_tree_append({}, "m"_bytes, data(0)).value.has_value());
    auto const query = query::PathQuery::new_single_key({}, "m"_bytes);
    auto const proof = db.prove_query(query);
    ASSERT_TRUE(proof.value.has_value());
    auto const verified = GroveDb::verify_query(proof.value.value(), query);
    ASSERT_TRUE(verified.value.has_value());
    EXPECT_EQ(verified.value.value().root_hash, db.root_hash().value.value());
    ASSERT_EQ(verified.value.value().elements.size(), 1u);
    auto const *mmr = std::get_if<Element::MmrTree>(
        &verified.value.value().elements.front().element.data);
    ASSERT_NE(mmr, nullptr);
    EXPECT_EQ(
        mmr->mmr_root, db.mmr_tree_root_hash({}, "m"_bytes).value.value());
}
