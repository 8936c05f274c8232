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

#include <grovedb/bulk_append/bulk_append_error.hpp>
#include <grovedb/bulk_append/chunk.hpp>
#include <grovedb/bulk_append/proof.hpp>
#include <grovedb/bulk_append/tree.hpp>
#include <grovedb/core/byte_string.hpp>
#include <grovedb/core/bytes.hpp>
#include <grovedb/core/hex_literal.hpp>
#include <grovedb/mmr/node.hpp>
#include <grovedb/query/query.hpp>
#include <grovedb/query/query_item.hpp>
#include <grovedb/storage/memory_storage.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

using namespace grovedb;
using namespace grovedb::literals;
using namespace grovedb::bulk_append;

namespace
{
    byte_string data(unsigned const i)
    {
        auto const s = "data_" + std::to_string(i);
        return byte_string{
            reinterpret_cast<unsigned char const *>(s.data()), s.size()};
    }

    byte_string position(uint8_t const p)
    {
        return byte_string(1, p);
    }

    query::Query range_query(uint8_t const start, uint8_t const end)
    {
        return query::Query::new_single_query_item(
            query::QueryItem::range(position(start), position(end)));
    }

    class BulkAppendTest : public ::testing::Test
    {
    protected:
        storage::MemoryStorage db_;
        std::unique_ptr<storage::StorageContext> ctx_ =
            db_.context(bytes32_t{});

        BulkAppendTree append_values(uint8_t const chunk_power, unsigned const n)
        {
            auto tree = BulkAppendTree::create(chunk_power).value();
            for (unsigned i = 0; i < n; ++i) {
                auto res = tree.append(*ctx_, data(i));
                EXPECT_TRUE(res.value.has_value()) << i;
            }
            return tree;
        }
    };
}

TEST(ChunkBlobTest, fixed_width_entries)
{
    std::vector<byte_string> const entries{"aa"_bytes, "bb"_bytes, "cc"_bytes};
    auto const blob = serialize_chunk_blob(entries);
    EXPECT_EQ(blob, 0x010000000300000002616162626363_hex);
    EXPECT_EQ(blob.front(), CHUNK_FORMAT_FIXED);
    EXPECT_EQ(blob.size(), 1 + 4 + 4 + 6);
    EXPECT_EQ(deserialize_chunk_blob(blob).value(), entries);
}

TEST(ChunkBlobTest, variable_width_entries)
{
    std::vector<byte_string> const entries{"a"_bytes, byte_string{}, "ccc"_bytes};
    auto const blob = serialize_chunk_blob(entries);
    EXPECT_EQ(blob.front(), CHUNK_FORMAT_VARIABLE);
    EXPECT_EQ(blob.size(), 1 + 3 * 4 + 4);
    EXPECT_EQ(deserialize_chunk_blob(blob).value(), entries);
    EXPECT_TRUE(serialize_chunk_blob({}).empty());
    EXPECT_TRUE(deserialize_chunk_blob(byte_string_view{}).value().empty());
}

TEST(ChunkBlobTest, malformed_blobs)
{
    EXPECT_EQ(
        deserialize_chunk_blob(0x02_hex).error(),
        BulkAppendError::corrupted_data);
    // fixed header promises 2 entries of 2 bytes but carries 3 bytes
    EXPECT_EQ(
        deserialize_chunk_blob(0x0100000002000000020102_hex).error(),
        BulkAppendError::corrupted_data);
    EXPECT_EQ(
        deserialize_chunk_blob(0x000000000501_hex).error(),
        BulkAppendError::corrupted_data);
}

TEST(BulkAppendTreeTest, chunk_power_bounds)
{
    EXPECT_EQ(BulkAppendTree::create(0).error(), BulkAppendError::invalid_input);
    EXPECT_EQ(
        BulkAppendTree::create(17).error(), BulkAppendError::invalid_input);
    EXPECT_EQ(BulkAppendTree::create(16).value().epoch_size(), 65536);
    EXPECT_EQ(
        BulkAppendTree::from_state(5, 2, 0, NULL_HASH).error(),
        BulkAppendError::corrupted_data);
}

TEST_F(BulkAppendTest, compacts_full_epoch)
{
    auto tree = BulkAppendTree::create(2).value();
    for (unsigned i = 0; i < 3; ++i) {
        auto res = tree.append(*ctx_, data(i));
        ASSERT_TRUE(res.value.has_value());
        EXPECT_FALSE(res.value.value().compacted);
        EXPECT_EQ(res.value.value().global_position, i);
    }
    EXPECT_NE(tree.buffer_hash(), NULL_HASH);

    auto res = tree.append(*ctx_, data(3));
    ASSERT_TRUE(res.value.has_value());
    EXPECT_TRUE(res.value.value().compacted);
    EXPECT_EQ(tree.chunk_count(), 1);
    EXPECT_EQ(tree.buffer_count(), 0);
    EXPECT_EQ(tree.mmr_size(), 1);
    EXPECT_EQ(tree.buffer_hash(), NULL_HASH);

    std::vector<byte_string> const chunk{data(0), data(1), data(2), data(3)};
    auto const leaf = mmr::MmrNode::leaf(serialize_chunk_blob(chunk));
    EXPECT_EQ(
        res.value.value().state_root,
        compute_state_root(leaf.hash(), NULL_HASH));
    EXPECT_EQ(tree.state_root(*ctx_).value.value(), res.value.value().state_root);
    EXPECT_EQ(
        tree.get_chunk_value(*ctx_, 0).value.value(),
        serialize_chunk_blob(chunk));
}

TEST_F(BulkAppendTest, empty_tree_state_root)
{
    auto const tree = BulkAppendTree::create(3).value();
    EXPECT_EQ(
        tree.state_root(*ctx_).value.value(),
        compute_state_root(NULL_HASH, NULL_HASH));
}

TEST_F(BulkAppendTest, reads_across_chunks_and_buffer)
{
    auto const tree = append_values(2, 10);
    EXPECT_EQ(tree.chunk_count(), 2);
    EXPECT_EQ(tree.buffer_count(), 2);
    for (unsigned i = 0; i < 10; ++i) {
        EXPECT_EQ(tree.get_value(*ctx_, i).value.value(), data(i)) << i;
    }
    EXPECT_FALSE(tree.get_value(*ctx_, 10).value.value().has_value());
    EXPECT_FALSE(tree.get_chunk_value(*ctx_, 2).value.value().has_value());

    auto const values = tree.query_range(*ctx_, 3, 20).value.value();
    ASSERT_EQ(values.size(), 7);
    for (unsigned i = 0; i < values.size(); ++i) {
        EXPECT_EQ(values[i].first, i + 3);
        EXPECT_EQ(values[i].second, data(i + 3));
    }
}

TEST_F(BulkAppendTest, reload_from_meta)
{
    auto const tree = append_values(2, 7);
    auto const root = tree.state_root(*ctx_).value.value();

    auto loaded = BulkAppendTree::load(*ctx_, 7, 2);
    ASSERT_TRUE(loaded.value.has_value());
    EXPECT_EQ(loaded.value.value().mmr_size(), tree.mmr_size());
    EXPECT_EQ(loaded.value.value().buffer_hash(), tree.buffer_hash());
    EXPECT_EQ(loaded.value.value().state_root(*ctx_).value.value(), root);

    storage::MemoryStorage fresh;
    auto fresh_ctx = fresh.context(bytes32_t{});
    EXPECT_EQ(
        BulkAppendTree::load(*fresh_ctx, 3, 2).value.error(),
        BulkAppendError::corrupted_data);
    EXPECT_TRUE(BulkAppendTree::load(*fresh_ctx, 0, 2).value.has_value());
}

TEST_F(BulkAppendTest, proof_over_chunk_and_buffer)
{
    auto const tree = append_values(2, 6);
    auto const root = tree.state_root(*ctx_).value.value();
    auto const q = range_query(0, 6);

    auto proof = BulkAppendProof::generate(tree, q, *ctx_);
    ASSERT_TRUE(proof.value.has_value());
    auto const &p = proof.value.value();
    ASSERT_EQ(p.chunk_proof().leaves().size(), 1);
    EXPECT_EQ(p.chunk_proof().leaves()[0].first, 0);
    EXPECT_EQ(p.buffer_proof().entries.size(), 2);

    auto const values = p.verify_against_query(root, 2, 6, q);
    ASSERT_TRUE(values.has_value());
    ASSERT_EQ(values.value().size(), 6);
    for (unsigned i = 0; i < 6; ++i) {
        EXPECT_EQ(values.value()[i].first, i);
        EXPECT_EQ(values.value()[i].second, data(i));
    }
}

TEST_F(BulkAppendTest, untouched_halves_are_anchored)
{
    auto const tree = append_values(2, 10);
    auto const root = tree.state_root(*ctx_).value.value();

    auto const buffer_only = range_query(9, 10);
    auto const p1 =
        BulkAppendProof::generate(tree, buffer_only, *ctx_).value.value();
    ASSERT_EQ(p1.chunk_proof().leaves().size(), 1);
    EXPECT_EQ(p1.chunk_proof().leaves()[0].first, 0);
    auto const v1 = p1.verify_against_query(root, 2, 10, buffer_only).value();
    ASSERT_EQ(v1.size(), 1);
    EXPECT_EQ(v1[0].second, data(9));

    auto const chunk_only = range_query(5, 6);
    auto const p2 =
        BulkAppendProof::generate(tree, chunk_only, *ctx_).value.value();
    ASSERT_EQ(p2.buffer_proof().entries.size(), 1);
    EXPECT_EQ(p2.buffer_proof().entries[0].first, 0);
    auto const v2 = p2.verify_against_query(root, 2, 10, chunk_only).value();
    ASSERT_EQ(v2.size(), 1);
    EXPECT_EQ(v2[0].first, 5);
    EXPECT_EQ(v2[0].second, data(5));
}

TEST_F(BulkAppendTest, incomplete_or_wrong_proofs_rejected)
{
    auto const tree = append_values(2, 10);
    auto const root = tree.state_root(*ctx_).value.value();
    auto const proof =
        BulkAppendProof::generate(tree, range_query(0, 2), *ctx_).value.value();

    EXPECT_EQ(
        proof.verify_against_query(root, 2, 10, range_query(0, 10)).error(),
        BulkAppendError::invalid_proof);
    EXPECT_EQ(
        proof.verify_against_query(root, 2, 10, range_query(9, 10)).error(),
        BulkAppendError::invalid_proof);
    EXPECT_EQ(
        proof.verify(NULL_HASH, 2, 10).error(), BulkAppendError::invalid_proof);
    EXPECT_EQ(
        proof.verify(root, 2, 11).error(), BulkAppendError::invalid_proof);
    EXPECT_EQ(
        proof.verify(root, 3, 10).error(), BulkAppendError::invalid_proof);

    auto q = query::Query::new_range_full();
    q.set_subquery_key("k"_bytes);
    EXPECT_EQ(
        proof.verify_against_query(root, 2, 10, q).error(),
        BulkAppendError::invalid_input);
}

TEST_F(BulkAppendTest, proof_encoding)
{
    auto const tree = append_values(3, 21);
    auto const root = tree.state_root(*ctx_).value.value();
    auto const q = range_query(6, 19);
    auto const proof = BulkAppendProof::generate(tree, q, *ctx_).value.value();

    auto const bytes = proof.encode();
    auto const decoded = BulkAppendProof::decode(bytes);
    ASSERT_TRUE(decoded.has_value());
    auto const values = decoded.value().verify_against_query(root, 3, 21, q);
    ASSERT_TRUE(values.has_value());
    EXPECT_EQ(values.value().size(), 13);
    EXPECT_EQ(values.value().front().second, data(6));
    EXPECT_EQ(values.value().back().second, data(18));

    auto const result = decoded.value().verify(root, 3, 21).value();
    auto const in_range = result.values_in_range(7, 9).value();
    ASSERT_EQ(in_range.size(), 2);
    EXPECT_EQ(in_range[0].second, data(7));

    EXPECT_EQ(
        BulkAppendProof::decode(bytes.substr(0, bytes.size() - 1)).error(),
        BulkAppendError::corrupted_data);
}
