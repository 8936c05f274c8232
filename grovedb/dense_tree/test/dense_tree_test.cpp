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

#include <grovedb/core/blake3.hpp>
#include <grovedb/core/byte_string.hpp>
#include <grovedb/core/bytes.hpp>
#include <grovedb/core/hex_literal.hpp>
#include <grovedb/dense_tree/dense_tree_error.hpp>
#include <grovedb/dense_tree/hash.hpp>
#include <grovedb/dense_tree/position_ranges.hpp>
#include <grovedb/dense_tree/proof.hpp>
#include <grovedb/dense_tree/store.hpp>
#include <grovedb/dense_tree/tree.hpp>
#include <grovedb/query/query.hpp>
#include <grovedb/query/query_item.hpp>
#include <grovedb/storage/memory_storage.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

using namespace grovedb;
using namespace grovedb::literals;
using namespace grovedb::dense_tree;

namespace
{
    byte_string value_at(uint16_t const i)
    {
        return byte_string(1, static_cast<unsigned char>(i));
    }

    DenseFixedSizedMerkleTree
    filled(uint8_t const height, uint16_t const n, DenseTreeStore &store)
    {
        auto tree = DenseFixedSizedMerkleTree::create(height).value();
        for (uint16_t i = 0; i < n; ++i) {
            auto res = tree.insert(value_at(i), store);
            EXPECT_TRUE(res.value.has_value());
        }
        return tree;
    }

    byte_string position(uint8_t const p)
    {
        return byte_string(1, p);
    }
}

TEST(DenseTreeHashTest, heights)
{
    EXPECT_TRUE(validate_height(1).has_value());
    EXPECT_TRUE(validate_height(16).has_value());
    EXPECT_EQ(validate_height(0).error(), DenseTreeError::invalid_height);
    EXPECT_EQ(validate_height(17).error(), DenseTreeError::invalid_height);
    EXPECT_EQ(capacity_for_height(1), 1);
    EXPECT_EQ(capacity_for_height(3), 7);
    EXPECT_EQ(capacity_for_height(16), 65535);
}

TEST(DenseTreeHashTest, domain_tags)
{
    auto const v = "abc"_bytes;
    EXPECT_NE(leaf_node_hash(v), blake3(v));
    EXPECT_NE(
        leaf_node_hash(v), internal_node_hash(blake3(v), NULL_HASH, NULL_HASH));
}

TEST(DenseTreeHashTest, dense_merkle_root)
{
    std::vector<bytes32_t> const one{blake3("a"_bytes)};
    EXPECT_EQ(compute_dense_merkle_root(one).value(), one[0]);

    std::vector<bytes32_t> const three(3, NULL_HASH);
    EXPECT_TRUE(compute_dense_merkle_root(three).has_error());

    std::vector<byte_string> const values{"a"_bytes, "b"_bytes};
    auto const [root, hashes] =
        compute_dense_merkle_root_from_values(values).value();
    EXPECT_EQ(hashes, 3);
    EXPECT_NE(root, NULL_HASH);
}

TEST(DenseTreeTest, empty_root_is_zero)
{
    MemDenseTreeStore store;
    auto const tree = DenseFixedSizedMerkleTree::create(3).value();
    EXPECT_EQ(tree.capacity(), 7);
    EXPECT_EQ(tree.root_hash(store).value.value(), EMPTY_NODE_HASH);
    EXPECT_EQ(
        DenseFixedSizedMerkleTree::create(0).error(),
        DenseTreeError::invalid_height);
}

TEST(DenseTreeTest, root_of_height_two)
{
    MemDenseTreeStore store;
    auto const tree = filled(2, 3, store);
    auto const expected = internal_node_hash(
        blake3(value_at(0)),
        leaf_node_hash(value_at(1)),
        leaf_node_hash(value_at(2)));
    auto const root = tree.root_hash(store);
    EXPECT_EQ(root.value.value(), expected);
    EXPECT_EQ(root.cost.hash_node_calls, 4);
}

TEST(DenseTreeTest, partial_tree_hashes_missing_positions_as_zero)
{
    MemDenseTreeStore store;
    auto const tree = filled(2, 2, store);
    auto const expected = internal_node_hash(
        blake3(value_at(0)), leaf_node_hash(value_at(1)), EMPTY_NODE_HASH);
    EXPECT_EQ(tree.root_hash(store).value.value(), expected);
}

TEST(DenseTreeTest, insert_until_full)
{
    MemDenseTreeStore store;
    auto tree = DenseFixedSizedMerkleTree::create(2).value();
    for (uint16_t i = 0; i < 3; ++i) {
        auto res = tree.insert(value_at(i), store);
        ASSERT_TRUE(res.value.has_value());
        EXPECT_EQ(res.value.value().position, i);
        EXPECT_EQ(res.value.value().root_hash, tree.root_hash(store).value.value());
    }
    EXPECT_TRUE(tree.is_full());

    auto full = tree.insert(value_at(3), store);
    ASSERT_TRUE(full.value.has_error());
    EXPECT_EQ(full.value.error(), DenseTreeError::tree_full);

    auto tried = tree.try_insert(value_at(3), store);
    ASSERT_TRUE(tried.value.has_value());
    EXPECT_FALSE(tried.value.value().has_value());
    EXPECT_EQ(tree.count(), 3);
}

TEST(DenseTreeTest, get_values)
{
    MemDenseTreeStore store;
    auto const tree = filled(3, 4, store);
    EXPECT_EQ(tree.get(3, store).value.value(), value_at(3));
    EXPECT_FALSE(tree.get(4, store).value.value().has_value());
}

TEST(DenseTreeTest, missing_value_is_a_store_error)
{
    MemDenseTreeStore store;
    auto const tree = DenseFixedSizedMerkleTree::from_state(2, 2).value();
    auto res = tree.root_hash(store);
    ASSERT_TRUE(res.value.has_error());
    EXPECT_EQ(res.value.error(), DenseTreeError::store_error);
    EXPECT_EQ(
        DenseFixedSizedMerkleTree::from_state(2, 4).error(),
        DenseTreeError::invalid_data);
}

TEST(DenseTreeTest, storage_backed_store)
{
    storage::MemoryStorage db;
    auto ctx = db.context(bytes32_t{});
    StorageDenseTreeStore store{*ctx, "d"_bytes};
    auto const tree = filled(3, 5, store);

    MemDenseTreeStore mem;
    auto const reference = filled(3, 5, mem);

    StorageDenseTreeStore reopened{*ctx, "d"_bytes};
    EXPECT_EQ(
        tree.root_hash(reopened).value.value(),
        reference.root_hash(mem).value.value());

    ASSERT_TRUE(reopened.clear(5).value.has_value());
    EXPECT_FALSE(reopened.get_value(0).value.value().has_value());
}

TEST(PositionRangesTest, bytes_to_position)
{
    EXPECT_EQ(bytes_to_position(0x05_hex).value(), 5);
    EXPECT_EQ(bytes_to_position(0x0102_hex).value(), 0x102);
    EXPECT_TRUE(bytes_to_position(byte_string_view{}).has_error());
    EXPECT_TRUE(bytes_to_position(byte_string(9, 0)).has_error());
}

TEST(PositionRangesTest, items_are_clamped_and_merged)
{
    query::Query q;
    q.insert_item(query::QueryItem::range(position(1), position(3)));
    q.insert_item(query::QueryItem::key(position(3)));
    q.insert_item(query::QueryItem::range_from(position(8)));
    auto const ranges = query_to_ranges(q, 10).value();
    ASSERT_EQ(ranges.size(), 2);
    EXPECT_EQ(ranges[0], std::make_pair(uint64_t{1}, uint64_t{4}));
    EXPECT_EQ(ranges[1], std::make_pair(uint64_t{8}, uint64_t{10}));
    EXPECT_TRUE(in_ranges(3, ranges));
    EXPECT_FALSE(in_ranges(4, ranges));
    EXPECT_EQ(ranges_size(ranges), 5);

    auto const none = query_to_ranges(q, 1).value();
    EXPECT_TRUE(none.empty());
}

TEST(PositionRangesTest, subqueries_rejected)
{
    auto q = query::Query::new_range_full();
    q.set_subquery_key("k"_bytes);
    EXPECT_EQ(
        query_to_ranges(q, 4).error(), DenseTreeError::invalid_input);
}

TEST(DenseTreeProofTest, every_position_of_full_tree)
{
    MemDenseTreeStore store;
    auto const tree = filled(3, 7, store);
    auto const root = tree.root_hash(store).value.value();
    for (uint16_t pos = 0; pos < 7; ++pos) {
        std::vector<uint16_t> const positions{pos};
        auto proof = DenseTreeProof::generate(3, 7, positions, store);
        ASSERT_TRUE(proof.value.has_value()) << pos;
        auto verified = proof.value.value().verify(root);
        ASSERT_TRUE(verified.has_value()) << pos;
        ASSERT_EQ(verified.value().size(), 1);
        EXPECT_EQ(verified.value()[0].first, pos);
        EXPECT_EQ(verified.value()[0].second, value_at(pos));
    }
}

TEST(DenseTreeProofTest, proof_shape)
{
    MemDenseTreeStore store;
    filled(3, 7, store);
    std::vector<uint16_t> const positions{4};
    auto const proof =
        DenseTreeProof::generate(3, 7, positions, store).value.value();
    ASSERT_EQ(proof.entries.size(), 1);
    // ancestors 1 and 0 give value hashes, siblings 3 and 2 give subtree hashes
    ASSERT_EQ(proof.node_value_hashes.size(), 2);
    EXPECT_EQ(proof.node_value_hashes[0].first, 0);
    EXPECT_EQ(proof.node_value_hashes[1].first, 1);
    ASSERT_EQ(proof.node_hashes.size(), 2);
    EXPECT_EQ(proof.node_hashes[0].first, 2);
    EXPECT_EQ(proof.node_hashes[1].first, 3);
}

TEST(DenseTreeProofTest, query_range_from)
{
    MemDenseTreeStore store;
    auto const tree = filled(3, 7, store);
    auto const root = tree.root_hash(store).value.value();
    auto const q =
        query::Query::new_single_query_item(query::QueryItem::range_from(
            position(5)));
    auto proof = DenseTreeProof::generate_for_query(3, 7, q, store);
    ASSERT_TRUE(proof.value.has_value());
    auto const verified = proof.value.value().verify(root).value();
    ProvenEntries const expected{{5, value_at(5)}, {6, value_at(6)}};
    EXPECT_EQ(verified, expected);
}

TEST(DenseTreeProofTest, out_of_range_positions)
{
    MemDenseTreeStore store;
    filled(3, 4, store);
    std::vector<uint16_t> const positions{4};
    auto proof = DenseTreeProof::generate(3, 4, positions, store);
    ASSERT_TRUE(proof.value.has_error());
    EXPECT_EQ(proof.value.error(), DenseTreeError::invalid_input);
}

TEST(DenseTreeProofTest, tampering_is_detected)
{
    MemDenseTreeStore store;
    auto const tree = filled(3, 6, store);
    auto const root = tree.root_hash(store).value.value();
    auto const proof =
        DenseTreeProof::generate_range(3, 6, 2, 4, store).value.value();
    ASSERT_TRUE(proof.verify(root).has_value());

    auto changed_value = proof;
    changed_value.entries[0].second = "x"_bytes;
    EXPECT_EQ(
        changed_value.verify(root).error(), DenseTreeError::invalid_proof);

    auto duplicated = proof;
    duplicated.entries.push_back(duplicated.entries[0]);
    EXPECT_EQ(duplicated.verify(root).error(), DenseTreeError::invalid_proof);

    auto overlapping = proof;
    overlapping.node_hashes.emplace_back(
        overlapping.entries[0].first, NULL_HASH);
    EXPECT_EQ(
        overlapping.verify(root).error(), DenseTreeError::invalid_proof);

    auto hash_on_path = proof;
    hash_on_path.node_value_hashes.erase(
        hash_on_path.node_value_hashes.begin());
    hash_on_path.node_hashes.emplace_back(0, root);
    EXPECT_EQ(
        hash_on_path.verify(root).error(), DenseTreeError::invalid_proof);

    auto missing = proof;
    missing.node_hashes.erase(missing.node_hashes.begin());
    EXPECT_EQ(missing.verify(root).error(), DenseTreeError::invalid_proof);

    auto bad_height = proof;
    bad_height.height = 17;
    EXPECT_EQ(bad_height.verify(root).error(), DenseTreeError::invalid_proof);
}

TEST(DenseTreeProofTest, encoding)
{
    MemDenseTreeStore store;
    auto const tree = filled(4, 11, store);
    auto const root = tree.root_hash(store).value.value();
    std::vector<uint16_t> const positions{0, 9, 10};
    auto const proof =
        DenseTreeProof::generate(4, 11, positions, store).value.value();
    auto const bytes = proof.encode();
    auto const decoded = DenseTreeProof::decode(bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value().verify(root).value(), proof.verify(root).value());

    auto trailing = bytes;
    trailing.push_back(0);
    EXPECT_EQ(
        DenseTreeProof::decode(trailing).error(), DenseTreeError::invalid_data);
    EXPECT_EQ(
        DenseTreeProof::decode(bytes.substr(0, bytes.size() - 1)).error(),
        DenseTreeError::invalid_data);
}
