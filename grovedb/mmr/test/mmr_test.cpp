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
#include <grovedb/core/bytes.hpp>
#include <grovedb/core/codec.hpp>
#include <grovedb/core/hex_literal.hpp>
#include <grovedb/mmr/helper.hpp>
#include <grovedb/mmr/merkle_proof.hpp>
#include <grovedb/mmr/mmr.hpp>
#include <grovedb/mmr/mmr_error.hpp>
#include <grovedb/mmr/mmr_tree_proof.hpp>
#include <grovedb/mmr/node.hpp>
#include <grovedb/mmr/store.hpp>
#include <grovedb/storage/memory_storage.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <random>
#include <vector>

using namespace grovedb;
using namespace grovedb::literals;
using namespace grovedb::mmr;

namespace
{
    byte_string leaf_value(uint32_t const i)
    {
        byte_string v(4, 0);
        for (unsigned b = 0; b < 4; ++b) {
            v[b] = static_cast<unsigned char>(i >> (8 * b));
        }
        return v;
    }

    MmrNode leaf_from_u32(uint32_t const i)
    {
        return MmrNode::leaf(leaf_value(i));
    }

    std::vector<uint64_t> push_leaves(Mmr &mmr, uint32_t const count)
    {
        std::vector<uint64_t> positions;
        for (uint32_t i = 0; i < count; ++i) {
            auto res = mmr.push(leaf_from_u32(i));
            EXPECT_TRUE(res.value.has_value());
            positions.push_back(res.value.value());
        }
        return positions;
    }

    GetNodeFn reader(MemMmrStore &store)
    {
        return [&store](uint64_t const pos) -> Result<std::optional<MmrNode>> {
            return store.element_at_position(pos).value;
        };
    }
}

TEST(MmrHelperTest, positions)
{
    std::vector<uint64_t> const expected{0, 1, 3, 4, 7, 8, 10, 11, 15};
    for (uint64_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(leaf_index_to_pos(i), expected[i]) << i;
    }
    EXPECT_EQ(leaf_index_to_mmr_size(0), 1);
    EXPECT_EQ(leaf_index_to_mmr_size(2), 4);
    EXPECT_EQ(leaf_index_to_mmr_size(3), 7);
    EXPECT_EQ(leaf_index_to_mmr_size(10), 19);

    EXPECT_EQ(pos_height_in_tree(0), 0);
    EXPECT_EQ(pos_height_in_tree(2), 1);
    EXPECT_EQ(pos_height_in_tree(6), 2);
    EXPECT_EQ(pos_height_in_tree(14), 3);
    EXPECT_EQ(pos_height_in_tree(15), 0);

    EXPECT_EQ(get_peaks(19), (std::vector<uint64_t>{14, 17, 18}));
    EXPECT_EQ(get_peaks(8), (std::vector<uint64_t>{6, 7}));
    EXPECT_TRUE(get_peaks(0).empty());

    EXPECT_EQ(mmr_size_to_leaf_count(0), 0);
    EXPECT_EQ(mmr_size_to_leaf_count(1), 1);
    EXPECT_EQ(mmr_size_to_leaf_count(3), 2);
    EXPECT_EQ(mmr_size_to_leaf_count(4), 3);
    EXPECT_EQ(mmr_size_to_leaf_count(7), 4);
    EXPECT_EQ(mmr_size_to_leaf_count(19), 11);

    EXPECT_EQ(hash_count_for_push(0), 1);
    EXPECT_EQ(hash_count_for_push(1), 2);
    EXPECT_EQ(hash_count_for_push(2), 1);
    EXPECT_EQ(hash_count_for_push(3), 3);
    EXPECT_EQ(hash_count_for_push(7), 4);

    EXPECT_EQ(mmr_node_key(5), 0x0000000000000005_hex);
}

TEST(MmrNodeTest, domain_separation)
{
    std::mt19937_64 rng{42};
    for (int round = 0; round < 32; ++round) {
        bytes32_t l;
        bytes32_t r;
        for (size_t i = 0; i < HASH_LENGTH; ++i) {
            l.bytes[i] = static_cast<unsigned char>(rng());
            r.bytes[i] = static_cast<unsigned char>(rng());
        }
        byte_string concat{to_byte_string_view(l)};
        concat.append(to_byte_string_view(r));
        EXPECT_NE(leaf_hash(concat), merge_hash(l, r));
    }
}

TEST(MmrNodeTest, serialization)
{
    auto const leaf = MmrNode::leaf("test data"_bytes);
    auto const leaf_bytes = leaf.serialize();
    ASSERT_TRUE(leaf_bytes.has_value());
    EXPECT_EQ(leaf_bytes.value().size(), leaf.serialized_size());
    EXPECT_EQ(leaf_bytes.value()[0], 0x01);

    auto const decoded = MmrNode::deserialize(leaf_bytes.value());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value(), leaf);
    EXPECT_EQ(decoded.value().value(), "test data"_bytes);

    auto const internal = MmrNode::internal(leaf.hash());
    auto const internal_bytes = internal.serialize();
    ASSERT_TRUE(internal_bytes.has_value());
    EXPECT_EQ(internal_bytes.value().size(), 33);
    auto const decoded_internal = MmrNode::deserialize(internal_bytes.value());
    ASSERT_TRUE(decoded_internal.has_value());
    EXPECT_FALSE(decoded_internal.value().value().has_value());

    // a data leaf keeps a hash that is not the leaf hash of its value
    auto const data = MmrNode::data_leaf(NULL_HASH, "blob"_bytes);
    auto const data_bytes = data.serialize();
    ASSERT_TRUE(data_bytes.has_value());
    auto const decoded_data = MmrNode::deserialize(data_bytes.value());
    ASSERT_TRUE(decoded_data.has_value());
    EXPECT_TRUE(decoded_data.value().is_data_leaf());
}

TEST(MmrNodeTest, rejects_malformed)
{
    auto tampered = MmrNode::leaf("abc"_bytes).serialize().value();
    tampered.back() ^= 1;
    auto const res = MmrNode::deserialize(tampered);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), MmrError::invalid_data);

    EXPECT_TRUE(MmrNode::deserialize(byte_string(32, 0)).has_error());
    EXPECT_TRUE(MmrNode::deserialize(byte_string(34, 0)).has_error());

    byte_string unknown(33, 0);
    unknown[0] = 0x07;
    EXPECT_TRUE(MmrNode::deserialize(unknown).has_error());
}

TEST(MmrTest, root_of_three_leaves)
{
    MemMmrStore store;
    Mmr mmr{0, store};
    push_leaves(mmr, 3);
    EXPECT_EQ(mmr.mmr_size(), 4);

    auto const l0 = leaf_from_u32(0);
    auto const l1 = leaf_from_u32(1);
    auto const l2 = leaf_from_u32(2);
    auto const p2 = MmrNode::merge(l0, l1);
    // peaks are bagged right to left
    auto const expected = MmrNode::merge(l2, p2);

    auto root = mmr.get_root();
    ASSERT_TRUE(root.value.has_value());
    EXPECT_EQ(root.value.value(), expected);
}

TEST(MmrTest, empty_has_no_root)
{
    MemMmrStore store;
    Mmr mmr{0, store};
    auto root = mmr.get_root();
    ASSERT_TRUE(root.value.has_error());
    EXPECT_EQ(root.value.error(), MmrError::get_root_on_empty);
}

TEST(MmrTest, uncommitted_nodes_are_readable)
{
    MemMmrStore store;
    Mmr mmr{0, store};
    push_leaves(mmr, 6);
    EXPECT_EQ(store.size(), 0);
    auto root_before = mmr.get_root();
    ASSERT_TRUE(root_before.value.has_value());

    ASSERT_TRUE(mmr.commit().value.has_value());
    EXPECT_EQ(store.size(), 10);

    Mmr reopened{mmr.mmr_size(), store};
    auto root_after = reopened.get_root();
    ASSERT_TRUE(root_after.value.has_value());
    EXPECT_EQ(root_after.value.value(), root_before.value.value());
    EXPECT_EQ(reopened.leaf_count(), 6);
}

TEST(MmrTest, proofs_verify_for_every_leaf_set)
{
    for (uint32_t const count : {1u, 2u, 5u, 11u, 32u}) {
        MemMmrStore store;
        Mmr mmr{0, store};
        auto const positions = push_leaves(mmr, count);
        auto root = mmr.get_root();
        ASSERT_TRUE(root.value.has_value());

        std::vector<std::vector<uint32_t>> selections;
        for (uint32_t i = 0; i < count; ++i) {
            selections.push_back({i});
        }
        selections.push_back({0, count - 1});
        if (count > 3) {
            selections.push_back({1, 2, count - 2});
        }

        for (auto const &selection : selections) {
            std::vector<uint64_t> proof_positions;
            ProvenLeaves leaves;
            for (uint32_t const i : selection) {
                proof_positions.push_back(positions[i]);
                leaves.emplace_back(positions[i], leaf_from_u32(i));
            }
            auto proof = mmr.gen_proof(proof_positions);
            ASSERT_TRUE(proof.value.has_value()) << count;
            auto verified =
                proof.value.value().verify(root.value.value(), leaves);
            ASSERT_TRUE(verified.has_value()) << count;
            EXPECT_TRUE(verified.value()) << count;

            // wrong value
            leaves.front().second = leaf_from_u32(count + 7);
            auto forged =
                proof.value.value().verify(root.value.value(), leaves);
            EXPECT_FALSE(forged.has_value() && forged.value()) << count;
        }
    }
}

TEST(MmrTest, gen_proof_rejects_bad_positions)
{
    MemMmrStore store;
    Mmr mmr{0, store};
    push_leaves(mmr, 4);

    auto empty = mmr.gen_proof({});
    ASSERT_TRUE(empty.value.has_error());
    EXPECT_EQ(empty.value.error(), MmrError::gen_proof_for_invalid_leaves);

    auto internal = mmr.gen_proof({2});
    ASSERT_TRUE(internal.value.has_error());
    EXPECT_EQ(internal.value.error(), MmrError::node_proofs_not_supported);
}

TEST(MmrTest, root_with_new_leaf)
{
    for (uint32_t const count : {1u, 5u, 11u}) {
        MemMmrStore store;
        Mmr mmr{0, store};
        auto const positions = push_leaves(mmr, count);
        uint32_t const elem = count - 1;
        uint64_t const pos = positions[elem];
        auto proof = mmr.gen_proof({pos});
        ASSERT_TRUE(proof.value.has_value());

        auto new_pos = mmr.push(leaf_from_u32(count));
        ASSERT_TRUE(new_pos.value.has_value());
        auto root = mmr.get_root();
        ASSERT_TRUE(root.value.has_value());

        ProvenLeaves leaves;
        leaves.emplace_back(pos, leaf_from_u32(elem));
        auto calculated = proof.value.value().calculate_root_with_new_leaf(
            leaves,
            new_pos.value.value(),
            leaf_from_u32(count),
            leaf_index_to_mmr_size(count));
        ASSERT_TRUE(calculated.has_value()) << count;
        EXPECT_EQ(calculated.value(), root.value.value()) << count;
    }
}

TEST(MmrTest, incremental_verification)
{
    MemMmrStore store;
    Mmr mmr{0, store};
    uint32_t next = 0;
    for (; next < 5; ++next) {
        ASSERT_TRUE(mmr.push(leaf_from_u32(next)).value.has_value());
    }
    ASSERT_TRUE(mmr.commit().value.has_value());

    for (int turn = 0; turn < 2; ++turn) {
        auto prev_root = mmr.get_root();
        ASSERT_TRUE(prev_root.value.has_value());
        std::vector<uint64_t> positions;
        std::vector<MmrNode> leaves;
        for (int step = 0; step < 3; ++step, ++next) {
            auto pos = mmr.push(leaf_from_u32(next));
            ASSERT_TRUE(pos.value.has_value());
            positions.push_back(pos.value.value());
            leaves.push_back(leaf_from_u32(next));
        }
        ASSERT_TRUE(mmr.commit().value.has_value());
        auto proof = mmr.gen_proof(positions);
        ASSERT_TRUE(proof.value.has_value());
        auto root = mmr.get_root();
        ASSERT_TRUE(root.value.has_value());

        auto ok = proof.value.value().verify_incremental(
            root.value.value(), prev_root.value.value(), leaves);
        ASSERT_TRUE(ok.has_value()) << turn;
        EXPECT_TRUE(ok.value()) << turn;

        auto wrong_prev = proof.value.value().verify_incremental(
            root.value.value(), leaf_from_u32(999), leaves);
        ASSERT_TRUE(wrong_prev.has_value());
        EXPECT_FALSE(wrong_prev.value());
    }
}

TEST(MmrTest, storage_backed_store)
{
    storage::MemoryStorage db;
    auto ctx = db.context(bytes32_t{});
    StorageMmrStore store{*ctx};
    Mmr mmr{0, store};
    push_leaves(mmr, 7);
    ASSERT_TRUE(mmr.commit().value.has_value());

    MemMmrStore mem;
    Mmr reference{0, mem};
    push_leaves(reference, 7);

    Mmr reopened{mmr.mmr_size(), store};
    auto root = reopened.get_root();
    ASSERT_TRUE(root.value.has_value());
    EXPECT_EQ(root.value.value(), reference.get_root().value.value());
    EXPECT_GT(root.cost.seek_count, 0);

    auto leaf = reopened.element_at_position(leaf_index_to_pos(3));
    ASSERT_TRUE(leaf.value.has_value());
    ASSERT_TRUE(leaf.value.value().has_value());
    EXPECT_EQ(leaf.value.value()->value(), leaf_value(3));
}

TEST(MmrTreeProofTest, generate_and_verify)
{
    MemMmrStore store;
    Mmr mmr{0, store};
    push_leaves(mmr, 9);
    ASSERT_TRUE(mmr.commit().value.has_value());
    auto const root = mmr.get_root().value.value().hash();

    std::vector<uint64_t> const indices{7, 2, 4};
    auto proof = MmrTreeProof::generate(mmr.mmr_size(), indices, reader(store));
    ASSERT_TRUE(proof.has_value());

    auto verified = proof.value().verify(root);
    ASSERT_TRUE(verified.has_value());
    ASSERT_EQ(verified.value().size(), 3);
    EXPECT_EQ(verified.value()[0], std::pair(uint64_t{7}, leaf_value(7)));
    EXPECT_EQ(verified.value()[1], std::pair(uint64_t{2}, leaf_value(2)));
    EXPECT_EQ(verified.value()[2], std::pair(uint64_t{4}, leaf_value(4)));

    auto with_root = proof.value().verify_and_get_root();
    ASSERT_TRUE(with_root.has_value());
    EXPECT_EQ(with_root.value().first, root);

    auto wrong = proof.value().verify(NULL_HASH);
    ASSERT_TRUE(wrong.has_error());
    EXPECT_EQ(wrong.error(), MmrError::invalid_proof);
}

TEST(MmrTreeProofTest, generate_rejects_bad_indices)
{
    MemMmrStore store;
    Mmr mmr{0, store};
    push_leaves(mmr, 4);
    ASSERT_TRUE(mmr.commit().value.has_value());

    std::vector<uint64_t> const none;
    std::vector<uint64_t> const dup{1, 1};
    std::vector<uint64_t> const out_of_range{4};
    for (auto const *indices : {&none, &dup, &out_of_range}) {
        auto res =
            MmrTreeProof::generate(mmr.mmr_size(), *indices, reader(store));
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.error(), MmrError::invalid_input);
    }
}

TEST(MmrTreeProofTest, reader_failure_takes_priority)
{
    MemMmrStore store;
    Mmr mmr{0, store};
    push_leaves(mmr, 4);
    ASSERT_TRUE(mmr.commit().value.has_value());

    // leaf 0 needs its sibling at position 1
    GetNodeFn const failing =
        [&store](uint64_t const pos) -> Result<std::optional<MmrNode>> {
        if (pos == 1) {
            return MmrError::store_error;
        }
        return store.element_at_position(pos).value;
    };
    std::vector<uint64_t> const indices{0};
    auto res = MmrTreeProof::generate(mmr.mmr_size(), indices, failing);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), MmrError::store_error);
}

TEST(MmrTreeProofTest, duplicate_leaves_keep_first)
{
    MemMmrStore store;
    Mmr mmr{0, store};
    push_leaves(mmr, 5);
    ASSERT_TRUE(mmr.commit().value.has_value());
    auto const root = mmr.get_root().value.value().hash();

    std::vector<uint64_t> const indices{2};
    auto honest =
        MmrTreeProof::generate(mmr.mmr_size(), indices, reader(store));
    ASSERT_TRUE(honest.has_value());

    VerifiedLeaves tampered_leaves{
        {2, leaf_value(2)}, {2, "forged"_bytes}};
    MmrTreeProof const tampered{
        honest.value().mmr_size(),
        tampered_leaves,
        honest.value().proof_items()};
    auto verified = tampered.verify(root);
    ASSERT_TRUE(verified.has_value());
    ASSERT_EQ(verified.value().size(), 1);
    EXPECT_EQ(verified.value()[0].second, leaf_value(2));

    // the forged value first no longer rebuilds the root
    VerifiedLeaves forged_first{{2, "forged"_bytes}, {2, leaf_value(2)}};
    MmrTreeProof const forged{
        honest.value().mmr_size(),
        forged_first,
        honest.value().proof_items()};
    EXPECT_TRUE(forged.verify(root).has_error());
}

TEST(MmrTreeProofTest, verify_rejects_bad_leaf_sets)
{
    MmrTreeProof const empty{7, {}, {}};
    auto res = empty.verify(NULL_HASH);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), MmrError::invalid_proof);

    MmrTreeProof const out_of_range{7, {{4, "x"_bytes}}, {}};
    EXPECT_TRUE(out_of_range.verify(NULL_HASH).has_error());
}

TEST(MmrTreeProofTest, encoding)
{
    MemMmrStore store;
    Mmr mmr{0, store};
    push_leaves(mmr, 6);
    ASSERT_TRUE(mmr.commit().value.has_value());
    auto const root = mmr.get_root().value.value().hash();

    std::vector<uint64_t> const indices{1, 5};
    auto proof = MmrTreeProof::generate(mmr.mmr_size(), indices, reader(store));
    ASSERT_TRUE(proof.has_value());

    auto const bytes = proof.value().encode();
    auto decoded = MmrTreeProof::decode(bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value().mmr_size(), proof.value().mmr_size());
    EXPECT_EQ(decoded.value().leaves(), proof.value().leaves());
    EXPECT_EQ(decoded.value().proof_items(), proof.value().proof_items());
    EXPECT_TRUE(decoded.value().verify(root).has_value());

    auto truncated = MmrTreeProof::decode(
        byte_string_view{bytes}.substr(0, bytes.size() - 1));
    ASSERT_TRUE(truncated.has_error());
    EXPECT_EQ(truncated.error(), MmrError::invalid_data);

    byte_string trailing = bytes;
    trailing.push_back(0);
    EXPECT_TRUE(MmrTreeProof::decode(trailing).has_error());
}
