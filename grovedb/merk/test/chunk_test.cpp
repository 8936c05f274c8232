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

#include "test_fixtures.hpp"

#include <grovedb/core/blake3.hpp>
#include <grovedb/core/byte_string.hpp>
#include <grovedb/core/bytes.hpp>
#include <grovedb/core/error.hpp>
#include <grovedb/core/hex_literal.hpp>
#include <grovedb/merk/merk.hpp>
#include <grovedb/merk/proofs/branch.hpp>
#include <grovedb/merk/proofs/chunk.hpp>
#include <grovedb/merk/proofs/node.hpp>
#include <grovedb/merk/proofs/tree.hpp>
#include <grovedb/merk/tree_feature_type.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <random>
#include <vector>

using namespace grovedb;
using namespace grovedb::literals;
using namespace grovedb::merk;
using namespace grovedb::test;

TEST(ChunkIdTest, number_of_chunks)
{
    EXPECT_EQ(number_of_chunks(1), 1u);
    EXPECT_EQ(number_of_chunks(2), 1u);
    EXPECT_EQ(number_of_chunks(4), 5u);
    EXPECT_EQ(number_of_chunks(6), 21u);
    EXPECT_EQ(number_of_chunks(10), 341u);

    EXPECT_EQ(number_of_chunks_under_chunk_id(10, 1).value(), 341u);
    EXPECT_EQ(number_of_chunks_under_chunk_id(10, 2).value(), 85u);
    EXPECT_EQ(number_of_chunks_under_chunk_id(10, 3).value(), 21u);
    EXPECT_EQ(number_of_chunks_under_chunk_id(10, 87).value(), 85u);
}

TEST(ChunkIdTest, traversal_instructions)
{
    EXPECT_TRUE(generate_traversal_instruction(4, 1).value().empty());
    EXPECT_EQ(
        generate_traversal_instruction(4, 2).value(),
        (std::vector<bool>{LEFT, LEFT}));
    EXPECT_EQ(
        generate_traversal_instruction(4, 3).value(),
        (std::vector<bool>{LEFT, RIGHT}));
    EXPECT_EQ(
        generate_traversal_instruction(4, 4).value(),
        (std::vector<bool>{RIGHT, LEFT}));
    EXPECT_EQ(
        generate_traversal_instruction(4, 5).value(),
        (std::vector<bool>{RIGHT, RIGHT}));

    auto const past = generate_traversal_instruction(4, 6);
    ASSERT_TRUE(past.has_error());
    EXPECT_EQ(past.error(), Error::chunk_out_of_bounds);
    EXPECT_TRUE(generate_traversal_instruction(4, 0).has_error());

    EXPECT_EQ(traversal_instruction_as_string({LEFT}), "1");
    EXPECT_EQ(traversal_instruction_as_string({RIGHT}), "0");
    EXPECT_EQ(traversal_instruction_as_string({LEFT, RIGHT, RIGHT}), "100");

    EXPECT_EQ(chunk_layer(10, 3).value(), 2u);
    EXPECT_EQ(chunk_height(5, 1).value(), 2u);
}

TEST(ChunkIdTest, binary_range)
{
    EXPECT_TRUE(BinaryRange::make(3, 2).has_error());
    auto const range = BinaryRange::make(2, 5).value();
    EXPECT_EQ(range.len(), 4u);
    EXPECT_EQ(range.which_half(3), std::optional<bool>{LEFT});
    EXPECT_EQ(range.which_half(4), std::optional<bool>{RIGHT});
    EXPECT_FALSE(range.which_half(6).has_value());
    auto const right = range.half(RIGHT).value();
    EXPECT_EQ(right.start(), 4u);
    EXPECT_EQ(right.end(), 5u);

    auto const odd = BinaryRange::make(1, 3).value();
    EXPECT_TRUE(odd.half(LEFT).has_error());
    auto const [rest, first] = odd.advance_start().value();
    EXPECT_EQ(first, 1u);
    EXPECT_EQ(rest.start(), 2u);
}

TEST(ChunkDepthTest, splits_evenly_deeper_first)
{
    EXPECT_EQ(calculate_chunk_depths(20, 8), (std::vector<uint8_t>{7, 7, 6}));
    EXPECT_EQ(calculate_chunk_depths(10, 4), (std::vector<uint8_t>{4, 3, 3}));
    EXPECT_EQ(calculate_chunk_depths(15, 5), (std::vector<uint8_t>{5, 5, 5}));
    EXPECT_EQ(calculate_chunk_depths(5, 10), (std::vector<uint8_t>{5}));
    EXPECT_EQ(calculate_chunk_depths(0, 8), (std::vector<uint8_t>{0}));
}

TEST(ChunkDepthTest, minimum_first_chunk)
{
    EXPECT_EQ(
        calculate_chunk_depths_with_minimum(3, 8, 6),
        (std::vector<uint8_t>{6}));
    EXPECT_EQ(
        calculate_chunk_depths_with_minimum(20, 8, 8),
        (std::vector<uint8_t>{8, 6, 6}));
    EXPECT_EQ(
        calculate_chunk_depths_with_minimum(20, 8, 4),
        (std::vector<uint8_t>{7, 7, 6}));
    // the minimum never exceeds the maximum
    EXPECT_EQ(
        calculate_chunk_depths_with_minimum(2, 4, 9),
        (std::vector<uint8_t>{4}));
}

TEST(ChunkDepthTest, tree_depth_bounds)
{
    EXPECT_EQ(calculate_tree_depth_from_count(0), 0);
    EXPECT_EQ(calculate_tree_depth_from_count(1), 1);
    EXPECT_EQ(calculate_tree_depth_from_count(3), 2);
    EXPECT_EQ(calculate_tree_depth_from_count(7), 3);
    EXPECT_EQ(calculate_tree_depth_from_count(15), 4);

    EXPECT_EQ(max_avl_height(0), 0);
    EXPECT_EQ(max_avl_height(1), 1);
    EXPECT_EQ(max_avl_height(2), 2);
    EXPECT_EQ(max_avl_height(4), 3);
    EXPECT_EQ(max_avl_height(6), 3);
    EXPECT_EQ(max_avl_height(7), 4);
    EXPECT_EQ(max_avl_height(100), 9);
    EXPECT_EQ(max_avl_height(143), 10);

    // minimal AVL trees: N(5) = 12, N(6) = 20, N(9) = 88
    EXPECT_EQ(max_avl_height(11), 4);
    EXPECT_EQ(max_avl_height(12), 5);
    EXPECT_EQ(max_avl_height(19), 5);
    EXPECT_EQ(max_avl_height(20), 6);
    EXPECT_EQ(max_avl_height(87), 8);
    EXPECT_EQ(max_avl_height(88), 9);
}

class ChunkTest : public MerkFixture
{
protected:
    void SetUp() override
    {
        open();
        // 31 sequential keys build a perfect tree of height 5
        insert_range(0, 31);
    }

    TreeNode const *node_at(
        std::vector<bool> const &path, std::unique_ptr<TreeNode> &holder) const
    {
        TreeNode const *node = merk->root();
        for (bool const left : path) {
            node = merk->walk(*node, left, holder).value.value();
        }
        return node;
    }
};

TEST_F(ChunkTest, chunks_commit_to_their_subtrees)
{
    ASSERT_EQ(merk->height(), 5);
    auto const total = number_of_chunks(merk->height());
    for (size_t id = 1; id <= total; ++id) {
        auto const chunk = create_chunk_by_id(*merk, id);
        ASSERT_TRUE(chunk.value.has_value()) << id;
        auto const executed = execute(chunk.value.value(), false);
        ASSERT_TRUE(executed.value.has_value()) << id;

        auto const path = generate_traversal_instruction(5, id).value();
        std::unique_ptr<TreeNode> holder;
        auto const *node = node_at(path, holder);
        ASSERT_NE(node, nullptr);
        EXPECT_EQ(
            executed.value.value()->hash().value, node->hash().value.value())
            << id;
    }
    EXPECT_TRUE(create_chunk_by_id(*merk, total + 1).value.has_error());
}

TEST_F(ChunkTest, bad_instruction_is_rejected)
{
    auto const res = traverse_and_build_chunk(
        *merk, {LEFT, LEFT, LEFT, LEFT, LEFT}, 1);
    ASSERT_TRUE(res.value.has_error());
    EXPECT_EQ(res.value.error(), Error::chunk_bad_instruction);
}

TEST_F(ChunkTest, zero_depth_chunk_is_a_hash)
{
    auto const res = create_chunk(*merk, *merk->root(), 0);
    ASSERT_TRUE(res.value.has_value());
    ASSERT_EQ(res.value.value().size(), 1u);
    EXPECT_EQ(res.value.value()[0].node.hash, root_hash());
}

TEST_F(ChunkTest, height_proof)
{
    auto const proof = generate_height_proof(*merk);
    ASSERT_TRUE(proof.value.has_value());
    auto const height = verify_height_proof(proof.value.value(), root_hash());
    ASSERT_TRUE(height.has_value());
    EXPECT_EQ(height.value(), 5u);

    bytes32_t wrong = root_hash();
    wrong.bytes[0] ^= 1;
    auto const bad = verify_height_proof(proof.value.value(), wrong);
    ASSERT_TRUE(bad.has_error());
    EXPECT_EQ(bad.error(), Error::invalid_proof);
}

namespace
{
    ProofTree const *
    descend_to(ProofTree const &root, byte_string_view const key)
    {
        ProofTree const *tree = &root;
        while (tree && tree->key() && *tree->key() != key) {
            auto const *child = tree->child(key < *tree->key());
            tree = child ? child->tree.get() : nullptr;
        }
        return tree;
    }
}

class TrunkBranchTest : public MerkFixture
{
protected:
    static constexpr uint64_t N = 2000;
    std::vector<byte_string> keys;
    int64_t total_sum{0};

    void SetUp() override
    {
        open(TreeType::count_sum);
        std::mt19937_64 rng{7};
        for (uint64_t start = 0; start < N; start += 250) {
            MerkBatch batch;
            for (uint64_t i = start; i < start + 250; ++i) {
                auto const h = blake3(be_key(rng()));
                byte_string key{h.bytes, sizeof(h.bytes)};
                auto const balance = static_cast<int64_t>(rng() % 1000);
                total_sum += balance;
                keys.push_back(key);
                batch.emplace_back(
                    std::move(key),
                    MerkOp::put(
                        "acct"_bytes,
                        TreeFeatureType::counted_summed(1, balance)));
            }
            apply(std::move(batch));
        }
    }
};

TEST_F(TrunkBranchTest, root_aggregate_matches_inserts)
{
    auto const agg = merk->aggregate_data().value();
    EXPECT_EQ(agg.count, N);
    EXPECT_EQ(agg.sum, total_sum);
}

TEST_F(TrunkBranchTest, trunk_then_branches_find_every_key)
{
    auto const trunk_res = trunk_query(*merk, {.max_depth = 7});
    ASSERT_TRUE(trunk_res.value.has_value());
    auto const &trunk = trunk_res.value.value();
    EXPECT_EQ(trunk.tree_depth, max_avl_height(N));
    ASSERT_FALSE(trunk.chunk_depths.empty());
    EXPECT_LE(trunk.chunk_depths.front(), 7);

    auto const terminals = trunk.terminal_node_keys();
    EXPECT_FALSE(terminals.empty());
    EXPECT_LE(terminals.size(), 127u);
    EXPECT_FALSE(trunk.verify_terminal_nodes_at_expected_depth().has_error());

    auto const trunk_tree = trunk.verify(root_hash());
    ASSERT_TRUE(trunk_tree.has_value());

    uint8_t const depth = 4;
    // ceil(log2(N) / depth) branches finish any search below the trunk
    size_t const max_rounds =
        (calculate_tree_depth_from_count(N) + depth - 1) / depth;
    ASSERT_EQ(max_rounds, 3u);
    // verified branches, kept alive while their keys are traced
    std::vector<std::unique_ptr<ProofTree>> kept;
    for (size_t i = 0; i < keys.size(); i += 97) {
        auto const &target = keys[i];
        auto terminal = trunk.trace_key_to_terminal(target);
        ProofTree const *parent_tree = trunk_tree.value().get();
        size_t rounds = 0;
        while (terminal.has_value()) {
            ASSERT_LT(rounds++, max_rounds);
            auto const branch_res = branch_query(*merk, *terminal, depth);
            ASSERT_TRUE(branch_res.value.has_value());
            auto const &branch = branch_res.value.value();
            EXPECT_EQ(branch.branch_root_key, *terminal);

            // the branch root is the node the previous proof ended at
            auto const *in_parent = descend_to(*parent_tree, *terminal);
            ASSERT_NE(in_parent, nullptr);
            EXPECT_EQ(in_parent->hash().value, branch.branch_root_hash);

            auto verified = branch.verify();
            ASSERT_TRUE(verified.has_value());
            terminal = branch.trace_key_to_terminal(target);
            if (!terminal.has_value()) {
                auto const *found = descend_to(*verified.value(), target);
                ASSERT_NE(found, nullptr);
                ASSERT_NE(found->key(), nullptr);
                EXPECT_EQ(*found->key(), target);
            }
            kept.push_back(std::move(verified).value());
            parent_tree = kept.back().get();
        }
    }
}

TEST_F(TrunkBranchTest, branch_of_missing_key_fails)
{
    auto const res = branch_query(*merk, byte_string(32, 0), 3);
    ASSERT_TRUE(res.value.has_error());
    EXPECT_EQ(res.value.error(), Error::path_key_not_found);
}

TEST_F(TrunkBranchTest, minimum_depth_hides_small_tree_shape)
{
    auto const res =
        trunk_query(*merk, {.max_depth = 12, .min_depth = 12});
    ASSERT_TRUE(res.value.has_value());
    EXPECT_EQ(res.value.value().chunk_depths.front(), 12);
}
