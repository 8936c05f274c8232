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

#include <grovedb/commitment_tree/client_tree.hpp>
#include <grovedb/commitment_tree/commitment_tree.hpp>
#include <grovedb/commitment_tree/commitment_tree_error.hpp>
#include <grovedb/commitment_tree/frontier.hpp>
#include <grovedb/commitment_tree/merkle_hash.hpp>
#include <grovedb/commitment_tree/node.hpp>
#include <grovedb/commitment_tree/shard_store.hpp>
#include <grovedb/core/blake3.hpp>
#include <grovedb/core/byte_string.hpp>
#include <grovedb/core/bytes.hpp>
#include <grovedb/core/codec.hpp>
#include <grovedb/query/query.hpp>
#include <grovedb/query/query_item.hpp>
#include <grovedb/storage/memory_storage.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <set>
#include <vector>

using namespace grovedb;
using namespace grovedb::commitment_tree;

namespace
{
    Blake3MerkleHasher const hasher;

    // a hasher unrelated to the default one, outputs stay canonical
    class TaggedHasher final : public MerkleHasher
    {
    public:
        bytes32_t empty_leaf() const override
        {
            return bytes32_t{};
        }

        bytes32_t combine(
            uint8_t const level, bytes32_t const &left,
            bytes32_t const &right) const override
        {
            auto out = Blake3Hasher{}
                           .update(to_byte_string("tagged"))
                           .update(level)
                           .update(left)
                           .update(right)
                           .finalize();
            out.bytes[31] = 0;
            return out;
        }
    };

    bytes32_t note(uint64_t const i)
    {
        byte_string in;
        append_be(in, i);
        auto h = blake3(in);
        h.bytes[31] &= 0x3f;
        return h;
    }

    bytes32_t non_canonical()
    {
        bytes32_t v;
        for (auto &b : v.bytes) {
            b = 0xff;
        }
        return v;
    }

    bytes32_t frontier_root(uint64_t const n)
    {
        CommitmentFrontier frontier;
        for (uint64_t i = 0; i < n; ++i) {
            EXPECT_TRUE(frontier.append(note(i)).value.has_value());
        }
        return frontier.root_hash();
    }

    void append_all(
        ClientCommitmentTree &tree, uint64_t const from, uint64_t const to,
        std::initializer_list<uint64_t> const marked = {})
    {
        for (uint64_t i = from; i < to; ++i) {
            bool const mark = std::find(marked.begin(), marked.end(), i) !=
                              marked.end();
            ASSERT_TRUE(tree.append(
                                note(i),
                                mark ? Retention::marked()
                                     : Retention::ephemeral())
                            .has_value())
                << i;
        }
    }
}

TEST(MerkleHashTest, canonical_field_elements)
{
    EXPECT_TRUE(is_canonical(bytes32_t{}));
    EXPECT_TRUE(is_canonical(hasher.empty_leaf()));
    EXPECT_FALSE(is_canonical(non_canonical()));

    // the modulus itself is out of range, one below it is not
    bytes32_t p{};
    p.bytes[0] = 0x01;
    p.bytes[4] = 0xed;
    p.bytes[5] = 0x30;
    p.bytes[6] = 0x2d;
    p.bytes[7] = 0x99;
    p.bytes[8] = 0x1b;
    p.bytes[9] = 0xf9;
    p.bytes[10] = 0x4c;
    p.bytes[11] = 0x09;
    p.bytes[12] = 0xfc;
    p.bytes[13] = 0x98;
    p.bytes[14] = 0x46;
    p.bytes[15] = 0x22;
    p.bytes[31] = 0x40;
    EXPECT_FALSE(is_canonical(p));
    p.bytes[0] = 0x00;
    EXPECT_TRUE(is_canonical(p));
}

TEST(MerkleHashTest, empty_roots)
{
    EXPECT_EQ(hasher.empty_root(0), hasher.empty_leaf());
    for (uint8_t level = 0; level < DEPTH; ++level) {
        EXPECT_EQ(
            hasher.empty_root(level + 1),
            hasher.combine(
                level, hasher.empty_root(level), hasher.empty_root(level)));
        EXPECT_TRUE(is_canonical(hasher.empty_root(level + 1)));
    }
    EXPECT_NE(
        hasher.combine(0, note(1), note(2)),
        hasher.combine(1, note(1), note(2)));
}

TEST(MerkleHashTest, injected_hasher_drives_every_tree)
{
    TaggedHasher const tagged;
    EXPECT_EQ(tagged.empty_root(0), bytes32_t{});
    EXPECT_EQ(
        tagged.empty_root(1),
        tagged.combine(0, bytes32_t{}, bytes32_t{}));

    CommitmentFrontier frontier{tagged};
    EXPECT_EQ(frontier.root_hash(), tagged.empty_root(DEPTH));
    MemoryShardStore store;
    ClientCommitmentTree tree{store, {}, tagged};
    for (uint64_t i = 0; i < 9; ++i) {
        ASSERT_TRUE(frontier.append(note(i)).value.has_value());
        ASSERT_TRUE(tree.append(
                            note(i),
                            i == 3 ? Retention::marked()
                                   : Retention::ephemeral())
                        .has_value());
    }
    auto const root = frontier.root_hash();
    EXPECT_NE(root, frontier_root(9));
    EXPECT_EQ(tree.anchor().value(), root);

    ASSERT_TRUE(tree.checkpoint(1).value());
    auto const path = tree.witness(3, 0).value();
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->root(note(3), tagged), root);
    EXPECT_NE(path->root(note(3)), root);

    auto const reloaded =
        CommitmentFrontier::deserialize(frontier.serialize(), tagged);
    ASSERT_TRUE(reloaded.has_value());
    EXPECT_EQ(reloaded.value().root_hash(), root);

    storage::MemoryStorage db;
    auto ctx = db.context(bytes32_t{});
    auto server = CommitmentTree::create(2, tagged).value();
    for (uint64_t i = 0; i < 9; ++i) {
        byte_string const payload(CIPHERTEXT_PAYLOAD_SIZE, 0x01);
        ASSERT_TRUE(server.append(*ctx, note(i), payload).value.has_value());
    }
    EXPECT_EQ(server.root_hash(), root);
    auto const reopened = CommitmentTree::open(*ctx, 9, 2, tagged);
    ASSERT_TRUE(reopened.value.has_value());
    EXPECT_EQ(reopened.value.value().root_hash(), root);
}

TEST(FrontierTest, empty)
{
    CommitmentFrontier const frontier;
    EXPECT_EQ(frontier.root_hash(), hasher.empty_root(DEPTH));
    EXPECT_EQ(frontier.tree_size(), 0);
    EXPECT_FALSE(frontier.position().has_value());
    EXPECT_EQ(frontier.serialize(), byte_string(1, 0x00));
}

TEST(FrontierTest, root_of_two_leaves)
{
    CommitmentFrontier frontier;
    ASSERT_TRUE(frontier.append(note(0)).value.has_value());
    auto const res = frontier.append(note(1));
    ASSERT_TRUE(res.value.has_value());

    bytes32_t expected = hasher.combine(0, note(0), note(1));
    for (uint8_t level = 1; level < DEPTH; ++level) {
        expected = hasher.combine(level, expected, hasher.empty_root(level));
    }
    EXPECT_EQ(res.value.value(), expected);
    EXPECT_EQ(frontier.root_hash(), expected);
    EXPECT_EQ(frontier.position(), 1);
    EXPECT_EQ(frontier.tree_size(), 2);
}

TEST(FrontierTest, append_cost_counts_ommer_merges)
{
    CommitmentFrontier frontier;
    uint32_t const expected[] = {32, 32, 33, 32, 34, 32, 33, 32, 35};
    for (unsigned i = 0; i < std::size(expected); ++i) {
        auto const res = frontier.append(note(i));
        ASSERT_TRUE(res.value.has_value());
        EXPECT_EQ(res.cost.sinsemilla_hash_calls, expected[i]) << i;
        EXPECT_EQ(res.cost.hash_node_calls, 0);
    }
}

TEST(FrontierTest, rejects_non_canonical_commitment)
{
    CommitmentFrontier frontier;
    auto const res = frontier.append(non_canonical());
    EXPECT_EQ(res.value.error(), CommitmentTreeError::invalid_field_element);
    EXPECT_EQ(frontier.tree_size(), 0);
}

TEST(FrontierTest, serialization)
{
    CommitmentFrontier frontier;
    for (uint64_t i = 0; i < 3; ++i) {
        ASSERT_TRUE(frontier.append(note(i)).value.has_value());
    }
    // position 2 has a single ommer
    auto const bytes = frontier.serialize();
    ASSERT_EQ(bytes.size(), 1 + 8 + 32 + 1 + 32);
    EXPECT_EQ(bytes[0], 0x01);
    EXPECT_EQ(load_be<uint64_t>(bytes.data() + 1), 2);
    EXPECT_EQ(bytes[41], 1);

    auto const decoded = CommitmentFrontier::deserialize(bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value(), frontier);
    EXPECT_EQ(decoded.value().root_hash(), frontier.root_hash());

    // appending to a restored frontier continues the same tree
    auto restored = decoded.value();
    ASSERT_TRUE(restored.append(note(3)).value.has_value());
    EXPECT_EQ(restored.root_hash(), frontier_root(4));

    auto const empty = CommitmentFrontier::deserialize(byte_string(1, 0x00));
    ASSERT_TRUE(empty.has_value());
    EXPECT_EQ(empty.value().tree_size(), 0);
}

TEST(FrontierTest, deserialize_rejects_malformed_input)
{
    CommitmentFrontier frontier;
    for (uint64_t i = 0; i < 3; ++i) {
        ASSERT_TRUE(frontier.append(note(i)).value.has_value());
    }
    auto const bytes = frontier.serialize();

    EXPECT_EQ(
        CommitmentFrontier::deserialize({}).error(),
        CommitmentTreeError::invalid_data);
    EXPECT_EQ(
        CommitmentFrontier::deserialize(byte_string(1, 0x02)).error(),
        CommitmentTreeError::invalid_data);
    EXPECT_EQ(
        CommitmentFrontier::deserialize(bytes.substr(0, bytes.size() - 1))
            .error(),
        CommitmentTreeError::invalid_data);
    EXPECT_EQ(
        CommitmentFrontier::deserialize(bytes + byte_string(1, 0x00)).error(),
        CommitmentTreeError::invalid_data);

    // ommer count disagrees with the position
    auto wrong_count = bytes;
    wrong_count[41] = 0;
    EXPECT_EQ(
        CommitmentFrontier::deserialize(wrong_count.substr(0, 42)).error(),
        CommitmentTreeError::invalid_data);

    auto bad_leaf = bytes;
    bad_leaf.replace(9, 32, non_canonical().bytes, 32);
    EXPECT_EQ(
        CommitmentFrontier::deserialize(bad_leaf).error(),
        CommitmentTreeError::invalid_field_element);
}

TEST(NodeTest, serialization_round_trip)
{
    Tree const tree = make_parent(
        note(9),
        make_parent(
            std::nullopt,
            make_leaf(note(0), MARKED | CHECKPOINT),
            make_leaf(note(1), EPHEMERAL)),
        make_nil());
    auto const bytes = serialize_tree(tree);
    EXPECT_EQ(bytes[0], 0x02);
    EXPECT_EQ(bytes[1], 0x01);
    EXPECT_EQ(bytes[34], 0x02);
    EXPECT_EQ(bytes[35], 0x00);
    EXPECT_EQ(bytes[36], 0x01);
    EXPECT_EQ(bytes[36 + 33], MARKED | CHECKPOINT);
    EXPECT_EQ(bytes.back(), 0x00);

    auto const decoded = deserialize_tree(bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(tree_equal(decoded.value(), tree));
    EXPECT_FALSE(tree_equal(decoded.value(), make_nil()));

    EXPECT_EQ(serialize_tree(make_nil()), byte_string(1, 0x00));
}

TEST(NodeTest, deserialize_rejects_malformed_input)
{
    EXPECT_EQ(
        deserialize_tree(byte_string(1, 0x03)).error(),
        CommitmentTreeError::invalid_data);
    EXPECT_EQ(deserialize_tree({}).error(), CommitmentTreeError::invalid_data);
    EXPECT_EQ(
        deserialize_tree(byte_string(2, 0x00)).error(),
        CommitmentTreeError::invalid_data);
    byte_string bad_ann{0x02, 0x02, 0x00, 0x00};
    EXPECT_EQ(
        deserialize_tree(bad_ann).error(), CommitmentTreeError::invalid_data);
}

TEST(NodeTest, nesting_depth_is_bounded)
{
    auto const nested = [](size_t const parents) {
        byte_string out;
        for (size_t i = 0; i < parents; ++i) {
            out += byte_string{0x02, 0x00};
        }
        out += byte_string(parents + 1, 0x00);
        return out;
    };
    EXPECT_TRUE(deserialize_tree(nested(MAX_DESERIALIZE_DEPTH)).has_value());
    EXPECT_EQ(
        deserialize_tree(nested(MAX_DESERIALIZE_DEPTH + 2)).error(),
        CommitmentTreeError::invalid_data);
}

TEST(ClientCommitmentTreeTest, empty_tree)
{
    MemoryShardStore store;
    ClientCommitmentTree tree{store};
    EXPECT_EQ(tree.anchor().value(), hasher.empty_root(DEPTH));
    EXPECT_FALSE(tree.max_leaf_position().value().has_value());
    EXPECT_FALSE(tree.root_at_checkpoint_depth(0).value().has_value());

    ASSERT_TRUE(tree.checkpoint(1).value());
    EXPECT_EQ(
        tree.root_at_checkpoint_depth(0).value(), hasher.empty_root(DEPTH));
    EXPECT_FALSE(tree.witness(0, 0).value().has_value());
}

TEST(ClientCommitmentTreeTest, root_matches_frontier)
{
    MemoryShardStore store;
    ClientCommitmentTree tree{store};
    CommitmentFrontier frontier;
    for (uint64_t i = 0; i < 40; ++i) {
        ASSERT_TRUE(tree.append(note(i), Retention::ephemeral()).has_value());
        ASSERT_TRUE(frontier.append(note(i)).value.has_value());
        EXPECT_EQ(tree.anchor().value(), frontier.root_hash()) << i;
    }
    EXPECT_EQ(tree.max_leaf_position().value(), 39);
}

TEST(ClientCommitmentTreeTest, rejects_non_canonical_commitment)
{
    MemoryShardStore store;
    ClientCommitmentTree tree{store};
    EXPECT_EQ(
        tree.append(non_canonical(), Retention::marked()).error(),
        CommitmentTreeError::invalid_field_element);
    EXPECT_FALSE(tree.max_leaf_position().value().has_value());
}

TEST(ClientCommitmentTreeTest, witness_of_marked_leaves)
{
    MemoryShardStore store;
    ClientCommitmentTree tree{store};
    append_all(tree, 0, 10, {3, 7});
    ASSERT_TRUE(tree.checkpoint(1).value());

    auto const anchor = tree.anchor().value();
    EXPECT_EQ(anchor, frontier_root(10));
    EXPECT_EQ(tree.root_at_checkpoint_depth(0).value(), anchor);

    for (uint64_t const pos : {3, 7}) {
        auto const path = tree.witness(pos, 0).value();
        ASSERT_TRUE(path.has_value()) << pos;
        EXPECT_EQ(path->position, pos);
        EXPECT_EQ(path->root(note(pos)), anchor) << pos;
        EXPECT_NE(path->root(note(pos + 1)), anchor) << pos;
    }

    auto const orchard = tree.orchard_witness(3).value();
    ASSERT_TRUE(orchard.has_value());
    EXPECT_EQ(orchard->position, 3u);
    EXPECT_EQ(orchard->root(note(3)), anchor);

    EXPECT_EQ(
        tree.witness(4, 0).error(), CommitmentTreeError::position_not_marked);
}

TEST(ClientCommitmentTreeTest, roots_and_witnesses_at_earlier_checkpoints)
{
    MemoryShardStore store;
    ClientCommitmentTree tree{store};
    append_all(tree, 0, 6, {2});
    ASSERT_TRUE(tree.checkpoint(1).value());
    append_all(tree, 6, 10);
    ASSERT_TRUE(tree.checkpoint(2).value());

    auto const old_root = frontier_root(6);
    auto const new_root = frontier_root(10);
    EXPECT_EQ(tree.root_at_checkpoint_depth(1).value(), old_root);
    EXPECT_EQ(tree.root_at_checkpoint_depth(0).value(), new_root);
    EXPECT_FALSE(tree.root_at_checkpoint_depth(2).value().has_value());

    auto const old_path = tree.witness(2, 1).value();
    ASSERT_TRUE(old_path.has_value());
    EXPECT_EQ(old_path->root(note(2)), old_root);
    auto const new_path = tree.witness(2, 0).value();
    ASSERT_TRUE(new_path.has_value());
    EXPECT_EQ(new_path->root(note(2)), new_root);

    // leaf 8 did not exist at the first checkpoint
    EXPECT_FALSE(tree.witness(8, 1).value().has_value());
}

TEST(ClientCommitmentTreeTest, checkpoint_ids_must_increase)
{
    MemoryShardStore store;
    ClientCommitmentTree tree{store};
    append_all(tree, 0, 2);
    EXPECT_TRUE(tree.checkpoint(5).value());
    EXPECT_FALSE(tree.checkpoint(5).value());
    EXPECT_FALSE(tree.checkpoint(3).value());
    EXPECT_EQ(
        tree.append(note(2), Retention::checkpoint(4)).error(),
        CommitmentTreeError::checkpoint_out_of_order);

    ASSERT_TRUE(
        tree.append(note(2), Retention::checkpoint(6, true)).has_value());
    EXPECT_EQ(store.max_checkpoint_id().value(), 6u);
    auto const path = tree.witness(2, 0).value();
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->root(note(2)), frontier_root(3));
}

TEST(ClientCommitmentTreeTest, prunes_oldest_checkpoints)
{
    MemoryShardStore store;
    ClientCommitmentTree tree{store, {.max_checkpoints = 2}};
    for (CheckpointId id = 1; id <= 3; ++id) {
        append_all(tree, id - 1, id);
        ASSERT_TRUE(tree.checkpoint(id).value());
    }
    EXPECT_EQ(store.checkpoint_count().value(), 2);
    EXPECT_EQ(store.min_checkpoint_id().value(), 2u);
    EXPECT_EQ(tree.root_at_checkpoint_depth(1).value(), frontier_root(2));
    EXPECT_FALSE(tree.root_at_checkpoint_depth(2).value().has_value());
    EXPECT_EQ(tree.anchor().value(), frontier_root(3));
}

TEST(ClientCommitmentTreeTest, remove_mark)
{
    MemoryShardStore store;
    ClientCommitmentTree tree{store};
    append_all(tree, 0, 3, {0, 2});
    EXPECT_TRUE(tree.remove_mark(0).value());
    EXPECT_FALSE(tree.remove_mark(0).value());
    EXPECT_FALSE(tree.remove_mark(1).value());
    ASSERT_TRUE(tree.checkpoint(1).value());

    EXPECT_EQ(
        tree.witness(0, 0).error(), CommitmentTreeError::position_not_marked);
    auto const path = tree.witness(2, 0).value();
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->root(note(2)), frontier_root(3));

    EXPECT_EQ(
        tree.remove_mark(2, 99).error(),
        CommitmentTreeError::checkpoint_not_found);
}

TEST(ClientCommitmentTreeTest, mark_removed_when_checkpoint_is_pruned)
{
    MemoryShardStore store;
    ClientCommitmentTree tree{store, {.max_checkpoints = 1}};
    append_all(tree, 0, 2, {0});
    ASSERT_TRUE(tree.checkpoint(1).value());
    EXPECT_TRUE(tree.remove_mark(0, 1).value());
    EXPECT_EQ(
        store.get_checkpoint(1).value()->marks_removed,
        std::set<uint64_t>{0});

    // still witnessable until checkpoint 1 goes away
    EXPECT_TRUE(tree.witness(0, 0).value().has_value());

    append_all(tree, 2, 3);
    ASSERT_TRUE(tree.checkpoint(2).value());
    EXPECT_EQ(
        tree.witness(0, 0).error(), CommitmentTreeError::position_not_marked);
    EXPECT_EQ(tree.anchor().value(), frontier_root(3));
}

TEST(ClientCommitmentTreeTest, spans_shards)
{
    uint64_t const n = (uint64_t{1} << SHARD_HEIGHT) + 3;
    MemoryShardStore store;
    ClientCommitmentTree tree{store};
    CommitmentFrontier frontier;
    for (uint64_t i = 0; i < n; ++i) {
        bool const mark = i == 5 || i == n - 2;
        ASSERT_TRUE(tree.append(
                            note(i),
                            mark ? Retention::marked() : Retention::ephemeral())
                        .has_value());
        ASSERT_TRUE(frontier.append(note(i)).value.has_value());
    }
    ASSERT_TRUE(tree.checkpoint(1).value());

    EXPECT_EQ(store.shard_indices().value(), (std::vector<uint64_t>{0, 1}));
    EXPECT_FALSE(store.get_cap().value()->is_nil());
    EXPECT_EQ(tree.max_leaf_position().value(), n - 1);

    auto const anchor = tree.anchor().value();
    EXPECT_EQ(anchor, frontier.root_hash());
    for (uint64_t const pos : {uint64_t{5}, n - 2}) {
        auto const path = tree.witness(pos, 0).value();
        ASSERT_TRUE(path.has_value()) << pos;
        EXPECT_EQ(path->root(note(pos)), anchor) << pos;
    }
}

class CommitmentTreeStorageTest : public ::testing::Test
{
protected:
    storage::MemoryStorage db_;
    std::unique_ptr<storage::StorageContext> ctx_ = db_.context(bytes32_t{});

    static byte_string payload(unsigned const i)
    {
        return byte_string(
            CIPHERTEXT_PAYLOAD_SIZE, static_cast<unsigned char>(i));
    }

    static byte_string record(unsigned const i)
    {
        byte_string out;
        append_bytes32(out, note(i));
        return out + payload(i);
    }

    CommitmentTree append_notes(uint8_t const chunk_power, unsigned const n)
    {
        auto tree = CommitmentTree::create(chunk_power).value();
        for (unsigned i = 0; i < n; ++i) {
            auto const res = tree.append(*ctx_, note(i), payload(i));
            EXPECT_TRUE(res.value.has_value()) << i;
        }
        return tree;
    }
};

TEST_F(CommitmentTreeStorageTest, append_binds_both_roots)
{
    auto tree = CommitmentTree::create(2).value();
    auto const res = tree.append(*ctx_, note(0), payload(0));
    ASSERT_TRUE(res.value.has_value());
    EXPECT_EQ(res.cost.sinsemilla_hash_calls, 32);
    auto const &appended = res.value.value();
    EXPECT_EQ(appended.global_position, 0);
    EXPECT_FALSE(appended.compacted);
    EXPECT_EQ(appended.sinsemilla_root, frontier_root(1));
    EXPECT_EQ(
        appended.state_root,
        compute_commitment_tree_state_root(
            appended.sinsemilla_root, appended.bulk_state_root));

    auto const state_root = tree.state_root(*ctx_);
    ASSERT_TRUE(state_root.value.has_value());
    EXPECT_EQ(state_root.value.value(), appended.state_root);
}

TEST_F(CommitmentTreeStorageTest, reopen_restores_frontier)
{
    auto tree = append_notes(2, 5);
    EXPECT_EQ(tree.total_count(), 5);
    EXPECT_EQ(tree.tree_size(), 5);
    EXPECT_EQ(tree.position(), 4);
    EXPECT_EQ(tree.root_hash(), frontier_root(5));

    auto const reopened = CommitmentTree::open(*ctx_, 5, 2);
    ASSERT_TRUE(reopened.value.has_value());
    EXPECT_EQ(reopened.value.value().root_hash(), tree.root_hash());
    EXPECT_EQ(
        reopened.value.value().state_root(*ctx_).value.value(),
        tree.state_root(*ctx_).value.value());

    auto const value = tree.get_value(*ctx_, 3);
    ASSERT_TRUE(value.value.has_value());
    EXPECT_EQ(value.value.value(), record(3));

    EXPECT_EQ(
        CommitmentTree::open(*ctx_, 4, 2).value.error(),
        CommitmentTreeError::invalid_data);
}

TEST_F(CommitmentTreeStorageTest, rejects_bad_input_without_mutation)
{
    auto tree = append_notes(2, 1);
    EXPECT_EQ(
        tree.append(*ctx_, non_canonical(), payload(1)).value.error(),
        CommitmentTreeError::invalid_field_element);
    EXPECT_EQ(
        tree.append(*ctx_, note(1), byte_string(10, 0)).value.error(),
        CommitmentTreeError::invalid_payload_size);
    EXPECT_EQ(tree.total_count(), 1);
    EXPECT_EQ(tree.tree_size(), 1);
}

TEST_F(CommitmentTreeStorageTest, proof_of_records)
{
    auto tree = append_notes(2, 5);
    auto const state_root = tree.state_root(*ctx_).value.value();
    auto const query = query::Query::new_single_query_item(
        query::QueryItem::range(byte_string(1, 1), byte_string(1, 4)));

    auto const proof = CommitmentTreeProof::generate(tree, query, *ctx_);
    ASSERT_TRUE(proof.value.has_value());
    auto const decoded =
        CommitmentTreeProof::decode(proof.value.value().encode());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value().sinsemilla_root(), tree.root_hash());

    auto const values =
        decoded.value().verify_against_query(state_root, 2, 5, query);
    ASSERT_TRUE(values.has_value());
    ASSERT_EQ(values.value().size(), 3);
    for (unsigned i = 0; i < 3; ++i) {
        EXPECT_EQ(values.value()[i].first, i + 1);
        EXPECT_EQ(values.value()[i].second, record(i + 1));
    }

    EXPECT_EQ(
        decoded.value().verify_against_query(note(0), 2, 5, query).error(),
        CommitmentTreeError::invalid_proof);
}
