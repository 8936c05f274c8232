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
#include <grovedb/commitment_tree/commitment_tree_error.hpp>
#include <grovedb/commitment_tree/frontier.hpp>
#include <grovedb/commitment_tree/node.hpp>
#include <grovedb/commitment_tree/sqlite_shard_store.hpp>
#include <grovedb/core/blake3.hpp>
#include <grovedb/core/byte_string.hpp>
#include <grovedb/core/codec.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <set>
#include <vector>

using namespace grovedb;
using namespace grovedb::commitment_tree;

namespace
{
    bytes32_t note(uint64_t const i)
    {
        byte_string in;
        append_be(in, i);
        auto h = blake3(in);
        h.bytes[31] &= 0x3f;
        return h;
    }

    std::unique_ptr<SqliteShardStore> open_memory_store()
    {
        auto conn = open_connection(":memory:");
        EXPECT_TRUE(conn.has_value());
        auto store = SqliteShardStore::open(std::move(conn).value());
        EXPECT_TRUE(store.has_value());
        return std::move(store).value();
    }
}

TEST(SqliteShardStoreTest, starts_empty)
{
    auto const store = open_memory_store();
    EXPECT_FALSE(store->is_shared());
    EXPECT_TRUE(store->get_cap().value()->is_nil());
    EXPECT_FALSE(store->last_shard_index().value().has_value());
    EXPECT_TRUE(store->shard_indices().value().empty());
    EXPECT_FALSE(store->get_shard(0).value().has_value());
    EXPECT_EQ(store->checkpoint_count().value(), 0);
    EXPECT_FALSE(store->min_checkpoint_id().value().has_value());
    EXPECT_FALSE(store->max_checkpoint_id().value().has_value());
    EXPECT_FALSE(store->get_checkpoint_at_depth(0).value().has_value());
}

TEST(SqliteShardStoreTest, shards_and_cap)
{
    auto const store = open_memory_store();
    Tree const shard = make_parent(
        note(7), make_leaf(note(0), MARKED), make_leaf(note(1), EPHEMERAL));
    ASSERT_TRUE(store->put_shard(3, shard).has_value());
    ASSERT_TRUE(store->put_shard(1, make_leaf(note(2), EPHEMERAL)).has_value());

    auto const loaded = store->get_shard(3).value();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_TRUE(tree_equal(*loaded, shard));
    EXPECT_EQ(store->last_shard_index().value(), 3u);
    EXPECT_EQ(store->shard_indices().value(), (std::vector<uint64_t>{1, 3}));

    // replacing keeps a single row per index
    ASSERT_TRUE(store->put_shard(3, make_nil()).has_value());
    EXPECT_TRUE(store->get_shard(3).value().value()->is_nil());
    EXPECT_EQ(store->shard_indices().value().size(), 2);

    ASSERT_TRUE(store->put_cap(shard).has_value());
    EXPECT_TRUE(tree_equal(store->get_cap().value(), shard));
}

TEST(SqliteShardStoreTest, checkpoints)
{
    auto const store = open_memory_store();
    Checkpoint const first{.position = 5, .marks_removed = {1, 3}};
    ASSERT_TRUE(store->add_checkpoint(7, first).has_value());
    ASSERT_TRUE(store->add_checkpoint(9, Checkpoint{}).has_value());
    EXPECT_TRUE(store->add_checkpoint(9, Checkpoint{}).has_error());

    EXPECT_EQ(store->checkpoint_count().value(), 2);
    EXPECT_EQ(store->min_checkpoint_id().value(), 7u);
    EXPECT_EQ(store->max_checkpoint_id().value(), 9u);
    EXPECT_EQ(store->get_checkpoint(7).value(), first);
    EXPECT_FALSE(store->get_checkpoint(8).value().has_value());

    auto const latest = store->get_checkpoint_at_depth(0).value();
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->first, 9u);
    EXPECT_FALSE(latest->second.position.has_value());
    auto const older = store->get_checkpoint_at_depth(1).value();
    ASSERT_TRUE(older.has_value());
    EXPECT_EQ(older->first, 7u);
    EXPECT_EQ(older->second, first);
    EXPECT_FALSE(store->get_checkpoint_at_depth(2).value().has_value());

    Checkpoint const updated{.position = 5, .marks_removed = {4}};
    EXPECT_TRUE(store->update_checkpoint(7, updated).value());
    EXPECT_EQ(store->get_checkpoint(7).value(), updated);
    EXPECT_FALSE(store->update_checkpoint(8, updated).value());

    ASSERT_TRUE(store->remove_checkpoint(7).has_value());
    EXPECT_EQ(store->checkpoint_count().value(), 1);
    EXPECT_FALSE(store->get_checkpoint(7).value().has_value());
}

TEST(SqliteShardStoreTest, client_tree_matches_memory_store)
{
    auto const sqlite = open_memory_store();
    MemoryShardStore memory;
    ClientCommitmentTree on_disk{*sqlite, {.max_checkpoints = 3}};
    ClientCommitmentTree in_memory{memory, {.max_checkpoints = 3}};
    for (uint64_t i = 0; i < 20; ++i) {
        auto const retention =
            i % 5 == 0 ? Retention::marked() : Retention::ephemeral();
        ASSERT_TRUE(on_disk.append(note(i), retention).has_value());
        ASSERT_TRUE(in_memory.append(note(i), retention).has_value());
        if (i % 4 == 3) {
            auto const id = static_cast<CheckpointId>(i);
            ASSERT_TRUE(on_disk.checkpoint(id).value());
            ASSERT_TRUE(in_memory.checkpoint(id).value());
        }
    }
    EXPECT_EQ(sqlite->checkpoint_count().value(), 3);
    EXPECT_EQ(on_disk.anchor().value(), in_memory.anchor().value());
    for (size_t depth = 0; depth < 3; ++depth) {
        EXPECT_EQ(
            on_disk.root_at_checkpoint_depth(depth).value(),
            in_memory.root_at_checkpoint_depth(depth).value());
    }
    auto const path = on_disk.witness(10, 0).value();
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(
        path->root(note(10)), on_disk.root_at_checkpoint_depth(0).value());
}

TEST(SqliteShardStoreTest, shared_connection_sees_the_same_tree)
{
    auto conn = std::make_shared<SharedConnection>();
    conn->db = open_connection(":memory:").value();

    auto const first = SqliteShardStore::open_shared(conn).value();
    EXPECT_TRUE(first->is_shared());
    CommitmentFrontier frontier;
    {
        ClientCommitmentTree tree{*first};
        for (uint64_t i = 0; i < 6; ++i) {
            ASSERT_TRUE(tree.append(
                                note(i),
                                i == 1 ? Retention::marked()
                                       : Retention::ephemeral())
                            .has_value());
            ASSERT_TRUE(frontier.append(note(i)).value.has_value());
        }
        ASSERT_TRUE(tree.checkpoint(1).value());
    }

    auto const second = SqliteShardStore::open_shared(conn).value();
    ClientCommitmentTree reopened{*second};
    EXPECT_EQ(reopened.max_leaf_position().value(), 5u);
    EXPECT_EQ(reopened.anchor().value(), frontier.root_hash());
    auto const path = reopened.witness(1, 0).value();
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->root(note(1)), frontier.root_hash());
}
