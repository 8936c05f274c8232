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
#include <grovedb/core/hex_literal.hpp>
#include <grovedb/costs/key_value_storage_cost.hpp>
#include <grovedb/storage/memory_storage.hpp>
#include <grovedb/storage/storage_error.hpp>

#include <gtest/gtest.h>

#include <vector>

using namespace grovedb;
using namespace grovedb::storage;
using namespace grovedb::literals;

TEST(MemoryStorageTest, contexts_are_isolated_by_prefix)
{
    MemoryStorage db;
    std::vector<byte_string> const path_a{"a"_bytes};
    std::vector<byte_string> const path_b{"b"_bytes};
    auto ctx_a = db.context_for_path(path_a);
    auto ctx_b = db.context_for_path(path_b);

    ASSERT_FALSE(ctx_a->put("k"_bytes, "va"_bytes).value.has_error());
    ASSERT_FALSE(ctx_b->put("k"_bytes, "vb"_bytes).value.has_error());

    auto const a = ctx_a->get("k"_bytes);
    ASSERT_TRUE(a.value.has_value());
    EXPECT_EQ(a.value.value(), "va"_bytes);
    EXPECT_EQ(a.cost.seek_count, 1u);
    EXPECT_EQ(a.cost.storage_loaded_bytes, 2u);

    auto const b = ctx_b->get("k"_bytes);
    EXPECT_EQ(b.value.value(), "vb"_bytes);

    auto const missing = ctx_a->get_aux("k"_bytes);
    ASSERT_TRUE(missing.value.has_value());
    EXPECT_FALSE(missing.value.value().has_value());
}

TEST(MemoryStorageTest, put_cost_is_paid_key_and_value)
{
    MemoryStorage db;
    auto ctx = db.context(NULL_HASH);
    auto const res = ctx->put("key1"_bytes, byte_string(10, 0x01));
    ASSERT_FALSE(res.value.has_error());
    // 32 byte prefix + 4 byte key, each length paying its varint
    EXPECT_EQ(res.cost.storage_cost.added_bytes, 37u + 11u);
    EXPECT_EQ(res.cost.seek_count, 1u);
}

TEST(MemoryStorageTest, root_puts_are_free_without_cost_info)
{
    MemoryStorage db;
    auto ctx = db.context(NULL_HASH);
    StorageBatch batch;
    batch.put_in(Keyspace::roots, "r"_bytes, "root"_bytes);
    auto const res = ctx->commit_batch(batch);
    ASSERT_FALSE(res.value.has_error());
    EXPECT_EQ(res.cost.storage_cost.added_bytes, 0u);
    EXPECT_EQ(ctx->get_root("r"_bytes).value.value(), "root"_bytes);
}

TEST(MemoryStorageTest, failed_verification_writes_nothing)
{
    MemoryStorage db;
    auto ctx = db.context(NULL_HASH);
    StorageBatch batch;
    batch.put("a"_bytes, "1"_bytes);
    batch.put(
        "b"_bytes,
        "2"_bytes,
        std::nullopt,
        KeyValueStorageCost{
            .key_storage_cost = {.added_bytes = 1},
            .value_storage_cost = {.added_bytes = 2},
            .new_node = true,
            .needs_value_verification = false});
    auto const res = ctx->commit_batch(batch);
    ASSERT_TRUE(res.value.has_error());
    EXPECT_EQ(res.value.error(), Error::storage_cost_mismatch);
    EXPECT_EQ(db.size(Keyspace::data), 0u);
}

TEST(MemoryStorageTest, delete_charges_removed_bytes)
{
    MemoryStorage db;
    auto ctx = db.context(NULL_HASH);
    ASSERT_FALSE(ctx->put("k"_bytes, "v"_bytes).value.has_error());
    StorageBatch batch;
    batch.del(
        "k"_bytes,
        KeyValueStorageCost{
            .key_storage_cost =
                {.removed_bytes = StorageRemovedBytes::basic(34)},
            .value_storage_cost =
                {.removed_bytes = StorageRemovedBytes::basic(2)}});
    auto const res = ctx->commit_batch(batch);
    ASSERT_FALSE(res.value.has_error());
    EXPECT_EQ(res.cost.storage_cost.removed_bytes.total_removed_bytes(), 36u);
    EXPECT_FALSE(ctx->get("k"_bytes).value.value().has_value());
}

TEST(MemoryStorageTest, raw_iterator_stays_within_prefix)
{
    MemoryStorage db;
    std::vector<byte_string> const path{"p"_bytes};
    auto ctx = db.context_for_path(path);
    auto other = db.context(NULL_HASH);
    for (auto const &k : {"a"_bytes, "c"_bytes, "e"_bytes}) {
        ASSERT_FALSE(ctx->put(k, k).value.has_error());
        ASSERT_FALSE(other->put(k, k).value.has_error());
    }

    OperationCost cost;
    auto it = ctx->raw_iter(Keyspace::data);
    it->seek_to_first(cost);
    std::vector<byte_string> keys;
    while (it->valid()) {
        keys.push_back(*it->key(cost));
        it->next(cost);
    }
    EXPECT_EQ(keys, (std::vector<byte_string>{"a"_bytes, "c"_bytes, "e"_bytes}));

    it->seek("b"_bytes, cost);
    ASSERT_TRUE(it->valid());
    EXPECT_EQ(*it->key(cost), "c"_bytes);

    it->seek_for_prev("d"_bytes, cost);
    ASSERT_TRUE(it->valid());
    EXPECT_EQ(*it->key(cost), "c"_bytes);

    it->seek_to_last(cost);
    ASSERT_TRUE(it->valid());
    EXPECT_EQ(*it->value(cost), "e"_bytes);

    it->prev(cost);
    EXPECT_EQ(*it->key(cost), "c"_bytes);

    it->seek("f"_bytes, cost);
    EXPECT_FALSE(it->valid());
}

TEST(MemoryStorageTest, failing_context_fails_data_and_aux)
{
    MemoryStorage db;
    auto ctx = db.context(NULL_HASH);
    FailingDataStorageContext failing{*ctx};

    auto const get = failing.get("k"_bytes);
    ASSERT_TRUE(get.value.has_error());
    EXPECT_EQ(get.value.error(), StorageError::injected_failure);

    auto const aux = failing.get_aux("k"_bytes);
    ASSERT_TRUE(aux.value.has_error());

    EXPECT_TRUE(failing.put("k"_bytes, "v"_bytes).value.has_error());
    EXPECT_FALSE(failing.get_meta("k"_bytes).value.has_error());
}
