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

#pragma once

#include <grovedb/commitment_tree/config.hpp>

#include <grovedb/commitment_tree/shard_store.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <variant>

struct sqlite3;

GROVEDB_COMMITMENT_TREE_NAMESPACE_BEGIN

struct connection_deleter
{
    void operator()(sqlite3 *) const noexcept;
};

using connection_ptr = std::unique_ptr<sqlite3, connection_deleter>;

/// Opens (creating if needed) a database file, ":memory:" for a private
/// in-memory database
Result<connection_ptr> open_connection(std::string const &path);

/// A connection used by several components, each statement sequence runs
/// under `mutex`
struct SharedConnection
{
    connection_ptr db;
    std::mutex mutex;
};

/*
 * ShardStore over four tables prefixed "commitment_tree_", so it can live in
 * an existing application database:
 *
 *   commitment_tree_shards(shard_index PK, shard_data BLOB)
 *   commitment_tree_cap(id PK CHECK(id = 0), cap_data BLOB)
 *   commitment_tree_checkpoints(checkpoint_id PK, position NULL)
 *   commitment_tree_checkpoint_marks_removed(checkpoint_id, position)
 *
 * The tables are created on construction. A store either owns its connection
 * or shares one through SharedConnection.
 */
class SqliteShardStore final : public ShardStore
{
    std::variant<connection_ptr, std::shared_ptr<SharedConnection>> holder_;

    explicit SqliteShardStore(connection_ptr);
    explicit SqliteShardStore(std::shared_ptr<SharedConnection>);

    template <class F>
    decltype(auto) with_connection(F &&f)
    {
        if (auto *const owned = std::get_if<connection_ptr>(&holder_)) {
            return f(owned->get());
        }
        auto const &shared =
            std::get<std::shared_ptr<SharedConnection>>(holder_);
        std::lock_guard const lock{shared->mutex};
        return f(shared->db.get());
    }

public:
    static Result<std::unique_ptr<SqliteShardStore>> open(connection_ptr);
    static Result<std::unique_ptr<SqliteShardStore>>
    open_shared(std::shared_ptr<SharedConnection>);

    bool is_shared() const noexcept
    {
        return std::holds_alternative<std::shared_ptr<SharedConnection>>(
            holder_);
    }

    Result<std::optional<Tree>> get_shard(uint64_t index) override;
    Result<void> put_shard(uint64_t index, Tree const &) override;
    Result<std::optional<uint64_t>> last_shard_index() override;
    Result<std::vector<uint64_t>> shard_indices() override;

    Result<Tree> get_cap() override;
    Result<void> put_cap(Tree const &) override;

    Result<void> add_checkpoint(CheckpointId, Checkpoint const &) override;
    Result<size_t> checkpoint_count() override;
    Result<std::optional<CheckpointId>> min_checkpoint_id() override;
    Result<std::optional<CheckpointId>> max_checkpoint_id() override;
    Result<std::optional<Checkpoint>> get_checkpoint(CheckpointId) override;
    Result<std::optional<std::pair<CheckpointId, Checkpoint>>>
    get_checkpoint_at_depth(size_t depth) override;
    Result<bool> update_checkpoint(CheckpointId, Checkpoint const &) override;
    Result<void> remove_checkpoint(CheckpointId) override;
};

GROVEDB_COMMITMENT_TREE_NAMESPACE_END
