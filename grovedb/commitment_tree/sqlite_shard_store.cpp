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

#include <grovedb/commitment_tree/sqlite_shard_store.hpp>

#include <grovedb/commitment_tree/commitment_tree_error.hpp>
#include <grovedb/core/byte_string.hpp>

#include <quill/Quill.h>

#include <sqlite3.h>

#include <string_view>
#include <utility>

GROVEDB_COMMITMENT_TREE_NAMESPACE_BEGIN

namespace
{
    constexpr char const CREATE_TABLES[] =
        "CREATE TABLE IF NOT EXISTS commitment_tree_shards ("
        "  shard_index INTEGER PRIMARY KEY,"
        "  shard_data  BLOB NOT NULL);"
        "CREATE TABLE IF NOT EXISTS commitment_tree_cap ("
        "  id       INTEGER PRIMARY KEY CHECK (id = 0),"
        "  cap_data BLOB NOT NULL);"
        "CREATE TABLE IF NOT EXISTS commitment_tree_checkpoints ("
        "  checkpoint_id INTEGER PRIMARY KEY,"
        "  position      INTEGER);"
        "CREATE TABLE IF NOT EXISTS commitment_tree_checkpoint_marks_removed ("
        "  checkpoint_id INTEGER NOT NULL,"
        "  position      INTEGER NOT NULL,"
        "  PRIMARY KEY (checkpoint_id, position),"
        "  FOREIGN KEY (checkpoint_id)"
        "    REFERENCES commitment_tree_checkpoints(checkpoint_id));";

    struct statement_deleter
    {
        void operator()(sqlite3_stmt *const stmt) const noexcept
        {
            sqlite3_finalize(stmt);
        }
    };

    using statement_ptr = std::unique_ptr<sqlite3_stmt, statement_deleter>;

    CommitmentTreeError
    sqlite_failure(sqlite3 *const db, char const *const what)
    {
        LOG_ERROR("sqlite {} failed: {}", what, sqlite3_errmsg(db));
        return CommitmentTreeError::storage_error;
    }

    Result<void> execute(sqlite3 *const db, char const *const sql)
    {
        char *message = nullptr;
        if (sqlite3_exec(db, sql, nullptr, nullptr, &message) != SQLITE_OK) {
            LOG_ERROR(
                "sqlite exec failed: {}",
                message != nullptr ? message : sqlite3_errmsg(db));
            sqlite3_free(message);
            return CommitmentTreeError::storage_error;
        }
        return outcome::success();
    }

    Result<statement_ptr> prepare(sqlite3 *const db, std::string_view const sql)
    {
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(
                db,
                sql.data(),
                static_cast<int>(sql.size()),
                &stmt,
                nullptr) != SQLITE_OK) {
            return sqlite_failure(db, "prepare");
        }
        return statement_ptr{stmt};
    }

    Result<void> bind_int64(
        sqlite3 *const db, sqlite3_stmt *const stmt, int const index,
        uint64_t const value)
    {
        if (sqlite3_bind_int64(
                stmt, index, static_cast<sqlite3_int64>(value)) != SQLITE_OK) {
            return sqlite_failure(db, "bind");
        }
        return outcome::success();
    }

    Result<void> bind_position(
        sqlite3 *const db, sqlite3_stmt *const stmt, int const index,
        std::optional<uint64_t> const position)
    {
        if (position.has_value()) {
            return bind_int64(db, stmt, index, *position);
        }
        if (sqlite3_bind_null(stmt, index) != SQLITE_OK) {
            return sqlite_failure(db, "bind");
        }
        return outcome::success();
    }

    Result<void> bind_blob(
        sqlite3 *const db, sqlite3_stmt *const stmt, int const index,
        byte_string_view const blob)
    {
        if (sqlite3_bind_blob(
                stmt,
                index,
                blob.data(),
                static_cast<int>(blob.size()),
                SQLITE_TRANSIENT) != SQLITE_OK) {
            return sqlite_failure(db, "bind");
        }
        return outcome::success();
    }

    // true while rows remain
    Result<bool> step(sqlite3 *const db, sqlite3_stmt *const stmt)
    {
        int const rc = sqlite3_step(stmt);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc == SQLITE_DONE) {
            return false;
        }
        return sqlite_failure(db, "step");
    }

    Result<void> step_done(sqlite3 *const db, sqlite3_stmt *const stmt)
    {
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            return sqlite_failure(db, "step");
        }
        return outcome::success();
    }

    byte_string column_blob(sqlite3_stmt *const stmt, int const column)
    {
        auto const *const data = static_cast<unsigned char const *>(
            sqlite3_column_blob(stmt, column));
        auto const size =
            static_cast<size_t>(sqlite3_column_bytes(stmt, column));
        return data != nullptr ? byte_string{data, size} : byte_string{};
    }

    uint64_t column_u64(sqlite3_stmt *const stmt, int const column)
    {
        return static_cast<uint64_t>(sqlite3_column_int64(stmt, column));
    }

    std::optional<uint64_t>
    column_position(sqlite3_stmt *const stmt, int const column)
    {
        if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
            return std::nullopt;
        }
        return column_u64(stmt, column);
    }

    // rolls back unless committed
    class Transaction
    {
        sqlite3 *db_;
        bool open_{false};

    public:
        explicit Transaction(sqlite3 *const db)
            : db_{db}
        {
        }

        Transaction(Transaction const &) = delete;
        Transaction &operator=(Transaction const &) = delete;

        ~Transaction()
        {
            if (open_ && sqlite3_exec(
                             db_, "ROLLBACK", nullptr, nullptr, nullptr) !=
                             SQLITE_OK) {
                LOG_ERROR("sqlite rollback failed: {}", sqlite3_errmsg(db_));
            }
        }

        Result<void> begin()
        {
            BOOST_OUTCOME_TRY(execute(db_, "BEGIN"));
            open_ = true;
            return outcome::success();
        }

        Result<void> commit()
        {
            BOOST_OUTCOME_TRY(execute(db_, "COMMIT"));
            open_ = false;
            return outcome::success();
        }
    };

    Result<std::optional<uint64_t>>
    select_optional_u64(sqlite3 *const db, char const *const sql)
    {
        BOOST_OUTCOME_TRY(auto const stmt, prepare(db, sql));
        BOOST_OUTCOME_TRY(auto const has_row, step(db, stmt.get()));
        if (!has_row || sqlite3_column_type(stmt.get(), 0) == SQLITE_NULL) {
            return std::optional<uint64_t>{};
        }
        return std::optional<uint64_t>{column_u64(stmt.get(), 0)};
    }

    Result<void> insert_marks(
        sqlite3 *const db, CheckpointId const id,
        std::set<uint64_t> const &marks)
    {
        BOOST_OUTCOME_TRY(
            auto const stmt,
            prepare(
                db,
                "INSERT INTO commitment_tree_checkpoint_marks_removed "
                "(checkpoint_id, position) VALUES (?1, ?2)"));
        for (auto const position : marks) {
            BOOST_OUTCOME_TRY(bind_int64(db, stmt.get(), 1, id));
            BOOST_OUTCOME_TRY(bind_int64(db, stmt.get(), 2, position));
            BOOST_OUTCOME_TRY(step_done(db, stmt.get()));
            sqlite3_reset(stmt.get());
        }
        return outcome::success();
    }

    Result<void> delete_marks(sqlite3 *const db, CheckpointId const id)
    {
        BOOST_OUTCOME_TRY(
            auto const stmt,
            prepare(
                db,
                "DELETE FROM commitment_tree_checkpoint_marks_removed "
                "WHERE checkpoint_id = ?1"));
        BOOST_OUTCOME_TRY(bind_int64(db, stmt.get(), 1, id));
        return step_done(db, stmt.get());
    }

    Result<Checkpoint> load_checkpoint(
        sqlite3 *const db, CheckpointId const id,
        std::optional<uint64_t> const position)
    {
        BOOST_OUTCOME_TRY(
            auto const stmt,
            prepare(
                db,
                "SELECT position FROM commitment_tree_checkpoint_marks_removed "
                "WHERE checkpoint_id = ?1"));
        BOOST_OUTCOME_TRY(bind_int64(db, stmt.get(), 1, id));
        Checkpoint checkpoint{.position = position, .marks_removed = {}};
        for (;;) {
            BOOST_OUTCOME_TRY(auto const has_row, step(db, stmt.get()));
            if (!has_row) {
                break;
            }
            checkpoint.marks_removed.insert(column_u64(stmt.get(), 0));
        }
        return checkpoint;
    }
}

void connection_deleter::operator()(sqlite3 *const db) const noexcept
{
    if (sqlite3_close(db) != SQLITE_OK) {
        LOG_ERROR("sqlite close failed: {}", sqlite3_errmsg(db));
    }
}

Result<connection_ptr> open_connection(std::string const &path)
{
    sqlite3 *db = nullptr;
    int const rc = sqlite3_open(path.c_str(), &db);
    connection_ptr conn{db};
    if (rc != SQLITE_OK) {
        LOG_ERROR(
            "failed to open sqlite database {}: {}",
            path,
            db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
        return CommitmentTreeError::storage_error;
    }
    return conn;
}

SqliteShardStore::SqliteShardStore(connection_ptr conn)
    : holder_{std::move(conn)}
{
}

SqliteShardStore::SqliteShardStore(std::shared_ptr<SharedConnection> conn)
    : holder_{std::move(conn)}
{
}

Result<std::unique_ptr<SqliteShardStore>>
SqliteShardStore::open(connection_ptr conn)
{
    BOOST_OUTCOME_TRY(execute(conn.get(), CREATE_TABLES));
    return std::unique_ptr<SqliteShardStore>{
        new SqliteShardStore{std::move(conn)}};
}

Result<std::unique_ptr<SqliteShardStore>>
SqliteShardStore::open_shared(std::shared_ptr<SharedConnection> conn)
{
    {
        std::lock_guard const lock{conn->mutex};
        BOOST_OUTCOME_TRY(execute(conn->db.get(), CREATE_TABLES));
    }
    return std::unique_ptr<SqliteShardStore>{
        new SqliteShardStore{std::move(conn)}};
}

Result<std::optional<Tree>> SqliteShardStore::get_shard(uint64_t const index)
{
    using R = std::optional<Tree>;
    return with_connection([&](sqlite3 *const db) -> Result<R> {
        BOOST_OUTCOME_TRY(
            auto const stmt,
            prepare(
                db,
                "SELECT shard_data FROM commitment_tree_shards "
                "WHERE shard_index = ?1"));
        BOOST_OUTCOME_TRY(bind_int64(db, stmt.get(), 1, index));
        BOOST_OUTCOME_TRY(auto const has_row, step(db, stmt.get()));
        if (!has_row) {
            return R{};
        }
        BOOST_OUTCOME_TRY(
            auto shard, deserialize_tree(column_blob(stmt.get(), 0)));
        return R{std::move(shard)};
    });
}

Result<void>
SqliteShardStore::put_shard(uint64_t const index, Tree const &shard)
{
    auto const data = serialize_tree(shard);
    return with_connection([&](sqlite3 *const db) -> Result<void> {
        BOOST_OUTCOME_TRY(
            auto const stmt,
            prepare(
                db,
                "INSERT OR REPLACE INTO commitment_tree_shards "
                "(shard_index, shard_data) VALUES (?1, ?2)"));
        BOOST_OUTCOME_TRY(bind_int64(db, stmt.get(), 1, index));
        BOOST_OUTCOME_TRY(bind_blob(db, stmt.get(), 2, data));
        return step_done(db, stmt.get());
    });
}

Result<std::optional<uint64_t>> SqliteShardStore::last_shard_index()
{
    return with_connection([](sqlite3 *const db) {
        return select_optional_u64(
            db, "SELECT MAX(shard_index) FROM commitment_tree_shards");
    });
}

Result<std::vector<uint64_t>> SqliteShardStore::shard_indices()
{
    return with_connection(
        [](sqlite3 *const db) -> Result<std::vector<uint64_t>> {
            BOOST_OUTCOME_TRY(
                auto const stmt,
                prepare(
                    db,
                    "SELECT shard_index FROM commitment_tree_shards "
                    "ORDER BY shard_index"));
            std::vector<uint64_t> out;
            for (;;) {
                BOOST_OUTCOME_TRY(auto const has_row, step(db, stmt.get()));
                if (!has_row) {
                    break;
                }
                out.push_back(column_u64(stmt.get(), 0));
            }
            return out;
        });
}

Result<Tree> SqliteShardStore::get_cap()
{
    return with_connection([](sqlite3 *const db) -> Result<Tree> {
        BOOST_OUTCOME_TRY(
            auto const stmt,
            prepare(
                db, "SELECT cap_data FROM commitment_tree_cap WHERE id = 0"));
        BOOST_OUTCOME_TRY(auto const has_row, step(db, stmt.get()));
        if (!has_row) {
            return make_nil();
        }
        return deserialize_tree(column_blob(stmt.get(), 0));
    });
}

Result<void> SqliteShardStore::put_cap(Tree const &cap)
{
    auto const data = serialize_tree(cap);
    return with_connection([&](sqlite3 *const db) -> Result<void> {
        BOOST_OUTCOME_TRY(
            auto const stmt,
            prepare(
                db,
                "INSERT OR REPLACE INTO commitment_tree_cap (id, cap_data) "
                "VALUES (0, ?1)"));
        BOOST_OUTCOME_TRY(bind_blob(db, stmt.get(), 1, data));
        return step_done(db, stmt.get());
    });
}

Result<void> SqliteShardStore::add_checkpoint(
    CheckpointId const id, Checkpoint const &checkpoint)
{
    return with_connection([&](sqlite3 *const db) -> Result<void> {
        Transaction tx{db};
        BOOST_OUTCOME_TRY(tx.begin());
        BOOST_OUTCOME_TRY(
            auto const stmt,
            prepare(
                db,
                "INSERT INTO commitment_tree_checkpoints "
                "(checkpoint_id, position) VALUES (?1, ?2)"));
        BOOST_OUTCOME_TRY(bind_int64(db, stmt.get(), 1, id));
        BOOST_OUTCOME_TRY(
            bind_position(db, stmt.get(), 2, checkpoint.position));
        BOOST_OUTCOME_TRY(step_done(db, stmt.get()));
        BOOST_OUTCOME_TRY(insert_marks(db, id, checkpoint.marks_removed));
        return tx.commit();
    });
}

Result<size_t> SqliteShardStore::checkpoint_count()
{
    return with_connection([](sqlite3 *const db) -> Result<size_t> {
        BOOST_OUTCOME_TRY(
            auto const count,
            select_optional_u64(
                db, "SELECT COUNT(*) FROM commitment_tree_checkpoints"));
        return static_cast<size_t>(count.value_or(0));
    });
}

Result<std::optional<CheckpointId>> SqliteShardStore::min_checkpoint_id()
{
    return with_connection(
        [](sqlite3 *const db) -> Result<std::optional<CheckpointId>> {
            BOOST_OUTCOME_TRY(
                auto const id,
                select_optional_u64(
                    db,
                    "SELECT MIN(checkpoint_id) FROM "
                    "commitment_tree_checkpoints"));
            if (!id.has_value()) {
                return std::optional<CheckpointId>{};
            }
            return std::optional<CheckpointId>{
                static_cast<CheckpointId>(*id)};
        });
}

Result<std::optional<CheckpointId>> SqliteShardStore::max_checkpoint_id()
{
    return with_connection(
        [](sqlite3 *const db) -> Result<std::optional<CheckpointId>> {
            BOOST_OUTCOME_TRY(
                auto const id,
                select_optional_u64(
                    db,
                    "SELECT MAX(checkpoint_id) FROM "
                    "commitment_tree_checkpoints"));
            if (!id.has_value()) {
                return std::optional<CheckpointId>{};
            }
            return std::optional<CheckpointId>{
                static_cast<CheckpointId>(*id)};
        });
}

Result<std::optional<Checkpoint>>
SqliteShardStore::get_checkpoint(CheckpointId const id)
{
    return with_connection(
        [&](sqlite3 *const db) -> Result<std::optional<Checkpoint>> {
            BOOST_OUTCOME_TRY(
                auto const stmt,
                prepare(
                    db,
                    "SELECT position FROM commitment_tree_checkpoints "
                    "WHERE checkpoint_id = ?1"));
            BOOST_OUTCOME_TRY(bind_int64(db, stmt.get(), 1, id));
            BOOST_OUTCOME_TRY(auto const has_row, step(db, stmt.get()));
            if (!has_row) {
                return std::optional<Checkpoint>{};
            }
            BOOST_OUTCOME_TRY(
                auto checkpoint,
                load_checkpoint(db, id, column_position(stmt.get(), 0)));
            return std::optional<Checkpoint>{std::move(checkpoint)};
        });
}

Result<std::optional<std::pair<CheckpointId, Checkpoint>>>
SqliteShardStore::get_checkpoint_at_depth(size_t const depth)
{
    using R = std::optional<std::pair<CheckpointId, Checkpoint>>;
    return with_connection([&](sqlite3 *const db) -> Result<R> {
        BOOST_OUTCOME_TRY(
            auto const stmt,
            prepare(
                db,
                "SELECT checkpoint_id, position FROM "
                "commitment_tree_checkpoints ORDER BY checkpoint_id DESC "
                "LIMIT 1 OFFSET ?1"));
        BOOST_OUTCOME_TRY(bind_int64(db, stmt.get(), 1, depth));
        BOOST_OUTCOME_TRY(auto const has_row, step(db, stmt.get()));
        if (!has_row) {
            return R{};
        }
        auto const id = static_cast<CheckpointId>(column_u64(stmt.get(), 0));
        BOOST_OUTCOME_TRY(
            auto checkpoint,
            load_checkpoint(db, id, column_position(stmt.get(), 1)));
        return R{std::in_place, id, std::move(checkpoint)};
    });
}

Result<bool> SqliteShardStore::update_checkpoint(
    CheckpointId const id, Checkpoint const &checkpoint)
{
    return with_connection([&](sqlite3 *const db) -> Result<bool> {
        Transaction tx{db};
        BOOST_OUTCOME_TRY(tx.begin());
        BOOST_OUTCOME_TRY(
            auto const stmt,
            prepare(
                db,
                "UPDATE commitment_tree_checkpoints SET position = ?1 "
                "WHERE checkpoint_id = ?2"));
        BOOST_OUTCOME_TRY(
            bind_position(db, stmt.get(), 1, checkpoint.position));
        BOOST_OUTCOME_TRY(bind_int64(db, stmt.get(), 2, id));
        BOOST_OUTCOME_TRY(step_done(db, stmt.get()));
        if (sqlite3_changes(db) == 0) {
            return false;
        }
        BOOST_OUTCOME_TRY(delete_marks(db, id));
        BOOST_OUTCOME_TRY(insert_marks(db, id, checkpoint.marks_removed));
        BOOST_OUTCOME_TRY(tx.commit());
        return true;
    });
}

Result<void> SqliteShardStore::remove_checkpoint(CheckpointId const id)
{
    return with_connection([&](sqlite3 *const db) -> Result<void> {
        Transaction tx{db};
        BOOST_OUTCOME_TRY(tx.begin());
        BOOST_OUTCOME_TRY(delete_marks(db, id));
        BOOST_OUTCOME_TRY(
            auto const stmt,
            prepare(
                db,
                "DELETE FROM commitment_tree_checkpoints "
                "WHERE checkpoint_id = ?1"));
        BOOST_OUTCOME_TRY(bind_int64(db, stmt.get(), 1, id));
        BOOST_OUTCOME_TRY(step_done(db, stmt.get()));
        return tx.commit();
    });
}

GROVEDB_COMMITMENT_TREE_NAMESPACE_END
