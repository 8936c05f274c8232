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

#include <grovedb/query/config.hpp>

#include <grovedb/core/byte_string.hpp>
#include <grovedb/core/result.hpp>
#include <grovedb/query/query_item.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

GROVEDB_QUERY_NAMESPACE_BEGIN

using Path = std::vector<byte_string>;

// upper bound on decoded conditional branches per query level
inline constexpr size_t MAX_CONDITIONAL_SUBQUERY_BRANCHES = 1024;

// upper bound on subquery nesting accepted by decode and max_depth
inline constexpr uint8_t MAX_QUERY_RECURSION = 255;

inline constexpr uint8_t QUERY_ENCODING_VERSION = 1;

struct Query;

/// What to query below a matched key: descend through `subquery_path`,
/// then run `subquery` there. With a path but no subquery the last path
/// segment is itself the selected key.
struct SubqueryBranch
{
    std::optional<Path> subquery_path;
    std::unique_ptr<Query> subquery;

    SubqueryBranch();
    SubqueryBranch(std::optional<Path>, std::unique_ptr<Query>);
    SubqueryBranch(SubqueryBranch const &);
    SubqueryBranch(SubqueryBranch &&) noexcept;
    SubqueryBranch &operator=(SubqueryBranch const &);
    SubqueryBranch &operator=(SubqueryBranch &&) noexcept;
    ~SubqueryBranch();

    bool is_empty() const noexcept
    {
        return !subquery_path.has_value() && !subquery;
    }

    std::optional<uint16_t> max_depth_internal(uint8_t recursion_limit) const;

    bool operator==(SubqueryBranch const &) const;
};

using ConditionalSubqueryBranches =
    std::vector<std::pair<QueryItem, SubqueryBranch>>;

using TerminalKey = std::pair<Path, byte_string>;

struct Query
{
    // sorted, non overlapping
    std::vector<QueryItem> items{};
    SubqueryBranch default_subquery_branch{};
    // insertion ordered; the first branch whose item contains a key wins
    ConditionalSubqueryBranches conditional_subquery_branches{};
    bool left_to_right{true};
    bool add_parent_tree_on_subquery{false};

    static Query new_single_key(byte_string key);
    static Query new_single_query_item(QueryItem item);
    static Query new_range_full();

    void insert_key(byte_string key);
    void insert_keys(std::vector<byte_string> keys);
    void insert_all();

    /// Inserts `item`, merging it with every item it collides with
    void insert_item(QueryItem item);

    void set_subquery(Query subquery);
    void set_subquery_key(byte_string key);
    void set_subquery_path(Path path);

    void add_conditional_subquery(
        QueryItem item, std::optional<Path> subquery_path,
        std::optional<Query> subquery);

    /// Folds `other` into this query: items are merged and branches are
    /// combined so that every key selects what either query selected
    void merge_with(Query other);

    bool has_subquery() const noexcept
    {
        return !default_subquery_branch.is_empty() ||
               !conditional_subquery_branches.empty();
    }

    bool has_subquery_on_key(byte_string_view key, bool in_path) const;
    bool
    has_subquery_or_subquery_path_on_key(byte_string_view key, bool in_path) const;

    /// The branch that applies below `key`, if any
    SubqueryBranch const *subquery_branch_for_key(byte_string_view key) const;

    /// Appends every (path, key) the query resolves to below
    /// `current_path`, failing on unbounded ranges or when more than
    /// `max_results` keys would be produced. Returns the count added.
    Result<size_t> terminal_keys(
        Path const &current_path, size_t max_results,
        std::vector<TerminalKey> &result) const;

    /// Subquery nesting depth, counting this level; empty when nested
    /// deeper than the recursion limit
    std::optional<uint16_t> max_depth() const;
    std::optional<uint16_t> max_depth_internal(uint8_t recursion_limit) const;

    size_t size() const noexcept
    {
        return items.size();
    }

    bool empty() const noexcept
    {
        return items.empty();
    }

    byte_string encode() const;
    static Result<Query> decode(byte_string_view enc);

    std::string to_string() const;

    bool operator==(Query const &) const = default;
};

struct SizedQuery
{
    Query query;
    std::optional<uint16_t> limit{};
};

struct PathQuery
{
    Path path;
    SizedQuery query;

    static PathQuery new_unsized(Path path, Query query)
    {
        return {.path = std::move(path), .query = {.query = std::move(query)}};
    }

    static PathQuery new_single_key(Path path, byte_string key)
    {
        return new_unsized(std::move(path), Query::new_single_key(std::move(key)));
    }
};

GROVEDB_QUERY_NAMESPACE_END
