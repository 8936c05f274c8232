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

#include <grovedb/query/query.hpp>

#include <grovedb/core/bincode.hpp>
#include <grovedb/core/codec.hpp>
#include <grovedb/core/error.hpp>
#include <grovedb/core/hex_literal.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <set>

GROVEDB_QUERY_NAMESPACE_BEGIN

namespace
{
    void encode_query(byte_string &out, Query const &query);

    void encode_path(byte_string &out, Path const &path)
    {
        bincode::append_varint(out, path.size());
        for (auto const &segment : path) {
            bincode::append_varint(out, segment.size());
            out += segment;
        }
    }

    void encode_branch(byte_string &out, SubqueryBranch const &branch)
    {
        out.push_back(branch.subquery_path.has_value() ? 1 : 0);
        if (branch.subquery_path.has_value()) {
            encode_path(out, *branch.subquery_path);
        }
        out.push_back(branch.subquery ? 1 : 0);
        if (branch.subquery) {
            encode_query(out, *branch.subquery);
        }
    }

    void encode_query(byte_string &out, Query const &query)
    {
        bincode::append_varint(out, query.items.size());
        for (auto const &item : query.items) {
            item.encode(out);
        }
        encode_branch(out, query.default_subquery_branch);
        bincode::append_varint(out, query.conditional_subquery_branches.size());
        for (auto const &[item, branch] : query.conditional_subquery_branches) {
            item.encode(out);
            encode_branch(out, branch);
        }
        out.push_back(query.left_to_right ? 1 : 0);
        out.push_back(query.add_parent_tree_on_subquery ? 1 : 0);
    }

    Result<bool> consume_flag(byte_string_view &enc)
    {
        BOOST_OUTCOME_TRY(auto const b, consume_byte(enc));
        if (b > 1) {
            return Error::corrupted_data;
        }
        return b == 1;
    }

    // every encoded element takes at least one byte, which bounds counts
    Result<size_t> consume_count(byte_string_view &enc)
    {
        BOOST_OUTCOME_TRY(auto const n, bincode::consume_varint(enc));
        if (n > enc.size()) {
            return Error::corrupted_data;
        }
        return static_cast<size_t>(n);
    }

    Result<Path> decode_path(byte_string_view &enc)
    {
        BOOST_OUTCOME_TRY(auto const n, consume_count(enc));
        Path path;
        path.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            BOOST_OUTCOME_TRY(auto const len, consume_count(enc));
            BOOST_OUTCOME_TRY(auto const segment, consume_bytes(enc, len));
            path.emplace_back(segment);
        }
        return path;
    }

    Result<Query> decode_query(byte_string_view &enc, uint8_t depth_left);

    Result<SubqueryBranch>
    decode_branch(byte_string_view &enc, uint8_t const depth_left)
    {
        SubqueryBranch branch;
        BOOST_OUTCOME_TRY(auto const has_path, consume_flag(enc));
        if (has_path) {
            BOOST_OUTCOME_TRY(auto path, decode_path(enc));
            branch.subquery_path = std::move(path);
        }
        BOOST_OUTCOME_TRY(auto const has_subquery, consume_flag(enc));
        if (has_subquery) {
            if (depth_left == 0) {
                LOG_ERROR("query nested deeper than {}", MAX_QUERY_RECURSION);
                return Error::invalid_input;
            }
            BOOST_OUTCOME_TRY(auto subquery, decode_query(enc, depth_left - 1));
            branch.subquery = std::make_unique<Query>(std::move(subquery));
        }
        return branch;
    }

    Result<Query> decode_query(byte_string_view &enc, uint8_t const depth_left)
    {
        Query query;
        BOOST_OUTCOME_TRY(auto const n_items, consume_count(enc));
        query.items.reserve(n_items);
        for (size_t i = 0; i < n_items; ++i) {
            BOOST_OUTCOME_TRY(auto item, QueryItem::decode(enc));
            query.items.push_back(std::move(item));
        }
        BOOST_OUTCOME_TRY(
            auto default_branch, decode_branch(enc, depth_left));
        query.default_subquery_branch = std::move(default_branch);
        BOOST_OUTCOME_TRY(auto const n_branches, consume_count(enc));
        if (n_branches > MAX_CONDITIONAL_SUBQUERY_BRANCHES) {
            LOG_ERROR(
                "query has {} conditional subquery branches, at most {} "
                "allowed",
                n_branches,
                MAX_CONDITIONAL_SUBQUERY_BRANCHES);
            return Error::invalid_input;
        }
        query.conditional_subquery_branches.reserve(n_branches);
        for (size_t i = 0; i < n_branches; ++i) {
            BOOST_OUTCOME_TRY(auto item, QueryItem::decode(enc));
            BOOST_OUTCOME_TRY(auto branch, decode_branch(enc, depth_left));
            query.conditional_subquery_branches.emplace_back(
                std::move(item), std::move(branch));
        }
        BOOST_OUTCOME_TRY(auto const left_to_right, consume_flag(enc));
        BOOST_OUTCOME_TRY(auto const add_parent, consume_flag(enc));
        query.left_to_right = left_to_right;
        query.add_parent_tree_on_subquery = add_parent;
        return query;
    }

    std::string path_to_string(Path const &path)
    {
        std::string s = "[";
        for (size_t i = 0; i < path.size(); ++i) {
            if (i > 0) {
                s += ", ";
            }
            s += to_hex(path[i]);
        }
        return s + "]";
    }

    std::string branch_to_string(SubqueryBranch const &branch)
    {
        std::string s = "{";
        if (branch.subquery_path.has_value()) {
            s += " path: " + path_to_string(*branch.subquery_path);
        }
        if (branch.subquery) {
            s += " subquery: " + branch.subquery->to_string();
        }
        return s + " }";
    }

    // Appends the terminal key a subquery path selects on its own
    Result<void> push_path_terminal(
        Path path, byte_string key, Path const &subquery_path,
        std::vector<TerminalKey> &result)
    {
        if (subquery_path.empty()) {
            LOG_ERROR("subquery path set but empty");
            return Error::invalid_input;
        }
        path.push_back(std::move(key));
        path.insert(path.end(), subquery_path.begin(), subquery_path.end() - 1);
        result.emplace_back(std::move(path), subquery_path.back());
        return outcome::success();
    }
}

SubqueryBranch::SubqueryBranch() = default;

SubqueryBranch::SubqueryBranch(
    std::optional<Path> subquery_path, std::unique_ptr<Query> subquery)
    : subquery_path{std::move(subquery_path)}
    , subquery{std::move(subquery)}
{
}

SubqueryBranch::SubqueryBranch(SubqueryBranch const &other)
    : subquery_path{other.subquery_path}
    , subquery{
          other.subquery ? std::make_unique<Query>(*other.subquery) : nullptr}
{
}

SubqueryBranch::SubqueryBranch(SubqueryBranch &&) noexcept = default;

SubqueryBranch &SubqueryBranch::operator=(SubqueryBranch const &other)
{
    if (this != &other) {
        subquery_path = other.subquery_path;
        subquery =
            other.subquery ? std::make_unique<Query>(*other.subquery) : nullptr;
    }
    return *this;
}

SubqueryBranch &SubqueryBranch::operator=(SubqueryBranch &&) noexcept = default;

SubqueryBranch::~SubqueryBranch() = default;

bool SubqueryBranch::operator==(SubqueryBranch const &other) const
{
    if (subquery_path != other.subquery_path) {
        return false;
    }
    if (!subquery || !other.subquery) {
        return !subquery && !other.subquery;
    }
    return *subquery == *other.subquery;
}

std::optional<uint16_t>
SubqueryBranch::max_depth_internal(uint8_t const recursion_limit) const
{
    if (recursion_limit == 0) {
        return std::nullopt;
    }
    uint32_t depth = 0;
    if (subquery_path.has_value()) {
        depth = static_cast<uint32_t>(
            std::min<size_t>(subquery_path->size(), UINT32_MAX));
    }
    if (subquery) {
        auto const sub = subquery->max_depth_internal(
            static_cast<uint8_t>(recursion_limit - 1));
        if (!sub.has_value()) {
            return std::nullopt;
        }
        depth += *sub;
    }
    if (depth > UINT16_MAX) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(depth);
}

Query Query::new_single_key(byte_string key)
{
    return new_single_query_item(QueryItem::key(std::move(key)));
}

Query Query::new_single_query_item(QueryItem item)
{
    Query query;
    query.items.push_back(std::move(item));
    return query;
}

Query Query::new_range_full()
{
    return new_single_query_item(QueryItem::range_full());
}

void Query::insert_key(byte_string key)
{
    insert_item(QueryItem::key(std::move(key)));
}

void Query::insert_keys(std::vector<byte_string> keys)
{
    for (auto &key : keys) {
        insert_key(std::move(key));
    }
}

void Query::insert_all()
{
    insert_item(QueryItem::range_full());
}

void Query::insert_item(QueryItem item)
{
    std::erase_if(items, [&item](QueryItem const &ours) {
        if (!ours.collides_with(item)) {
            return false;
        }
        item = item.merge(ours);
        return true;
    });
    auto const pos = std::lower_bound(items.begin(), items.end(), item);
    items.insert(pos, std::move(item));
}

void Query::set_subquery(Query subquery)
{
    default_subquery_branch.subquery =
        std::make_unique<Query>(std::move(subquery));
}

void Query::set_subquery_key(byte_string key)
{
    default_subquery_branch.subquery_path = Path{std::move(key)};
}

void Query::set_subquery_path(Path path)
{
    default_subquery_branch.subquery_path = std::move(path);
}

void Query::add_conditional_subquery(
    QueryItem item, std::optional<Path> subquery_path,
    std::optional<Query> subquery)
{
    SubqueryBranch branch{
        std::move(subquery_path),
        subquery.has_value() ? std::make_unique<Query>(std::move(*subquery))
                             : nullptr};
    for (auto &[existing, existing_branch] : conditional_subquery_branches) {
        if (existing == item) {
            existing_branch = std::move(branch);
            return;
        }
    }
    conditional_subquery_branches.emplace_back(
        std::move(item), std::move(branch));
}

void Query::merge_with(Query other)
{
    // their default branch keeps applying to their own items only
    if (!(default_subquery_branch == other.default_subquery_branch)) {
        if (default_subquery_branch.is_empty() && items.empty()) {
            default_subquery_branch = std::move(other.default_subquery_branch);
        }
        else if (
            default_subquery_branch.subquery_path ==
                other.default_subquery_branch.subquery_path &&
            default_subquery_branch.subquery &&
            other.default_subquery_branch.subquery) {
            default_subquery_branch.subquery->merge_with(
                std::move(*other.default_subquery_branch.subquery));
        }
        else if (!other.default_subquery_branch.is_empty()) {
            for (auto const &item : other.items) {
                conditional_subquery_branches.emplace_back(
                    item, other.default_subquery_branch);
            }
        }
    }

    for (auto &item : other.items) {
        insert_item(std::move(item));
    }

    for (auto &[item, branch] : other.conditional_subquery_branches) {
        auto const it = std::find_if(
            conditional_subquery_branches.begin(),
            conditional_subquery_branches.end(),
            [&item](auto const &entry) { return entry.first == item; });
        if (it == conditional_subquery_branches.end()) {
            conditional_subquery_branches.emplace_back(
                std::move(item), std::move(branch));
        }
        else if (
            it->second.subquery_path == branch.subquery_path &&
            it->second.subquery && branch.subquery) {
            it->second.subquery->merge_with(std::move(*branch.subquery));
        }
        else {
            it->second = std::move(branch);
        }
    }
}

bool Query::has_subquery_on_key(
    byte_string_view const key, bool const in_path) const
{
    if (in_path || default_subquery_branch.subquery) {
        return true;
    }
    for (auto const &[item, branch] : conditional_subquery_branches) {
        if (item.contains(key)) {
            return branch.subquery != nullptr;
        }
    }
    return false;
}

bool Query::has_subquery_or_subquery_path_on_key(
    byte_string_view const key, bool const in_path) const
{
    if (in_path || !default_subquery_branch.is_empty()) {
        return true;
    }
    return std::any_of(
        conditional_subquery_branches.begin(),
        conditional_subquery_branches.end(),
        [key](auto const &entry) { return entry.first.contains(key); });
}

SubqueryBranch const *
Query::subquery_branch_for_key(byte_string_view const key) const
{
    for (auto const &[item, branch] : conditional_subquery_branches) {
        if (item.contains(key)) {
            return &branch;
        }
    }
    if (default_subquery_branch.is_empty()) {
        return nullptr;
    }
    return &default_subquery_branch;
}

Result<size_t> Query::terminal_keys(
    Path const &current_path, size_t const max_results,
    std::vector<TerminalKey> &result) const
{
    size_t current_len = result.size();
    size_t added = 0;
    std::set<byte_string> already_added;

    auto const descend = [&](byte_string key,
                             SubqueryBranch const *branch) -> Result<void> {
        Path path = current_path;
        if (branch && branch->subquery_path.has_value()) {
            if (branch->subquery) {
                path.push_back(std::move(key));
                path.insert(
                    path.end(),
                    branch->subquery_path->begin(),
                    branch->subquery_path->end());
                BOOST_OUTCOME_TRY(
                    auto const n,
                    branch->subquery->terminal_keys(path, max_results, result));
                added += n;
                current_len += n;
                return outcome::success();
            }
            if (current_len == max_results) {
                LOG_ERROR(
                    "terminal keys limit {} exceeded by a subquery path",
                    max_results);
                return Error::request_amount_exceeded;
            }
            BOOST_OUTCOME_TRY(push_path_terminal(
                std::move(path), std::move(key), *branch->subquery_path, result));
            ++added;
            ++current_len;
            return outcome::success();
        }
        if (branch && branch->subquery) {
            path.push_back(std::move(key));
            BOOST_OUTCOME_TRY(
                auto const n,
                branch->subquery->terminal_keys(path, max_results, result));
            added += n;
            current_len += n;
            return outcome::success();
        }
        if (branch) {
            // a conditional branch without path or subquery selects nothing
            return outcome::success();
        }
        if (current_len == max_results) {
            LOG_ERROR("terminal keys limit {} exceeded", max_results);
            return Error::request_amount_exceeded;
        }
        result.emplace_back(std::move(path), std::move(key));
        ++added;
        ++current_len;
        return outcome::success();
    };

    for (auto const &[item, branch] : conditional_subquery_branches) {
        if (item.is_unbounded_range()) {
            LOG_ERROR(
                "terminal keys over conditional unbounded range {}",
                item.to_string());
            return Error::not_supported;
        }
        BOOST_OUTCOME_TRY(auto keys, item.keys());
        for (auto &key : keys) {
            if (current_len > max_results) {
                LOG_ERROR("terminal keys limit {} exceeded", max_results);
                return Error::request_amount_exceeded;
            }
            already_added.insert(key);
            BOOST_OUTCOME_TRY(descend(std::move(key), &branch));
        }
    }

    SubqueryBranch const *const default_branch =
        default_subquery_branch.is_empty() ? nullptr : &default_subquery_branch;
    for (auto const &item : items) {
        if (item.is_unbounded_range()) {
            LOG_ERROR(
                "terminal keys over unbounded range {}", item.to_string());
            return Error::not_supported;
        }
        BOOST_OUTCOME_TRY(auto keys, item.keys());
        for (auto &key : keys) {
            if (already_added.contains(key)) {
                continue;
            }
            if (current_len > max_results) {
                LOG_ERROR("terminal keys limit {} exceeded", max_results);
                return Error::request_amount_exceeded;
            }
            BOOST_OUTCOME_TRY(descend(std::move(key), default_branch));
        }
    }
    return added;
}

std::optional<uint16_t> Query::max_depth() const
{
    return max_depth_internal(MAX_QUERY_RECURSION);
}

std::optional<uint16_t>
Query::max_depth_internal(uint8_t const recursion_limit) const
{
    auto const default_depth =
        default_subquery_branch.max_depth_internal(recursion_limit);
    if (!default_depth.has_value()) {
        return std::nullopt;
    }
    uint16_t deepest = *default_depth;
    for (auto const &[item, branch] : conditional_subquery_branches) {
        auto const depth = branch.max_depth_internal(recursion_limit);
        if (!depth.has_value()) {
            return std::nullopt;
        }
        deepest = std::max(deepest, *depth);
    }
    if (deepest == UINT16_MAX) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(deepest + 1);
}

byte_string Query::encode() const
{
    byte_string out;
    out.push_back(QUERY_ENCODING_VERSION);
    encode_query(out, *this);
    return out;
}

Result<Query> Query::decode(byte_string_view enc)
{
    BOOST_OUTCOME_TRY(auto const version, consume_byte(enc));
    if (version != QUERY_ENCODING_VERSION) {
        LOG_ERROR("unknown query encoding version {}", version);
        return Error::version_mismatch;
    }
    BOOST_OUTCOME_TRY(auto query, decode_query(enc, MAX_QUERY_RECURSION));
    if (!enc.empty()) {
        LOG_ERROR("{} trailing bytes after query", enc.size());
        return Error::corrupted_data;
    }
    return query;
}

std::string Query::to_string() const
{
    std::string s = "Query { items: [";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            s += ", ";
        }
        s += items[i].to_string();
    }
    s += "]";
    if (!default_subquery_branch.is_empty()) {
        s += ", default: " + branch_to_string(default_subquery_branch);
    }
    for (auto const &[item, branch] : conditional_subquery_branches) {
        s += ", if " + item.to_string() + ": " + branch_to_string(branch);
    }
    s += left_to_right ? ", left_to_right }" : ", right_to_left }";
    return s;
}

GROVEDB_QUERY_NAMESPACE_END
