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

#include <grovedb/merk/proofs/branch.hpp>

#include <grovedb/core/byte_string.hpp>
#include <grovedb/core/bytes.hpp>
#include <grovedb/core/error.hpp>
#include <grovedb/core/hex_literal.hpp>
#include <grovedb/costs/cost_context.hpp>
#include <grovedb/costs/operation_cost.hpp>
#include <grovedb/merk/merk.hpp>
#include <grovedb/merk/proofs/chunk.hpp>
#include <grovedb/merk/proofs/node.hpp>
#include <grovedb/merk/proofs/tree.hpp>
#include <grovedb/merk/tree_node.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

GROVEDB_MERK_NAMESPACE_BEGIN

std::vector<uint8_t>
calculate_chunk_depths(uint8_t const tree_depth, uint8_t const max_depth)
{
    if (tree_depth == 0) {
        return {0};
    }
    if (tree_depth <= max_depth || max_depth == 0) {
        return {tree_depth};
    }
    unsigned const chunks = (tree_depth + max_depth - 1u) / max_depth;
    unsigned const base = tree_depth / chunks;
    unsigned const remainder = tree_depth % chunks;
    std::vector<uint8_t> depths;
    depths.reserve(chunks);
    for (unsigned i = 0; i < chunks; ++i) {
        depths.push_back(static_cast<uint8_t>(i < remainder ? base + 1 : base));
    }
    return depths;
}

std::vector<uint8_t> calculate_chunk_depths_with_minimum(
    uint8_t const tree_depth, uint8_t const max_depth, uint8_t const min_depth)
{
    uint8_t const floor = std::min(min_depth, max_depth);
    auto depths = calculate_chunk_depths(tree_depth, max_depth);
    if (depths.front() >= floor) {
        return depths;
    }
    if (tree_depth <= floor) {
        return {floor};
    }
    auto rest = calculate_chunk_depths(
        static_cast<uint8_t>(tree_depth - floor), max_depth);
    rest.insert(rest.begin(), floor);
    return rest;
}

namespace
{
    bool is_hash(ProofChild const *const child) noexcept
    {
        return child && child->tree->node().kind == NodeKind::hash;
    }

    void collect_terminal_keys(
        ProofTree const &tree, std::vector<byte_string> &keys)
    {
        auto const *left = tree.child(true);
        auto const *right = tree.child(false);
        if ((is_hash(left) || is_hash(right)) && tree.key()) {
            keys.push_back(*tree.key());
        }
        if (left && !is_hash(left)) {
            collect_terminal_keys(*left->tree, keys);
        }
        if (right && !is_hash(right)) {
            collect_terminal_keys(*right->tree, keys);
        }
    }

    std::optional<byte_string>
    trace_key(ProofTree const &root, byte_string_view const target)
    {
        ProofTree const *tree = &root;
        while (tree->key()) {
            auto const order = target.compare(*tree->key());
            if (order == 0) {
                return std::nullopt;
            }
            auto const *child = tree->child(order < 0);
            if (!child) {
                return std::nullopt;
            }
            if (is_hash(child)) {
                return *tree->key();
            }
            tree = child->tree.get();
        }
        return std::nullopt;
    }

    void collect_hash_depths(
        ProofTree const &tree, size_t const depth, std::vector<size_t> &out)
    {
        if (tree.node().kind == NodeKind::hash) {
            out.push_back(depth);
        }
        for (bool const left : {true, false}) {
            if (auto const *c = tree.child(left)) {
                collect_hash_depths(*c->tree, depth + 1, out);
            }
        }
    }

    Result<std::unique_ptr<ProofTree>> execute_plain(std::vector<Op> const &proof)
    {
        auto executed = execute(proof, false);
        return std::move(executed.value);
    }

    std::vector<byte_string> terminal_keys_of(std::vector<Op> const &proof)
    {
        std::vector<byte_string> keys;
        auto tree = execute_plain(proof);
        if (tree.has_value()) {
            collect_terminal_keys(*tree.value(), keys);
        }
        return keys;
    }

    std::optional<byte_string>
    trace_in(std::vector<Op> const &proof, byte_string_view const key)
    {
        auto tree = execute_plain(proof);
        if (tree.has_error()) {
            return std::nullopt;
        }
        return trace_key(*tree.value(), key);
    }

    Result<std::unique_ptr<ProofTree>>
    execute_against(std::vector<Op> const &proof, bytes32_t const &expected)
    {
        BOOST_OUTCOME_TRY(auto tree, execute_plain(proof));
        if (tree->hash().value != expected) {
            LOG_ERROR(
                "chunk proof does not match the expected hash {}",
                to_hex(to_byte_string_view(expected)));
            return Error::invalid_proof;
        }
        return tree;
    }
}

std::vector<byte_string> TrunkQueryResult::terminal_node_keys() const
{
    return terminal_keys_of(proof);
}

std::optional<byte_string>
TrunkQueryResult::trace_key_to_terminal(byte_string_view const key) const
{
    return trace_in(proof, key);
}

Result<void> TrunkQueryResult::verify_terminal_nodes_at_expected_depth() const
{
    size_t const expected = chunk_depths.empty() ? 0 : chunk_depths.front();
    BOOST_OUTCOME_TRY(auto const tree, execute_plain(proof));
    std::vector<size_t> depths;
    collect_hash_depths(*tree, 0, depths);
    for (size_t const depth : depths) {
        if (depth != expected) {
            LOG_ERROR(
                "trunk hashes a subtree at depth {} instead of {}",
                depth,
                expected);
            return Error::invalid_proof;
        }
    }
    return outcome::success();
}

Result<std::unique_ptr<ProofTree>>
TrunkQueryResult::verify(bytes32_t const &expected_root) const
{
    return execute_against(proof, expected_root);
}

std::vector<byte_string> BranchQueryResult::terminal_node_keys() const
{
    return terminal_keys_of(proof);
}

std::optional<byte_string>
BranchQueryResult::trace_key_to_terminal(byte_string_view const key) const
{
    return trace_in(proof, key);
}

Result<std::unique_ptr<ProofTree>> BranchQueryResult::verify() const
{
    return execute_against(proof, branch_root_hash);
}

CostResult<TrunkQueryResult>
trunk_query(Merk const &merk, ChunkOptions const &options)
{
    OperationCost cost;
    TrunkQueryResult out;
    auto const *root = merk.root();
    if (!root) {
        out.chunk_depths = {0};
        return {std::move(out), cost};
    }
    auto const aggregate = GROVEDB_COST_TRY_NO_ADD(cost, merk.aggregate_data());
    out.tree_depth = has_count(aggregate.tag) ? max_avl_height(aggregate.count)
                                              : merk.height();
    uint8_t const max_depth = std::max<uint8_t>(options.max_depth, 1);
    out.chunk_depths =
        options.min_depth.has_value()
            ? calculate_chunk_depths_with_minimum(
                  out.tree_depth, max_depth, *options.min_depth)
            : calculate_chunk_depths(out.tree_depth, max_depth);
    out.proof =
        GROVEDB_COST_TRY(cost, create_chunk(merk, *root, out.chunk_depths.front()));
    return {std::move(out), cost};
}

CostResult<BranchQueryResult>
branch_query(Merk const &merk, byte_string_view const key, uint8_t const depth)
{
    OperationCost cost;
    std::unique_ptr<TreeNode> holder;
    auto const *node = GROVEDB_COST_TRY(cost, merk.find(key, holder));
    if (!node) {
        LOG_ERROR("branch root {} is not in the tree", to_hex(key));
        return {Error::path_key_not_found, cost};
    }
    uint8_t const d = std::max<uint8_t>(depth, 1);
    BranchQueryResult out{
        .branch_root_key = node->key(),
        .returned_depth = std::min(d, node->height())};
    out.branch_root_hash = GROVEDB_COST_TRY(cost, node->hash());
    out.proof = GROVEDB_COST_TRY(cost, create_chunk(merk, *node, d));
    return {std::move(out), cost};
}

GROVEDB_MERK_NAMESPACE_END
