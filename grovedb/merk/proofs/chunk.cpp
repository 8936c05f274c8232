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

#include <grovedb/merk/proofs/chunk.hpp>

#include <grovedb/core/assert.h>
#include <grovedb/core/bytes.hpp>
#include <grovedb/core/error.hpp>
#include <grovedb/core/hex_literal.hpp>
#include <grovedb/costs/cost_context.hpp>
#include <grovedb/costs/operation_cost.hpp>
#include <grovedb/merk/link.hpp>
#include <grovedb/merk/merk.hpp>
#include <grovedb/merk/proofs/node.hpp>
#include <grovedb/merk/proofs/op.hpp>
#include <grovedb/merk/proofs/query.hpp>
#include <grovedb/merk/proofs/tree.hpp>
#include <grovedb/merk/tree_node.hpp>

#include <quill/Quill.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

GROVEDB_MERK_NAMESPACE_BEGIN

Result<BinaryRange> BinaryRange::make(size_t const start, size_t const end)
{
    if (start > end || start < 1) {
        LOG_ERROR("invalid chunk range [{}, {}]", start, end);
        return Error::chunk_internal;
    }
    return BinaryRange{start, end};
}

std::optional<bool> BinaryRange::which_half(size_t const value) const noexcept
{
    if (value < start_ || value > end_ || odd()) {
        return std::nullopt;
    }
    return value < start_ + len() / 2 ? LEFT : RIGHT;
}

Result<BinaryRange> BinaryRange::half(bool const left) const
{
    if (odd()) {
        return Error::chunk_internal;
    }
    size_t const second_start = start_ + len() / 2;
    return left ? BinaryRange{start_, second_start - 1}
                : BinaryRange{second_start, end_};
}

Result<std::pair<BinaryRange, size_t>> BinaryRange::advance_start() const
{
    if (start_ == end_) {
        return Error::chunk_internal;
    }
    return std::pair{BinaryRange{start_ + 1, end_}, start_};
}

std::vector<size_t> chunk_height_per_layer(size_t const height)
{
    return std::vector<size_t>((height + 1) / 2, 2);
}

namespace
{
    size_t number_of_chunks_internal(std::span<size_t const> const layers)
    {
        // every chunk but those of the last layer has 2^h exits
        size_t total = 1;
        size_t layer_count = 1;
        for (size_t i = 0; i + 1 < layers.size(); ++i) {
            layer_count *= size_t{1} << layers[i];
            total += layer_count;
        }
        return total;
    }

    CostResult<void> build_chunk(
        Merk const &merk, TreeNode const &node, size_t const remaining,
        std::vector<Op> &out)
    {
        OperationCost cost;
        // children at the depth limit are shown by their hash only
        auto const emit_child = [&](bool const left) -> CostResult<void> {
            OperationCost c;
            auto const *link = node.link(left);
            if (remaining == 1) {
                out.push_back(Op::push(Node::make_hash(link->hash())));
                return {outcome::success(), c};
            }
            std::unique_ptr<TreeNode> holder;
            auto const *child = GROVEDB_COST_TRY(c, merk.walk(node, left, holder));
            GROVEDB_COST_TRY(c, build_chunk(merk, *child, remaining - 1, out));
            return {outcome::success(), c};
        };

        bool const has_left = node.link(LEFT) != nullptr;
        bool const has_right = node.link(RIGHT) != nullptr;
        if (has_left) {
            GROVEDB_COST_TRY(cost, emit_child(LEFT));
        }
        auto const ft = GROVEDB_COST_TRY_NO_ADD(cost, proof_feature_type(node));
        out.push_back(Op::push(Node::make_kv_value_hash_feature_type(
            node.key(), node.value(), node.value_hash(), ft)));
        if (has_left) {
            out.push_back(Op::parent());
        }
        if (has_right) {
            GROVEDB_COST_TRY(cost, emit_child(RIGHT));
            out.push_back(Op::child());
        }
        return {outcome::success(), cost};
    }

    Result<Node> kv_hash_node(TreeNode const &node)
    {
        if (!is_provable_count(node.feature_type().tag)) {
            return Node::make_kv_hash(node.kv_hash());
        }
        BOOST_OUTCOME_TRY(auto const aggregate, node.aggregate_data());
        return Node::make_kv_hash_count(node.kv_hash(), aggregate.count);
    }

    CostResult<void> build_height_proof(
        Merk const &merk, TreeNode const &node, std::vector<Op> &out)
    {
        OperationCost cost;
        std::unique_ptr<TreeNode> holder;
        auto const *left = GROVEDB_COST_TRY(cost, merk.walk(node, LEFT, holder));
        if (left) {
            GROVEDB_COST_TRY(cost, build_height_proof(merk, *left, out));
        }
        auto node_op = GROVEDB_COST_TRY_NO_ADD(cost, kv_hash_node(node));
        out.push_back(Op::push(std::move(node_op)));
        if (left) {
            out.push_back(Op::parent());
        }
        if (auto const *right = node.link(RIGHT)) {
            out.push_back(Op::push(Node::make_hash(right->hash())));
            out.push_back(Op::child());
        }
        return {outcome::success(), cost};
    }
}

size_t number_of_chunks(size_t const height)
{
    return number_of_chunks_internal(chunk_height_per_layer(height));
}

Result<size_t>
number_of_chunks_under_chunk_id(size_t const height, size_t const chunk_id)
{
    BOOST_OUTCOME_TRY(auto const layer, chunk_layer(height, chunk_id));
    auto const layers = chunk_height_per_layer(height);
    return number_of_chunks_internal(std::span{layers}.subspan(layer));
}

Result<std::vector<bool>>
generate_traversal_instruction(size_t const height, size_t const chunk_id)
{
    std::vector<bool> instructions;
    size_t const total = number_of_chunks(height);
    if (chunk_id < 1 || chunk_id > total) {
        LOG_ERROR("chunk id {} out of bounds [1, {}]", chunk_id, total);
        return Error::chunk_out_of_bounds;
    }
    BOOST_OUTCOME_TRY(auto range, BinaryRange::make(1, total));
    // one chunk plus an even number below it, so the range starts odd
    while (range.len() > 1) {
        if (range.odd()) {
            BOOST_OUTCOME_TRY(auto const advanced, range.advance_start());
            range = advanced.first;
            if (advanced.second == chunk_id) {
                return instructions;
            }
        }
        else {
            auto const side = range.which_half(chunk_id);
            if (!side.has_value()) {
                return Error::chunk_internal;
            }
            instructions.push_back(*side);
            BOOST_OUTCOME_TRY(auto const next, range.half(*side));
            range = next;
        }
    }
    return instructions;
}

std::string traversal_instruction_as_string(std::vector<bool> const &instruction)
{
    std::string out;
    out.reserve(instruction.size());
    for (bool const left : instruction) {
        out.push_back(left ? '1' : '0');
    }
    return out;
}

Result<size_t> chunk_layer(size_t const height, size_t const chunk_id)
{
    BOOST_OUTCOME_TRY(
        auto const instructions,
        generate_traversal_instruction(height, chunk_id));
    auto const layers = chunk_height_per_layer(height);
    size_t remaining_depth = instructions.size() + 1;
    size_t layer = 1;
    while (remaining_depth > 1) {
        // chunks start on layer boundaries
        if (layer > layers.size() || remaining_depth <= layers[layer - 1]) {
            return Error::chunk_internal;
        }
        remaining_depth -= layers[layer - 1];
        ++layer;
    }
    return layer - 1;
}

Result<size_t> chunk_height(size_t const height, size_t const chunk_id)
{
    BOOST_OUTCOME_TRY(auto const layer, chunk_layer(height, chunk_id));
    auto const layers = chunk_height_per_layer(height);
    if (layer >= layers.size()) {
        return Error::chunk_internal;
    }
    return layers[layer];
}

CostResult<std::vector<Op>>
create_chunk(Merk const &merk, TreeNode const &node, size_t const depth)
{
    OperationCost cost;
    std::vector<Op> out;
    if (depth == 0) {
        auto const h = GROVEDB_COST_TRY(cost, node.hash());
        out.push_back(Op::push(Node::make_hash(h)));
        return {std::move(out), cost};
    }
    GROVEDB_COST_TRY(cost, build_chunk(merk, node, depth, out));
    return {std::move(out), cost};
}

CostResult<std::vector<Op>> traverse_and_build_chunk(
    Merk const &merk, std::vector<bool> const &instructions,
    size_t const depth)
{
    OperationCost cost;
    TreeNode const *node = merk.root();
    if (!node) {
        if (!instructions.empty()) {
            return {Error::chunk_bad_instruction, cost};
        }
        return {std::vector<Op>{}, cost};
    }
    std::unique_ptr<TreeNode> holder;
    for (bool const left : instructions) {
        node = GROVEDB_COST_TRY(cost, merk.walk(*node, left, holder));
        if (!node) {
            LOG_ERROR(
                "no node at traversal instruction {}",
                traversal_instruction_as_string(instructions));
            return {Error::chunk_bad_instruction, cost};
        }
    }
    return create_chunk(merk, *node, depth).add_cost(cost);
}

CostResult<std::vector<Op>>
create_chunk_by_id(Merk const &merk, size_t const chunk_id)
{
    size_t const height = merk.height();
    auto const instructions = generate_traversal_instruction(height, chunk_id);
    if (instructions.has_error()) {
        return {instructions.as_failure(), OperationCost{}};
    }
    auto const depth = chunk_height(height, chunk_id);
    if (depth.has_error()) {
        return {depth.as_failure(), OperationCost{}};
    }
    return traverse_and_build_chunk(merk, instructions.value(), depth.value());
}

CostResult<std::vector<Op>> generate_height_proof(Merk const &merk)
{
    OperationCost cost;
    std::vector<Op> out;
    if (auto const *root = merk.root()) {
        GROVEDB_COST_TRY(cost, build_height_proof(merk, *root, out));
    }
    return {std::move(out), cost};
}

Result<size_t> verify_height_proof(
    std::span<Op const> const proof, bytes32_t const &expected_root)
{
    auto executed = execute(proof, false);
    BOOST_OUTCOME_TRY(auto const tree, std::move(executed.value));
    if (tree->hash().value != expected_root) {
        LOG_ERROR("height proof does not match the expected root");
        return Error::invalid_proof;
    }
    size_t height = 1;
    ProofTree const *node = tree.get();
    while (auto const *left = node->child(LEFT)) {
        auto const kind = left->tree->node().kind;
        if (kind != NodeKind::kv_hash && kind != NodeKind::kv_hash_count) {
            LOG_ERROR("height proof has a {} on its left spine", left->tree->node().to_string());
            return Error::invalid_proof;
        }
        node = left->tree.get();
        ++height;
    }
    return height;
}

GROVEDB_MERK_NAMESPACE_END
