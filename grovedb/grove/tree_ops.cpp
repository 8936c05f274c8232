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

#include <grovedb/grove/grove_db.hpp>

#include <grovedb/bulk_append/proof.hpp>
#include <grovedb/bulk_append/tree.hpp>
#include <grovedb/commitment_tree/commitment_tree.hpp>
#include <grovedb/core/byte_string.hpp>
#include <grovedb/core/bytes.hpp>
#include <grovedb/core/error.hpp>
#include <grovedb/core/hex_literal.hpp>
#include <grovedb/costs/operation_cost.hpp>
#include <grovedb/element/element.hpp>
#include <grovedb/grove/path.hpp>
#include <grovedb/mmr/helper.hpp>
#include <grovedb/mmr/mmr.hpp>
#include <grovedb/mmr/mmr_tree_proof.hpp>
#include <grovedb/mmr/node.hpp>
#include <grovedb/mmr/store.hpp>

#include <quill/Quill.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <utility>
#include <variant>

GROVEDB_NAMESPACE_BEGIN

template <class T>
CostResult<std::pair<std::unique_ptr<GroveDb::Subtree>, Element>>
GroveDb::open_tree_element(Path const &path, byte_string_view const key)
{
    OperationCost cost;
    auto parent = GROVEDB_COST_TRY(cost, open_subtree(path));
    auto element = GROVEDB_COST_TRY(cost, get_from(*parent, key));
    if (!std::holds_alternative<T>(element.data)) {
        LOG_ERROR(
            "unexpected {} at {} / {}",
            element_type_name(element.type()),
            path_to_string(path),
            to_hex(key));
        return {Error::wrong_element_type, cost};
    }
    return {std::pair{std::move(parent), std::move(element)}, cost};
}

CostResult<MmrAppendResult> GroveDb::mmr_tree_append(
    Path const &path, byte_string_view const key, byte_string value)
{
    OperationCost cost;
    auto [parent, element] = GROVEDB_COST_TRY(
        cost, open_tree_element<Element::MmrTree>(path, key));
    auto &tree = std::get<Element::MmrTree>(element.data);

    auto const ctx = storage_.context_for_path(child_path(path, key));
    mmr::StorageMmrStore store{*ctx};
    mmr::Mmr range{tree.mmr_size, store};
    uint64_t const leaf_index = range.leaf_count();
    GROVEDB_COST_TRY(cost, range.push(mmr::MmrNode::leaf(std::move(value))));
    GROVEDB_COST_TRY(cost, range.commit());
    auto const root = GROVEDB_COST_TRY(cost, range.get_root());

    tree.mmr_root = root.hash();
    tree.mmr_size = range.mmr_size();
    GROVEDB_COST_TRY(
        cost, replace_tree_element(*parent, key, element, tree.mmr_root));
    return {
        MmrAppendResult{.mmr_root = tree.mmr_root, .leaf_index = leaf_index},
        cost};
}

CostResult<bytes32_t>
GroveDb::mmr_tree_root_hash(Path const &path, byte_string_view const key)
{
    OperationCost cost;
    auto const [parent, element] = GROVEDB_COST_TRY(
        cost, open_tree_element<Element::MmrTree>(path, key));
    return {std::get<Element::MmrTree>(element.data).mmr_root, cost};
}

CostResult<uint64_t>
GroveDb::mmr_tree_leaf_count(Path const &path, byte_string_view const key)
{
    OperationCost cost;
    auto const [parent, element] = GROVEDB_COST_TRY(
        cost, open_tree_element<Element::MmrTree>(path, key));
    return {
        mmr::mmr_size_to_leaf_count(
            std::get<Element::MmrTree>(element.data).mmr_size),
        cost};
}

CostResult<std::optional<byte_string>> GroveDb::mmr_tree_get_value(
    Path const &path, byte_string_view const key, uint64_t const leaf_index)
{
    OperationCost cost;
    auto const [parent, element] = GROVEDB_COST_TRY(
        cost, open_tree_element<Element::MmrTree>(path, key));
    auto const &tree = std::get<Element::MmrTree>(element.data);
    if (leaf_index >= mmr::mmr_size_to_leaf_count(tree.mmr_size)) {
        return {std::optional<byte_string>{}, cost};
    }

    auto const ctx = storage_.context_for_path(child_path(path, key));
    mmr::StorageMmrStore store{*ctx};
    auto const node = GROVEDB_COST_TRY(
        cost, store.element_at_position(mmr::leaf_index_to_pos(leaf_index)));
    if (!node.has_value() || !node->value().has_value()) {
        LOG_ERROR(
            "mmr leaf {} missing at {} / {}",
            leaf_index,
            path_to_string(path),
            to_hex(key));
        return {Error::corrupted_data, cost};
    }
    return {node->value(), cost};
}

CostResult<mmr::MmrTreeProof> GroveDb::prove_mmr_tree_leaves(
    Path const &path, byte_string_view const key,
    std::span<uint64_t const> const leaf_indices)
{
    OperationCost cost;
    auto const [parent, element] = GROVEDB_COST_TRY(
        cost, open_tree_element<Element::MmrTree>(path, key));
    auto const mmr_size = std::get<Element::MmrTree>(element.data).mmr_size;

    auto const ctx = storage_.context_for_path(child_path(path, key));
    mmr::StorageMmrStore store{*ctx};
    OperationCost read_cost;
    mmr::GetNodeFn const get_node =
        [&store, &read_cost](
            uint64_t const pos) -> Result<std::optional<mmr::MmrNode>> {
        return store.element_at_position(pos).unwrap_add_cost(read_cost);
    };
    auto proof = mmr::MmrTreeProof::generate(mmr_size, leaf_indices, get_node);
    cost += read_cost;
    return {std::move(proof), cost};
}

CostResult<bulk_append::AppendResult> GroveDb::bulk_append(
    Path const &path, byte_string_view const key, byte_string_view const value)
{
    OperationCost cost;
    auto [parent, element] = GROVEDB_COST_TRY(
        cost, open_tree_element<Element::BulkAppendTree>(path, key));
    auto &desc = std::get<Element::BulkAppendTree>(element.data);

    auto const ctx = storage_.context_for_path(child_path(path, key));
    auto tree = GROVEDB_COST_TRY(
        cost,
        bulk_append::BulkAppendTree::load(
            *ctx, desc.total_count, desc.chunk_power));
    auto const appended = GROVEDB_COST_TRY(cost, tree.append(*ctx, value));

    desc.state_root = appended.state_root;
    desc.total_count = tree.total_count();
    GROVEDB_COST_TRY(
        cost, replace_tree_element(*parent, key, element, desc.state_root));
    return {appended, cost};
}

CostResult<std::optional<byte_string>> GroveDb::bulk_get_value(
    Path const &path, byte_string_view const key, uint64_t const position)
{
    OperationCost cost;
    auto const [parent, element] = GROVEDB_COST_TRY(
        cost, open_tree_element<Element::BulkAppendTree>(path, key));
    auto const &desc = std::get<Element::BulkAppendTree>(element.data);
    auto const ctx = storage_.context_for_path(child_path(path, key));
    auto const tree = GROVEDB_COST_TRY(
        cost,
        bulk_append::BulkAppendTree::load(
            *ctx, desc.total_count, desc.chunk_power));
    return tree.get_value(*ctx, position).add_cost(cost);
}

CostResult<std::optional<byte_string>> GroveDb::bulk_get_chunk(
    Path const &path, byte_string_view const key, uint64_t const chunk_index)
{
    OperationCost cost;
    auto const [parent, element] = GROVEDB_COST_TRY(
        cost, open_tree_element<Element::BulkAppendTree>(path, key));
    auto const &desc = std::get<Element::BulkAppendTree>(element.data);
    auto const ctx = storage_.context_for_path(child_path(path, key));
    auto const tree = GROVEDB_COST_TRY(
        cost,
        bulk_append::BulkAppendTree::load(
            *ctx, desc.total_count, desc.chunk_power));
    return tree.get_chunk_value(*ctx, chunk_index).add_cost(cost);
}

CostResult<uint64_t>
GroveDb::bulk_count(Path const &path, byte_string_view const key)
{
    OperationCost cost;
    auto const [parent, element] = GROVEDB_COST_TRY(
        cost, open_tree_element<Element::BulkAppendTree>(path, key));
    return {std::get<Element::BulkAppendTree>(element.data).total_count, cost};
}

CostResult<bulk_append::BulkAppendProof> GroveDb::prove_bulk_append_query(
    Path const &path, byte_string_view const key, query::Query const &query)
{
    OperationCost cost;
    auto const [parent, element] = GROVEDB_COST_TRY(
        cost, open_tree_element<Element::BulkAppendTree>(path, key));
    auto const &desc = std::get<Element::BulkAppendTree>(element.data);
    auto const ctx = storage_.context_for_path(child_path(path, key));
    auto const tree = GROVEDB_COST_TRY(
        cost,
        bulk_append::BulkAppendTree::load(
            *ctx, desc.total_count, desc.chunk_power));
    return bulk_append::BulkAppendProof::generate(tree, query, *ctx)
        .add_cost(cost);
}

CostResult<commitment_tree::CommitmentAppendResult>
GroveDb::commitment_tree_append(
    Path const &path, byte_string_view const key, bytes32_t const &cmx,
    byte_string_view const payload)
{
    OperationCost cost;
    auto [parent, element] = GROVEDB_COST_TRY(
        cost, open_tree_element<Element::CommitmentTree>(path, key));
    auto &desc = std::get<Element::CommitmentTree>(element.data);

    auto const ctx = storage_.context_for_path(child_path(path, key));
    auto tree = GROVEDB_COST_TRY(
        cost,
        commitment_tree::CommitmentTree::open(
            *ctx, desc.total_count, desc.chunk_power));
    auto const appended =
        GROVEDB_COST_TRY(cost, tree.append(*ctx, cmx, payload));

    desc.state_root = appended.state_root;
    desc.total_count = tree.total_count();
    GROVEDB_COST_TRY(
        cost, replace_tree_element(*parent, key, element, desc.state_root));
    return {appended, cost};
}

CostResult<bytes32_t>
GroveDb::commitment_tree_anchor(Path const &path, byte_string_view const key)
{
    OperationCost cost;
    auto const [parent, element] = GROVEDB_COST_TRY(
        cost, open_tree_element<Element::CommitmentTree>(path, key));
    auto const &desc = std::get<Element::CommitmentTree>(element.data);
    auto const ctx = storage_.context_for_path(child_path(path, key));
    auto const tree = GROVEDB_COST_TRY(
        cost,
        commitment_tree::CommitmentTree::open(
            *ctx, desc.total_count, desc.chunk_power));
    return {tree.root_hash(), cost};
}

CostResult<std::optional<byte_string>> GroveDb::commitment_tree_get_value(
    Path const &path, byte_string_view const key, uint64_t const position)
{
    OperationCost cost;
    auto const [parent, element] = GROVEDB_COST_TRY(
        cost, open_tree_element<Element::CommitmentTree>(path, key));
    auto const &desc = std::get<Element::CommitmentTree>(element.data);
    auto const ctx = storage_.context_for_path(child_path(path, key));
    auto const tree = GROVEDB_COST_TRY(
        cost,
        commitment_tree::CommitmentTree::open(
            *ctx, desc.total_count, desc.chunk_power));
    return tree.get_value(*ctx, position).add_cost(cost);
}

CostResult<commitment_tree::CommitmentTreeProof>
GroveDb::prove_commitment_tree_query(
    Path const &path, byte_string_view const key, query::Query const &query)
{
    OperationCost cost;
    auto const [parent, element] = GROVEDB_COST_TRY(
        cost, open_tree_element<Element::CommitmentTree>(path, key));
    auto const &desc = std::get<Element::CommitmentTree>(element.data);
    auto const ctx = storage_.context_for_path(child_path(path, key));
    auto const tree = GROVEDB_COST_TRY(
        cost,
        commitment_tree::CommitmentTree::open(
            *ctx, desc.total_count, desc.chunk_power));
    return commitment_tree::CommitmentTreeProof::generate(tree, query, *ctx)
        .add_cost(cost);
}

GROVEDB_NAMESPACE_END
