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

#include <grovedb/dense_tree/tree.hpp>

#include <grovedb/core/blake3.hpp>
#include <grovedb/dense_tree/dense_tree_error.hpp>

#include <quill/Quill.h>

GROVEDB_DENSE_TREE_NAMESPACE_BEGIN

Result<DenseFixedSizedMerkleTree>
DenseFixedSizedMerkleTree::create(uint8_t const height)
{
    BOOST_OUTCOME_TRY(validate_height(height));
    return DenseFixedSizedMerkleTree{height, 0};
}

Result<DenseFixedSizedMerkleTree> DenseFixedSizedMerkleTree::from_state(
    uint8_t const height, uint16_t const count)
{
    BOOST_OUTCOME_TRY(validate_height(height));
    if (count > capacity_for_height(height)) {
        LOG_ERROR(
            "dense tree count {} exceeds capacity {} for height {}",
            count,
            capacity_for_height(height),
            height);
        return DenseTreeError::invalid_data;
    }
    return DenseFixedSizedMerkleTree{height, count};
}

CostResult<DenseInsertResult> DenseFixedSizedMerkleTree::insert(
    byte_string_view const value, DenseTreeStore &store)
{
    OperationCost cost;
    auto inserted = GROVEDB_COST_TRY(cost, try_insert(value, store));
    if (!inserted.has_value()) {
        LOG_ERROR("dense tree of capacity {} is full", capacity());
        return {DenseTreeError::tree_full, cost};
    }
    return {*inserted, cost};
}

CostResult<std::optional<DenseInsertResult>>
DenseFixedSizedMerkleTree::try_insert(
    byte_string_view const value, DenseTreeStore &store)
{
    OperationCost cost;
    if (is_full()) {
        return {std::optional<DenseInsertResult>{}, cost};
    }
    uint16_t const position = count_;
    GROVEDB_COST_TRY(cost, store.put_value(position, value));
    ++count_;
    auto root = root_hash(store);
    cost += root.cost;
    if (root.value.has_error()) {
        --count_;
        return {std::move(root.value).as_failure(), cost};
    }
    return {
        std::optional<DenseInsertResult>{
            DenseInsertResult{root.value.value(), position}},
        cost};
}

CostResult<std::optional<byte_string>> DenseFixedSizedMerkleTree::get(
    uint16_t const position, DenseTreeStore &store) const
{
    OperationCost cost;
    if (position >= count_) {
        return {std::optional<byte_string>{}, cost};
    }
    auto value = GROVEDB_COST_TRY(cost, store.get_value(position));
    if (!value.has_value()) {
        LOG_ERROR(
            "dense tree value at position {} is missing (count {})",
            position,
            count_);
        return {DenseTreeError::store_error, cost};
    }
    return {std::move(value), cost};
}

CostResult<bytes32_t>
DenseFixedSizedMerkleTree::root_hash(DenseTreeStore &store) const
{
    if (count_ == 0) {
        return {EMPTY_NODE_HASH, OperationCost{}};
    }
    return hash_node(0, store);
}

CostResult<bytes32_t> DenseFixedSizedMerkleTree::hash_position(
    uint16_t const position, DenseTreeStore &store) const
{
    return hash_node(position, store);
}

CostResult<bytes32_t> DenseFixedSizedMerkleTree::hash_node(
    uint16_t const position, DenseTreeStore &store) const
{
    OperationCost cost;
    if (position >= capacity() || position >= count_) {
        return {EMPTY_NODE_HASH, cost};
    }
    auto const value = GROVEDB_COST_TRY(cost, get(position, store));
    if (position >= first_leaf()) {
        cost.hash_node_calls += 1;
        return {leaf_node_hash(*value), cost};
    }
    // positions stay below capacity, so children fit in 32 bits
    uint32_t const left = 2 * uint32_t{position} + 1;
    auto const left_hash = GROVEDB_COST_TRY(
        cost, hash_node(static_cast<uint16_t>(left), store));
    auto const right_hash = GROVEDB_COST_TRY(
        cost, hash_node(static_cast<uint16_t>(left + 1), store));
    cost.hash_node_calls += 2;
    return {internal_node_hash(blake3(*value), left_hash, right_hash), cost};
}

GROVEDB_DENSE_TREE_NAMESPACE_END
