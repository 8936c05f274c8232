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

#include <grovedb/commitment_tree/commitment_tree.hpp>

#include <grovedb/commitment_tree/commitment_tree_error.hpp>
#include <grovedb/commitment_tree/merkle_hash.hpp>
#include <grovedb/core/blake3.hpp>
#include <grovedb/core/codec.hpp>
#include <grovedb/storage/storage_context.hpp>

#include <quill/Quill.h>

#include <utility>

GROVEDB_COMMITMENT_TREE_NAMESPACE_BEGIN

namespace
{
    constexpr unsigned char STATE_ROOT_TAG[] = {
        'c', 't', '_', 's', 't', 'a', 't', 'e'};

    byte_string_view data_key() noexcept
    {
        return {COMMITMENT_TREE_DATA_KEY, sizeof(COMMITMENT_TREE_DATA_KEY)};
    }
}

bytes32_t compute_commitment_tree_state_root(
    bytes32_t const &sinsemilla_root, bytes32_t const &bulk_state_root)
{
    return Blake3Hasher{}
        .update(byte_string_view{STATE_ROOT_TAG, sizeof(STATE_ROOT_TAG)})
        .update(sinsemilla_root)
        .update(bulk_state_root)
        .finalize();
}

Result<CommitmentTree> CommitmentTree::create(
    uint8_t const chunk_power, MerkleHasher const &hasher)
{
    BOOST_OUTCOME_TRY(
        auto bulk, bulk_append::BulkAppendTree::create(chunk_power));
    return CommitmentTree{CommitmentFrontier{hasher}, std::move(bulk)};
}

CostResult<CommitmentTree> CommitmentTree::open(
    storage::StorageContext &ctx, uint64_t const total_count,
    uint8_t const chunk_power, MerkleHasher const &hasher)
{
    OperationCost cost;
    auto bulk = GROVEDB_COST_TRY(
        cost, bulk_append::BulkAppendTree::load(ctx, total_count, chunk_power));
    auto const data = GROVEDB_COST_TRY(cost, ctx.get(data_key()));
    CommitmentFrontier frontier{hasher};
    if (data.has_value()) {
        frontier = GROVEDB_COST_TRY_NO_ADD(
            cost, CommitmentFrontier::deserialize(*data, hasher));
    }
    if (frontier.tree_size() != total_count) {
        LOG_ERROR(
            "frontier holds {} notes, bulk tree holds {}",
            frontier.tree_size(),
            total_count);
        return {CommitmentTreeError::invalid_data, cost};
    }
    return {CommitmentTree{std::move(frontier), std::move(bulk)}, cost};
}

CostResult<CommitmentAppendResult> CommitmentTree::append(
    storage::StorageContext &ctx, bytes32_t const &cmx,
    byte_string_view const payload)
{
    OperationCost cost;
    // reject before touching either structure so they never diverge
    if (!is_canonical(cmx)) {
        return {CommitmentTreeError::invalid_field_element, cost};
    }
    if (payload.size() != CIPHERTEXT_PAYLOAD_SIZE) {
        LOG_ERROR(
            "ciphertext payload is {} bytes, expected {}",
            payload.size(),
            CIPHERTEXT_PAYLOAD_SIZE);
        return {CommitmentTreeError::invalid_payload_size, cost};
    }

    byte_string record;
    record.reserve(sizeof(cmx.bytes) + payload.size());
    append_bytes32(record, cmx);
    record.append(payload);
    auto const appended = GROVEDB_COST_TRY(cost, bulk_.append(ctx, record));
    auto const sinsemilla_root =
        GROVEDB_COST_TRY(cost, frontier_.append(cmx));
    GROVEDB_COST_TRY(cost, save(ctx));

    cost.hash_node_calls += 1;
    return {
        CommitmentAppendResult{
            .sinsemilla_root = sinsemilla_root,
            .bulk_state_root = appended.state_root,
            .state_root = compute_commitment_tree_state_root(
                sinsemilla_root, appended.state_root),
            .global_position = appended.global_position,
            .hash_count = appended.hash_count,
            .compacted = appended.compacted},
        cost};
}

CostResult<void> CommitmentTree::save(storage::StorageContext &ctx) const
{
    return ctx.put(data_key(), frontier_.serialize());
}

CostResult<bytes32_t>
CommitmentTree::state_root(storage::StorageContext &ctx) const
{
    OperationCost cost;
    auto const bulk_root = GROVEDB_COST_TRY(cost, bulk_.state_root(ctx));
    cost.hash_node_calls += 1;
    return {
        compute_commitment_tree_state_root(frontier_.root_hash(), bulk_root),
        cost};
}

CostResult<std::optional<byte_string>> CommitmentTree::get_value(
    storage::StorageContext &ctx, uint64_t const position) const
{
    return bulk_.get_value(ctx, position);
}

CostResult<CommitmentTreeProof> CommitmentTreeProof::generate(
    CommitmentTree const &tree, query::Query const &query,
    storage::StorageContext &ctx)
{
    OperationCost cost;
    auto bulk_proof = GROVEDB_COST_TRY(
        cost, bulk_append::BulkAppendProof::generate(tree.bulk(), query, ctx));
    return {CommitmentTreeProof{tree.root_hash(), std::move(bulk_proof)}, cost};
}

Result<bulk_append::PositionedValues> CommitmentTreeProof::verify_against_query(
    bytes32_t const &expected_state_root, uint8_t const chunk_power,
    uint64_t const total_count, query::Query const &query) const
{
    auto const computed =
        bulk_proof_.verify_and_compute_root(chunk_power, total_count);
    if (computed.has_error()) {
        LOG_ERROR(
            "commitment tree bulk proof failed: {}",
            computed.error().message().c_str());
        return CommitmentTreeError::invalid_proof;
    }
    auto const &bulk_root = computed.value().first;
    if (compute_commitment_tree_state_root(sinsemilla_root_, bulk_root) !=
        expected_state_root) {
        LOG_ERROR("commitment tree proof does not match the state root");
        return CommitmentTreeError::invalid_proof;
    }
    return bulk_proof_.verify_against_query(
        bulk_root, chunk_power, total_count, query);
}

byte_string CommitmentTreeProof::encode() const
{
    byte_string out;
    append_bytes32(out, sinsemilla_root_);
    out.append(bulk_proof_.encode());
    return out;
}

Result<CommitmentTreeProof> CommitmentTreeProof::decode(byte_string_view enc)
{
    auto const root = consume_bytes32(enc);
    if (root.has_error()) {
        return CommitmentTreeError::invalid_data;
    }
    BOOST_OUTCOME_TRY(auto bulk, bulk_append::BulkAppendProof::decode(enc));
    return CommitmentTreeProof{root.value(), std::move(bulk)};
}

GROVEDB_COMMITMENT_TREE_NAMESPACE_END
