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

#include <grovedb/bulk_append/proof.hpp>

#include <grovedb/bulk_append/bulk_append_error.hpp>
#include <grovedb/bulk_append/chunk.hpp>
#include <grovedb/core/bincode.hpp>
#include <grovedb/core/codec.hpp>
#include <grovedb/core/hex_literal.hpp>
#include <grovedb/dense_tree/hash.hpp>
#include <grovedb/dense_tree/position_ranges.hpp>
#include <grovedb/storage/storage_context.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <set>
#include <vector>

GROVEDB_BULK_APPEND_NAMESPACE_BEGIN

namespace
{
    using dense_tree::PositionRanges;

    Result<PositionRanges>
    query_positions(query::Query const &query, uint64_t const total_count)
    {
        auto ranges = dense_tree::query_to_ranges(query, total_count);
        if (ranges.has_error()) {
            return BulkAppendError::invalid_input;
        }
        return std::move(ranges).value();
    }

    /// Values of the proven chunks and buffer entries accepted by `keep`
    template <class Keep>
    Result<PositionedValues>
    collect_values(BulkAppendProofResult const &result, Keep const &keep)
    {
        uint64_t const buffer_start =
            (result.total_count >> result.chunk_power) << result.chunk_power;
        PositionedValues values;
        for (auto const &[chunk, blob] : result.chunk_blobs) {
            auto entries = deserialize_chunk_blob(blob);
            if (entries.has_error()) {
                LOG_ERROR("proven chunk {} does not deserialize", chunk);
                return BulkAppendError::corrupted_data;
            }
            uint64_t pos = chunk << result.chunk_power;
            for (auto &entry : entries.value()) {
                if (keep(pos)) {
                    values.emplace_back(pos, std::move(entry));
                }
                ++pos;
            }
        }
        for (auto const &[pos, value] : result.buffer_entries) {
            if (keep(buffer_start + pos)) {
                values.emplace_back(buffer_start + pos, value);
            }
        }
        std::ranges::sort(values, {}, &PositionedValues::value_type::first);
        return values;
    }
}

Result<PositionedValues> BulkAppendProofResult::values_in_range(
    uint64_t const start, uint64_t const end) const
{
    return collect_values(*this, [&](uint64_t const pos) {
        return pos >= start && pos < end;
    });
}

CostResult<BulkAppendProof> BulkAppendProof::generate(
    uint64_t const total_count, uint8_t const chunk_power,
    query::Query const &query, dense_tree::DenseTreeStore &dense_store,
    mmr::MmrStore &mmr_store)
{
    OperationCost cost;
    if (dense_tree::validate_height(chunk_power).has_error()) {
        LOG_ERROR("bulk append chunk power {} out of range", chunk_power);
        return {BulkAppendError::invalid_input, cost};
    }
    uint64_t const chunks = total_count >> chunk_power;
    uint64_t const buffer_start = chunks << chunk_power;
    auto const dense_count =
        static_cast<uint16_t>(total_count - buffer_start);
    auto const ranges =
        GROVEDB_COST_TRY_NO_ADD(cost, query_positions(query, total_count));

    mmr::MmrTreeProof chunk_proof;
    if (chunks > 0) {
        std::set<uint64_t> indices;
        for (auto const &[start, end] : ranges) {
            if (start >= buffer_start) {
                continue;
            }
            uint64_t const last = (std::min(end, buffer_start) - 1) >> chunk_power;
            for (uint64_t i = start >> chunk_power; i <= last; ++i) {
                indices.insert(i);
            }
        }
        if (indices.empty()) {
            indices.insert(0);
        }
        std::vector<uint64_t> const leaf_indices(indices.begin(), indices.end());
        mmr::GetNodeFn const get_node =
            [&](uint64_t const pos) -> Result<std::optional<mmr::MmrNode>> {
            return mmr_store.element_at_position(pos).unwrap_add_cost(cost);
        };
        chunk_proof = GROVEDB_COST_TRY_NO_ADD(
            cost,
            mmr::MmrTreeProof::generate(
                leaf_count_to_mmr_size(chunks), leaf_indices, get_node));
    }

    dense_tree::DenseTreeProof buffer_proof{.height = chunk_power};
    if (dense_count > 0) {
        std::vector<uint16_t> positions;
        for (auto const &[start, end] : ranges) {
            for (uint64_t pos = std::max(start, buffer_start); pos < end;
                 ++pos) {
                positions.push_back(static_cast<uint16_t>(pos - buffer_start));
            }
        }
        if (positions.empty()) {
            positions.push_back(0);
        }
        buffer_proof = GROVEDB_COST_TRY(
            cost,
            dense_tree::DenseTreeProof::generate(
                chunk_power, dense_count, positions, dense_store));
    }
    return {
        BulkAppendProof{std::move(chunk_proof), std::move(buffer_proof)}, cost};
}

CostResult<BulkAppendProof> BulkAppendProof::generate(
    BulkAppendTree const &tree, query::Query const &query,
    storage::StorageContext &ctx)
{
    dense_tree::StorageDenseTreeStore dense_store{
        ctx, byte_string{BUFFER_KEY_PREFIX, sizeof(BUFFER_KEY_PREFIX)}};
    mmr::StorageMmrStore mmr_store{ctx};
    return generate(
        tree.total_count(), tree.chunk_power(), query, dense_store, mmr_store);
}

Result<std::pair<bytes32_t, BulkAppendProofResult>>
BulkAppendProof::verify_and_compute_root(
    uint8_t const chunk_power, uint64_t const total_count) const
{
    if (dense_tree::validate_height(chunk_power).has_error()) {
        LOG_ERROR("bulk append chunk power {} out of range", chunk_power);
        return BulkAppendError::invalid_proof;
    }
    uint64_t const chunks = total_count >> chunk_power;
    auto const dense_count =
        static_cast<uint16_t>(total_count - (chunks << chunk_power));

    BulkAppendProofResult result{
        .total_count = total_count, .chunk_power = chunk_power};
    bytes32_t mmr_root = NULL_HASH;
    uint64_t const mmr_size = leaf_count_to_mmr_size(chunks);
    if (chunk_proof_.mmr_size() != mmr_size) {
        LOG_ERROR(
            "chunk proof covers an mmr of size {}, expected {}",
            chunk_proof_.mmr_size(),
            mmr_size);
        return BulkAppendError::invalid_proof;
    }
    if (mmr_size > 0) {
        auto verified = chunk_proof_.verify_and_get_root();
        if (verified.has_error()) {
            LOG_ERROR(
                "chunk proof failed: {}", verified.error().message().c_str());
            return BulkAppendError::invalid_proof;
        }
        mmr_root = verified.value().first;
        result.chunk_blobs = std::move(verified.value().second);
    }

    bytes32_t buffer_root = NULL_HASH;
    if (dense_count > 0) {
        if (buffer_proof_.height != chunk_power ||
            buffer_proof_.count != dense_count) {
            LOG_ERROR(
                "buffer proof is for height {} count {}, expected {} and {}",
                buffer_proof_.height,
                buffer_proof_.count,
                chunk_power,
                dense_count);
            return BulkAppendError::invalid_proof;
        }
        auto verified = buffer_proof_.verify_and_get_root();
        if (verified.has_error()) {
            LOG_ERROR(
                "buffer proof failed: {}", verified.error().message().c_str());
            return BulkAppendError::invalid_proof;
        }
        buffer_root = verified.value().first;
        result.buffer_entries = std::move(verified.value().second);
    }
    return std::make_pair(
        compute_state_root(mmr_root, buffer_root), std::move(result));
}

Result<BulkAppendProofResult> BulkAppendProof::verify(
    bytes32_t const &expected_state_root, uint8_t const chunk_power,
    uint64_t const total_count) const
{
    BOOST_OUTCOME_TRY(
        auto verified, verify_and_compute_root(chunk_power, total_count));
    if (verified.first != expected_state_root) {
        LOG_ERROR(
            "bulk append state root mismatch: expected {}, computed {}",
            to_hex(to_byte_string_view(expected_state_root)),
            to_hex(to_byte_string_view(verified.first)));
        return BulkAppendError::invalid_proof;
    }
    return std::move(verified.second);
}

Result<PositionedValues> BulkAppendProof::verify_against_query(
    bytes32_t const &expected_state_root, uint8_t const chunk_power,
    uint64_t const total_count, query::Query const &query) const
{
    BOOST_OUTCOME_TRY(auto const ranges, query_positions(query, total_count));
    BOOST_OUTCOME_TRY(
        auto const result,
        verify(expected_state_root, chunk_power, total_count));

    uint64_t const buffer_start = (total_count >> chunk_power) << chunk_power;
    std::set<uint64_t> proven_chunks;
    for (auto const &[chunk, _] : result.chunk_blobs) {
        proven_chunks.insert(chunk);
    }
    std::set<uint64_t> proven_buffer;
    for (auto const &[pos, _] : result.buffer_entries) {
        proven_buffer.insert(pos);
    }
    for (auto const &[start, end] : ranges) {
        if (start < buffer_start) {
            uint64_t const last = (std::min(end, buffer_start) - 1) >> chunk_power;
            for (uint64_t i = start >> chunk_power; i <= last; ++i) {
                if (!proven_chunks.contains(i)) {
                    LOG_ERROR("proof lacks chunk {} selected by the query", i);
                    return BulkAppendError::invalid_proof;
                }
            }
        }
        for (uint64_t pos = std::max(start, buffer_start); pos < end; ++pos) {
            if (!proven_buffer.contains(pos - buffer_start)) {
                LOG_ERROR(
                    "proof lacks buffer position {} selected by the query",
                    pos);
                return BulkAppendError::invalid_proof;
            }
        }
    }
    return collect_values(result, [&](uint64_t const pos) {
        return dense_tree::in_ranges(pos, ranges);
    });
}

byte_string BulkAppendProof::encode() const
{
    byte_string out;
    auto const chunk = chunk_proof_.encode();
    bincode::append_varint(out, chunk.size());
    out.append(chunk);
    out.append(buffer_proof_.encode());
    return out;
}

Result<BulkAppendProof> BulkAppendProof::decode(byte_string_view enc)
{
    if (enc.size() > dense_tree::MAX_PROOF_DECODE_SIZE) {
        LOG_ERROR(
            "bulk append proof of {} bytes exceeds the decode limit",
            enc.size());
        return BulkAppendError::corrupted_data;
    }
    auto proof = [&]() -> Result<BulkAppendProof> {
        BOOST_OUTCOME_TRY(auto const len, bincode::consume_varint(enc));
        BOOST_OUTCOME_TRY(auto const chunk, consume_bytes(enc, len));
        BOOST_OUTCOME_TRY(auto chunk_proof, mmr::MmrTreeProof::decode(chunk));
        BOOST_OUTCOME_TRY(
            auto buffer_proof, dense_tree::DenseTreeProof::decode(enc));
        return BulkAppendProof{std::move(chunk_proof), std::move(buffer_proof)};
    }();
    if (proof.has_error()) {
        LOG_ERROR("malformed bulk append proof");
        return BulkAppendError::corrupted_data;
    }
    return proof;
}

GROVEDB_BULK_APPEND_NAMESPACE_END
