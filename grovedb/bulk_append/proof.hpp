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

#include <grovedb/bulk_append/config.hpp>

#include <grovedb/bulk_append/tree.hpp>
#include <grovedb/core/byte_string.hpp>
#include <grovedb/core/bytes.hpp>
#include <grovedb/core/result.hpp>
#include <grovedb/costs/cost_context.hpp>
#include <grovedb/dense_tree/proof.hpp>
#include <grovedb/dense_tree/store.hpp>
#include <grovedb/mmr/mmr_tree_proof.hpp>
#include <grovedb/mmr/store.hpp>
#include <grovedb/query/query.hpp>

#include <cstdint>
#include <utility>

GROVEDB_BULK_APPEND_NAMESPACE_BEGIN

/// What a bulk append proof authenticates once its roots check out
struct BulkAppendProofResult
{
    mmr::VerifiedLeaves chunk_blobs;
    dense_tree::ProvenEntries buffer_entries;
    uint64_t total_count{0};
    uint8_t chunk_power{0};

    /// Values at global positions [start, end) among the proven ones
    Result<PositionedValues> values_in_range(uint64_t start, uint64_t end) const;
};

/*
 * Proof of the values at a set of global positions: an MMR proof for every
 * completed chunk touching the query and a dense tree proof for the buffer
 * positions it selects. A half the query does not touch still proves chunk 0
 * or buffer position 0 so that both roots, and with them the state root, can
 * be recomputed.
 */
class BulkAppendProof
{
    mmr::MmrTreeProof chunk_proof_;
    dense_tree::DenseTreeProof buffer_proof_;

public:
    BulkAppendProof() = default;

    BulkAppendProof(
        mmr::MmrTreeProof chunk_proof, dense_tree::DenseTreeProof buffer_proof)
        : chunk_proof_{std::move(chunk_proof)}
        , buffer_proof_{std::move(buffer_proof)}
    {
    }

    mmr::MmrTreeProof const &chunk_proof() const noexcept
    {
        return chunk_proof_;
    }

    dense_tree::DenseTreeProof const &buffer_proof() const noexcept
    {
        return buffer_proof_;
    }

    static CostResult<BulkAppendProof> generate(
        uint64_t total_count, uint8_t chunk_power, query::Query const &,
        dense_tree::DenseTreeStore &, mmr::MmrStore &);

    /// Proves `query` against a tree laid out in one storage context
    static CostResult<BulkAppendProof> generate(
        BulkAppendTree const &, query::Query const &,
        storage::StorageContext &);

    Result<std::pair<bytes32_t, BulkAppendProofResult>>
    verify_and_compute_root(uint8_t chunk_power, uint64_t total_count) const;

    Result<BulkAppendProofResult> verify(
        bytes32_t const &expected_state_root, uint8_t chunk_power,
        uint64_t total_count) const;

    /// Verifies the proof and that it covers every position `query` selects;
    /// returns exactly those values in position order
    Result<PositionedValues> verify_against_query(
        bytes32_t const &expected_state_root, uint8_t chunk_power,
        uint64_t total_count, query::Query const &) const;

    byte_string encode() const;
    static Result<BulkAppendProof> decode(byte_string_view);
};

GROVEDB_BULK_APPEND_NAMESPACE_END
