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

#include <grovedb/commitment_tree/config.hpp>

#include <grovedb/bulk_append/proof.hpp>
#include <grovedb/bulk_append/tree.hpp>
#include <grovedb/commitment_tree/frontier.hpp>
#include <grovedb/commitment_tree/merkle_hash.hpp>
#include <grovedb/core/byte_string.hpp>
#include <grovedb/core/bytes.hpp>
#include <grovedb/core/result.hpp>
#include <grovedb/costs/cost_context.hpp>
#include <grovedb/query/query.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>

GROVEDB_NAMESPACE_BEGIN

namespace storage
{
    class StorageContext;
}

GROVEDB_NAMESPACE_END

GROVEDB_COMMITMENT_TREE_NAMESPACE_BEGIN

inline constexpr unsigned char COMMITMENT_TREE_DATA_KEY[] = {
    '_', '_', 'c', 't', '_', 'd', 'a', 't', 'a', '_', '_'};

/// epk (32) || encrypted note with a 36 byte memo (104) || out ciphertext (80)
inline constexpr size_t CIPHERTEXT_PAYLOAD_SIZE = 32 + 104 + 80;

/// blake3("ct_state" || sinsemilla_root || bulk_state_root)
bytes32_t compute_commitment_tree_state_root(
    bytes32_t const &sinsemilla_root, bytes32_t const &bulk_state_root);

struct CommitmentAppendResult
{
    bytes32_t sinsemilla_root;
    bytes32_t bulk_state_root;
    bytes32_t state_root;
    uint64_t global_position;
    uint32_t hash_count;
    bool compacted;
};

/*
 * Server side commitment tree. Note commitments go into the frontier, whose
 * root is the Orchard anchor; "cmx || ciphertext payload" records go into a
 * bulk append tree in the same storage context so clients can sync them. The
 * frontier is kept under COMMITMENT_TREE_DATA_KEY and must always agree with
 * the bulk tree on the number of appended notes.
 */
class CommitmentTree
{
    CommitmentFrontier frontier_;
    bulk_append::BulkAppendTree bulk_;

    CommitmentTree(
        CommitmentFrontier frontier, bulk_append::BulkAppendTree bulk)
        : frontier_{std::move(frontier)}
        , bulk_{std::move(bulk)}
    {
    }

public:
    static Result<CommitmentTree> create(
        uint8_t chunk_power, MerkleHasher const & = default_merkle_hasher());

    static CostResult<CommitmentTree> open(
        storage::StorageContext &, uint64_t total_count, uint8_t chunk_power,
        MerkleHasher const & = default_merkle_hasher());

    /// Appends and persists the frontier
    CostResult<CommitmentAppendResult> append(
        storage::StorageContext &, bytes32_t const &cmx,
        byte_string_view payload);

    CostResult<void> save(storage::StorageContext &) const;

    /// Sinsemilla root, the anchor spends are proven against
    bytes32_t root_hash() const
    {
        return frontier_.root_hash();
    }

    std::optional<uint64_t> position() const noexcept
    {
        return frontier_.position();
    }

    uint64_t tree_size() const noexcept
    {
        return frontier_.tree_size();
    }

    uint64_t total_count() const noexcept
    {
        return bulk_.total_count();
    }

    uint8_t chunk_power() const noexcept
    {
        return bulk_.chunk_power();
    }

    bulk_append::BulkAppendTree const &bulk() const noexcept
    {
        return bulk_;
    }

    CostResult<bytes32_t> state_root(storage::StorageContext &) const;

    /// The "cmx || payload" record at `position`
    CostResult<std::optional<byte_string>>
    get_value(storage::StorageContext &, uint64_t position) const;
};

/*
 * Proof of records of a commitment tree: the Sinsemilla root in the clear and
 * a bulk append proof. Together they rebuild the state root held by the
 * parent element.
 */
class CommitmentTreeProof
{
    bytes32_t sinsemilla_root_;
    bulk_append::BulkAppendProof bulk_proof_;

public:
    CommitmentTreeProof(
        bytes32_t const &sinsemilla_root,
        bulk_append::BulkAppendProof bulk_proof)
        : sinsemilla_root_{sinsemilla_root}
        , bulk_proof_{std::move(bulk_proof)}
    {
    }

    bytes32_t const &sinsemilla_root() const noexcept
    {
        return sinsemilla_root_;
    }

    static CostResult<CommitmentTreeProof> generate(
        CommitmentTree const &, query::Query const &,
        storage::StorageContext &);

    Result<bulk_append::PositionedValues> verify_against_query(
        bytes32_t const &expected_state_root, uint8_t chunk_power,
        uint64_t total_count, query::Query const &) const;

    byte_string encode() const;
    static Result<CommitmentTreeProof> decode(byte_string_view);
};

GROVEDB_COMMITMENT_TREE_NAMESPACE_END
