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

#include <grovedb/core/config.hpp>

#include <grovedb/bulk_append/proof.hpp>
#include <grovedb/bulk_append/tree.hpp>
#include <grovedb/commitment_tree/commitment_tree.hpp>
#include <grovedb/core/byte_string.hpp>
#include <grovedb/core/bytes.hpp>
#include <grovedb/core/result.hpp>
#include <grovedb/core/version.hpp>
#include <grovedb/costs/cost_context.hpp>
#include <grovedb/element/element.hpp>
#include <grovedb/grove/proof.hpp>
#include <grovedb/merk/merk.hpp>
#include <grovedb/merk/proofs/op.hpp>
#include <grovedb/merk/tree_feature_type.hpp>
#include <grovedb/mmr/mmr_tree_proof.hpp>
#include <grovedb/query/query.hpp>
#include <grovedb/storage/memory_storage.hpp>
#include <grovedb/storage/storage_context.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <utility>
#include <vector>

GROVEDB_NAMESPACE_BEGIN

inline constexpr uint8_t MAX_REFERENCE_HOPS = 10;

struct InsertOptions
{
    bool validate_insertion_does_not_override{false};
    bool validate_insertion_does_not_override_tree{true};
    bool base_root_storage_is_free{true};
};

struct DeleteOptions
{
    bool allow_deleting_non_empty_trees{false};
    bool base_root_storage_is_free{true};
};

struct MmrAppendResult
{
    bytes32_t mmr_root;
    uint64_t leaf_index;
};

struct ProvedPathKeyValue
{
    Path path;
    byte_string key;
    Element element;
    bytes32_t proof_hash;

    bool operator==(ProvedPathKeyValue const &) const = default;
};

struct VerifiedPathQuery
{
    bytes32_t root_hash;
    std::vector<ProvedPathKeyValue> elements;
    // limit left after the proven elements
    std::optional<uint16_t> limit;
    // aggregate committed at the root of the queried merk, when shown
    std::optional<merk::AggregateData> aggregate;
};

/*
 * Hierarchy of merks over one MemoryStorage. The merk at `path` keeps its
 * nodes in the storage context of that path; a tree element at `path`/`key`
 * describes the child stored under `path` + `key`. Every write rewrites the
 * tree elements on the way up so that the root merk commits to the whole
 * grove.
 */
class GroveDb
{
    struct Subtree
    {
        Path path;
        std::unique_ptr<storage::StorageContext> ctx;
        std::unique_ptr<merk::Merk> merk;
    };

    storage::MemoryStorage storage_;

    CostResult<std::unique_ptr<Subtree>> open_subtree(Path const &path);

    CostResult<std::optional<Element>>
    get_optional_from(Subtree const &, byte_string_view key) const;
    CostResult<Element> get_from(Subtree const &, byte_string_view key) const;

    CostResult<merk::MerkOp> insert_op(
        Path const &path, byte_string_view key, Element const &element,
        merk::TreeType parent_type, std::optional<Element> const &existing);

    CostResult<void> apply_op(
        Subtree &, byte_string_view key, merk::MerkOp op,
        bool base_root_storage_is_free);

    /// Rewrites the tree element of `child` in its parent, up to the root
    CostResult<void> propagate(Subtree const &child);

    /// Stores `element`, a tree whose child hashes to `child_root`, then
    /// propagates
    CostResult<void> replace_tree_element(
        Subtree &parent, byte_string_view key, Element const &element,
        bytes32_t const &child_root);

    CostResult<void> clear_subtree(Path const &path, Element const &element);

    /// Swaps pushed references to items in a proof of the merk at `path`
    /// for reference nodes carrying the item
    CostResult<void>
    resolve_reference_nodes(Path const &path, std::vector<merk::Op> &ops);

    /// Proves `query` in the merk at `path` with lower layers for its
    /// subqueries, spending `limit` on the results
    CostResult<LayerProof> prove_layer(
        Path const &path, query::Query const &query,
        std::optional<uint16_t> &limit);

    /// Single key layers down `segments` from `path`, then `query`
    CostResult<LayerProof> prove_path(
        Path const &path, std::span<byte_string const> segments,
        query::Query const &query, std::optional<uint16_t> &limit);

    /// Parent merk and the element at `key`, which must be of type `T`
    template <class T>
    CostResult<std::pair<std::unique_ptr<Subtree>, Element>>
    open_tree_element(Path const &path, byte_string_view key);

public:
    GroveDb() = default;
    GroveDb(GroveDb const &) = delete;
    GroveDb &operator=(GroveDb const &) = delete;

    CostResult<void> insert(
        Path const &path, byte_string_view key, Element element,
        InsertOptions const & = {},
        GroveVersion const & = GroveVersion::latest());

    CostResult<void> remove(
        Path const &path, byte_string_view key, DeleteOptions const & = {},
        GroveVersion const & = GroveVersion::latest());

    /// Element at `path`/`key` with references followed to their target
    CostResult<Element> get(
        Path const &path, byte_string_view key,
        GroveVersion const & = GroveVersion::latest());

    CostResult<Element> get_raw(
        Path const &path, byte_string_view key,
        GroveVersion const & = GroveVersion::latest());

    CostResult<std::optional<Element>> get_raw_optional(
        Path const &path, byte_string_view key,
        GroveVersion const & = GroveVersion::latest());

    CostResult<bytes32_t> root_hash();

    /// Layered proof from the root merk down to the query path and through
    /// every subquery. References to items are shown with the item.
    CostResult<byte_string> prove_query(
        query::PathQuery const &,
        GroveVersion const & = GroveVersion::latest());

    static CostResult<VerifiedPathQuery> verify_query(
        byte_string_view proof, query::PathQuery const &,
        GroveVersion const & = GroveVersion::latest());

    CostResult<MmrAppendResult>
    mmr_tree_append(Path const &path, byte_string_view key, byte_string value);
    CostResult<bytes32_t>
    mmr_tree_root_hash(Path const &path, byte_string_view key);
    CostResult<uint64_t>
    mmr_tree_leaf_count(Path const &path, byte_string_view key);
    CostResult<std::optional<byte_string>> mmr_tree_get_value(
        Path const &path, byte_string_view key, uint64_t leaf_index);
    CostResult<mmr::MmrTreeProof> prove_mmr_tree_leaves(
        Path const &path, byte_string_view key,
        std::span<uint64_t const> leaf_indices);

    CostResult<bulk_append::AppendResult>
    bulk_append(Path const &path, byte_string_view key, byte_string_view value);
    CostResult<std::optional<byte_string>> bulk_get_value(
        Path const &path, byte_string_view key, uint64_t position);
    CostResult<std::optional<byte_string>> bulk_get_chunk(
        Path const &path, byte_string_view key, uint64_t chunk_index);
    CostResult<uint64_t> bulk_count(Path const &path, byte_string_view key);
    CostResult<bulk_append::BulkAppendProof> prove_bulk_append_query(
        Path const &path, byte_string_view key, query::Query const &);

    CostResult<commitment_tree::CommitmentAppendResult> commitment_tree_append(
        Path const &path, byte_string_view key, bytes32_t const &cmx,
        byte_string_view payload);
    /// Root of the note commitment frontier, the Orchard anchor
    CostResult<bytes32_t>
    commitment_tree_anchor(Path const &path, byte_string_view key);
    CostResult<std::optional<byte_string>> commitment_tree_get_value(
        Path const &path, byte_string_view key, uint64_t position);
    CostResult<commitment_tree::CommitmentTreeProof>
    prove_commitment_tree_query(
        Path const &path, byte_string_view key, query::Query const &);

    storage::MemoryStorage &storage() noexcept
    {
        return storage_;
    }
};

GROVEDB_NAMESPACE_END
