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

#include <grovedb/merk/config.hpp>

#include <grovedb/core/byte_string.hpp>
#include <grovedb/core/bytes.hpp>
#include <grovedb/core/result.hpp>
#include <grovedb/costs/cost_context.hpp>
#include <grovedb/merk/proofs/op.hpp>
#include <grovedb/merk/tree_feature_type.hpp>
#include <grovedb/query/query.hpp>
#include <grovedb/query/query_item.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <vector>

GROVEDB_MERK_NAMESPACE_BEGIN

class Merk;
class TreeNode;

/// How a queried node is shown in a proof, which decides whether the
/// verifier recomputes its value hash or trusts the one given
enum class ProofNodeType : uint8_t
{
    kv,
    kv_count,
    kv_value_hash,
    kv_value_hash_feature_type,
    kv_ref_value_hash,
    kv_ref_value_hash_count,
};

/// Chooses the proof node type of a stored value; the flag tells whether
/// the merk is a provable count tree
using ProofNodeTypeFn =
    std::function<ProofNodeType(byte_string_view value, bool provable_count)>;

/// Feature type shown in proof nodes: the node's own, with the subtree count
/// for provable count trees
Result<TreeFeatureType> proof_feature_type(TreeNode const &);

struct ProofResult
{
    std::vector<Op> proof;
    // limit left after the proven nodes
    std::optional<uint16_t> limit;
};

/// Proves `items` (sorted, non overlapping) against `merk`. Nodes reported
/// as references are emitted with their stored value hash; the caller
/// rewrites them into reference nodes.
CostResult<ProofResult> prove_query_items(
    Merk const &merk, std::span<query::QueryItem const> items,
    std::optional<uint16_t> limit, bool left_to_right = true,
    ProofNodeTypeFn const &node_type = {});

CostResult<ProofResult> prove_query(
    Merk const &merk, query::Query const &query,
    std::optional<uint16_t> limit, ProofNodeTypeFn const &node_type = {});

struct ProvedKeyOptionalValue
{
    byte_string key;
    std::optional<byte_string> value;
    bytes32_t proof_hash;

    bool operator==(ProvedKeyOptionalValue const &) const = default;
};

struct ProofVerificationResult
{
    std::vector<ProvedKeyOptionalValue> result_set;
    std::optional<uint16_t> limit;
};

struct ExecutedProof
{
    bytes32_t root_hash;
    ProofVerificationResult result;
    // aggregate data committed at the root of the proven tree, if shown
    std::optional<AggregateData> root_aggregate;
};

/// Replays `ops` and checks them against the query, recomputing the root
/// hash. An empty proof stands for an empty tree.
CostResult<ExecutedProof> execute_proof(
    std::span<Op const> ops, std::span<query::QueryItem const> items,
    std::optional<uint16_t> limit, bool left_to_right = true);

/// Decodes and executes `proof`, requiring it to commit to `expected_root`
CostResult<ProofVerificationResult> verify_query(
    byte_string_view proof, query::Query const &query,
    std::optional<uint16_t> limit, bytes32_t const &expected_root);

GROVEDB_MERK_NAMESPACE_END
