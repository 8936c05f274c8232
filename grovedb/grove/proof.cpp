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

#include <grovedb/grove/proof.hpp>

#include <grovedb/core/bincode.hpp>
#include <grovedb/core/byte_string.hpp>
#include <grovedb/core/bytes.hpp>
#include <grovedb/core/codec.hpp>
#include <grovedb/core/error.hpp>
#include <grovedb/core/hex_literal.hpp>
#include <grovedb/core/version.hpp>
#include <grovedb/costs/operation_cost.hpp>
#include <grovedb/element/element.hpp>
#include <grovedb/grove/grove_db.hpp>
#include <grovedb/grove/path.hpp>
#include <grovedb/merk/hash.hpp>
#include <grovedb/merk/proofs/op.hpp>
#include <grovedb/merk/proofs/query.hpp>
#include <grovedb/query/query.hpp>
#include <grovedb/query/query_item.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <span>
#include <utility>
#include <variant>
#include <vector>

GROVEDB_ANONYMOUS_NAMESPACE_BEGIN

using query::Query;

void encode_layer(LayerProof const &layer, byte_string &out)
{
    bincode::append_bytes(out, layer.merk_proof);
    bincode::append_varint(out, layer.lower_layers.size());
    for (auto const &lower : layer.lower_layers) {
        bincode::append_bytes(out, lower.key);
        encode_layer(lower, out);
    }
}

Result<LayerProof>
decode_layer(byte_string_view &enc, byte_string key, size_t const depth)
{
    if (depth > MAX_GROVE_PROOF_DEPTH) {
        LOG_ERROR("grove proof nests deeper than {}", MAX_GROVE_PROOF_DEPTH);
        return Error::corrupted_data;
    }
    BOOST_OUTCOME_TRY(auto merk_proof, bincode::consume_bytes(enc));
    LayerProof layer{
        .key = std::move(key),
        .merk_proof = std::move(merk_proof),
        .lower_layers = {}};
    BOOST_OUTCOME_TRY(auto const count, bincode::consume_varint(enc));
    // every lower layer takes at least three bytes
    if (count > enc.size() / 3) {
        return Error::corrupted_data;
    }
    layer.lower_layers.reserve(count);
    for (uint64_t i = 0; i < count; ++i) {
        BOOST_OUTCOME_TRY(auto lower_key, bincode::consume_bytes(enc));
        if (i > 0 && lower_key <= layer.lower_layers.back().key) {
            LOG_ERROR(
                "grove proof lower layer {} out of order", to_hex(lower_key));
            return Error::corrupted_data;
        }
        BOOST_OUTCOME_TRY(
            auto lower, decode_layer(enc, std::move(lower_key), depth + 1));
        layer.lower_layers.push_back(std::move(lower));
    }
    return layer;
}

// subquery path segments to walk below a matched tree and the query run at
// their end; empty when the branch selects nothing
std::optional<std::pair<std::span<byte_string const>, Query>>
descent_of(query::SubqueryBranch const *const branch)
{
    if (!branch) {
        return std::nullopt;
    }
    std::span<byte_string const> segments;
    if (branch->subquery_path.has_value()) {
        segments = *branch->subquery_path;
    }
    if (branch->subquery) {
        return std::pair{segments, *branch->subquery};
    }
    if (segments.empty()) {
        return std::nullopt;
    }
    return std::pair{
        segments.first(segments.size() - 1),
        Query::new_single_key(segments.back())};
}

void spend_limit(std::optional<uint16_t> &limit)
{
    if (limit.has_value() && *limit > 0) {
        --*limit;
    }
}

CostResult<merk::ExecutedProof> execute_layer(
    LayerProof const &layer, std::span<query::QueryItem const> items,
    std::optional<uint16_t> limit, bool left_to_right)
{
    OperationCost cost;
    auto const ops =
        GROVEDB_COST_TRY_NO_ADD(cost, merk::decode_ops(layer.merk_proof));
    auto executed = GROVEDB_COST_TRY(
        cost, merk::execute_proof(ops, items, limit, left_to_right));
    return {std::move(executed), cost};
}

// the tree element holding `child_root` must be what the parent committed to
CostResult<void> check_child_root(
    Path const &path, merk::ProvedKeyOptionalValue const &proved,
    bytes32_t const &child_root)
{
    OperationCost cost;
    auto const value_hash =
        merk::value_hash(*proved.value).unwrap_add_cost(cost);
    auto const expected =
        merk::combine_hash(value_hash, child_root).unwrap_add_cost(cost);
    if (expected != proved.proof_hash) {
        LOG_ERROR(
            "grove proof tree {} at {} commits to {} not {}",
            to_hex(proved.key),
            path_to_string(path),
            to_hex(to_byte_string_view(proved.proof_hash)),
            to_hex(to_byte_string_view(expected)));
        return {Error::invalid_proof, cost};
    }
    return {outcome::success(), cost};
}

Result<void> check_no_lower_layers(Path const &path, LayerProof const &layer)
{
    if (!layer.lower_layers.empty()) {
        LOG_ERROR(
            "grove proof has {} unexpected lower layers at {}",
            layer.lower_layers.size(),
            path_to_string(path));
        return Error::invalid_proof;
    }
    return outcome::success();
}

class LayerVerifier
{
    std::vector<ProvedPathKeyValue> &elements_;
    std::optional<uint16_t> &limit_;

public:
    LayerVerifier(
        std::vector<ProvedPathKeyValue> &elements,
        std::optional<uint16_t> &limit)
        : elements_{elements}
        , limit_{limit}
    {
    }

    /// Root of the merk at `path` proven by `layer` for `query`
    CostResult<merk::ExecutedProof>
    verify(Path const &path, Query const &query, LayerProof const &layer)
    {
        OperationCost cost;
        if (!query.has_subquery()) {
            GROVEDB_COST_TRY_NO_ADD(cost, check_no_lower_layers(path, layer));
            auto executed = GROVEDB_COST_TRY(
                cost,
                execute_layer(layer, query.items, limit_, query.left_to_right));
            limit_ = executed.result.limit;
            for (auto const &proved : executed.result.result_set) {
                GROVEDB_COST_TRY_NO_ADD(cost, push(path, proved));
            }
            return {std::move(executed), cost};
        }

        auto executed = GROVEDB_COST_TRY(
            cost,
            execute_layer(
                layer, query.items, std::nullopt, query.left_to_right));
        size_t descended = 0;
        for (auto const &proved : executed.result.result_set) {
            if (limit_.has_value() && *limit_ == 0) {
                break;
            }
            auto const element = GROVEDB_COST_TRY_NO_ADD(
                cost, Element::deserialize(*proved.value));
            auto const descent =
                element.is_merk_tree()
                    ? descent_of(query.subquery_branch_for_key(proved.key))
                    : std::nullopt;
            if (!descent.has_value() || query.add_parent_tree_on_subquery) {
                GROVEDB_COST_TRY_NO_ADD(cost, push(path, proved));
                spend_limit(limit_);
            }
            if (!descent.has_value()) {
                continue;
            }
            auto const *lower = layer.lower_layer(proved.key);
            if (!lower) {
                LOG_ERROR(
                    "grove proof is missing the subquery of {} at {}",
                    to_hex(proved.key),
                    path_to_string(path));
                return {Error::invalid_proof, cost};
            }
            ++descended;
            auto const child_root = GROVEDB_COST_TRY(
                cost,
                verify_path(
                    child_path(path, proved.key),
                    descent->first,
                    descent->second,
                    *lower));
            GROVEDB_COST_TRY(cost, check_child_root(path, proved, child_root));
        }
        if (descended != layer.lower_layers.size()) {
            LOG_ERROR(
                "grove proof has {} lower layers at {} for {} subqueries",
                layer.lower_layers.size(),
                path_to_string(path),
                descended);
            return {Error::invalid_proof, cost};
        }
        return {std::move(executed), cost};
    }

    /// Walks `segments` from the tree at `path` through single key layers,
    /// then verifies `query` where they end. Returns the root at `path`.
    CostResult<bytes32_t> verify_path(
        Path const &path, std::span<byte_string const> const segments,
        Query const &query, LayerProof const &layer)
    {
        OperationCost cost;
        if (segments.empty()) {
            auto const executed =
                GROVEDB_COST_TRY(cost, verify(path, query, layer));
            return {executed.root_hash, cost};
        }
        query::QueryItem const item = query::QueryItem::key(segments.front());
        auto const executed = GROVEDB_COST_TRY(
            cost,
            execute_layer(
                layer,
                std::span<query::QueryItem const>{&item, 1},
                std::nullopt,
                true));
        auto const &set = executed.result.result_set;
        // the path ends early when a segment is absent or not a tree
        if (set.empty()) {
            GROVEDB_COST_TRY_NO_ADD(cost, check_no_lower_layers(path, layer));
            return {executed.root_hash, cost};
        }
        auto const element = GROVEDB_COST_TRY_NO_ADD(
            cost, Element::deserialize(*set.front().value));
        if (!element.is_merk_tree()) {
            GROVEDB_COST_TRY_NO_ADD(cost, check_no_lower_layers(path, layer));
            return {executed.root_hash, cost};
        }
        auto const *lower = layer.lower_layer(segments.front());
        if (!lower || layer.lower_layers.size() != 1) {
            LOG_ERROR(
                "grove proof does not descend into {} at {}",
                to_hex(segments.front()),
                path_to_string(path));
            return {Error::invalid_proof, cost};
        }
        auto const child_root = GROVEDB_COST_TRY(
            cost,
            verify_path(
                child_path(path, segments.front()),
                segments.subspan(1),
                query,
                *lower));
        GROVEDB_COST_TRY(
            cost, check_child_root(path, set.front(), child_root));
        return {executed.root_hash, cost};
    }

private:
    Result<void>
    push(Path const &path, merk::ProvedKeyOptionalValue const &proved)
    {
        if (!proved.value.has_value()) {
            return outcome::success();
        }
        BOOST_OUTCOME_TRY(auto element, Element::deserialize(*proved.value));
        elements_.push_back(ProvedPathKeyValue{
            .path = path,
            .key = proved.key,
            .element = std::move(element),
            .proof_hash = proved.proof_hash});
        return outcome::success();
    }
};

GROVEDB_ANONYMOUS_NAMESPACE_END

GROVEDB_NAMESPACE_BEGIN

LayerProof const *LayerProof::lower_layer(byte_string_view const key) const
{
    auto const it = std::lower_bound(
        lower_layers.begin(),
        lower_layers.end(),
        key,
        [](LayerProof const &layer, byte_string_view const k) {
            return byte_string_view{layer.key} < k;
        });
    if (it == lower_layers.end() || it->key != key) {
        return nullptr;
    }
    return &*it;
}

byte_string GroveDbProof::encode() const
{
    byte_string out;
    out.push_back(GROVE_PROOF_VERSION);
    encode_layer(root_layer_, out);
    return out;
}

Result<GroveDbProof> GroveDbProof::decode(byte_string_view enc)
{
    if (enc.size() > MAX_GROVE_PROOF_DECODE_SIZE) {
        LOG_ERROR(
            "grove proof of {} bytes exceeds the decode limit", enc.size());
        return Error::invalid_proof;
    }
    BOOST_OUTCOME_TRY(auto const version, consume_byte(enc));
    if (version != GROVE_PROOF_VERSION) {
        LOG_ERROR("unknown grove proof version {}", version);
        return Error::invalid_proof;
    }
    BOOST_OUTCOME_TRY(auto root, decode_layer(enc, byte_string{}, 0));
    if (!enc.empty()) {
        LOG_ERROR("{} trailing bytes after grove proof", enc.size());
        return Error::corrupted_data;
    }
    return GroveDbProof{std::move(root)};
}

CostResult<void> GroveDb::resolve_reference_nodes(
    Path const &path, std::vector<merk::Op> &ops)
{
    OperationCost cost;
    for (auto &op : ops) {
        auto &node = op.node;
        if (!op.is_push() || (node.kind != merk::NodeKind::kv_value_hash &&
                              node.kind !=
                                  merk::NodeKind::kv_value_hash_feature_type)) {
            continue;
        }
        auto const element = Element::deserialize(node.value);
        if (element.has_error() || !element.value().is_reference()) {
            continue;
        }
        auto const &reference =
            std::get<Element::Reference>(element.value().data);
        auto const target = GROVEDB_COST_TRY_NO_ADD(
            cost, reference.path.absolute_qualified_path(path, node.key));
        Path const target_path(target.begin(), target.end() - 1);
        auto const subtree = GROVEDB_COST_TRY(cost, open_subtree(target_path));
        auto const referenced =
            GROVEDB_COST_TRY(cost, subtree->merk->get(target.back()));
        if (!referenced.has_value()) {
            LOG_ERROR(
                "reference {} at {} points to missing {}",
                to_hex(node.key),
                path_to_string(path),
                path_to_string(target));
            return {Error::corrupted_reference_path_key_not_found, cost};
        }
        // only an item's value hash is the plain hash of its bytes, chained
        // references and trees keep their stored value hash
        auto const type = element_type_of(*referenced);
        if (type.has_error() || !is_any_item(type.value())) {
            continue;
        }
        auto const ref_hash =
            merk::value_hash(node.value).unwrap_add_cost(cost);
        bool const provable = node.is_counted();
        uint64_t const count = node.committed_count();
        node = provable ? merk::Node::make_kv_ref_value_hash_count(
                              std::move(node.key), *referenced, ref_hash, count)
                        : merk::Node::make_kv_ref_value_hash(
                              std::move(node.key), *referenced, ref_hash);
    }
    return {outcome::success(), cost};
}

CostResult<LayerProof> GroveDb::prove_layer(
    Path const &path, query::Query const &query,
    std::optional<uint16_t> &limit)
{
    OperationCost cost;
    auto const subtree = GROVEDB_COST_TRY(cost, open_subtree(path));
    bool const descends = query.has_subquery();
    auto proof = GROVEDB_COST_TRY(
        cost,
        merk::prove_query(
            *subtree->merk,
            query,
            descends ? std::nullopt : limit,
            element_proof_node_type));
    GROVEDB_COST_TRY(cost, resolve_reference_nodes(path, proof.proof));
    LayerProof layer{
        .key = {},
        .merk_proof = merk::encode_ops(proof.proof),
        .lower_layers = {}};
    if (!descends) {
        limit = proof.limit;
        return {std::move(layer), cost};
    }

    // the layer shows every match; the limit is spent walking them in order
    auto const executed = GROVEDB_COST_TRY(
        cost,
        merk::execute_proof(
            proof.proof, query.items, std::nullopt, query.left_to_right));
    for (auto const &proved : executed.result.result_set) {
        if (limit.has_value() && *limit == 0) {
            break;
        }
        auto const element = GROVEDB_COST_TRY_NO_ADD(
            cost, Element::deserialize(*proved.value));
        auto const descent =
            element.is_merk_tree()
                ? descent_of(query.subquery_branch_for_key(proved.key))
                : std::nullopt;
        if (!descent.has_value() || query.add_parent_tree_on_subquery) {
            spend_limit(limit);
        }
        if (!descent.has_value()) {
            continue;
        }
        auto lower = GROVEDB_COST_TRY(
            cost,
            prove_path(
                child_path(path, proved.key),
                descent->first,
                descent->second,
                limit));
        lower.key = proved.key;
        layer.lower_layers.push_back(std::move(lower));
    }
    std::sort(
        layer.lower_layers.begin(),
        layer.lower_layers.end(),
        [](LayerProof const &a, LayerProof const &b) { return a.key < b.key; });
    return {std::move(layer), cost};
}

CostResult<LayerProof> GroveDb::prove_path(
    Path const &path, std::span<byte_string const> const segments,
    query::Query const &query, std::optional<uint16_t> &limit)
{
    OperationCost cost;
    if (segments.empty()) {
        auto layer = GROVEDB_COST_TRY(cost, prove_layer(path, query, limit));
        return {std::move(layer), cost};
    }
    auto const subtree = GROVEDB_COST_TRY(cost, open_subtree(path));
    auto const proof = GROVEDB_COST_TRY(
        cost,
        merk::prove_query(
            *subtree->merk,
            query::Query::new_single_key(segments.front()),
            std::nullopt,
            element_proof_node_type));
    LayerProof layer{
        .key = {},
        .merk_proof = merk::encode_ops(proof.proof),
        .lower_layers = {}};
    auto const element =
        GROVEDB_COST_TRY(cost, get_optional_from(*subtree, segments.front()));
    if (!element.has_value() || !element->is_merk_tree()) {
        return {std::move(layer), cost};
    }
    auto lower = GROVEDB_COST_TRY(
        cost,
        prove_path(
            child_path(path, segments.front()),
            segments.subspan(1),
            query,
            limit));
    lower.key = segments.front();
    layer.lower_layers.push_back(std::move(lower));
    return {std::move(layer), cost};
}

CostResult<byte_string> GroveDb::prove_query(
    query::PathQuery const &path_query, GroveVersion const &version)
{
    OperationCost cost;
    GROVEDB_COST_TRY_NO_ADD(
        cost,
        check_version(
            "prove_query",
            GroveVersion::latest().grovedb.prove_query,
            version.grovedb.prove_query));
    // the query path must lead to a merk
    GROVEDB_COST_TRY(cost, open_subtree(path_query.path));
    auto limit = path_query.query.limit;
    auto root = GROVEDB_COST_TRY(
        cost, prove_path({}, path_query.path, path_query.query.query, limit));
    return {GroveDbProof{std::move(root)}.encode(), cost};
}

CostResult<VerifiedPathQuery> GroveDb::verify_query(
    byte_string_view const proof_bytes, query::PathQuery const &path_query,
    GroveVersion const &version)
{
    OperationCost cost;
    GROVEDB_COST_TRY_NO_ADD(
        cost,
        check_version(
            "verify_query",
            GroveVersion::latest().grovedb.verify_query,
            version.grovedb.verify_query));
    auto const proof =
        GROVEDB_COST_TRY_NO_ADD(cost, GroveDbProof::decode(proof_bytes));
    auto const &path = path_query.path;
    auto const &query = path_query.query.query;

    VerifiedPathQuery out{
        .root_hash = NULL_HASH,
        .elements = {},
        .limit = path_query.query.limit,
        .aggregate = std::nullopt};
    LayerVerifier verifier{out.elements, out.limit};

    // walk down the path, then verify the query layer
    std::vector<merk::ExecutedProof> steps;
    LayerProof const *layer = &proof.root_layer();
    for (size_t i = 0; i < path.size(); ++i) {
        query::QueryItem const item = query::QueryItem::key(path[i]);
        auto executed = GROVEDB_COST_TRY(
            cost,
            execute_layer(
                *layer,
                std::span<query::QueryItem const>{&item, 1},
                std::nullopt,
                true));
        auto const &set = executed.result.result_set;
        if (set.size() != 1 || set.front().key != path[i] ||
            !set.front().value.has_value()) {
            LOG_ERROR(
                "grove proof layer {} does not prove {}",
                i,
                to_hex(path[i]));
            return {Error::invalid_proof, cost};
        }
        auto const element = GROVEDB_COST_TRY_NO_ADD(
            cost, Element::deserialize(*set.front().value));
        if (!element.is_merk_tree()) {
            LOG_ERROR(
                "grove proof layer {} holds a {} at {}",
                i,
                element_type_name(element.type()),
                to_hex(path[i]));
            return {Error::invalid_proof, cost};
        }
        auto const *lower = layer->lower_layer(path[i]);
        if (!lower || layer->lower_layers.size() != 1) {
            LOG_ERROR(
                "grove proof layer {} does not descend into {}",
                i,
                to_hex(path[i]));
            return {Error::invalid_proof, cost};
        }
        steps.push_back(std::move(executed));
        layer = lower;
    }

    auto const leaf =
        GROVEDB_COST_TRY(cost, verifier.verify(path, query, *layer));
    out.root_hash = leaf.root_hash;
    out.aggregate = leaf.root_aggregate;

    // walk up, checking each layer commits to the root below it
    for (size_t i = steps.size(); i-- > 0;) {
        Path const prefix(path.begin(), path.begin() + i);
        auto const &executed = steps[i];
        GROVEDB_COST_TRY(
            cost,
            check_child_root(
                prefix, executed.result.result_set.front(), out.root_hash));
        out.root_hash = executed.root_hash;
    }
    return {std::move(out), cost};
}

GROVEDB_NAMESPACE_END
