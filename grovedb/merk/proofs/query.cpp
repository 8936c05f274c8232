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

#include <grovedb/merk/proofs/query.hpp>

#include <grovedb/core/byte_string.hpp>
#include <grovedb/core/bytes.hpp>
#include <grovedb/core/error.hpp>
#include <grovedb/core/hex_literal.hpp>
#include <grovedb/costs/cost_context.hpp>
#include <grovedb/costs/operation_cost.hpp>
#include <grovedb/merk/hash.hpp>
#include <grovedb/merk/link.hpp>
#include <grovedb/merk/merk.hpp>
#include <grovedb/merk/proofs/node.hpp>
#include <grovedb/merk/proofs/op.hpp>
#include <grovedb/merk/proofs/tree.hpp>
#include <grovedb/merk/tree_node.hpp>

#include <quill/Quill.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <utility>
#include <vector>

GROVEDB_MERK_NAMESPACE_BEGIN

using query::QueryItem;

namespace
{
    using ItemRefs = std::vector<QueryItem const *>;

    // whether the first and the last key of a proven subtree are missing
    using Absence = std::pair<bool, bool>;

    struct ProofAbsenceLimit
    {
        std::vector<Op> proof;
        Absence absence;
        std::optional<uint16_t> limit;
    };

    struct KeyPartition
    {
        bool found{false};
        // the key is an exclusive endpoint of a queried range
        bool on_boundary{false};
        ItemRefs left;
        ItemRefs right;
    };

    KeyPartition process_key(ItemRefs const &items, byte_string_view const key)
    {
        KeyPartition p;
        for (auto const *item : items) {
            auto const lower = item->lower_bound().first;
            auto const upper = item->upper_bound().first;
            if (!lower || *lower < key) {
                p.left.push_back(item);
            }
            if (!upper || *upper > key) {
                p.right.push_back(item);
            }
            p.found |= item->contains(key);
        }
        if (!p.found) {
            for (auto const *item : items) {
                auto const [lower, start_non_inclusive] = item->lower_bound();
                auto const [upper, end_inclusive] = item->upper_bound();
                if ((lower && start_non_inclusive && *lower == key) ||
                    (upper && !end_inclusive && *upper == key)) {
                    p.on_boundary = true;
                }
            }
        }
        return p;
    }

    class Prover
    {
        Merk const &merk_;
        ProofNodeTypeFn const &node_type_;
        bool left_to_right_;

        Op push(Node node) const
        {
            return left_to_right_ ? Op::push(std::move(node))
                                  : Op::push_inverted(std::move(node));
        }

        Result<Node> found_node(TreeNode const &node) const
        {
            bool const provable = is_provable_count(node.feature_type().tag);
            ProofNodeType type =
                provable ? ProofNodeType::kv_count : ProofNodeType::kv;
            if (node_type_) {
                type = node_type_(node.value(), provable);
            }
            switch (type) {
            case ProofNodeType::kv:
                return Node::make_kv(node.key(), node.value());
            case ProofNodeType::kv_count: {
                BOOST_OUTCOME_TRY(auto const aggregate, node.aggregate_data());
                return Node::make_kv_count(
                    node.key(), node.value(), aggregate.count);
            }
            case ProofNodeType::kv_value_hash:
            case ProofNodeType::kv_ref_value_hash:
                return Node::make_kv_value_hash(
                    node.key(), node.value(), node.value_hash());
            case ProofNodeType::kv_value_hash_feature_type:
            case ProofNodeType::kv_ref_value_hash_count: {
                BOOST_OUTCOME_TRY(auto const ft, proof_feature_type(node));
                return Node::make_kv_value_hash_feature_type(
                    node.key(), node.value(), node.value_hash(), ft);
            }
            }
            return Error::invalid_input;
        }

        Result<Node> digest_node(TreeNode const &node) const
        {
            if (!is_provable_count(node.feature_type().tag)) {
                return Node::make_kv_digest(node.key(), node.value_hash());
            }
            BOOST_OUTCOME_TRY(auto const aggregate, node.aggregate_data());
            return Node::make_kv_digest_count(
                node.key(), node.value_hash(), aggregate.count);
        }

        Result<Node> kv_hash_node(TreeNode const &node) const
        {
            if (!is_provable_count(node.feature_type().tag)) {
                return Node::make_kv_hash(node.kv_hash());
            }
            BOOST_OUTCOME_TRY(auto const aggregate, node.aggregate_data());
            return Node::make_kv_hash_count(node.kv_hash(), aggregate.count);
        }

    public:
        Prover(
            Merk const &merk, ProofNodeTypeFn const &node_type,
            bool const left_to_right)
            : merk_{merk}
            , node_type_{node_type}
            , left_to_right_{left_to_right}
        {
        }

        CostResult<ProofAbsenceLimit> prove(
            TreeNode const &node, ItemRefs const &items,
            std::optional<uint16_t> const limit) const;

        CostResult<ProofAbsenceLimit> prove_child(
            TreeNode const &node, bool const left, ItemRefs const &items,
            std::optional<uint16_t> const limit) const
        {
            OperationCost cost;
            auto const *link = node.link(left);
            if (!items.empty()) {
                if (!link) {
                    return {
                        ProofAbsenceLimit{
                            .absence = {true, true}, .limit = limit},
                        cost};
                }
                std::unique_ptr<TreeNode> holder;
                auto const *child =
                    GROVEDB_COST_TRY(cost, merk_.walk(node, left, holder));
                return prove(*child, items, limit).add_cost(cost);
            }
            ProofAbsenceLimit out{.absence = {false, false}, .limit = limit};
            if (link) {
                out.proof.push_back(push(Node::make_hash(link->hash())));
            }
            return {std::move(out), cost};
        }
    };

    CostResult<ProofAbsenceLimit> Prover::prove(
        TreeNode const &node, ItemRefs const &items,
        std::optional<uint16_t> const limit) const
    {
        OperationCost cost;
        auto part = process_key(items, node.key());
        if (limit == 0) {
            part.left.clear();
            part.right.clear();
            part.found = false;
        }

        auto &first_items = left_to_right_ ? part.left : part.right;
        auto &second_items = left_to_right_ ? part.right : part.left;

        auto first = GROVEDB_COST_TRY(
            cost, prove_child(node, left_to_right_, first_items, limit));

        auto second_limit = first.limit;
        if (first.limit.has_value()) {
            if (*first.limit == 0) {
                second_items.clear();
                part.found = false;
            }
            else if (part.found && !part.on_boundary) {
                second_limit = static_cast<uint16_t>(*first.limit - 1);
                if (*second_limit == 0) {
                    second_items.clear();
                }
            }
        }

        auto second = GROVEDB_COST_TRY(
            cost, prove_child(node, !left_to_right_, second_items, second_limit));

        Result<Node> proof_node = Error::invalid_input;
        if (part.found) {
            proof_node = found_node(node);
        }
        else if (
            part.on_boundary || first.absence.second || second.absence.first) {
            proof_node = digest_node(node);
        }
        else {
            proof_node = kv_hash_node(node);
        }
        if (proof_node.has_error()) {
            return {proof_node.as_failure(), cost};
        }

        ProofAbsenceLimit out{
            .proof = std::move(first.proof),
            .absence = {first.absence.first, second.absence.second},
            .limit = second.limit};
        bool const has_first = !out.proof.empty();
        out.proof.push_back(push(std::move(proof_node).value()));
        if (has_first) {
            out.proof.push_back(
                left_to_right_ ? Op::parent() : Op::parent_inverted());
        }
        if (!second.proof.empty()) {
            out.proof.insert(
                out.proof.end(),
                std::make_move_iterator(second.proof.begin()),
                std::make_move_iterator(second.proof.end()));
            out.proof.push_back(
                left_to_right_ ? Op::child() : Op::child_inverted());
        }
        return {std::move(out), cost};
    }
}

Result<TreeFeatureType> proof_feature_type(TreeNode const &node)
{
    auto ft = node.feature_type();
    if (is_provable_count(ft.tag)) {
        BOOST_OUTCOME_TRY(auto const aggregate, node.aggregate_data());
        ft.count = aggregate.count;
    }
    return ft;
}

CostResult<ProofResult> prove_query_items(
    Merk const &merk, std::span<QueryItem const> const items,
    std::optional<uint16_t> const limit, bool const left_to_right,
    ProofNodeTypeFn const &node_type)
{
    OperationCost cost;
    auto const *root = merk.root();
    if (!root) {
        return {ProofResult{.limit = limit}, cost};
    }
    ItemRefs refs;
    refs.reserve(items.size());
    for (auto const &item : items) {
        refs.push_back(&item);
    }
    Prover const prover{merk, node_type, left_to_right};
    auto res = GROVEDB_COST_TRY(cost, prover.prove(*root, refs, limit));
    return {
        ProofResult{.proof = std::move(res.proof), .limit = res.limit}, cost};
}

CostResult<ProofResult> prove_query(
    Merk const &merk, query::Query const &query,
    std::optional<uint16_t> const limit, ProofNodeTypeFn const &node_type)
{
    return prove_query_items(
        merk, query.items, limit, query.left_to_right, node_type);
}

CostResult<ExecutedProof> execute_proof(
    std::span<Op const> const ops, std::span<QueryItem const> const items,
    std::optional<uint16_t> const limit, bool const left_to_right)
{
    OperationCost cost;
    ExecutedProof out{.root_hash = NULL_HASH, .result = {.limit = limit}};
    if (ops.empty()) {
        return {std::move(out), cost};
    }

    size_t pos = 0;
    auto const peek = [&]() -> QueryItem const * {
        if (pos >= items.size()) {
            return nullptr;
        }
        return left_to_right ? &items[pos] : &items[items.size() - 1 - pos];
    };
    bool in_range = false;
    Node const *last_push = nullptr;
    auto &current_limit = out.result.limit;

    auto const execute_node = [&](byte_string_view const key,
                                  byte_string const *const value,
                                  bytes32_t const &proof_hash) -> Result<void> {
        while (auto const *item = peek()) {
            auto const [lower, start_non_inclusive] = item->lower_bound();
            auto const [upper, end_inclusive] = item->upper_bound();

            // the node comes before the current item
            bool const terminate =
                left_to_right
                    ? lower && (*lower > key ||
                                (start_non_inclusive && *lower == key))
                    : upper && (*upper < key || (!end_inclusive && *upper == key));
            if (terminate) {
                break;
            }

            if (!in_range) {
                // the nearest bound of the item must be proven by the previous
                // node, unless the node sits exactly on it
                auto const &bound = left_to_right ? lower : upper;
                bool const exact = bound && *bound == key;
                if (!exact && last_push && !last_push->has_key()) {
                    LOG_ERROR(
                        "proof cannot verify the {} bound of {}",
                        left_to_right ? "lower" : "upper",
                        item->to_string());
                    return Error::invalid_proof;
                }
            }

            if (left_to_right) {
                if (upper && key >= *upper) {
                    ++pos;
                    in_range = false;
                }
                else {
                    in_range = true;
                }
            }
            else if (lower && key <= *lower) {
                ++pos;
                in_range = false;
            }
            else {
                in_range = true;
            }

            if (item->contains(key)) {
                if (!value) {
                    LOG_ERROR(
                        "proof is missing the value of queried key {}",
                        to_hex(key));
                    return Error::invalid_proof;
                }
                if (current_limit.has_value()) {
                    if (*current_limit == 0) {
                        LOG_ERROR(
                            "proof returns more data than the limit {}",
                            *limit);
                        return Error::invalid_proof;
                    }
                    --*current_limit;
                    if (*current_limit == 0) {
                        in_range = false;
                    }
                }
                out.result.result_set.push_back(ProvedKeyOptionalValue{
                    .key = byte_string{key},
                    .value = *value,
                    .proof_hash = proof_hash});
                break;
            }
        }
        return outcome::success();
    };

    auto const visit = [&](Node const &node) -> Result<void> {
        switch (node.kind) {
        case NodeKind::kv:
        case NodeKind::kv_count: {
            auto const vh = value_hash(node.value).unwrap_add_cost(cost);
            BOOST_OUTCOME_TRY(execute_node(node.key, &node.value, vh));
            break;
        }
        case NodeKind::kv_value_hash:
        case NodeKind::kv_value_hash_feature_type:
            BOOST_OUTCOME_TRY(execute_node(node.key, &node.value, node.hash));
            break;
        case NodeKind::kv_ref_value_hash:
        case NodeKind::kv_ref_value_hash_count: {
            // the stored value hash of the reference
            auto const referenced = value_hash(node.value).unwrap_add_cost(cost);
            auto const combined =
                combine_hash(node.hash, referenced).unwrap_add_cost(cost);
            BOOST_OUTCOME_TRY(execute_node(node.key, &node.value, combined));
            break;
        }
        case NodeKind::kv_digest:
        case NodeKind::kv_digest_count:
            BOOST_OUTCOME_TRY(execute_node(node.key, nullptr, node.hash));
            break;
        case NodeKind::hash:
        case NodeKind::kv_hash:
        case NodeKind::kv_hash_count:
            if (in_range) {
                LOG_ERROR(
                    "proof is missing data inside a queried range, found {}",
                    node.to_string());
                return Error::invalid_proof;
            }
            break;
        }
        last_push = &node;
        return outcome::success();
    };

    auto const root = GROVEDB_COST_TRY(cost, execute(ops, true, visit));

    // items left over must lie past the last edge of the tree
    if (peek() && current_limit != 0) {
        if (!last_push || !last_push->has_key()) {
            LOG_ERROR("proof cannot verify absence past its last node");
            return {Error::invalid_proof, cost};
        }
    }

    out.root_hash = root->hash().unwrap_add_cost(cost);
    out.root_aggregate = root->aggregate_data();
    return {std::move(out), cost};
}

CostResult<ProofVerificationResult> verify_query(
    byte_string_view const proof, query::Query const &query,
    std::optional<uint16_t> const limit, bytes32_t const &expected_root)
{
    OperationCost cost;
    auto const ops = GROVEDB_COST_TRY_NO_ADD(cost, decode_ops(proof));
    auto executed = GROVEDB_COST_TRY(
        cost, execute_proof(ops, query.items, limit, query.left_to_right));
    if (executed.root_hash != expected_root) {
        LOG_ERROR(
            "proof root {} does not match the expected {}",
            to_hex(to_byte_string_view(executed.root_hash)),
            to_hex(to_byte_string_view(expected_root)));
        return {Error::invalid_proof, cost};
    }
    return {std::move(executed.result), cost};
}

GROVEDB_MERK_NAMESPACE_END
