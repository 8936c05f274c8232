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

#include <grovedb/merk/proofs/tree.hpp>

#include <grovedb/core/byte_string.hpp>
#include <grovedb/core/bytes.hpp>
#include <grovedb/core/error.hpp>
#include <grovedb/core/hex_literal.hpp>
#include <grovedb/costs/cost_context.hpp>
#include <grovedb/costs/operation_cost.hpp>
#include <grovedb/merk/hash.hpp>
#include <grovedb/merk/proofs/node.hpp>
#include <grovedb/merk/proofs/op.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <cstdlib>
#include <memory>
#include <optional>
#include <span>
#include <utility>
#include <vector>

GROVEDB_MERK_NAMESPACE_BEGIN

bytes32_t const &ProofTree::child_hash(bool const left) const noexcept
{
    auto const *c = child(left);
    return c ? c->hash : NULL_HASH;
}

CostContext<bytes32_t> ProofTree::hash() const
{
    OperationCost cost;
    bytes32_t kvh{};
    switch (node_.kind) {
    case NodeKind::hash:
        return {node_.hash, cost};
    case NodeKind::kv_hash:
    case NodeKind::kv_hash_count:
        kvh = node_.hash;
        break;
    case NodeKind::kv:
    case NodeKind::kv_count:
        kvh = kv_hash(node_.key, node_.value).unwrap_add_cost(cost);
        break;
    case NodeKind::kv_value_hash:
    case NodeKind::kv_value_hash_feature_type:
    case NodeKind::kv_digest:
    case NodeKind::kv_digest_count:
        kvh = kv_digest_to_kv_hash(node_.key, node_.hash).unwrap_add_cost(cost);
        break;
    case NodeKind::kv_ref_value_hash:
    case NodeKind::kv_ref_value_hash_count: {
        auto const referenced = value_hash(node_.value).unwrap_add_cost(cost);
        auto const combined =
            combine_hash(node_.hash, referenced).unwrap_add_cost(cost);
        kvh = kv_digest_to_kv_hash(node_.key, combined).unwrap_add_cost(cost);
        break;
    }
    }
    auto const h =
        node_.is_counted()
            ? node_hash_with_count(
                  kvh,
                  child_hash(true),
                  child_hash(false),
                  node_.committed_count())
                  .unwrap_add_cost(cost)
            : node_hash(kvh, child_hash(true), child_hash(false))
                  .unwrap_add_cost(cost);
    return {h, cost};
}

CostResult<void>
ProofTree::attach(bool const left, std::unique_ptr<ProofTree> child)
{
    OperationCost cost;
    auto &s = slot(left);
    if (s.has_value()) {
        LOG_ERROR(
            "proof attaches a second {} child", left ? "left" : "right");
        return {Error::invalid_proof, cost};
    }
    height_ = std::max<uint8_t>(height_, static_cast<uint8_t>(child->height_ + 1));
    if (left) {
        child_heights_.left = child->height_;
    }
    else {
        child_heights_.right = child->height_;
    }
    auto const h = child->hash().unwrap_add_cost(cost);
    s.emplace(ProofChild{.tree = std::move(child), .hash = h});
    return {outcome::success(), cost};
}

CostContext<std::unique_ptr<ProofTree>> ProofTree::into_hash() const
{
    auto h = hash();
    auto tree = std::make_unique<ProofTree>(Node::make_hash(h.value));
    tree->height_ = height_;
    tree->child_heights_ = child_heights_;
    return {std::move(tree), h.cost};
}

std::optional<AggregateData> ProofTree::aggregate_data() const
{
    if (node_.kind == NodeKind::kv_value_hash_feature_type) {
        auto const &ft = node_.feature_type;
        return AggregateData{
            .tag = ft.tag, .count = ft.count, .sum = ft.sum, .big_sum = ft.big_sum};
    }
    if (node_.is_counted()) {
        return AggregateData{
            .tag = FeatureTag::provable_counted, .count = node_.count};
    }
    return std::nullopt;
}

Result<void> ProofTree::visit_refs(
    std::function<Result<void>(ProofTree const &)> const &visit) const
{
    if (left_.has_value()) {
        BOOST_OUTCOME_TRY(left_->tree->visit_refs(visit));
    }
    BOOST_OUTCOME_TRY(visit(*this));
    if (right_.has_value()) {
        BOOST_OUTCOME_TRY(right_->tree->visit_refs(visit));
    }
    return outcome::success();
}

std::vector<ProofTree const *> ProofTree::layer(size_t const depth) const
{
    std::vector<ProofTree const *> out;
    if (depth == 0) {
        out.push_back(this);
        return out;
    }
    for (bool const left : {true, false}) {
        if (auto const *c = child(left)) {
            auto sub = c->tree->layer(depth - 1);
            out.insert(out.end(), sub.begin(), sub.end());
        }
    }
    return out;
}

CostResult<std::unique_ptr<ProofTree>> execute(
    std::span<Op const> const ops, bool const collapse,
    NodeVisitor const &visit_node)
{
    OperationCost cost;
    std::vector<std::unique_ptr<ProofTree>> stack;
    Node const *last_key_node = nullptr;

    auto const pop = [&]() -> std::unique_ptr<ProofTree> {
        auto tree = std::move(stack.back());
        stack.pop_back();
        return tree;
    };

    auto const join = [&](std::unique_ptr<ProofTree> parent,
                          std::unique_ptr<ProofTree> child,
                          bool const left) -> CostResult<void> {
        OperationCost c;
        if (collapse) {
            child = child->into_hash().unwrap_add_cost(c);
        }
        GROVEDB_COST_TRY(c, parent->attach(left, std::move(child)));
        stack.push_back(std::move(parent));
        return {outcome::success(), c};
    };

    for (auto const &op : ops) {
        switch (op.kind) {
        case Op::Kind::parent:
        case Op::Kind::parent_inverted: {
            if (stack.size() < 2) {
                LOG_ERROR("proof stack underflow on parent op");
                return {Error::invalid_proof, cost};
            }
            auto parent = pop();
            auto child = pop();
            GROVEDB_COST_TRY(
                cost,
                join(
                    std::move(parent),
                    std::move(child),
                    op.kind == Op::Kind::parent));
            break;
        }
        case Op::Kind::child:
        case Op::Kind::child_inverted: {
            if (stack.size() < 2) {
                LOG_ERROR("proof stack underflow on child op");
                return {Error::invalid_proof, cost};
            }
            auto child = pop();
            auto parent = pop();
            GROVEDB_COST_TRY(
                cost,
                join(
                    std::move(parent),
                    std::move(child),
                    op.kind == Op::Kind::child_inverted));
            break;
        }
        case Op::Kind::push:
        case Op::Kind::push_inverted: {
            auto const &node = op.node;
            if (node.has_key()) {
                if (last_key_node) {
                    auto const order = node.key.compare(last_key_node->key);
                    bool const ok = op.kind == Op::Kind::push ? order > 0
                                                               : order < 0;
                    if (!ok) {
                        LOG_ERROR(
                            "proof key {} is out of order after {}",
                            to_hex(node.key),
                            to_hex(last_key_node->key));
                        return {Error::invalid_proof, cost};
                    }
                }
                last_key_node = &node;
            }
            if (visit_node) {
                auto const visited = visit_node(node);
                if (visited.has_error()) {
                    return {visited.as_failure(), cost};
                }
            }
            stack.push_back(std::make_unique<ProofTree>(node));
            break;
        }
        default:
            LOG_ERROR("unknown proof op {}", static_cast<unsigned>(op.kind));
            return {Error::invalid_proof, cost};
        }
    }

    if (stack.size() != 1) {
        LOG_ERROR(
            "proof leaves {} trees on the stack instead of one", stack.size());
        return {Error::invalid_proof, cost};
    }
    auto tree = pop();
    auto const h = tree->child_heights();
    if (std::abs(static_cast<int>(h.left) - static_cast<int>(h.right)) > 1) {
        LOG_ERROR(
            "proof tree is unbalanced at its root ({} vs {})", h.left, h.right);
        return {Error::invalid_proof, cost};
    }
    return {std::move(tree), cost};
}

GROVEDB_MERK_NAMESPACE_END
