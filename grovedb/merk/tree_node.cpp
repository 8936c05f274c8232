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

#include <grovedb/merk/tree_node.hpp>

#include <grovedb/core/assert.h>
#include <grovedb/core/codec.hpp>
#include <grovedb/core/error.hpp>
#include <grovedb/merk/hash.hpp>

#include <quill/Quill.h>

#include <utility>

GROVEDB_MERK_NAMESPACE_BEGIN

namespace
{
    constexpr unsigned char HAS_LEFT = 1;
    constexpr unsigned char HAS_RIGHT = 2;
    constexpr unsigned FEATURE_SHIFT = 2;
}

TreeNode::TreeNode(
    byte_string key, byte_string value, TreeFeatureType const feature_type,
    bytes32_t const &value_hash, bytes32_t const &kv_hash,
    std::optional<uint32_t> const value_defined_cost)
    : key_{std::move(key)}
    , value_{std::move(value)}
    , feature_type_{feature_type}
    , value_hash_{value_hash}
    , kv_hash_{kv_hash}
    , value_defined_cost_{value_defined_cost}
{
}

CostContext<std::unique_ptr<TreeNode>> TreeNode::make(
    byte_string key, byte_string value, bytes32_t const &value_hash,
    TreeFeatureType const feature_type,
    std::optional<uint32_t> const value_defined_cost)
{
    OperationCost cost;
    auto const kv = kv_digest_to_kv_hash(key, value_hash).unwrap_add_cost(cost);
    return {
        std::make_unique<TreeNode>(
            std::move(key),
            std::move(value),
            feature_type,
            value_hash,
            kv,
            value_defined_cost),
        cost};
}

CostContext<std::unique_ptr<TreeNode>> TreeNode::make(
    byte_string key, byte_string value, TreeFeatureType const feature_type)
{
    OperationCost cost;
    auto const vh = merk::value_hash(value).unwrap_add_cost(cost);
    return make(std::move(key), std::move(value), vh, feature_type)
        .add_cost(cost);
}

bytes32_t const &TreeNode::child_hash(bool const left) const
{
    auto const *l = link(left);
    return l ? l->hash() : NULL_HASH;
}

AggregateData TreeNode::child_aggregate_data(bool const left) const
{
    auto const *l = link(left);
    return l ? l->aggregate_data() : AggregateData::none();
}

size_t TreeNode::child_pending_writes(bool const left) const noexcept
{
    auto const *l = link(left);
    return l ? l->pending_writes() : 0;
}

Result<AggregateData> TreeNode::aggregate_data() const
{
    return AggregateData::combine(
        feature_type_, child_aggregate_data(true), child_aggregate_data(false));
}

CostResult<bytes32_t> TreeNode::hash() const
{
    if (is_provable_count(feature_type_.tag)) {
        auto const aggregate = aggregate_data();
        if (aggregate.has_error()) {
            return {aggregate.as_failure(), OperationCost{}};
        }
        auto h = node_hash_with_count(
            kv_hash_,
            child_hash(true),
            child_hash(false),
            aggregate.value().count);
        return {h.value, h.cost};
    }
    auto h = node_hash(kv_hash_, child_hash(true), child_hash(false));
    return {h.value, h.cost};
}

void TreeNode::attach(bool const left, std::unique_ptr<TreeNode> child)
{
    auto &s = slot(left);
    GROVEDB_ASSERT(!s.has_value(), "attach to an occupied slot");
    if (!child) {
        return;
    }
    GROVEDB_ASSERT(child->key() != key_, "attach of a node with the same key");
    s.emplace(Link::from_modified_tree(std::move(child)));
}

std::unique_ptr<TreeNode> TreeNode::detach(bool const left)
{
    auto &s = slot(left);
    if (!s.has_value()) {
        return nullptr;
    }
    GROVEDB_ASSERT(!s->is_reference(), "detach of an unloaded child");
    auto child = s->take_tree();
    s.reset();
    return child;
}

void TreeNode::load(bool const left, std::unique_ptr<TreeNode> child)
{
    auto &s = slot(left);
    GROVEDB_ASSERT(s.has_value() && s->is_reference());
    GROVEDB_ASSERT(child && child->key() == s->key());
    Link::Loaded loaded{
        .hash = s->hash(),
        .child_heights = s->child_heights(),
        .tree = std::move(child),
        .aggregate_data = s->aggregate_data()};
    s.emplace(std::move(loaded));
}

OperationCost TreeNode::set_value(
    byte_string value, bytes32_t const &value_hash,
    TreeFeatureType const feature_type,
    std::optional<uint32_t> const value_defined_cost)
{
    OperationCost cost;
    value_ = std::move(value);
    value_hash_ = value_hash;
    kv_hash_ = kv_digest_to_kv_hash(key_, value_hash_).unwrap_add_cost(cost);
    feature_type_ = feature_type;
    value_defined_cost_ = value_defined_cost;
    return cost;
}

OperationCost
TreeNode::put_value(byte_string value, TreeFeatureType const feature_type)
{
    OperationCost cost;
    auto const vh = merk::value_hash(value).unwrap_add_cost(cost);
    cost += set_value(std::move(value), vh, feature_type);
    return cost;
}

uint32_t TreeNode::key_storage_cost() const noexcept
{
    return paid_len(static_cast<uint32_t>(HASH_LENGTH + key_.size()));
}

uint32_t TreeNode::value_storage_cost() const noexcept
{
    uint32_t const feature_len = feature_type_.cost_len();
    // what the parent spends to link to this node
    uint32_t const parent_hook =
        static_cast<uint32_t>(HASH_LENGTH + key_.size()) + 3 + feature_len;
    if (value_defined_cost_.has_value()) {
        return *value_defined_cost_ + parent_hook;
    }
    return paid_len(static_cast<uint32_t>(
               2 * HASH_LENGTH + value_.size() + feature_len)) +
           parent_hook;
}

CostResult<void> TreeNode::compute_hashes()
{
    OperationCost cost;
    for (bool const left : {true, false}) {
        auto *l = link(left);
        if (!l || !l->is_modified()) {
            continue;
        }
        auto *child = l->tree();
        GROVEDB_COST_TRY(cost, child->compute_hashes());
        auto const h = GROVEDB_COST_TRY(cost, child->hash());
        auto const aggregate =
            GROVEDB_COST_TRY_NO_ADD(cost, child->aggregate_data());
        l->set_hashed(h, aggregate);
    }
    return {outcome::success(), cost};
}

void TreeNode::mark_written()
{
    for (bool const left : {true, false}) {
        auto *l = link(left);
        if (!l || !l->is_uncommitted()) {
            continue;
        }
        l->tree()->mark_written();
        l->set_written();
    }
}

void TreeNode::prune(unsigned const keep_levels)
{
    for (bool const left : {true, false}) {
        auto *l = link(left);
        if (!l || l->is_reference()) {
            continue;
        }
        if (keep_levels == 0) {
            l->prune();
        }
        else {
            l->tree()->prune(keep_levels - 1);
        }
    }
}

ChildrenSizes TreeNode::children_sizes() const
{
    ChildrenSizes sizes{.aggregate_len = feature_type_.cost_len()};
    if (auto const *l = link(true)) {
        sizes.left = static_cast<uint32_t>(l->encoded_size());
    }
    if (auto const *l = link(false)) {
        sizes.right = static_cast<uint32_t>(l->encoded_size());
    }
    return sizes;
}

byte_string TreeNode::encode() const
{
    byte_string out;
    auto const *left = link(true);
    auto const *right = link(false);
    unsigned char header =
        static_cast<unsigned char>(feature_type_.tag) << FEATURE_SHIFT;
    if (left) {
        header |= HAS_LEFT;
    }
    if (right) {
        header |= HAS_RIGHT;
    }
    out.push_back(header);
    if (left) {
        left->encode(out);
    }
    if (right) {
        right->encode(out);
    }
    feature_type_.encode_fixed(out);
    append_bytes32(out, kv_hash_);
    append_bytes32(out, value_hash_);
    out.append(value_);
    return out;
}

Result<std::unique_ptr<TreeNode>>
TreeNode::decode(byte_string key, byte_string_view enc)
{
    BOOST_OUTCOME_TRY(auto const header, consume_byte(enc));
    if (header >> FEATURE_SHIFT >= FEATURE_TAG_COUNT) {
        LOG_ERROR("bad merk node header {:#x}", header);
        return Error::corrupted_data;
    }
    auto const tag = static_cast<FeatureTag>(header >> FEATURE_SHIFT);
    std::optional<Link> left;
    std::optional<Link> right;
    if (header & HAS_LEFT) {
        BOOST_OUTCOME_TRY(auto l, Link::decode(enc));
        left.emplace(std::move(l));
    }
    if (header & HAS_RIGHT) {
        BOOST_OUTCOME_TRY(auto r, Link::decode(enc));
        right.emplace(std::move(r));
    }
    BOOST_OUTCOME_TRY(
        auto const feature_type, TreeFeatureType::decode_fixed(tag, enc));
    BOOST_OUTCOME_TRY(auto const kv, consume_bytes32(enc));
    BOOST_OUTCOME_TRY(auto const vh, consume_bytes32(enc));
    auto node = std::make_unique<TreeNode>(
        std::move(key), byte_string{enc}, feature_type, vh, kv);
    node->left_ = std::move(left);
    node->right_ = std::move(right);
    return node;
}

GROVEDB_MERK_NAMESPACE_END
