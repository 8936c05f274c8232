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

#include <grovedb/grove/grove_db.hpp>

#include <grovedb/bulk_append/tree.hpp>
#include <grovedb/commitment_tree/commitment_tree.hpp>
#include <grovedb/core/byte_string.hpp>
#include <grovedb/core/bytes.hpp>
#include <grovedb/core/error.hpp>
#include <grovedb/core/hex_literal.hpp>
#include <grovedb/core/version.hpp>
#include <grovedb/costs/operation_cost.hpp>
#include <grovedb/element/element.hpp>
#include <grovedb/grove/path.hpp>
#include <grovedb/merk/merk.hpp>
#include <grovedb/merk/ops.hpp>
#include <grovedb/storage/storage_batch.hpp>

#include <quill/Quill.h>

#include <memory>
#include <optional>
#include <set>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

GROVEDB_ANONYMOUS_NAMESPACE_BEGIN

// a freshly inserted tree must not describe any content
bool is_empty_tree(Element const &element)
{
    if (auto const type = element.tree_type()) {
        Element cleared = element;
        auto const res = cleared.set_root_key_and_aggregate(
            std::nullopt, merk::AggregateData::empty(*type));
        return res.has_value() && cleared == element;
    }
    return std::visit(
        [](auto const &v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Element::MmrTree>) {
                return v.mmr_size == 0;
            }
            else if constexpr (
                std::is_same_v<T, Element::BulkAppendTree> ||
                std::is_same_v<T, Element::CommitmentTree>) {
                return v.total_count == 0;
            }
            else {
                return false;
            }
        },
        element.data);
}

Result<void> check_chunk_power(Element const &element)
{
    if (auto const *v = std::get_if<Element::BulkAppendTree>(&element.data)) {
        BOOST_OUTCOME_TRY(bulk_append::BulkAppendTree::create(v->chunk_power));
    }
    if (auto const *v = std::get_if<Element::CommitmentTree>(&element.data)) {
        BOOST_OUTCOME_TRY(
            commitment_tree::CommitmentTree::create(v->chunk_power));
    }
    return outcome::success();
}

bytes32_t non_merk_child_root(Element const &element)
{
    return std::visit(
        [](auto const &v) -> bytes32_t {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Element::MmrTree>) {
                return v.mmr_root;
            }
            else if constexpr (
                std::is_same_v<T, Element::BulkAppendTree> ||
                std::is_same_v<T, Element::CommitmentTree>) {
                return v.state_root;
            }
            else {
                return NULL_HASH;
            }
        },
        element.data);
}

CostResult<void> clear_context(storage::StorageContext &ctx)
{
    OperationCost cost;
    storage::StorageBatch batch;
    for (auto const keyspace :
         {storage::Keyspace::data, storage::Keyspace::roots}) {
        auto it = ctx.raw_iter(keyspace);
        for (it->seek_to_first(cost); it->valid(); it->next(cost)) {
            batch.del_in(keyspace, *it->key(cost));
        }
    }
    if (!batch.empty()) {
        GROVEDB_COST_TRY(cost, ctx.commit_batch(batch));
    }
    return {outcome::success(), cost};
}

GROVEDB_ANONYMOUS_NAMESPACE_END

GROVEDB_NAMESPACE_BEGIN

CostResult<std::unique_ptr<GroveDb::Subtree>>
GroveDb::open_subtree(Path const &path)
{
    OperationCost cost;
    merk::TreeType type = merk::TreeType::normal;
    if (!path.empty()) {
        Path const parent_path(path.begin(), path.end() - 1);
        auto const parent = GROVEDB_COST_TRY(cost, open_subtree(parent_path));
        auto const element =
            GROVEDB_COST_TRY(cost, get_from(*parent, path.back()));
        auto const tree_type = element.tree_type();
        if (!tree_type.has_value()) {
            LOG_ERROR(
                "{} at {} has no child merk",
                element_type_name(element.type()),
                path_to_string(path));
            return {Error::invalid_path, cost};
        }
        type = *tree_type;
    }
    auto subtree = std::make_unique<Subtree>();
    subtree->path = path;
    subtree->ctx = storage_.context_for_path(path);
    subtree->merk = GROVEDB_COST_TRY(
        cost, merk::Merk::open(*subtree->ctx, type, element_merk_value_cost));
    return {std::move(subtree), cost};
}

CostResult<std::optional<Element>> GroveDb::get_optional_from(
    Subtree const &subtree, byte_string_view const key) const
{
    OperationCost cost;
    auto const value = GROVEDB_COST_TRY(cost, subtree.merk->get(key));
    if (!value.has_value()) {
        return {std::optional<Element>{}, cost};
    }
    auto element = Element::deserialize(*value);
    if (element.has_error()) {
        LOG_ERROR(
            "cannot deserialize element {} at {}",
            to_hex(key),
            path_to_string(subtree.path));
        return {Error::corrupted_data, cost};
    }
    return {std::optional{std::move(element).value()}, cost};
}

CostResult<Element>
GroveDb::get_from(Subtree const &subtree, byte_string_view const key) const
{
    OperationCost cost;
    auto element = GROVEDB_COST_TRY(cost, get_optional_from(subtree, key));
    if (!element.has_value()) {
        LOG_ERROR(
            "key {} not found at {}",
            to_hex(key),
            path_to_string(subtree.path));
        return {Error::path_key_not_found, cost};
    }
    return {std::move(*element), cost};
}

CostResult<merk::MerkOp> GroveDb::insert_op(
    Path const &path, byte_string_view const key, Element const &element,
    merk::TreeType const parent_type, std::optional<Element> const &existing)
{
    using merk::MerkOp;
    OperationCost cost;
    auto const ft = element.tree_feature_type(parent_type);
    auto value = element.serialize();

    if (element.is_reference()) {
        auto const &reference = std::get<Element::Reference>(element.data);
        auto const target = GROVEDB_COST_TRY_NO_ADD(
            cost, reference.path.absolute_qualified_path(path, key));
        Path const target_path(target.begin(), target.end() - 1);
        auto const target_subtree =
            GROVEDB_COST_TRY(cost, open_subtree(target_path));
        auto const hash = GROVEDB_COST_TRY(
            cost, target_subtree->merk->get_value_hash(target.back()));
        if (!hash.has_value()) {
            LOG_ERROR(
                "reference target {} / {} does not exist",
                path_to_string(target_path),
                to_hex(target.back()));
            return {Error::corrupted_reference_path_key_not_found, cost};
        }
        return {
            MerkOp::put_combined_reference(std::move(value), *hash, ft), cost};
    }

    if (element.is_any_tree()) {
        if (!is_empty_tree(element)) {
            LOG_ERROR(
                "{} must be empty when inserted",
                element_type_name(element.type()));
            return {Error::invalid_input, cost};
        }
        GROVEDB_COST_TRY_NO_ADD(cost, check_chunk_power(element));
        bytes32_t const child_root = element.is_merk_tree()
                                         ? NULL_HASH
                                         : non_merk_child_root(element);
        auto const value_cost = *element.merk_value_cost();
        if (existing.has_value() && existing->is_any_tree()) {
            return {
                MerkOp::replace_layered_reference(
                    std::move(value), value_cost, child_root, ft),
                cost};
        }
        return {
            MerkOp::put_layered_reference(
                std::move(value), value_cost, child_root, ft),
            cost};
    }

    if (auto const value_cost = element.merk_value_cost()) {
        return {
            MerkOp::put_with_specialized_cost(
                std::move(value), *value_cost, ft),
            cost};
    }
    return {MerkOp::put(std::move(value), ft), cost};
}

CostResult<void> GroveDb::apply_op(
    Subtree &subtree, byte_string_view const key, merk::MerkOp op,
    bool const base_root_storage_is_free)
{
    OperationCost cost;
    merk::MerkBatch batch;
    batch.emplace_back(byte_string{key}, std::move(op));
    GROVEDB_COST_TRY(
        cost,
        subtree.merk->apply(
            batch,
            {},
            merk::ApplyOptions{
                .base_root_storage_is_free = base_root_storage_is_free}));
    return {outcome::success(), cost};
}

CostResult<void> GroveDb::propagate(Subtree const &child)
{
    OperationCost cost;
    if (child.path.empty()) {
        return {outcome::success(), cost};
    }
    Path const parent_path(child.path.begin(), child.path.end() - 1);
    byte_string const &key = child.path.back();
    auto parent = GROVEDB_COST_TRY(cost, open_subtree(parent_path));
    auto element = GROVEDB_COST_TRY(cost, get_from(*parent, key));
    auto const aggregate =
        GROVEDB_COST_TRY_NO_ADD(cost, child.merk->aggregate_data());
    GROVEDB_COST_TRY_NO_ADD(
        cost,
        element.set_root_key_and_aggregate(child.merk->root_key(), aggregate));
    auto const child_root = GROVEDB_COST_TRY(cost, child.merk->root_hash());
    GROVEDB_COST_TRY(
        cost, replace_tree_element(*parent, key, element, child_root));
    return {outcome::success(), cost};
}

CostResult<void> GroveDb::replace_tree_element(
    Subtree &parent, byte_string_view const key, Element const &element,
    bytes32_t const &child_root)
{
    OperationCost cost;
    auto op = merk::MerkOp::replace_layered_reference(
        element.serialize(),
        *element.merk_value_cost(),
        child_root,
        element.tree_feature_type(parent.merk->tree_type()));
    GROVEDB_COST_TRY(cost, apply_op(parent, key, std::move(op), true));
    GROVEDB_COST_TRY(cost, propagate(parent));
    return {outcome::success(), cost};
}

CostResult<void>
GroveDb::clear_subtree(Path const &path, Element const &element)
{
    OperationCost cost;
    auto ctx = storage_.context_for_path(path);
    if (!element.is_merk_tree()) {
        GROVEDB_COST_TRY(cost, clear_context(*ctx));
        return {outcome::success(), cost};
    }

    auto merk = GROVEDB_COST_TRY(
        cost,
        merk::Merk::open(*ctx, *element.tree_type(), element_merk_value_cost));
    std::vector<byte_string> keys;
    auto it = ctx->raw_iter(storage::Keyspace::data);
    for (it->seek_to_first(cost); it->valid(); it->next(cost)) {
        keys.push_back(*it->key(cost));
    }
    for (auto const &key : keys) {
        auto const value = GROVEDB_COST_TRY(cost, merk->get(key));
        if (!value.has_value()) {
            continue;
        }
        auto const child = Element::deserialize(*value);
        if (child.has_error()) {
            LOG_ERROR(
                "cannot deserialize element {} at {}",
                to_hex(key),
                path_to_string(path));
            return {Error::corrupted_data, cost};
        }
        if (child.value().is_any_tree()) {
            GROVEDB_COST_TRY(
                cost, clear_subtree(child_path(path, key), child.value()));
        }
    }
    GROVEDB_COST_TRY(cost, merk->clear());
    return {outcome::success(), cost};
}

CostResult<void> GroveDb::insert(
    Path const &path, byte_string_view const key, Element element,
    InsertOptions const &options, GroveVersion const &version)
{
    OperationCost cost;
    GROVEDB_COST_TRY_NO_ADD(
        cost,
        check_version(
            "insert",
            GroveVersion::latest().grovedb.insert,
            version.grovedb.insert));

    auto subtree = GROVEDB_COST_TRY(cost, open_subtree(path));
    auto const existing =
        GROVEDB_COST_TRY(cost, get_optional_from(*subtree, key));
    if (existing.has_value()) {
        if (options.validate_insertion_does_not_override) {
            LOG_ERROR("insertion not allowed to override {}", to_hex(key));
            return {Error::invalid_input, cost};
        }
        if (options.validate_insertion_does_not_override_tree &&
            existing->is_any_tree()) {
            LOG_ERROR(
                "insertion not allowed to override tree {}", to_hex(key));
            return {Error::invalid_input, cost};
        }
    }

    auto op = GROVEDB_COST_TRY(
        cost,
        insert_op(path, key, element, subtree->merk->tree_type(), existing));
    GROVEDB_COST_TRY(
        cost,
        apply_op(
            *subtree, key, std::move(op), options.base_root_storage_is_free));
    GROVEDB_COST_TRY(cost, propagate(*subtree));
    return {outcome::success(), cost};
}

CostResult<void> GroveDb::remove(
    Path const &path, byte_string_view const key, DeleteOptions const &options,
    GroveVersion const &version)
{
    OperationCost cost;
    GROVEDB_COST_TRY_NO_ADD(
        cost,
        check_version(
            "delete",
            GroveVersion::latest().grovedb.remove,
            version.grovedb.remove));

    auto subtree = GROVEDB_COST_TRY(cost, open_subtree(path));
    auto const element = GROVEDB_COST_TRY(cost, get_from(*subtree, key));
    auto op = merk::MerkOp::del();
    if (element.is_any_tree()) {
        if (!is_empty_tree(element) &&
            !options.allow_deleting_non_empty_trees) {
            LOG_ERROR(
                "deleting non empty {} {} at {}",
                element_type_name(element.type()),
                to_hex(key),
                path_to_string(path));
            return {Error::invalid_input, cost};
        }
        GROVEDB_COST_TRY(cost, clear_subtree(child_path(path, key), element));
        op = merk::MerkOp::delete_layered();
    }
    GROVEDB_COST_TRY(
        cost,
        apply_op(
            *subtree, key, std::move(op), options.base_root_storage_is_free));
    GROVEDB_COST_TRY(cost, propagate(*subtree));
    return {outcome::success(), cost};
}

CostResult<std::optional<Element>> GroveDb::get_raw_optional(
    Path const &path, byte_string_view const key, GroveVersion const &version)
{
    OperationCost cost;
    GROVEDB_COST_TRY_NO_ADD(
        cost,
        check_version(
            "get", GroveVersion::latest().grovedb.get, version.grovedb.get));
    auto const subtree = GROVEDB_COST_TRY(cost, open_subtree(path));
    return get_optional_from(*subtree, key).add_cost(cost);
}

CostResult<Element> GroveDb::get_raw(
    Path const &path, byte_string_view const key, GroveVersion const &version)
{
    OperationCost cost;
    auto element =
        GROVEDB_COST_TRY(cost, get_raw_optional(path, key, version));
    if (!element.has_value()) {
        LOG_ERROR("key {} not found at {}", to_hex(key), path_to_string(path));
        return {Error::path_key_not_found, cost};
    }
    return {std::move(*element), cost};
}

CostResult<Element> GroveDb::get(
    Path const &path, byte_string_view const key, GroveVersion const &version)
{
    OperationCost cost;
    auto element = GROVEDB_COST_TRY(cost, get_raw(path, key, version));
    auto const *reference = std::get_if<Element::Reference>(&element.data);
    if (!reference) {
        return {std::move(element), cost};
    }

    uint8_t hops_left = reference->max_hop.value_or(MAX_REFERENCE_HOPS);
    Path current = child_path(path, key);
    std::set<Path> visited{current};
    while (auto const *ref = std::get_if<Element::Reference>(&element.data)) {
        if (hops_left == 0) {
            LOG_ERROR(
                "reference hop limit reached at {}", path_to_string(current));
            return {Error::reference_limit, cost};
        }
        --hops_left;
        Path const from_path(current.begin(), current.end() - 1);
        auto target = GROVEDB_COST_TRY_NO_ADD(
            cost, ref->path.absolute_qualified_path(from_path, current.back()));
        if (!visited.insert(target).second) {
            LOG_ERROR("cyclic reference through {}", path_to_string(target));
            return {Error::cyclic_reference, cost};
        }
        Path const target_path(target.begin(), target.end() - 1);
        auto next = GROVEDB_COST_TRY(
            cost, get_raw_optional(target_path, target.back(), version));
        if (!next.has_value()) {
            LOG_ERROR(
                "reference target {} does not exist", path_to_string(target));
            return {Error::corrupted_reference_path_key_not_found, cost};
        }
        element = std::move(*next);
        current = std::move(target);
    }
    return {std::move(element), cost};
}

CostResult<bytes32_t> GroveDb::root_hash()
{
    OperationCost cost;
    auto const root = GROVEDB_COST_TRY(cost, open_subtree({}));
    return root->merk->root_hash().add_cost(cost);
}

GROVEDB_NAMESPACE_END
