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

#include <grovedb/element/element.hpp>

#include <grovedb/core/bincode.hpp>
#include <grovedb/core/byte_string.hpp>
#include <grovedb/core/bytes.hpp>
#include <grovedb/core/codec.hpp>
#include <grovedb/core/error.hpp>
#include <grovedb/core/hex_literal.hpp>
#include <grovedb/core/result.hpp>
#include <grovedb/costs/operation_cost.hpp>
#include <grovedb/element/reference_path.hpp>
#include <grovedb/merk/proofs/query.hpp>
#include <grovedb/merk/tree_feature_type.hpp>

#include <quill/Quill.h>

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

GROVEDB_ANONYMOUS_NAMESPACE_BEGIN

template <class... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};

std::string int128_to_string(merk::int128_t v)
{
    if (v == 0) {
        return "0";
    }
    bool const negative = v < 0;
    std::string s;
    while (v != 0) {
        int const digit = static_cast<int>(v % 10);
        s.insert(s.begin(), static_cast<char>('0' + (negative ? -digit : digit)));
        v /= 10;
    }
    return negative ? "-" + s : s;
}

std::string root_key_string(std::optional<byte_string> const &root_key)
{
    return root_key.has_value() ? to_hex(*root_key) : "None";
}

Result<std::optional<uint8_t>> consume_max_hop(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const present, bincode::consume_option_tag(enc));
    if (!present) {
        return std::optional<uint8_t>{};
    }
    BOOST_OUTCOME_TRY(auto const hop, consume_byte(enc));
    return std::optional<uint8_t>{hop};
}

Result<Element::Variant>
consume_variant(ElementType const type, byte_string_view &enc)
{
    using E = Element;
    switch (type) {
    case ElementType::item: {
        BOOST_OUTCOME_TRY(auto value, bincode::consume_bytes(enc));
        return E::Variant{E::Item{std::move(value)}};
    }
    case ElementType::reference: {
        BOOST_OUTCOME_TRY(auto path, ReferencePathType::decode(enc));
        BOOST_OUTCOME_TRY(auto const max_hop, consume_max_hop(enc));
        return E::Variant{E::Reference{std::move(path), max_hop}};
    }
    case ElementType::tree: {
        BOOST_OUTCOME_TRY(auto root, bincode::consume_optional_bytes(enc));
        return E::Variant{E::Tree{std::move(root)}};
    }
    case ElementType::sum_item: {
        BOOST_OUTCOME_TRY(auto const v, bincode::consume_signed(enc));
        return E::Variant{E::SumItem{v}};
    }
    case ElementType::sum_tree: {
        BOOST_OUTCOME_TRY(auto root, bincode::consume_optional_bytes(enc));
        BOOST_OUTCOME_TRY(auto const sum, bincode::consume_signed(enc));
        return E::Variant{E::SumTree{std::move(root), sum}};
    }
    case ElementType::big_sum_tree: {
        BOOST_OUTCOME_TRY(auto root, bincode::consume_optional_bytes(enc));
        BOOST_OUTCOME_TRY(auto const sum, bincode::consume_signed128(enc));
        return E::Variant{E::BigSumTree{std::move(root), sum}};
    }
    case ElementType::count_tree: {
        BOOST_OUTCOME_TRY(auto root, bincode::consume_optional_bytes(enc));
        BOOST_OUTCOME_TRY(auto const count, bincode::consume_varint(enc));
        return E::Variant{E::CountTree{std::move(root), count}};
    }
    case ElementType::count_sum_tree: {
        BOOST_OUTCOME_TRY(auto root, bincode::consume_optional_bytes(enc));
        BOOST_OUTCOME_TRY(auto const count, bincode::consume_varint(enc));
        BOOST_OUTCOME_TRY(auto const sum, bincode::consume_signed(enc));
        return E::Variant{E::CountSumTree{std::move(root), count, sum}};
    }
    case ElementType::provable_count_tree: {
        BOOST_OUTCOME_TRY(auto root, bincode::consume_optional_bytes(enc));
        BOOST_OUTCOME_TRY(auto const count, bincode::consume_varint(enc));
        return E::Variant{E::ProvableCountTree{std::move(root), count}};
    }
    case ElementType::item_with_sum_item: {
        BOOST_OUTCOME_TRY(auto value, bincode::consume_bytes(enc));
        BOOST_OUTCOME_TRY(auto const sum, bincode::consume_signed(enc));
        return E::Variant{E::ItemWithSumItem{std::move(value), sum}};
    }
    case ElementType::provable_count_sum_tree: {
        BOOST_OUTCOME_TRY(auto root, bincode::consume_optional_bytes(enc));
        BOOST_OUTCOME_TRY(auto const count, bincode::consume_varint(enc));
        BOOST_OUTCOME_TRY(auto const sum, bincode::consume_signed(enc));
        return E::Variant{E::ProvableCountSumTree{std::move(root), count, sum}};
    }
    case ElementType::commitment_tree: {
        BOOST_OUTCOME_TRY(auto const root, consume_bytes32(enc));
        BOOST_OUTCOME_TRY(auto const count, bincode::consume_varint(enc));
        BOOST_OUTCOME_TRY(auto const power, consume_byte(enc));
        return E::Variant{E::CommitmentTree{root, count, power}};
    }
    case ElementType::mmr_tree: {
        BOOST_OUTCOME_TRY(auto const root, consume_bytes32(enc));
        BOOST_OUTCOME_TRY(auto const size, bincode::consume_varint(enc));
        return E::Variant{E::MmrTree{root, size}};
    }
    case ElementType::bulk_append_tree: {
        BOOST_OUTCOME_TRY(auto const root, consume_bytes32(enc));
        BOOST_OUTCOME_TRY(auto const count, bincode::consume_varint(enc));
        BOOST_OUTCOME_TRY(auto const power, consume_byte(enc));
        return E::Variant{E::BulkAppendTree{root, count, power}};
    }
    }
    return Error::corrupted_data;
}

GROVEDB_ANONYMOUS_NAMESPACE_END

GROVEDB_NAMESPACE_BEGIN

Result<ElementType> element_type_of(byte_string_view const serialized)
{
    if (serialized.empty()) {
        LOG_ERROR("cannot get the element type of an empty value");
        return Error::corrupted_data;
    }
    if (serialized.front() >= ELEMENT_TYPE_COUNT) {
        LOG_ERROR("unknown element discriminant {}", serialized.front());
        return Error::corrupted_data;
    }
    return static_cast<ElementType>(serialized.front());
}

char const *element_type_name(ElementType const t)
{
    switch (t) {
    case ElementType::item:
        return "item";
    case ElementType::reference:
        return "reference";
    case ElementType::tree:
        return "tree";
    case ElementType::sum_item:
        return "sum item";
    case ElementType::sum_tree:
        return "sum tree";
    case ElementType::big_sum_tree:
        return "big sum tree";
    case ElementType::count_tree:
        return "count tree";
    case ElementType::count_sum_tree:
        return "count sum tree";
    case ElementType::provable_count_tree:
        return "provable count tree";
    case ElementType::item_with_sum_item:
        return "item with sum item";
    case ElementType::provable_count_sum_tree:
        return "provable count sum tree";
    case ElementType::commitment_tree:
        return "commitment tree";
    case ElementType::mmr_tree:
        return "mmr tree";
    case ElementType::bulk_append_tree:
        return "bulk append tree";
    }
    return "unknown";
}

merk::ProofNodeType
element_proof_node_type(byte_string_view const value, bool const provable_count)
{
    auto const type = element_type_of(value);
    if (type.has_error()) {
        // unknown values are shown in full so the verifier hashes them
        return provable_count ? merk::ProofNodeType::kv_count
                              : merk::ProofNodeType::kv;
    }
    return proof_node_type(type.value(), provable_count);
}

Element Element::empty_commitment_tree(
    uint8_t const chunk_power, std::optional<ElementFlags> flags)
{
    return {CommitmentTree{NULL_HASH, 0, chunk_power}, std::move(flags)};
}

Element Element::empty_mmr_tree(std::optional<ElementFlags> flags)
{
    return {MmrTree{NULL_HASH, 0}, std::move(flags)};
}

Element Element::empty_bulk_append_tree(
    uint8_t const chunk_power, std::optional<ElementFlags> flags)
{
    return {BulkAppendTree{NULL_HASH, 0, chunk_power}, std::move(flags)};
}

std::optional<merk::TreeType> Element::tree_type() const noexcept
{
    using merk::TreeType;
    switch (type()) {
    case ElementType::tree:
        return TreeType::normal;
    case ElementType::sum_tree:
        return TreeType::sum;
    case ElementType::big_sum_tree:
        return TreeType::big_sum;
    case ElementType::count_tree:
        return TreeType::count;
    case ElementType::count_sum_tree:
        return TreeType::count_sum;
    case ElementType::provable_count_tree:
        return TreeType::provable_count;
    case ElementType::provable_count_sum_tree:
        return TreeType::provable_count_sum;
    default:
        return std::nullopt;
    }
}

std::optional<byte_string> Element::root_key() const
{
    return std::visit(
        [](auto const &v) -> std::optional<byte_string> {
            if constexpr (requires { v.root_key; }) {
                return v.root_key;
            }
            else {
                return std::nullopt;
            }
        },
        data);
}

Result<void> Element::set_root_key_and_aggregate(
    std::optional<byte_string> root_key, merk::AggregateData const &aggregate)
{
    return std::visit(
        overloaded{
            [&](Tree &v) -> Result<void> {
                v.root_key = std::move(root_key);
                return outcome::success();
            },
            [&](SumTree &v) -> Result<void> {
                v.root_key = std::move(root_key);
                v.sum = aggregate.sum;
                return outcome::success();
            },
            [&](BigSumTree &v) -> Result<void> {
                v.root_key = std::move(root_key);
                v.sum = aggregate.big_sum;
                return outcome::success();
            },
            [&](CountTree &v) -> Result<void> {
                v.root_key = std::move(root_key);
                v.count = aggregate.count;
                return outcome::success();
            },
            [&](CountSumTree &v) -> Result<void> {
                v.root_key = std::move(root_key);
                v.count = aggregate.count;
                v.sum = aggregate.sum;
                return outcome::success();
            },
            [&](ProvableCountTree &v) -> Result<void> {
                v.root_key = std::move(root_key);
                v.count = aggregate.count;
                return outcome::success();
            },
            [&](ProvableCountSumTree &v) -> Result<void> {
                v.root_key = std::move(root_key);
                v.count = aggregate.count;
                v.sum = aggregate.sum;
                return outcome::success();
            },
            [&](auto &) -> Result<void> {
                LOG_ERROR(
                    "{} has no child merk", element_type_name(type()));
                return Error::wrong_element_type;
            }},
        data);
}

Result<byte_string_view> Element::item_value() const
{
    if (auto const *const item = std::get_if<Item>(&data)) {
        return byte_string_view{item->value};
    }
    if (auto const *const item = std::get_if<ItemWithSumItem>(&data)) {
        return byte_string_view{item->value};
    }
    return Error::wrong_element_type;
}

int64_t Element::sum_value_or_default() const noexcept
{
    return std::visit(
        overloaded{
            [](SumItem const &v) { return v.value; },
            [](ItemWithSumItem const &v) { return v.sum; },
            [](SumTree const &v) { return v.sum; },
            [](CountSumTree const &v) { return v.sum; },
            [](ProvableCountSumTree const &v) { return v.sum; },
            [](auto const &) { return int64_t{0}; }},
        data);
}

merk::int128_t Element::big_sum_value_or_default() const noexcept
{
    if (auto const *const v = std::get_if<BigSumTree>(&data)) {
        return v->sum;
    }
    return sum_value_or_default();
}

uint64_t Element::count_value_or_default() const noexcept
{
    return std::visit(
        overloaded{
            [](CountTree const &v) { return v.count; },
            [](CountSumTree const &v) { return v.count; },
            [](ProvableCountTree const &v) { return v.count; },
            [](ProvableCountSumTree const &v) { return v.count; },
            [](auto const &) { return uint64_t{1}; }},
        data);
}

std::pair<uint64_t, int64_t>
Element::count_sum_value_or_default() const noexcept
{
    return {count_value_or_default(), sum_value_or_default()};
}

merk::TreeFeatureType
Element::tree_feature_type(merk::TreeType const parent) const noexcept
{
    using merk::TreeFeatureType;
    using merk::TreeType;
    switch (parent) {
    case TreeType::normal:
        return TreeFeatureType::basic();
    case TreeType::sum:
        return TreeFeatureType::summed(sum_value_or_default());
    case TreeType::big_sum:
        return TreeFeatureType::big_summed(big_sum_value_or_default());
    case TreeType::count:
        return TreeFeatureType::counted(count_value_or_default());
    case TreeType::count_sum:
        return TreeFeatureType::counted_summed(
            count_value_or_default(), sum_value_or_default());
    case TreeType::provable_count:
        return TreeFeatureType::provable_counted(count_value_or_default());
    case TreeType::provable_count_sum:
        return TreeFeatureType::provable_counted_summed(
            count_value_or_default(), sum_value_or_default());
    }
    return TreeFeatureType::basic();
}

uint32_t Element::flags_cost() const noexcept
{
    if (!flags.has_value()) {
        return 0;
    }
    auto const len = static_cast<uint32_t>(flags->size());
    return len + varint_size(len);
}

std::optional<ValueDefinedCost> Element::value_defined_cost() const
{
    auto const layered = [this](uint32_t const size) {
        return ValueDefinedCost{
            ValueDefinedCost::Kind::layered, size + flags_cost()};
    };
    switch (type()) {
    case ElementType::tree:
        return layered(TREE_COST_SIZE);
    case ElementType::sum_tree:
        return layered(SUM_TREE_COST_SIZE);
    case ElementType::big_sum_tree:
        return layered(BIG_SUM_TREE_COST_SIZE);
    case ElementType::count_tree:
    case ElementType::provable_count_tree:
        return layered(COUNT_TREE_COST_SIZE);
    case ElementType::count_sum_tree:
    case ElementType::provable_count_sum_tree:
        return layered(COUNT_SUM_TREE_COST_SIZE);
    case ElementType::commitment_tree:
        return layered(COMMITMENT_TREE_COST_SIZE);
    case ElementType::mmr_tree:
        return layered(MMR_TREE_COST_SIZE);
    case ElementType::bulk_append_tree:
        return layered(BULK_APPEND_TREE_COST_SIZE);
    case ElementType::sum_item:
        return ValueDefinedCost{
            ValueDefinedCost::Kind::specialized,
            SUM_ITEM_COST_SIZE + flags_cost()};
    case ElementType::item_with_sum_item: {
        auto const len = static_cast<uint32_t>(
            std::get<ItemWithSumItem>(data).value.size());
        return ValueDefinedCost{
            ValueDefinedCost::Kind::specialized,
            SUM_ITEM_COST_SIZE + len + varint_size(len) + flags_cost()};
    }
    case ElementType::item:
    case ElementType::reference:
        return std::nullopt;
    }
    return std::nullopt;
}

std::optional<uint32_t> Element::merk_value_cost() const
{
    auto const defined = value_defined_cost();
    if (!defined.has_value()) {
        return std::nullopt;
    }
    switch (defined->kind) {
    case ValueDefinedCost::Kind::layered:
        // the child root hash is paid by the child's own root node
        return defined->cost + static_cast<uint32_t>(HASH_LENGTH) + 2;
    case ValueDefinedCost::Kind::specialized:
        return paid_len(
            defined->cost + 2 * static_cast<uint32_t>(HASH_LENGTH));
    }
    return std::nullopt;
}

byte_string Element::serialize() const
{
    byte_string out;
    bincode::append_varint(out, static_cast<uint8_t>(type()));
    std::visit(
        overloaded{
            [&](Item const &v) { bincode::append_bytes(out, v.value); },
            [&](Reference const &v) {
                v.path.encode(out);
                out.push_back(v.max_hop.has_value() ? 1 : 0);
                if (v.max_hop.has_value()) {
                    out.push_back(*v.max_hop);
                }
            },
            [&](Tree const &v) {
                bincode::append_optional_bytes(out, v.root_key);
            },
            [&](SumItem const &v) { bincode::append_signed(out, v.value); },
            [&](SumTree const &v) {
                bincode::append_optional_bytes(out, v.root_key);
                bincode::append_signed(out, v.sum);
            },
            [&](BigSumTree const &v) {
                bincode::append_optional_bytes(out, v.root_key);
                bincode::append_signed128(out, v.sum);
            },
            [&](CountTree const &v) {
                bincode::append_optional_bytes(out, v.root_key);
                bincode::append_varint(out, v.count);
            },
            [&](CountSumTree const &v) {
                bincode::append_optional_bytes(out, v.root_key);
                bincode::append_varint(out, v.count);
                bincode::append_signed(out, v.sum);
            },
            [&](ProvableCountTree const &v) {
                bincode::append_optional_bytes(out, v.root_key);
                bincode::append_varint(out, v.count);
            },
            [&](ItemWithSumItem const &v) {
                bincode::append_bytes(out, v.value);
                bincode::append_signed(out, v.sum);
            },
            [&](ProvableCountSumTree const &v) {
                bincode::append_optional_bytes(out, v.root_key);
                bincode::append_varint(out, v.count);
                bincode::append_signed(out, v.sum);
            },
            [&](CommitmentTree const &v) {
                append_bytes32(out, v.state_root);
                bincode::append_varint(out, v.total_count);
                out.push_back(v.chunk_power);
            },
            [&](MmrTree const &v) {
                append_bytes32(out, v.mmr_root);
                bincode::append_varint(out, v.mmr_size);
            },
            [&](BulkAppendTree const &v) {
                append_bytes32(out, v.state_root);
                bincode::append_varint(out, v.total_count);
                out.push_back(v.chunk_power);
            }},
        data);
    bincode::append_optional_bytes(out, flags);
    return out;
}

Result<Element> Element::deserialize(byte_string_view enc)
{
    BOOST_OUTCOME_TRY(auto const tag, bincode::consume_varint(enc));
    if (tag >= ELEMENT_TYPE_COUNT) {
        LOG_ERROR("unknown element discriminant {}", tag);
        return Error::corrupted_data;
    }
    BOOST_OUTCOME_TRY(
        auto variant, consume_variant(static_cast<ElementType>(tag), enc));
    BOOST_OUTCOME_TRY(auto flags, bincode::consume_optional_bytes(enc));
    if (!enc.empty()) {
        LOG_ERROR(
            "{} trailing bytes after serialized {}",
            enc.size(),
            element_type_name(static_cast<ElementType>(tag)));
        return Error::corrupted_data;
    }
    return Element{std::move(variant), std::move(flags)};
}

std::string Element::to_string() const
{
    std::string s = std::visit(
        overloaded{
            [](Item const &v) { return "Item(" + to_hex(v.value); },
            [](Reference const &v) {
                return "Reference(" + v.path.to_string() + ", max_hop: " +
                       (v.max_hop ? std::to_string(*v.max_hop) : "None");
            },
            [](Tree const &v) { return "Tree(" + root_key_string(v.root_key); },
            [](SumItem const &v) {
                return "SumItem(" + std::to_string(v.value);
            },
            [](SumTree const &v) {
                return "SumTree(" + root_key_string(v.root_key) + ", " +
                       std::to_string(v.sum);
            },
            [](BigSumTree const &v) {
                return "BigSumTree(" + root_key_string(v.root_key) + ", " +
                       int128_to_string(v.sum);
            },
            [](CountTree const &v) {
                return "CountTree(" + root_key_string(v.root_key) + ", " +
                       std::to_string(v.count);
            },
            [](CountSumTree const &v) {
                return "CountSumTree(" + root_key_string(v.root_key) + ", " +
                       std::to_string(v.count) + ", " + std::to_string(v.sum);
            },
            [](ProvableCountTree const &v) {
                return "ProvableCountTree(" + root_key_string(v.root_key) +
                       ", " + std::to_string(v.count);
            },
            [](ItemWithSumItem const &v) {
                return "ItemWithSumItem(" + to_hex(v.value) + ", " +
                       std::to_string(v.sum);
            },
            [](ProvableCountSumTree const &v) {
                return "ProvableCountSumTree(" + root_key_string(v.root_key) +
                       ", " + std::to_string(v.count) + ", " +
                       std::to_string(v.sum);
            },
            [](CommitmentTree const &v) {
                return "CommitmentTree(" +
                       to_hex(to_byte_string_view(v.state_root)) + ", " +
                       std::to_string(v.total_count) + ", " +
                       std::to_string(v.chunk_power);
            },
            [](MmrTree const &v) {
                return "MmrTree(" + to_hex(to_byte_string_view(v.mmr_root)) +
                       ", " + std::to_string(v.mmr_size);
            },
            [](BulkAppendTree const &v) {
                return "BulkAppendTree(" +
                       to_hex(to_byte_string_view(v.state_root)) + ", " +
                       std::to_string(v.total_count) + ", " +
                       std::to_string(v.chunk_power);
            }},
        data);
    if (flags.has_value()) {
        s += ", flags: " + to_hex(*flags);
    }
    return s + ")";
}

std::optional<uint32_t> element_merk_value_cost(byte_string_view const serialized)
{
    auto const element = Element::deserialize(serialized);
    if (element.has_error()) {
        return std::nullopt;
    }
    return element.value().merk_value_cost();
}

GROVEDB_NAMESPACE_END
