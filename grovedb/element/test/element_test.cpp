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

#include <grovedb/core/byte_string.hpp>
#include <grovedb/core/bytes.hpp>
#include <grovedb/core/error.hpp>
#include <grovedb/core/hex_literal.hpp>
#include <grovedb/element/element.hpp>
#include <grovedb/element/reference_path.hpp>
#include <grovedb/merk/proofs/query.hpp>
#include <grovedb/merk/tree_feature_type.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <vector>

using namespace grovedb;
using namespace grovedb::literals;

using merk::ProofNodeType;
using merk::TreeFeatureType;
using merk::TreeType;

namespace
{
    std::vector<Element> one_of_each()
    {
        return {
            Element::item("v"_bytes),
            Element::reference(ReferencePathType::sibling("k"_bytes), 3),
            Element::empty_tree(),
            Element::sum_item(-4),
            Element::empty_sum_tree(),
            Element::empty_big_sum_tree(),
            Element::empty_count_tree(),
            Element::empty_count_sum_tree(),
            Element::empty_provable_count_tree(),
            Element::item_with_sum_item("w"_bytes, 9),
            Element::empty_provable_count_sum_tree(),
            Element::empty_commitment_tree(4),
            Element::empty_mmr_tree(),
            Element::empty_bulk_append_tree(2),
        };
    }
}

TEST(ElementTest, discriminant_matches_element_type)
{
    auto const elements = one_of_each();
    ASSERT_EQ(elements.size(), ELEMENT_TYPE_COUNT);
    for (size_t i = 0; i < elements.size(); ++i) {
        auto const &element = elements[i];
        EXPECT_EQ(static_cast<size_t>(element.type()), i);
        auto const bytes = element.serialize();
        ASSERT_FALSE(bytes.empty());
        EXPECT_EQ(bytes[0], i) << element.to_string();
        auto const type = element_type_of(bytes);
        ASSERT_FALSE(type.has_error());
        EXPECT_EQ(type.value(), element.type());
    }
}

TEST(ElementTest, serialized_layout)
{
    EXPECT_EQ(Element::empty_tree().serialize(), 0x020000_hex);
    EXPECT_EQ(
        Element::empty_tree(byte_string(1, 5)).serialize(), 0x0200010105_hex);
    EXPECT_EQ(Element::item(0xabcdef_hex).serialize(), 0x0003abcdef00_hex);
    EXPECT_EQ(Element::sum_item(5).serialize(), 0x030a00_hex);
    EXPECT_EQ(Element::sum_item(-1).serialize(), 0x030100_hex);
    EXPECT_EQ(
        Element::reference(ReferencePathType::sibling("k"_bytes)).serialize(),
        0x0106016b0000_hex);
}

TEST(ElementTest, varint_boundaries)
{
    Element small = Element::empty_count_tree();
    std::get<Element::CountTree>(small.data).count = 250;
    EXPECT_EQ(small.serialize(), 0x0600fa00_hex);

    Element wide = Element::empty_count_tree();
    std::get<Element::CountTree>(wide.data).count = 251;
    EXPECT_EQ(wide.serialize(), 0x0600fbfb0000_hex);

    Element huge = Element::empty_count_tree();
    std::get<Element::CountTree>(huge.data).count = UINT64_MAX;
    EXPECT_EQ(huge.serialize(), 0x0600fdffffffffffffffff00_hex);
    auto const back = Element::deserialize(huge.serialize());
    ASSERT_FALSE(back.has_error());
    EXPECT_EQ(back.value(), huge);
}

TEST(ElementTest, deserialize_round_trips)
{
    Element big = Element::empty_big_sum_tree("flag"_bytes);
    auto &tree = std::get<Element::BigSumTree>(big.data);
    tree.root_key = "root"_bytes;
    tree.sum = -(merk::int128_t{1} << 90);

    Element reference = Element::reference(
        ReferencePathType::upstream_root_height(2, {"a"_bytes, "b"_bytes}),
        std::nullopt,
        "f"_bytes);

    Element commitment = Element::empty_commitment_tree(11);
    auto &ct = std::get<Element::CommitmentTree>(commitment.data);
    ct.state_root.bytes[0] = 0x42;
    ct.total_count = 70000;

    for (auto const &element : {big, reference, commitment}) {
        auto const back = Element::deserialize(element.serialize());
        ASSERT_FALSE(back.has_error()) << element.to_string();
        EXPECT_EQ(back.value(), element);
    }
}

TEST(ElementTest, rejects_malformed)
{
    EXPECT_EQ(Element::deserialize({}).error(), Error::corrupted_data);
    EXPECT_EQ(Element::deserialize(0x0e00_hex).error(), Error::corrupted_data);
    // trailing byte
    EXPECT_EQ(
        Element::deserialize(0x02000000_hex).error(), Error::corrupted_data);
    // option tag other than 0 or 1
    EXPECT_EQ(
        Element::deserialize(0x020200_hex).error(), Error::corrupted_data);
    // item length past the end
    EXPECT_EQ(
        Element::deserialize(0x0005abcd_hex).error(), Error::corrupted_data);
    EXPECT_EQ(element_type_of({}).error(), Error::corrupted_data);
}

TEST(ElementTest, aggregate_values)
{
    EXPECT_EQ(Element::sum_item(7).sum_value_or_default(), 7);
    EXPECT_EQ(Element::item("x"_bytes).sum_value_or_default(), 0);
    EXPECT_EQ(
        Element::item_with_sum_item("x"_bytes, -3).sum_value_or_default(), -3);
    EXPECT_EQ(Element::item("x"_bytes).count_value_or_default(), 1);
    EXPECT_EQ(Element::empty_tree().count_value_or_default(), 1);

    Element count_sum = Element::empty_count_sum_tree();
    ASSERT_FALSE(count_sum
                     .set_root_key_and_aggregate(
                         "r"_bytes,
                         merk::AggregateData{
                             .tag = merk::FeatureTag::counted_summed,
                             .count = 3,
                             .sum = 12})
                     .has_error());
    EXPECT_EQ(count_sum.root_key(), std::optional{"r"_bytes});
    EXPECT_EQ(
        count_sum.count_sum_value_or_default(),
        std::pair(uint64_t{3}, int64_t{12}));

    Element item = Element::item("x"_bytes);
    EXPECT_EQ(
        item.set_root_key_and_aggregate(std::nullopt, {}).error(),
        Error::wrong_element_type);
}

TEST(ElementTest, feature_type_follows_parent)
{
    Element count_tree = Element::empty_count_tree();
    std::get<Element::CountTree>(count_tree.data).count = 3;

    EXPECT_EQ(
        Element::sum_item(7).tree_feature_type(TreeType::sum),
        TreeFeatureType::summed(7));
    EXPECT_EQ(
        Element::sum_item(7).tree_feature_type(TreeType::normal),
        TreeFeatureType::basic());
    EXPECT_EQ(
        Element::item("x"_bytes).tree_feature_type(TreeType::count),
        TreeFeatureType::counted(1));
    EXPECT_EQ(
        count_tree.tree_feature_type(TreeType::provable_count),
        TreeFeatureType::provable_counted(3));
    EXPECT_EQ(
        Element::sum_item(-2).tree_feature_type(TreeType::count_sum),
        TreeFeatureType::counted_summed(1, -2));
    EXPECT_EQ(
        Element::sum_item(5).tree_feature_type(TreeType::big_sum),
        TreeFeatureType::big_summed(5));
}

TEST(ElementTest, tree_types)
{
    EXPECT_EQ(Element::empty_tree().tree_type(), TreeType::normal);
    EXPECT_EQ(
        Element::empty_provable_count_sum_tree().tree_type(),
        TreeType::provable_count_sum);
    EXPECT_FALSE(Element::empty_mmr_tree().tree_type().has_value());
    EXPECT_TRUE(Element::empty_mmr_tree().is_any_tree());
    EXPECT_FALSE(Element::empty_mmr_tree().is_merk_tree());
    EXPECT_FALSE(Element::sum_item(1).is_any_tree());
}

TEST(ElementTest, proof_node_types)
{
    struct Row
    {
        Element element;
        ProofNodeType regular;
        ProofNodeType provable;
    };

    std::vector<Row> const rows = {
        {Element::item("x"_bytes), ProofNodeType::kv, ProofNodeType::kv_count},
        {Element::sum_item(1), ProofNodeType::kv, ProofNodeType::kv_count},
        {Element::item_with_sum_item("x"_bytes, 1),
         ProofNodeType::kv,
         ProofNodeType::kv_count},
        {Element::reference(ReferencePathType::sibling("k"_bytes)),
         ProofNodeType::kv_ref_value_hash,
         ProofNodeType::kv_ref_value_hash_count},
        {Element::empty_tree(),
         ProofNodeType::kv_value_hash,
         ProofNodeType::kv_value_hash_feature_type},
        {Element::empty_count_sum_tree(),
         ProofNodeType::kv_value_hash,
         ProofNodeType::kv_value_hash_feature_type},
        {Element::empty_bulk_append_tree(2),
         ProofNodeType::kv_value_hash,
         ProofNodeType::kv_value_hash_feature_type},
    };

    for (auto const &row : rows) {
        auto const bytes = row.element.serialize();
        EXPECT_EQ(element_proof_node_type(bytes, false), row.regular)
            << row.element.to_string();
        EXPECT_EQ(element_proof_node_type(bytes, true), row.provable)
            << row.element.to_string();
    }
}

TEST(ElementTest, value_defined_costs)
{
    using Kind = ValueDefinedCost::Kind;

    EXPECT_FALSE(Element::item("abc"_bytes).value_defined_cost().has_value());
    EXPECT_FALSE(Element::item("abc"_bytes).merk_value_cost().has_value());
    EXPECT_EQ(
        Element::empty_tree().value_defined_cost(),
        (ValueDefinedCost{Kind::layered, TREE_COST_SIZE}));
    // three flag bytes and their length
    EXPECT_EQ(
        Element::empty_tree(0x010203_hex).value_defined_cost(),
        (ValueDefinedCost{Kind::layered, TREE_COST_SIZE + 4}));
    EXPECT_EQ(
        Element::empty_count_sum_tree().value_defined_cost(),
        (ValueDefinedCost{Kind::layered, COUNT_SUM_TREE_COST_SIZE}));
    EXPECT_EQ(
        Element::sum_item(1).value_defined_cost(),
        (ValueDefinedCost{Kind::specialized, SUM_ITEM_COST_SIZE}));
    EXPECT_EQ(
        Element::item_with_sum_item("abc"_bytes, 1).value_defined_cost(),
        (ValueDefinedCost{Kind::specialized, SUM_ITEM_COST_SIZE + 4}));

    auto const tree = Element::empty_tree();
    EXPECT_EQ(
        element_merk_value_cost(tree.serialize()), tree.merk_value_cost());
    EXPECT_EQ(tree.merk_value_cost(), TREE_COST_SIZE + HASH_LENGTH + 2);
}
