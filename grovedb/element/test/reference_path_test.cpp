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
#include <grovedb/core/error.hpp>
#include <grovedb/core/hex_literal.hpp>
#include <grovedb/element/reference_path.hpp>

#include <gtest/gtest.h>

#include <optional>
#include <vector>

using namespace grovedb;
using namespace grovedb::literals;

namespace
{
    Path const current{"a"_bytes, "b"_bytes, "c"_bytes};

    Path resolve(ReferencePathType const &ref)
    {
        auto res = ref.absolute_qualified_path(current, "d"_bytes);
        EXPECT_FALSE(res.has_error()) << ref.to_string();
        return res.has_error() ? Path{} : res.value();
    }
}

TEST(ReferencePathTest, resolves_every_kind)
{
    EXPECT_EQ(
        resolve(ReferencePathType::absolute({"x"_bytes, "y"_bytes})),
        (Path{"x"_bytes, "y"_bytes}));
    EXPECT_EQ(
        resolve(ReferencePathType::upstream_root_height(1, {"x"_bytes})),
        (Path{"a"_bytes, "x"_bytes}));
    EXPECT_EQ(
        resolve(
            ReferencePathType::upstream_root_height_with_parent_path_addition(
                1, {"x"_bytes})),
        (Path{"a"_bytes, "x"_bytes, "c"_bytes}));
    EXPECT_EQ(
        resolve(
            ReferencePathType::upstream_from_element_height(1, {"x"_bytes})),
        (Path{"a"_bytes, "b"_bytes, "x"_bytes}));
    EXPECT_EQ(
        resolve(ReferencePathType::cousin("x"_bytes)),
        (Path{"a"_bytes, "b"_bytes, "x"_bytes, "d"_bytes}));
    EXPECT_EQ(
        resolve(ReferencePathType::removed_cousin({"x"_bytes, "y"_bytes})),
        (Path{"a"_bytes, "b"_bytes, "x"_bytes, "y"_bytes, "d"_bytes}));
    EXPECT_EQ(
        resolve(ReferencePathType::sibling("x"_bytes)),
        (Path{"a"_bytes, "b"_bytes, "c"_bytes, "x"_bytes}));
}

TEST(ReferencePathTest, keeps_whole_path)
{
    EXPECT_EQ(
        resolve(ReferencePathType::upstream_root_height(3, {"x"_bytes})),
        (Path{"a"_bytes, "b"_bytes, "c"_bytes, "x"_bytes}));
    EXPECT_EQ(
        resolve(
            ReferencePathType::upstream_from_element_height(3, {"x"_bytes})),
        (Path{"x"_bytes}));
}

TEST(ReferencePathTest, rejects_unsatisfiable)
{
    EXPECT_EQ(
        ReferencePathType::upstream_root_height(4, {})
            .absolute_qualified_path(current, "d"_bytes)
            .error(),
        Error::invalid_input);
    EXPECT_EQ(
        ReferencePathType::upstream_from_element_height(4, {})
            .absolute_qualified_path(current, "d"_bytes)
            .error(),
        Error::invalid_input);
    EXPECT_EQ(
        ReferencePathType::cousin("x"_bytes)
            .absolute_qualified_path({}, "d"_bytes)
            .error(),
        Error::invalid_input);
    EXPECT_EQ(
        ReferencePathType::cousin("x"_bytes)
            .absolute_qualified_path(current, std::nullopt)
            .error(),
        Error::invalid_input);
    EXPECT_EQ(
        ReferencePathType::upstream_root_height_with_parent_path_addition(0, {})
            .absolute_qualified_path({}, "d"_bytes)
            .error(),
        Error::invalid_input);
}

TEST(ReferencePathTest, to_absolute)
{
    auto const abs =
        ReferencePathType::sibling("x"_bytes).to_absolute(current, "d"_bytes);
    ASSERT_FALSE(abs.has_error());
    EXPECT_EQ(abs.value().kind, ReferencePathType::Kind::absolute);
    EXPECT_EQ(abs.value().path.size(), 4u);
}

TEST(ReferencePathTest, encoding)
{
    auto const ref = ReferencePathType::upstream_from_element_height(
        2, {"ab"_bytes, ""_bytes});
    byte_string enc;
    ref.encode(enc);
    EXPECT_EQ(enc, 0x03020202616200_hex);
    EXPECT_EQ(ref.serialized_size(), enc.size());

    byte_string_view view{enc};
    auto const back = ReferencePathType::decode(view);
    ASSERT_FALSE(back.has_error());
    EXPECT_EQ(back.value(), ref);
    EXPECT_TRUE(view.empty());

    byte_string const bad = 0x07_hex;
    byte_string_view unknown{bad};
    EXPECT_EQ(
        ReferencePathType::decode(unknown).error(), Error::corrupted_data);
}
