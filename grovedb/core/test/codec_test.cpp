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

#include <grovedb/core/bincode.hpp>
#include <grovedb/core/blake3.hpp>
#include <grovedb/core/byte_string.hpp>
#include <grovedb/core/codec.hpp>
#include <grovedb/core/error.hpp>
#include <grovedb/core/hex_literal.hpp>
#include <grovedb/core/version.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

using namespace grovedb;
using namespace grovedb::literals;

TEST(CodecTest, varint_sizes)
{
    EXPECT_EQ(varint_size(0), 1);
    EXPECT_EQ(varint_size(127), 1);
    EXPECT_EQ(varint_size(128), 2);
    EXPECT_EQ(varint_size(16383), 2);
    EXPECT_EQ(varint_size(16384), 3);
    EXPECT_EQ(varint_size(std::numeric_limits<uint64_t>::max()), 10);
}

TEST(CodecTest, varint_encoding)
{
    byte_string out;
    append_varint(out, 300);
    EXPECT_EQ(out, 0xac02_hex);

    byte_string_view enc{out};
    auto const v = consume_varint(enc);
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v.value(), 300);
    EXPECT_TRUE(enc.empty());
}

TEST(CodecTest, varint_truncated)
{
    byte_string const bad = 0x8080_hex;
    byte_string_view enc{bad};
    auto const v = consume_varint(enc);
    ASSERT_TRUE(v.has_error());
    EXPECT_EQ(v.error(), Error::corrupted_data);
}

TEST(CodecTest, bincode_varint_widths)
{
    auto const encode = [](uint64_t const v) {
        byte_string out;
        bincode::append_varint(out, v);
        return out;
    };
    EXPECT_EQ(encode(0), 0x00_hex);
    EXPECT_EQ(encode(250), 0xfa_hex);
    EXPECT_EQ(encode(251), 0xfbfb00_hex);
    EXPECT_EQ(encode(300), 0xfb2c01_hex);
    EXPECT_EQ(encode(0xffff), 0xfbffff_hex);
    EXPECT_EQ(encode(0x10000), 0xfc00000100_hex);
    EXPECT_EQ(encode(0x100000000), 0xfd0000000001000000_hex);

    byte_string const bytes = 0xfc00000100fa_hex;
    byte_string_view enc{bytes};
    EXPECT_EQ(bincode::consume_varint(enc).value(), 0x10000);
    EXPECT_EQ(bincode::consume_varint(enc).value(), 250);
    EXPECT_TRUE(enc.empty());
}

TEST(CodecTest, bincode_varint_rejects_bad_input)
{
    byte_string const truncated = 0xfb01_hex;
    byte_string_view enc{truncated};
    auto const v = bincode::consume_varint(enc);
    ASSERT_TRUE(v.has_error());
    EXPECT_EQ(v.error(), Error::corrupted_data);

    byte_string const wide = 0xfe0000000000000000ffffffffffffffff_hex;
    enc = wide;
    auto const w = bincode::consume_varint(enc);
    ASSERT_TRUE(w.has_error());
    EXPECT_EQ(w.error(), Error::corrupted_data);
}

TEST(CodecTest, zigzag)
{
    EXPECT_EQ(zigzag_encode(0), 0);
    EXPECT_EQ(zigzag_encode(-1), 1);
    EXPECT_EQ(zigzag_encode(1), 2);
    EXPECT_EQ(zigzag_encode(-2), 3);
    for (int64_t const v :
         {int64_t{0},
          int64_t{-5},
          int64_t{1} << 40,
          std::numeric_limits<int64_t>::min(),
          std::numeric_limits<int64_t>::max()}) {
        byte_string out;
        append_signed_varint(out, v);
        byte_string_view enc{out};
        EXPECT_EQ(consume_signed_varint(enc).value(), v);
    }
}

TEST(CodecTest, big_endian)
{
    EXPECT_EQ(to_be_bytes(uint32_t{0x01020304}), 0x01020304_hex);
    EXPECT_EQ(to_be_bytes(uint64_t{1}), 0x0000000000000001_hex);

    byte_string const bytes = 0x0000000000000102_hex;
    byte_string_view enc{bytes};
    EXPECT_EQ(consume_be<uint64_t>(enc).value(), 0x102);
    EXPECT_TRUE(consume_be<uint16_t>(enc).has_error());
}

TEST(CodecTest, blake3_empty)
{
    EXPECT_EQ(
        blake3({}),
        to_bytes(
            0xaf1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262_hex));
}

TEST(CodecTest, blake3_incremental_matches_oneshot)
{
    byte_string const a = "hello "_bytes;
    byte_string const b = "world"_bytes;
    EXPECT_EQ(
        Blake3Hasher{}.update(a).update(b).finalize(),
        blake3("hello world"_bytes));
}

TEST(CodecTest, version_check)
{
    EXPECT_FALSE(check_version("apply", 0, 0).has_error());
    auto const res = check_version("apply", 0, 1);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), Error::version_mismatch);
}
