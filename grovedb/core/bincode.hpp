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

#include <grovedb/core/config.hpp>

#include <grovedb/core/byte_string.hpp>
#include <grovedb/core/codec.hpp>
#include <grovedb/core/error.hpp>
#include <grovedb/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>

GROVEDB_NAMESPACE_BEGIN

/* Variable length integer format of stored elements, queries and the
 * proofs of the non merk trees:
 *   v < 251        one byte
 *   v < 2^16       0xfb then u16 little endian
 *   v < 2^32       0xfc then u32 little endian
 *   v < 2^64       0xfd then u64 little endian
 *   otherwise      0xfe then u128 little endian
 * Signed values are zigzag encoded first. Byte strings and sequences are a
 * length followed by their contents; optionals a 0 or 1 byte.
 */

using uint128_t = unsigned __int128;
using int128_t = __int128;

namespace bincode
{
    inline constexpr unsigned char SINGLE_BYTE_MAX = 250;
    inline constexpr unsigned char U16_BYTE = 251;
    inline constexpr unsigned char U32_BYTE = 252;
    inline constexpr unsigned char U64_BYTE = 253;
    inline constexpr unsigned char U128_BYTE = 254;

    template <class T>
    void append_le(byte_string &out, T v)
    {
        for (size_t i = 0; i < sizeof(T); ++i) {
            out.push_back(static_cast<unsigned char>(v & 0xff));
            v >>= 8;
        }
    }

    template <class T>
    Result<T> consume_le(byte_string_view &enc)
    {
        BOOST_OUTCOME_TRY(
            auto const bytes, GROVEDB_NAMESPACE::consume_bytes(enc, sizeof(T)));
        T v = 0;
        for (size_t i = sizeof(T); i-- > 0;) {
            v = static_cast<T>((v << 8) | bytes[i]);
        }
        return v;
    }

    inline void append_varint(byte_string &out, uint128_t const v)
    {
        if (v <= SINGLE_BYTE_MAX) {
            out.push_back(static_cast<unsigned char>(v));
        }
        else if (v <= UINT16_MAX) {
            out.push_back(U16_BYTE);
            append_le(out, static_cast<uint16_t>(v));
        }
        else if (v <= UINT32_MAX) {
            out.push_back(U32_BYTE);
            append_le(out, static_cast<uint32_t>(v));
        }
        else if (v <= UINT64_MAX) {
            out.push_back(U64_BYTE);
            append_le(out, static_cast<uint64_t>(v));
        }
        else {
            out.push_back(U128_BYTE);
            append_le(out, v);
        }
    }

    inline Result<uint128_t> consume_varint128(byte_string_view &enc)
    {
        BOOST_OUTCOME_TRY(auto const first, consume_byte(enc));
        switch (first) {
        case U16_BYTE: {
            BOOST_OUTCOME_TRY(auto const v, consume_le<uint16_t>(enc));
            return uint128_t{v};
        }
        case U32_BYTE: {
            BOOST_OUTCOME_TRY(auto const v, consume_le<uint32_t>(enc));
            return uint128_t{v};
        }
        case U64_BYTE: {
            BOOST_OUTCOME_TRY(auto const v, consume_le<uint64_t>(enc));
            return uint128_t{v};
        }
        case U128_BYTE:
            return consume_le<uint128_t>(enc);
        default:
            if (first > SINGLE_BYTE_MAX) {
                return Error::corrupted_data;
            }
            return uint128_t{first};
        }
    }

    inline Result<uint64_t> consume_varint(byte_string_view &enc)
    {
        BOOST_OUTCOME_TRY(auto const v, consume_varint128(enc));
        if (v > UINT64_MAX) {
            return Error::corrupted_data;
        }
        return static_cast<uint64_t>(v);
    }

    inline void append_signed(byte_string &out, int64_t const v)
    {
        append_varint(out, zigzag_encode(v));
    }

    inline Result<int64_t> consume_signed(byte_string_view &enc)
    {
        BOOST_OUTCOME_TRY(auto const v, consume_varint(enc));
        return zigzag_decode(v);
    }

    inline void append_signed128(byte_string &out, int128_t const v)
    {
        auto const u = static_cast<uint128_t>(v);
        append_varint(out, (u << 1) ^ static_cast<uint128_t>(v >> 127));
    }

    inline Result<int128_t> consume_signed128(byte_string_view &enc)
    {
        BOOST_OUTCOME_TRY(auto const v, consume_varint128(enc));
        return static_cast<int128_t>(v >> 1) ^ -static_cast<int128_t>(v & 1);
    }

    inline void append_bytes(byte_string &out, byte_string_view const bytes)
    {
        append_varint(out, bytes.size());
        out.append(bytes);
    }

    inline Result<byte_string> consume_bytes(byte_string_view &enc)
    {
        BOOST_OUTCOME_TRY(auto const len, consume_varint(enc));
        if (len > enc.size()) {
            return Error::corrupted_data;
        }
        BOOST_OUTCOME_TRY(
            auto const bytes,
            GROVEDB_NAMESPACE::consume_bytes(enc, static_cast<size_t>(len)));
        return byte_string{bytes};
    }

    inline Result<bool> consume_option_tag(byte_string_view &enc)
    {
        BOOST_OUTCOME_TRY(auto const tag, consume_byte(enc));
        if (tag > 1) {
            return Error::corrupted_data;
        }
        return tag == 1;
    }

    inline void
    append_optional_bytes(byte_string &out, std::optional<byte_string> const &v)
    {
        out.push_back(v.has_value() ? 1 : 0);
        if (v.has_value()) {
            append_bytes(out, *v);
        }
    }

    inline Result<std::optional<byte_string>>
    consume_optional_bytes(byte_string_view &enc)
    {
        BOOST_OUTCOME_TRY(auto const present, consume_option_tag(enc));
        if (!present) {
            return std::optional<byte_string>{};
        }
        BOOST_OUTCOME_TRY(auto bytes, consume_bytes(enc));
        return std::optional<byte_string>{std::move(bytes)};
    }
}

GROVEDB_NAMESPACE_END
