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
#include <grovedb/core/bytes.hpp>
#include <grovedb/core/error.hpp>
#include <grovedb/core/result.hpp>

#include <algorithm>
#include <array>
#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>

GROVEDB_NAMESPACE_BEGIN

template <std::unsigned_integral T>
[[nodiscard]] constexpr T load_be(unsigned char const *const buf) noexcept
{
    std::array<unsigned char, sizeof(T)> data;
    std::copy_n(buf, sizeof(T), data.data());
    T const v = std::bit_cast<T>(data);
    if constexpr (std::endian::native == std::endian::little) {
        return std::byteswap(v);
    }
    else {
        return v;
    }
}

template <std::unsigned_integral T>
constexpr void store_be(unsigned char *const buf, T value) noexcept
{
    if constexpr (std::endian::native == std::endian::little) {
        value = std::byteswap(value);
    }
    auto const data = std::bit_cast<std::array<unsigned char, sizeof(T)>>(value);
    std::copy_n(data.data(), sizeof(T), buf);
}

template <std::unsigned_integral T>
void append_be(byte_string &out, T const value)
{
    unsigned char buf[sizeof(T)];
    store_be(buf, value);
    out.append(buf, sizeof(T));
}

template <std::unsigned_integral T>
[[nodiscard]] byte_string to_be_bytes(T const value)
{
    byte_string out;
    append_be(out, value);
    return out;
}

/// Number of bytes the LEB128 encoding of `v` occupies
[[nodiscard]] constexpr uint32_t varint_size(uint64_t v) noexcept
{
    uint32_t n = 1;
    while (v >= 0x80) {
        v >>= 7;
        ++n;
    }
    return n;
}

[[nodiscard]] constexpr uint64_t zigzag_encode(int64_t const v) noexcept
{
    return (static_cast<uint64_t>(v) << 1) ^ static_cast<uint64_t>(v >> 63);
}

[[nodiscard]] constexpr int64_t zigzag_decode(uint64_t const v) noexcept
{
    return static_cast<int64_t>(v >> 1) ^ -static_cast<int64_t>(v & 1);
}

inline void append_varint(byte_string &out, uint64_t v)
{
    while (v >= 0x80) {
        out.push_back(static_cast<unsigned char>(v | 0x80));
        v >>= 7;
    }
    out.push_back(static_cast<unsigned char>(v));
}

inline void append_signed_varint(byte_string &out, int64_t const v)
{
    append_varint(out, zigzag_encode(v));
}

inline void append_bytes32(byte_string &out, bytes32_t const &h)
{
    out.append(h.bytes, sizeof(h.bytes));
}

// The consume_* family reads from the front of `enc` and advances it

inline Result<unsigned char> consume_byte(byte_string_view &enc)
{
    if (enc.empty()) {
        return Error::corrupted_data;
    }
    unsigned char const b = enc.front();
    enc.remove_prefix(1);
    return b;
}

inline Result<byte_string_view>
consume_bytes(byte_string_view &enc, size_t const n)
{
    if (enc.size() < n) {
        return Error::corrupted_data;
    }
    byte_string_view const out = enc.substr(0, n);
    enc.remove_prefix(n);
    return out;
}

inline Result<bytes32_t> consume_bytes32(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const bytes, consume_bytes(enc, sizeof(bytes32_t)));
    return to_bytes(bytes);
}

template <std::unsigned_integral T>
Result<T> consume_be(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const bytes, consume_bytes(enc, sizeof(T)));
    return load_be<T>(bytes.data());
}

inline Result<uint64_t> consume_varint(byte_string_view &enc)
{
    uint64_t v = 0;
    for (unsigned shift = 0; shift < 64; shift += 7) {
        BOOST_OUTCOME_TRY(auto const b, consume_byte(enc));
        if (shift == 63 && b > 1) {
            return Error::overflow;
        }
        v |= static_cast<uint64_t>(b & 0x7f) << shift;
        if (!(b & 0x80)) {
            return v;
        }
    }
    return Error::overflow;
}

inline Result<int64_t> consume_signed_varint(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const v, consume_varint(enc));
    return zigzag_decode(v);
}

GROVEDB_NAMESPACE_END
