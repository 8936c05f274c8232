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

#include <grovedb/core/byte_string.hpp>

#include <cstddef>
#include <string>
#include <string_view>

GROVEDB_NAMESPACE_BEGIN

/// Bytes of an even length hex string with an optional 0x prefix; empty on
/// any other input
constexpr byte_string from_hex(std::string_view s)
{
    if (s.starts_with("0x")) {
        s.remove_prefix(2);
    }
    auto const nibble = [](char const c) -> int {
        if (c >= '0' && c <= '9') {
            return c - '0';
        }
        if (c >= 'a' && c <= 'f') {
            return c - 'a' + 10;
        }
        if (c >= 'A' && c <= 'F') {
            return c - 'A' + 10;
        }
        return -1;
    };
    if (s.size() % 2) {
        return {};
    }
    byte_string out;
    out.reserve(s.size() / 2);
    for (size_t i = 0; i < s.size(); i += 2) {
        int const hi = nibble(s[i]);
        int const lo = nibble(s[i + 1]);
        if (hi < 0 || lo < 0) {
            return {};
        }
        out.push_back(static_cast<unsigned char>((hi << 4) | lo));
    }
    return out;
}

inline std::string to_hex(byte_string_view const bytes)
{
    static constexpr std::string_view digits = "0123456789abcdef";
    std::string s;
    s.reserve(bytes.size() * 2);
    for (auto const b : bytes) {
        s.push_back(digits[b >> 4]);
        s.push_back(digits[b & 0xf]);
    }
    return s;
}

namespace literals
{
    inline byte_string operator""_hex(char const *const s)
    {
        return from_hex(s);
    }

    inline byte_string operator""_bytes(char const *const s, size_t const len)
    {
        return to_byte_string({s, len});
    }
}

GROVEDB_NAMESPACE_END
