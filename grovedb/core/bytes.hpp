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

#include <grovedb/core/assert.h>
#include <grovedb/core/byte_string.hpp>

#include <evmc/evmc.hpp>

#include <algorithm>
#include <cstddef>
#include <functional>

GROVEDB_NAMESPACE_BEGIN

using bytes32_t = ::evmc::bytes32;

static_assert(sizeof(bytes32_t) == 32);
static_assert(alignof(bytes32_t) == 1);

inline constexpr size_t HASH_LENGTH = sizeof(bytes32_t);

// Missing children, empty subtrees and empty buffers all hash to this value
inline constexpr bytes32_t NULL_HASH{};

constexpr bytes32_t to_bytes(byte_string_view const data) noexcept
{
    GROVEDB_ASSERT(data.size() == sizeof(bytes32_t));

    bytes32_t byte;
    std::copy_n(data.begin(), data.size(), byte.bytes);
    return byte;
}

constexpr byte_string_view to_byte_string_view(bytes32_t const &b) noexcept
{
    return {b.bytes, sizeof(b.bytes)};
}

GROVEDB_NAMESPACE_END

namespace boost
{
    inline size_t hash_value(grovedb::bytes32_t const &bytes) noexcept
    {
        return std::hash<grovedb::bytes32_t>{}(bytes);
    }
}
