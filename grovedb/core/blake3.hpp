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

#include <blake3.h>

GROVEDB_NAMESPACE_BEGIN

static_assert(sizeof(bytes32_t) == BLAKE3_OUT_LEN);

/// Incremental hasher for hashing concatenations without copying
class Blake3Hasher
{
    blake3_hasher hasher_;

public:
    Blake3Hasher() noexcept
    {
        blake3_hasher_init(&hasher_);
    }

    Blake3Hasher &update(byte_string_view const bytes) noexcept
    {
        blake3_hasher_update(&hasher_, bytes.data(), bytes.size());
        return *this;
    }

    Blake3Hasher &update(bytes32_t const &hash) noexcept
    {
        blake3_hasher_update(&hasher_, hash.bytes, sizeof(hash.bytes));
        return *this;
    }

    Blake3Hasher &update(unsigned char const byte) noexcept
    {
        blake3_hasher_update(&hasher_, &byte, 1);
        return *this;
    }

    bytes32_t finalize() const noexcept
    {
        bytes32_t hash;
        blake3_hasher_finalize(&hasher_, hash.bytes, BLAKE3_OUT_LEN);
        return hash;
    }
};

inline bytes32_t blake3(byte_string_view const bytes)
{
    return Blake3Hasher{}.update(bytes).finalize();
}

GROVEDB_NAMESPACE_END
