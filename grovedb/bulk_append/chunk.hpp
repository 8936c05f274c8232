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

#include <grovedb/bulk_append/config.hpp>

#include <grovedb/core/byte_string.hpp>
#include <grovedb/core/result.hpp>

#include <cstddef>
#include <span>
#include <vector>

GROVEDB_BULK_APPEND_NAMESPACE_BEGIN

/*
 * A completed chunk is stored as one blob:
 *   fixed     0x01 || u32 count || u32 entry_size || entries
 *   variable  0x00 || (u32 len || bytes)*
 * with all integers big endian. The fixed form is used whenever every entry
 * has the same length. No entries serialize to an empty blob.
 */
inline constexpr unsigned char CHUNK_FORMAT_VARIABLE = 0x00;
inline constexpr unsigned char CHUNK_FORMAT_FIXED = 0x01;
inline constexpr size_t MAX_CHUNK_ENTRIES = size_t{1} << 20;

byte_string serialize_chunk_blob(std::span<byte_string const> entries);

Result<std::vector<byte_string>> deserialize_chunk_blob(byte_string_view);

GROVEDB_BULK_APPEND_NAMESPACE_END
