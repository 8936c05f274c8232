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

#include <grovedb/bulk_append/chunk.hpp>

#include <grovedb/bulk_append/bulk_append_error.hpp>
#include <grovedb/core/codec.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <cstdint>

GROVEDB_BULK_APPEND_NAMESPACE_BEGIN

byte_string serialize_chunk_blob(std::span<byte_string const> const entries)
{
    byte_string blob;
    if (entries.empty()) {
        return blob;
    }
    bool const fixed =
        std::ranges::all_of(entries, [&](byte_string const &e) {
            return e.size() == entries.front().size();
        });
    if (fixed) {
        blob.push_back(CHUNK_FORMAT_FIXED);
        append_be(blob, static_cast<uint32_t>(entries.size()));
        append_be(blob, static_cast<uint32_t>(entries.front().size()));
        for (auto const &e : entries) {
            blob.append(e);
        }
    }
    else {
        blob.push_back(CHUNK_FORMAT_VARIABLE);
        for (auto const &e : entries) {
            append_be(blob, static_cast<uint32_t>(e.size()));
            blob.append(e);
        }
    }
    return blob;
}

Result<std::vector<byte_string>> deserialize_chunk_blob(byte_string_view blob)
{
    std::vector<byte_string> entries;
    if (blob.empty()) {
        return entries;
    }
    unsigned char const format = blob.front();
    blob.remove_prefix(1);
    if (format == CHUNK_FORMAT_FIXED) {
        auto const header = [&]() -> Result<std::pair<uint32_t, uint32_t>> {
            BOOST_OUTCOME_TRY(auto const count, consume_be<uint32_t>(blob));
            BOOST_OUTCOME_TRY(auto const size, consume_be<uint32_t>(blob));
            return std::make_pair(count, size);
        }();
        if (header.has_error()) {
            LOG_ERROR("fixed chunk blob truncated at header");
            return BulkAppendError::corrupted_data;
        }
        auto const [count, entry_size] = header.value();
        if (count > MAX_CHUNK_ENTRIES) {
            LOG_ERROR(
                "fixed chunk blob count {} exceeds {}",
                count,
                MAX_CHUNK_ENTRIES);
            return BulkAppendError::corrupted_data;
        }
        if (blob.size() != uint64_t{count} * entry_size) {
            LOG_ERROR(
                "fixed chunk blob payload is {} bytes, expected {} x {}",
                blob.size(),
                count,
                entry_size);
            return BulkAppendError::corrupted_data;
        }
        entries.reserve(count);
        for (uint32_t i = 0; i < count; ++i) {
            entries.emplace_back(blob.substr(size_t{i} * entry_size, entry_size));
        }
        return entries;
    }
    if (format != CHUNK_FORMAT_VARIABLE) {
        LOG_ERROR("unknown chunk blob format 0x{:02x}", format);
        return BulkAppendError::corrupted_data;
    }
    while (!blob.empty()) {
        if (entries.size() >= MAX_CHUNK_ENTRIES) {
            LOG_ERROR("variable chunk blob exceeds {} entries", MAX_CHUNK_ENTRIES);
            return BulkAppendError::corrupted_data;
        }
        auto const entry = [&]() -> Result<byte_string_view> {
            BOOST_OUTCOME_TRY(auto const len, consume_be<uint32_t>(blob));
            return consume_bytes(blob, len);
        }();
        if (entry.has_error()) {
            LOG_ERROR("variable chunk blob truncated");
            return BulkAppendError::corrupted_data;
        }
        entries.emplace_back(entry.value());
    }
    return entries;
}

GROVEDB_BULK_APPEND_NAMESPACE_END
