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

#include <grovedb/element/reference_path.hpp>

#include <grovedb/core/assert.h>
#include <grovedb/core/bincode.hpp>
#include <grovedb/core/byte_string.hpp>
#include <grovedb/core/codec.hpp>
#include <grovedb/core/error.hpp>
#include <grovedb/core/hex_literal.hpp>
#include <grovedb/core/result.hpp>

#include <quill/Quill.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <utility>

GROVEDB_ANONYMOUS_NAMESPACE_BEGIN

Path to_path(std::span<byte_string const> const segments)
{
    return Path{segments.begin(), segments.end()};
}

uint32_t bytes_size(byte_string const &b)
{
    return varint_size(b.size()) + static_cast<uint32_t>(b.size());
}

uint32_t path_size(Path const &path)
{
    uint32_t n = varint_size(path.size());
    for (auto const &segment : path) {
        n += bytes_size(segment);
    }
    return n;
}

void append_path(byte_string &out, Path const &path)
{
    bincode::append_varint(out, path.size());
    for (auto const &segment : path) {
        bincode::append_bytes(out, segment);
    }
}

Result<Path> consume_path(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const len, bincode::consume_varint(enc));
    // every segment takes at least its length byte
    if (len > enc.size()) {
        return Error::corrupted_data;
    }
    Path path;
    path.reserve(static_cast<size_t>(len));
    for (uint64_t i = 0; i < len; ++i) {
        BOOST_OUTCOME_TRY(auto segment, bincode::consume_bytes(enc));
        path.push_back(std::move(segment));
    }
    return path;
}

std::string path_to_string(Path const &path)
{
    std::string s = "[";
    for (size_t i = 0; i < path.size(); ++i) {
        if (i) {
            s += ", ";
        }
        s += to_hex(path[i]);
    }
    return s + "]";
}

GROVEDB_ANONYMOUS_NAMESPACE_END

GROVEDB_NAMESPACE_BEGIN

Result<Path> ReferencePathType::absolute_qualified_path(
    std::span<byte_string const> const current_path,
    std::optional<byte_string_view> const current_key) const
{
    switch (kind) {
    case Kind::absolute:
        return path;
    case Kind::upstream_root_height:
    case Kind::upstream_root_height_with_parent_path_addition: {
        if (height > current_path.size()) {
            LOG_ERROR(
                "reference keeps {} segments of a path of length {}",
                height,
                current_path.size());
            return Error::invalid_input;
        }
        bool const add_parent =
            kind == Kind::upstream_root_height_with_parent_path_addition;
        if (add_parent && current_path.empty()) {
            return Error::invalid_input;
        }
        Path out = to_path(current_path.first(height));
        out.insert(out.end(), path.begin(), path.end());
        if (add_parent) {
            out.push_back(current_path.back());
        }
        return out;
    }
    case Kind::upstream_from_element_height: {
        if (height > current_path.size()) {
            LOG_ERROR(
                "reference discards {} segments of a path of length {}",
                height,
                current_path.size());
            return Error::invalid_input;
        }
        Path out = to_path(current_path.first(current_path.size() - height));
        out.insert(out.end(), path.begin(), path.end());
        return out;
    }
    case Kind::cousin:
    case Kind::removed_cousin: {
        if (current_path.empty()) {
            LOG_ERROR("cousin reference stored at the root");
            return Error::invalid_input;
        }
        if (!current_key.has_value()) {
            LOG_ERROR("cousin reference resolved without its own key");
            return Error::invalid_input;
        }
        Path out = to_path(current_path.first(current_path.size() - 1));
        if (kind == Kind::cousin) {
            out.push_back(key);
        }
        else {
            out.insert(out.end(), path.begin(), path.end());
        }
        out.emplace_back(*current_key);
        return out;
    }
    case Kind::sibling: {
        Path out = to_path(current_path);
        out.push_back(key);
        return out;
    }
    }
    return Error::invalid_input;
}

Result<ReferencePathType> ReferencePathType::to_absolute(
    std::span<byte_string const> const current_path,
    std::optional<byte_string_view> const current_key) const
{
    BOOST_OUTCOME_TRY(
        auto qualified, absolute_qualified_path(current_path, current_key));
    return absolute(std::move(qualified));
}

uint32_t ReferencePathType::serialized_size() const noexcept
{
    switch (kind) {
    case Kind::absolute:
    case Kind::removed_cousin:
        return 1 + path_size(path);
    case Kind::upstream_root_height:
    case Kind::upstream_root_height_with_parent_path_addition:
    case Kind::upstream_from_element_height:
        return 2 + path_size(path);
    case Kind::cousin:
    case Kind::sibling:
        return 1 + bytes_size(key);
    }
    return 0;
}

void ReferencePathType::encode(byte_string &out) const
{
    bincode::append_varint(out, static_cast<uint8_t>(kind));
    switch (kind) {
    case Kind::absolute:
    case Kind::removed_cousin:
        append_path(out, path);
        break;
    case Kind::upstream_root_height:
    case Kind::upstream_root_height_with_parent_path_addition:
    case Kind::upstream_from_element_height:
        out.push_back(height);
        append_path(out, path);
        break;
    case Kind::cousin:
    case Kind::sibling:
        bincode::append_bytes(out, key);
        break;
    }
}

Result<ReferencePathType> ReferencePathType::decode(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const tag, bincode::consume_varint(enc));
    if (tag > static_cast<uint8_t>(Kind::sibling)) {
        LOG_ERROR("unknown reference path type {}", tag);
        return Error::corrupted_data;
    }
    ReferencePathType ref{.kind = static_cast<Kind>(tag)};
    switch (ref.kind) {
    case Kind::absolute:
    case Kind::removed_cousin: {
        BOOST_OUTCOME_TRY(ref.path, consume_path(enc));
        break;
    }
    case Kind::upstream_root_height:
    case Kind::upstream_root_height_with_parent_path_addition:
    case Kind::upstream_from_element_height: {
        BOOST_OUTCOME_TRY(ref.height, consume_byte(enc));
        BOOST_OUTCOME_TRY(ref.path, consume_path(enc));
        break;
    }
    case Kind::cousin:
    case Kind::sibling: {
        BOOST_OUTCOME_TRY(ref.key, bincode::consume_bytes(enc));
        break;
    }
    }
    return ref;
}

std::string ReferencePathType::to_string() const
{
    switch (kind) {
    case Kind::absolute:
        return "AbsolutePathReference(" + path_to_string(path) + ")";
    case Kind::upstream_root_height:
        return "UpstreamRootHeightReference(" + std::to_string(height) + ", " +
               path_to_string(path) + ")";
    case Kind::upstream_root_height_with_parent_path_addition:
        return "UpstreamRootHeightWithParentPathAdditionReference(" +
               std::to_string(height) + ", " + path_to_string(path) + ")";
    case Kind::upstream_from_element_height:
        return "UpstreamFromElementHeightReference(" + std::to_string(height) +
               ", " + path_to_string(path) + ")";
    case Kind::cousin:
        return "CousinReference(" + to_hex(key) + ")";
    case Kind::removed_cousin:
        return "RemovedCousinReference(" + path_to_string(path) + ")";
    case Kind::sibling:
        return "SiblingReference(" + to_hex(key) + ")";
    }
    return "Unknown";
}

GROVEDB_NAMESPACE_END
