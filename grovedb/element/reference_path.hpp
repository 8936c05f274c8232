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
#include <grovedb/core/result.hpp>
#include <grovedb/query/query.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

GROVEDB_NAMESPACE_BEGIN

using query::Path;

/// How a reference names its target, relative to where the reference is
/// stored. Resolution yields the qualified path of the target: its parent
/// path followed by its key.
struct ReferencePathType
{
    // Part of the stored element encoding; do not reorder
    enum class Kind : uint8_t
    {
        // the stored path is the target
        absolute = 0,
        // keep the first `height` segments of the current path
        upstream_root_height = 1,
        // as above, then re-append the last segment of the current path
        upstream_root_height_with_parent_path_addition = 2,
        // drop the last `height` segments of the current path
        upstream_from_element_height = 3,
        // replace the parent with `key`, keep the reference's own key
        cousin = 4,
        // replace the parent with `path`, keep the reference's own key
        removed_cousin = 5,
        // `key` in the same subtree
        sibling = 6,
    };

    Kind kind{Kind::absolute};
    uint8_t height{0};
    Path path{};
    byte_string key{};

    bool operator==(ReferencePathType const &) const = default;

    static ReferencePathType absolute(Path path)
    {
        return {.kind = Kind::absolute, .path = std::move(path)};
    }

    static ReferencePathType upstream_root_height(uint8_t const n, Path path)
    {
        return {
            .kind = Kind::upstream_root_height,
            .height = n,
            .path = std::move(path)};
    }

    static ReferencePathType
    upstream_root_height_with_parent_path_addition(uint8_t const n, Path path)
    {
        return {
            .kind = Kind::upstream_root_height_with_parent_path_addition,
            .height = n,
            .path = std::move(path)};
    }

    static ReferencePathType
    upstream_from_element_height(uint8_t const n, Path path)
    {
        return {
            .kind = Kind::upstream_from_element_height,
            .height = n,
            .path = std::move(path)};
    }

    static ReferencePathType cousin(byte_string key)
    {
        return {.kind = Kind::cousin, .key = std::move(key)};
    }

    static ReferencePathType removed_cousin(Path path)
    {
        return {.kind = Kind::removed_cousin, .path = std::move(path)};
    }

    static ReferencePathType sibling(byte_string key)
    {
        return {.kind = Kind::sibling, .key = std::move(key)};
    }

    /// Qualified path of the target of a reference stored at
    /// `current_path`/`current_key`. Kinds that reuse the reference's key
    /// fail without one.
    Result<Path> absolute_qualified_path(
        std::span<byte_string const> current_path,
        std::optional<byte_string_view> current_key) const;

    /// The reference rewritten as an absolute one
    Result<ReferencePathType> to_absolute(
        std::span<byte_string const> current_path,
        std::optional<byte_string_view> current_key) const;

    uint32_t serialized_size() const noexcept;

    void encode(byte_string &) const;
    static Result<ReferencePathType> decode(byte_string_view &);

    std::string to_string() const;
};

GROVEDB_NAMESPACE_END
