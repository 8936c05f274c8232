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
#include <grovedb/core/hex_literal.hpp>
#include <grovedb/query/query.hpp>

#include <span>
#include <string>

GROVEDB_NAMESPACE_BEGIN

using query::Path;

inline Path child_path(Path const &path, byte_string_view const key)
{
    Path child = path;
    child.emplace_back(key);
    return child;
}

inline std::string path_to_string(std::span<byte_string const> const path)
{
    std::string s = "[";
    for (size_t i = 0; i < path.size(); ++i) {
        if (i) {
            s += "/";
        }
        s += to_hex(path[i]);
    }
    return s + "]";
}

GROVEDB_NAMESPACE_END
