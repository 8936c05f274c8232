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

#include <grovedb/merk/config.hpp>

#include <grovedb/core/byte_string.hpp>
#include <grovedb/core/result.hpp>
#include <grovedb/merk/proofs/node.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

GROVEDB_MERK_NAMESPACE_BEGIN

inline constexpr size_t MAX_PROOF_SIZE = 100 * 1024 * 1024;

struct Op
{
    enum class Kind : uint8_t
    {
        parent = 0x00,
        parent_inverted = 0x01,
        child = 0x02,
        child_inverted = 0x03,
        push = 0x10,
        push_inverted = 0x11,
    };

    Kind kind{Kind::push};
    Node node{};

    bool operator==(Op const &) const = default;

    static Op push(Node node)
    {
        return {.kind = Kind::push, .node = std::move(node)};
    }

    static Op push_inverted(Node node)
    {
        return {.kind = Kind::push_inverted, .node = std::move(node)};
    }

    static Op parent()
    {
        return {.kind = Kind::parent};
    }

    static Op parent_inverted()
    {
        return {.kind = Kind::parent_inverted};
    }

    static Op child()
    {
        return {.kind = Kind::child};
    }

    static Op child_inverted()
    {
        return {.kind = Kind::child_inverted};
    }

    bool is_push() const noexcept
    {
        return kind == Kind::push || kind == Kind::push_inverted;
    }
};

void encode_ops(std::span<Op const>, byte_string &out);
byte_string encode_ops(std::span<Op const>);
Result<std::vector<Op>> decode_ops(byte_string_view);

GROVEDB_MERK_NAMESPACE_END
