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

#include <grovedb/commitment_tree/config.hpp>

#include <grovedb/core/byte_string.hpp>
#include <grovedb/core/bytes.hpp>
#include <grovedb/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

GROVEDB_COMMITMENT_TREE_NAMESPACE_BEGIN

enum RetentionFlags : uint8_t
{
    EPHEMERAL = 0,
    CHECKPOINT = 1,
    MARKED = 2,
};

enum class NodeKind : uint8_t
{
    nil = 0,
    leaf = 1,
    parent = 2,
};

struct Node;

/// Immutable, structurally shared subtree. Never null, empty is a nil node.
using Tree = std::shared_ptr<Node const>;

/*
 * Sparse subtree of the note commitment tree. A leaf at level zero is an
 * appended commitment; a leaf higher up stands for a pruned, fully appended
 * subtree and holds its root. Parents may cache their root in `ann` once
 * complete.
 */
struct Node
{
    NodeKind kind{NodeKind::nil};
    bytes32_t hash{};
    uint8_t flags{EPHEMERAL};
    std::optional<bytes32_t> ann;
    Tree left;
    Tree right;

    bool is_nil() const noexcept
    {
        return kind == NodeKind::nil;
    }

    bool is_leaf() const noexcept
    {
        return kind == NodeKind::leaf;
    }

    bool is_parent() const noexcept
    {
        return kind == NodeKind::parent;
    }
};

Tree make_nil();
Tree make_leaf(bytes32_t const &hash, uint8_t flags);
Tree make_parent(std::optional<bytes32_t> const &ann, Tree left, Tree right);

bool tree_equal(Tree const &, Tree const &);

inline constexpr size_t MAX_DESERIALIZE_DEPTH = 64;

/// Nil = 0x00, Leaf = 0x01 || hash[32] || flags,
/// Parent = 0x02 || has_ann || ann[32]? || left || right
byte_string serialize_tree(Tree const &);
Result<Tree> deserialize_tree(byte_string_view);

GROVEDB_COMMITMENT_TREE_NAMESPACE_END
