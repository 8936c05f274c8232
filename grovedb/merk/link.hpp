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
#include <grovedb/core/bytes.hpp>
#include <grovedb/core/result.hpp>
#include <grovedb/merk/tree_feature_type.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <variant>

GROVEDB_MERK_NAMESPACE_BEGIN

class TreeNode;

struct ChildHeights
{
    uint8_t left{0};
    uint8_t right{0};

    bool operator==(ChildHeights const &) const = default;
};

/* A link from a parent to one child. Through one write cycle a link moves
 * Reference -> Modified -> Uncommitted -> Loaded -> Reference:
 * - Reference: the child lives only in storage
 * - Modified: the child changed; its hash is stale
 * - Uncommitted: hash recomputed but the child is not yet written out
 * - Loaded: child in memory and in sync with storage
 */
class Link
{
public:
    struct Reference
    {
        bytes32_t hash;
        ChildHeights child_heights;
        byte_string key;
        AggregateData aggregate_data;
    };

    struct Modified
    {
        size_t pending_writes;
        ChildHeights child_heights;
        std::unique_ptr<TreeNode> tree;
    };

    struct Uncommitted
    {
        bytes32_t hash;
        ChildHeights child_heights;
        std::unique_ptr<TreeNode> tree;
        AggregateData aggregate_data;
    };

    struct Loaded
    {
        bytes32_t hash;
        ChildHeights child_heights;
        std::unique_ptr<TreeNode> tree;
        AggregateData aggregate_data;
    };

private:
    std::variant<Reference, Modified, Uncommitted, Loaded> v_;

public:
    Link(Reference);
    Link(Modified);
    Link(Uncommitted);
    Link(Loaded);
    Link(Link &&) noexcept;
    Link &operator=(Link &&) noexcept;
    ~Link();

    static Link from_modified_tree(std::unique_ptr<TreeNode> tree);

    bool is_reference() const noexcept
    {
        return std::holds_alternative<Reference>(v_);
    }

    bool is_modified() const noexcept
    {
        return std::holds_alternative<Modified>(v_);
    }

    bool is_uncommitted() const noexcept
    {
        return std::holds_alternative<Uncommitted>(v_);
    }

    bool is_loaded() const noexcept
    {
        return std::holds_alternative<Loaded>(v_);
    }

    byte_string_view key() const;

    // null for a reference
    TreeNode *tree() const noexcept;

    // not available while modified
    bytes32_t const &hash() const;
    AggregateData const &aggregate_data() const;

    ChildHeights child_heights() const noexcept;

    uint8_t height() const noexcept
    {
        auto const h = child_heights();
        return static_cast<uint8_t>(1 + std::max(h.left, h.right));
    }

    int balance_factor() const noexcept
    {
        auto const h = child_heights();
        return static_cast<int>(h.right) - static_cast<int>(h.left);
    }

    size_t pending_writes() const noexcept;

    /// Moves the child out; the link must be discarded afterwards
    std::unique_ptr<TreeNode> take_tree();

    // Modified -> Uncommitted
    void set_hashed(bytes32_t const &hash, AggregateData const &aggregate);

    // Uncommitted -> Loaded
    void set_written();

    /// Drops the in-memory child of a hashed link, keeping a reference
    void prune();

    // Stored form, available once hashed:
    // key_len u8 | key | hash | left_h | right_h | agg tag | agg payload
    size_t encoded_size() const;
    void encode(byte_string &out) const;
    static Result<Link> decode(byte_string_view &enc);
};

GROVEDB_MERK_NAMESPACE_END
