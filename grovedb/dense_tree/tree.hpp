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

#include <grovedb/dense_tree/config.hpp>

#include <grovedb/core/byte_string.hpp>
#include <grovedb/core/bytes.hpp>
#include <grovedb/costs/cost_context.hpp>
#include <grovedb/dense_tree/hash.hpp>
#include <grovedb/dense_tree/store.hpp>

#include <cstdint>
#include <optional>

GROVEDB_DENSE_TREE_NAMESPACE_BEGIN

struct DenseInsertResult
{
    bytes32_t root_hash;
    uint16_t position;
};

/*
 * Complete binary tree of fixed height filled in level order: position p has
 * children 2p+1 and 2p+2 and every position, internal ones included, holds a
 * value. Only the first `count` positions are populated; the rest hash to
 * EMPTY_NODE_HASH.
 */
class DenseFixedSizedMerkleTree
{
    uint8_t height_;
    uint16_t count_{0};

    DenseFixedSizedMerkleTree(uint8_t const height, uint16_t const count)
        : height_{height}
        , count_{count}
    {
    }

    CostResult<bytes32_t> hash_node(uint16_t position, DenseTreeStore &) const;

public:
    static Result<DenseFixedSizedMerkleTree> create(uint8_t height);
    static Result<DenseFixedSizedMerkleTree>
    from_state(uint8_t height, uint16_t count);

    uint8_t height() const noexcept
    {
        return height_;
    }

    uint16_t count() const noexcept
    {
        return count_;
    }

    uint16_t capacity() const noexcept
    {
        return static_cast<uint16_t>(capacity_for_height(height_));
    }

    bool is_full() const noexcept
    {
        return count_ >= capacity();
    }

    /// First position without children
    uint16_t first_leaf() const noexcept
    {
        return static_cast<uint16_t>((capacity() - 1) / 2);
    }

    /// Writes `value` at the next position; fails with tree_full at capacity
    CostResult<DenseInsertResult>
    insert(byte_string_view value, DenseTreeStore &);

    /// As insert, but a full tree yields no result instead of an error
    CostResult<std::optional<DenseInsertResult>>
    try_insert(byte_string_view value, DenseTreeStore &);

    CostResult<std::optional<byte_string>>
    get(uint16_t position, DenseTreeStore &) const;

    /// EMPTY_NODE_HASH for an empty tree
    CostResult<bytes32_t> root_hash(DenseTreeStore &) const;

    CostResult<bytes32_t>
    hash_position(uint16_t position, DenseTreeStore &) const;
};

GROVEDB_DENSE_TREE_NAMESPACE_END
