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

#include <grovedb/commitment_tree/merkle_hash.hpp>
#include <grovedb/core/byte_string.hpp>
#include <grovedb/core/bytes.hpp>
#include <grovedb/core/result.hpp>
#include <grovedb/costs/cost_context.hpp>

#include <cstdint>
#include <optional>
#include <vector>

GROVEDB_COMMITMENT_TREE_NAMESPACE_BEGIN

/*
 * Rightmost path of the note commitment tree: the last appended leaf plus the
 * left siblings ("ommers") of its ancestors, one for every set bit of the
 * leaf position, lowest level first. This is enough to append and to compute
 * the root in constant space.
 *
 * Serialized form:
 *   0x00                                               empty
 *   0x01 || position u64 BE || leaf[32] || u8 n || n * ommer[32]
 */
class CommitmentFrontier
{
    struct NonEmpty
    {
        uint64_t position;
        bytes32_t leaf;
        std::vector<bytes32_t> ommers;
    };

    MerkleHasher const *hasher_;
    std::optional<NonEmpty> frontier_;

public:
    explicit CommitmentFrontier(
        MerkleHasher const &hasher = default_merkle_hasher())
        : hasher_{&hasher}
    {
    }

    /// Appends a note commitment and returns the new root. Charges one
    /// Sinsemilla call per tree level plus one per ommer merge.
    CostResult<bytes32_t> append(bytes32_t const &cmx);

    bytes32_t root_hash() const;

    /// Position of the last appended leaf
    std::optional<uint64_t> position() const noexcept
    {
        if (!frontier_.has_value()) {
            return std::nullopt;
        }
        return frontier_->position;
    }

    uint64_t tree_size() const noexcept
    {
        return frontier_.has_value() ? frontier_->position + 1 : 0;
    }

    byte_string serialize() const;
    static Result<CommitmentFrontier> deserialize(
        byte_string_view, MerkleHasher const & = default_merkle_hasher());

    bool operator==(CommitmentFrontier const &other) const
    {
        return serialize() == other.serialize();
    }
};

GROVEDB_COMMITMENT_TREE_NAMESPACE_END
