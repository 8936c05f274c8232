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

#include <grovedb/core/bytes.hpp>

#include <array>
#include <cstdint>
#include <mutex>

GROVEDB_COMMITMENT_TREE_NAMESPACE_BEGIN

inline constexpr uint8_t DEPTH = 32;
inline constexpr uint8_t SHARD_HEIGHT = 16;
inline constexpr uint64_t MAX_LEAVES = uint64_t{1} << DEPTH;

/// True when the little endian value is below the Pallas base field modulus
bool is_canonical(bytes32_t const &) noexcept;

/*
 * Node hashing of the note commitment tree. Leaves and nodes are elements of
 * the Pallas base field in canonical little endian form; an implementation
 * supplies the value of an unfilled leaf and the level separated compression
 * of two children. Orchard uses Sinsemilla here.
 */
class MerkleHasher
{
    mutable std::once_flag empty_roots_once_;
    mutable std::array<bytes32_t, DEPTH + 1> empty_roots_;

public:
    MerkleHasher() = default;
    MerkleHasher(MerkleHasher const &) = delete;
    MerkleHasher &operator=(MerkleHasher const &) = delete;
    virtual ~MerkleHasher() = default;

    /// Value of a leaf that was never appended
    virtual bytes32_t empty_leaf() const = 0;

    /// Parent of two nodes at `level`, the parent sits at `level + 1`
    virtual bytes32_t combine(
        uint8_t level, bytes32_t const &left, bytes32_t const &right) const = 0;

    /// Root of a subtree of height `level` holding no leaves, for 0..=DEPTH
    bytes32_t const &empty_root(uint8_t level) const;
};

/// blake3 of the level and both children, truncated to 254 bits so that
/// every output is again a canonical field element. The unfilled leaf is 2.
class Blake3MerkleHasher final : public MerkleHasher
{
public:
    bytes32_t empty_leaf() const override;
    bytes32_t combine(
        uint8_t level, bytes32_t const &left,
        bytes32_t const &right) const override;
};

/// Hasher used when none is given
MerkleHasher const &default_merkle_hasher();

GROVEDB_COMMITMENT_TREE_NAMESPACE_END
