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

#include <grovedb/commitment_tree/merkle_hash.hpp>

#include <grovedb/core/assert.h>
#include <grovedb/core/blake3.hpp>

#include <mutex>

GROVEDB_COMMITMENT_TREE_NAMESPACE_BEGIN

namespace
{
    // 0x40000000000000000000000000000000224698fc094cf91b992d30ed00000001
    constexpr unsigned char PALLAS_MODULUS_LE[32] = {
        0x01, 0x00, 0x00, 0x00, 0xed, 0x30, 0x2d, 0x99, 0x1b, 0xf9, 0x4c,
        0x09, 0xfc, 0x98, 0x46, 0x22, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
        0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x40};
}

bool is_canonical(bytes32_t const &value) noexcept
{
    for (size_t i = sizeof(value.bytes); i-- > 0;) {
        if (value.bytes[i] != PALLAS_MODULUS_LE[i]) {
            return value.bytes[i] < PALLAS_MODULUS_LE[i];
        }
    }
    return false;
}

bytes32_t const &MerkleHasher::empty_root(uint8_t const level) const
{
    GROVEDB_ASSERT(level <= DEPTH);
    std::call_once(empty_roots_once_, [this] {
        empty_roots_[0] = empty_leaf();
        for (uint8_t l = 0; l < DEPTH; ++l) {
            empty_roots_[l + 1u] = combine(l, empty_roots_[l], empty_roots_[l]);
        }
    });
    return empty_roots_[level];
}

bytes32_t Blake3MerkleHasher::empty_leaf() const
{
    bytes32_t leaf{};
    leaf.bytes[0] = 2;
    return leaf;
}

bytes32_t Blake3MerkleHasher::combine(
    uint8_t const level, bytes32_t const &left, bytes32_t const &right) const
{
    bytes32_t out =
        Blake3Hasher{}.update(level).update(left).update(right).finalize();
    out.bytes[31] &= 0x3f;
    return out;
}

MerkleHasher const &default_merkle_hasher()
{
    static Blake3MerkleHasher const hasher;
    return hasher;
}

GROVEDB_COMMITMENT_TREE_NAMESPACE_END
