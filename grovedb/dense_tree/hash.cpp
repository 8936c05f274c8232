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

#include <grovedb/dense_tree/hash.hpp>

#include <grovedb/core/blake3.hpp>
#include <grovedb/dense_tree/dense_tree_error.hpp>

#include <quill/Quill.h>

#include <bit>
#include <vector>

GROVEDB_DENSE_TREE_NAMESPACE_BEGIN

namespace
{
    constexpr unsigned char LEAF_DOMAIN_TAG = 0x00;
    constexpr unsigned char INTERNAL_DOMAIN_TAG = 0x01;
}

Result<void> validate_height(uint8_t const height)
{
    if (height < MIN_HEIGHT || height > MAX_HEIGHT) {
        LOG_ERROR("dense tree height {} is outside 1..=16", height);
        return DenseTreeError::invalid_height;
    }
    return outcome::success();
}

bytes32_t leaf_node_hash(byte_string_view const value)
{
    return Blake3Hasher{}.update(LEAF_DOMAIN_TAG).update(value).finalize();
}

bytes32_t internal_node_hash(
    bytes32_t const &value_hash, bytes32_t const &left, bytes32_t const &right)
{
    return Blake3Hasher{}
        .update(INTERNAL_DOMAIN_TAG)
        .update(value_hash)
        .update(left)
        .update(right)
        .finalize();
}

Result<bytes32_t>
compute_dense_merkle_root(std::span<bytes32_t const> const leaf_hashes)
{
    if (leaf_hashes.empty() || !std::has_single_bit(leaf_hashes.size())) {
        LOG_ERROR(
            "dense merkle root needs a power of two leaves, got {}",
            leaf_hashes.size());
        return DenseTreeError::invalid_data;
    }
    std::vector<bytes32_t> level(leaf_hashes.begin(), leaf_hashes.end());
    while (level.size() > 1) {
        std::vector<bytes32_t> next;
        next.reserve(level.size() / 2);
        for (size_t i = 0; i < level.size(); i += 2) {
            next.push_back(
                Blake3Hasher{}.update(level[i]).update(level[i + 1]).finalize());
        }
        level = std::move(next);
    }
    return level.front();
}

Result<std::pair<bytes32_t, uint32_t>>
compute_dense_merkle_root_from_values(std::span<byte_string const> const values)
{
    std::vector<bytes32_t> leaf_hashes;
    leaf_hashes.reserve(values.size());
    for (auto const &value : values) {
        leaf_hashes.push_back(blake3(value));
    }
    BOOST_OUTCOME_TRY(auto const root, compute_dense_merkle_root(leaf_hashes));
    // n leaf hashes and n - 1 internal ones
    auto const n = static_cast<uint32_t>(leaf_hashes.size());
    return std::pair{root, 2 * n - 1};
}

GROVEDB_DENSE_TREE_NAMESPACE_END
