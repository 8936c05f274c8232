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

#include <cstdint>
#include <string>
#include <utility>

GROVEDB_MERK_NAMESPACE_BEGIN

enum class NodeKind : uint8_t
{
    hash = 0x01,
    kv_hash = 0x02,
    kv = 0x03,
    kv_value_hash = 0x04,
    kv_digest = 0x05,
    kv_ref_value_hash = 0x06,
    kv_value_hash_feature_type = 0x07,
    kv_count = 0x08,
    kv_hash_count = 0x09,
    kv_ref_value_hash_count = 0x0a,
    kv_digest_count = 0x0b,
};

/* A node of a proof. Which fields are meaningful depends on the kind:
 * - hash: `hash` is the node hash of a pruned subtree
 * - kv_hash, kv_hash_count: `hash` is the kv hash
 * - kv, kv_count: key and value, the value hash is recomputed
 * - kv_digest, kv_digest_count: key and `hash` as value hash, no value
 * - kv_value_hash, kv_value_hash_feature_type: key, value and `hash` as the
 *   value hash
 * - kv_ref_value_hash, kv_ref_value_hash_count: key, the referenced value
 *   and `hash` as the value hash of the reference element itself
 * The count kinds carry the subtree count committed by provable count
 * trees.
 */
struct Node
{
    NodeKind kind{NodeKind::hash};
    byte_string key{};
    byte_string value{};
    bytes32_t hash{};
    TreeFeatureType feature_type{};
    uint64_t count{0};

    bool operator==(Node const &) const = default;

    static Node make_hash(bytes32_t const &h)
    {
        return {.kind = NodeKind::hash, .hash = h};
    }

    static Node make_kv_hash(bytes32_t const &kv_hash)
    {
        return {.kind = NodeKind::kv_hash, .hash = kv_hash};
    }

    static Node make_kv(byte_string key, byte_string value)
    {
        return {
            .kind = NodeKind::kv,
            .key = std::move(key),
            .value = std::move(value)};
    }

    static Node make_kv_value_hash(
        byte_string key, byte_string value, bytes32_t const &value_hash)
    {
        return {
            .kind = NodeKind::kv_value_hash,
            .key = std::move(key),
            .value = std::move(value),
            .hash = value_hash};
    }

    static Node make_kv_digest(byte_string key, bytes32_t const &value_hash)
    {
        return {
            .kind = NodeKind::kv_digest,
            .key = std::move(key),
            .hash = value_hash};
    }

    static Node make_kv_ref_value_hash(
        byte_string key, byte_string referenced_value,
        bytes32_t const &node_value_hash)
    {
        return {
            .kind = NodeKind::kv_ref_value_hash,
            .key = std::move(key),
            .value = std::move(referenced_value),
            .hash = node_value_hash};
    }

    static Node make_kv_value_hash_feature_type(
        byte_string key, byte_string value, bytes32_t const &value_hash,
        TreeFeatureType const &feature_type)
    {
        return {
            .kind = NodeKind::kv_value_hash_feature_type,
            .key = std::move(key),
            .value = std::move(value),
            .hash = value_hash,
            .feature_type = feature_type};
    }

    static Node make_kv_count(byte_string key, byte_string value, uint64_t count)
    {
        return {
            .kind = NodeKind::kv_count,
            .key = std::move(key),
            .value = std::move(value),
            .count = count};
    }

    static Node make_kv_hash_count(bytes32_t const &kv_hash, uint64_t count)
    {
        return {.kind = NodeKind::kv_hash_count, .hash = kv_hash, .count = count};
    }

    static Node make_kv_ref_value_hash_count(
        byte_string key, byte_string referenced_value,
        bytes32_t const &node_value_hash, uint64_t count)
    {
        return {
            .kind = NodeKind::kv_ref_value_hash_count,
            .key = std::move(key),
            .value = std::move(referenced_value),
            .hash = node_value_hash,
            .count = count};
    }

    static Node make_kv_digest_count(
        byte_string key, bytes32_t const &value_hash, uint64_t count)
    {
        return {
            .kind = NodeKind::kv_digest_count,
            .key = std::move(key),
            .hash = value_hash,
            .count = count};
    }

    bool has_key() const noexcept
    {
        return kind != NodeKind::hash && kind != NodeKind::kv_hash &&
               kind != NodeKind::kv_hash_count;
    }

    bool has_value() const noexcept
    {
        return has_key() && kind != NodeKind::kv_digest &&
               kind != NodeKind::kv_digest_count;
    }

    // node hash commits to a subtree count
    bool is_counted() const noexcept
    {
        switch (kind) {
        case NodeKind::kv_count:
        case NodeKind::kv_hash_count:
        case NodeKind::kv_ref_value_hash_count:
        case NodeKind::kv_digest_count:
            return true;
        case NodeKind::kv_value_hash_feature_type:
            return is_provable_count(feature_type.tag);
        default:
            return false;
        }
    }

    uint64_t committed_count() const noexcept
    {
        return kind == NodeKind::kv_value_hash_feature_type ? feature_type.count
                                                            : count;
    }

    void encode(byte_string &) const;
    static Result<Node> decode(byte_string_view &);

    std::string to_string() const;
};

GROVEDB_MERK_NAMESPACE_END
