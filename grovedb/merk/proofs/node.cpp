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

#include <grovedb/merk/proofs/node.hpp>

#include <grovedb/core/assert.h>
#include <grovedb/core/byte_string.hpp>
#include <grovedb/core/codec.hpp>
#include <grovedb/core/error.hpp>
#include <grovedb/core/hex_literal.hpp>
#include <grovedb/core/result.hpp>

#include <quill/Quill.h>

#include <cstdint>
#include <format>
#include <string>

GROVEDB_MERK_NAMESPACE_BEGIN

namespace
{
    void encode_key(byte_string &out, byte_string const &key)
    {
        GROVEDB_ASSERT(key.size() <= 0xff);
        out.push_back(static_cast<unsigned char>(key.size()));
        out.append(key);
    }

    void encode_value(byte_string &out, byte_string const &value)
    {
        GROVEDB_ASSERT(value.size() <= 0xffffffff);
        append_be(out, static_cast<uint32_t>(value.size()));
        out.append(value);
    }

    Result<byte_string> decode_key(byte_string_view &enc)
    {
        BOOST_OUTCOME_TRY(auto const len, consume_byte(enc));
        BOOST_OUTCOME_TRY(auto const key, consume_bytes(enc, len));
        return byte_string{key};
    }

    Result<byte_string> decode_value(byte_string_view &enc)
    {
        BOOST_OUTCOME_TRY(auto const len, consume_be<uint32_t>(enc));
        BOOST_OUTCOME_TRY(auto const value, consume_bytes(enc, len));
        return byte_string{value};
    }

    std::string_view kind_name(NodeKind const kind)
    {
        switch (kind) {
        case NodeKind::hash:
            return "Hash";
        case NodeKind::kv_hash:
            return "KVHash";
        case NodeKind::kv:
            return "KV";
        case NodeKind::kv_value_hash:
            return "KVValueHash";
        case NodeKind::kv_digest:
            return "KVDigest";
        case NodeKind::kv_ref_value_hash:
            return "KVRefValueHash";
        case NodeKind::kv_value_hash_feature_type:
            return "KVValueHashFeatureType";
        case NodeKind::kv_count:
            return "KVCount";
        case NodeKind::kv_hash_count:
            return "KVHashCount";
        case NodeKind::kv_ref_value_hash_count:
            return "KVRefValueHashCount";
        case NodeKind::kv_digest_count:
            return "KVDigestCount";
        }
        return "?";
    }
}

void Node::encode(byte_string &out) const
{
    out.push_back(static_cast<unsigned char>(kind));
    switch (kind) {
    case NodeKind::hash:
    case NodeKind::kv_hash:
        append_bytes32(out, hash);
        break;
    case NodeKind::kv_hash_count:
        append_bytes32(out, hash);
        append_varint(out, count);
        break;
    case NodeKind::kv:
        encode_key(out, key);
        encode_value(out, value);
        break;
    case NodeKind::kv_count:
        encode_key(out, key);
        encode_value(out, value);
        append_varint(out, count);
        break;
    case NodeKind::kv_digest:
        encode_key(out, key);
        append_bytes32(out, hash);
        break;
    case NodeKind::kv_digest_count:
        encode_key(out, key);
        append_bytes32(out, hash);
        append_varint(out, count);
        break;
    case NodeKind::kv_value_hash:
    case NodeKind::kv_ref_value_hash:
        encode_key(out, key);
        encode_value(out, value);
        append_bytes32(out, hash);
        break;
    case NodeKind::kv_ref_value_hash_count:
        encode_key(out, key);
        encode_value(out, value);
        append_bytes32(out, hash);
        append_varint(out, count);
        break;
    case NodeKind::kv_value_hash_feature_type:
        encode_key(out, key);
        encode_value(out, value);
        append_bytes32(out, hash);
        feature_type.encode(out);
        break;
    }
}

Result<Node> Node::decode(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const tag, consume_byte(enc));
    if (tag < static_cast<unsigned char>(NodeKind::hash) ||
        tag > static_cast<unsigned char>(NodeKind::kv_digest_count)) {
        LOG_ERROR("unknown proof node tag {}", tag);
        return Error::invalid_proof;
    }
    Node node{.kind = static_cast<NodeKind>(tag)};
    if (node.has_key()) {
        BOOST_OUTCOME_TRY(node.key, decode_key(enc));
    }
    if (node.has_value()) {
        BOOST_OUTCOME_TRY(node.value, decode_value(enc));
    }
    if (node.kind != NodeKind::kv && node.kind != NodeKind::kv_count) {
        BOOST_OUTCOME_TRY(node.hash, consume_bytes32(enc));
    }
    if (node.kind == NodeKind::kv_value_hash_feature_type) {
        BOOST_OUTCOME_TRY(node.feature_type, TreeFeatureType::decode(enc));
    }
    else if (node.is_counted()) {
        BOOST_OUTCOME_TRY(node.count, consume_varint(enc));
    }
    return node;
}

std::string Node::to_string() const
{
    switch (kind) {
    case NodeKind::hash:
    case NodeKind::kv_hash:
        return std::format("{}({})", kind_name(kind), to_hex(to_byte_string_view(hash)));
    case NodeKind::kv_hash_count:
        return std::format(
            "{}({}, {})", kind_name(kind), to_hex(to_byte_string_view(hash)), count);
    case NodeKind::kv:
        return std::format("{}({}, {})", kind_name(kind), to_hex(key), to_hex(value));
    case NodeKind::kv_count:
        return std::format(
            "{}({}, {}, {})", kind_name(kind), to_hex(key), to_hex(value), count);
    default:
        return std::format(
            "{}({}, {})", kind_name(kind), to_hex(key), to_hex(to_byte_string_view(hash)));
    }
}

GROVEDB_MERK_NAMESPACE_END
