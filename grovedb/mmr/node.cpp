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

#include <grovedb/mmr/node.hpp>

#include <grovedb/core/blake3.hpp>
#include <grovedb/core/codec.hpp>
#include <grovedb/mmr/mmr_error.hpp>

#include <quill/Quill.h>

#include <limits>

GROVEDB_MMR_NAMESPACE_BEGIN

namespace
{
    constexpr unsigned char LEAF_TAG = 0x00;
    constexpr unsigned char INTERNAL_TAG = 0x01;

    constexpr unsigned char FLAG_INTERNAL = 0x00;
    constexpr unsigned char FLAG_LEAF = 0x01;
    constexpr unsigned char FLAG_DATA_LEAF = 0x02;
}

bytes32_t leaf_hash(byte_string_view const value)
{
    return Blake3Hasher{}.update(LEAF_TAG).update(value).finalize();
}

bytes32_t merge_hash(bytes32_t const &left, bytes32_t const &right)
{
    return Blake3Hasher{}
        .update(INTERNAL_TAG)
        .update(left)
        .update(right)
        .finalize();
}

MmrNode MmrNode::leaf(byte_string value)
{
    bytes32_t const hash = leaf_hash(value);
    return MmrNode{hash, std::move(value), false};
}

MmrNode MmrNode::internal(bytes32_t const &hash)
{
    return MmrNode{hash, std::nullopt, false};
}

MmrNode MmrNode::data_leaf(bytes32_t const &hash, byte_string data)
{
    return MmrNode{hash, std::move(data), true};
}

MmrNode MmrNode::merge(MmrNode const &left, MmrNode const &right)
{
    return internal(merge_hash(left.hash_, right.hash_));
}

Result<byte_string> MmrNode::serialize() const
{
    byte_string out;
    if (!value_.has_value()) {
        out.reserve(33);
        out.push_back(FLAG_INTERNAL);
        append_bytes32(out, hash_);
        return out;
    }
    if (value_->size() > std::numeric_limits<uint32_t>::max()) {
        LOG_ERROR("mmr node value of {} bytes is too large", value_->size());
        return MmrError::invalid_data;
    }
    out.reserve(37 + value_->size());
    out.push_back(is_data_leaf_ ? FLAG_DATA_LEAF : FLAG_LEAF);
    append_bytes32(out, hash_);
    append_be(out, static_cast<uint32_t>(value_->size()));
    out.append(*value_);
    return out;
}

Result<MmrNode> MmrNode::deserialize(byte_string_view const data)
{
    if (data.size() < 33) {
        LOG_ERROR("mmr node of {} bytes is too short", data.size());
        return MmrError::invalid_data;
    }
    unsigned char const flag = data[0];
    bytes32_t const hash = to_bytes(data.substr(1, 32));
    switch (flag) {
    case FLAG_INTERNAL:
        if (data.size() != 33) {
            LOG_ERROR(
                "internal mmr node has {} trailing bytes", data.size() - 33);
            return MmrError::invalid_data;
        }
        return internal(hash);
    case FLAG_LEAF:
    case FLAG_DATA_LEAF: {
        if (data.size() < 37) {
            LOG_ERROR("mmr leaf is missing its value length");
            return MmrError::invalid_data;
        }
        auto const len = load_be<uint32_t>(data.data() + 33);
        if (data.size() != 37 + static_cast<size_t>(len)) {
            LOG_ERROR(
                "mmr leaf expected {} bytes, got {}",
                37 + static_cast<size_t>(len),
                data.size());
            return MmrError::invalid_data;
        }
        byte_string value{data.substr(37)};
        if (flag == FLAG_LEAF && leaf_hash(value) != hash) {
            LOG_ERROR("mmr leaf hash does not match its value");
            return MmrError::invalid_data;
        }
        return MmrNode{hash, std::move(value), flag == FLAG_DATA_LEAF};
    }
    default:
        LOG_ERROR("unknown mmr node flag {:#04x}", flag);
        return MmrError::invalid_data;
    }
}

GROVEDB_MMR_NAMESPACE_END
