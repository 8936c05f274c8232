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

#include <grovedb/merk/proofs/op.hpp>

#include <grovedb/core/byte_string.hpp>
#include <grovedb/core/codec.hpp>
#include <grovedb/core/error.hpp>
#include <grovedb/core/result.hpp>
#include <grovedb/merk/proofs/node.hpp>

#include <quill/Quill.h>

#include <span>
#include <vector>

GROVEDB_MERK_NAMESPACE_BEGIN

void encode_ops(std::span<Op const> const ops, byte_string &out)
{
    for (auto const &op : ops) {
        out.push_back(static_cast<unsigned char>(op.kind));
        if (op.is_push()) {
            op.node.encode(out);
        }
    }
}

byte_string encode_ops(std::span<Op const> const ops)
{
    byte_string out;
    encode_ops(ops, out);
    return out;
}

Result<std::vector<Op>> decode_ops(byte_string_view enc)
{
    if (enc.size() > MAX_PROOF_SIZE) {
        LOG_ERROR("proof of {} bytes exceeds the decode limit", enc.size());
        return Error::invalid_proof;
    }
    std::vector<Op> ops;
    while (!enc.empty()) {
        BOOST_OUTCOME_TRY(auto const tag, consume_byte(enc));
        switch (static_cast<Op::Kind>(tag)) {
        case Op::Kind::parent:
        case Op::Kind::parent_inverted:
        case Op::Kind::child:
        case Op::Kind::child_inverted:
            ops.push_back(Op{.kind = static_cast<Op::Kind>(tag)});
            break;
        case Op::Kind::push:
        case Op::Kind::push_inverted: {
            BOOST_OUTCOME_TRY(auto node, Node::decode(enc));
            ops.push_back(
                Op{.kind = static_cast<Op::Kind>(tag), .node = std::move(node)});
            break;
        }
        default:
            LOG_ERROR("unknown proof op tag {}", tag);
            return Error::invalid_proof;
        }
    }
    return ops;
}

GROVEDB_MERK_NAMESPACE_END
