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

#include <grovedb/commitment_tree/node.hpp>

#include <grovedb/commitment_tree/commitment_tree_error.hpp>
#include <grovedb/core/codec.hpp>

#include <quill/Quill.h>

#include <utility>

GROVEDB_COMMITMENT_TREE_NAMESPACE_BEGIN

namespace
{
    void serialize_into(byte_string &out, Node const &node)
    {
        switch (node.kind) {
        case NodeKind::nil:
            out.push_back(0x00);
            return;
        case NodeKind::leaf:
            out.push_back(0x01);
            append_bytes32(out, node.hash);
            out.push_back(node.flags);
            return;
        case NodeKind::parent:
            out.push_back(0x02);
            out.push_back(node.ann.has_value() ? 1 : 0);
            if (node.ann.has_value()) {
                append_bytes32(out, *node.ann);
            }
            serialize_into(out, *node.left);
            serialize_into(out, *node.right);
            return;
        }
    }

    Result<Tree> deserialize_bounded(byte_string_view &enc, size_t const depth)
    {
        if (depth > MAX_DESERIALIZE_DEPTH) {
            LOG_ERROR(
                "tree exceeds maximum nesting depth of {}",
                MAX_DESERIALIZE_DEPTH);
            return CommitmentTreeError::invalid_data;
        }
        BOOST_OUTCOME_TRY(auto const tag, consume_byte(enc));
        switch (tag) {
        case 0x00:
            return make_nil();
        case 0x01: {
            BOOST_OUTCOME_TRY(auto const hash, consume_bytes32(enc));
            BOOST_OUTCOME_TRY(auto const flags, consume_byte(enc));
            return make_leaf(
                hash, static_cast<uint8_t>(flags & (CHECKPOINT | MARKED)));
        }
        case 0x02: {
            BOOST_OUTCOME_TRY(auto const has_ann, consume_byte(enc));
            std::optional<bytes32_t> ann;
            if (has_ann == 1) {
                BOOST_OUTCOME_TRY(ann, consume_bytes32(enc));
            }
            else if (has_ann != 0) {
                LOG_ERROR("invalid annotation flag {}", has_ann);
                return CommitmentTreeError::invalid_data;
            }
            BOOST_OUTCOME_TRY(auto left, deserialize_bounded(enc, depth + 1));
            BOOST_OUTCOME_TRY(auto right, deserialize_bounded(enc, depth + 1));
            return make_parent(ann, std::move(left), std::move(right));
        }
        default:
            LOG_ERROR("invalid tree node tag {}", tag);
            return CommitmentTreeError::invalid_data;
        }
    }
}

Tree make_nil()
{
    static Tree const nil = std::make_shared<Node const>();
    return nil;
}

Tree make_leaf(bytes32_t const &hash, uint8_t const flags)
{
    return std::make_shared<Node const>(
        Node{.kind = NodeKind::leaf, .hash = hash, .flags = flags});
}

Tree make_parent(std::optional<bytes32_t> const &ann, Tree left, Tree right)
{
    return std::make_shared<Node const>(Node{
        .kind = NodeKind::parent,
        .ann = ann,
        .left = std::move(left),
        .right = std::move(right)});
}

bool tree_equal(Tree const &a, Tree const &b)
{
    if (a == b) {
        return true;
    }
    if (a->kind != b->kind) {
        return false;
    }
    switch (a->kind) {
    case NodeKind::nil:
        return true;
    case NodeKind::leaf:
        return a->hash == b->hash && a->flags == b->flags;
    case NodeKind::parent:
        return a->ann == b->ann && tree_equal(a->left, b->left) &&
               tree_equal(a->right, b->right);
    }
    return false;
}

byte_string serialize_tree(Tree const &tree)
{
    byte_string out;
    serialize_into(out, *tree);
    return out;
}

Result<Tree> deserialize_tree(byte_string_view enc)
{
    auto tree = deserialize_bounded(enc, 0);
    if (tree.has_error()) {
        return CommitmentTreeError::invalid_data;
    }
    if (!enc.empty()) {
        LOG_ERROR("{} trailing bytes after serialized tree", enc.size());
        return CommitmentTreeError::invalid_data;
    }
    return tree;
}

GROVEDB_COMMITMENT_TREE_NAMESPACE_END
