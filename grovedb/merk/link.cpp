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

#include <grovedb/merk/link.hpp>

#include <grovedb/core/assert.h>
#include <grovedb/core/codec.hpp>
#include <grovedb/core/error.hpp>
#include <grovedb/merk/tree_node.hpp>

#include <utility>

GROVEDB_MERK_NAMESPACE_BEGIN

Link::Link(Reference r)
    : v_{std::move(r)}
{
}

Link::Link(Modified m)
    : v_{std::move(m)}
{
}

Link::Link(Uncommitted u)
    : v_{std::move(u)}
{
}

Link::Link(Loaded l)
    : v_{std::move(l)}
{
}

Link::Link(Link &&) noexcept = default;
Link &Link::operator=(Link &&) noexcept = default;
Link::~Link() = default;

Link Link::from_modified_tree(std::unique_ptr<TreeNode> tree)
{
    GROVEDB_ASSERT(tree);
    size_t const pending_writes = 1 + tree->child_pending_writes(true) +
                                  tree->child_pending_writes(false);
    auto const heights = tree->child_heights();
    return Modified{
        .pending_writes = pending_writes,
        .child_heights = heights,
        .tree = std::move(tree)};
}

byte_string_view Link::key() const
{
    if (auto const *r = std::get_if<Reference>(&v_)) {
        return r->key;
    }
    return tree()->key();
}

TreeNode *Link::tree() const noexcept
{
    return std::visit(
        [](auto const &l) -> TreeNode * {
            if constexpr (std::is_same_v<
                              std::decay_t<decltype(l)>,
                              Reference>) {
                return nullptr;
            }
            else {
                return l.tree.get();
            }
        },
        v_);
}

bytes32_t const &Link::hash() const
{
    return std::visit(
        [](auto const &l) -> bytes32_t const & {
            if constexpr (std::is_same_v<std::decay_t<decltype(l)>, Modified>) {
                GROVEDB_ABORT("hash of a modified link");
            }
            else {
                return l.hash;
            }
        },
        v_);
}

AggregateData const &Link::aggregate_data() const
{
    return std::visit(
        [](auto const &l) -> AggregateData const & {
            if constexpr (std::is_same_v<std::decay_t<decltype(l)>, Modified>) {
                GROVEDB_ABORT("aggregate of a modified link");
            }
            else {
                return l.aggregate_data;
            }
        },
        v_);
}

ChildHeights Link::child_heights() const noexcept
{
    return std::visit([](auto const &l) { return l.child_heights; }, v_);
}

size_t Link::pending_writes() const noexcept
{
    auto const *m = std::get_if<Modified>(&v_);
    return m ? m->pending_writes : 0;
}

std::unique_ptr<TreeNode> Link::take_tree()
{
    return std::visit(
        [](auto &l) -> std::unique_ptr<TreeNode> {
            if constexpr (std::is_same_v<std::decay_t<decltype(l)>, Reference>) {
                GROVEDB_ABORT("take_tree on a reference link");
            }
            else {
                return std::move(l.tree);
            }
        },
        v_);
}

void Link::set_hashed(bytes32_t const &hash, AggregateData const &aggregate)
{
    auto *m = std::get_if<Modified>(&v_);
    GROVEDB_ASSERT(m != nullptr);
    Uncommitted u{
        .hash = hash,
        .child_heights = m->child_heights,
        .tree = std::move(m->tree),
        .aggregate_data = aggregate};
    v_ = std::move(u);
}

void Link::set_written()
{
    auto *u = std::get_if<Uncommitted>(&v_);
    GROVEDB_ASSERT(u != nullptr);
    Loaded l{
        .hash = u->hash,
        .child_heights = u->child_heights,
        .tree = std::move(u->tree),
        .aggregate_data = u->aggregate_data};
    v_ = std::move(l);
}

void Link::prune()
{
    GROVEDB_ASSERT(!is_modified());
    if (is_reference()) {
        return;
    }
    Reference r{
        .hash = hash(),
        .child_heights = child_heights(),
        .key = byte_string{key()},
        .aggregate_data = aggregate_data()};
    v_ = std::move(r);
}

size_t Link::encoded_size() const
{
    return 1 + key().size() + HASH_LENGTH + 2 + 1 +
           aggregate_data().payload_len();
}

void Link::encode(byte_string &out) const
{
    auto const k = key();
    GROVEDB_ASSERT(k.size() <= 255);
    auto const heights = child_heights();
    auto const &aggregate = aggregate_data();
    out.push_back(static_cast<unsigned char>(k.size()));
    out.append(k);
    append_bytes32(out, hash());
    out.push_back(heights.left);
    out.push_back(heights.right);
    out.push_back(static_cast<unsigned char>(aggregate.tag));
    aggregate.encode_fixed(out);
}

Result<Link> Link::decode(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const key_len, consume_byte(enc));
    BOOST_OUTCOME_TRY(auto const key, consume_bytes(enc, key_len));
    BOOST_OUTCOME_TRY(auto const hash, consume_bytes32(enc));
    BOOST_OUTCOME_TRY(auto const left_height, consume_byte(enc));
    BOOST_OUTCOME_TRY(auto const right_height, consume_byte(enc));
    BOOST_OUTCOME_TRY(auto const tag_byte, consume_byte(enc));
    BOOST_OUTCOME_TRY(auto const tag, decode_feature_tag(tag_byte));
    BOOST_OUTCOME_TRY(auto aggregate, AggregateData::decode_fixed(tag, enc));
    return Link{Reference{
        .hash = hash,
        .child_heights = {.left = left_height, .right = right_height},
        .key = byte_string{key},
        .aggregate_data = aggregate}};
}

GROVEDB_MERK_NAMESPACE_END
