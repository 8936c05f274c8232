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
#include <grovedb/costs/cost_context.hpp>
#include <grovedb/merk/link.hpp>
#include <grovedb/merk/proofs/node.hpp>
#include <grovedb/merk/proofs/op.hpp>
#include <grovedb/merk/tree_feature_type.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <utility>
#include <vector>

GROVEDB_MERK_NAMESPACE_BEGIN

class ProofTree;

struct ProofChild
{
    std::unique_ptr<ProofTree> tree;
    bytes32_t hash;
};

/// The subset of a merk reconstructed from a proof
class ProofTree
{
    Node node_;
    std::optional<ProofChild> left_;
    std::optional<ProofChild> right_;
    uint8_t height_{1};
    ChildHeights child_heights_{};

    std::optional<ProofChild> &slot(bool const left) noexcept
    {
        return left ? left_ : right_;
    }

public:
    explicit ProofTree(Node node)
        : node_{std::move(node)}
    {
    }

    Node const &node() const noexcept
    {
        return node_;
    }

    uint8_t height() const noexcept
    {
        return height_;
    }

    ChildHeights child_heights() const noexcept
    {
        return child_heights_;
    }

    ProofChild const *child(bool const left) const noexcept
    {
        auto const &s = left ? left_ : right_;
        return s.has_value() ? &*s : nullptr;
    }

    bytes32_t const &child_hash(bool left) const noexcept;

    // null for nodes without a key
    byte_string const *key() const noexcept
    {
        return node_.has_key() ? &node_.key : nullptr;
    }

    CostContext<bytes32_t> hash() const;

    /// Attaches `child` on an empty side
    CostResult<void> attach(bool left, std::unique_ptr<ProofTree> child);

    /// Replaces the subtree by a hash node of equal height
    CostContext<std::unique_ptr<ProofTree>> into_hash() const;

    /// Aggregate data carried by feature type nodes
    std::optional<AggregateData> aggregate_data() const;

    /// In-order walk over every node of the tree
    Result<void>
    visit_refs(std::function<Result<void>(ProofTree const &)> const &) const;

    /// Nodes at `depth` below this one, left to right
    std::vector<ProofTree const *> layer(size_t depth) const;
};

using NodeVisitor = std::function<Result<void>(Node const &)>;

/// Replays `ops`, calling `visit_node` for every pushed node. With
/// `collapse` each attached subtree is kept only as its hash.
CostResult<std::unique_ptr<ProofTree>> execute(
    std::span<Op const> ops, bool collapse, NodeVisitor const &visit_node = {});

GROVEDB_MERK_NAMESPACE_END
