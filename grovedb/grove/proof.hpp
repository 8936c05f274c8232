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

#include <grovedb/core/config.hpp>

#include <grovedb/core/byte_string.hpp>
#include <grovedb/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

GROVEDB_NAMESPACE_BEGIN

inline constexpr uint8_t GROVE_PROOF_VERSION = 1;
inline constexpr size_t MAX_GROVE_PROOF_DECODE_SIZE = 100 * 1024 * 1024;
// nesting of layers accepted by decode
inline constexpr size_t MAX_GROVE_PROOF_DEPTH = 512;

/// Merk proof of one subtree plus the proofs of the subtrees it descends
/// into, each keyed by its tree element in this merk
struct LayerProof
{
    // key of this subtree in the parent merk, empty at the root
    byte_string key;
    byte_string merk_proof;
    // strictly ascending keys
    std::vector<LayerProof> lower_layers;

    LayerProof const *lower_layer(byte_string_view key) const;
};

/*
 * Proof of a path query, rooted at the root merk. Each path segment is a
 * layer proving the single key leading to the next subtree; the layer at the
 * query path proves the query, and matched trees with a subquery branch get
 * lower layers for the subquery path and the subquery below them.
 */
class GroveDbProof
{
    LayerProof root_layer_;

public:
    GroveDbProof() = default;

    explicit GroveDbProof(LayerProof root_layer)
        : root_layer_{std::move(root_layer)}
    {
    }

    LayerProof const &root_layer() const noexcept
    {
        return root_layer_;
    }

    LayerProof &root_layer() noexcept
    {
        return root_layer_;
    }

    byte_string encode() const;
    static Result<GroveDbProof> decode(byte_string_view);
};

GROVEDB_NAMESPACE_END
