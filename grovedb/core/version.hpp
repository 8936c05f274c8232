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

#include <grovedb/core/error.hpp>
#include <grovedb/core/result.hpp>

#include <cstdint>

GROVEDB_NAMESPACE_BEGIN

using FeatureVersion = uint16_t;

/// Per-method feature versions; passed by reference to versioned entry
/// points so that behaviour can be gated without global state
struct GroveVersion
{
    uint32_t protocol_version;

    struct MerkVersions
    {
        FeatureVersion apply;
        FeatureVersion prove;
        FeatureVersion verify;
        FeatureVersion chunk;
    } merk;

    struct ElementVersions
    {
        FeatureVersion serialize;
        FeatureVersion value_hash;
    } element;

    struct GroveDbVersions
    {
        FeatureVersion insert;
        FeatureVersion remove;
        FeatureVersion get;
        FeatureVersion prove_query;
        FeatureVersion verify_query;
    } grovedb;

    static GroveVersion const &latest() noexcept
    {
        static constexpr GroveVersion v{
            .protocol_version = 1,
            .merk = {.apply = 0, .prove = 0, .verify = 0, .chunk = 0},
            .element = {.serialize = 0, .value_hash = 0},
            .grovedb =
                {.insert = 0,
                 .remove = 0,
                 .get = 0,
                 .prove_query = 0,
                 .verify_query = 0},
        };
        return v;
    }
};

Result<void> check_version(
    char const *method, FeatureVersion known, FeatureVersion received);

GROVEDB_NAMESPACE_END
