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

#include <compare>
#include <cstdint>
#include <map>
#include <variant>

GROVEDB_NAMESPACE_BEGIN

using Identifier = byte_string_fixed<32>;
using Epoch = uint16_t;

inline constexpr Epoch UNKNOWN_EPOCH = 0xffff;

using StorageRemovalPerEpochByIdentifier =
    std::map<Identifier, std::map<Epoch, uint32_t>>;

/// Bytes freed by an operation; either untracked, a plain count, or
/// attributed to (identity, epoch) sections
class StorageRemovedBytes
{
public:
    struct None
    {
        bool operator==(None const &) const = default;
    };

    struct Basic
    {
        uint32_t bytes;
        bool operator==(Basic const &) const = default;
    };

    struct Sectioned
    {
        StorageRemovalPerEpochByIdentifier sections;
        bool operator==(Sectioned const &) const = default;
    };

private:
    std::variant<None, Basic, Sectioned> v_;

public:
    StorageRemovedBytes() = default;

    StorageRemovedBytes(None const n)
        : v_{n}
    {
    }

    StorageRemovedBytes(Basic const b)
        : v_{b}
    {
    }

    StorageRemovedBytes(Sectioned s)
        : v_{std::move(s)}
    {
    }

    static StorageRemovedBytes basic(uint32_t const bytes)
    {
        return Basic{bytes};
    }

    static StorageRemovedBytes
    sectioned(StorageRemovalPerEpochByIdentifier sections)
    {
        return Sectioned{std::move(sections)};
    }

    bool is_none() const noexcept
    {
        return std::holds_alternative<None>(v_);
    }

    bool is_basic() const noexcept
    {
        return std::holds_alternative<Basic>(v_);
    }

    bool is_sectioned() const noexcept
    {
        return std::holds_alternative<Sectioned>(v_);
    }

    StorageRemovalPerEpochByIdentifier const *sections() const noexcept
    {
        auto const *s = std::get_if<Sectioned>(&v_);
        return s ? &s->sections : nullptr;
    }

    uint32_t total_removed_bytes() const noexcept;

    // Removal of zero bytes does not count
    bool has_removal() const noexcept
    {
        return total_removed_bytes() != 0;
    }

    StorageRemovedBytes &operator+=(StorageRemovedBytes const &rhs);

    friend StorageRemovedBytes
    operator+(StorageRemovedBytes lhs, StorageRemovedBytes const &rhs)
    {
        lhs += rhs;
        return lhs;
    }

    bool operator==(StorageRemovedBytes const &) const = default;

    // None < Basic; two Basic compare numerically; anything involving a
    // sectioned value compares by total removed bytes
    std::weak_ordering operator<=>(StorageRemovedBytes const &rhs) const;
};

GROVEDB_NAMESPACE_END
