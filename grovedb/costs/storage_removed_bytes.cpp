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

#include <grovedb/costs/storage_removed_bytes.hpp>

#include <compare>
#include <cstdint>
#include <map>
#include <utility>
#include <variant>

GROVEDB_ANONYMOUS_NAMESPACE_BEGIN

void add_to_default_section(
    StorageRemovalPerEpochByIdentifier &sections, uint32_t const bytes)
{
    sections[Identifier{}][UNKNOWN_EPOCH] += bytes;
}

void merge_sections(
    StorageRemovalPerEpochByIdentifier &into,
    StorageRemovalPerEpochByIdentifier const &from)
{
    for (auto const &[identifier, epochs] : from) {
        auto &target = into[identifier];
        for (auto const &[epoch, bytes] : epochs) {
            target[epoch] += bytes;
        }
    }
}

GROVEDB_ANONYMOUS_NAMESPACE_END

GROVEDB_NAMESPACE_BEGIN

uint32_t StorageRemovedBytes::total_removed_bytes() const noexcept
{
    if (auto const *b = std::get_if<Basic>(&v_)) {
        return b->bytes;
    }
    if (auto const *s = std::get_if<Sectioned>(&v_)) {
        uint32_t total = 0;
        for (auto const &section : s->sections) {
            for (auto const &epoch_bytes : section.second) {
                total += epoch_bytes.second;
            }
        }
        return total;
    }
    return 0;
}

StorageRemovedBytes &StorageRemovedBytes::operator+=(StorageRemovedBytes const &rhs)
{
    if (rhs.is_none()) {
        return *this;
    }
    if (is_none()) {
        *this = rhs;
        return *this;
    }
    if (auto *b = std::get_if<Basic>(&v_)) {
        if (auto const *rb = std::get_if<Basic>(&rhs.v_)) {
            b->bytes += rb->bytes;
            return *this;
        }
        // promote to sectioned, attributing our bytes to the default cell
        auto sections = std::get<Sectioned>(rhs.v_).sections;
        add_to_default_section(sections, b->bytes);
        v_ = Sectioned{std::move(sections)};
        return *this;
    }
    auto &sections = std::get<Sectioned>(v_).sections;
    if (auto const *rb = std::get_if<Basic>(&rhs.v_)) {
        add_to_default_section(sections, rb->bytes);
    }
    else {
        merge_sections(sections, std::get<Sectioned>(rhs.v_).sections);
    }
    return *this;
}

std::weak_ordering
StorageRemovedBytes::operator<=>(StorageRemovedBytes const &rhs) const
{
    if (is_none() || rhs.is_none()) {
        if (is_none() && rhs.is_none()) {
            return std::weak_ordering::equivalent;
        }
        return is_none() ? std::weak_ordering::less
                         : std::weak_ordering::greater;
    }
    return total_removed_bytes() <=> rhs.total_removed_bytes();
}

GROVEDB_NAMESPACE_END
