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
#include <grovedb/core/result.hpp>

#include <cstdint>
#include <optional>

GROVEDB_MERK_NAMESPACE_BEGIN

using int128_t = __int128;

/// Shared numbering of tree types, node feature types and aggregates. The
/// values are part of the on-disk and proof encodings.
enum class FeatureTag : uint8_t
{
    basic = 0,
    summed = 1,
    big_summed = 2,
    counted = 3,
    counted_summed = 4,
    provable_counted = 5,
    provable_counted_summed = 6,
};

inline constexpr uint8_t FEATURE_TAG_COUNT = 7;

enum class TreeType : uint8_t
{
    normal = 0,
    sum = 1,
    big_sum = 2,
    count = 3,
    count_sum = 4,
    provable_count = 5,
    provable_count_sum = 6,
};

constexpr FeatureTag inner_node_tag(TreeType const t) noexcept
{
    return static_cast<FeatureTag>(t);
}

constexpr bool is_provable_count(FeatureTag const t) noexcept
{
    return t == FeatureTag::provable_counted ||
           t == FeatureTag::provable_counted_summed;
}

constexpr bool has_count(FeatureTag const t) noexcept
{
    return t == FeatureTag::counted || t == FeatureTag::counted_summed ||
           is_provable_count(t);
}

constexpr bool has_sum(FeatureTag const t) noexcept
{
    return t == FeatureTag::summed || t == FeatureTag::counted_summed ||
           t == FeatureTag::provable_counted_summed;
}

/// Extra bytes a feature adds to the stored node and to the parent's link:
/// 8 for one counter, 16 for two counters or a 128 bit sum
constexpr uint32_t feature_cost_len(FeatureTag const t) noexcept
{
    switch (t) {
    case FeatureTag::basic:
        return 0;
    case FeatureTag::summed:
    case FeatureTag::counted:
    case FeatureTag::provable_counted:
        return 8;
    case FeatureTag::big_summed:
    case FeatureTag::counted_summed:
    case FeatureTag::provable_counted_summed:
        return 16;
    }
    return 0;
}

Result<FeatureTag> decode_feature_tag(unsigned char);

/// What a single node contributes to the aggregate of its subtree
struct TreeFeatureType
{
    FeatureTag tag{FeatureTag::basic};
    uint64_t count{0};
    int64_t sum{0};
    int128_t big_sum{0};

    bool operator==(TreeFeatureType const &) const = default;

    static constexpr TreeFeatureType basic() noexcept
    {
        return {};
    }

    static constexpr TreeFeatureType summed(int64_t const s) noexcept
    {
        return {.tag = FeatureTag::summed, .sum = s};
    }

    static constexpr TreeFeatureType big_summed(int128_t const s) noexcept
    {
        return {.tag = FeatureTag::big_summed, .big_sum = s};
    }

    static constexpr TreeFeatureType counted(uint64_t const c) noexcept
    {
        return {.tag = FeatureTag::counted, .count = c};
    }

    static constexpr TreeFeatureType
    counted_summed(uint64_t const c, int64_t const s) noexcept
    {
        return {.tag = FeatureTag::counted_summed, .count = c, .sum = s};
    }

    static constexpr TreeFeatureType provable_counted(uint64_t const c) noexcept
    {
        return {.tag = FeatureTag::provable_counted, .count = c};
    }

    static constexpr TreeFeatureType
    provable_counted_summed(uint64_t const c, int64_t const s) noexcept
    {
        return {
            .tag = FeatureTag::provable_counted_summed, .count = c, .sum = s};
    }

    std::optional<uint64_t> counted_value() const noexcept
    {
        if (has_count(tag)) {
            return count;
        }
        return std::nullopt;
    }

    uint32_t cost_len() const noexcept
    {
        return feature_cost_len(tag);
    }

    // Compact form used in proofs: tag byte then varints (i128 big endian)
    void encode(byte_string &) const;
    static Result<TreeFeatureType> decode(byte_string_view &);

    // Fixed width payload used in stored nodes, without the tag
    void encode_fixed(byte_string &) const;
    static Result<TreeFeatureType> decode_fixed(FeatureTag, byte_string_view &);
};

/// Aggregate of a whole subtree, carried by links and committed into node
/// hashes of provable-count trees
struct AggregateData
{
    FeatureTag tag{FeatureTag::basic};
    uint64_t count{0};
    int64_t sum{0};
    int128_t big_sum{0};

    bool operator==(AggregateData const &) const = default;

    static constexpr AggregateData none() noexcept
    {
        return {};
    }

    static constexpr AggregateData empty(TreeType const t) noexcept
    {
        return {.tag = inner_node_tag(t)};
    }

    uint32_t payload_len() const noexcept
    {
        return feature_cost_len(tag);
    }

    bool is_empty() const noexcept
    {
        return count == 0 && sum == 0 && big_sum == 0;
    }

    /// `self` combined with both children, checking for sum overflow
    static Result<AggregateData> combine(
        TreeFeatureType const &self, AggregateData const &left,
        AggregateData const &right);

    void encode_fixed(byte_string &) const;
    static Result<AggregateData> decode_fixed(FeatureTag, byte_string_view &);
};

GROVEDB_MERK_NAMESPACE_END
