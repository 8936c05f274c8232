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

#include <grovedb/merk/tree_feature_type.hpp>

#include <grovedb/core/codec.hpp>
#include <grovedb/core/error.hpp>

GROVEDB_MERK_NAMESPACE_BEGIN

namespace
{
    void append_i128(byte_string &out, int128_t const v)
    {
        auto const u = static_cast<unsigned __int128>(v);
        append_be(out, static_cast<uint64_t>(u >> 64));
        append_be(out, static_cast<uint64_t>(u));
    }

    Result<int128_t> consume_i128(byte_string_view &enc)
    {
        BOOST_OUTCOME_TRY(auto const hi, consume_be<uint64_t>(enc));
        BOOST_OUTCOME_TRY(auto const lo, consume_be<uint64_t>(enc));
        return static_cast<int128_t>(
            (static_cast<unsigned __int128>(hi) << 64) | lo);
    }

    template <class T>
    Result<T> checked_add3(T const a, T const b, T const c)
    {
        T r;
        if (__builtin_add_overflow(a, b, &r) ||
            __builtin_add_overflow(r, c, &r)) {
            return Error::overflow;
        }
        return r;
    }
}

Result<FeatureTag> decode_feature_tag(unsigned char const b)
{
    if (b >= FEATURE_TAG_COUNT) {
        return Error::corrupted_data;
    }
    return static_cast<FeatureTag>(b);
}

void TreeFeatureType::encode(byte_string &out) const
{
    out.push_back(static_cast<unsigned char>(tag));
    switch (tag) {
    case FeatureTag::basic:
        break;
    case FeatureTag::summed:
        append_signed_varint(out, sum);
        break;
    case FeatureTag::big_summed:
        append_i128(out, big_sum);
        break;
    case FeatureTag::counted:
    case FeatureTag::provable_counted:
        append_varint(out, count);
        break;
    case FeatureTag::counted_summed:
    case FeatureTag::provable_counted_summed:
        append_varint(out, count);
        append_signed_varint(out, sum);
        break;
    }
}

Result<TreeFeatureType> TreeFeatureType::decode(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const b, consume_byte(enc));
    BOOST_OUTCOME_TRY(auto const t, decode_feature_tag(b));
    TreeFeatureType f{.tag = t};
    switch (t) {
    case FeatureTag::basic:
        break;
    case FeatureTag::summed:
        BOOST_OUTCOME_TRY(f.sum, consume_signed_varint(enc));
        break;
    case FeatureTag::big_summed:
        BOOST_OUTCOME_TRY(f.big_sum, consume_i128(enc));
        break;
    case FeatureTag::counted:
    case FeatureTag::provable_counted:
        BOOST_OUTCOME_TRY(f.count, consume_varint(enc));
        break;
    case FeatureTag::counted_summed:
    case FeatureTag::provable_counted_summed:
        BOOST_OUTCOME_TRY(f.count, consume_varint(enc));
        BOOST_OUTCOME_TRY(f.sum, consume_signed_varint(enc));
        break;
    }
    return f;
}

void TreeFeatureType::encode_fixed(byte_string &out) const
{
    if (has_count(tag)) {
        append_be(out, count);
    }
    if (has_sum(tag)) {
        append_be(out, static_cast<uint64_t>(sum));
    }
    if (tag == FeatureTag::big_summed) {
        append_i128(out, big_sum);
    }
}

Result<TreeFeatureType>
TreeFeatureType::decode_fixed(FeatureTag const t, byte_string_view &enc)
{
    TreeFeatureType f{.tag = t};
    if (has_count(t)) {
        BOOST_OUTCOME_TRY(f.count, consume_be<uint64_t>(enc));
    }
    if (has_sum(t)) {
        BOOST_OUTCOME_TRY(auto const s, consume_be<uint64_t>(enc));
        f.sum = static_cast<int64_t>(s);
    }
    if (t == FeatureTag::big_summed) {
        BOOST_OUTCOME_TRY(f.big_sum, consume_i128(enc));
    }
    return f;
}

Result<AggregateData> AggregateData::combine(
    TreeFeatureType const &self, AggregateData const &left,
    AggregateData const &right)
{
    AggregateData r{.tag = self.tag};
    BOOST_OUTCOME_TRY(
        r.count, checked_add3(self.count, left.count, right.count));
    BOOST_OUTCOME_TRY(r.sum, checked_add3(self.sum, left.sum, right.sum));
    BOOST_OUTCOME_TRY(
        r.big_sum, checked_add3(self.big_sum, left.big_sum, right.big_sum));
    return r;
}

void AggregateData::encode_fixed(byte_string &out) const
{
    TreeFeatureType{.tag = tag, .count = count, .sum = sum, .big_sum = big_sum}
        .encode_fixed(out);
}

Result<AggregateData>
AggregateData::decode_fixed(FeatureTag const t, byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const f, TreeFeatureType::decode_fixed(t, enc));
    return AggregateData{
        .tag = f.tag, .count = f.count, .sum = f.sum, .big_sum = f.big_sum};
}

GROVEDB_MERK_NAMESPACE_END
