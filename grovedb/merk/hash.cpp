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

#include <grovedb/merk/hash.hpp>

#include <grovedb/core/blake3.hpp>
#include <grovedb/core/codec.hpp>

GROVEDB_MERK_NAMESPACE_BEGIN

CostContext<bytes32_t> value_hash(byte_string_view const value)
{
    byte_string len;
    append_varint(len, value.size());
    auto const hash = Blake3Hasher{}.update(len).update(value).finalize();
    return {
        hash,
        OperationCost::with_hash_node_calls(
            hash_block_count(len.size() + value.size()))};
}

CostContext<bytes32_t>
kv_hash(byte_string_view const key, byte_string_view const value)
{
    OperationCost cost;
    auto const vh = value_hash(value).unwrap_add_cost(cost);
    auto res = kv_digest_to_kv_hash(key, vh);
    res.cost += cost;
    return res;
}

CostContext<bytes32_t>
kv_digest_to_kv_hash(byte_string_view const key, bytes32_t const &value_hash)
{
    byte_string len;
    append_varint(len, key.size());
    auto const hash =
        Blake3Hasher{}.update(len).update(key).update(value_hash).finalize();
    return {
        hash,
        OperationCost::with_hash_node_calls(
            hash_block_count(len.size() + key.size() + HASH_LENGTH))};
}

CostContext<bytes32_t> node_hash(
    bytes32_t const &kv, bytes32_t const &left, bytes32_t const &right)
{
    auto const hash =
        Blake3Hasher{}.update(kv).update(left).update(right).finalize();
    return {hash, OperationCost::with_hash_node_calls(2)};
}

CostContext<bytes32_t> node_hash_with_count(
    bytes32_t const &kv, bytes32_t const &left, bytes32_t const &right,
    uint64_t const count)
{
    unsigned char buf[sizeof(count)];
    store_be(buf, count);
    auto const hash = Blake3Hasher{}
                          .update(kv)
                          .update(left)
                          .update(right)
                          .update(to_byte_string_view(buf))
                          .finalize();
    return {hash, OperationCost::with_hash_node_calls(2)};
}

CostContext<bytes32_t> combine_hash(bytes32_t const &a, bytes32_t const &b)
{
    auto const hash = Blake3Hasher{}.update(a).update(b).finalize();
    return {hash, OperationCost::with_hash_node_calls(1)};
}

GROVEDB_MERK_NAMESPACE_END
