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

#include <grovedb/dense_tree/proof.hpp>

#include <grovedb/core/bincode.hpp>
#include <grovedb/core/blake3.hpp>
#include <grovedb/core/codec.hpp>
#include <grovedb/core/hex_literal.hpp>
#include <grovedb/dense_tree/dense_tree_error.hpp>
#include <grovedb/dense_tree/hash.hpp>
#include <grovedb/dense_tree/position_ranges.hpp>
#include <grovedb/dense_tree/tree.hpp>

#include <quill/Quill.h>

#include <map>
#include <set>

GROVEDB_DENSE_TREE_NAMESPACE_BEGIN

namespace
{
    constexpr uint16_t parent(uint16_t const pos) noexcept
    {
        return static_cast<uint16_t>((pos - 1) / 2);
    }

    std::set<uint16_t> with_ancestors(std::set<uint16_t> positions)
    {
        std::set<uint16_t> expanded = positions;
        for (auto pos : positions) {
            while (pos > 0) {
                pos = parent(pos);
                if (!expanded.insert(pos).second) {
                    break;
                }
            }
        }
        return expanded;
    }

    class Recomputer
    {
        uint64_t capacity_;
        uint16_t count_;
        std::map<uint16_t, byte_string_view> entries_;
        std::map<uint16_t, bytes32_t> value_hashes_;
        std::map<uint16_t, bytes32_t> hashes_;

    public:
        Recomputer(DenseTreeProof const &proof)
            : capacity_{capacity_for_height(proof.height)}
            , count_{proof.count}
        {
            for (auto const &[pos, value] : proof.entries) {
                entries_.emplace(pos, value);
            }
            value_hashes_.insert(
                proof.node_value_hashes.begin(), proof.node_value_hashes.end());
            hashes_.insert(proof.node_hashes.begin(), proof.node_hashes.end());
        }

        Result<bytes32_t> hash(uint64_t const position) const
        {
            if (position >= capacity_ || position >= count_) {
                return EMPTY_NODE_HASH;
            }
            auto const pos = static_cast<uint16_t>(position);
            if (auto const it = hashes_.find(pos); it != hashes_.end()) {
                return it->second;
            }
            bool const leaf = position >= (capacity_ - 1) / 2;
            if (auto const it = entries_.find(pos); it != entries_.end()) {
                if (leaf) {
                    return leaf_node_hash(it->second);
                }
                return internal(position, blake3(it->second));
            }
            if (auto const it = value_hashes_.find(pos);
                it != value_hashes_.end()) {
                if (leaf) {
                    LOG_ERROR(
                        "dense proof gives only a value hash for leaf {}", pos);
                    return DenseTreeError::invalid_proof;
                }
                return internal(position, it->second);
            }
            LOG_ERROR("dense proof has nothing for position {}", pos);
            return DenseTreeError::invalid_proof;
        }

    private:
        Result<bytes32_t>
        internal(uint64_t const position, bytes32_t const &value_hash) const
        {
            BOOST_OUTCOME_TRY(auto const left, hash(2 * position + 1));
            BOOST_OUTCOME_TRY(auto const right, hash(2 * position + 2));
            return internal_node_hash(value_hash, left, right);
        }
    };

    template <class Pairs>
    bool has_duplicates(Pairs const &pairs, std::set<uint16_t> &seen)
    {
        for (auto const &p : pairs) {
            if (!seen.insert(p.first).second) {
                return true;
            }
        }
        return false;
    }
}

CostResult<DenseTreeProof> DenseTreeProof::generate(
    uint8_t const height, uint16_t const count,
    std::span<uint16_t const> const positions, DenseTreeStore &store)
{
    OperationCost cost;
    auto const tree = GROVEDB_COST_TRY_NO_ADD(
        cost, DenseFixedSizedMerkleTree::from_state(height, count));
    for (auto const pos : positions) {
        if (pos >= count) {
            LOG_ERROR(
                "cannot prove position {} of a dense tree holding {}",
                pos,
                count);
            return {DenseTreeError::invalid_input, cost};
        }
    }
    std::set<uint16_t> const proved(positions.begin(), positions.end());
    auto const expanded = with_ancestors(proved);
    uint64_t const capacity = tree.capacity();

    DenseTreeProof proof{.height = height, .count = count};
    for (auto const pos : expanded) {
        auto value = GROVEDB_COST_TRY(cost, tree.get(pos, store));
        if (!value.has_value()) {
            return {DenseTreeError::store_error, cost};
        }
        if (proved.contains(pos)) {
            proof.entries.emplace_back(pos, std::move(*value));
        }
        else {
            cost.hash_node_calls += 1;
            proof.node_value_hashes.emplace_back(pos, blake3(*value));
        }
        for (uint64_t child = 2 * uint64_t{pos} + 1;
             child <= 2 * uint64_t{pos} + 2 && child < capacity;
             ++child) {
            auto const c = static_cast<uint16_t>(child);
            if (expanded.contains(c)) {
                continue;
            }
            auto const hash =
                GROVEDB_COST_TRY(cost, tree.hash_position(c, store));
            proof.node_hashes.emplace_back(c, hash);
        }
    }
    return {std::move(proof), cost};
}

CostResult<DenseTreeProof> DenseTreeProof::generate_range(
    uint8_t const height, uint16_t const count, uint16_t const start,
    uint16_t const end, DenseTreeStore &store)
{
    std::vector<uint16_t> positions;
    for (uint32_t p = start; p < end; ++p) {
        positions.push_back(static_cast<uint16_t>(p));
    }
    return generate(height, count, positions, store);
}

CostResult<DenseTreeProof> DenseTreeProof::generate_for_query(
    uint8_t const height, uint16_t const count, query::Query const &query,
    DenseTreeStore &store)
{
    OperationCost cost;
    auto const ranges =
        GROVEDB_COST_TRY_NO_ADD(cost, query_to_ranges(query, count));
    std::vector<uint16_t> positions;
    for (auto const &[start, end] : ranges) {
        for (uint64_t p = start; p < end; ++p) {
            positions.push_back(static_cast<uint16_t>(p));
        }
    }
    return generate(height, count, positions, store);
}

Result<std::pair<bytes32_t, ProvenEntries>>
DenseTreeProof::verify_and_get_root() const
{
    if (height < MIN_HEIGHT || height > MAX_HEIGHT) {
        LOG_ERROR("dense proof height {} out of range", height);
        return DenseTreeError::invalid_proof;
    }
    if (count > capacity_for_height(height)) {
        LOG_ERROR(
            "dense proof count {} exceeds capacity {}",
            count,
            capacity_for_height(height));
        return DenseTreeError::invalid_proof;
    }
    if (entries.size() > MAX_PROOF_ELEMENTS ||
        node_value_hashes.size() > MAX_PROOF_ELEMENTS ||
        node_hashes.size() > MAX_PROOF_ELEMENTS) {
        LOG_ERROR("dense proof carries too many elements");
        return DenseTreeError::invalid_proof;
    }

    // one set across all three fields catches repeats and overlaps alike
    std::set<uint16_t> seen;
    if (has_duplicates(entries, seen) ||
        has_duplicates(node_value_hashes, seen) ||
        has_duplicates(node_hashes, seen)) {
        LOG_ERROR("dense proof names a position more than once");
        return DenseTreeError::invalid_proof;
    }

    std::set<uint16_t> proved;
    for (auto const &[pos, _] : entries) {
        proved.insert(pos);
    }
    auto const auth_path = with_ancestors(std::move(proved));
    for (auto const &[pos, _] : node_hashes) {
        if (auth_path.contains(pos)) {
            LOG_ERROR(
                "dense proof hash at {} sits on the path of a proved entry",
                pos);
            return DenseTreeError::invalid_proof;
        }
    }

    BOOST_OUTCOME_TRY(auto const root, Recomputer{*this}.hash(0));
    ProvenEntries out;
    for (auto const &entry : entries) {
        if (entry.first < count) {
            out.push_back(entry);
        }
    }
    return std::make_pair(root, std::move(out));
}

Result<ProvenEntries>
DenseTreeProof::verify(bytes32_t const &expected_root) const
{
    BOOST_OUTCOME_TRY(auto verified, verify_and_get_root());
    if (verified.first != expected_root) {
        LOG_ERROR(
            "dense proof root mismatch: expected {}, got {}",
            to_hex(to_byte_string_view(expected_root)),
            to_hex(to_byte_string_view(verified.first)));
        return DenseTreeError::invalid_proof;
    }
    return std::move(verified.second);
}

byte_string DenseTreeProof::encode() const
{
    byte_string out;
    out.push_back(height);
    bincode::append_varint(out, count);
    bincode::append_varint(out, entries.size());
    for (auto const &[pos, value] : entries) {
        bincode::append_varint(out, pos);
        bincode::append_varint(out, value.size());
        out.append(value);
    }
    for (auto const *hashes : {&node_value_hashes, &node_hashes}) {
        bincode::append_varint(out, hashes->size());
        for (auto const &[pos, hash] : *hashes) {
            bincode::append_varint(out, pos);
            append_bytes32(out, hash);
        }
    }
    return out;
}

Result<DenseTreeProof> DenseTreeProof::decode(byte_string_view enc)
{
    if (enc.size() > MAX_PROOF_DECODE_SIZE) {
        LOG_ERROR(
            "dense proof of {} bytes exceeds the decode limit", enc.size());
        return DenseTreeError::invalid_data;
    }
    auto const consume_position =
        [](byte_string_view &in) -> Result<uint16_t> {
        BOOST_OUTCOME_TRY(auto const pos, bincode::consume_varint(in));
        if (pos > UINT16_MAX) {
            return DenseTreeError::invalid_data;
        }
        return static_cast<uint16_t>(pos);
    };
    auto proof = [&]() -> Result<DenseTreeProof> {
        DenseTreeProof out;
        BOOST_OUTCOME_TRY(out.height, consume_byte(enc));
        BOOST_OUTCOME_TRY(out.count, consume_position(enc));
        BOOST_OUTCOME_TRY(auto const entry_count, bincode::consume_varint(enc));
        if (entry_count > enc.size() / 2) {
            return DenseTreeError::invalid_data;
        }
        for (uint64_t i = 0; i < entry_count; ++i) {
            BOOST_OUTCOME_TRY(auto const pos, consume_position(enc));
            BOOST_OUTCOME_TRY(auto const len, bincode::consume_varint(enc));
            BOOST_OUTCOME_TRY(auto const value, consume_bytes(enc, len));
            out.entries.emplace_back(pos, byte_string{value});
        }
        for (auto *hashes : {&out.node_value_hashes, &out.node_hashes}) {
            BOOST_OUTCOME_TRY(auto const n, bincode::consume_varint(enc));
            if (n > enc.size() / (HASH_LENGTH + 1)) {
                return DenseTreeError::invalid_data;
            }
            for (uint64_t i = 0; i < n; ++i) {
                BOOST_OUTCOME_TRY(auto const pos, consume_position(enc));
                BOOST_OUTCOME_TRY(auto const hash, consume_bytes32(enc));
                hashes->emplace_back(pos, hash);
            }
        }
        return out;
    }();
    if (proof.has_error()) {
        LOG_ERROR("malformed dense tree proof");
        return DenseTreeError::invalid_data;
    }
    if (!enc.empty()) {
        LOG_ERROR("{} trailing bytes after dense tree proof", enc.size());
        return DenseTreeError::invalid_data;
    }
    if (proof.value().height < MIN_HEIGHT ||
        proof.value().height > MAX_HEIGHT ||
        proof.value().count > capacity_for_height(proof.value().height)) {
        LOG_ERROR("dense tree proof has an impossible shape");
        return DenseTreeError::invalid_data;
    }
    return proof;
}

GROVEDB_DENSE_TREE_NAMESPACE_END
