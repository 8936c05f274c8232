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

#include <grovedb/mmr/mmr_tree_proof.hpp>

#include <grovedb/core/bincode.hpp>
#include <grovedb/core/codec.hpp>
#include <grovedb/core/hex_literal.hpp>
#include <grovedb/mmr/helper.hpp>
#include <grovedb/mmr/merkle_proof.hpp>
#include <grovedb/mmr/mmr.hpp>
#include <grovedb/mmr/mmr_error.hpp>
#include <grovedb/mmr/store.hpp>

#include <quill/Quill.h>

#include <map>
#include <set>
#include <utility>

GROVEDB_MMR_NAMESPACE_BEGIN

namespace
{
    // Caches fetched nodes. After the first failure every read reports the
    // node absent and the failure is kept for the caller.
    class LazyNodeStore final : public MmrStore
    {
        GetNodeFn const &get_node_;
        std::map<uint64_t, std::optional<MmrNode>> cache_;
        Result<void> error_{outcome::success()};

    public:
        explicit LazyNodeStore(GetNodeFn const &get_node)
            : get_node_{get_node}
        {
        }

        Result<void> take_error()
        {
            return std::exchange(error_, outcome::success());
        }

        CostResult<std::optional<MmrNode>>
        element_at_position(uint64_t const pos) override
        {
            if (error_.has_error()) {
                return {std::optional<MmrNode>{}, OperationCost{}};
            }
            if (auto const it = cache_.find(pos); it != cache_.end()) {
                return {it->second, OperationCost{}};
            }
            auto res = get_node_(pos);
            if (res.has_error()) {
                error_ = std::move(res).as_failure();
                return {std::optional<MmrNode>{}, OperationCost{}};
            }
            cache_.emplace(pos, res.value());
            return {std::move(res).assume_value(), OperationCost{}};
        }

        CostResult<void> append(uint64_t, std::vector<MmrNode>) override
        {
            return {MmrError::operation_failed, OperationCost{}};
        }
    };

    Result<void> check_leaf_range(
        VerifiedLeaves const &leaves, uint64_t const mmr_size)
    {
        if (leaves.empty()) {
            LOG_ERROR("mmr proof contains no leaves");
            return MmrError::invalid_proof;
        }
        uint64_t const leaf_count = mmr_size_to_leaf_count(mmr_size);
        for (auto const &[idx, value] : leaves) {
            if (idx >= leaf_count) {
                LOG_ERROR(
                    "mmr proof leaf {} out of range for {} leaves",
                    idx,
                    leaf_count);
                return MmrError::invalid_proof;
            }
        }
        return outcome::success();
    }

    VerifiedLeaves first_of_each_index(VerifiedLeaves const &leaves)
    {
        std::set<uint64_t> seen;
        VerifiedLeaves out;
        for (auto const &leaf : leaves) {
            if (seen.insert(leaf.first).second) {
                out.push_back(leaf);
            }
        }
        return out;
    }
}

Result<MmrTreeProof> MmrTreeProof::generate(
    uint64_t const mmr_size, std::span<uint64_t const> const leaf_indices,
    GetNodeFn const &get_node)
{
    if (leaf_indices.empty()) {
        LOG_ERROR("mmr proof requested for no leaves");
        return MmrError::invalid_input;
    }
    uint64_t const leaf_count = mmr_size_to_leaf_count(mmr_size);
    std::set<uint64_t> seen;
    for (uint64_t const idx : leaf_indices) {
        if (idx >= leaf_count) {
            LOG_ERROR(
                "mmr leaf index {} out of range for {} leaves",
                idx,
                leaf_count);
            return MmrError::invalid_input;
        }
        if (!seen.insert(idx).second) {
            LOG_ERROR("duplicate mmr leaf index {}", idx);
            return MmrError::invalid_input;
        }
    }

    std::vector<uint64_t> positions;
    VerifiedLeaves leaves;
    positions.reserve(leaf_indices.size());
    leaves.reserve(leaf_indices.size());
    for (uint64_t const idx : leaf_indices) {
        uint64_t const pos = leaf_index_to_pos(idx);
        positions.push_back(pos);
        BOOST_OUTCOME_TRY(auto node, get_node(pos));
        if (!node.has_value()) {
            LOG_ERROR("mmr leaf {} missing at position {}", idx, pos);
            return MmrError::invalid_data;
        }
        if (!node->value().has_value()) {
            LOG_ERROR("mmr node at position {} is not a leaf", pos);
            return MmrError::invalid_data;
        }
        leaves.emplace_back(idx, *node->value());
    }

    LazyNodeStore store{get_node};
    Mmr mmr{mmr_size, store};
    auto proof = mmr.gen_proof(std::move(positions)).value;
    BOOST_OUTCOME_TRY(store.take_error());
    if (proof.has_error()) {
        LOG_ERROR("mmr proof generation failed");
        return MmrError::operation_failed;
    }

    std::vector<bytes32_t> items;
    items.reserve(proof.value().proof_items().size());
    for (auto const &node : proof.value().proof_items()) {
        items.push_back(node.hash());
    }
    return MmrTreeProof{mmr_size, std::move(leaves), std::move(items)};
}

Result<std::pair<bytes32_t, VerifiedLeaves>>
MmrTreeProof::verify_and_get_root() const
{
    BOOST_OUTCOME_TRY(check_leaf_range(leaves_, mmr_size_));

    std::vector<MmrNode> nodes;
    nodes.reserve(proof_items_.size());
    for (auto const &hash : proof_items_) {
        nodes.push_back(MmrNode::internal(hash));
    }
    MerkleProof const proof{mmr_size_, std::move(nodes)};

    ProvenLeaves proven;
    proven.reserve(leaves_.size());
    for (auto const &[idx, value] : leaves_) {
        proven.emplace_back(
            leaf_index_to_pos(idx), MmrNode::internal(leaf_hash(value)));
    }
    auto root = proof.calculate_root(std::move(proven));
    if (root.has_error()) {
        LOG_ERROR("mmr proof does not rebuild a root");
        return MmrError::invalid_proof;
    }
    return std::pair{root.value().hash(), first_of_each_index(leaves_)};
}

Result<VerifiedLeaves>
MmrTreeProof::verify(bytes32_t const &expected_root) const
{
    BOOST_OUTCOME_TRY(auto verified, verify_and_get_root());
    if (verified.first != expected_root) {
        LOG_ERROR(
            "mmr proof root mismatch: expected {}, got {}",
            to_hex(to_byte_string_view(expected_root)),
            to_hex(to_byte_string_view(verified.first)));
        return MmrError::invalid_proof;
    }
    return std::move(verified.second);
}

byte_string MmrTreeProof::encode() const
{
    byte_string out;
    bincode::append_varint(out, mmr_size_);
    bincode::append_varint(out, leaves_.size());
    for (auto const &[idx, value] : leaves_) {
        bincode::append_varint(out, idx);
        bincode::append_varint(out, value.size());
        out.append(value);
    }
    bincode::append_varint(out, proof_items_.size());
    for (auto const &item : proof_items_) {
        append_bytes32(out, item);
    }
    return out;
}

Result<MmrTreeProof> MmrTreeProof::decode(byte_string_view enc)
{
    if (enc.size() > MAX_PROOF_DECODE_SIZE) {
        LOG_ERROR("mmr proof of {} bytes exceeds the decode limit", enc.size());
        return MmrError::invalid_data;
    }
    auto proof = [&]() -> Result<MmrTreeProof> {
        MmrTreeProof out;
        BOOST_OUTCOME_TRY(out.mmr_size_, bincode::consume_varint(enc));
        BOOST_OUTCOME_TRY(auto const leaf_count, bincode::consume_varint(enc));
        // every leaf takes at least two bytes
        if (leaf_count > enc.size() / 2) {
            return MmrError::invalid_data;
        }
        for (uint64_t i = 0; i < leaf_count; ++i) {
            BOOST_OUTCOME_TRY(auto const idx, bincode::consume_varint(enc));
            BOOST_OUTCOME_TRY(auto const len, bincode::consume_varint(enc));
            BOOST_OUTCOME_TRY(auto const value, consume_bytes(enc, len));
            out.leaves_.emplace_back(idx, byte_string{value});
        }
        BOOST_OUTCOME_TRY(auto const item_count, bincode::consume_varint(enc));
        if (item_count > enc.size() / HASH_LENGTH) {
            return MmrError::invalid_data;
        }
        for (uint64_t i = 0; i < item_count; ++i) {
            BOOST_OUTCOME_TRY(auto const item, consume_bytes32(enc));
            out.proof_items_.push_back(item);
        }
        return out;
    }();
    if (proof.has_error()) {
        LOG_ERROR("malformed mmr proof");
        return MmrError::invalid_data;
    }
    if (!enc.empty()) {
        LOG_ERROR("{} trailing bytes after mmr proof", enc.size());
        return MmrError::invalid_data;
    }
    return proof;
}

GROVEDB_MMR_NAMESPACE_END
