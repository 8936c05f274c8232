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

#include <grovedb/commitment_tree/frontier.hpp>

#include <grovedb/commitment_tree/commitment_tree_error.hpp>
#include <grovedb/commitment_tree/merkle_hash.hpp>
#include <grovedb/core/codec.hpp>

#include <quill/Quill.h>

#include <bit>

GROVEDB_COMMITMENT_TREE_NAMESPACE_BEGIN

CostResult<bytes32_t> CommitmentFrontier::append(bytes32_t const &cmx)
{
    OperationCost cost;
    if (!is_canonical(cmx)) {
        return {CommitmentTreeError::invalid_field_element, cost};
    }
    unsigned const merges =
        frontier_.has_value() ? std::countr_one(frontier_->position) : 0;
    cost.sinsemilla_hash_calls += DEPTH + merges;

    if (!frontier_.has_value()) {
        frontier_.emplace(NonEmpty{.position = 0, .leaf = cmx, .ommers = {}});
        return {root_hash(), cost};
    }
    if (frontier_->position + 1 >= MAX_LEAVES) {
        return {CommitmentTreeError::tree_full, cost};
    }

    // the completed subtree left of the new leaf becomes its ommer
    auto &f = *frontier_;
    bytes32_t carry = f.leaf;
    for (unsigned level = 0; level < merges; ++level) {
        carry = hasher_->combine(
            static_cast<uint8_t>(level), f.ommers[level], carry);
    }
    f.ommers.erase(f.ommers.begin(), f.ommers.begin() + merges);
    f.ommers.insert(f.ommers.begin(), carry);
    f.leaf = cmx;
    ++f.position;
    return {root_hash(), cost};
}

bytes32_t CommitmentFrontier::root_hash() const
{
    if (!frontier_.has_value()) {
        return hasher_->empty_root(DEPTH);
    }
    bytes32_t node = frontier_->leaf;
    auto ommer = frontier_->ommers.begin();
    for (uint8_t level = 0; level < DEPTH; ++level) {
        if ((frontier_->position >> level) & 1) {
            node = hasher_->combine(level, *ommer++, node);
        }
        else {
            node = hasher_->combine(level, node, hasher_->empty_root(level));
        }
    }
    return node;
}

byte_string CommitmentFrontier::serialize() const
{
    byte_string out;
    if (!frontier_.has_value()) {
        out.push_back(0x00);
        return out;
    }
    out.push_back(0x01);
    append_be(out, frontier_->position);
    append_bytes32(out, frontier_->leaf);
    out.push_back(static_cast<unsigned char>(frontier_->ommers.size()));
    for (auto const &ommer : frontier_->ommers) {
        append_bytes32(out, ommer);
    }
    return out;
}

Result<CommitmentFrontier>
CommitmentFrontier::deserialize(
    byte_string_view enc, MerkleHasher const &hasher)
{
    auto const parsed = [&]() -> Result<CommitmentFrontier> {
        BOOST_OUTCOME_TRY(auto const flag, consume_byte(enc));
        CommitmentFrontier frontier{hasher};
        if (flag == 0x00) {
            return frontier;
        }
        if (flag != 0x01) {
            LOG_ERROR("invalid frontier flag {:#04x}", flag);
            return CommitmentTreeError::invalid_data;
        }
        NonEmpty f;
        BOOST_OUTCOME_TRY(f.position, consume_be<uint64_t>(enc));
        BOOST_OUTCOME_TRY(f.leaf, consume_bytes32(enc));
        BOOST_OUTCOME_TRY(auto const n, consume_byte(enc));
        for (unsigned i = 0; i < n; ++i) {
            BOOST_OUTCOME_TRY(auto const ommer, consume_bytes32(enc));
            f.ommers.push_back(ommer);
        }
        if (f.position >= MAX_LEAVES ||
            f.ommers.size() !=
                static_cast<size_t>(std::popcount(f.position))) {
            LOG_ERROR(
                "frontier at position {} carries {} ommers",
                f.position,
                f.ommers.size());
            return CommitmentTreeError::invalid_data;
        }
        if (!is_canonical(f.leaf)) {
            return CommitmentTreeError::invalid_field_element;
        }
        for (auto const &ommer : f.ommers) {
            if (!is_canonical(ommer)) {
                return CommitmentTreeError::invalid_field_element;
            }
        }
        frontier.frontier_ = std::move(f);
        return frontier;
    }();
    if (parsed.has_error()) {
        if (parsed.error() == CommitmentTreeError::invalid_field_element) {
            return CommitmentTreeError::invalid_field_element;
        }
        return CommitmentTreeError::invalid_data;
    }
    if (!enc.empty()) {
        LOG_ERROR("{} trailing bytes after frontier", enc.size());
        return CommitmentTreeError::invalid_data;
    }
    return parsed;
}

GROVEDB_COMMITMENT_TREE_NAMESPACE_END
