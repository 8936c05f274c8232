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

#include <grovedb/bulk_append/tree.hpp>

#include <grovedb/bulk_append/bulk_append_error.hpp>
#include <grovedb/bulk_append/chunk.hpp>
#include <grovedb/core/blake3.hpp>
#include <grovedb/core/codec.hpp>
#include <grovedb/dense_tree/hash.hpp>
#include <grovedb/dense_tree/store.hpp>
#include <grovedb/dense_tree/tree.hpp>
#include <grovedb/mmr/helper.hpp>
#include <grovedb/mmr/mmr.hpp>
#include <grovedb/mmr/node.hpp>
#include <grovedb/mmr/store.hpp>
#include <grovedb/storage/storage_context.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <cstring>

GROVEDB_BULK_APPEND_NAMESPACE_BEGIN

namespace
{
    constexpr unsigned char STATE_ROOT_TAG[] = {
        'b', 'u', 'l', 'k', '_', 's', 't', 'a', 't', 'e'};

    byte_string_view meta_key() noexcept
    {
        return {META_KEY, sizeof(META_KEY)};
    }

    dense_tree::StorageDenseTreeStore
    buffer_store(storage::StorageContext &ctx)
    {
        return dense_tree::StorageDenseTreeStore{
            ctx, byte_string{BUFFER_KEY_PREFIX, sizeof(BUFFER_KEY_PREFIX)}};
    }
}

bytes32_t compute_state_root(
    bytes32_t const &mmr_root, bytes32_t const &buffer_hash)
{
    return Blake3Hasher{}
        .update(byte_string_view{STATE_ROOT_TAG, sizeof(STATE_ROOT_TAG)})
        .update(mmr_root)
        .update(buffer_hash)
        .finalize();
}

uint64_t leaf_count_to_mmr_size(uint64_t const leaf_count) noexcept
{
    return leaf_count == 0 ? 0 : mmr::leaf_index_to_mmr_size(leaf_count - 1);
}

Result<BulkAppendTree> BulkAppendTree::create(uint8_t const chunk_power)
{
    return from_state(0, chunk_power, 0, NULL_HASH);
}

Result<BulkAppendTree> BulkAppendTree::from_state(
    uint64_t const total_count, uint8_t const chunk_power,
    uint64_t const mmr_size, bytes32_t const &buffer_hash)
{
    if (dense_tree::validate_height(chunk_power).has_error()) {
        LOG_ERROR(
            "bulk append chunk power {} must be within {}..={}",
            chunk_power,
            dense_tree::MIN_HEIGHT,
            dense_tree::MAX_HEIGHT);
        return BulkAppendError::invalid_input;
    }
    uint64_t const chunks = total_count >> chunk_power;
    if (mmr_size != leaf_count_to_mmr_size(chunks)) {
        LOG_ERROR(
            "bulk append mmr size {} does not match {} completed chunks",
            mmr_size,
            chunks);
        return BulkAppendError::corrupted_data;
    }
    return BulkAppendTree{total_count, chunk_power, mmr_size, buffer_hash};
}

CostResult<BulkAppendTree> BulkAppendTree::load(
    storage::StorageContext &ctx, uint64_t const total_count,
    uint8_t const chunk_power)
{
    OperationCost cost;
    auto const meta = GROVEDB_COST_TRY(cost, ctx.get(meta_key()));
    if (!meta.has_value()) {
        if (total_count > 0) {
            LOG_ERROR(
                "bulk append meta missing with {} values appended",
                total_count);
            return {BulkAppendError::corrupted_data, cost};
        }
        return {create(chunk_power), cost};
    }
    auto const [mmr_size, buffer_hash] =
        GROVEDB_COST_TRY_NO_ADD(cost, deserialize_meta(*meta));
    return {from_state(total_count, chunk_power, mmr_size, buffer_hash), cost};
}

std::array<unsigned char, META_SIZE> BulkAppendTree::serialize_meta() const
{
    std::array<unsigned char, META_SIZE> out{};
    store_be(out.data(), mmr_size_);
    std::memcpy(
        out.data() + sizeof(uint64_t), buffer_hash_.bytes, sizeof(bytes32_t));
    return out;
}

Result<std::pair<uint64_t, bytes32_t>>
BulkAppendTree::deserialize_meta(byte_string_view const bytes)
{
    if (bytes.size() != META_SIZE) {
        LOG_ERROR(
            "bulk append meta is {} bytes, expected {}",
            bytes.size(),
            META_SIZE);
        return BulkAppendError::corrupted_data;
    }
    return std::make_pair(
        load_be<uint64_t>(bytes.data()),
        to_bytes(bytes.substr(sizeof(uint64_t))));
}

CostResult<AppendResult> BulkAppendTree::append(
    storage::StorageContext &ctx, byte_string_view const value)
{
    OperationCost cost;
    uint64_t const global_position = total_count_;
    bool const compacted = uint64_t{buffer_count()} + 1 == epoch_size();
    if (compacted) {
        GROVEDB_COST_TRY(cost, compact(ctx, value));
    }
    else {
        auto store = buffer_store(ctx);
        auto tree = GROVEDB_COST_TRY_NO_ADD(
            cost,
            dense_tree::DenseFixedSizedMerkleTree::from_state(
                chunk_power_, buffer_count()));
        auto const inserted = GROVEDB_COST_TRY(cost, tree.insert(value, store));
        buffer_hash_ = inserted.root_hash;
    }
    ++total_count_;

    auto const root = GROVEDB_COST_TRY(cost, state_root(ctx));
    auto const meta = serialize_meta();
    GROVEDB_COST_TRY(
        cost, ctx.put(meta_key(), byte_string{meta.data(), meta.size()}));
    return {
        AppendResult{
            .state_root = root,
            .global_position = global_position,
            .hash_count = cost.hash_node_calls,
            .compacted = compacted},
        cost};
}

CostResult<void> BulkAppendTree::compact(
    storage::StorageContext &ctx, byte_string_view const last_value)
{
    OperationCost cost;
    auto store = buffer_store(ctx);
    auto const buffer = GROVEDB_COST_TRY_NO_ADD(
        cost,
        dense_tree::DenseFixedSizedMerkleTree::from_state(
            chunk_power_, buffer_count()));
    std::vector<byte_string> entries;
    entries.reserve(epoch_size());
    for (uint16_t pos = 0; pos < buffer.count(); ++pos) {
        auto value = GROVEDB_COST_TRY(cost, buffer.get(pos, store));
        entries.push_back(std::move(*value));
    }
    entries.emplace_back(last_value);

    mmr::StorageMmrStore mmr_store{ctx};
    mmr::Mmr chunks{mmr_size_, mmr_store};
    cost.hash_node_calls += mmr::hash_count_for_push(chunks.leaf_count());
    auto const chunk_mmr_failed = [](auto const &e) {
        LOG_ERROR("bulk append chunk mmr failed: {}", e.message().c_str());
        return BulkAppendError::mmr_error;
    };
    GROVEDB_COST_TRY_INTO(
        cost,
        chunk_mmr_failed,
        chunks.push(mmr::MmrNode::leaf(serialize_chunk_blob(entries))));
    GROVEDB_COST_TRY_INTO(cost, chunk_mmr_failed, chunks.commit());
    GROVEDB_COST_TRY(cost, store.clear(buffer.count()));
    mmr_size_ = chunks.mmr_size();
    buffer_hash_ = NULL_HASH;
    return {outcome::success(), cost};
}

CostResult<bytes32_t>
BulkAppendTree::mmr_root(storage::StorageContext &ctx) const
{
    if (mmr_size_ == 0) {
        return {NULL_HASH, OperationCost{}};
    }
    mmr::StorageMmrStore store{ctx};
    return mmr::Mmr{mmr_size_, store}.get_root().map(
        [](Result<mmr::MmrNode> &&root) -> Result<bytes32_t> {
            BOOST_OUTCOME_TRY(auto const node, std::move(root));
            return node.hash();
        });
}

CostResult<bytes32_t>
BulkAppendTree::state_root(storage::StorageContext &ctx) const
{
    OperationCost cost;
    auto const root = GROVEDB_COST_TRY(cost, mmr_root(ctx));
    cost.hash_node_calls += 1;
    return {compute_state_root(root, buffer_hash_), cost};
}

CostResult<std::optional<byte_string>> BulkAppendTree::get_chunk_value(
    storage::StorageContext &ctx, uint64_t const chunk_index) const
{
    OperationCost cost;
    if (chunk_index >= chunk_count()) {
        return {std::optional<byte_string>{}, cost};
    }
    mmr::StorageMmrStore store{ctx};
    auto const node = GROVEDB_COST_TRY(
        cost, store.element_at_position(mmr::leaf_index_to_pos(chunk_index)));
    if (!node.has_value() || !node->value().has_value()) {
        LOG_ERROR("bulk append chunk {} is missing", chunk_index);
        return {BulkAppendError::corrupted_data, cost};
    }
    return {std::optional<byte_string>{*node->value()}, cost};
}

CostResult<std::optional<byte_string>> BulkAppendTree::get_value(
    storage::StorageContext &ctx, uint64_t const position) const
{
    OperationCost cost;
    if (position >= total_count_) {
        return {std::optional<byte_string>{}, cost};
    }
    uint64_t const chunk = position >> chunk_power_;
    if (chunk < chunk_count()) {
        auto const blob = GROVEDB_COST_TRY(cost, get_chunk_value(ctx, chunk));
        auto entries =
            GROVEDB_COST_TRY_NO_ADD(cost, deserialize_chunk_blob(*blob));
        uint64_t const offset = position - (chunk << chunk_power_);
        if (offset >= entries.size()) {
            LOG_ERROR(
                "bulk append chunk {} holds {} entries, wanted offset {}",
                chunk,
                entries.size(),
                offset);
            return {BulkAppendError::corrupted_data, cost};
        }
        return {std::optional<byte_string>{std::move(entries[offset])}, cost};
    }
    auto store = buffer_store(ctx);
    auto const buffer = GROVEDB_COST_TRY_NO_ADD(
        cost,
        dense_tree::DenseFixedSizedMerkleTree::from_state(
            chunk_power_, buffer_count()));
    return buffer
        .get(static_cast<uint16_t>(position - (chunk << chunk_power_)), store)
        .add_cost(cost);
}

CostResult<PositionedValues> BulkAppendTree::query_range(
    storage::StorageContext &ctx, uint64_t const start, uint64_t end) const
{
    OperationCost cost;
    PositionedValues out;
    end = std::min(end, total_count_);
    uint64_t const buffer_start = chunk_count() << chunk_power_;
    for (uint64_t chunk = start >> chunk_power_;
         chunk < chunk_count() && (chunk << chunk_power_) < end;
         ++chunk) {
        auto const blob = GROVEDB_COST_TRY(cost, get_chunk_value(ctx, chunk));
        auto entries =
            GROVEDB_COST_TRY_NO_ADD(cost, deserialize_chunk_blob(*blob));
        uint64_t pos = chunk << chunk_power_;
        for (auto &entry : entries) {
            if (pos >= start && pos < end) {
                out.emplace_back(pos, std::move(entry));
            }
            ++pos;
        }
    }
    if (end > buffer_start) {
        auto store = buffer_store(ctx);
        auto const buffer = GROVEDB_COST_TRY_NO_ADD(
            cost,
            dense_tree::DenseFixedSizedMerkleTree::from_state(
                chunk_power_, buffer_count()));
        for (uint64_t pos = std::max(start, buffer_start); pos < end; ++pos) {
            auto value = GROVEDB_COST_TRY(
                cost,
                buffer.get(static_cast<uint16_t>(pos - buffer_start), store));
            out.emplace_back(pos, std::move(*value));
        }
    }
    return {std::move(out), cost};
}

GROVEDB_BULK_APPEND_NAMESPACE_END
