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

#include <grovedb/storage/memory_storage.hpp>

#include <grovedb/core/blake3.hpp>
#include <grovedb/core/codec.hpp>
#include <grovedb/storage/storage_error.hpp>

#include <quill/Quill.h>

#include <map>
#include <optional>

GROVEDB_STORAGE_NAMESPACE_BEGIN

namespace
{
    using map_type = std::map<byte_string, byte_string>;

    bool has_prefix(byte_string const &key, bytes32_t const &prefix)
    {
        return key.size() >= sizeof(prefix.bytes) &&
               std::equal(
                   prefix.bytes, prefix.bytes + sizeof(prefix.bytes), key.data());
    }

    class MemoryRawIterator final : public RawIterator
    {
        map_type const &map_;
        bytes32_t prefix_;
        map_type::const_iterator it_;

        void clamp_forward()
        {
            if (it_ != map_.end() && !has_prefix(it_->first, prefix_)) {
                it_ = map_.end();
            }
        }

        // moves to the element before `it`, or invalidates
        void step_back(map_type::const_iterator it)
        {
            if (it == map_.begin()) {
                it_ = map_.end();
                return;
            }
            --it;
            it_ = has_prefix(it->first, prefix_) ? it : map_.end();
        }

        byte_string with_prefix(byte_string_view const key) const
        {
            byte_string k{to_byte_string_view(prefix_)};
            k.append(key);
            return k;
        }

    public:
        MemoryRawIterator(map_type const &map, bytes32_t const &prefix)
            : map_{map}
            , prefix_{prefix}
            , it_{map.end()}
        {
        }

        void seek_to_first(OperationCost &cost) override
        {
            ++cost.seek_count;
            it_ = map_.lower_bound(with_prefix({}));
            clamp_forward();
        }

        void seek_to_last(OperationCost &cost) override
        {
            ++cost.seek_count;
            // first key past the prefix range
            byte_string upper{to_byte_string_view(prefix_)};
            while (!upper.empty() && upper.back() == 0xff) {
                upper.pop_back();
            }
            if (upper.empty()) {
                step_back(map_.end());
                return;
            }
            ++upper.back();
            step_back(map_.lower_bound(upper));
        }

        void seek(byte_string_view const key, OperationCost &cost) override
        {
            ++cost.seek_count;
            it_ = map_.lower_bound(with_prefix(key));
            clamp_forward();
        }

        void
        seek_for_prev(byte_string_view const key, OperationCost &cost) override
        {
            ++cost.seek_count;
            step_back(map_.upper_bound(with_prefix(key)));
        }

        void next(OperationCost &cost) override
        {
            ++cost.seek_count;
            if (it_ != map_.end()) {
                ++it_;
                clamp_forward();
            }
        }

        void prev(OperationCost &cost) override
        {
            ++cost.seek_count;
            if (it_ != map_.end()) {
                step_back(it_);
            }
        }

        bool valid() const override
        {
            return it_ != map_.end();
        }

        std::optional<byte_string> key(OperationCost &cost) const override
        {
            if (!valid()) {
                return std::nullopt;
            }
            byte_string k = it_->first.substr(sizeof(prefix_.bytes));
            cost.storage_loaded_bytes += k.size();
            return k;
        }

        std::optional<byte_string> value(OperationCost &cost) const override
        {
            if (!valid()) {
                return std::nullopt;
            }
            cost.storage_loaded_bytes += it_->second.size();
            return it_->second;
        }
    };
}

bytes32_t build_prefix(std::span<byte_string const> const path)
{
    if (path.empty()) {
        return NULL_HASH;
    }
    Blake3Hasher hasher;
    byte_string lengths;
    for (auto const &segment : path) {
        hasher.update(segment);
        append_varint(lengths, segment.size());
    }
    append_varint(lengths, path.size());
    return hasher.update(lengths).finalize();
}

std::unique_ptr<StorageContext> MemoryStorage::context(bytes32_t const &prefix)
{
    return std::make_unique<MemoryStorageContext>(*this, prefix);
}

byte_string MemoryStorageContext::prefixed(byte_string_view const key) const
{
    byte_string k{to_byte_string_view(prefix_)};
    k.append(key);
    return k;
}

CostResult<std::optional<byte_string>>
MemoryStorageContext::get_in(Keyspace const keyspace, byte_string_view const key)
{
    OperationCost cost{.seek_count = 1};
    auto const &map = db_.spaces_[static_cast<size_t>(keyspace)];
    auto const it = map.find(prefixed(key));
    if (it == map.end()) {
        return {std::optional<byte_string>{}, cost};
    }
    cost.storage_loaded_bytes += it->second.size();
    return {std::optional<byte_string>{it->second}, cost};
}

CostResult<void> MemoryStorageContext::commit_batch(StorageBatch const &batch)
{
    OperationCost cost;
    // Costs only become final once every write is known to be valid
    OperationCost pending;
    for (auto const &op : batch.operations()) {
        ++cost.seek_count;
        uint32_t const key_len =
            static_cast<uint32_t>(sizeof(prefix_.bytes) + op.key.size());
        if (op.kind == BatchOperation::Kind::put) {
            if (op.keyspace == Keyspace::roots && !op.cost_info.has_value()) {
                continue;
            }
            GROVEDB_COST_TRY_NO_ADD(
                cost,
                pending.add_key_value_storage_costs(
                    key_len,
                    static_cast<uint32_t>(op.value.size()),
                    op.keyspace == Keyspace::data ? op.children_sizes
                                                  : std::nullopt,
                    op.cost_info));
        }
        else if (op.cost_info.has_value()) {
            pending.storage_cost.removed_bytes +=
                op.cost_info->combined_removed_bytes();
        }
    }
    for (auto const &op : batch.operations()) {
        auto &map = db_.spaces_[static_cast<size_t>(op.keyspace)];
        if (op.kind == BatchOperation::Kind::put) {
            map.insert_or_assign(prefixed(op.key), op.value);
        }
        else {
            map.erase(prefixed(op.key));
        }
    }
    cost += pending;
    return {outcome::success(), cost};
}

std::unique_ptr<RawIterator> MemoryStorageContext::raw_iter(Keyspace const keyspace)
{
    return std::make_unique<MemoryRawIterator>(
        db_.spaces_[static_cast<size_t>(keyspace)], prefix_);
}

CostResult<std::optional<byte_string>> FailingDataStorageContext::get_in(
    Keyspace const keyspace, byte_string_view const key)
{
    if (keyspace == Keyspace::data || keyspace == Keyspace::aux) {
        return {StorageError::injected_failure, OperationCost{}};
    }
    return inner_.get_in(keyspace, key);
}

CostResult<void>
FailingDataStorageContext::commit_batch(StorageBatch const &batch)
{
    for (auto const &op : batch.operations()) {
        if (op.keyspace == Keyspace::data || op.keyspace == Keyspace::aux) {
            LOG_WARNING("refusing batch of {} operations", batch.size());
            return {StorageError::injected_failure, OperationCost{}};
        }
    }
    return inner_.commit_batch(batch);
}

GROVEDB_STORAGE_NAMESPACE_END
