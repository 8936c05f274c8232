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

#include <grovedb/commitment_tree/config.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <cstdint>
#include <initializer_list>

GROVEDB_COMMITMENT_TREE_NAMESPACE_BEGIN

enum class CommitmentTreeError : uint8_t
{
    success = 0,
    tree_full,
    invalid_data,
    invalid_field_element,
    invalid_payload_size,
    storage_error,
    insufficient_history,
    position_not_marked,
    checkpoint_out_of_order,
    checkpoint_not_found,
    invalid_proof,
};

GROVEDB_COMMITMENT_TREE_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<
    GROVEDB_COMMITMENT_TREE_NAMESPACE::CommitmentTreeError>
    : quick_status_code_from_enum_defaults<
          GROVEDB_COMMITMENT_TREE_NAMESPACE::CommitmentTreeError>
{
    static constexpr auto const domain_name = "CommitmentTreeError domain";

    static constexpr auto const domain_uuid =
        "{7a3e9c41-b25d-4f08-9e6a-d14c0b83f5a2}";

    static std::initializer_list<mapping> const &value_mappings()
    {
        using GROVEDB_COMMITMENT_TREE_NAMESPACE::CommitmentTreeError;

        static std::initializer_list<mapping> const v = {
            {CommitmentTreeError::success, "success", {errc::success}},
            {CommitmentTreeError::tree_full, "commitment tree is full", {}},
            {CommitmentTreeError::invalid_data,
             "invalid commitment tree data",
             {}},
            {CommitmentTreeError::invalid_field_element,
             "not a canonical field element",
             {}},
            {CommitmentTreeError::invalid_payload_size,
             "invalid ciphertext payload size",
             {}},
            {CommitmentTreeError::storage_error,
             "commitment tree storage error",
             {}},
            {CommitmentTreeError::insufficient_history,
             "pruned history does not cover the requested state",
             {}},
            {CommitmentTreeError::position_not_marked,
             "position is not marked for witnessing",
             {}},
            {CommitmentTreeError::checkpoint_out_of_order,
             "checkpoint ids must increase",
             {}},
            {CommitmentTreeError::checkpoint_not_found,
             "checkpoint not found",
             {}},
            {CommitmentTreeError::invalid_proof,
             "invalid commitment tree proof",
             {}},
        };
        return v;
    }
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
