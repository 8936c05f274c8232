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

#include <grovedb/bulk_append/config.hpp>

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

GROVEDB_BULK_APPEND_NAMESPACE_BEGIN

enum class BulkAppendError : uint8_t
{
    success = 0,
    invalid_input,
    invalid_proof,
    corrupted_data,
    mmr_error,
    storage_error,
};

GROVEDB_BULK_APPEND_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<
    GROVEDB_BULK_APPEND_NAMESPACE::BulkAppendError>
    : quick_status_code_from_enum_defaults<
          GROVEDB_BULK_APPEND_NAMESPACE::BulkAppendError>
{
    static constexpr auto const domain_name = "BulkAppendError domain";

    static constexpr auto const domain_uuid =
        "{c5f08a3d-6e12-4b97-a4d0-28e9b71f6c05}";

    static std::initializer_list<mapping> const &value_mappings()
    {
        using GROVEDB_BULK_APPEND_NAMESPACE::BulkAppendError;

        static std::initializer_list<mapping> const v = {
            {BulkAppendError::success, "success", {errc::success}},
            {BulkAppendError::invalid_input, "invalid bulk append input", {}},
            {BulkAppendError::invalid_proof, "invalid bulk append proof", {}},
            {BulkAppendError::corrupted_data,
             "corrupted bulk append data",
             {}},
            {BulkAppendError::mmr_error, "bulk append chunk mmr error", {}},
            {BulkAppendError::storage_error, "bulk append storage error", {}},
        };
        return v;
    }
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
