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

#include <grovedb/storage/config.hpp>

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

GROVEDB_STORAGE_NAMESPACE_BEGIN

enum class StorageError : uint8_t
{
    success = 0,
    backend_failure,
    injected_failure,
    invalid_key,
};

GROVEDB_STORAGE_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<GROVEDB_STORAGE_NAMESPACE::StorageError>
    : quick_status_code_from_enum_defaults<
          GROVEDB_STORAGE_NAMESPACE::StorageError>
{
    static constexpr auto const domain_name = "StorageError domain";

    static constexpr auto const domain_uuid =
        "{0c6f2a91-7d44-4b1e-8e35-5a9d07c1f2b8}";

    static std::initializer_list<mapping> const &value_mappings()
    {
        using GROVEDB_STORAGE_NAMESPACE::StorageError;

        static std::initializer_list<mapping> const v = {
            {StorageError::success, "success", {errc::success}},
            {StorageError::backend_failure, "storage backend failure", {}},
            {StorageError::injected_failure, "injected storage failure", {}},
            {StorageError::invalid_key, "invalid storage key", {}},
        };
        return v;
    }
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
