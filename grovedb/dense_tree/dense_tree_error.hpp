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

#include <grovedb/dense_tree/config.hpp>

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

GROVEDB_DENSE_TREE_NAMESPACE_BEGIN

enum class DenseTreeError : uint8_t
{
    success = 0,
    invalid_height,
    tree_full,
    invalid_data,
    invalid_input,
    invalid_proof,
    store_error,
};

GROVEDB_DENSE_TREE_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<GROVEDB_DENSE_TREE_NAMESPACE::DenseTreeError>
    : quick_status_code_from_enum_defaults<
          GROVEDB_DENSE_TREE_NAMESPACE::DenseTreeError>
{
    static constexpr auto const domain_name = "DenseTreeError domain";

    static constexpr auto const domain_uuid =
        "{3e7b2c18-95d4-4f0a-8c62-d1a04b9e7f53}";

    static std::initializer_list<mapping> const &value_mappings()
    {
        using GROVEDB_DENSE_TREE_NAMESPACE::DenseTreeError;

        static std::initializer_list<mapping> const v = {
            {DenseTreeError::success, "success", {errc::success}},
            {DenseTreeError::invalid_height,
             "dense tree height must be within 1..=16",
             {}},
            {DenseTreeError::tree_full, "dense tree is full", {}},
            {DenseTreeError::invalid_data, "invalid dense tree data", {}},
            {DenseTreeError::invalid_input, "invalid dense tree input", {}},
            {DenseTreeError::invalid_proof, "invalid dense tree proof", {}},
            {DenseTreeError::store_error, "dense tree store error", {}},
        };
        return v;
    }
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
