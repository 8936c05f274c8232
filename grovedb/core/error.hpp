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

#include <grovedb/core/config.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <cstdint>
#include <initializer_list>

GROVEDB_NAMESPACE_BEGIN

enum class Error : uint8_t
{
    success = 0,
    storage_cost_mismatch,
    corrupted_data,
    path_key_not_found,
    corrupted_reference_path_key_not_found,
    invalid_proof,
    invalid_input,
    bad_traversal_instruction,
    merk_invariant,
    chunk_out_of_bounds,
    chunk_bad_instruction,
    chunk_internal,
    version_mismatch,
    reference_limit,
    cyclic_reference,
    bidirectional_reference_rule,
    not_supported,
    overflow,
    request_amount_exceeded,
    wrong_element_type,
    invalid_path,
};

GROVEDB_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<grovedb::Error>
    : quick_status_code_from_enum_defaults<grovedb::Error>
{
    static constexpr auto const domain_name = "GroveDB Error";
    static constexpr auto const domain_uuid =
        "{5b0e93f2-1c3a-4d7e-9a61-2f4c8d7b3e10}";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
