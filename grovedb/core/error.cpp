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

#include <grovedb/core/error.hpp>

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

#include <initializer_list>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<quick_status_code_from_enum<grovedb::Error>::mapping> const &
quick_status_code_from_enum<grovedb::Error>::value_mappings()
{
    using grovedb::Error;

    static std::initializer_list<mapping> const v = {
        {Error::success, "success", {errc::success}},
        {Error::storage_cost_mismatch, "storage cost mismatch", {}},
        {Error::corrupted_data, "corrupted data", {}},
        {Error::path_key_not_found, "path key not found", {}},
        {Error::corrupted_reference_path_key_not_found,
         "corrupted reference path key not found",
         {}},
        {Error::invalid_proof, "invalid proof", {}},
        {Error::invalid_input, "invalid input", {}},
        {Error::bad_traversal_instruction, "bad traversal instruction", {}},
        {Error::merk_invariant, "merk invariant broken", {}},
        {Error::chunk_out_of_bounds, "chunk id out of bounds", {}},
        {Error::chunk_bad_instruction, "bad chunk traversal instruction", {}},
        {Error::chunk_internal, "internal chunking error", {}},
        {Error::version_mismatch, "unknown version mismatch", {}},
        {Error::reference_limit, "reference hop limit reached", {}},
        {Error::cyclic_reference, "cyclic reference", {}},
        {Error::bidirectional_reference_rule,
         "bidirectional reference rule violated",
         {}},
        {Error::not_supported, "not supported", {}},
        {Error::overflow, "arithmetic overflow", {}},
        {Error::request_amount_exceeded, "request amount exceeded", {}},
        {Error::wrong_element_type, "wrong element type", {}},
        {Error::invalid_path, "invalid path", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
