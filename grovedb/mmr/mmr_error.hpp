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

#include <grovedb/mmr/config.hpp>

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

GROVEDB_MMR_NAMESPACE_BEGIN

enum class MmrError : uint8_t
{
    success = 0,
    get_root_on_empty,
    inconsistent_store,
    store_error,
    node_proofs_not_supported,
    gen_proof_for_invalid_leaves,
    operation_failed,
    invalid_data,
    invalid_input,
    invalid_proof,
};

GROVEDB_MMR_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<GROVEDB_MMR_NAMESPACE::MmrError>
    : quick_status_code_from_enum_defaults<GROVEDB_MMR_NAMESPACE::MmrError>
{
    static constexpr auto const domain_name = "MmrError domain";

    static constexpr auto const domain_uuid =
        "{9a41d3e7-2b58-4c06-b1f9-6e83c07a5d24}";

    static std::initializer_list<mapping> const &value_mappings()
    {
        using GROVEDB_MMR_NAMESPACE::MmrError;

        static std::initializer_list<mapping> const v = {
            {MmrError::success, "success", {errc::success}},
            {MmrError::get_root_on_empty, "get root on an empty MMR", {}},
            {MmrError::inconsistent_store, "inconsistent MMR store", {}},
            {MmrError::store_error, "MMR store error", {}},
            {MmrError::node_proofs_not_supported,
             "tried to prove membership of a non-leaf",
             {}},
            {MmrError::gen_proof_for_invalid_leaves,
             "generate proof for invalid leaves",
             {}},
            {MmrError::operation_failed, "MMR operation failed", {}},
            {MmrError::invalid_data, "invalid MMR data", {}},
            {MmrError::invalid_input, "invalid MMR input", {}},
            {MmrError::invalid_proof, "invalid MMR proof", {}},
        };
        return v;
    }
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
