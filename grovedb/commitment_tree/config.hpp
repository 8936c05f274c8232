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

#define GROVEDB_COMMITMENT_TREE_NAMESPACE_BEGIN                                \
    GROVEDB_NAMESPACE_BEGIN namespace commitment_tree                          \
    {

#define GROVEDB_COMMITMENT_TREE_NAMESPACE_END                                  \
    }                                                                          \
    GROVEDB_NAMESPACE_END

#define GROVEDB_COMMITMENT_TREE_NAMESPACE ::grovedb::commitment_tree
