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

#include <grovedb/core/version.hpp>

#include <quill/Quill.h>

GROVEDB_NAMESPACE_BEGIN

Result<void> check_version(
    char const *const method, FeatureVersion const known,
    FeatureVersion const received)
{
    if (received != known) {
        LOG_ERROR(
            "unknown version mismatch for {}: known {}, received {}",
            method,
            known,
            received);
        return Error::version_mismatch;
    }
    return outcome::success();
}

GROVEDB_NAMESPACE_END
