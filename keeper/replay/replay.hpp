// Copyright (C) 2025 Category Labs, Inc.
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

#include <keeper/core/config.hpp>
#include <keeper/core/result.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstddef>

KEEPER_NAMESPACE_BEGIN

class Deployment;

struct ReplayStats
{
    size_t applied{0};
    size_t failed{0};
};

// Applies a single operation. A rejected operation returns its error and
// leaves the deployment unchanged; a malformed one throws.
Result<void> apply_op(Deployment &, nlohmann::json const &op);

// Applies every operation in order, logging each outcome and the events it
// emitted. Rejected operations are counted and skipped.
ReplayStats replay_ops(Deployment &, nlohmann::json const &ops);

KEEPER_NAMESPACE_END
