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

#include <keeper/core/address.hpp>
#include <keeper/core/config.hpp>

#include <cstdint>

KEEPER_NAMESPACE_BEGIN

// Set of oracles allowed to sign rewards snapshots and the quorum they must
// reach
class AttestorRegistry
{
public:
    virtual ~AttestorRegistry() = default;

    virtual bool is_oracle(Address const &) const = 0;

    virtual uint64_t rewards_min_oracles() const = 0;
};

KEEPER_NAMESPACE_END
