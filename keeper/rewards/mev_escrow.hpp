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
#include <keeper/core/int.hpp>
#include <keeper/core/result.hpp>
#include <keeper/host/call_context.hpp>

KEEPER_NAMESPACE_BEGIN

class State;
class VaultRegistry;

// Pool of execution layer rewards shared by all vaults. Each vault's share is
// attested in the rewards tree as its unlocked MEV reward.
class SharedMevEscrow
{
    State &state_;
    VaultRegistry const &vaults_;
    Address const address_;

public:
    SharedMevEscrow(State &, VaultRegistry const &, Address const &);

    Address const &address() const noexcept
    {
        return address_;
    }

    // Sends assets to the calling vault
    Result<void> harvest(CallContext const &, uint256_t const &assets);
};

// Execution layer rewards of a single vault
class OwnMevEscrow
{
    State &state_;
    Address const address_;
    Address const vault_;

public:
    OwnMevEscrow(State &, Address const &, Address const &vault);

    Address const &address() const noexcept
    {
        return address_;
    }

    // Sends the whole balance to the vault and returns the amount
    Result<uint256_t> harvest(CallContext const &);
};

KEEPER_NAMESPACE_END
