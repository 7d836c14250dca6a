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
#include <keeper/core/unordered_map.hpp>

KEEPER_NAMESPACE_BEGIN

// Vaults allowed to harvest rewards and pull from the shared MEV escrow
class VaultRegistry
{
public:
    virtual ~VaultRegistry() = default;

    virtual bool is_vault(Address const &) const = 0;
};

class InMemoryVaultRegistry final : public VaultRegistry
{
    Set<Address> vaults_{};

public:
    bool is_vault(Address const &vault) const override
    {
        return vaults_.contains(vault);
    }

    // returns false if the vault was already registered
    bool add_vault(Address const &vault)
    {
        return vaults_.insert(vault).second;
    }

    bool remove_vault(Address const &vault)
    {
        return vaults_.erase(vault) != 0;
    }
};

KEEPER_NAMESPACE_END
