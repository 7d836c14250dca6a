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

#include <keeper/config/keeper_config.hpp>
#include <keeper/core/address.hpp>
#include <keeper/core/config.hpp>
#include <keeper/core/result.hpp>
#include <keeper/core/unordered_map.hpp>
#include <keeper/host/state.hpp>
#include <keeper/oracle/keeper_state.hpp>
#include <keeper/oracle/oracle_consensus.hpp>
#include <keeper/oracle/oracle_set.hpp>
#include <keeper/rewards/mev_escrow.hpp>
#include <keeper/rewards/reward_harvester.hpp>
#include <keeper/rewards/vault_registry.hpp>
#include <keeper/vault/vault.hpp>

#include <memory>
#include <optional>
#include <vector>

KEEPER_NAMESPACE_BEGIN

// One keeper with its oracles, the shared MEV escrow and every vault,
// wired over a single State
class Deployment
{
    KeeperConfig const config_;
    State state_{};
    KeeperState keeper_{};
    OracleSet oracles_;
    InMemoryVaultRegistry vault_registry_{};
    OracleConsensus consensus_;
    RewardHarvester harvester_;
    SharedMevEscrow shared_mev_escrow_;
    std::vector<std::unique_ptr<OwnMevEscrow>> own_mev_escrows_{};
    Map<Address, std::unique_ptr<Vault>> vaults_{};

    explicit Deployment(KeeperConfig const &);

public:
    Deployment(Deployment const &) = delete;
    Deployment &operator=(Deployment const &) = delete;

    static Result<std::unique_ptr<Deployment>> create(KeeperConfig const &);

    // own_mev_escrow empty selects the shared MEV escrow
    Result<Vault *> add_vault(
        VaultConfig const &, std::optional<Address> const &own_mev_escrow);

    // nullptr if no such vault
    Vault *find_vault(Address const &);

    KeeperConfig const &config() const noexcept
    {
        return config_;
    }

    State &state() noexcept
    {
        return state_;
    }

    KeeperState const &keeper_state() const noexcept
    {
        return keeper_;
    }

    OracleSet &oracles() noexcept
    {
        return oracles_;
    }

    OracleConsensus &consensus() noexcept
    {
        return consensus_;
    }

    RewardHarvester &harvester() noexcept
    {
        return harvester_;
    }

    SharedMevEscrow &shared_mev_escrow() noexcept
    {
        return shared_mev_escrow_;
    }
};

KEEPER_NAMESPACE_END
