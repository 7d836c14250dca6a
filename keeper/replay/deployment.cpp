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

#include <keeper/core/fmt/address_fmt.hpp>
#include <keeper/core/likely.h>
#include <keeper/oracle/keeper_error.hpp>
#include <keeper/replay/deployment.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <functional>
#include <utility>

KEEPER_NAMESPACE_BEGIN

Deployment::Deployment(KeeperConfig const &config)
    : config_{config}
    , oracles_{state_, config.keeper}
    , consensus_{
          keeper_,
          state_,
          oracles_,
          config.eip712_domain(),
          config.oracle_consensus_config()}
    , harvester_{keeper_, state_, vault_registry_, config.keeper}
    , shared_mev_escrow_{state_, vault_registry_, config.shared_mev_escrow}
{
}

Result<std::unique_ptr<Deployment>>
Deployment::create(KeeperConfig const &config)
{
    std::unique_ptr<Deployment> deployment{new Deployment{config}};
    for (auto const &oracle : config.oracles) {
        BOOST_OUTCOME_TRY(deployment->oracles_.add_oracle(oracle));
    }
    BOOST_OUTCOME_TRY(deployment->oracles_.set_rewards_min_oracles(
        config.rewards_min_oracles));
    LOG_INFO(
        "Deployment: keeper {} with {} oracles, quorum {}",
        config.keeper,
        config.oracles.size(),
        config.rewards_min_oracles);
    return deployment;
}

Result<Vault *> Deployment::add_vault(
    VaultConfig const &vault_config,
    std::optional<Address> const &own_mev_escrow)
{
    if (KEEPER_UNLIKELY(!vault_registry_.add_vault(vault_config.address))) {
        return KeeperError::VaultExists;
    }

    MevEscrowRef escrow{std::ref(shared_mev_escrow_)};
    if (own_mev_escrow.has_value()) {
        own_mev_escrows_.emplace_back(std::make_unique<OwnMevEscrow>(
            state_, *own_mev_escrow, vault_config.address));
        escrow = std::ref(*own_mev_escrows_.back());
    }

    auto vault =
        std::make_unique<Vault>(state_, harvester_, escrow, vault_config);
    Vault *const result = vault.get();
    vaults_.emplace(vault_config.address, std::move(vault));
    LOG_INFO(
        "Deployment: added vault {}, fee recipient {}, fee percent {}",
        vault_config.address,
        vault_config.fee_recipient,
        vault_config.fee_percent);
    return result;
}

Vault *Deployment::find_vault(Address const &address)
{
    auto const it = vaults_.find(address);
    if (it == vaults_.end()) {
        return nullptr;
    }
    return it->second.get();
}

KEEPER_NAMESPACE_END
