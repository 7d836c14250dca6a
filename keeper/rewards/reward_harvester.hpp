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
#include <keeper/core/bytes.hpp>
#include <keeper/core/config.hpp>
#include <keeper/core/int.hpp>
#include <keeper/core/result.hpp>
#include <keeper/host/call_context.hpp>
#include <keeper/oracle/keeper_state.hpp>

#include <cstdint>
#include <optional>
#include <vector>

KEEPER_NAMESPACE_BEGIN

class State;
class VaultRegistry;

struct HarvestParams
{
    // cumulative reward of the vault, int160 in two's complement
    uint256_t reward{0};
    // cumulative reward accrued for the vault in the shared MEV escrow, uint160
    uint256_t unlocked_mev_reward{0};
    std::vector<bytes32_t> proof{};
};

struct HarvestResult
{
    // signed change of the vault's total assets since its last harvest
    uint256_t total_assets_delta{0};
    uint256_t unlocked_mev_delta{0};
    bool harvested{false};
};

// keccak256(keccak256(abi.encode(address vault, int160 reward, uint160
// unlockedMevReward)))
bytes32_t rewards_leaf(
    Address const &vault, uint256_t const &reward,
    uint256_t const &unlocked_mev_reward);

// Applies the rewards of the current (or previous) snapshot to a vault at
// most once per snapshot
class RewardHarvester
{
    KeeperState &keeper_;
    State &state_;
    VaultRegistry const &vaults_;
    Address const contract_;

    struct RootMatch
    {
        bytes32_t root;
        uint64_t nonce;
    };

    std::optional<RootMatch>
    match_root(Address const &vault, HarvestParams const &) const;

    void emit_harvested_event(
        Address const &vault, bytes32_t const &root,
        HarvestResult const &result);

public:
    RewardHarvester(
        KeeperState &, State &, VaultRegistry const &,
        Address const &contract);

    // Called by the vault itself; shared_mev selects whether the vault takes
    // its execution rewards from the shared MEV escrow
    Result<HarvestResult>
    harvest(CallContext const &, HarvestParams const &, bool shared_mev);

    // Dry run of harvest, nothing is written
    bool can_harvest(Address const &vault, HarvestParams const &) const;

    bool is_harvest_required(Address const &vault) const;

    // The vault missed more than one snapshot and must harvest before
    // accepting deposits or exits
    bool is_harvest_overdue(Address const &vault) const;

    bool is_collateralized(Address const &vault) const;

    // Starts tracking rewards of a vault once its first validator is
    // registered
    Result<void> collateralize(Address const &vault);

    Reward reward(Address const &vault) const;

    UnlockedMevReward unlocked_mev_reward(Address const &vault) const;
};

KEEPER_NAMESPACE_END
