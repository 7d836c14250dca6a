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
#include <keeper/core/unordered_map.hpp>

#include <cstdint>

KEEPER_NAMESPACE_BEGIN

// Last harvested cumulative reward of a vault; assets is an int160 in two's
// complement and may be negative after penalties
struct Reward
{
    uint256_t assets{0};
    uint64_t nonce{0};
};

// Last harvested cumulative reward accrued in the shared MEV escrow
struct UnlockedMevReward
{
    uint256_t assets{0};
    uint64_t nonce{0};
};

// Rewards snapshot written by OracleConsensus and the per vault harvest
// records written by RewardHarvester
struct KeeperState
{
    bytes32_t rewards_root{};
    bytes32_t prev_rewards_root{};
    // zero is reserved for vaults that were never collateralized
    uint64_t rewards_nonce{1};
    uint64_t last_rewards_timestamp{0};
    uint256_t avg_reward_per_second{0};

    Map<Address, Reward> rewards{};
    Map<Address, UnlockedMevReward> unlocked_mev_rewards{};
};

KEEPER_NAMESPACE_END
