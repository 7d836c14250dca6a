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

#include <nlohmann/json_fwd.hpp>

#include <vector>

KEEPER_NAMESPACE_BEGIN

struct VaultReward
{
    Address vault{};
    // int160 in two's complement
    uint256_t reward{0};
    uint256_t unlocked_mev_reward{0};
};

// [{"vault", "reward", "unlocked_mev_reward"}]; throws on malformed input
std::vector<VaultReward> parse_vault_rewards(nlohmann::json const &);

// {"root", "vaults": [{"vault", "reward", "unlocked_mev_reward", "proof"}]}
nlohmann::json build_rewards_tree(std::vector<VaultReward> const &);

KEEPER_NAMESPACE_END
