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

#include <keeper/config/json_util.hpp>
#include <keeper/core/bytes.hpp>
#include <keeper/crypto/merkle_tree.hpp>
#include <keeper/replay/rewards_tree.hpp>
#include <keeper/rewards/reward_harvester.hpp>

#include <evmc/hex.hpp>

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

KEEPER_NAMESPACE_BEGIN

namespace
{
    std::string to_hex(byte_string_view const bytes)
    {
        return "0x" + evmc::hex(bytes);
    }
}

std::vector<VaultReward> parse_vault_rewards(nlohmann::json const &json)
{
    std::vector<VaultReward> rewards;
    for (auto const &item : json) {
        VaultReward reward{
            .vault = parse_address(item.at("vault").get<std::string>()),
            .reward = parse_int256(item.at("reward")),
            .unlocked_mev_reward = item.contains("unlocked_mev_reward")
                                       ? parse_uint256(
                                             item.at("unlocked_mev_reward"))
                                       : uint256_t{0}};
        if (!fits_signed<160>(reward.reward) ||
            !fits_unsigned<160>(reward.unlocked_mev_reward)) {
            throw std::invalid_argument{"reward out of range"};
        }
        rewards.push_back(reward);
    }
    return rewards;
}

nlohmann::json build_rewards_tree(std::vector<VaultReward> const &rewards)
{
    std::vector<bytes32_t> leaves;
    leaves.reserve(rewards.size());
    for (auto const &r : rewards) {
        leaves.push_back(
            rewards_leaf(r.vault, r.reward, r.unlocked_mev_reward));
    }
    MerkleTree const tree{leaves};

    nlohmann::json vaults = nlohmann::json::array();
    for (size_t i = 0; i < rewards.size(); ++i) {
        nlohmann::json proof = nlohmann::json::array();
        for (auto const &node : tree.proof(i)) {
            proof.push_back(to_hex(node));
        }
        vaults.push_back(
            {{"vault", to_hex(rewards[i].vault)},
             {"reward", to_signed_string(rewards[i].reward)},
             {"unlocked_mev_reward",
              intx::to_string(rewards[i].unlocked_mev_reward)},
             {"proof", std::move(proof)}});
    }
    return {{"root", to_hex(tree.root())}, {"vaults", std::move(vaults)}};
}

KEEPER_NAMESPACE_END
