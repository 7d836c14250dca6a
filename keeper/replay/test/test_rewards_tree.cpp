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
#include <keeper/core/int.hpp>
#include <keeper/crypto/merkle.hpp>
#include <keeper/replay/rewards_tree.hpp>
#include <keeper/rewards/reward_harvester.hpp>

#include <evmc/evmc.hpp>

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace keeper;
using namespace evmc::literals;

namespace
{
    nlohmann::json const REWARDS = nlohmann::json::parse(R"([
        {"vault": "0x00000000000000000000000000000000000000f1",
         "reward": "1000000000000000000", "unlocked_mev_reward": "25"},
        {"vault": "0x00000000000000000000000000000000000000f2",
         "reward": -42},
        {"vault": "0x00000000000000000000000000000000000000f3",
         "reward": 0, "unlocked_mev_reward": 7}
    ])");
}

TEST(RewardsTree, parse)
{
    auto const rewards = parse_vault_rewards(REWARDS);
    ASSERT_EQ(rewards.size(), 3);
    EXPECT_EQ(
        rewards[0].vault, 0x00000000000000000000000000000000000000f1_address);
    EXPECT_EQ(rewards[0].unlocked_mev_reward, 25);
    EXPECT_EQ(rewards[1].reward, from_int64(-42));
    EXPECT_EQ(rewards[1].unlocked_mev_reward, 0);
}

TEST(RewardsTree, proofs_verify_against_root)
{
    auto const rewards = parse_vault_rewards(REWARDS);
    auto const tree = build_rewards_tree(rewards);
    auto const root = parse_bytes32(tree.at("root").get<std::string>());
    auto const &vaults = tree.at("vaults");
    ASSERT_EQ(vaults.size(), rewards.size());

    for (size_t i = 0; i < rewards.size(); ++i) {
        auto const &entry = vaults[i];
        EXPECT_EQ(
            parse_address(entry.at("vault").get<std::string>()),
            rewards[i].vault);
        EXPECT_EQ(parse_int256(entry.at("reward")), rewards[i].reward);

        std::vector<bytes32_t> proof;
        for (auto const &node : entry.at("proof")) {
            proof.push_back(parse_bytes32(node.get<std::string>()));
        }
        EXPECT_TRUE(verify_proof(
            proof,
            root,
            rewards_leaf(
                rewards[i].vault,
                rewards[i].reward,
                rewards[i].unlocked_mev_reward)));
    }
    EXPECT_EQ(vaults[1].at("reward").get<std::string>(), "-42");
}

TEST(RewardsTree, rejects_out_of_range)
{
    auto json = REWARDS;
    json[0]["reward"] =
        "730750818665451459101842416358141509827966271488"; // 2^159
    EXPECT_THROW(parse_vault_rewards(json), std::invalid_argument);

    json = REWARDS;
    json[2]["unlocked_mev_reward"] = "-1";
    EXPECT_THROW(parse_vault_rewards(json), std::invalid_argument);
}
