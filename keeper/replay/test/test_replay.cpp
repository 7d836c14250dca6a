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
#include <keeper/config/keeper_config.hpp>
#include <keeper/host/host_error.hpp>
#include <keeper/oracle/keeper_error.hpp>
#include <keeper/oracle/oracle_consensus.hpp>
#include <keeper/replay/deployment.hpp>
#include <keeper/replay/replay.hpp>
#include <keeper/replay/rewards_tree.hpp>
#include <keeper/test_util/oracle_keys.hpp>
#include <keeper/vault/vault.hpp>

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace keeper;
using namespace keeper::test;
using namespace evmc::literals;

namespace
{
    constexpr auto KEEPER = 0x6b5815467da09daa7dc83db21c9239d98bb487b5_address;
    constexpr auto VAULT = 0x00000000000000000000000000000000000000f1_address;
    constexpr auto OTHER_VAULT =
        0x00000000000000000000000000000000000000f2_address;
    constexpr auto ALICE = 0x000000000000000000000000000000000000a11c_address;

    std::string hex(byte_string_view const bytes)
    {
        return "0x" + evmc::hex(bytes);
    }

    struct ReplayTest : public ::testing::Test
    {
        std::vector<OracleKey> keys_{make_oracle_keys(2)};
        std::unique_ptr<Deployment> deployment_{};

        void SetUp() override
        {
            KeeperConfig config;
            config.keeper = KEEPER;
            config.rewards_min_oracles = 2;
            for (auto const &key : keys_) {
                config.oracles.push_back(key.address);
            }
            auto deployment = Deployment::create(config);
            ASSERT_FALSE(deployment.has_error());
            deployment_ = std::move(deployment).value();
        }

        // signed against the deployment's current nonce
        nlohmann::json update_rewards_op(
            bytes32_t const &root, uint64_t const timestamp)
        {
            RewardsUpdateParams params{
                .rewards_root = root,
                .avg_reward_per_second = 100,
                .update_timestamp = timestamp,
                .rewards_ipfs_hash = "bafkrei",
                .signatures = {}};
            params.signatures = sign_all(
                deployment_->consensus().rewards_digest(params), keys_);
            return {
                {"op", "update_rewards"},
                {"sender", hex(keys_[0].address)},
                {"timestamp", timestamp},
                {"rewards_root", hex(root)},
                {"avg_reward_per_second", 100},
                {"update_timestamp", timestamp},
                {"rewards_ipfs_hash", "bafkrei"},
                {"signatures", hex(params.signatures)}};
        }
    };
}

TEST_F(ReplayTest, deposit_exit_and_claim)
{
    auto const tree = build_rewards_tree(
        {{.vault = VAULT, .reward = 0, .unlocked_mev_reward = 0},
         {.vault = OTHER_VAULT, .reward = 5, .unlocked_mev_reward = 0}});
    auto const root = parse_bytes32(tree.at("root").get<std::string>());

    nlohmann::json ops = nlohmann::json::array();
    ops.push_back(
        {{"op", "set_balance"}, {"address", hex(ALICE)}, {"amount", 1000}});
    ops.push_back(
        {{"op", "add_vault"},
         {"vault", hex(VAULT)},
         {"fee_recipient", hex(ALICE)},
         {"fee_percent", 500}});
    ops.push_back({{"op", "add_vault"}, {"vault", hex(OTHER_VAULT)},
                   {"fee_recipient", hex(ALICE)}});
    ops.push_back({{"op", "collateralize"}, {"vault", hex(VAULT)}});
    ops.push_back(
        {{"op", "deposit"},
         {"vault", hex(VAULT)},
         {"sender", hex(ALICE)},
         {"assets", "1000"}});
    // rejected, nothing to deposit
    ops.push_back(
        {{"op", "deposit"},
         {"vault", hex(VAULT)},
         {"sender", hex(ALICE)},
         {"assets", 0}});
    ops.push_back(
        {{"op", "enter_exit_queue"},
         {"vault", hex(VAULT)},
         {"sender", hex(ALICE)},
         {"shares", 400},
         {"timestamp", 10}});
    ops.push_back(update_rewards_op(root, 43201));
    ops.push_back(
        {{"op", "update_state"},
         {"vault", hex(VAULT)},
         {"reward", tree.at("vaults")[0].at("reward")},
         {"proof", tree.at("vaults")[0].at("proof")}});
    ops.push_back(
        {{"op", "claim_exited_assets"},
         {"vault", hex(VAULT)},
         {"sender", hex(ALICE)},
         {"ticket", 0},
         {"timestamp", 10 + 86400}});

    auto const stats = replay_ops(*deployment_, ops);
    EXPECT_EQ(stats.applied, 9);
    EXPECT_EQ(stats.failed, 1);

    EXPECT_EQ(deployment_->keeper_state().rewards_root, root);
    EXPECT_EQ(deployment_->state().get_balance(ALICE), 400);
    Vault *const vault = deployment_->find_vault(VAULT);
    ASSERT_NE(vault, nullptr);
    EXPECT_EQ(vault->total_assets(), 600);
    EXPECT_EQ(vault->balance_of(ALICE), 600);
    EXPECT_FALSE(vault->get_exit_request(ALICE, 0).has_value());
}

TEST_F(ReplayTest, rejected_op_returns_error)
{
    nlohmann::json const op = {
        {"op", "add_vault"},
        {"vault", hex(VAULT)},
        {"fee_recipient", hex(ALICE)}};
    ASSERT_FALSE(apply_op(*deployment_, op).has_error());
    EXPECT_EQ(
        apply_op(*deployment_, op).assume_error(), KeeperError::VaultExists);

    EXPECT_EQ(
        apply_op(*deployment_, update_rewards_op(bytes32_t{}, 43201))
            .assume_error(),
        KeeperError::InvalidRoot);
}

TEST_F(ReplayTest, balance_overflow_is_rejected)
{
    nlohmann::json const op = {
        {"op", "add_balance"},
        {"address", hex(ALICE)},
        {"amount",
         "0xffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff"}};
    auto const stats =
        replay_ops(*deployment_, nlohmann::json::array({op, op}));
    EXPECT_EQ(stats.applied, 1);
    EXPECT_EQ(stats.failed, 1);
    EXPECT_EQ(
        apply_op(*deployment_, op).assume_error(), HostError::BalanceOverflow);
    EXPECT_EQ(
        deployment_->state().get_balance(ALICE),
        std::numeric_limits<uint256_t>::max());
}

TEST_F(ReplayTest, malformed_ops_throw)
{
    EXPECT_THROW(
        apply_op(*deployment_, {{"op", "self_destruct"}}),
        std::invalid_argument);
    EXPECT_THROW(
        apply_op(
            *deployment_,
            {{"op", "deposit"},
             {"vault", hex(VAULT)},
             {"sender", hex(ALICE)},
             {"assets", 1}}),
        std::invalid_argument);
    EXPECT_THROW(
        apply_op(
            *deployment_,
            {{"op", "add_vault"},
             {"vault", hex(VAULT)},
             {"fee_recipient", hex(ALICE)},
             {"fee_percent", 10001}}),
        std::invalid_argument);
    EXPECT_THROW(
        apply_op(*deployment_, {{"op", "collateralize"}}),
        nlohmann::json::exception);
}
