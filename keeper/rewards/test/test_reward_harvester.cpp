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

#include <keeper/abi/abi_encode.hpp>
#include <keeper/abi/abi_signatures.hpp>
#include <keeper/abi/checked_math.hpp>
#include <keeper/host/call_context.hpp>
#include <keeper/oracle/keeper_error.hpp>
#include <keeper/rewards/reward_harvester.hpp>
#include <keeper/test_util/keeper_fixture.hpp>

#include <evmc/evmc.hpp>

#include <gtest/gtest.h>

using namespace keeper;
using namespace keeper::test;
using namespace evmc::literals;

namespace
{
    constexpr auto VAULT = 0x00000000000000000000000000000000000000f1_address;
    constexpr auto OTHER_VAULT =
        0x00000000000000000000000000000000000000f2_address;
    constexpr auto FEE_RECIPIENT =
        0x00000000000000000000000000000000000000fe_address;

    struct RewardHarvesterTest : public KeeperFixture
    {
        void SetUp() override
        {
            KeeperFixture::SetUp();
            add_vault(VAULT, FEE_RECIPIENT, 0);
            add_vault(OTHER_VAULT, FEE_RECIPIENT, 0);
        }

        RewardHarvester &harvester()
        {
            return deployment_->harvester();
        }

        Result<HarvestResult>
        harvest(HarvestParams const &params, bool const shared_mev = false)
        {
            return harvester().harvest(
                CallContext{.sender = VAULT, .timestamp = now_},
                params,
                shared_mev);
        }

        // one entry for VAULT, one for OTHER_VAULT so proofs are non-empty
        HarvestParams publish(int64_t const reward, uint64_t const mev = 0)
        {
            return publish_rewards(
                {{.vault = VAULT,
                  .reward = from_int64(reward),
                  .unlocked_mev_reward = mev},
                 {.vault = OTHER_VAULT,
                  .reward = from_int64(reward + 1),
                  .unlocked_mev_reward = 0}})[0];
        }
    };
}

TEST(RewardsLeaf, binds_every_field)
{
    auto const leaf = rewards_leaf(VAULT, 10, 5);
    EXPECT_NE(leaf, rewards_leaf(OTHER_VAULT, 10, 5));
    EXPECT_NE(leaf, rewards_leaf(VAULT, 11, 5));
    EXPECT_NE(leaf, rewards_leaf(VAULT, 10, 6));
    EXPECT_EQ(
        leaf,
        keccak256_bytes(keccak256_bytes(AbiEncoder{}
                                            .add_address(VAULT)
                                            .add_int(10)
                                            .add_uint(u256_be{5})
                                            .encode_final())));
}

TEST_F(RewardHarvesterTest, harvest_applies_delta)
{
    auto const params = publish(100);
    EXPECT_TRUE(harvester().is_harvest_required(VAULT));
    EXPECT_TRUE(harvester().can_harvest(VAULT, params));

    auto const result = harvest(params);
    ASSERT_FALSE(result.has_error());
    EXPECT_TRUE(result.value().harvested);
    EXPECT_EQ(result.value().total_assets_delta, 100);
    EXPECT_EQ(result.value().unlocked_mev_delta, 0);

    auto const reward = harvester().reward(VAULT);
    EXPECT_EQ(reward.assets, 100);
    EXPECT_EQ(reward.nonce, 2);
    EXPECT_FALSE(harvester().is_harvest_required(VAULT));

    auto const &log = deployment_->state().logs().back();
    EXPECT_EQ(
        log.topics[0],
        abi_encode_event_signature(
            "Harvested(address,bytes32,int256,uint256)"));
    EXPECT_EQ(log.topics[1], abi_encode_address(VAULT));
    EXPECT_EQ(log.topics[2], deployment_->keeper_state().rewards_root);
}

TEST_F(RewardHarvesterTest, harvest_is_applied_once)
{
    auto const params = publish(100);
    ASSERT_FALSE(harvest(params).has_error());
    size_t const logs = deployment_->state().logs().size();

    EXPECT_FALSE(harvester().can_harvest(VAULT, params));
    auto const again = harvest(params);
    ASSERT_FALSE(again.has_error());
    EXPECT_FALSE(again.value().harvested);
    EXPECT_EQ(again.value().total_assets_delta, 0);
    EXPECT_EQ(harvester().reward(VAULT).assets, 100);
    EXPECT_EQ(deployment_->state().logs().size(), logs);
}

TEST_F(RewardHarvesterTest, negative_delta)
{
    ASSERT_FALSE(harvest(publish(100)).has_error());
    auto const result = harvest(publish(80));
    ASSERT_FALSE(result.has_error());
    EXPECT_EQ(result.value().total_assets_delta, from_int64(-20));
    EXPECT_EQ(harvester().reward(VAULT).assets, 80);
}

TEST_F(RewardHarvesterTest, negative_cumulative_reward)
{
    auto const result = harvest(publish(-7));
    ASSERT_FALSE(result.has_error());
    EXPECT_EQ(result.value().total_assets_delta, from_int64(-7));
}

TEST_F(RewardHarvesterTest, previous_root_grace)
{
    auto const first = publish(100);
    auto const second = publish(150);

    auto const result = harvest(first);
    ASSERT_FALSE(result.has_error());
    EXPECT_TRUE(result.value().harvested);
    EXPECT_EQ(result.value().total_assets_delta, 100);
    // synced with the previous snapshot only
    EXPECT_EQ(harvester().reward(VAULT).nonce, 2);
    EXPECT_TRUE(harvester().is_harvest_required(VAULT));

    auto const catch_up = harvest(second);
    ASSERT_FALSE(catch_up.has_error());
    EXPECT_EQ(catch_up.value().total_assets_delta, 50);
    EXPECT_EQ(harvester().reward(VAULT).nonce, 3);

    // going back to the previous root is a no-op
    auto const stale = harvest(first);
    ASSERT_FALSE(stale.has_error());
    EXPECT_FALSE(stale.value().harvested);
    EXPECT_EQ(harvester().reward(VAULT).assets, 150);
}

TEST_F(RewardHarvesterTest, proof_two_snapshots_old)
{
    auto const oldest = publish(100);
    publish(150);
    publish(200);

    EXPECT_FALSE(harvester().can_harvest(VAULT, oldest));
    EXPECT_EQ(harvest(oldest).assume_error(), KeeperError::InvalidProof);
    EXPECT_EQ(harvester().reward(VAULT).nonce, 0);
}

TEST_F(RewardHarvesterTest, invalid_proof)
{
    auto params = publish(100);
    params.reward = 101;
    EXPECT_EQ(harvest(params).assume_error(), KeeperError::InvalidProof);

    params = publish(120);
    params.proof.clear();
    EXPECT_EQ(harvest(params).assume_error(), KeeperError::InvalidProof);
}

TEST_F(RewardHarvesterTest, no_snapshot_yet)
{
    HarvestParams const params{.reward = 0, .unlocked_mev_reward = 0};
    EXPECT_EQ(harvest(params).assume_error(), KeeperError::InvalidProof);
}

TEST_F(RewardHarvesterTest, only_vaults_harvest)
{
    auto const params = publish(100);
    auto const result = harvester().harvest(
        CallContext{
            .sender = 0x00000000000000000000000000000000000000aa_address},
        params,
        false);
    EXPECT_EQ(result.assume_error(), KeeperError::AccessDenied);
    EXPECT_EQ(
        harvester().collateralize(FEE_RECIPIENT).assume_error(),
        KeeperError::AccessDenied);
}

TEST_F(RewardHarvesterTest, reward_width)
{
    auto params = publish(100);
    params.reward = uint256_t{1} << 159;
    EXPECT_EQ(harvest(params).assume_error(), KeeperError::InvalidAmount);
    params.reward = 100;
    params.unlocked_mev_reward = uint256_t{1} << 160;
    EXPECT_EQ(harvest(params).assume_error(), KeeperError::InvalidAmount);
}

TEST_F(RewardHarvesterTest, harvest_overdue)
{
    EXPECT_FALSE(harvester().is_collateralized(VAULT));
    ASSERT_FALSE(harvester().collateralize(VAULT).has_error());
    EXPECT_TRUE(harvester().is_collateralized(VAULT));
    EXPECT_EQ(harvester().reward(VAULT).nonce, 1);
    EXPECT_FALSE(harvester().is_harvest_required(VAULT));

    auto const first = publish(100);
    EXPECT_TRUE(harvester().is_harvest_required(VAULT));
    EXPECT_FALSE(harvester().is_harvest_overdue(VAULT));

    publish(150);
    EXPECT_TRUE(harvester().is_harvest_overdue(VAULT));

    ASSERT_FALSE(harvest(first).has_error());
    EXPECT_FALSE(harvester().is_harvest_overdue(VAULT));
    EXPECT_TRUE(harvester().is_harvest_required(VAULT));

    // collateralizing again keeps the record
    ASSERT_FALSE(harvester().collateralize(VAULT).has_error());
    EXPECT_EQ(harvester().reward(VAULT).assets, 100);
}

TEST_F(RewardHarvesterTest, shared_mev_delta)
{
    auto const result = harvest(publish(100, 30), true);
    ASSERT_FALSE(result.has_error());
    EXPECT_EQ(result.value().unlocked_mev_delta, 30);
    EXPECT_EQ(harvester().unlocked_mev_reward(VAULT).assets, 30);
    EXPECT_EQ(harvester().unlocked_mev_reward(VAULT).nonce, 2);

    auto const next = harvest(publish(110, 45), true);
    ASSERT_FALSE(next.has_error());
    EXPECT_EQ(next.value().total_assets_delta, 10);
    EXPECT_EQ(next.value().unlocked_mev_delta, 15);
}

TEST_F(RewardHarvesterTest, own_mev_ignores_unlocked_reward)
{
    auto const result = harvest(publish(100, 30), false);
    ASSERT_FALSE(result.has_error());
    EXPECT_EQ(result.value().unlocked_mev_delta, 0);
    EXPECT_EQ(harvester().unlocked_mev_reward(VAULT).assets, 0);
}

TEST_F(RewardHarvesterTest, decreasing_unlocked_mev_is_rejected)
{
    ASSERT_FALSE(harvest(publish(100, 30), true).has_error());
    auto const params = publish(110, 20);
    EXPECT_EQ(harvest(params, true).assume_error(), MathError::Underflow);
    EXPECT_EQ(harvester().reward(VAULT).assets, 100);
    EXPECT_EQ(harvester().unlocked_mev_reward(VAULT).assets, 30);
}
