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

#include <keeper/crypto/merkle_tree.hpp>
#include <keeper/host/call_context.hpp>
#include <keeper/oracle/oracle_consensus.hpp>
#include <keeper/test_util/keeper_fixture.hpp>
#include <keeper/vault/vault.hpp>

#include <utility>

namespace keeper::test
{
    void KeeperFixture::SetUp()
    {
        config_.chain_id = 1;
        config_.keeper = KEEPER_ADDRESS;
        config_.shared_mev_escrow = SHARED_MEV_ESCROW_ADDRESS;
        config_.rewards_min_oracles = 2;
        for (auto const &key : oracle_keys_) {
            config_.oracles.push_back(key.address);
        }
        auto deployment = Deployment::create(config_);
        ASSERT_FALSE(deployment.has_error());
        deployment_ = std::move(deployment).value();
        now_ = config_.rewards_delay;
    }

    Vault &KeeperFixture::add_vault(
        Address const &vault, Address const &fee_recipient,
        uint64_t const fee_percent,
        std::optional<Address> const &own_mev_escrow)
    {
        auto const result = deployment_->add_vault(
            VaultConfig{
                .address = vault,
                .fee_recipient = fee_recipient,
                .fee_percent = fee_percent,
                .exit_claim_delay = config_.exit_claim_delay},
            own_mev_escrow);
        EXPECT_FALSE(result.has_error());
        return *result.value();
    }

    RewardsUpdateParams KeeperFixture::make_rewards_update(
        bytes32_t const &root, std::span<OracleKey const> const signers)
    {
        RewardsUpdateParams params{
            .rewards_root = root,
            .avg_reward_per_second = 1'000,
            .update_timestamp = now_,
            .rewards_ipfs_hash = "bafkreidivzimqfqtoqxkrpge6bjyhlvxqs3rhe",
            .signatures = {}};
        params.signatures = sign_all(
            deployment_->consensus().rewards_digest(params), signers);
        return params;
    }

    std::vector<HarvestParams>
    KeeperFixture::publish_rewards(std::vector<VaultReward> const &rewards)
    {
        std::vector<bytes32_t> leaves;
        for (auto const &r : rewards) {
            leaves.push_back(
                rewards_leaf(r.vault, r.reward, r.unlocked_mev_reward));
        }
        MerkleTree const tree{leaves};

        advance(config_.rewards_delay + 1);
        auto const params = make_rewards_update(
            tree.root(), std::span{oracle_keys_}.first(2));
        auto const result = deployment_->consensus().update_rewards(
            CallContext{.sender = oracle_keys_[0].address, .timestamp = now_},
            params);
        EXPECT_FALSE(result.has_error())
            << result.assume_error().message().c_str();

        std::vector<HarvestParams> harvests;
        for (size_t i = 0; i < rewards.size(); ++i) {
            harvests.push_back(HarvestParams{
                .reward = rewards[i].reward,
                .unlocked_mev_reward = rewards[i].unlocked_mev_reward,
                .proof = tree.proof(i)});
        }
        return harvests;
    }
}
