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
#include <keeper/core/bytes.hpp>
#include <keeper/core/int.hpp>
#include <keeper/core/result.hpp>
#include <keeper/replay/deployment.hpp>
#include <keeper/replay/rewards_tree.hpp>
#include <keeper/rewards/reward_harvester.hpp>
#include <keeper/test_util/oracle_keys.hpp>

#include <evmc/evmc.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace keeper::test
{
    using namespace evmc::literals;

    inline constexpr Address KEEPER_ADDRESS =
        0x6b5815467da09daa7dc83db21c9239d98bb487b5_address;
    inline constexpr Address SHARED_MEV_ESCROW_ADDRESS =
        0x48319f97e5da1233c21c48b80097c0fb7a20ff86_address;

    // A deployment with three oracles and a quorum of two. Time starts one
    // rewards delay after zero and only moves forward through advance().
    class KeeperFixture : public ::testing::Test
    {
    protected:
        std::vector<OracleKey> oracle_keys_{make_oracle_keys(3)};
        KeeperConfig config_{};
        std::unique_ptr<Deployment> deployment_{};
        uint64_t now_{0};

        void SetUp() override;

        void advance(uint64_t seconds)
        {
            now_ += seconds;
        }

        Vault &add_vault(
            Address const &vault, Address const &fee_recipient,
            uint64_t fee_percent,
            std::optional<Address> const &own_mev_escrow = std::nullopt);

        RewardsUpdateParams make_rewards_update(
            bytes32_t const &root, std::span<OracleKey const> signers);

        // Publishes a snapshot over rewards once the rewards delay has
        // passed and returns the harvest params of every entry, in order
        std::vector<HarvestParams>
        publish_rewards(std::vector<VaultReward> const &rewards);
    };
}
