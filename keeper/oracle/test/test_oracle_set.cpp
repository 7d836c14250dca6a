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
#include <keeper/host/state.hpp>
#include <keeper/oracle/keeper_error.hpp>
#include <keeper/oracle/oracle_set.hpp>

#include <evmc/evmc.hpp>

#include <gtest/gtest.h>

using namespace keeper;
using namespace evmc::literals;

namespace
{
    constexpr auto KEEPER = 0x6b5815467da09daa7dc83db21c9239d98bb487b5_address;
    constexpr auto ORACLE_A =
        0x00000000000000000000000000000000000000a1_address;
    constexpr auto ORACLE_B =
        0x00000000000000000000000000000000000000b2_address;
    constexpr auto ORACLE_C =
        0x00000000000000000000000000000000000000c3_address;
}

TEST(OracleSet, add_and_remove)
{
    State state;
    OracleSet oracles{state, KEEPER};
    EXPECT_FALSE(oracles.is_oracle(ORACLE_A));

    EXPECT_FALSE(oracles.add_oracle(ORACLE_A).has_error());
    EXPECT_TRUE(oracles.is_oracle(ORACLE_A));
    EXPECT_EQ(
        oracles.add_oracle(ORACLE_A).assume_error(), KeeperError::OracleExists);
    EXPECT_EQ(oracles.total_oracles(), 1);

    EXPECT_FALSE(oracles.remove_oracle(ORACLE_A).has_error());
    EXPECT_FALSE(oracles.is_oracle(ORACLE_A));
    EXPECT_EQ(
        oracles.remove_oracle(ORACLE_A).assume_error(),
        KeeperError::UnknownOracle);

    auto const &logs = state.logs();
    ASSERT_EQ(logs.size(), 2);
    EXPECT_EQ(
        logs[0].topics[0], abi_encode_event_signature("OracleAdded(address)"));
    EXPECT_EQ(logs[0].topics[1], abi_encode_address(ORACLE_A));
    EXPECT_EQ(logs[0].address, KEEPER);
    EXPECT_EQ(
        logs[1].topics[0],
        abi_encode_event_signature("OracleRemoved(address)"));
}

TEST(OracleSet, quorum_bounds)
{
    State state;
    OracleSet oracles{state, KEEPER};
    EXPECT_EQ(
        oracles.set_rewards_min_oracles(1).assume_error(),
        KeeperError::InvalidOracles);

    ASSERT_FALSE(oracles.add_oracle(ORACLE_A).has_error());
    ASSERT_FALSE(oracles.add_oracle(ORACLE_B).has_error());
    ASSERT_FALSE(oracles.add_oracle(ORACLE_C).has_error());

    EXPECT_EQ(
        oracles.set_rewards_min_oracles(0).assume_error(),
        KeeperError::InvalidOracles);
    EXPECT_EQ(
        oracles.set_rewards_min_oracles(4).assume_error(),
        KeeperError::InvalidOracles);
    EXPECT_FALSE(oracles.set_rewards_min_oracles(3).has_error());
    EXPECT_EQ(oracles.rewards_min_oracles(), 3);
}

TEST(OracleSet, remove_keeps_quorum_reachable)
{
    State state;
    OracleSet oracles{state, KEEPER};
    ASSERT_FALSE(oracles.add_oracle(ORACLE_A).has_error());
    ASSERT_FALSE(oracles.add_oracle(ORACLE_B).has_error());
    ASSERT_FALSE(oracles.set_rewards_min_oracles(2).has_error());

    EXPECT_EQ(
        oracles.remove_oracle(ORACLE_A).assume_error(),
        KeeperError::InvalidOracles);
    EXPECT_TRUE(oracles.is_oracle(ORACLE_A));

    ASSERT_FALSE(oracles.set_rewards_min_oracles(1).has_error());
    EXPECT_FALSE(oracles.remove_oracle(ORACLE_A).has_error());
    EXPECT_EQ(oracles.total_oracles(), 1);
}
