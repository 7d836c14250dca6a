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

#include <keeper/core/int.hpp>
#include <keeper/host/host_error.hpp>
#include <keeper/host/log.hpp>
#include <keeper/host/state.hpp>

#include <evmc/evmc.hpp>

#include <gtest/gtest.h>

#include <limits>

using namespace keeper;
using namespace evmc::literals;

namespace
{
    constexpr auto A = 0x00000000000000000000000000000000000000aa_address;
    constexpr auto B = 0x00000000000000000000000000000000000000bb_address;
}

TEST(State, balances)
{
    State state;
    EXPECT_EQ(state.get_balance(A), 0);
    EXPECT_FALSE(state.add_to_balance(A, 10).has_error());
    EXPECT_FALSE(state.add_to_balance(A, 5).has_error());
    EXPECT_EQ(state.get_balance(A), 15);

    uint256_t const max = std::numeric_limits<uint256_t>::max();
    EXPECT_EQ(
        state.add_to_balance(A, max - 14).assume_error(),
        HostError::BalanceOverflow);
    EXPECT_EQ(state.get_balance(A), 15);
    EXPECT_FALSE(state.add_to_balance(A, max - 15).has_error());
    EXPECT_EQ(state.get_balance(A), max);

    EXPECT_FALSE(state.subtract_from_balance(A, 5).has_error());
    EXPECT_EQ(state.get_balance(A), 10);
    EXPECT_EQ(
        state.subtract_from_balance(A, 11).assume_error(),
        HostError::InsufficientBalance);
    EXPECT_EQ(
        state.subtract_from_balance(B, 1).assume_error(),
        HostError::InsufficientBalance);
    EXPECT_FALSE(state.subtract_from_balance(B, 0).has_error());

    state.set_balance(A, 3);
    EXPECT_EQ(state.get_balance(A), 3);
}

TEST(State, transfer)
{
    State state;
    state.set_balance(A, 10);
    EXPECT_FALSE(state.transfer(A, B, 4).has_error());
    EXPECT_EQ(state.get_balance(A), 6);
    EXPECT_EQ(state.get_balance(B), 4);

    EXPECT_EQ(
        state.transfer(A, B, 7).assume_error(), HostError::InsufficientBalance);
    EXPECT_EQ(state.get_balance(A), 6);

    EXPECT_FALSE(state.transfer(A, A, 6).has_error());
    EXPECT_EQ(state.get_balance(A), 6);

    state.set_balance(B, UINT256_MAX);
    EXPECT_EQ(
        state.transfer(A, B, 1).assume_error(), HostError::BalanceOverflow);
}

TEST(State, logs_keep_order)
{
    State state;
    Log first{.data = {0x01}, .topics = {}, .address = A};
    Log second{.data = {0x02}, .topics = {}, .address = B};
    state.store_log(first);
    state.store_log(second);
    ASSERT_EQ(state.logs().size(), 2);
    EXPECT_EQ(state.logs()[0], first);
    EXPECT_EQ(state.logs()[1], second);
}
