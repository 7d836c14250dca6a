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

#include <keeper/core/likely.h>
#include <keeper/host/host_error.hpp>
#include <keeper/host/state.hpp>

#include <limits>

#include <boost/outcome/config.hpp>
// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
#endif

KEEPER_NAMESPACE_BEGIN

uint256_t State::get_balance(Address const &address) const
{
    auto const it = balances_.find(address);
    if (it == balances_.end()) {
        return 0;
    }
    return it->second;
}

Result<void>
State::add_to_balance(Address const &address, uint256_t const &delta)
{
    if (KEEPER_UNLIKELY(
            std::numeric_limits<uint256_t>::max() - delta <
            get_balance(address))) {
        return HostError::BalanceOverflow;
    }
    balances_[address] += delta;
    return outcome::success();
}

Result<void>
State::subtract_from_balance(Address const &address, uint256_t const &delta)
{
    auto const it = balances_.find(address);
    uint256_t const balance = it == balances_.end() ? 0 : it->second;
    if (KEEPER_UNLIKELY(balance < delta)) {
        return HostError::InsufficientBalance;
    }
    if (it != balances_.end()) {
        it->second -= delta;
    }
    return outcome::success();
}

Result<void> State::transfer(
    Address const &from, Address const &to, uint256_t const &amount)
{
    if (KEEPER_UNLIKELY(get_balance(from) < amount)) {
        return HostError::InsufficientBalance;
    }
    if (KEEPER_UNLIKELY(
            from != to &&
            std::numeric_limits<uint256_t>::max() - amount < get_balance(to))) {
        return HostError::BalanceOverflow;
    }
    balances_[from] -= amount;
    balances_[to] += amount;
    return outcome::success();
}

void State::set_balance(Address const &address, uint256_t const &balance)
{
    balances_[address] = balance;
}

void State::store_log(Log const &log)
{
    logs_.push_back(log);
}

KEEPER_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<keeper::HostError>::mapping> const &
quick_status_code_from_enum<keeper::HostError>::value_mappings()
{
    using keeper::HostError;

    static std::initializer_list<mapping> const v = {
        {HostError::Success, "success", {errc::success}},
        {HostError::InsufficientBalance, "insufficient balance", {}},
        {HostError::BalanceOverflow, "balance overflow", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
