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
#include <keeper/core/result.hpp>
#include <keeper/core/unordered_map.hpp>
#include <keeper/host/log.hpp>

#include <vector>

KEEPER_NAMESPACE_BEGIN

// Native asset balances of every participant plus the ordered log of emitted
// events. Stands in for the chain the protocol runs on.
class State
{
    Map<Address, uint256_t> balances_{};
    std::vector<Log> logs_{};

public:
    State() = default;
    State(State const &) = delete;
    State &operator=(State const &) = delete;

    uint256_t get_balance(Address const &) const;

    // value arriving from outside the tracked system, e.g. validator
    // withdrawals or execution rewards
    Result<void> add_to_balance(Address const &, uint256_t const &);

    Result<void> subtract_from_balance(Address const &, uint256_t const &);

    Result<void>
    transfer(Address const &from, Address const &to, uint256_t const &);

    void set_balance(Address const &, uint256_t const &);

    void store_log(Log const &);

    std::vector<Log> const &logs() const
    {
        return logs_;
    }
};

KEEPER_NAMESPACE_END
