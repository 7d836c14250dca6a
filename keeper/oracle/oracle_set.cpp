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
#include <keeper/abi/big_endian.hpp>
#include <keeper/abi/events.hpp>
#include <keeper/core/fmt/address_fmt.hpp>
#include <keeper/core/likely.h>
#include <keeper/host/state.hpp>
#include <keeper/oracle/keeper_error.hpp>
#include <keeper/oracle/oracle_set.hpp>

#include <quill/Quill.h>

KEEPER_NAMESPACE_BEGIN

OracleSet::OracleSet(State &state, Address const &contract)
    : state_{state}
    , contract_{contract}
{
}

bool OracleSet::is_oracle(Address const &oracle) const
{
    return oracles_.contains(oracle);
}

uint64_t OracleSet::rewards_min_oracles() const
{
    return rewards_min_oracles_;
}

Result<void> OracleSet::add_oracle(Address const &oracle)
{
    if (KEEPER_UNLIKELY(!oracles_.insert(oracle).second)) {
        return KeeperError::OracleExists;
    }
    LOG_INFO("OracleSet: added oracle {}", oracle);
    emit_oracle_added_event(oracle);
    return outcome::success();
}

Result<void> OracleSet::remove_oracle(Address const &oracle)
{
    if (KEEPER_UNLIKELY(!oracles_.contains(oracle))) {
        return KeeperError::UnknownOracle;
    }
    if (KEEPER_UNLIKELY(oracles_.size() - 1 < rewards_min_oracles_)) {
        return KeeperError::InvalidOracles;
    }
    oracles_.erase(oracle);
    LOG_INFO("OracleSet: removed oracle {}", oracle);
    emit_oracle_removed_event(oracle);
    return outcome::success();
}

Result<void> OracleSet::set_rewards_min_oracles(uint64_t const min_oracles)
{
    if (KEEPER_UNLIKELY(min_oracles == 0 || min_oracles > oracles_.size())) {
        return KeeperError::InvalidOracles;
    }
    rewards_min_oracles_ = min_oracles;
    emit_rewards_min_oracles_updated_event(min_oracles);
    return outcome::success();
}

void OracleSet::emit_oracle_added_event(Address const &oracle)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("OracleAdded(address)");
    state_.store_log(EventBuilder(contract_, signature)
                         .add_topic(abi_encode_address(oracle))
                         .build());
}

void OracleSet::emit_oracle_removed_event(Address const &oracle)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("OracleRemoved(address)");
    state_.store_log(EventBuilder(contract_, signature)
                         .add_topic(abi_encode_address(oracle))
                         .build());
}

void OracleSet::emit_rewards_min_oracles_updated_event(
    uint64_t const min_oracles)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("RewardsMinOraclesUpdated(uint256)");
    state_.store_log(EventBuilder(contract_, signature)
                         .add_data(abi_encode_uint(u64_be{min_oracles}))
                         .build());
}

KEEPER_NAMESPACE_END
