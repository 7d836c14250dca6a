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
#include <keeper/core/fmt/int_fmt.hpp>
#include <keeper/core/likely.h>
#include <keeper/host/state.hpp>
#include <keeper/oracle/keeper_error.hpp>
#include <keeper/rewards/mev_escrow.hpp>
#include <keeper/rewards/vault_registry.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

KEEPER_NAMESPACE_BEGIN

SharedMevEscrow::SharedMevEscrow(
    State &state, VaultRegistry const &vaults, Address const &address)
    : state_{state}
    , vaults_{vaults}
    , address_{address}
{
}

Result<void>
SharedMevEscrow::harvest(CallContext const &ctx, uint256_t const &assets)
{
    if (KEEPER_UNLIKELY(!vaults_.is_vault(ctx.sender))) {
        return KeeperError::AccessDenied;
    }
    BOOST_OUTCOME_TRY(state_.transfer(address_, ctx.sender, assets));

    LOG_INFO("SharedMevEscrow: sent {} to vault {}", assets, ctx.sender);

    constexpr bytes32_t signature =
        abi_encode_event_signature("Harvested(address,uint256)");
    state_.store_log(EventBuilder(address_, signature)
                         .add_topic(abi_encode_address(ctx.sender))
                         .add_data(abi_encode_uint(u256_be{assets}))
                         .build());
    return outcome::success();
}

OwnMevEscrow::OwnMevEscrow(
    State &state, Address const &address, Address const &vault)
    : state_{state}
    , address_{address}
    , vault_{vault}
{
}

Result<uint256_t> OwnMevEscrow::harvest(CallContext const &ctx)
{
    if (KEEPER_UNLIKELY(ctx.sender != vault_)) {
        return KeeperError::AccessDenied;
    }
    uint256_t const assets = state_.get_balance(address_);
    if (assets == 0) {
        return assets;
    }
    BOOST_OUTCOME_TRY(state_.transfer(address_, vault_, assets));

    constexpr bytes32_t signature =
        abi_encode_event_signature("Harvested(uint256)");
    state_.store_log(EventBuilder(address_, signature)
                         .add_data(abi_encode_uint(u256_be{assets}))
                         .build());
    return assets;
}

KEEPER_NAMESPACE_END
