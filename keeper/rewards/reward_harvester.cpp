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
#include <keeper/abi/checked_math.hpp>
#include <keeper/abi/events.hpp>
#include <keeper/core/fmt/address_fmt.hpp>
#include <keeper/core/fmt/bytes_fmt.hpp>
#include <keeper/core/fmt/int_fmt.hpp>
#include <keeper/core/keccak.hpp>
#include <keeper/core/likely.h>
#include <keeper/crypto/merkle.hpp>
#include <keeper/host/state.hpp>
#include <keeper/oracle/keeper_error.hpp>
#include <keeper/rewards/reward_harvester.hpp>
#include <keeper/rewards/vault_registry.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

KEEPER_NAMESPACE_BEGIN

bytes32_t rewards_leaf(
    Address const &vault, uint256_t const &reward,
    uint256_t const &unlocked_mev_reward)
{
    auto const encoded = AbiEncoder{}
                             .add_address(vault)
                             .add_int(reward)
                             .add_uint(u256_be{unlocked_mev_reward})
                             .encode_final();
    return keccak256_bytes(keccak256_bytes(encoded));
}

RewardHarvester::RewardHarvester(
    KeeperState &keeper, State &state, VaultRegistry const &vaults,
    Address const &contract)
    : keeper_{keeper}
    , state_{state}
    , vaults_{vaults}
    , contract_{contract}
{
}

std::optional<RewardHarvester::RootMatch> RewardHarvester::match_root(
    Address const &vault, HarvestParams const &params) const
{
    bytes32_t const leaf =
        rewards_leaf(vault, params.reward, params.unlocked_mev_reward);
    if (keeper_.rewards_root != bytes32_t{} &&
        verify_proof(params.proof, keeper_.rewards_root, leaf)) {
        return RootMatch{keeper_.rewards_root, keeper_.rewards_nonce};
    }
    // vaults get one snapshot of grace to catch up
    if (keeper_.prev_rewards_root != bytes32_t{} &&
        verify_proof(params.proof, keeper_.prev_rewards_root, leaf)) {
        return RootMatch{keeper_.prev_rewards_root, keeper_.rewards_nonce - 1};
    }
    return std::nullopt;
}

Result<HarvestResult> RewardHarvester::harvest(
    CallContext const &ctx, HarvestParams const &params, bool const shared_mev)
{
    Address const &vault = ctx.sender;
    if (KEEPER_UNLIKELY(!vaults_.is_vault(vault))) {
        return KeeperError::AccessDenied;
    }
    if (KEEPER_UNLIKELY(
            !fits_signed<160>(params.reward) ||
            !fits_unsigned<160>(params.unlocked_mev_reward))) {
        return KeeperError::InvalidAmount;
    }

    auto const match = match_root(vault, params);
    if (KEEPER_UNLIKELY(!match.has_value())) {
        return KeeperError::InvalidProof;
    }

    Reward const last = reward(vault);
    if (last.nonce >= match->nonce) {
        // already synced with this snapshot
        return HarvestResult{};
    }

    HarvestResult result{
        .total_assets_delta = params.reward - last.assets,
        .unlocked_mev_delta = 0,
        .harvested = true};
    if (shared_mev) {
        UnlockedMevReward const last_mev = unlocked_mev_reward(vault);
        BOOST_OUTCOME_TRY(
            auto const mev_delta,
            checked_sub(params.unlocked_mev_reward, last_mev.assets));
        result.unlocked_mev_delta = mev_delta;
        keeper_.unlocked_mev_rewards[vault] = UnlockedMevReward{
            .assets = params.unlocked_mev_reward, .nonce = match->nonce};
    }
    keeper_.rewards[vault] =
        Reward{.assets = params.reward, .nonce = match->nonce};

    LOG_INFO(
        "RewardHarvester: vault {} harvested root {} at nonce {}, total "
        "assets delta {}, unlocked mev delta {}",
        vault,
        match->root,
        match->nonce,
        to_signed_string(result.total_assets_delta),
        result.unlocked_mev_delta);
    emit_harvested_event(vault, match->root, result);
    return result;
}

bool RewardHarvester::can_harvest(
    Address const &vault, HarvestParams const &params) const
{
    if (!vaults_.is_vault(vault) || !fits_signed<160>(params.reward) ||
        !fits_unsigned<160>(params.unlocked_mev_reward)) {
        return false;
    }
    auto const match = match_root(vault, params);
    return match.has_value() && reward(vault).nonce < match->nonce;
}

bool RewardHarvester::is_harvest_required(Address const &vault) const
{
    return reward(vault).nonce != keeper_.rewards_nonce;
}

bool RewardHarvester::is_harvest_overdue(Address const &vault) const
{
    uint64_t const nonce = reward(vault).nonce;
    return nonce != 0 && nonce + 1 < keeper_.rewards_nonce;
}

bool RewardHarvester::is_collateralized(Address const &vault) const
{
    return reward(vault).nonce != 0;
}

Result<void> RewardHarvester::collateralize(Address const &vault)
{
    if (KEEPER_UNLIKELY(!vaults_.is_vault(vault))) {
        return KeeperError::AccessDenied;
    }
    if (is_collateralized(vault)) {
        return outcome::success();
    }
    keeper_.rewards[vault] =
        Reward{.assets = 0, .nonce = keeper_.rewards_nonce};
    LOG_INFO(
        "RewardHarvester: vault {} collateralized at nonce {}",
        vault,
        keeper_.rewards_nonce);
    return outcome::success();
}

Reward RewardHarvester::reward(Address const &vault) const
{
    auto const it = keeper_.rewards.find(vault);
    if (it == keeper_.rewards.end()) {
        return {};
    }
    return it->second;
}

UnlockedMevReward
RewardHarvester::unlocked_mev_reward(Address const &vault) const
{
    auto const it = keeper_.unlocked_mev_rewards.find(vault);
    if (it == keeper_.unlocked_mev_rewards.end()) {
        return {};
    }
    return it->second;
}

void RewardHarvester::emit_harvested_event(
    Address const &vault, bytes32_t const &root, HarvestResult const &result)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("Harvested(address,bytes32,int256,uint256)");

    state_.store_log(
        EventBuilder(contract_, signature)
            .add_topic(abi_encode_address(vault))
            .add_topic(root)
            .add_data(abi_encode_int(result.total_assets_delta))
            .add_data(abi_encode_uint(u256_be{result.unlocked_mev_delta}))
            .build());
}

KEEPER_NAMESPACE_END
