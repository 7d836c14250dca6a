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
#include <keeper/core/assert.h>
#include <keeper/core/fmt/address_fmt.hpp>
#include <keeper/core/fmt/int_fmt.hpp>
#include <keeper/core/keccak.hpp>
#include <keeper/core/likely.h>
#include <keeper/host/host_error.hpp>
#include <keeper/host/state.hpp>
#include <keeper/rewards/mev_escrow.hpp>
#include <keeper/vault/vault.hpp>
#include <keeper/vault/vault_error.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <algorithm>

KEEPER_NAMESPACE_BEGIN

bytes32_t exit_request_key(Address const &owner, uint256_t const &ticket)
{
    return keccak256_bytes(
        AbiEncoder{}
            .add_address(owner)
            .add_uint(u256_be{ticket})
            .encode_final());
}

Vault::Vault(
    State &state, RewardHarvester &harvester, MevEscrowRef mev_escrow,
    VaultConfig const &config)
    : state_{state}
    , harvester_{harvester}
    , mev_escrow_{mev_escrow}
    , config_{config}
{
    KEEPER_ASSERT(config_.fee_percent <= MAX_FEE_PERCENT);
}

uint256_t Vault::balance_of(Address const &account) const
{
    auto const it = balances_.find(account);
    if (it == balances_.end()) {
        return 0;
    }
    return it->second;
}

Result<uint256_t> Vault::convert_to_shares(uint256_t const &assets) const
{
    if (total_shares_ == 0) {
        return assets;
    }
    // fails once a penalty has wiped out every asset behind the shares
    return checked_mul_div(assets, total_shares_, total_assets_);
}

Result<uint256_t> Vault::convert_to_assets(uint256_t const &shares) const
{
    if (total_shares_ == 0) {
        return shares;
    }
    return checked_mul_div(shares, total_assets_, total_shares_);
}

ExitQueueData Vault::get_exit_queue_data() const
{
    return ExitQueueData{
        .queued_shares = queued_shares_,
        .unclaimed_assets = unclaimed_assets_,
        .total_tickets = exit_queue_.latest_total_tickets() + queued_shares_};
}

std::optional<ExitRequest>
Vault::get_exit_request(Address const &owner, uint256_t const &ticket) const
{
    auto const it = exit_requests_.find(exit_request_key(owner, ticket));
    if (it == exit_requests_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Vault::is_state_update_required() const
{
    return harvester_.is_harvest_required(config_.address);
}

bool Vault::uses_shared_mev_escrow() const noexcept
{
    return std::holds_alternative<std::reference_wrapper<SharedMevEscrow>>(
        mev_escrow_);
}

Result<uint256_t> Vault::deposit(
    CallContext const &ctx, Address const &receiver, uint256_t const &assets)
{
    if (KEEPER_UNLIKELY(assets == 0)) {
        return VaultError::InvalidAmount;
    }
    if (KEEPER_UNLIKELY(harvester_.is_harvest_overdue(config_.address))) {
        return VaultError::NotHarvested;
    }
    BOOST_OUTCOME_TRY(auto const shares, convert_to_shares(assets));
    if (KEEPER_UNLIKELY(shares == 0)) {
        return VaultError::InvalidAmount;
    }
    BOOST_OUTCOME_TRY(
        auto const new_total_assets, checked_add(total_assets_, assets));
    BOOST_OUTCOME_TRY(
        auto const new_total_shares, checked_add(total_shares_, shares));

    BOOST_OUTCOME_TRY(state_.transfer(ctx.sender, config_.address, assets));

    total_assets_ = new_total_assets;
    total_shares_ = new_total_shares;
    balances_[receiver] += shares;

    emit_deposited_event(ctx.sender, receiver, assets, shares);
    return shares;
}

Result<uint256_t> Vault::enter_exit_queue(
    CallContext const &ctx, uint256_t const &shares, Address const &receiver)
{
    if (KEEPER_UNLIKELY(shares == 0)) {
        return VaultError::InvalidAmount;
    }
    if (KEEPER_UNLIKELY(harvester_.is_harvest_overdue(config_.address))) {
        return VaultError::NotHarvested;
    }
    if (KEEPER_UNLIKELY(balance_of(ctx.sender) < shares)) {
        return VaultError::InsufficientShares;
    }
    BOOST_OUTCOME_TRY(
        auto const ticket,
        checked_add(exit_queue_.latest_total_tickets(), queued_shares_));
    BOOST_OUTCOME_TRY(
        auto const new_queued_shares, checked_add(queued_shares_, shares));

    bytes32_t const key = exit_request_key(receiver, ticket);
    KEEPER_ASSERT(!exit_requests_.contains(key));

    balances_[ctx.sender] -= shares;
    queued_shares_ = new_queued_shares;
    exit_requests_[key] =
        ExitRequest{.shares = shares, .timestamp = ctx.timestamp};

    LOG_INFO(
        "Vault {}: {} queued {} shares for {} at ticket {}",
        config_.address,
        ctx.sender,
        shares,
        receiver,
        ticket);
    emit_exit_queue_entered_event(ctx.sender, receiver, ticket, shares);
    return ticket;
}

Result<void>
Vault::check_mev_escrow_liquidity(HarvestParams const &params) const
{
    if (!uses_shared_mev_escrow() ||
        !harvester_.can_harvest(config_.address, params)) {
        return outcome::success();
    }
    uint256_t const last =
        harvester_.unlocked_mev_reward(config_.address).assets;
    if (params.unlocked_mev_reward <= last) {
        return outcome::success();
    }
    auto const &escrow =
        std::get<std::reference_wrapper<SharedMevEscrow>>(mev_escrow_).get();
    if (KEEPER_UNLIKELY(
            state_.get_balance(escrow.address()) <
            params.unlocked_mev_reward - last)) {
        return HostError::InsufficientBalance;
    }
    return outcome::success();
}

Result<uint256_t> Vault::pull_mev_rewards(HarvestResult const &result)
{
    CallContext const self{.sender = config_.address};
    if (uses_shared_mev_escrow()) {
        // the attested reward already includes the vault's share of the pool
        if (result.unlocked_mev_delta > 0) {
            auto &escrow =
                std::get<std::reference_wrapper<SharedMevEscrow>>(mev_escrow_)
                    .get();
            BOOST_OUTCOME_TRY(escrow.harvest(self, result.unlocked_mev_delta));
        }
        return uint256_t{0};
    }
    auto &escrow =
        std::get<std::reference_wrapper<OwnMevEscrow>>(mev_escrow_).get();
    return escrow.harvest(self);
}

Result<HarvestResult>
Vault::update_state(CallContext const &ctx, HarvestParams const &params)
{
    BOOST_OUTCOME_TRY(check_mev_escrow_liquidity(params));

    BOOST_OUTCOME_TRY(
        auto result,
        harvester_.harvest(
            CallContext{.sender = config_.address, .timestamp = ctx.timestamp},
            params,
            uses_shared_mev_escrow()));
    if (!result.harvested) {
        return result;
    }

    BOOST_OUTCOME_TRY(auto const mev_assets, pull_mev_rewards(result));
    result.total_assets_delta += mev_assets;

    BOOST_OUTCOME_TRY(process_total_assets_delta(result.total_assets_delta));
    BOOST_OUTCOME_TRY(update_exit_queue());
    return result;
}

Result<void> Vault::process_total_assets_delta(uint256_t const &delta)
{
    if (delta == 0) {
        return outcome::success();
    }

    if (is_negative(delta)) {
        uint256_t const penalty = abs_value(delta);
        if (KEEPER_UNLIKELY(penalty > total_assets_)) {
            LOG_WARNING(
                "Vault {}: penalty {} exceeds total assets {}",
                config_.address,
                penalty,
                total_assets_);
            total_assets_ = 0;
        }
        else {
            total_assets_ -= penalty;
        }
        LOG_INFO(
            "Vault {}: penalized {}, total assets {}",
            config_.address,
            penalty,
            total_assets_);
        return outcome::success();
    }

    uint256_t const &profit = delta;
    BOOST_OUTCOME_TRY(
        auto const new_total_assets, checked_add(total_assets_, profit));
    BOOST_OUTCOME_TRY(
        auto const fee_assets,
        checked_mul_div(profit, config_.fee_percent, MAX_FEE_PERCENT));

    uint256_t fee_shares = 0;
    if (fee_assets > 0) {
        uint256_t const assets_before_fee = new_total_assets - fee_assets;
        if (total_shares_ == 0 || assets_before_fee == 0) {
            fee_shares = fee_assets;
        }
        else {
            BOOST_OUTCOME_TRY(
                auto const shares,
                checked_mul_div(fee_assets, total_shares_, assets_before_fee));
            fee_shares = shares;
        }
    }
    BOOST_OUTCOME_TRY(
        auto const new_total_shares, checked_add(total_shares_, fee_shares));

    total_assets_ = new_total_assets;
    if (fee_shares > 0) {
        total_shares_ = new_total_shares;
        balances_[config_.fee_recipient] += fee_shares;
        emit_fee_shares_minted_event(fee_shares, fee_assets);
    }
    LOG_INFO(
        "Vault {}: accrued {}, fee shares {}, total assets {}",
        config_.address,
        profit,
        fee_shares,
        total_assets_);
    return outcome::success();
}

Result<void> Vault::update_exit_queue()
{
    if (queued_shares_ == 0) {
        return outcome::success();
    }
    uint256_t const balance = state_.get_balance(config_.address);
    if (balance <= unclaimed_assets_) {
        return outcome::success();
    }
    uint256_t const available_assets = balance - unclaimed_assets_;

    BOOST_OUTCOME_TRY(
        auto const queued_assets, convert_to_assets(queued_shares_));
    uint256_t const exited_assets = std::min(available_assets, queued_assets);
    if (exited_assets == 0) {
        return outcome::success();
    }

    // rounds down, a queue left with 1 share is settled by the dust rule
    BOOST_OUTCOME_TRY(
        auto const shares_for_assets, convert_to_shares(exited_assets));
    uint256_t const burned_shares =
        std::min(shares_for_assets, queued_shares_);
    if (burned_shares == 0) {
        return outcome::success();
    }

    BOOST_OUTCOME_TRY(
        auto const new_unclaimed_assets,
        checked_add(unclaimed_assets_, exited_assets));
    BOOST_OUTCOME_TRY(
        auto const new_total_shares, checked_sub(total_shares_, burned_shares));
    BOOST_OUTCOME_TRY(
        auto const new_total_assets, checked_sub(total_assets_, exited_assets));

    BOOST_OUTCOME_TRY(exit_queue_.push(burned_shares, exited_assets));

    queued_shares_ -= burned_shares;
    unclaimed_assets_ = new_unclaimed_assets;
    total_shares_ = new_total_shares;
    total_assets_ = new_total_assets;

    LOG_INFO(
        "Vault {}: checkpoint {} burned {} shares for {} assets",
        config_.address,
        exit_queue_.size() - 1,
        burned_shares,
        exited_assets);
    emit_checkpoint_created_event(burned_shares, exited_assets);
    return outcome::success();
}

Result<ClaimResult> Vault::claim_exited_assets(
    CallContext const &ctx, uint256_t const &ticket,
    size_t const checkpoint_index)
{
    Address const &receiver = ctx.sender;
    bytes32_t const key = exit_request_key(receiver, ticket);
    auto const it = exit_requests_.find(key);
    if (KEEPER_UNLIKELY(it == exit_requests_.end())) {
        return VaultError::UnknownExitRequest;
    }
    ExitRequest const request = it->second;
    if (KEEPER_UNLIKELY(
            ctx.timestamp < request.timestamp ||
            ctx.timestamp - request.timestamp < config_.exit_claim_delay)) {
        return VaultError::ClaimTooEarly;
    }

    BOOST_OUTCOME_TRY(
        auto const resolved,
        exit_queue_.resolve(ticket, request.shares, checkpoint_index));
    if (KEEPER_UNLIKELY(resolved.exited_assets == 0)) {
        return VaultError::ExitRequestNotProcessed;
    }
    BOOST_OUTCOME_TRY(
        auto const new_unclaimed_assets,
        checked_sub(unclaimed_assets_, resolved.exited_assets));
    if (KEEPER_UNLIKELY(
            state_.get_balance(config_.address) < resolved.exited_assets)) {
        return HostError::InsufficientBalance;
    }

    ClaimResult result{
        .new_ticket = std::nullopt,
        .left_shares = resolved.left_shares,
        .exited_assets = resolved.exited_assets};

    exit_requests_.erase(it);
    if (resolved.left_shares > 0) {
        result.new_ticket = ticket + resolved.exited_shares;
        exit_requests_[exit_request_key(receiver, *result.new_ticket)] =
            ExitRequest{
                .shares = resolved.left_shares,
                .timestamp = request.timestamp};
    }
    unclaimed_assets_ = new_unclaimed_assets;

    LOG_INFO(
        "Vault {}: {} claimed {} assets for ticket {}, {} shares left",
        config_.address,
        receiver,
        resolved.exited_assets,
        ticket,
        resolved.left_shares);
    emit_exited_assets_claimed_event(
        receiver,
        ticket,
        result.new_ticket.value_or(uint256_t{0}),
        resolved.exited_assets);

    BOOST_OUTCOME_TRY(
        state_.transfer(config_.address, receiver, resolved.exited_assets));
    return result;
}

void Vault::emit_deposited_event(
    Address const &caller, Address const &receiver, uint256_t const &assets,
    uint256_t const &shares)
{
    constexpr bytes32_t signature = abi_encode_event_signature(
        "Deposited(address,address,uint256,uint256)");
    state_.store_log(EventBuilder(config_.address, signature)
                         .add_topic(abi_encode_address(caller))
                         .add_topic(abi_encode_address(receiver))
                         .add_data(abi_encode_uint(u256_be{assets}))
                         .add_data(abi_encode_uint(u256_be{shares}))
                         .build());
}

void Vault::emit_fee_shares_minted_event(
    uint256_t const &shares, uint256_t const &assets)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("FeeSharesMinted(address,uint256,uint256)");
    state_.store_log(EventBuilder(config_.address, signature)
                         .add_data(abi_encode_address(config_.fee_recipient))
                         .add_data(abi_encode_uint(u256_be{shares}))
                         .add_data(abi_encode_uint(u256_be{assets}))
                         .build());
}

void Vault::emit_exit_queue_entered_event(
    Address const &owner, Address const &receiver, uint256_t const &ticket,
    uint256_t const &shares)
{
    constexpr bytes32_t signature = abi_encode_event_signature(
        "ExitQueueEntered(address,address,uint256,uint256)");
    state_.store_log(EventBuilder(config_.address, signature)
                         .add_topic(abi_encode_address(owner))
                         .add_topic(abi_encode_address(receiver))
                         .add_data(abi_encode_uint(u256_be{ticket}))
                         .add_data(abi_encode_uint(u256_be{shares}))
                         .build());
}

void Vault::emit_checkpoint_created_event(
    uint256_t const &shares, uint256_t const &assets)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("CheckpointCreated(uint256,uint256)");
    state_.store_log(EventBuilder(config_.address, signature)
                         .add_data(abi_encode_uint(u256_be{shares}))
                         .add_data(abi_encode_uint(u256_be{assets}))
                         .build());
}

void Vault::emit_exited_assets_claimed_event(
    Address const &receiver, uint256_t const &prev_ticket,
    uint256_t const &new_ticket, uint256_t const &assets)
{
    constexpr bytes32_t signature = abi_encode_event_signature(
        "ExitedAssetsClaimed(address,uint256,uint256,uint256)");
    state_.store_log(EventBuilder(config_.address, signature)
                         .add_topic(abi_encode_address(receiver))
                         .add_data(abi_encode_uint(u256_be{prev_ticket}))
                         .add_data(abi_encode_uint(u256_be{new_ticket}))
                         .add_data(abi_encode_uint(u256_be{assets}))
                         .build());
}

KEEPER_NAMESPACE_END
