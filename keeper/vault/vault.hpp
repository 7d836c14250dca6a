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
#include <keeper/core/bytes.hpp>
#include <keeper/core/config.hpp>
#include <keeper/core/int.hpp>
#include <keeper/core/result.hpp>
#include <keeper/core/unordered_map.hpp>
#include <keeper/host/call_context.hpp>
#include <keeper/rewards/reward_harvester.hpp>
#include <keeper/vault/exit_queue.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <variant>

KEEPER_NAMESPACE_BEGIN

class OwnMevEscrow;
class SharedMevEscrow;
class State;

inline constexpr uint64_t MAX_FEE_PERCENT = 10'000;

struct VaultConfig
{
    Address address{};
    Address fee_recipient{};
    // basis points of every profit minted as shares to fee_recipient
    uint64_t fee_percent{0};
    // minimum time between entering the exit queue and claiming
    uint64_t exit_claim_delay{86400};
};

using MevEscrowRef = std::variant<
    std::reference_wrapper<SharedMevEscrow>,
    std::reference_wrapper<OwnMevEscrow>>;

struct ExitRequest
{
    uint256_t shares{0};
    uint64_t timestamp{0};
};

struct ExitQueueData
{
    uint256_t queued_shares{0};
    uint256_t unclaimed_assets{0};
    uint256_t total_tickets{0};
};

struct ClaimResult
{
    // ticket of the remaining position, if any
    std::optional<uint256_t> new_ticket{};
    uint256_t left_shares{0};
    uint256_t exited_assets{0};
};

// Share accounting of a staking vault together with its exit queue. Assets
// held by the vault in State back both the share price and the assets
// reserved for processed exits.
class Vault
{
    State &state_;
    RewardHarvester &harvester_;
    MevEscrowRef mev_escrow_;
    VaultConfig const config_;

    uint256_t total_assets_{0};
    uint256_t total_shares_{0};
    Map<Address, uint256_t> balances_{};

    uint256_t queued_shares_{0};
    uint256_t unclaimed_assets_{0};
    ExitQueueLedger exit_queue_{};
    Map<bytes32_t, ExitRequest> exit_requests_{};

    bool uses_shared_mev_escrow() const noexcept;

    Result<void> check_mev_escrow_liquidity(HarvestParams const &) const;

    Result<uint256_t> pull_mev_rewards(HarvestResult const &);

    Result<void> process_total_assets_delta(uint256_t const &delta);

    Result<void> update_exit_queue();

    void emit_deposited_event(
        Address const &caller, Address const &receiver,
        uint256_t const &assets, uint256_t const &shares);
    void emit_fee_shares_minted_event(
        uint256_t const &shares, uint256_t const &assets);
    void emit_exit_queue_entered_event(
        Address const &owner, Address const &receiver,
        uint256_t const &ticket, uint256_t const &shares);
    void emit_checkpoint_created_event(
        uint256_t const &shares, uint256_t const &assets);
    void emit_exited_assets_claimed_event(
        Address const &receiver, uint256_t const &prev_ticket,
        uint256_t const &new_ticket, uint256_t const &assets);

public:
    Vault(State &, RewardHarvester &, MevEscrowRef, VaultConfig const &);

    Address const &address() const noexcept
    {
        return config_.address;
    }

    uint256_t const &total_assets() const noexcept
    {
        return total_assets_;
    }

    uint256_t const &total_shares() const noexcept
    {
        return total_shares_;
    }

    uint256_t balance_of(Address const &) const;

    Result<uint256_t> convert_to_shares(uint256_t const &assets) const;

    Result<uint256_t> convert_to_assets(uint256_t const &shares) const;

    ExitQueueData get_exit_queue_data() const;

    ExitQueueLedger const &exit_queue() const noexcept
    {
        return exit_queue_;
    }

    std::optional<ExitRequest>
    get_exit_request(Address const &owner, uint256_t const &ticket) const;

    bool is_state_update_required() const;

    Result<uint256_t> deposit(
        CallContext const &, Address const &receiver, uint256_t const &assets);

    // Moves shares of the caller into the exit queue; returns the ticket of
    // the new position, owned by receiver
    Result<uint256_t> enter_exit_queue(
        CallContext const &, uint256_t const &shares, Address const &receiver);

    // Harvests the latest rewards, accrues them and processes as much of the
    // exit queue as the vault's unreserved assets allow
    Result<HarvestResult>
    update_state(CallContext const &, HarvestParams const &);

    Result<ClaimResult> claim_exited_assets(
        CallContext const &, uint256_t const &ticket, size_t checkpoint_index);
};

bytes32_t exit_request_key(Address const &owner, uint256_t const &ticket);

KEEPER_NAMESPACE_END
