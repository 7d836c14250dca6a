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

#include <keeper/abi/checked_math.hpp>
#include <keeper/core/assert.h>
#include <keeper/core/likely.h>
#include <keeper/vault/exit_queue.hpp>
#include <keeper/vault/vault_error.hpp>

#include <boost/outcome/try.hpp>

#include <algorithm>

KEEPER_NAMESPACE_BEGIN

Checkpoint const &ExitQueueLedger::checkpoint(size_t const index) const
{
    KEEPER_ASSERT(index < checkpoints_.size());
    return checkpoints_[index];
}

uint256_t ExitQueueLedger::latest_total_tickets() const noexcept
{
    return checkpoints_.empty() ? 0 : checkpoints_.back().total_tickets;
}

uint256_t ExitQueueLedger::latest_exited_assets() const noexcept
{
    return checkpoints_.empty() ? 0 : checkpoints_.back().exited_assets;
}

Result<void>
ExitQueueLedger::push(uint256_t const &shares, uint256_t const &assets)
{
    if (KEEPER_UNLIKELY(shares == 0)) {
        return VaultError::InvalidAmount;
    }
    BOOST_OUTCOME_TRY(
        auto const total_tickets, checked_add(latest_total_tickets(), shares));
    BOOST_OUTCOME_TRY(
        auto const exited_assets, checked_add(latest_exited_assets(), assets));
    checkpoints_.push_back(Checkpoint{
        .total_tickets = total_tickets, .exited_assets = exited_assets});
    return outcome::success();
}

std::optional<size_t>
ExitQueueLedger::get_checkpoint_index(uint256_t const &ticket) const
{
    auto const it = std::ranges::upper_bound(
        checkpoints_, ticket, {}, &Checkpoint::total_tickets);
    if (it == checkpoints_.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(it - checkpoints_.begin());
}

Result<ExitedAssets> ExitQueueLedger::resolve(
    uint256_t const &ticket, uint256_t const &amount, size_t const index) const
{
    ExitedAssets const unresolved{
        .left_shares = amount, .exited_shares = 0, .exited_assets = 0};
    if (index >= checkpoints_.size()) {
        return unresolved;
    }
    Checkpoint const &current = checkpoints_[index];
    if (current.total_tickets <= ticket) {
        return unresolved;
    }
    Checkpoint const prev = index == 0 ? Checkpoint{} : checkpoints_[index - 1];
    if (KEEPER_UNLIKELY(ticket < prev.total_tickets)) {
        return VaultError::InvalidCheckpointIndex;
    }

    uint256_t const exited_shares =
        std::min(amount, current.total_tickets - ticket);
    BOOST_OUTCOME_TRY(
        auto const exited_assets,
        checked_mul_div(
            exited_shares,
            current.exited_assets - prev.exited_assets,
            current.total_tickets - prev.total_tickets));

    ExitedAssets result{
        .left_shares = amount - exited_shares,
        .exited_shares = exited_shares,
        .exited_assets = exited_assets};
    // a single share left over from rounding is never worth a second claim
    if (result.left_shares == 1) {
        result.left_shares = 0;
        result.exited_shares = amount;
    }
    return result;
}

KEEPER_NAMESPACE_END
