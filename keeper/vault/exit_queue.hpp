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

#include <keeper/core/config.hpp>
#include <keeper/core/int.hpp>
#include <keeper/core/result.hpp>

#include <cstddef>
#include <optional>
#include <vector>

KEEPER_NAMESPACE_BEGIN

struct Checkpoint
{
    // cumulative shares resolved up to and including this checkpoint
    uint256_t total_tickets{0};
    // cumulative assets paid out for them
    uint256_t exited_assets{0};

    friend bool operator==(Checkpoint const &, Checkpoint const &) = default;
};

struct ExitedAssets
{
    uint256_t left_shares{0};
    uint256_t exited_shares{0};
    uint256_t exited_assets{0};

    friend bool
    operator==(ExitedAssets const &, ExitedAssets const &) = default;
};

// Append-only history of exit queue processing. A position queued at ticket t
// for n shares occupies tickets [t, t + n) and is paid at the rate of every
// checkpoint that covers part of that range, strictly in ticket order.
class ExitQueueLedger
{
    std::vector<Checkpoint> checkpoints_{};

public:
    size_t size() const noexcept
    {
        return checkpoints_.size();
    }

    Checkpoint const &checkpoint(size_t index) const;

    uint256_t latest_total_tickets() const noexcept;

    uint256_t latest_exited_assets() const noexcept;

    Result<void> push(uint256_t const &shares, uint256_t const &assets);

    // Index of the first checkpoint covering ticket, nullopt if the ticket is
    // not processed yet
    std::optional<size_t> get_checkpoint_index(uint256_t const &ticket) const;

    // Portion of a position [ticket, ticket + amount) paid by the checkpoint
    // at index. A remainder of a single share is treated as exited.
    Result<ExitedAssets> resolve(
        uint256_t const &ticket, uint256_t const &amount, size_t index) const;
};

KEEPER_NAMESPACE_END
