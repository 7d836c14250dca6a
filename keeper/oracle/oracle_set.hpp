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
#include <keeper/core/result.hpp>
#include <keeper/core/unordered_map.hpp>
#include <keeper/oracle/attestor_registry.hpp>

#include <cstddef>
#include <cstdint>

KEEPER_NAMESPACE_BEGIN

class State;

class OracleSet final : public AttestorRegistry
{
    State &state_;
    Address const contract_;
    Set<Address> oracles_{};
    uint64_t rewards_min_oracles_{0};

    void emit_oracle_added_event(Address const &);
    void emit_oracle_removed_event(Address const &);
    void emit_rewards_min_oracles_updated_event(uint64_t);

public:
    OracleSet(State &, Address const &contract);

    bool is_oracle(Address const &) const override;

    uint64_t rewards_min_oracles() const override;

    size_t total_oracles() const noexcept
    {
        return oracles_.size();
    }

    Result<void> add_oracle(Address const &);

    // fails if the remaining set could no longer reach quorum
    Result<void> remove_oracle(Address const &);

    Result<void> set_rewards_min_oracles(uint64_t);
};

KEEPER_NAMESPACE_END
