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
#include <keeper/crypto/eip712.hpp>
#include <keeper/oracle/oracle_consensus.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <filesystem>
#include <vector>

KEEPER_NAMESPACE_BEGIN

struct KeeperConfig
{
    uint256_t chain_id{1};
    // verifying contract of the oracle signatures and emitter of keeper events
    Address keeper{};
    Address shared_mev_escrow{};
    uint64_t rewards_delay{43200};
    uint64_t rewards_min_oracles{1};
    uint256_t max_avg_reward_per_second{6341958397};
    uint64_t exit_claim_delay{86400};
    std::vector<Address> oracles{};

    Eip712Domain eip712_domain() const;

    OracleConsensusConfig oracle_consensus_config() const;
};

// Throws on malformed input and on a quorum the oracle list cannot reach
KeeperConfig parse_keeper_config(nlohmann::json const &);

KeeperConfig load_keeper_config(std::filesystem::path const &);

KEEPER_NAMESPACE_END
