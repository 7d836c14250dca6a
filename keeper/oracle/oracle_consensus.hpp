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

#include <keeper/core/byte_string.hpp>
#include <keeper/core/bytes.hpp>
#include <keeper/core/config.hpp>
#include <keeper/core/int.hpp>
#include <keeper/core/result.hpp>
#include <keeper/crypto/eip712.hpp>
#include <keeper/host/call_context.hpp>

#include <cstdint>
#include <string>

KEEPER_NAMESPACE_BEGIN

class AttestorRegistry;
class State;
struct KeeperState;

struct RewardsUpdateParams
{
    bytes32_t rewards_root{};
    uint256_t avg_reward_per_second{0};
    uint64_t update_timestamp{0};
    // opaque reference to the off-chain rewards data, only its hash is kept
    std::string rewards_ipfs_hash{};
    // concatenated 65 byte signatures, ordered by strictly increasing signer
    byte_string signatures{};
};

struct OracleConsensusConfig
{
    uint64_t rewards_delay{43200};
    uint256_t max_avg_reward_per_second{6341958397};
};

// Accepts rewards snapshots signed by a quorum of oracles. Each accepted
// snapshot replaces the rewards root, keeps the replaced one as the previous
// root and advances the rewards nonce by one.
class OracleConsensus
{
    KeeperState &keeper_;
    State &state_;
    AttestorRegistry const &oracles_;
    Address const contract_;
    bytes32_t const domain_separator_;
    OracleConsensusConfig const config_;

    void emit_rewards_updated_event(
        Address const &caller, RewardsUpdateParams const &, uint64_t nonce,
        bytes32_t const &ipfs_hash);

public:
    OracleConsensus(
        KeeperState &, State &, AttestorRegistry const &, Eip712Domain const &,
        OracleConsensusConfig const &);

    Address const &contract() const noexcept
    {
        return contract_;
    }

    bytes32_t const &domain_separator() const noexcept
    {
        return domain_separator_;
    }

    bool can_update_rewards(uint64_t now) const;

    // EIP-712 digest the oracles sign for params at the current nonce
    bytes32_t rewards_digest(RewardsUpdateParams const &) const;

    // Every signature must recover to a registered oracle greater than the
    // previous one, and there must be at least quorum of them
    Result<void>
    verify_signatures(bytes32_t const &digest, byte_string_view) const;

    Result<void>
    update_rewards(CallContext const &, RewardsUpdateParams const &);
};

KEEPER_NAMESPACE_END
