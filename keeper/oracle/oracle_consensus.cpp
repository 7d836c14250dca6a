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
#include <keeper/core/assert.h>
#include <keeper/core/fmt/address_fmt.hpp>
#include <keeper/core/fmt/bytes_fmt.hpp>
#include <keeper/core/fmt/int_fmt.hpp>
#include <keeper/core/keccak.hpp>
#include <keeper/core/likely.h>
#include <keeper/crypto/secp256k1.hpp>
#include <keeper/host/state.hpp>
#include <keeper/oracle/attestor_registry.hpp>
#include <keeper/oracle/keeper_error.hpp>
#include <keeper/oracle/keeper_state.hpp>
#include <keeper/oracle/oracle_consensus.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <limits>
#include <optional>

KEEPER_NAMESPACE_BEGIN

OracleConsensus::OracleConsensus(
    KeeperState &keeper, State &state, AttestorRegistry const &oracles,
    Eip712Domain const &domain, OracleConsensusConfig const &config)
    : keeper_{keeper}
    , state_{state}
    , oracles_{oracles}
    , contract_{domain.verifying_contract}
    , domain_separator_{domain_separator(domain)}
    , config_{config}
{
}

bool OracleConsensus::can_update_rewards(uint64_t const now) const
{
    uint64_t const last = keeper_.last_rewards_timestamp;
    return now >= last && now - last >= config_.rewards_delay;
}

bytes32_t
OracleConsensus::rewards_digest(RewardsUpdateParams const &params) const
{
    constexpr bytes32_t type_hash = keccak256_literal(
        "KeeperRewards(bytes32 rewardsRoot,bytes32 rewardsIpfsHash,uint256 "
        "avgRewardPerSecond,uint64 updateTimestamp,uint64 nonce)");

    auto const encoded =
        AbiEncoder{}
            .add_bytes32(type_hash)
            .add_bytes32(params.rewards_root)
            .add_bytes32(
                keccak256_bytes(to_byte_string_view(params.rewards_ipfs_hash)))
            .add_uint(u256_be{params.avg_reward_per_second})
            .add_uint(u64_be{params.update_timestamp})
            .add_uint(u64_be{keeper_.rewards_nonce})
            .encode_final();
    return typed_data_hash(domain_separator_, keccak256_bytes(encoded));
}

Result<void> OracleConsensus::verify_signatures(
    bytes32_t const &digest, byte_string_view signatures) const
{
    if (KEEPER_UNLIKELY(signatures.size() % SIGNATURE_SIZE != 0)) {
        return KeeperError::InvalidSigner;
    }
    uint64_t const count = signatures.size() / SIGNATURE_SIZE;
    if (KEEPER_UNLIKELY(count == 0 || count < oracles_.rewards_min_oracles())) {
        return KeeperError::NotEnoughSignatures;
    }

    std::optional<Address> last_signer;
    while (!signatures.empty()) {
        auto const signer =
            recover_signer(digest, signatures.substr(0, SIGNATURE_SIZE));
        if (KEEPER_UNLIKELY(!signer.has_value())) {
            return KeeperError::InvalidSigner;
        }
        // strictly increasing order rules out duplicates in a single pass
        if (KEEPER_UNLIKELY(
                last_signer.has_value() && !(*last_signer < *signer))) {
            return KeeperError::InvalidSigner;
        }
        if (KEEPER_UNLIKELY(!oracles_.is_oracle(*signer))) {
            return KeeperError::InvalidSigner;
        }
        last_signer = signer;
        signatures.remove_prefix(SIGNATURE_SIZE);
    }
    return outcome::success();
}

Result<void> OracleConsensus::update_rewards(
    CallContext const &ctx, RewardsUpdateParams const &params)
{
    if (KEEPER_UNLIKELY(!oracles_.is_oracle(ctx.sender))) {
        return KeeperError::AccessDenied;
    }
    if (KEEPER_UNLIKELY(
            params.rewards_root == bytes32_t{} ||
            params.rewards_root == keeper_.rewards_root)) {
        return KeeperError::InvalidRoot;
    }
    if (KEEPER_UNLIKELY(
            !can_update_rewards(ctx.timestamp) ||
            params.update_timestamp <= keeper_.last_rewards_timestamp ||
            params.update_timestamp - keeper_.last_rewards_timestamp <=
                config_.rewards_delay)) {
        return KeeperError::TooEarlyUpdate;
    }
    if (KEEPER_UNLIKELY(params.update_timestamp > ctx.timestamp)) {
        return KeeperError::FutureTimestamp;
    }
    if (KEEPER_UNLIKELY(
            params.avg_reward_per_second > config_.max_avg_reward_per_second)) {
        return KeeperError::InvalidAvgRewardPerSecond;
    }

    BOOST_OUTCOME_TRY(
        verify_signatures(rewards_digest(params), params.signatures));

    uint64_t const nonce = keeper_.rewards_nonce;
    KEEPER_ASSERT(nonce < std::numeric_limits<uint64_t>::max());

    keeper_.prev_rewards_root = keeper_.rewards_root;
    keeper_.rewards_root = params.rewards_root;
    keeper_.rewards_nonce = nonce + 1;
    keeper_.last_rewards_timestamp = params.update_timestamp;
    keeper_.avg_reward_per_second = params.avg_reward_per_second;

    bytes32_t const ipfs_hash =
        keccak256_bytes(to_byte_string_view(params.rewards_ipfs_hash));
    LOG_INFO(
        "OracleConsensus: accepted rewards root {} at nonce {}, update "
        "timestamp {}, avg reward per second {}",
        params.rewards_root,
        nonce,
        params.update_timestamp,
        params.avg_reward_per_second);
    emit_rewards_updated_event(ctx.sender, params, nonce, ipfs_hash);
    return outcome::success();
}

void OracleConsensus::emit_rewards_updated_event(
    Address const &caller, RewardsUpdateParams const &params,
    uint64_t const nonce, bytes32_t const &ipfs_hash)
{
    constexpr bytes32_t signature = abi_encode_event_signature(
        "RewardsUpdated(address,bytes32,uint256,uint64,uint64,bytes32)");

    state_.store_log(
        EventBuilder(contract_, signature)
            .add_topic(abi_encode_address(caller))
            .add_topic(params.rewards_root)
            .add_data(abi_encode_uint(u256_be{params.avg_reward_per_second}))
            .add_data(abi_encode_uint(u64_be{params.update_timestamp}))
            .add_data(abi_encode_uint(u64_be{nonce}))
            .add_data(ipfs_hash)
            .build());
}

KEEPER_NAMESPACE_END
