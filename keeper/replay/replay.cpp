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

#include <keeper/config/json_util.hpp>
#include <keeper/core/fmt/address_fmt.hpp>
#include <keeper/core/fmt/int_fmt.hpp>
#include <keeper/host/fmt/log_fmt.hpp>
#include <keeper/replay/deployment.hpp>
#include <keeper/replay/replay.hpp>
#include <keeper/vault/vault.hpp>
#include <keeper/vault/vault_error.hpp>

#include <boost/outcome/try.hpp>

#include <nlohmann/json.hpp>

#include <quill/Quill.h>

#include <optional>
#include <stdexcept>
#include <string>

KEEPER_NAMESPACE_BEGIN

namespace
{
    Address address_field(nlohmann::json const &op, char const *const key)
    {
        return parse_address(op.at(key).get<std::string>());
    }

    CallContext context(nlohmann::json const &op, char const *const sender)
    {
        return CallContext{
            .sender = address_field(op, sender),
            .timestamp =
                op.contains("timestamp") ? parse_uint64(op.at("timestamp"))
                                         : uint64_t{0}};
    }

    Vault &vault_field(Deployment &deployment, nlohmann::json const &op)
    {
        Address const address = address_field(op, "vault");
        Vault *const vault = deployment.find_vault(address);
        if (vault == nullptr) {
            throw std::invalid_argument{
                "unknown vault: " + op.at("vault").get<std::string>()};
        }
        return *vault;
    }

    HarvestParams harvest_params(nlohmann::json const &op)
    {
        HarvestParams params{
            .reward = parse_int256(op.at("reward")),
            .unlocked_mev_reward =
                op.contains("unlocked_mev_reward")
                    ? parse_uint256(op.at("unlocked_mev_reward"))
                    : uint256_t{0}};
        if (op.contains("proof")) {
            for (auto const &node : op.at("proof")) {
                params.proof.push_back(parse_bytes32(node.get<std::string>()));
            }
        }
        return params;
    }

    Result<void> add_vault(Deployment &deployment, nlohmann::json const &op)
    {
        VaultConfig config{
            .address = address_field(op, "vault"),
            .fee_recipient = address_field(op, "fee_recipient"),
            .fee_percent = op.contains("fee_percent")
                               ? parse_uint64(op.at("fee_percent"))
                               : uint64_t{0},
            .exit_claim_delay = deployment.config().exit_claim_delay};
        if (config.fee_percent > MAX_FEE_PERCENT) {
            throw std::invalid_argument{"fee_percent exceeds 10000"};
        }
        std::optional<Address> own_mev_escrow;
        if (op.contains("own_mev_escrow")) {
            own_mev_escrow = address_field(op, "own_mev_escrow");
        }
        BOOST_OUTCOME_TRY(deployment.add_vault(config, own_mev_escrow));
        return outcome::success();
    }

    Result<void>
    update_rewards(Deployment &deployment, nlohmann::json const &op)
    {
        RewardsUpdateParams const params{
            .rewards_root =
                parse_bytes32(op.at("rewards_root").get<std::string>()),
            .avg_reward_per_second =
                parse_uint256(op.at("avg_reward_per_second")),
            .update_timestamp = parse_uint64(op.at("update_timestamp")),
            .rewards_ipfs_hash = op.value("rewards_ipfs_hash", std::string{}),
            .signatures = parse_hex(op.at("signatures").get<std::string>())};
        return deployment.consensus().update_rewards(
            context(op, "sender"), params);
    }

    Result<void> update_state(Deployment &deployment, nlohmann::json const &op)
    {
        Vault &vault = vault_field(deployment, op);
        BOOST_OUTCOME_TRY(
            auto const result,
            vault.update_state(
                CallContext{.sender = vault.address()}, harvest_params(op)));
        LOG_INFO(
            "Replay: vault {} harvested={} total assets {} total shares {}",
            vault.address(),
            result.harvested,
            vault.total_assets(),
            vault.total_shares());
        return outcome::success();
    }

    Result<void> deposit(Deployment &deployment, nlohmann::json const &op)
    {
        Vault &vault = vault_field(deployment, op);
        CallContext const ctx = context(op, "sender");
        uint256_t const assets = parse_uint256(op.at("assets"));
        Address const receiver = op.contains("receiver")
                                     ? address_field(op, "receiver")
                                     : ctx.sender;
        BOOST_OUTCOME_TRY(
            auto const shares, vault.deposit(ctx, receiver, assets));
        LOG_INFO(
            "Replay: {} deposited {} for {} shares",
            ctx.sender,
            assets,
            shares);
        return outcome::success();
    }

    Result<void>
    enter_exit_queue(Deployment &deployment, nlohmann::json const &op)
    {
        Vault &vault = vault_field(deployment, op);
        CallContext const ctx = context(op, "sender");
        Address const receiver = op.contains("receiver")
                                     ? address_field(op, "receiver")
                                     : ctx.sender;
        BOOST_OUTCOME_TRY(
            auto const ticket,
            vault.enter_exit_queue(
                ctx, parse_uint256(op.at("shares")), receiver));
        LOG_INFO("Replay: {} queued at ticket {}", receiver, ticket);
        return outcome::success();
    }

    Result<void>
    claim_exited_assets(Deployment &deployment, nlohmann::json const &op)
    {
        Vault &vault = vault_field(deployment, op);
        CallContext const ctx = context(op, "sender");
        uint256_t const ticket = parse_uint256(op.at("ticket"));
        size_t index = 0;
        if (op.contains("checkpoint_index")) {
            index = static_cast<size_t>(
                parse_uint64(op.at("checkpoint_index")));
        }
        else {
            auto const found = vault.exit_queue().get_checkpoint_index(ticket);
            if (!found.has_value()) {
                return VaultError::ExitRequestNotProcessed;
            }
            index = *found;
        }
        BOOST_OUTCOME_TRY(
            auto const result, vault.claim_exited_assets(ctx, ticket, index));
        LOG_INFO(
            "Replay: {} claimed {} for ticket {}, {} shares left",
            ctx.sender,
            result.exited_assets,
            ticket,
            result.left_shares);
        return outcome::success();
    }
}

Result<void> apply_op(Deployment &deployment, nlohmann::json const &op)
{
    auto const name = op.at("op").get<std::string>();
    if (name == "set_balance") {
        deployment.state().set_balance(
            address_field(op, "address"), parse_uint256(op.at("amount")));
        return outcome::success();
    }
    if (name == "add_balance") {
        return deployment.state().add_to_balance(
            address_field(op, "address"), parse_uint256(op.at("amount")));
    }
    if (name == "add_vault") {
        return add_vault(deployment, op);
    }
    if (name == "collateralize") {
        return deployment.harvester().collateralize(
            address_field(op, "vault"));
    }
    if (name == "update_rewards") {
        return update_rewards(deployment, op);
    }
    if (name == "update_state") {
        return update_state(deployment, op);
    }
    if (name == "deposit") {
        return deposit(deployment, op);
    }
    if (name == "enter_exit_queue") {
        return enter_exit_queue(deployment, op);
    }
    if (name == "claim_exited_assets") {
        return claim_exited_assets(deployment, op);
    }
    throw std::invalid_argument{"unknown op: " + name};
}

ReplayStats replay_ops(Deployment &deployment, nlohmann::json const &ops)
{
    ReplayStats stats;
    size_t index = 0;
    for (auto const &op : ops) {
        auto const name = op.at("op").get<std::string>();
        size_t const logs_before = deployment.state().logs().size();
        auto const result = apply_op(deployment, op);
        if (result.has_error()) {
            ++stats.failed;
            LOG_WARNING(
                "Replay: op {} ({}) rejected: {}",
                index,
                name,
                result.assume_error().message().c_str());
        }
        else {
            ++stats.applied;
            LOG_INFO("Replay: op {} ({}) applied", index, name);
            auto const &logs = deployment.state().logs();
            for (size_t i = logs_before; i < logs.size(); ++i) {
                LOG_INFO("Replay:   {}", logs[i]);
            }
        }
        ++index;
    }
    return stats;
}

KEEPER_NAMESPACE_END
