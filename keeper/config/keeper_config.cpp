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
#include <keeper/config/keeper_config.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <stdexcept>
#include <string>

KEEPER_NAMESPACE_BEGIN

Eip712Domain KeeperConfig::eip712_domain() const
{
    return Eip712Domain{
        .name = "KeeperOracles",
        .version = "1",
        .chain_id = chain_id,
        .verifying_contract = keeper};
}

OracleConsensusConfig KeeperConfig::oracle_consensus_config() const
{
    return OracleConsensusConfig{
        .rewards_delay = rewards_delay,
        .max_avg_reward_per_second = max_avg_reward_per_second};
}

KeeperConfig parse_keeper_config(nlohmann::json const &json)
{
    KeeperConfig config;
    if (json.contains("chain_id")) {
        config.chain_id = parse_uint256(json.at("chain_id"));
    }
    config.keeper = parse_address(json.at("keeper").get<std::string>());
    if (json.contains("shared_mev_escrow")) {
        config.shared_mev_escrow =
            parse_address(json.at("shared_mev_escrow").get<std::string>());
    }
    if (json.contains("rewards_delay")) {
        config.rewards_delay = parse_uint64(json.at("rewards_delay"));
    }
    if (json.contains("max_avg_reward_per_second")) {
        config.max_avg_reward_per_second =
            parse_uint256(json.at("max_avg_reward_per_second"));
    }
    if (json.contains("exit_claim_delay")) {
        config.exit_claim_delay = parse_uint64(json.at("exit_claim_delay"));
    }
    for (auto const &oracle : json.at("oracles")) {
        config.oracles.push_back(parse_address(oracle.get<std::string>()));
    }
    config.rewards_min_oracles = parse_uint64(json.at("rewards_min_oracles"));
    if (config.rewards_min_oracles == 0 ||
        config.rewards_min_oracles > config.oracles.size()) {
        throw std::invalid_argument{
            "rewards_min_oracles must be between 1 and the number of oracles"};
    }
    return config;
}

KeeperConfig load_keeper_config(std::filesystem::path const &path)
{
    std::ifstream in{path};
    if (!in) {
        throw std::runtime_error{"cannot open " + path.string()};
    }
    return parse_keeper_config(nlohmann::json::parse(in));
}

KEEPER_NAMESPACE_END
