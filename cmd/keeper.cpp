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

#include <keeper/config/keeper_config.hpp>
#include <keeper/core/likely.h>
#include <keeper/replay/deployment.hpp>
#include <keeper/replay/replay.hpp>
#include <keeper/replay/rewards_tree.hpp>

#include <CLI/CLI.hpp>

#include <nlohmann/json.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>
#include <quill/detail/LogMacros.h>

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unordered_map>

using namespace keeper;
namespace fs = std::filesystem;

namespace
{
    std::unordered_map<std::string, quill::LogLevel> const log_levels = {
        {"debug", quill::LogLevel::Debug},
        {"info", quill::LogLevel::Info},
        {"warning", quill::LogLevel::Warning},
        {"error", quill::LogLevel::Error},
        {"none", quill::LogLevel::None}};

    nlohmann::json read_json(fs::path const &path)
    {
        std::ifstream in{path};
        if (!in) {
            throw std::runtime_error{"cannot open " + path.string()};
        }
        return nlohmann::json::parse(in);
    }

    int run_tree(fs::path const &rewards_path, fs::path const &out_path)
    {
        auto const rewards = parse_vault_rewards(read_json(rewards_path));
        auto const tree = build_rewards_tree(rewards);
        LOG_INFO(
            "Built rewards tree of {} vaults, root {}",
            rewards.size(),
            tree.at("root").get<std::string>());
        if (out_path.empty()) {
            std::cout << tree.dump(2) << std::endl;
        }
        else {
            std::ofstream out{out_path};
            out << tree.dump(2) << std::endl;
        }
        return EXIT_SUCCESS;
    }

    int run_replay(
        fs::path const &config_path, fs::path const &ops_path,
        bool const strict)
    {
        auto const config = load_keeper_config(config_path);
        auto deployment = Deployment::create(config);
        if (KEEPER_UNLIKELY(deployment.has_error())) {
            LOG_ERROR(
                "deployment failed with: {}",
                deployment.assume_error().message().c_str());
            return EXIT_FAILURE;
        }
        auto const stats =
            replay_ops(*deployment.assume_value(), read_json(ops_path));
        LOG_INFO(
            "Finish replay, applied = {}, rejected = {}",
            stats.applied,
            stats.failed);
        return strict && stats.failed != 0 ? EXIT_FAILURE : EXIT_SUCCESS;
    }
}

int main(int const argc, char const *argv[])
{
    CLI::App cli{"keeper"};
    cli.option_defaults()->always_capture_default();
    cli.require_subcommand(1);

    auto log_level = quill::LogLevel::Info;
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_levels, CLI::ignore_case));

    fs::path rewards_path;
    fs::path out_path;
    auto *const tree = cli.add_subcommand(
        "tree", "build the rewards Merkle tree and per vault proofs");
    tree->add_option("--rewards", rewards_path, "vault rewards json")
        ->required()
        ->check(CLI::ExistingFile);
    tree->add_option("--out", out_path, "output file, stdout if omitted");

    fs::path config_path;
    fs::path ops_path;
    bool strict = false;
    auto *const replay = cli.add_subcommand(
        "replay", "apply a sequence of operations to a fresh deployment");
    replay->add_option("--config", config_path, "keeper config json")
        ->required()
        ->check(CLI::ExistingFile);
    replay->add_option("--ops", ops_path, "operations json")
        ->required()
        ->check(CLI::ExistingFile);
    replay->add_flag("--strict", strict, "fail if any operation is rejected");

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(ascii_time) [%(thread)] %(filename):%(lineno) LOG_%(level_name)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    int status = EXIT_FAILURE;
    try {
        if (*tree) {
            status = run_tree(rewards_path, out_path);
        }
        else if (*replay) {
            status = run_replay(config_path, ops_path, strict);
        }
    }
    catch (std::exception const &e) {
        LOG_ERROR("keeper failed with: {}", e.what());
    }
    quill::flush();
    return status;
}
