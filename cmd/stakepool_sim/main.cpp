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

#include <stakepool/core/basic_formatter.hpp>
#include <stakepool/core/config.hpp>
#include <stakepool/core/int.hpp>
#include <stakepool/execution/asset/token_contract.hpp>
#include <stakepool/execution/core/address.hpp>
#include <stakepool/execution/core/fmt/address_fmt.hpp> // NOLINT
#include <stakepool/execution/core/fmt/int_fmt.hpp> // NOLINT
#include <stakepool/execution/sim/scenario.hpp>
#include <stakepool/execution/staking/staking_config.hpp>
#include <stakepool/execution/staking/staking_executor.hpp>
#include <stakepool/execution/staking/util/constants.hpp>
#include <stakepool/execution/state/state.hpp>

#include <CLI/CLI.hpp>

#include <intx/intx.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

STAKEPOOL_ANONYMOUS_NAMESPACE_BEGIN

std::map<std::string, quill::LogLevel> const log_levels = {
    {"trace_l3", quill::LogLevel::TraceL3},
    {"trace_l2", quill::LogLevel::TraceL2},
    {"trace_l1", quill::LogLevel::TraceL1},
    {"debug", quill::LogLevel::Debug},
    {"info", quill::LogLevel::Info},
    {"warning", quill::LogLevel::Warning},
    {"error", quill::LogLevel::Error},
    {"critical", quill::LogLevel::Critical},
    {"none", quill::LogLevel::None}};

std::string read_file(std::filesystem::path const &path)
{
    std::ifstream in{path};
    if (!in) {
        throw std::runtime_error{fmt::format("cannot open {}", path.string())};
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

uint256_t parse_cli_amount(std::string const &value)
{
    return intx::from_string<uint256_t>(value);
}

STAKEPOOL_ANONYMOUS_NAMESPACE_END

using namespace stakepool;
namespace fs = std::filesystem;

int main(int const argc, char const *argv[])
{
    CLI::App cli{"stakepool-sim"};
    cli.option_defaults()->always_capture_default();

    fs::path genesis_path;
    fs::path scenario_path;
    auto log_level = quill::LogLevel::Info;
    std::string pool_target;
    std::string units_per_asset;
    std::string daily_rate;
    bool stop_on_error = false;

    cli.add_option("--genesis", genesis_path, "genesis token allocation json")
        ->required()
        ->check(CLI::ExistingFile);
    cli.add_option("--scenario", scenario_path, "scenario steps json")
        ->required()
        ->check(CLI::ExistingFile);
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_levels, CLI::ignore_case));
    cli.add_option(
        "--pool_target",
        pool_target,
        "reward pool funded on initialization, in fixed point (decimal)");
    cli.add_option(
        "--units_per_asset",
        units_per_asset,
        "whole tokens paid per stake unit (decimal)");
    cli.add_option(
        "--daily_rate",
        daily_rate,
        "reward per stake unit per day, in fixed point (decimal)");
    cli.add_flag(
        "--stop_on_error",
        stop_on_error,
        "stop the scenario at the first failing step");

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(time) [%(thread_id)] %(file_name):%(line_number) LOG_%(log_level)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    staking::StakingConfig config;
    std::vector<GenesisAllocation> genesis;
    std::vector<ScenarioStep> steps;
    try {
        if (!pool_target.empty()) {
            config.pool_target = parse_cli_amount(pool_target);
        }
        if (!units_per_asset.empty()) {
            config.units_per_asset = parse_cli_amount(units_per_asset);
        }
        if (!daily_rate.empty()) {
            config.daily_reward_rate = parse_cli_amount(daily_rate);
        }
        genesis = parse_genesis(read_file(genesis_path));
        steps = parse_scenario(read_file(scenario_path));
    }
    catch (std::exception const &e) {
        LOG_ERROR("invalid input: {}", e.what());
        quill::flush();
        return EXIT_FAILURE;
    }

    State state;
    TokenContract token{state, staking::TOKEN_CA};
    staking::StakingExecutor executor{state, token, config};

    try {
        load_genesis(genesis, token);
    }
    catch (std::exception const &e) {
        LOG_ERROR("{}", e.what());
        quill::flush();
        return EXIT_FAILURE;
    }
    if (auto const res = executor.deploy(); res.has_error()) {
        LOG_ERROR("deploy failed: {}", res.error().message());
        quill::flush();
        return EXIT_FAILURE;
    }

    LOG_INFO(
        "running {} steps over {} genesis accounts",
        steps.size(),
        genesis.size());
    auto const report = run_scenario(steps, executor, token, stop_on_error);

    std::set<Address> accounts;
    for (auto const &alloc : genesis) {
        accounts.insert(alloc.account);
    }
    for (auto const &step : steps) {
        accounts.insert(step.caller);
    }

    fmt::print(
        "steps: {} run, {} failed\n", report.outcomes.size(), report.failures);
    fmt::print("pool initialized: {}\n", executor.is_pool_initialized());
    fmt::print("pool remaining: {}\n", executor.remaining_pool());
    fmt::print("staking balance: {}\n", token.balance_of(staking::STAKING_CA));
    for (auto const &account : accounts) {
        fmt::print(
            "{}: tokens {}, assets {}\n",
            account,
            token.balance_of(account),
            executor.asset_balance(account));
    }
    fmt::print("events:\n");
    for (auto const &log : state.logs()) {
        fmt::print("  {} {}\n", log.address, describe_log(log));
    }

    quill::flush();
    return EXIT_SUCCESS;
}
