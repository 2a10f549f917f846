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

#include <stakepool/core/assert.h>
#include <stakepool/core/basic_formatter.hpp>
#include <stakepool/core/bytes.hpp>
#include <stakepool/core/int.hpp>
#include <stakepool/core/likely.h>
#include <stakepool/execution/asset/fungible_asset.hpp>
#include <stakepool/execution/asset/token_contract.hpp>
#include <stakepool/execution/core/address.hpp>
#include <stakepool/execution/core/contract/abi_encode.hpp>
#include <stakepool/execution/core/contract/abi_signatures.hpp>
#include <stakepool/execution/core/fmt/address_fmt.hpp> // NOLINT
#include <stakepool/execution/core/fmt/int_fmt.hpp> // NOLINT
#include <stakepool/execution/core/log.hpp>
#include <stakepool/execution/sim/scenario.hpp>
#include <stakepool/execution/staking/staking_executor.hpp>
#include <stakepool/execution/staking/util/constants.hpp>
#include <stakepool/execution/staking/util/staking_error.hpp>

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>

#include <intx/intx.hpp>

#include <nlohmann/json.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

STAKEPOOL_ANONYMOUS_NAMESPACE_BEGIN

using staking::StakingExecutor;
using staking::StakingResult;

Address parse_address(std::string const &hex)
{
    auto const address = evmc::from_hex<Address>(hex);
    if (STAKEPOOL_UNLIKELY(!address.has_value())) {
        throw std::invalid_argument{fmt::format("invalid address '{}'", hex)};
    }
    return address.value();
}

uint256_t parse_amount(nlohmann::json const &value)
{
    if (value.is_number_unsigned()) {
        return uint256_t{value.get<uint64_t>()};
    }
    auto const str = value.get<std::string>();
    if (str == "max") {
        return UINT256_MAX;
    }
    return intx::from_string<uint256_t>(str);
}

ScenarioOp parse_op(std::string const &name)
{
    static std::unordered_map<std::string, ScenarioOp> const ops = {
        {"approve", ScenarioOp::Approve},
        {"initialize", ScenarioOp::Initialize},
        {"buy", ScenarioOp::Buy},
        {"redeem", ScenarioOp::Redeem},
        {"claim", ScenarioOp::Claim},
        {"query", ScenarioOp::Query}};

    auto const it = ops.find(name);
    if (STAKEPOOL_UNLIKELY(it == ops.end())) {
        throw std::invalid_argument{
            fmt::format("unknown scenario op '{}'", name)};
    }
    return it->second;
}

template <typename T>
StepOutcome to_outcome(StakingResult<T> const &res)
{
    if (res.has_error()) {
        return {.ok = false, .message = res.error().message(), .value = {}};
    }
    if constexpr (std::is_void_v<T>) {
        return {.ok = true, .message = {}, .value = {}};
    }
    else {
        return {.ok = true, .message = {}, .value = res.value()};
    }
}

StepOutcome run_step(
    ScenarioStep const &step, StakingExecutor &executor, FungibleAsset &asset)
{
    switch (step.op) {
    case ScenarioOp::Approve: {
        auto const res =
            asset.approve(step.caller, staking::STAKING_CA, step.amount);
        if (res.has_error()) {
            auto const msg = res.error().message();
            return {
                .ok = false,
                .message = std::string{msg.data(), msg.size()},
                .value = {}};
        }
        return {.ok = true, .message = {}, .value = {}};
    }
    case ScenarioOp::Initialize:
        return to_outcome(executor.initialize_pool(step.caller, step.time));
    case ScenarioOp::Buy:
        return to_outcome(
            executor.buy_assets(step.caller, step.amount, step.time));
    case ScenarioOp::Redeem:
        return to_outcome(
            executor.redeem_assets(step.caller, step.amount, step.time));
    case ScenarioOp::Claim:
        return to_outcome(executor.claim_rewards(step.caller, step.time));
    case ScenarioOp::Query: {
        auto const res =
            executor.current_claimable_reward(step.caller, step.time);
        if (res.has_value()) {
            LOG_INFO(
                "query: {} holds {} assets, claimable {} at {}, pool "
                "remaining {}",
                step.caller,
                executor.asset_balance(step.caller),
                res.value(),
                step.time,
                executor.remaining_pool());
        }
        return to_outcome(res);
    }
    }
    STAKEPOOL_ABORT("unhandled scenario op");
}

STAKEPOOL_ANONYMOUS_NAMESPACE_END

STAKEPOOL_NAMESPACE_BEGIN

std::vector<GenesisAllocation> parse_genesis(std::string_view const json)
{
    std::vector<GenesisAllocation> allocations;
    auto const doc = nlohmann::json::parse(json);
    for (auto const &item : doc.items()) {
        allocations.push_back(
            {.account = parse_address(item.key()),
             .token_balance = parse_amount(item.value().at("token_balance"))});
    }
    return allocations;
}

void load_genesis(
    std::vector<GenesisAllocation> const &allocations, TokenContract &token)
{
    for (auto const &alloc : allocations) {
        auto const res = token.mint(alloc.account, alloc.token_balance);
        if (STAKEPOOL_UNLIKELY(res.has_error())) {
            auto const msg = res.error().message();
            throw std::invalid_argument{fmt::format(
                "genesis allocation to {} failed: {}",
                alloc.account,
                std::string_view{msg.data(), msg.size()})};
        }
    }
}

std::vector<ScenarioStep> parse_scenario(std::string_view const json)
{
    std::vector<ScenarioStep> steps;
    auto const doc = nlohmann::json::parse(json);
    for (auto const &item : doc) {
        ScenarioOp const op = parse_op(item.at("op").get<std::string>());
        steps.push_back(
            {.op = op,
             .caller = parse_address(item.at("caller").get<std::string>()),
             .time = item.value("time", uint64_t{0}),
             .amount = item.contains("amount") ? parse_amount(item["amount"])
                                               : uint256_t{0}});
    }
    return steps;
}

ScenarioReport run_scenario(
    std::vector<ScenarioStep> const &steps, staking::StakingExecutor &executor,
    FungibleAsset &asset, bool const stop_on_error)
{
    ScenarioReport report;
    for (size_t i = 0; i < steps.size(); ++i) {
        auto const &step = steps[i];
        auto outcome = run_step(step, executor, asset);
        if (!outcome.ok) {
            ++report.failures;
            LOG_WARNING(
                "step {}: {} by {} at {} failed: {}",
                i,
                to_string(step.op),
                step.caller,
                step.time,
                outcome.message);
        }
        bool const stop = !outcome.ok && stop_on_error;
        report.outcomes.push_back(std::move(outcome));
        if (stop) {
            LOG_ERROR("stopping after step {}", i);
            break;
        }
    }
    return report;
}

std::string_view to_string(ScenarioOp const op)
{
    switch (op) {
    case ScenarioOp::Approve:
        return "approve";
    case ScenarioOp::Initialize:
        return "initialize";
    case ScenarioOp::Buy:
        return "buy";
    case ScenarioOp::Redeem:
        return "redeem";
    case ScenarioOp::Claim:
        return "claim";
    case ScenarioOp::Query:
        return "query";
    }
    STAKEPOOL_ABORT("unhandled scenario op");
}

std::string describe_log(Log const &log)
{
    struct KnownEvent
    {
        bytes32_t signature;
        std::string_view name;
    };

    static constexpr KnownEvent known[] = {
        {abi_encode_event_signature("Transfer(address,address,uint256)"),
         "Transfer"},
        {abi_encode_event_signature("Approval(address,address,uint256)"),
         "Approval"},
        {abi_encode_event_signature("PoolInitialized(address,uint256)"),
         "PoolInitialized"},
        {abi_encode_event_signature("AssetsBought(address,uint256)"),
         "AssetsBought"},
        {abi_encode_event_signature("AssetsRedeemed(address,uint256)"),
         "AssetsRedeemed"},
        {abi_encode_event_signature("RewardsClaimed(address,uint256)"),
         "RewardsClaimed"},
    };

    if (log.topics.empty()) {
        return fmt::format("anonymous event from {}", log.address);
    }

    auto const *const it =
        std::ranges::find(known, log.topics.front(), &KnownEvent::signature);
    std::string out = it == std::ranges::end(known)
                          ? fmt::format(
                                "0x{}", evmc::hex({log.topics.front().bytes,
                                                   sizeof(bytes32_t)}))
                          : std::string{it->name};
    out += '(';
    bool first = true;
    for (size_t i = 1; i < log.topics.size(); ++i) {
        out += first ? "" : ", ";
        out += fmt::format("{}", abi_decode_address(log.topics[i]));
        first = false;
    }
    for (size_t offset = 0; offset + sizeof(bytes32_t) <= log.data.size();
         offset += sizeof(bytes32_t)) {
        bytes32_t word;
        std::memcpy(word.bytes, log.data.data() + offset, sizeof(bytes32_t));
        out += first ? "" : ", ";
        out += fmt::format("{}", abi_decode_uint(word));
        first = false;
    }
    out += ')';
    return out;
}

STAKEPOOL_NAMESPACE_END
