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

#include <stakepool/core/config.hpp>
#include <stakepool/core/int.hpp>
#include <stakepool/execution/core/address.hpp>
#include <stakepool/execution/core/log.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

STAKEPOOL_NAMESPACE_BEGIN

class FungibleAsset;
class TokenContract;

namespace staking
{
    class StakingExecutor;
}

// Token allocation read from a genesis file:
//
//   {"0x<address>": {"token_balance": "<decimal>"}, ...}
struct GenesisAllocation
{
    Address account;
    uint256_t token_balance;
};

// Throws on malformed input.
std::vector<GenesisAllocation> parse_genesis(std::string_view json);

void load_genesis(std::vector<GenesisAllocation> const &, TokenContract &);

enum class ScenarioOp
{
    Approve,
    Initialize,
    Buy,
    Redeem,
    Claim,
    Query,
};

// One call in a scripted scenario:
//
//   {"op": "buy", "caller": "0x...", "time": 86400, "amount": "5"}
//
// `amount` is a decimal string or integer, or "max" for an infinite
// approval; it is ignored by initialize, claim and query.
struct ScenarioStep
{
    ScenarioOp op;
    Address caller;
    uint64_t time;
    uint256_t amount;
};

// Throws on malformed input.
std::vector<ScenarioStep> parse_scenario(std::string_view json);

struct StepOutcome
{
    bool ok;

    // failure message, empty on success
    std::string message;

    // reward withdrawn by a claim, or claimable reward reported by a query
    std::optional<uint256_t> value;
};

struct ScenarioReport
{
    std::vector<StepOutcome> outcomes;
    size_t failures{0};
};

// Runs every step in order. A failing step is recorded and the run continues
// unless `stop_on_error` is set.
ScenarioReport run_scenario(
    std::vector<ScenarioStep> const &, staking::StakingExecutor &,
    FungibleAsset &, bool stop_on_error);

std::string_view to_string(ScenarioOp);

// Human readable rendering of a token or staking event.
std::string describe_log(Log const &);

STAKEPOOL_NAMESPACE_END
