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

#include <stakepool/core/int.hpp>
#include <stakepool/execution/core/address.hpp>
#include <stakepool/execution/staking/config.hpp>
#include <stakepool/execution/staking/util/constants.hpp>

#include <cstdint>

STAKEPOOL_STAKING_NAMESPACE_BEGIN

// Fixed at deployment. The defaults price a stake unit at 10 tokens and pay
// 0.1 token per stake unit per day out of a 10,000 token pool.
struct StakingConfig
{
    Address asset{TOKEN_CA};

    // reward pool funded by `initialize_pool`, in fixed point
    uint256_t pool_target{TOTAL_REWARD_POOL};

    // whole tokens per stake unit
    uint256_t units_per_asset{UNITS_PER_ASSET};

    // fixed point reward per stake unit per day
    uint256_t daily_reward_rate{DAILY_REWARD_RATE};

    uint64_t seconds_per_day{SECONDS_PER_DAY};
};

STAKEPOOL_STAKING_NAMESPACE_END
