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

#include <cstdint>

#include <intx/intx.hpp>

STAKEPOOL_STAKING_NAMESPACE_BEGIN

using namespace intx::literals;

// one whole token in fixed point
inline constexpr uint256_t TOKEN{1000000000000000000_u256};

inline constexpr uint256_t TOTAL_REWARD_POOL{10'000 * TOKEN};

// whole tokens paid per stake unit
inline constexpr uint256_t UNITS_PER_ASSET{10};

// 0.1 token per stake unit per day
inline constexpr uint256_t DAILY_REWARD_RATE{TOKEN / 10};

inline constexpr uint64_t SECONDS_PER_DAY{86'400};

// genesis allocation of the reference token
inline constexpr uint256_t TOKEN_INITIAL_SUPPLY{100'000'000'000 * TOKEN};

inline constexpr Address STAKING_CA{0x2000};
inline constexpr Address TOKEN_CA{0x2001};

static_assert(DAILY_REWARD_RATE == 100000000000000000_u256);

STAKEPOOL_STAKING_NAMESPACE_END
