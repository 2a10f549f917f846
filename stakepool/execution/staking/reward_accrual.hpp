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
#include <stakepool/core/result.hpp>
#include <stakepool/execution/staking/config.hpp>
#include <stakepool/execution/staking/staking_config.hpp>

#include <cstdint>

STAKEPOOL_STAKING_NAMESPACE_BEGIN

// Reward owed to a holder of `assets` stake units for the time between
// `last_settlement` and `now`, capped at what the pool has left:
//
//   min(elapsed * assets * daily_reward_rate / seconds_per_day, remaining)
//
// The quotient truncates. Once `remaining` is zero the result is zero no
// matter how much time has passed. A `now` earlier than `last_settlement`
// fails with `MathError::Underflow`, an oversized product with
// `MathError::Overflow`.
Result<uint256_t> compute_accrual(
    uint256_t const &assets, uint64_t last_settlement, uint64_t now,
    uint256_t const &remaining, StakingConfig const &);

// Tokens, in fixed point, exchanged for `amount` stake units.
Result<uint256_t> asset_price(uint256_t const &amount, StakingConfig const &);

STAKEPOOL_STAKING_NAMESPACE_END
