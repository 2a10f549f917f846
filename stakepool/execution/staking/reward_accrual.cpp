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

#include <stakepool/core/int.hpp>
#include <stakepool/core/likely.h>
#include <stakepool/core/result.hpp>
#include <stakepool/execution/core/contract/checked_math.hpp>
#include <stakepool/execution/staking/reward_accrual.hpp>
#include <stakepool/execution/staking/staking_config.hpp>
#include <stakepool/execution/staking/util/constants.hpp>

#include <boost/outcome/try.hpp>

#include <algorithm>
#include <cstdint>

STAKEPOOL_STAKING_NAMESPACE_BEGIN

Result<uint256_t> compute_accrual(
    uint256_t const &assets, uint64_t const last_settlement,
    uint64_t const now, uint256_t const &remaining,
    StakingConfig const &config)
{
    BOOST_OUTCOME_TRY(
        auto const elapsed,
        checked_sub(uint256_t{now}, uint256_t{last_settlement}));
    if (elapsed == 0 || assets == 0 || STAKEPOOL_UNLIKELY(remaining == 0)) {
        return uint256_t{0};
    }
    BOOST_OUTCOME_TRY(auto const held, checked_mul(elapsed, assets));
    BOOST_OUTCOME_TRY(
        auto const raw,
        checked_mul_div(
            held, config.daily_reward_rate, uint256_t{config.seconds_per_day}));
    return std::min(raw, remaining);
}

Result<uint256_t>
asset_price(uint256_t const &amount, StakingConfig const &config)
{
    BOOST_OUTCOME_TRY(
        auto const units, checked_mul(amount, config.units_per_asset));
    return checked_mul(units, TOKEN);
}

STAKEPOOL_STAKING_NAMESPACE_END
