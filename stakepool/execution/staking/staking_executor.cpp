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
#include <stakepool/execution/core/address.hpp>
#include <stakepool/execution/core/fmt/address_fmt.hpp> // NOLINT
#include <stakepool/execution/core/fmt/int_fmt.hpp> // NOLINT
#include <stakepool/execution/staking/staking_executor.hpp>
#include <stakepool/execution/staking/util/staking_error.hpp>
#include <stakepool/execution/state/state.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <cstdint>
#include <mutex>
#include <utility>

STAKEPOOL_STAKING_NAMESPACE_BEGIN

StakingExecutor::StakingExecutor(
    State &state, FungibleAsset &asset, StakingConfig const &config)
    : state_{state}
    , contract_{state, asset, config}
{
}

template <typename T, typename F>
StakingResult<T> StakingExecutor::execute(
    char const *const op, Address const &caller, uint64_t const now,
    F &&call)
{
    if (STAKEPOOL_UNLIKELY(now < latest_timestamp_)) {
        LOG_WARNING(
            "{} by {} rejected: timestamp {} precedes {}",
            op,
            caller,
            now,
            latest_timestamp_);
        return StakingError::StaleTimestamp;
    }

    // nested calls may commit inside this one, the clock rolls back with them
    uint64_t const committed = latest_timestamp_;
    state_.push();
    StakingResult<T> res = std::forward<F>(call)();
    if (STAKEPOOL_UNLIKELY(res.has_error())) {
        state_.pop_reject();
        latest_timestamp_ = committed;
        LOG_WARNING(
            "{} by {} at {} aborted: {}",
            op,
            caller,
            now,
            res.error().message());
        return res;
    }
    state_.pop_accept();
    latest_timestamp_ = std::max(latest_timestamp_, now);
    return res;
}

StakingResult<void> StakingExecutor::deploy()
{
    std::lock_guard const lock{mutex_};
    return execute<void>(
        "deploy", contract_.config().asset, latest_timestamp_, [&] {
            return contract_.deploy();
        });
}

StakingResult<void>
StakingExecutor::initialize_pool(Address const &funder, uint64_t const now)
{
    std::lock_guard const lock{mutex_};
    auto res = execute<void>("initialize_pool", funder, now, [&] {
        return contract_.initialize_pool(funder, now);
    });
    if (res.has_value()) {
        LOG_INFO(
            "initialize_pool: {} funded {} at {}",
            funder,
            contract_.remaining_pool(),
            now);
    }
    return res;
}

StakingResult<void> StakingExecutor::buy_assets(
    Address const &caller, uint256_t const &amount, uint64_t const now)
{
    std::lock_guard const lock{mutex_};
    auto res = execute<void>("buy_assets", caller, now, [&] {
        return contract_.buy_assets(caller, amount, now);
    });
    if (res.has_value()) {
        LOG_INFO(
            "buy_assets: {} bought {} at {}, holding {}",
            caller,
            amount,
            now,
            contract_.asset_balance(caller));
    }
    return res;
}

StakingResult<void> StakingExecutor::redeem_assets(
    Address const &caller, uint256_t const &amount, uint64_t const now)
{
    std::lock_guard const lock{mutex_};
    auto res = execute<void>("redeem_assets", caller, now, [&] {
        return contract_.redeem_assets(caller, amount, now);
    });
    if (res.has_value()) {
        LOG_INFO(
            "redeem_assets: {} redeemed {} at {}, holding {}",
            caller,
            amount,
            now,
            contract_.asset_balance(caller));
    }
    return res;
}

StakingResult<uint256_t>
StakingExecutor::claim_rewards(Address const &caller, uint64_t const now)
{
    std::lock_guard const lock{mutex_};
    auto res = execute<uint256_t>("claim_rewards", caller, now, [&] {
        return contract_.claim_rewards(caller, now);
    });
    if (res.has_value()) {
        LOG_INFO(
            "claim_rewards: {} withdrew {} at {}, pool remaining {}",
            caller,
            res.value(),
            now,
            contract_.remaining_pool());
    }
    return res;
}

Address StakingExecutor::asset_address() const
{
    std::lock_guard const lock{mutex_};
    return contract_.asset_address();
}

bool StakingExecutor::is_pool_initialized() const
{
    std::lock_guard const lock{mutex_};
    return contract_.is_pool_initialized();
}

StakingResult<uint256_t> StakingExecutor::current_claimable_reward(
    Address const &account, uint64_t const now) const
{
    std::lock_guard const lock{mutex_};
    return contract_.current_claimable_reward(account, now);
}

uint256_t StakingExecutor::asset_balance(Address const &account) const
{
    std::lock_guard const lock{mutex_};
    return contract_.asset_balance(account);
}

uint256_t StakingExecutor::remaining_pool() const
{
    std::lock_guard const lock{mutex_};
    return contract_.remaining_pool();
}

uint64_t StakingExecutor::latest_timestamp() const
{
    std::lock_guard const lock{mutex_};
    return latest_timestamp_;
}

STAKEPOOL_STAKING_NAMESPACE_END
