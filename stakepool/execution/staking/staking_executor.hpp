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
#include <stakepool/execution/staking/config.hpp>
#include <stakepool/execution/staking/staking_config.hpp>
#include <stakepool/execution/staking/staking_contract.hpp>
#include <stakepool/execution/staking/util/staking_error.hpp>

#include <cstdint>
#include <mutex>

STAKEPOOL_NAMESPACE_BEGIN

class FungibleAsset;
class State;

STAKEPOOL_NAMESPACE_END

STAKEPOOL_STAKING_NAMESPACE_BEGIN

// Runs each staking call as one all-or-nothing transaction over `State`.
//
// Calls are serialized. Each one opens a state version and either folds it
// into its parent or, on any error, discards every storage write and event
// made since, including those of the asset. A call that re-enters from inside
// an asset transfer on the same thread runs as a nested transaction.
//
// Timestamps must not go backwards across committed calls; an earlier one is
// rejected with `StaleTimestamp` before anything runs.
class StakingExecutor
{
    mutable std::recursive_mutex mutex_;
    State &state_;
    StakingContract contract_;
    uint64_t latest_timestamp_{0};

    template <typename T, typename F>
    StakingResult<T> execute(
        char const *op, Address const &caller, uint64_t now, F &&call);

public:
    StakingExecutor(State &, FungibleAsset &, StakingConfig const & = {});

    StakingExecutor(StakingExecutor const &) = delete;
    StakingExecutor &operator=(StakingExecutor const &) = delete;

    // Genesis. Fails with `AlreadyDeployed` if `State` already holds a
    // deployed staking contract.
    StakingResult<void> deploy();

    StakingResult<void> initialize_pool(Address const &funder, uint64_t now);

    StakingResult<void>
    buy_assets(Address const &caller, uint256_t const &amount, uint64_t now);

    StakingResult<void> redeem_assets(
        Address const &caller, uint256_t const &amount, uint64_t now);

    StakingResult<uint256_t> claim_rewards(Address const &caller, uint64_t now);

    Address asset_address() const;

    bool is_pool_initialized() const;

    StakingResult<uint256_t>
    current_claimable_reward(Address const &account, uint64_t now) const;

    uint256_t asset_balance(Address const &account) const;

    uint256_t remaining_pool() const;

    // timestamp of the latest committed call
    uint64_t latest_timestamp() const;
};

STAKEPOOL_STAKING_NAMESPACE_END
