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

#include <stakepool/core/bytes.hpp>
#include <stakepool/core/int.hpp>
#include <stakepool/execution/core/address.hpp>
#include <stakepool/execution/core/contract/big_endian.hpp>
#include <stakepool/execution/core/contract/storage_variable.hpp>
#include <stakepool/execution/staking/config.hpp>

STAKEPOOL_NAMESPACE_BEGIN

class State;

STAKEPOOL_NAMESPACE_END

STAKEPOOL_STAKING_NAMESPACE_BEGIN

// A struct in state holding one account's position. Every field reads as zero
// until the account is first settled, so records need no explicit creation.
class StakeRecord
{
    State &state_;
    Address const address_;
    uint256_t const key_;

public:
    ////////////
    // Layout //
    ////////////
    using Assets_t = u256_be;
    using UnclaimedReward_t = u256_be;
    using LastSettlement_t = u64_be;

    struct Offsets
    {
        static constexpr size_t assets = 0;
        static constexpr size_t unclaimed_reward =
            assets + StorageVariable<Assets_t>::N;
        static constexpr size_t last_settlement =
            unclaimed_reward + StorageVariable<UnclaimedReward_t>::N;
    };

    static_assert(StorageVariable<LastSettlement_t>::N == 1);

    StakeRecord(State &state, Address const &address, bytes32_t const key);

    /////////////
    // Getters //
    /////////////

    // stake units held
    StorageVariable<Assets_t> assets() const noexcept
    {
        return {state_, address_, key_ + Offsets::assets};
    }

    // reward settled to the account and not yet withdrawn
    StorageVariable<UnclaimedReward_t> unclaimed_reward() const noexcept
    {
        return {state_, address_, key_ + Offsets::unclaimed_reward};
    }

    // timestamp of the latest settlement. never moves backwards.
    StorageVariable<LastSettlement_t> last_settlement() const noexcept
    {
        return {state_, address_, key_ + Offsets::last_settlement};
    }
};

STAKEPOOL_STAKING_NAMESPACE_END
