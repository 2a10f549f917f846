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
#include <stakepool/core/config.hpp>
#include <stakepool/core/int.hpp>
#include <stakepool/core/result.hpp>
#include <stakepool/execution/core/address.hpp>
#include <stakepool/execution/core/contract/big_endian.hpp>
#include <stakepool/execution/core/contract/storage_variable.hpp>
#include <stakepool/execution/staking/config.hpp>
#include <stakepool/execution/staking/staking_config.hpp>
#include <stakepool/execution/staking/util/constants.hpp>
#include <stakepool/execution/staking/util/stake_record.hpp>
#include <stakepool/execution/staking/util/staking_error.hpp>

#include <bit>
#include <cstdint>

STAKEPOOL_NAMESPACE_BEGIN

class FungibleAsset;
class State;

STAKEPOOL_NAMESPACE_END

STAKEPOOL_STAKING_NAMESPACE_BEGIN

// Stake units bought and redeemed at a fixed token price, earning a fixed
// daily reward out of a pool funded once and never replenished.
//
// Every mutating call settles the caller's accrued reward first, then
// validates, then writes the ledger, and only then moves tokens through the
// asset. None of these calls is atomic by itself: the caller brackets each
// one in a `State` version and rejects it on error (see `StakingExecutor`).
class StakingContract
{
    State &state_;
    FungibleAsset &asset_;
    StakingConfig const config_;

public:
    StakingContract(State &, FungibleAsset &, StakingConfig const & = {});

    /////////////////////////////
    // Staking Storage Variables
    /////////////////////////////
    class Variables
    {
        State &state_;

        // Single slot constants all under namespace 0x0
        static constexpr auto AddressAsset{
            0x0000000000000000000000000000000000000000000000000000000000000001_bytes32};
        static constexpr auto AddressPoolInitialized{
            0x0000000000000000000000000000000000000000000000000000000000000002_bytes32};
        static constexpr auto AddressRemainingPool{
            0x0000000000000000000000000000000000000000000000000000000000000003_bytes32};

        // Namespaces for mappings. Each mapping "owns" all the address space
        // under the namespace byte.
        enum Namespace : uint8_t
        {
            NSStakeRecord = 0x01,
        };

    public:
        explicit Variables(State &state)
            : state_{state}
        {
        }

        ////////////////
        //  Constants //
        ////////////////

        // The asset staked and paid out. Written once by `deploy()`, so its
        // presence marks the contract as deployed.
        StorageVariable<Address> asset{state_, STAKING_CA, AddressAsset};

        // One way switch flipped by `initialize_pool()`.
        StorageVariable<bool> pool_initialized{
            state_, STAKING_CA, AddressPoolInitialized};

        // Undistributed reward. Starts at the pool target and only
        // decreases.
        StorageVariable<u256_be> remaining_pool{
            state_, STAKING_CA, AddressRemainingPool};

        ////////////////
        //  Mappings  //
        ////////////////

        // mapping (address => StakeRecord) stake_record
        StakeRecord stake_record(Address const &account) const noexcept
        {
            struct
            {
                uint8_t ns;
                Address address;
                uint8_t slots[11];
            } key{.ns = NSStakeRecord, .address = account, .slots = {}};

            return {state_, STAKING_CA, std::bit_cast<bytes32_t>(key)};
        }
    } vars;

    // Genesis: records the asset and pre-sets the pool to its target.
    StakingResult<void> deploy();

    ////////////////
    // Operations //
    ////////////////

    // Pulls the pool target from `funder`. Allowed exactly once.
    StakingResult<void> initialize_pool(Address const &funder, uint64_t now);

    StakingResult<void>
    buy_assets(Address const &caller, uint256_t const &amount, uint64_t now);

    StakingResult<void> redeem_assets(
        Address const &caller, uint256_t const &amount, uint64_t now);

    // Returns the reward withdrawn.
    StakingResult<uint256_t> claim_rewards(Address const &caller, uint64_t now);

    /////////////
    // Queries //
    /////////////

    Address asset_address() const;

    bool is_pool_initialized() const;

    // What `claim_rewards` would pay at `now`. Nothing is written.
    StakingResult<uint256_t>
    current_claimable_reward(Address const &account, uint64_t now) const;

    uint256_t asset_balance(Address const &account) const;

    uint256_t remaining_pool() const;

    StakingConfig const &config() const noexcept;

private:
    /////////////
    // Events //
    /////////////

    // event PoolInitialized(
    //     address indexed funder,
    //     uint256         amount);
    void emit_pool_initialized_event(
        Address const &funder, u256_be const &amount);

    // event AssetsBought(
    //     address indexed account,
    //     uint256         assetsBought);
    void
    emit_assets_bought_event(Address const &account, u256_be const &amount);

    // event AssetsRedeemed(
    //     address indexed account,
    //     uint256         assetsRedeemed);
    void
    emit_assets_redeemed_event(Address const &account, u256_be const &amount);

    // event RewardsClaimed(
    //     address indexed account,
    //     uint256         rewardWithdrawn);
    void
    emit_rewards_claimed_event(Address const &account, u256_be const &amount);

    /////////////
    // Helpers //
    /////////////

    // Credits the reward `account` accrued since its last settlement and
    // debits it from the pool.
    StakingResult<void> settle(Address const &account, uint64_t now);

    // Pull tokens from an account into the contract. Requires an allowance.
    StakingResult<void> pull_tokens(Address const &from, uint256_t const &);

    // Send tokens from the contract to an account.
    StakingResult<void> send_tokens(Address const &to, uint256_t const &);
};

STAKEPOOL_STAKING_NAMESPACE_END
