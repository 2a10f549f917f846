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

#include <stakepool/core/bytes.hpp>
#include <stakepool/core/int.hpp>
#include <stakepool/execution/asset/token_contract.hpp>
#include <stakepool/execution/core/address.hpp>
#include <stakepool/execution/core/contract/abi_encode.hpp>
#include <stakepool/execution/core/contract/abi_signatures.hpp>
#include <stakepool/execution/core/log.hpp>
#include <stakepool/execution/staking/staking_contract.hpp>
#include <stakepool/execution/staking/util/constants.hpp>
#include <stakepool/execution/staking/util/staking_error.hpp>
#include <stakepool/execution/state/state.hpp>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

#include <cstdint>
#include <cstring>
#include <vector>

using namespace stakepool;
using namespace stakepool::staking;
using namespace intx::literals;

namespace
{
    constexpr auto DEPLOYER{0xdee_address};
    constexpr auto ALICE{0xa11ce_address};
    constexpr auto BOB{0xb0b_address};
    constexpr auto CAROL{0xca201_address};

    constexpr uint64_t T0 = 1'700'000'000;
    constexpr uint64_t DAY = SECONDS_PER_DAY;
    constexpr uint64_t YEAR = 365 * DAY;

    constexpr uint256_t USER_FUNDS = 1'000'000 * TOKEN;

    constexpr auto POOL_INITIALIZED_SIGNATURE =
        abi_encode_event_signature("PoolInitialized(address,uint256)");
    constexpr auto ASSETS_BOUGHT_SIGNATURE =
        abi_encode_event_signature("AssetsBought(address,uint256)");
    constexpr auto ASSETS_REDEEMED_SIGNATURE =
        abi_encode_event_signature("AssetsRedeemed(address,uint256)");
    constexpr auto REWARDS_CLAIMED_SIGNATURE =
        abi_encode_event_signature("RewardsClaimed(address,uint256)");

    void expect_event(
        Log const &log, bytes32_t const &signature, Address const &account,
        uint256_t const &value)
    {
        EXPECT_EQ(log.address, STAKING_CA);
        ASSERT_EQ(log.topics.size(), 2);
        EXPECT_EQ(log.topics[0], signature);
        EXPECT_EQ(abi_decode_address(log.topics[1]), account);
        ASSERT_EQ(log.data.size(), sizeof(bytes32_t));
        bytes32_t word;
        std::memcpy(word.bytes, log.data.data(), sizeof(bytes32_t));
        EXPECT_EQ(abi_decode_uint(word), value);
    }
}

struct Stake : public ::testing::Test
{
    State state;
    TokenContract token{state, TOKEN_CA};
    StakingContract contract{state, token};

    void SetUp() override
    {
        ASSERT_FALSE(token.mint(DEPLOYER, TOKEN_INITIAL_SUPPLY).has_error());
        ASSERT_FALSE(contract.deploy().has_error());
        for (auto const &user : {ALICE, BOB, CAROL}) {
            ASSERT_FALSE(
                token.transfer(DEPLOYER, user, USER_FUNDS).has_error());
        }
    }

    void post_call(bool err)
    {
        if (!err) {
            state.pop_accept();
        }
        else {
            state.pop_reject();
        }
    }

    void approve(Address const &owner, uint256_t const &amount)
    {
        ASSERT_FALSE(token.approve(owner, STAKING_CA, amount).has_error());
    }

    StakingResult<void>
    initialize_pool(Address const &funder, uint64_t const now)
    {
        state.push();
        auto res = contract.initialize_pool(funder, now);
        post_call(res.has_error());
        return res;
    }

    StakingResult<void> buy_assets(
        Address const &caller, uint256_t const &amount, uint64_t const now)
    {
        state.push();
        auto res = contract.buy_assets(caller, amount, now);
        post_call(res.has_error());
        return res;
    }

    StakingResult<void> redeem_assets(
        Address const &caller, uint256_t const &amount, uint64_t const now)
    {
        state.push();
        auto res = contract.redeem_assets(caller, amount, now);
        post_call(res.has_error());
        return res;
    }

    StakingResult<uint256_t>
    claim_rewards(Address const &caller, uint64_t const now)
    {
        state.push();
        auto res = contract.claim_rewards(caller, now);
        post_call(res.has_error());
        return res;
    }

    uint256_t claimable(Address const &account, uint64_t const now)
    {
        auto const res = contract.current_claimable_reward(account, now);
        EXPECT_TRUE(res.has_value());
        return res.has_value() ? res.value() : uint256_t{0};
    }

    uint256_t unclaimed(Address const &account)
    {
        return contract.vars.stake_record(account)
            .unclaimed_reward()
            .load()
            .native();
    }

    void fund_pool()
    {
        approve(DEPLOYER, TOTAL_REWARD_POOL);
        ASSERT_FALSE(initialize_pool(DEPLOYER, T0).has_error());
    }

    void buy(Address const &caller, uint256_t const &amount, uint64_t now)
    {
        approve(caller, UINT256_MAX);
        ASSERT_FALSE(buy_assets(caller, amount, now).has_error());
    }
};

TEST_F(Stake, deploy)
{
    EXPECT_EQ(contract.asset_address(), TOKEN_CA);
    EXPECT_FALSE(contract.is_pool_initialized());
    EXPECT_EQ(contract.remaining_pool(), TOTAL_REWARD_POOL);
    EXPECT_EQ(contract.deploy().assume_error(), StakingError::AlreadyDeployed);
    EXPECT_EQ(contract.remaining_pool(), TOTAL_REWARD_POOL);
}

TEST_F(Stake, deploy_is_once_per_state)
{
    StakingContract other{state, token};
    EXPECT_EQ(other.deploy().assume_error(), StakingError::AlreadyDeployed);
    EXPECT_EQ(other.asset_address(), TOKEN_CA);
}

TEST_F(Stake, initialize_pool)
{
    uint256_t const deployer_before = token.balance_of(DEPLOYER);
    fund_pool();

    EXPECT_TRUE(contract.is_pool_initialized());
    EXPECT_EQ(contract.remaining_pool(), TOTAL_REWARD_POOL);
    EXPECT_EQ(token.balance_of(STAKING_CA), TOTAL_REWARD_POOL);
    EXPECT_EQ(
        token.balance_of(DEPLOYER), deployer_before - TOTAL_REWARD_POOL);
    expect_event(
        state.logs().back(),
        POOL_INITIALIZED_SIGNATURE,
        DEPLOYER,
        TOTAL_REWARD_POOL);

    // the funder is settled like any other caller
    EXPECT_EQ(
        contract.vars.stake_record(DEPLOYER).last_settlement().load().native(),
        T0);
}

TEST_F(Stake, initialize_pool_twice)
{
    fund_pool();
    approve(ALICE, TOTAL_REWARD_POOL);
    auto const logs_before = state.logs().size();
    EXPECT_EQ(
        initialize_pool(ALICE, T0 + 1).assume_error(),
        StakingError::AlreadyInitialized);
    EXPECT_EQ(token.balance_of(STAKING_CA), TOTAL_REWARD_POOL);
    EXPECT_EQ(token.balance_of(ALICE), USER_FUNDS);
    EXPECT_EQ(state.logs().size(), logs_before);
}

TEST_F(Stake, initialize_pool_without_allowance)
{
    auto const res = initialize_pool(DEPLOYER, T0);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), StakingError::AssetTransferFailed);
    EXPECT_EQ(res.error().detail, "insufficient allowance");
    EXPECT_EQ(
        res.error().message(), "asset transfer failed: insufficient allowance");

    // the initialized flag written before the pull is rolled back
    EXPECT_FALSE(contract.is_pool_initialized());
    EXPECT_EQ(token.balance_of(STAKING_CA), 0);
}

TEST_F(Stake, buy_before_initialize)
{
    approve(ALICE, UINT256_MAX);
    EXPECT_EQ(
        buy_assets(ALICE, 5, T0).assume_error(), StakingError::Uninitialized);

    // the initialization check comes before the amount check
    EXPECT_EQ(
        buy_assets(ALICE, 0, T0).assume_error(), StakingError::Uninitialized);
}

TEST_F(Stake, buy_zero)
{
    fund_pool();
    approve(ALICE, UINT256_MAX);
    EXPECT_EQ(
        buy_assets(ALICE, 0, T0).assume_error(),
        StakingError::ZeroAmountNotAllowed);
}

TEST_F(Stake, buy_assets)
{
    fund_pool();
    approve(ALICE, 50 * TOKEN);
    EXPECT_FALSE(buy_assets(ALICE, 5, T0).has_error());

    EXPECT_EQ(contract.asset_balance(ALICE), 5);
    EXPECT_EQ(token.balance_of(ALICE), USER_FUNDS - 50 * TOKEN);
    EXPECT_EQ(token.balance_of(STAKING_CA), TOTAL_REWARD_POOL + 50 * TOKEN);
    EXPECT_EQ(token.allowance(ALICE, STAKING_CA), 0);

    auto const &logs = state.logs();
    ASSERT_GE(logs.size(), 2);
    expect_event(logs.back(), ASSETS_BOUGHT_SIGNATURE, ALICE, 5);
    EXPECT_EQ(logs[logs.size() - 2].address, TOKEN_CA);
}

TEST_F(Stake, buy_without_enough_allowance)
{
    fund_pool();
    approve(ALICE, 49 * TOKEN);
    auto const logs_before = state.logs().size();

    auto const res = buy_assets(ALICE, 5, T0);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), StakingError::AssetTransferFailed);
    EXPECT_EQ(res.error().detail, "insufficient allowance");

    // holdings written before the pull are rolled back with it
    EXPECT_EQ(contract.asset_balance(ALICE), 0);
    EXPECT_EQ(token.balance_of(ALICE), USER_FUNDS);
    EXPECT_EQ(state.logs().size(), logs_before);
}

TEST_F(Stake, buy_without_enough_balance)
{
    fund_pool();
    approve(ALICE, UINT256_MAX);
    auto const res = buy_assets(ALICE, USER_FUNDS, T0);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), StakingError::AssetTransferFailed);
    EXPECT_EQ(res.error().detail, "transfer amount exceeds balance");
    EXPECT_EQ(contract.asset_balance(ALICE), 0);
}

TEST_F(Stake, buy_price_overflow)
{
    fund_pool();
    approve(ALICE, UINT256_MAX);
    auto const res = buy_assets(ALICE, UINT256_MAX / 10, T0);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), StakingError::ArithmeticError);
    EXPECT_EQ(res.error().detail, "overflow");
}

TEST_F(Stake, reward_after_one_day)
{
    fund_pool();
    buy(ALICE, 5, T0);
    EXPECT_EQ(claimable(ALICE, T0), 0);
    EXPECT_EQ(claimable(ALICE, T0 + DAY), 500000000000000000_u256);
}

TEST_F(Stake, claimable_preview_does_not_persist)
{
    fund_pool();
    buy(ALICE, 5, T0);
    auto const logs_before = state.logs().size();
    auto const size_before = state.storage_size(STAKING_CA);

    EXPECT_EQ(claimable(ALICE, T0 + DAY), TOKEN / 2);
    EXPECT_EQ(claimable(ALICE, T0 + DAY), TOKEN / 2);

    EXPECT_EQ(contract.remaining_pool(), TOTAL_REWARD_POOL);
    EXPECT_EQ(unclaimed(ALICE), 0);
    EXPECT_EQ(
        contract.vars.stake_record(ALICE).last_settlement().load().native(),
        T0);
    EXPECT_EQ(state.logs().size(), logs_before);
    EXPECT_EQ(state.storage_size(STAKING_CA), size_before);
}

TEST_F(Stake, claimable_preview_rejects_past)
{
    fund_pool();
    buy(ALICE, 5, T0 + DAY);
    EXPECT_EQ(
        contract.current_claimable_reward(ALICE, T0).assume_error(),
        StakingError::StaleTimestamp);
}

TEST_F(Stake, claim_rewards)
{
    fund_pool();
    buy(ALICE, 5, T0);
    uint256_t const before = token.balance_of(ALICE);

    auto const res = claim_rewards(ALICE, T0 + DAY);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value(), TOKEN / 2);
    EXPECT_EQ(token.balance_of(ALICE), before + TOKEN / 2);
    EXPECT_EQ(contract.remaining_pool(), TOTAL_REWARD_POOL - TOKEN / 2);
    EXPECT_EQ(unclaimed(ALICE), 0);
    EXPECT_EQ(claimable(ALICE, T0 + DAY), 0);
    expect_event(
        state.logs().back(), REWARDS_CLAIMED_SIGNATURE, ALICE, TOKEN / 2);

    EXPECT_EQ(
        claim_rewards(ALICE, T0 + DAY).assume_error(),
        StakingError::NoRewardsForSender);
}

TEST_F(Stake, claim_without_stake)
{
    fund_pool();
    EXPECT_EQ(
        claim_rewards(BOB, T0 + DAY).assume_error(),
        StakingError::NoRewardsForSender);
}

TEST_F(Stake, pool_drains_after_20000_days)
{
    fund_pool();
    buy(ALICE, 5, T0);

    auto const res = claim_rewards(ALICE, T0 + 20'000 * DAY);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value(), TOTAL_REWARD_POOL);
    EXPECT_EQ(contract.remaining_pool(), 0);

    EXPECT_EQ(
        claim_rewards(ALICE, T0 + 20'001 * DAY).assume_error(),
        StakingError::NoRewardsForSender);
}

TEST_F(Stake, payout_capped_after_100000_years)
{
    fund_pool();
    buy(ALICE, 5, T0);
    uint256_t const before = token.balance_of(ALICE);

    auto const res = claim_rewards(ALICE, T0 + 100'000 * YEAR);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value(), TOTAL_REWARD_POOL);
    EXPECT_EQ(token.balance_of(ALICE), before + TOTAL_REWARD_POOL);
    EXPECT_EQ(contract.remaining_pool(), 0);

    EXPECT_EQ(
        claim_rewards(ALICE, T0 + 100'000 * YEAR + DAY).assume_error(),
        StakingError::NoRewardsForSender);
}

TEST_F(Stake, redeem_more_than_held)
{
    fund_pool();
    buy(ALICE, 5, T0);

    auto const res = redeem_assets(ALICE, 6, T0 + DAY);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), StakingError::InsufficientAssets);
    EXPECT_EQ(res.error().available, 5);
    EXPECT_EQ(res.error().requested, 6);
    EXPECT_EQ(
        res.error().message(), "insufficient assets: available 5, requested 6");
    EXPECT_EQ(contract.asset_balance(ALICE), 5);

    // the settlement that ran first is rolled back too
    EXPECT_EQ(unclaimed(ALICE), 0);
    EXPECT_EQ(contract.remaining_pool(), TOTAL_REWARD_POOL);
}

TEST_F(Stake, redeem_zero)
{
    // not gated on initialization
    EXPECT_EQ(
        redeem_assets(ALICE, 0, T0).assume_error(),
        StakingError::ZeroAmountNotAllowed);
    EXPECT_EQ(
        redeem_assets(ALICE, 1, T0).assume_error(),
        StakingError::InsufficientAssets);
}

TEST_F(Stake, redeem_assets)
{
    fund_pool();
    buy(ALICE, 5, T0);
    uint256_t const before = token.balance_of(ALICE);

    EXPECT_FALSE(redeem_assets(ALICE, 2, T0 + DAY).has_error());
    EXPECT_EQ(contract.asset_balance(ALICE), 3);
    EXPECT_EQ(token.balance_of(ALICE), before + 20 * TOKEN);
    expect_event(state.logs().back(), ASSETS_REDEEMED_SIGNATURE, ALICE, 2);

    // the reward earned on the redeemed units before redemption is kept
    EXPECT_EQ(unclaimed(ALICE), TOKEN / 2);
    EXPECT_EQ(claimable(ALICE, T0 + 2 * DAY), TOKEN / 2 + 3 * TOKEN / 10);
}

TEST_F(Stake, price_symmetry)
{
    fund_pool();
    approve(BOB, UINT256_MAX);
    for (uint256_t const n : {1_u256, 7_u256, 123456_u256}) {
        uint256_t const before = token.balance_of(BOB);
        ASSERT_FALSE(buy_assets(BOB, n, T0).has_error());
        EXPECT_EQ(token.balance_of(BOB), before - n * 10 * TOKEN);
        ASSERT_FALSE(redeem_assets(BOB, n, T0).has_error());
        EXPECT_EQ(token.balance_of(BOB), before);
        EXPECT_EQ(contract.asset_balance(BOB), 0);
    }
}

TEST_F(Stake, settlement_is_idempotent)
{
    fund_pool();
    buy(ALICE, 5, T0);

    // a second purchase at the same instant settles nothing twice
    buy(ALICE, 1, T0 + DAY);
    buy(ALICE, 1, T0 + DAY);
    EXPECT_EQ(unclaimed(ALICE), TOKEN / 2);
    EXPECT_EQ(contract.remaining_pool(), TOTAL_REWARD_POOL - TOKEN / 2);
    EXPECT_EQ(claimable(ALICE, T0 + DAY), TOKEN / 2);
}

TEST_F(Stake, settlement_uses_prior_holdings)
{
    fund_pool();
    buy(ALICE, 5, T0);
    buy(ALICE, 5, T0 + DAY);

    // 0.5 for the first day at 5 units, 1.0 for the second at 10
    EXPECT_EQ(claimable(ALICE, T0 + 2 * DAY), 3 * TOKEN / 2);
}

TEST_F(Stake, stale_timestamp)
{
    fund_pool();
    buy(ALICE, 5, T0 + DAY);
    EXPECT_EQ(
        buy_assets(ALICE, 1, T0).assume_error(), StakingError::StaleTimestamp);
    EXPECT_EQ(
        claim_rewards(ALICE, T0).assume_error(), StakingError::StaleTimestamp);
    EXPECT_EQ(contract.asset_balance(ALICE), 5);
}

TEST_F(Stake, depletion_is_terminal)
{
    fund_pool();
    buy(ALICE, 5, T0);
    buy(BOB, 5, T0);

    // bob settles 500 tokens on day 1000
    ASSERT_FALSE(redeem_assets(BOB, 1, T0 + 1000 * DAY).has_error());
    EXPECT_EQ(unclaimed(BOB), 500 * TOKEN);

    // alice takes the rest of the pool
    auto const res = claim_rewards(ALICE, T0 + 30'000 * DAY);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value(), TOTAL_REWARD_POOL - 500 * TOKEN);
    EXPECT_EQ(contract.remaining_pool(), 0);

    // nothing grows any more, settled rewards are still owed
    EXPECT_EQ(claimable(BOB, T0 + 30'000 * DAY), 500 * TOKEN);
    EXPECT_EQ(claimable(BOB, T0 + 90'000 * DAY), 500 * TOKEN);
    EXPECT_EQ(claimable(ALICE, T0 + 90'000 * DAY), 0);

    // buying and redeeming still work
    buy(CAROL, 3, T0 + 30'000 * DAY);
    EXPECT_FALSE(redeem_assets(CAROL, 3, T0 + 40'000 * DAY).has_error());
    EXPECT_EQ(
        claim_rewards(CAROL, T0 + 40'000 * DAY).assume_error(),
        StakingError::NoRewardsForSender);

    auto const bob_claim = claim_rewards(BOB, T0 + 90'000 * DAY);
    ASSERT_FALSE(bob_claim.has_error());
    EXPECT_EQ(bob_claim.value(), 500 * TOKEN);
    EXPECT_EQ(
        claim_rewards(BOB, T0 + 90'000 * DAY).assume_error(),
        StakingError::NoRewardsForSender);
}

TEST_F(Stake, solvency)
{
    fund_pool();
    std::vector<Address> const users{ALICE, BOB, CAROL};
    buy(ALICE, 3, T0);
    buy(BOB, 11, T0 + 17);
    buy(CAROL, 1, T0 + 4 * DAY + 1);

    uint256_t paid = 0;
    uint64_t now = T0 + DAY;
    for (unsigned round = 0; round < 40; ++round, now += 397 * DAY + 13) {
        auto const &user = users[round % users.size()];
        auto const res = claim_rewards(user, now);
        if (res.has_value()) {
            paid += res.value();
        }
        else {
            EXPECT_EQ(res.error(), StakingError::NoRewardsForSender);
        }

        // every token held by the contract is accounted for
        uint256_t owed = contract.remaining_pool();
        for (auto const &u : users) {
            owed += unclaimed(u) + contract.asset_balance(u) * 10 * TOKEN;
        }
        EXPECT_EQ(token.balance_of(STAKING_CA), owed);
        EXPECT_LE(paid + contract.remaining_pool(), TOTAL_REWARD_POOL);
    }

    for (auto const &user : users) {
        auto const res = claim_rewards(user, now);
        if (res.has_value()) {
            paid += res.value();
        }
    }
    EXPECT_EQ(contract.remaining_pool(), 0);
    EXPECT_EQ(paid, TOTAL_REWARD_POOL);
}
