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

#include <stakepool/core/assert.h>
#include <stakepool/core/int.hpp>
#include <stakepool/core/likely.h>
#include <stakepool/core/result.hpp>
#include <stakepool/execution/asset/fungible_asset.hpp>
#include <stakepool/execution/core/address.hpp>
#include <stakepool/execution/core/contract/abi_encode.hpp>
#include <stakepool/execution/core/contract/abi_signatures.hpp>
#include <stakepool/execution/core/contract/checked_math.hpp>
#include <stakepool/execution/core/contract/events.hpp>
#include <stakepool/execution/core/fmt/address_fmt.hpp> // NOLINT
#include <stakepool/execution/core/fmt/int_fmt.hpp> // NOLINT
#include <stakepool/execution/staking/reward_accrual.hpp>
#include <stakepool/execution/staking/staking_contract.hpp>
#include <stakepool/execution/staking/util/constants.hpp>
#include <stakepool/execution/staking/util/staking_error.hpp>
#include <stakepool/execution/state/state.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <cstdint>

STAKEPOOL_STAKING_ANONYMOUS_NAMESPACE_BEGIN

// Fixed point math failures surface from the staking API as
// `ArithmeticError`.
template <typename T>
StakingResult<T> from_math(Result<T> const &res)
{
    if (STAKEPOOL_UNLIKELY(res.has_error())) {
        return StakingFailure::arithmetic_error(res.error());
    }
    return res.assume_value();
}

StakingResult<void> from_asset(Result<void> const &res)
{
    if (STAKEPOOL_UNLIKELY(res.has_error())) {
        return StakingFailure::asset_transfer_failed(res.error());
    }
    return outcome::success();
}

STAKEPOOL_STAKING_ANONYMOUS_NAMESPACE_END

STAKEPOOL_STAKING_NAMESPACE_BEGIN

StakingContract::StakingContract(
    State &state, FungibleAsset &asset, StakingConfig const &config)
    : state_{state}
    , asset_{asset}
    , config_{config}
    , vars{state}
{
    STAKEPOOL_ASSERT(
        asset_.address() == config_.asset,
        "asset does not match the configured asset address");
}

StakingResult<void> StakingContract::deploy()
{
    if (STAKEPOOL_UNLIKELY(vars.asset.load_checked().has_value())) {
        return StakingError::AlreadyDeployed;
    }
    vars.asset.store(config_.asset);
    vars.remaining_pool.store(config_.pool_target);
    LOG_INFO(
        "StakingContract: deployed with asset {} and pool target {}",
        config_.asset,
        config_.pool_target);
    return outcome::success();
}

/////////////
// Events //
/////////////

void StakingContract::emit_pool_initialized_event(
    Address const &funder, u256_be const &amount)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("PoolInitialized(address,uint256)");
    static_assert(
        signature ==
        0x865db32d629b778510d2a2bd16751d214bd4a78253e6670dcebb9d1e5e3d6327_bytes32);

    auto const event = EventBuilder(STAKING_CA, signature)
                           .add_topic(abi_encode_address(funder))
                           .add_data(abi_encode_uint(amount))
                           .build();
    state_.store_log(event);
}

void StakingContract::emit_assets_bought_event(
    Address const &account, u256_be const &amount)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("AssetsBought(address,uint256)");
    static_assert(
        signature ==
        0xd503b6e11149eab108cda29724f5c68eb4de43bdd0dc7231ad4c02a48b76976a_bytes32);

    auto const event = EventBuilder(STAKING_CA, signature)
                           .add_topic(abi_encode_address(account))
                           .add_data(abi_encode_uint(amount))
                           .build();
    state_.store_log(event);
}

void StakingContract::emit_assets_redeemed_event(
    Address const &account, u256_be const &amount)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("AssetsRedeemed(address,uint256)");
    static_assert(
        signature ==
        0x687423a2cbecceb3cbc5cce06a787d83146ac343432827c8729e0e9744ba62be_bytes32);

    auto const event = EventBuilder(STAKING_CA, signature)
                           .add_topic(abi_encode_address(account))
                           .add_data(abi_encode_uint(amount))
                           .build();
    state_.store_log(event);
}

void StakingContract::emit_rewards_claimed_event(
    Address const &account, u256_be const &amount)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("RewardsClaimed(address,uint256)");
    static_assert(
        signature ==
        0xfc30cddea38e2bf4d6ea7d3f9ed3b6ad7f176419f4963bd81318067a4aee73fe_bytes32);

    auto const event = EventBuilder(STAKING_CA, signature)
                           .add_topic(abi_encode_address(account))
                           .add_data(abi_encode_uint(amount))
                           .build();
    state_.store_log(event);
}

/////////////
// Helpers //
/////////////

StakingResult<void>
StakingContract::settle(Address const &account, uint64_t const now)
{
    auto const record = vars.stake_record(account);
    auto last_settlement = record.last_settlement();
    uint64_t const last = last_settlement.load().native();
    if (STAKEPOOL_UNLIKELY(now < last)) {
        return StakingError::StaleTimestamp;
    }

    uint256_t const remaining = vars.remaining_pool.load().native();
    BOOST_OUTCOME_TRY(
        auto const additional,
        from_math(compute_accrual(
            record.assets().load().native(), last, now, remaining, config_)));

    if (additional != 0) {
        STAKEPOOL_ASSERT(additional <= remaining);
        auto unclaimed = record.unclaimed_reward();
        BOOST_OUTCOME_TRY(
            auto const credited,
            from_math(checked_add(unclaimed.load().native(), additional)));
        unclaimed.store(credited);

        uint256_t const left = remaining - additional;
        vars.remaining_pool.store(left);
        LOG_DEBUG(
            "StakingContract: settled {} for {} over {}s, pool remaining {}",
            additional,
            account,
            now - last,
            left);
        if (left == 0) {
            LOG_INFO("StakingContract: reward pool depleted at {}", now);
        }
    }
    last_settlement.store(now);
    return outcome::success();
}

StakingResult<void>
StakingContract::pull_tokens(Address const &from, uint256_t const &amount)
{
    return from_asset(
        asset_.transfer_from(STAKING_CA, from, STAKING_CA, amount));
}

StakingResult<void>
StakingContract::send_tokens(Address const &to, uint256_t const &amount)
{
    return from_asset(asset_.transfer(STAKING_CA, to, amount));
}

////////////////
// Operations //
////////////////

StakingResult<void>
StakingContract::initialize_pool(Address const &funder, uint64_t const now)
{
    BOOST_OUTCOME_TRY(settle(funder, now));
    if (STAKEPOOL_UNLIKELY(vars.pool_initialized.load())) {
        return StakingError::AlreadyInitialized;
    }

    uint256_t const amount = vars.remaining_pool.load().native();
    vars.pool_initialized.store(true);

    BOOST_OUTCOME_TRY(pull_tokens(funder, amount));
    emit_pool_initialized_event(funder, amount);
    return outcome::success();
}

StakingResult<void> StakingContract::buy_assets(
    Address const &caller, uint256_t const &amount, uint64_t const now)
{
    BOOST_OUTCOME_TRY(settle(caller, now));
    if (STAKEPOOL_UNLIKELY(!vars.pool_initialized.load())) {
        return StakingError::Uninitialized;
    }
    if (STAKEPOOL_UNLIKELY(amount == 0)) {
        return StakingError::ZeroAmountNotAllowed;
    }

    BOOST_OUTCOME_TRY(
        auto const price, from_math(asset_price(amount, config_)));
    auto assets = vars.stake_record(caller).assets();
    BOOST_OUTCOME_TRY(
        auto const held,
        from_math(checked_add(assets.load().native(), amount)));

    // holdings are written before the pull so a callback from the asset sees
    // them
    assets.store(held);
    BOOST_OUTCOME_TRY(pull_tokens(caller, price));
    emit_assets_bought_event(caller, amount);
    return outcome::success();
}

StakingResult<void> StakingContract::redeem_assets(
    Address const &caller, uint256_t const &amount, uint64_t const now)
{
    BOOST_OUTCOME_TRY(settle(caller, now));
    if (STAKEPOOL_UNLIKELY(amount == 0)) {
        return StakingError::ZeroAmountNotAllowed;
    }
    auto assets = vars.stake_record(caller).assets();
    uint256_t const held = assets.load().native();
    if (STAKEPOOL_UNLIKELY(held < amount)) {
        return StakingFailure::insufficient_assets(held, amount);
    }

    BOOST_OUTCOME_TRY(
        auto const price, from_math(asset_price(amount, config_)));
    assets.store(held - amount);
    BOOST_OUTCOME_TRY(send_tokens(caller, price));
    emit_assets_redeemed_event(caller, amount);
    return outcome::success();
}

StakingResult<uint256_t>
StakingContract::claim_rewards(Address const &caller, uint64_t const now)
{
    BOOST_OUTCOME_TRY(settle(caller, now));
    auto unclaimed = vars.stake_record(caller).unclaimed_reward();
    uint256_t const reward = unclaimed.load().native();
    if (STAKEPOOL_UNLIKELY(reward == 0)) {
        return StakingError::NoRewardsForSender;
    }

    unclaimed.clear();
    BOOST_OUTCOME_TRY(send_tokens(caller, reward));
    emit_rewards_claimed_event(caller, reward);
    return reward;
}

/////////////
// Queries //
/////////////

Address StakingContract::asset_address() const
{
    return vars.asset.load();
}

bool StakingContract::is_pool_initialized() const
{
    return vars.pool_initialized.load();
}

StakingResult<uint256_t> StakingContract::current_claimable_reward(
    Address const &account, uint64_t const now) const
{
    auto const record = vars.stake_record(account);
    uint64_t const last = record.last_settlement().load().native();
    if (STAKEPOOL_UNLIKELY(now < last)) {
        return StakingError::StaleTimestamp;
    }
    BOOST_OUTCOME_TRY(
        auto const additional,
        from_math(compute_accrual(
            record.assets().load().native(),
            last,
            now,
            vars.remaining_pool.load().native(),
            config_)));
    return from_math(
        checked_add(record.unclaimed_reward().load().native(), additional));
}

uint256_t StakingContract::asset_balance(Address const &account) const
{
    return vars.stake_record(account).assets().load().native();
}

uint256_t StakingContract::remaining_pool() const
{
    return vars.remaining_pool.load().native();
}

StakingConfig const &StakingContract::config() const noexcept
{
    return config_;
}

STAKEPOOL_STAKING_NAMESPACE_END
