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
#include <stakepool/core/likely.h>
#include <stakepool/core/result.hpp>
#include <stakepool/execution/asset/asset_error.hpp>
#include <stakepool/execution/asset/token_contract.hpp>
#include <stakepool/execution/core/address.hpp>
#include <stakepool/execution/core/contract/abi_encode.hpp>
#include <stakepool/execution/core/contract/abi_signatures.hpp>
#include <stakepool/execution/core/contract/big_endian.hpp>
#include <stakepool/execution/core/contract/checked_math.hpp>
#include <stakepool/execution/core/contract/events.hpp>
#include <stakepool/execution/core/contract/storage_variable.hpp>
#include <stakepool/execution/core/fmt/address_fmt.hpp> // NOLINT
#include <stakepool/execution/core/fmt/int_fmt.hpp> // NOLINT
#include <stakepool/execution/state/state.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <bit>
#include <cstdint>

STAKEPOOL_NAMESPACE_BEGIN

TokenContract::TokenContract(State &state, Address const &address)
    : state_{state}
    , address_{address}
{
}

StorageVariable<u256_be> TokenContract::total_supply_var() const noexcept
{
    return {state_, address_, AddressTotalSupply};
}

StorageVariable<u256_be>
TokenContract::balance_var(Address const &account) const noexcept
{
    struct
    {
        uint8_t ns;
        Address address;
        uint8_t slots[11];
    } key{.ns = NSBalance, .address = account, .slots = {}};

    return {state_, address_, std::bit_cast<bytes32_t>(key)};
}

StorageVariable<u256_be> TokenContract::allowance_var(
    Address const &owner, Address const &spender) const noexcept
{
    bytes32_t const inner =
        mapping_slot(abi_encode_address(owner), AddressAllowances);
    return {state_, address_, mapping_slot(abi_encode_address(spender), inner)};
}

void TokenContract::emit_transfer_event(
    Address const &from, Address const &to, u256_be const &amount)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("Transfer(address,address,uint256)");
    static_assert(
        signature ==
        0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef_bytes32);

    auto const event = EventBuilder(address_, signature)
                           .add_topic(abi_encode_address(from))
                           .add_topic(abi_encode_address(to))
                           .add_data(abi_encode_uint(amount))
                           .build();
    state_.store_log(event);
}

void TokenContract::emit_approval_event(
    Address const &owner, Address const &spender, u256_be const &amount)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("Approval(address,address,uint256)");
    static_assert(
        signature ==
        0x8c5be1e5ebec7d5bd14f71427d1e84f3dd0314c0f7b2291e5b200ac8c7c3b925_bytes32);

    auto const event = EventBuilder(address_, signature)
                           .add_topic(abi_encode_address(owner))
                           .add_topic(abi_encode_address(spender))
                           .add_data(abi_encode_uint(amount))
                           .build();
    state_.store_log(event);
}

Address const &TokenContract::address() const noexcept
{
    return address_;
}

uint256_t TokenContract::total_supply() const
{
    return total_supply_var().load().native();
}

Result<void> TokenContract::mint(Address const &to, uint256_t const &amount)
{
    if (STAKEPOOL_UNLIKELY(to == Address{})) {
        return AssetError::InvalidReceiver;
    }
    auto supply = total_supply_var();
    BOOST_OUTCOME_TRY(
        auto const new_supply, checked_add(supply.load().native(), amount));
    auto balance = balance_var(to);
    BOOST_OUTCOME_TRY(
        auto const new_balance, checked_add(balance.load().native(), amount));
    supply.store(new_supply);
    balance.store(new_balance);

    emit_transfer_event(Address{}, to, amount);
    LOG_DEBUG("TokenContract: minted {} to {}", amount, to);
    return outcome::success();
}

uint256_t TokenContract::balance_of(Address const &account) const
{
    return balance_var(account).load().native();
}

uint256_t TokenContract::allowance(
    Address const &owner, Address const &spender) const
{
    return allowance_var(owner, spender).load().native();
}

Result<void> TokenContract::move(
    Address const &from, Address const &to, uint256_t const &amount)
{
    if (STAKEPOOL_UNLIKELY(to == Address{})) {
        return AssetError::InvalidReceiver;
    }

    auto from_balance = balance_var(from);
    uint256_t const from_amount = from_balance.load().native();
    if (STAKEPOOL_UNLIKELY(from_amount < amount)) {
        return AssetError::InsufficientBalance;
    }
    from_balance.store(from_amount - amount);

    // read after the debit so that a transfer to self is a no-op
    auto to_balance = balance_var(to);
    BOOST_OUTCOME_TRY(
        auto const to_amount, checked_add(to_balance.load().native(), amount));
    to_balance.store(to_amount);

    emit_transfer_event(from, to, amount);
    return outcome::success();
}

Result<void> TokenContract::transfer(
    Address const &from, Address const &to, uint256_t const &amount)
{
    return move(from, to, amount);
}

Result<void> TokenContract::transfer_from(
    Address const &spender, Address const &from, Address const &to,
    uint256_t const &amount)
{
    auto allowance_slot = allowance_var(from, spender);
    uint256_t const allowed = allowance_slot.load().native();
    if (allowed != UINT256_MAX) {
        if (STAKEPOOL_UNLIKELY(allowed < amount)) {
            return AssetError::InsufficientAllowance;
        }
        allowance_slot.store(allowed - amount);
    }
    return move(from, to, amount);
}

Result<void> TokenContract::approve(
    Address const &owner, Address const &spender, uint256_t const &amount)
{
    if (STAKEPOOL_UNLIKELY(spender == Address{})) {
        return AssetError::InvalidSpender;
    }
    allowance_var(owner, spender).store(amount);
    emit_approval_event(owner, spender, amount);
    return outcome::success();
}

STAKEPOOL_NAMESPACE_END
