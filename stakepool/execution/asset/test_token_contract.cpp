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
#include <stakepool/execution/asset/asset_error.hpp>
#include <stakepool/execution/asset/token_contract.hpp>
#include <stakepool/execution/core/address.hpp>
#include <stakepool/execution/core/contract/abi_encode.hpp>
#include <stakepool/execution/core/contract/checked_math.hpp>
#include <stakepool/execution/state/state.hpp>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

using namespace stakepool;
using namespace intx::literals;

namespace
{
    constexpr auto TOKEN_ADDRESS{0x2001_address};
    constexpr auto ALICE{0xa11ce_address};
    constexpr auto BOB{0xb0b_address};
    constexpr auto SPENDER{0x5e4de4_address};

    constexpr auto TRANSFER_SIGNATURE{
        0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef_bytes32};
    constexpr auto APPROVAL_SIGNATURE{
        0x8c5be1e5ebec7d5bd14f71427d1e84f3dd0314c0f7b2291e5b200ac8c7c3b925_bytes32};
}

struct Token : public ::testing::Test
{
    State state;
    TokenContract token{state, TOKEN_ADDRESS};

    void SetUp() override
    {
        ASSERT_FALSE(token.mint(ALICE, 1000_u256).has_error());
    }
};

TEST_F(Token, mint)
{
    EXPECT_EQ(token.address(), TOKEN_ADDRESS);
    EXPECT_EQ(token.total_supply(), 1000);
    EXPECT_EQ(token.balance_of(ALICE), 1000);
    EXPECT_EQ(token.balance_of(BOB), 0);

    ASSERT_EQ(state.logs().size(), 1);
    auto const &log = state.logs()[0];
    EXPECT_EQ(log.address, TOKEN_ADDRESS);
    ASSERT_EQ(log.topics.size(), 3);
    EXPECT_EQ(log.topics[0], TRANSFER_SIGNATURE);
    EXPECT_EQ(abi_decode_address(log.topics[1]), Address{});
    EXPECT_EQ(abi_decode_address(log.topics[2]), ALICE);

    EXPECT_EQ(
        token.mint(Address{}, 1).assume_error(), AssetError::InvalidReceiver);
    EXPECT_EQ(
        token.mint(BOB, UINT256_MAX).assume_error(), MathError::Overflow);
}

TEST_F(Token, transfer)
{
    EXPECT_FALSE(token.transfer(ALICE, BOB, 400).has_error());
    EXPECT_EQ(token.balance_of(ALICE), 600);
    EXPECT_EQ(token.balance_of(BOB), 400);
    EXPECT_EQ(token.total_supply(), 1000);

    auto const &log = state.logs().back();
    EXPECT_EQ(log.topics[0], TRANSFER_SIGNATURE);
    EXPECT_EQ(abi_decode_address(log.topics[1]), ALICE);
    EXPECT_EQ(abi_decode_address(log.topics[2]), BOB);
    EXPECT_EQ(log.data.size(), 32);
}

TEST_F(Token, transfer_to_self)
{
    EXPECT_FALSE(token.transfer(ALICE, ALICE, 1000).has_error());
    EXPECT_EQ(token.balance_of(ALICE), 1000);
}

TEST_F(Token, transfer_exceeds_balance)
{
    auto const res = token.transfer(ALICE, BOB, 1001);
    EXPECT_EQ(res.assume_error(), AssetError::InsufficientBalance);
    EXPECT_STREQ(
        res.assume_error().message().c_str(),
        "transfer amount exceeds balance");
    EXPECT_EQ(token.balance_of(ALICE), 1000);
    EXPECT_EQ(token.balance_of(BOB), 0);
}

TEST_F(Token, transfer_to_zero_address)
{
    EXPECT_EQ(
        token.transfer(ALICE, Address{}, 1).assume_error(),
        AssetError::InvalidReceiver);
}

TEST_F(Token, approve)
{
    EXPECT_FALSE(token.approve(ALICE, SPENDER, 300).has_error());
    EXPECT_EQ(token.allowance(ALICE, SPENDER), 300);
    EXPECT_EQ(token.allowance(SPENDER, ALICE), 0);
    EXPECT_EQ(token.allowance(ALICE, BOB), 0);

    auto const &log = state.logs().back();
    EXPECT_EQ(log.topics[0], APPROVAL_SIGNATURE);
    EXPECT_EQ(abi_decode_address(log.topics[1]), ALICE);
    EXPECT_EQ(abi_decode_address(log.topics[2]), SPENDER);

    EXPECT_EQ(
        token.approve(ALICE, Address{}, 1).assume_error(),
        AssetError::InvalidSpender);
}

TEST_F(Token, transfer_from_consumes_allowance)
{
    ASSERT_FALSE(token.approve(ALICE, SPENDER, 300).has_error());
    EXPECT_FALSE(token.transfer_from(SPENDER, ALICE, BOB, 100).has_error());
    EXPECT_EQ(token.allowance(ALICE, SPENDER), 200);
    EXPECT_EQ(token.balance_of(ALICE), 900);
    EXPECT_EQ(token.balance_of(BOB), 100);
}

TEST_F(Token, transfer_from_insufficient_allowance)
{
    ASSERT_FALSE(token.approve(ALICE, SPENDER, 99).has_error());
    auto const res = token.transfer_from(SPENDER, ALICE, BOB, 100);
    EXPECT_EQ(res.assume_error(), AssetError::InsufficientAllowance);
    EXPECT_STREQ(
        res.assume_error().message().c_str(), "insufficient allowance");
    EXPECT_EQ(token.allowance(ALICE, SPENDER), 99);
    EXPECT_EQ(token.balance_of(ALICE), 1000);
}

TEST_F(Token, transfer_from_insufficient_balance)
{
    ASSERT_FALSE(token.approve(ALICE, SPENDER, 5000).has_error());
    state.push();
    auto const res = token.transfer_from(SPENDER, ALICE, BOB, 2000);
    EXPECT_EQ(res.assume_error(), AssetError::InsufficientBalance);
    state.pop_reject();
    EXPECT_EQ(token.allowance(ALICE, SPENDER), 5000);
}

TEST_F(Token, infinite_approval)
{
    ASSERT_FALSE(token.approve(ALICE, SPENDER, UINT256_MAX).has_error());
    EXPECT_FALSE(token.transfer_from(SPENDER, ALICE, BOB, 600).has_error());
    EXPECT_EQ(token.allowance(ALICE, SPENDER), UINT256_MAX);
    EXPECT_EQ(token.balance_of(BOB), 600);
}

TEST_F(Token, rollback)
{
    state.push();
    ASSERT_FALSE(token.transfer(ALICE, BOB, 10).has_error());
    state.pop_reject();
    EXPECT_EQ(token.balance_of(ALICE), 1000);
    EXPECT_EQ(token.balance_of(BOB), 0);
    EXPECT_EQ(state.logs().size(), 1);
}
