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
#include <stakepool/execution/core/contract/checked_math.hpp>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

using namespace stakepool;
using namespace intx::literals;

TEST(CheckedMath, add)
{
    EXPECT_EQ(checked_add(2, 3).value(), 5);
    EXPECT_EQ(checked_add(UINT256_MAX, 0).value(), UINT256_MAX);
    EXPECT_EQ(checked_add(UINT256_MAX, 1).assume_error(), MathError::Overflow);
}

TEST(CheckedMath, sub)
{
    EXPECT_EQ(checked_sub(5, 3).value(), 2);
    EXPECT_EQ(checked_sub(3, 3).value(), 0);
    EXPECT_EQ(checked_sub(3, 5).assume_error(), MathError::Underflow);
}

TEST(CheckedMath, mul)
{
    EXPECT_EQ(checked_mul(1_u256 << 100, 1_u256 << 100).value(), 1_u256 << 200);
    EXPECT_EQ(checked_mul(UINT256_MAX, 1).value(), UINT256_MAX);
    EXPECT_EQ(
        checked_mul(1_u256 << 128, 1_u256 << 128).assume_error(),
        MathError::Overflow);
}

TEST(CheckedMath, mul_div)
{
    // 24h of 5 stake units at 0.1 token per day
    EXPECT_EQ(
        checked_mul_div(86400 * 5, 100000000000000000_u256, 86400).value(),
        500000000000000000_u256);

    // truncates toward zero
    EXPECT_EQ(checked_mul_div(1, 1, 3).value(), 0);
    EXPECT_EQ(checked_mul_div(5, 2, 3).value(), 3);

    // the intermediate product may exceed 256 bits
    EXPECT_EQ(checked_mul_div(UINT256_MAX, 2, 2).value(), UINT256_MAX);
    EXPECT_EQ(
        checked_mul_div(UINT256_MAX, 3, 2).assume_error(), MathError::Overflow);
    EXPECT_EQ(
        checked_mul_div(1, 1, 0).assume_error(), MathError::DivisionByZero);
}

TEST(CheckedMath, message)
{
    auto const res = checked_sub(0, 1);
    ASSERT_TRUE(res.has_error());
    EXPECT_STREQ(res.error().message().c_str(), "underflow");
}
