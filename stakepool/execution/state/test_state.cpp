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
#include <stakepool/execution/core/address.hpp>
#include <stakepool/execution/core/log.hpp>
#include <stakepool/execution/state/state.hpp>
#include <stakepool/execution/state/version_stack.hpp>

#include <gtest/gtest.h>

#include <vector>

using namespace stakepool;

namespace
{
    constexpr auto a = 0x5353535353535353535353535353535353535353_address;
    constexpr auto b = 0xbebebebebebebebebebebebebebebebebebebebe_address;

    constexpr auto key1 =
        0x00000000000000000000000000000000000000000000000000000000cafebabe_bytes32;
    constexpr auto key2 =
        0x1234567890123456789012345678901234567890123456789012345678901234_bytes32;

    constexpr auto value1 =
        0x0000000000000000000000000000000000000000000000000000000000000003_bytes32;
    constexpr auto value2 =
        0x0000000000000000000000000000000000000000000000000000000000000007_bytes32;
    constexpr auto value3 =
        0x000000000000000000000000000000000000000000000000000000000000000b_bytes32;

    Log make_log(Address const &address, unsigned const n)
    {
        return Log{
            .address = address, .topics = {bytes32_t{n}}, .data = {}};
    }
}

TEST(VersionStack, accept_folds_into_parent)
{
    VersionStack<int> s{1};
    s.current(1) = 2;
    s.current(2) = 3;
    EXPECT_EQ(s.size(), 3);
    s.pop_accept(2);
    EXPECT_EQ(s.recent(), 3);
    EXPECT_EQ(s.version(), 1);
    s.pop_accept(1);
    EXPECT_EQ(s.recent(), 3);
    EXPECT_EQ(s.version(), 0);
    EXPECT_EQ(s.size(), 1);
}

TEST(VersionStack, reject_restores_parent)
{
    VersionStack<int> s{1};
    s.current(1) = 2;
    EXPECT_FALSE(s.pop_reject(1));
    EXPECT_EQ(s.recent(), 1);

    // untouched at the rejected version
    EXPECT_FALSE(s.pop_reject(3));
    EXPECT_EQ(s.recent(), 1);
}

TEST(VersionStack, skipped_version)
{
    VersionStack<int> s{1};
    s.current(3) = 2;
    s.pop_accept(3);
    EXPECT_EQ(s.version(), 2);
    EXPECT_EQ(s.size(), 2);
    EXPECT_FALSE(s.pop_reject(2));
    EXPECT_EQ(s.recent(), 1);
}

TEST(State, storage_defaults_to_zero)
{
    State s;
    EXPECT_EQ(s.get_storage(a, key1), bytes32_t{});
    EXPECT_EQ(s.storage_size(a), 0);
    EXPECT_EQ(s.version(), 0);
}

TEST(State, set_storage)
{
    State s;
    s.set_storage(a, key1, value1);
    s.set_storage(a, key2, value2);
    s.set_storage(b, key1, value3);
    EXPECT_EQ(s.get_storage(a, key1), value1);
    EXPECT_EQ(s.get_storage(a, key2), value2);
    EXPECT_EQ(s.get_storage(b, key1), value3);
    EXPECT_EQ(s.storage_size(a), 2);
    EXPECT_EQ(s.storage_size(b), 1);
}

TEST(State, pop_reject_discards_storage_and_logs)
{
    State s;
    s.set_storage(a, key1, value1);
    s.store_log(make_log(a, 1));

    s.push();
    s.set_storage(a, key1, value2);
    s.set_storage(a, key2, value3);
    s.set_storage(b, key1, value3);
    s.store_log(make_log(b, 2));
    EXPECT_EQ(s.logs().size(), 2);
    s.pop_reject();

    EXPECT_EQ(s.version(), 0);
    EXPECT_EQ(s.get_storage(a, key1), value1);
    EXPECT_EQ(s.get_storage(a, key2), bytes32_t{});
    EXPECT_EQ(s.get_storage(b, key1), bytes32_t{});
    EXPECT_EQ(s.storage_size(b), 0);
    ASSERT_EQ(s.logs().size(), 1);
    EXPECT_EQ(s.logs()[0], make_log(a, 1));
}

TEST(State, pop_accept_keeps_storage_and_logs)
{
    State s;
    s.push();
    s.set_storage(a, key1, value1);
    s.store_log(make_log(a, 1));
    s.pop_accept();

    EXPECT_EQ(s.get_storage(a, key1), value1);
    ASSERT_EQ(s.logs().size(), 1);
    EXPECT_EQ(s.logs()[0], make_log(a, 1));
}

TEST(State, nested_versions)
{
    State s;
    s.set_storage(a, key1, value1);

    s.push();
    s.set_storage(a, key1, value2);
    s.store_log(make_log(a, 1));

    {
        s.push();
        s.set_storage(a, key1, value3);
        s.set_storage(a, key2, value3);
        s.store_log(make_log(a, 2));
        s.pop_reject();
    }
    EXPECT_EQ(s.get_storage(a, key1), value2);
    EXPECT_EQ(s.get_storage(a, key2), bytes32_t{});
    EXPECT_EQ(s.logs().size(), 1);

    {
        s.push();
        s.set_storage(a, key2, value3);
        s.store_log(make_log(a, 3));
        s.pop_accept();
    }
    EXPECT_EQ(s.get_storage(a, key2), value3);
    EXPECT_EQ(s.logs().size(), 2);

    // the outer rejection drops what the inner version accepted
    s.pop_reject();
    EXPECT_EQ(s.get_storage(a, key1), value1);
    EXPECT_EQ(s.get_storage(a, key2), bytes32_t{});
    EXPECT_TRUE(s.logs().empty());
}
