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

#include <algorithm>
#include <bit>
#include <cstdint>
#include <type_traits>

STAKEPOOL_NAMESPACE_BEGIN

// An integer held in most-significant-byte-first order, so that a slot holds
// the same bytes on every host and lines up with the solidity ABI.
template <typename T>
    requires(slot_integral<T>)
struct BigEndian
{
    using native_type = T;

    unsigned char bytes[sizeof(T)];

    BigEndian() = default;

    constexpr BigEndian(T const &x) noexcept
    {
        unaligned_store(bytes, intx::bswap(x));
    }

    constexpr BigEndian &operator=(T const &x) noexcept
    {
        unaligned_store(bytes, intx::bswap(x));
        return *this;
    }

    [[nodiscard]] constexpr native_type native() const noexcept
    {
        return intx::bswap(unaligned_load<T>(bytes));
    }

    friend constexpr bool
    operator==(BigEndian const &a, BigEndian const &b) noexcept
    {
        return std::ranges::equal(a.bytes, b.bytes);
    }
};

using u64_be = BigEndian<uint64_t>;
using u256_be = BigEndian<uint256_t>;

static_assert(sizeof(u64_be) == 8 && alignof(u64_be) == 1);
static_assert(sizeof(u256_be) == 32 && alignof(u256_be) == 1);

template <typename T>
inline constexpr bool is_big_endian_v = false;

template <typename U>
inline constexpr bool is_big_endian_v<BigEndian<U>> = true;

template <typename T>
concept BigEndianType = is_big_endian_v<T>;

STAKEPOOL_NAMESPACE_END
