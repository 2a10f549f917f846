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

#include <evmc/evmc.hpp>

#include <algorithm>
#include <array>
#include <bit>

STAKEPOOL_NAMESPACE_BEGIN

using bytes32_t = ::evmc::bytes32;

static_assert(sizeof(bytes32_t) == 32);
static_assert(alignof(bytes32_t) == 1);

using namespace evmc::literals;

// Byte-wise (alignment free) reads and writes of trivially copyable values,
// usable in constant expressions.
template <typename T>
[[nodiscard]] constexpr T unaligned_load(unsigned char const *const src)
{
    std::array<unsigned char, sizeof(T)> raw;
    std::copy_n(src, sizeof(T), raw.begin());
    return std::bit_cast<T>(raw);
}

template <typename T>
constexpr void unaligned_store(unsigned char *const dst, T const &value)
{
    auto const raw = std::bit_cast<std::array<unsigned char, sizeof(T)>>(value);
    std::copy_n(raw.begin(), sizeof(T), dst);
}

STAKEPOOL_NAMESPACE_END
