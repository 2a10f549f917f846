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
#include <stakepool/execution/core/address.hpp>
#include <stakepool/execution/core/contract/big_endian.hpp>

#include <intx/intx.hpp>

STAKEPOOL_NAMESPACE_BEGIN

// Helpers for encoding event topics and data words in the solidity ABI, so
// that emitted logs can be read back with `abi.decode()` style tooling.
//
// https://docs.soliditylang.org/en/latest/abi-spec.html#types
constexpr bytes32_t abi_encode_address(Address const &address)
{
    bytes32_t output{};
    unaligned_store(&output.bytes[12], address);
    return output;
}

template <BigEndianType I>
constexpr bytes32_t abi_encode_uint(I const &i)
{
    static_assert(sizeof(I) <= sizeof(bytes32_t));

    constexpr size_t offset = sizeof(bytes32_t) - sizeof(I);
    bytes32_t output{};
    unaligned_store(&output.bytes[offset], i);
    return output;
}

// Inverse of `abi_encode_address` and `abi_encode_uint` for single words.
inline Address abi_decode_address(bytes32_t const &word)
{
    return unaligned_load<Address>(&word.bytes[12]);
}

inline uint256_t abi_decode_uint(bytes32_t const &word)
{
    return intx::be::load<uint256_t>(word);
}

STAKEPOOL_NAMESPACE_END
