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
#include <stakepool/core/byte_string.hpp>
#include <stakepool/core/config.hpp>

#include <algorithm>
#include <bit>
#include <span>
#include <string_view>

#include <cthash/sha3/common.hpp>

// cthash only provides sha3 and not keccak. this function modifies the suffix
// in the trait to return keccaked values
namespace cthash
{
    struct keccak_config
    {
        static constexpr size_t digest_length_bit = 256u;
        static constexpr size_t capacity_bit = 512u;
        static constexpr size_t rate_bit = 1600u - capacity_bit;

        // Note that the library uses this trait internally as such:
        //
        // constexpr std::byte suffix_and_start_of_padding =
        //      (suffix.values[0] | (std::byte{0b0000'0001u} << suffix.bits));
        //
        // So this yields domain bit = 0x01
        static constexpr auto suffix = keccak_suffix(0, 0x00);
    };

    static_assert(
        keccak_config::rate_bit + keccak_config::capacity_bit == 1600u);

    using keccak_256 = keccak_hasher<keccak_config>;
}

STAKEPOOL_NAMESPACE_BEGIN

consteval bytes32_t
abi_encode_event_signature(std::string_view const event_name)
{
    auto const h = cthash::keccak_256{}.update(std::span{event_name}).final();
    return std::bit_cast<bytes32_t>(h);
}

// Storage slot of `mapping(key => ...)` declared at `slot`, derived the way
// solidity does: keccak256(key . slot).
inline bytes32_t
mapping_slot(bytes32_t const &key, bytes32_t const &slot) noexcept
{
    byte_string_fixed<64> preimage;
    std::copy_n(key.bytes, sizeof(key.bytes), preimage.data());
    std::copy_n(slot.bytes, sizeof(slot.bytes), preimage.data() + 32);
    auto const h =
        cthash::keccak_256{}
            .update(std::span<unsigned char const>{preimage})
            .final();
    return std::bit_cast<bytes32_t>(h);
}

STAKEPOOL_NAMESPACE_END
