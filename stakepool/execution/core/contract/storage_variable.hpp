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
#include <stakepool/execution/core/address.hpp>
#include <stakepool/execution/state/state.hpp>

#include <intx/intx.hpp>

#include <array>
#include <cstddef>
#include <optional>
#include <type_traits>

STAKEPOOL_NAMESPACE_BEGIN

// Typed access to `N` consecutive storage slots of one account, the first at
// `key`. A value is laid out from the start of the first slot and the tail
// of the last slot is zero. Zero in every slot means "never written".
template <typename T>
    requires std::has_unique_object_representations_v<T>
class StorageVariable
{
public:
    static constexpr size_t N =
        (sizeof(T) + sizeof(bytes32_t) - 1) / sizeof(bytes32_t);

private:
    using Image = std::array<unsigned char, N * sizeof(bytes32_t)>;

    State &state_;
    Address const address_;
    uint256_t const first_;

    bytes32_t slot_key(size_t const i) const noexcept
    {
        return intx::be::store<bytes32_t>(first_ + i);
    }

    Image read() const
    {
        Image image;
        for (size_t i = 0; i < N; ++i) {
            auto const word = state_.get_storage(address_, slot_key(i));
            unaligned_store(&image[i * sizeof(bytes32_t)], word);
        }
        return image;
    }

    void write(Image const &image)
    {
        for (size_t i = 0; i < N; ++i) {
            state_.set_storage(
                address_,
                slot_key(i),
                unaligned_load<bytes32_t>(&image[i * sizeof(bytes32_t)]));
        }
    }

public:
    StorageVariable(State &state, Address const &address, bytes32_t const &key)
        : StorageVariable{state, address, intx::be::load<uint256_t>(key)}
    {
    }

    StorageVariable(State &state, Address const &address, uint256_t const &key)
        : state_{state}
        , address_{address}
        , first_{key}
    {
    }

    T load() const
    {
        return unaligned_load<T>(read().data());
    }

    std::optional<T> load_checked() const
    {
        Image const image = read();
        for (auto const byte : image) {
            if (byte != 0) {
                return unaligned_load<T>(image.data());
            }
        }
        return std::nullopt;
    }

    void store(T const &value)
    {
        Image image{};
        unaligned_store(image.data(), value);
        write(image);
    }

    void clear()
    {
        write(Image{});
    }
};

STAKEPOOL_NAMESPACE_END
