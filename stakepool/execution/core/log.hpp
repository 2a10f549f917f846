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

#include <stakepool/core/byte_string.hpp>
#include <stakepool/core/bytes.hpp>
#include <stakepool/core/config.hpp>
#include <stakepool/execution/core/address.hpp>

#include <vector>

STAKEPOOL_NAMESPACE_BEGIN

// An emitted record. topics[0] is the keccak of the event signature, the
// remaining topics are the indexed fields; data holds the non-indexed fields
// as consecutive 32 byte words.
struct Log
{
    Address address{};
    std::vector<bytes32_t> topics{};
    byte_string data{};

    friend bool operator==(Log const &, Log const &) = default;
};

STAKEPOOL_NAMESPACE_END
