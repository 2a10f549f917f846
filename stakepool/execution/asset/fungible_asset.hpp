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
#include <stakepool/core/int.hpp>
#include <stakepool/core/result.hpp>
#include <stakepool/execution/core/address.hpp>

STAKEPOOL_NAMESPACE_BEGIN

// A transferable-balance ledger keyed by account. Implementations move exact
// amounts or fail without effect; failures are reported as `AssetError`
// (or any other status code) and are never retried by callers.
//
// A transfer may run code outside the caller, including code that calls back
// into the caller. Callers commit their own state before transferring.
class FungibleAsset
{
public:
    virtual ~FungibleAsset() = default;

    virtual Address const &address() const noexcept = 0;

    virtual uint256_t balance_of(Address const &) const = 0;

    virtual uint256_t
    allowance(Address const &owner, Address const &spender) const = 0;

    // Moves `amount` from `from` to `to`, authorized by `from`.
    virtual Result<void> transfer(
        Address const &from, Address const &to, uint256_t const &amount) = 0;

    // Moves `amount` from `from` to `to` on behalf of `spender`, consuming
    // the allowance `from` granted to `spender`.
    virtual Result<void> transfer_from(
        Address const &spender, Address const &from, Address const &to,
        uint256_t const &amount) = 0;

    virtual Result<void> approve(
        Address const &owner, Address const &spender,
        uint256_t const &amount) = 0;
};

STAKEPOOL_NAMESPACE_END
