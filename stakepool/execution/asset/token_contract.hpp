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
#include <stakepool/core/result.hpp>
#include <stakepool/execution/asset/fungible_asset.hpp>
#include <stakepool/execution/core/address.hpp>
#include <stakepool/execution/core/contract/big_endian.hpp>
#include <stakepool/execution/core/contract/storage_variable.hpp>

#include <bit>
#include <cstdint>

STAKEPOOL_NAMESPACE_BEGIN

class State;

// Reference fungible asset with ERC-20 semantics. Balances and allowances
// live in `State` storage under the token's own address, so token movements
// made inside a staking call are undone together with it.
class TokenContract final : public FungibleAsset
{
    State &state_;
    Address const address_;

    static constexpr auto AddressTotalSupply{
        0x0000000000000000000000000000000000000000000000000000000000000001_bytes32};

    // root slot of mapping(address => mapping(address => uint256))
    static constexpr auto AddressAllowances{
        0x0000000000000000000000000000000000000000000000000000000000000002_bytes32};

    enum Namespace : uint8_t
    {
        NSBalance = 0x01,
    };

    StorageVariable<u256_be> total_supply_var() const noexcept;

    // mapping (address => uint256) balance
    StorageVariable<u256_be> balance_var(Address const &) const noexcept;

    // mapping (address => mapping(address => uint256)) allowance
    StorageVariable<u256_be> allowance_var(
        Address const &owner, Address const &spender) const noexcept;

    Result<void>
    move(Address const &from, Address const &to, uint256_t const &amount);

    // event Transfer(
    //     address indexed from,
    //     address indexed to,
    //     uint256         value);
    void emit_transfer_event(
        Address const &from, Address const &to, u256_be const &amount);

    // event Approval(
    //     address indexed owner,
    //     address indexed spender,
    //     uint256         value);
    void emit_approval_event(
        Address const &owner, Address const &spender, u256_be const &amount);

public:
    TokenContract(State &, Address const &);

    Address const &address() const noexcept override;

    uint256_t total_supply() const;

    // Genesis allocation. Emits a transfer from the zero address.
    Result<void> mint(Address const &to, uint256_t const &amount);

    uint256_t balance_of(Address const &) const override;

    uint256_t
    allowance(Address const &owner, Address const &spender) const override;

    Result<void> transfer(
        Address const &from, Address const &to,
        uint256_t const &amount) override;

    Result<void> transfer_from(
        Address const &spender, Address const &from, Address const &to,
        uint256_t const &amount) override;

    Result<void> approve(
        Address const &owner, Address const &spender,
        uint256_t const &amount) override;
};

STAKEPOOL_NAMESPACE_END
