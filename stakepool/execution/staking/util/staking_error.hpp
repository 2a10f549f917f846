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

#include <stakepool/core/int.hpp>
#include <stakepool/core/result.hpp>
#include <stakepool/execution/staking/config.hpp>

#include <boost/outcome/basic_result.hpp>
#include <boost/outcome/policy/terminate.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>
#include <string>

STAKEPOOL_STAKING_NAMESPACE_BEGIN

enum class StakingError
{
    Success = 0,
    AlreadyInitialized,
    Uninitialized,
    ZeroAmountNotAllowed,
    InsufficientAssets,
    NoRewardsForSender,
    AssetTransferFailed,
    ArithmeticError,
    StaleTimestamp,
    AlreadyDeployed,
};

// A staking error kind together with the data a caller needs to act on it.
// `available`/`requested` are set for `InsufficientAssets`; `detail` carries
// the underlying message for `AssetTransferFailed` and `ArithmeticError`.
struct StakingFailure
{
    StakingError code{StakingError::Success};
    uint256_t available{};
    uint256_t requested{};
    std::string detail{};

    StakingFailure() = default;

    StakingFailure(StakingError const e)
        : code{e}
    {
    }

    static StakingFailure
    insufficient_assets(uint256_t const &available, uint256_t const &requested);

    static StakingFailure asset_transfer_failed(outcome_e::system_code const &);

    static StakingFailure arithmetic_error(outcome_e::system_code const &);

    std::string message() const;

    friend bool operator==(StakingFailure const &f, StakingError const e)
    {
        return f.code == e;
    }

    friend bool operator==(StakingFailure const &, StakingFailure const &) =
        default;
};

template <typename T>
using StakingResult =
    outcome::basic_result<T, StakingFailure, outcome::policy::terminate>;

STAKEPOOL_STAKING_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<stakepool::staking::StakingError>
    : quick_status_code_from_enum_defaults<stakepool::staking::StakingError>
{
    static constexpr auto const domain_name = "Staking Error";
    static constexpr auto const domain_uuid =
        "a4e0b9d7-35c2-4f61-8e1a-7b2d9c60f3e5";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
