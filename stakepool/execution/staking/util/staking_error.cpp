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

#include <stakepool/core/basic_formatter.hpp>
#include <stakepool/core/int.hpp>
#include <stakepool/core/result.hpp>
#include <stakepool/execution/core/fmt/int_fmt.hpp> // NOLINT
#include <stakepool/execution/staking/util/staking_error.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>
#include <string>

STAKEPOOL_STAKING_NAMESPACE_BEGIN

StakingFailure StakingFailure::insufficient_assets(
    uint256_t const &available, uint256_t const &requested)
{
    StakingFailure f{StakingError::InsufficientAssets};
    f.available = available;
    f.requested = requested;
    return f;
}

StakingFailure
StakingFailure::asset_transfer_failed(outcome_e::system_code const &ec)
{
    StakingFailure f{StakingError::AssetTransferFailed};
    auto const msg = ec.message();
    f.detail.assign(msg.data(), msg.size());
    return f;
}

StakingFailure
StakingFailure::arithmetic_error(outcome_e::system_code const &ec)
{
    StakingFailure f{StakingError::ArithmeticError};
    auto const msg = ec.message();
    f.detail.assign(msg.data(), msg.size());
    return f;
}

std::string StakingFailure::message() const
{
    auto const kind = outcome_e::quick_status_code_from_enum_code<StakingError>{
        code}.message();
    std::string out{kind.data(), kind.size()};
    if (code == StakingError::InsufficientAssets) {
        out +=
            fmt::format(": available {}, requested {}", available, requested);
    }
    else if (!detail.empty()) {
        out += ": ";
        out += detail;
    }
    return out;
}

STAKEPOOL_STAKING_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<stakepool::staking::StakingError>::mapping> const &
quick_status_code_from_enum<stakepool::staking::StakingError>::value_mappings()
{
    using stakepool::staking::StakingError;

    static std::initializer_list<mapping> const v = {
        {StakingError::Success, "success", {errc::success}},
        {StakingError::AlreadyInitialized, "pool already initialized", {}},
        {StakingError::Uninitialized, "pool not initialized", {}},
        {StakingError::ZeroAmountNotAllowed, "zero amount not allowed", {}},
        {StakingError::InsufficientAssets, "insufficient assets", {}},
        {StakingError::NoRewardsForSender, "no rewards for sender", {}},
        {StakingError::AssetTransferFailed, "asset transfer failed", {}},
        {StakingError::ArithmeticError, "arithmetic error", {}},
        {StakingError::StaleTimestamp, "stale timestamp", {}},
        {StakingError::AlreadyDeployed, "staking already deployed", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
