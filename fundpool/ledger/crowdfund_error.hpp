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

#include <fundpool/core/config.hpp>

#include <boost/outcome/config.hpp>
// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <boost/describe/enum.hpp>

#include <initializer_list>

FUNDPOOL_NAMESPACE_BEGIN

enum class CrowdfundError
{
    Success = 0,
    // authorization
    NotCampaignCreator,
    NotAdmin,
    NotOwner,
    // invalid input
    InvalidAmount,
    InvalidTimeframe,
    InvalidFundingPeriod,
    FundingGoalTooLow,
    InvalidFeeRate,
    InvalidToken,
    InvalidEndTime,
    // invalid state
    CampaignNotFound,
    CampaignNotActive,
    CampaignDisputed,
    SystemPaused,
    SystemNotPaused,
    DonationsReceived,
    NoFundsToWithdraw,
    NoRefundAvailable,
    RefundsNotSupported,
    NotADonor,
    AlreadyRefunded,
    FundingGoalNotReached,
    // temporal
    CampaignNotStarted,
    CampaignEnded,
    DeadlineNotReached,
    RefundWindowExpired,
};

enum class ErrorClass
{
    None,
    Authorization,
    InvalidInput,
    InvalidState,
    TemporalViolation,
};

BOOST_DESCRIBE_ENUM(
    ErrorClass, None, Authorization, InvalidInput, InvalidState,
    TemporalViolation)

ErrorClass error_class(CrowdfundError);

FUNDPOOL_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<fundpool::CrowdfundError>
    : quick_status_code_from_enum_defaults<fundpool::CrowdfundError>
{
    static constexpr auto const domain_name = "Crowdfund Error";
    static constexpr auto const domain_uuid =
        "9d1f3c6e-58a2-4f07-b3e4-7a0c2e91d6b8";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
