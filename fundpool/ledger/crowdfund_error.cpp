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

#include <fundpool/ledger/crowdfund_error.hpp>

#include <boost/outcome/config.hpp>
// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

FUNDPOOL_NAMESPACE_BEGIN

ErrorClass error_class(CrowdfundError const e)
{
    switch (e) {
    case CrowdfundError::Success:
        return ErrorClass::None;
    case CrowdfundError::NotCampaignCreator:
    case CrowdfundError::NotAdmin:
    case CrowdfundError::NotOwner:
        return ErrorClass::Authorization;
    case CrowdfundError::InvalidAmount:
    case CrowdfundError::InvalidTimeframe:
    case CrowdfundError::InvalidFundingPeriod:
    case CrowdfundError::FundingGoalTooLow:
    case CrowdfundError::InvalidFeeRate:
    case CrowdfundError::InvalidToken:
    case CrowdfundError::InvalidEndTime:
        return ErrorClass::InvalidInput;
    case CrowdfundError::CampaignNotFound:
    case CrowdfundError::CampaignNotActive:
    case CrowdfundError::CampaignDisputed:
    case CrowdfundError::SystemPaused:
    case CrowdfundError::SystemNotPaused:
    case CrowdfundError::DonationsReceived:
    case CrowdfundError::NoFundsToWithdraw:
    case CrowdfundError::NoRefundAvailable:
    case CrowdfundError::RefundsNotSupported:
    case CrowdfundError::NotADonor:
    case CrowdfundError::AlreadyRefunded:
    case CrowdfundError::FundingGoalNotReached:
        return ErrorClass::InvalidState;
    case CrowdfundError::CampaignNotStarted:
    case CrowdfundError::CampaignEnded:
    case CrowdfundError::DeadlineNotReached:
    case CrowdfundError::RefundWindowExpired:
        return ErrorClass::TemporalViolation;
    }
    return ErrorClass::None;
}

FUNDPOOL_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<fundpool::CrowdfundError>::mapping> const &
quick_status_code_from_enum<fundpool::CrowdfundError>::value_mappings()
{
    using fundpool::CrowdfundError;

    static std::initializer_list<mapping> const v = {
        {CrowdfundError::Success, "success", {errc::success}},
        {CrowdfundError::NotCampaignCreator, "not campaign creator", {}},
        {CrowdfundError::NotAdmin, "not admin", {}},
        {CrowdfundError::NotOwner, "not owner", {}},
        {CrowdfundError::InvalidAmount, "invalid amount", {}},
        {CrowdfundError::InvalidTimeframe, "invalid timeframe", {}},
        {CrowdfundError::InvalidFundingPeriod, "invalid funding period", {}},
        {CrowdfundError::FundingGoalTooLow, "funding goal too low", {}},
        {CrowdfundError::InvalidFeeRate, "invalid fee rate", {}},
        {CrowdfundError::InvalidToken, "invalid token", {}},
        {CrowdfundError::InvalidEndTime, "invalid end time", {}},
        {CrowdfundError::CampaignNotFound, "campaign not found", {}},
        {CrowdfundError::CampaignNotActive, "campaign not active", {}},
        {CrowdfundError::CampaignDisputed, "campaign disputed", {}},
        {CrowdfundError::SystemPaused, "system paused", {}},
        {CrowdfundError::SystemNotPaused, "system not paused", {}},
        {CrowdfundError::DonationsReceived, "donations received", {}},
        {CrowdfundError::NoFundsToWithdraw, "no funds to withdraw", {}},
        {CrowdfundError::NoRefundAvailable, "no refund available", {}},
        {CrowdfundError::RefundsNotSupported, "refunds not supported", {}},
        {CrowdfundError::NotADonor, "not a donor", {}},
        {CrowdfundError::AlreadyRefunded, "already refunded", {}},
        {CrowdfundError::FundingGoalNotReached,
         "funding goal not reached",
         {}},
        {CrowdfundError::CampaignNotStarted, "campaign not started", {}},
        {CrowdfundError::CampaignEnded, "campaign ended", {}},
        {CrowdfundError::DeadlineNotReached, "deadline not reached", {}},
        {CrowdfundError::RefundWindowExpired, "refund window expired", {}}};

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
