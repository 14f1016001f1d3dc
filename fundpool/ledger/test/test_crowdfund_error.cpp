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

#include <fundpool/core/checked_math.hpp>
#include <fundpool/core/result.hpp>
#include <fundpool/ledger/crowdfund_error.hpp>
#include <fundpool/ledger/host.hpp>

#include <string>

#include <gtest/gtest.h>

using namespace fundpool;

TEST(CrowdfundError, messages)
{
    Result<void> const not_admin = CrowdfundError::NotAdmin;
    ASSERT_TRUE(not_admin.has_error());
    EXPECT_EQ(not_admin.error(), CrowdfundError::NotAdmin);
    EXPECT_EQ(
        std::string{not_admin.error().message().c_str()}, "not admin");

    Result<void> const expired = CrowdfundError::RefundWindowExpired;
    EXPECT_EQ(
        std::string{expired.error().message().c_str()},
        "refund window expired");

    Result<void> const overflow = ArithmeticError::Overflow;
    EXPECT_EQ(
        std::string{overflow.error().message().c_str()},
        "arithmetic overflow");
    EXPECT_NE(overflow.error(), CrowdfundError::NotAdmin);

    Result<void> const insufficient = TokenError::InsufficientBalance;
    EXPECT_EQ(
        std::string{insufficient.error().message().c_str()},
        "insufficient balance");
}

TEST(CrowdfundError, classes)
{
    EXPECT_EQ(error_class(CrowdfundError::Success), ErrorClass::None);
    EXPECT_EQ(
        error_class(CrowdfundError::NotCampaignCreator),
        ErrorClass::Authorization);
    EXPECT_EQ(error_class(CrowdfundError::NotOwner), ErrorClass::Authorization);
    EXPECT_EQ(
        error_class(CrowdfundError::FundingGoalTooLow),
        ErrorClass::InvalidInput);
    EXPECT_EQ(
        error_class(CrowdfundError::InvalidEndTime), ErrorClass::InvalidInput);
    EXPECT_EQ(
        error_class(CrowdfundError::AlreadyRefunded), ErrorClass::InvalidState);
    EXPECT_EQ(
        error_class(CrowdfundError::SystemPaused), ErrorClass::InvalidState);
    EXPECT_EQ(
        error_class(CrowdfundError::CampaignEnded),
        ErrorClass::TemporalViolation);
    EXPECT_EQ(
        error_class(CrowdfundError::RefundWindowExpired),
        ErrorClass::TemporalViolation);
}
