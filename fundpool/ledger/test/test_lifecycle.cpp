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

#include <fundpool/core/int.hpp>
#include <fundpool/ledger/campaign.hpp>
#include <fundpool/ledger/crowdfund_error.hpp>
#include <fundpool/ledger/event.hpp>
#include <fundpool/ledger/ledger_state.hpp>
#include <fundpool/ledger/lifecycle.hpp>

#include <evmc/evmc.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>

#include <initializer_list>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

using namespace fundpool;
using namespace evmc::literals;
using namespace intx::literals;

namespace
{
    constexpr uint64_t START = 1'000;
    constexpr uint64_t END = 1'000 + 7 * 86'400;

    Campaign make_campaign(FundingModel const model)
    {
        return Campaign{
            .id = 1,
            .creator = 0xc4ea702_address,
            .token = 0x70ce4_address,
            .start_time = START,
            .end_time = END,
            .funding_goal = 1000,
            .funding_model = model,
            .status = CampaignStatus::Active,
            .fee_rate_bps = 100};
    }

    BalanceLedger raised(uint256_t const &total)
    {
        return BalanceLedger{.total_donations = total};
    }
}

TEST(Lifecycle, time_predicates)
{
    auto const campaign = make_campaign(FundingModel::AllOrNothing);
    EXPECT_FALSE(has_started(campaign, START - 1));
    EXPECT_TRUE(has_started(campaign, START));
    EXPECT_FALSE(has_ended(campaign, END - 1));
    EXPECT_TRUE(has_ended(campaign, END));
}

TEST(Lifecycle, goal_reached_is_successful)
{
    for (auto const model :
         {FundingModel::AllOrNothing, FundingModel::KeepWhatYouRaise}) {
        auto const campaign = make_campaign(model);
        EXPECT_EQ(
            derive_status(campaign, raised(999), START),
            CampaignStatus::Active);
        EXPECT_EQ(
            derive_status(campaign, raised(1000), START),
            CampaignStatus::Successful);
        EXPECT_EQ(
            derive_status(campaign, raised(1001), END + 1),
            CampaignStatus::Successful);
    }
}

TEST(Lifecycle, all_or_nothing_fails_after_end)
{
    auto const campaign = make_campaign(FundingModel::AllOrNothing);
    EXPECT_EQ(
        derive_status(campaign, raised(600), END - 1), CampaignStatus::Active);
    EXPECT_EQ(
        derive_status(campaign, raised(600), END), CampaignStatus::Failed);
}

TEST(Lifecycle, keep_what_you_raise_never_fails_by_time)
{
    auto const campaign = make_campaign(FundingModel::KeepWhatYouRaise);
    EXPECT_EQ(
        derive_status(campaign, raised(300), END + 1'000'000),
        CampaignStatus::Active);
}

TEST(Lifecycle, terminal_statuses_are_sticky)
{
    auto campaign = make_campaign(FundingModel::AllOrNothing);
    for (auto const status :
         {CampaignStatus::Successful,
          CampaignStatus::Failed,
          CampaignStatus::Deleted}) {
        campaign.status = status;
        EXPECT_EQ(derive_status(campaign, raised(0), END + 1), status);
        EXPECT_EQ(derive_status(campaign, raised(5000), START), status);
    }
}

TEST(Lifecycle, evaluate_status_persists_and_logs)
{
    LedgerState state{100};
    ASSERT_EQ(state.next_campaign_id(), 1);
    state.set_campaign(make_campaign(FundingModel::AllOrNothing));
    state.set_balance(1, raised(1000));

    EXPECT_EQ(evaluate_status(state, 1, START), CampaignStatus::Successful);
    EXPECT_EQ(state.find_campaign(1)->status, CampaignStatus::Successful);
    ASSERT_EQ(state.logs().size(), 2);
    EXPECT_EQ(state.logs()[0].type, EventType::GoalReached);
    EXPECT_EQ(state.logs()[0].amount, 1000);
    EXPECT_EQ(state.logs()[1].type, EventType::StatusChanged);
    EXPECT_EQ(
        state.logs()[1].value,
        static_cast<uint64_t>(CampaignStatus::Successful));

    // no transition, nothing logged
    EXPECT_EQ(evaluate_status(state, 1, END), CampaignStatus::Successful);
    EXPECT_EQ(state.logs().size(), 2);
}

TEST(Lifecycle, evaluate_status_failure)
{
    LedgerState state{100};
    ASSERT_EQ(state.next_campaign_id(), 1);
    state.set_campaign(make_campaign(FundingModel::AllOrNothing));
    state.set_balance(1, raised(10));

    EXPECT_EQ(evaluate_status(state, 1, END - 1), CampaignStatus::Active);
    EXPECT_TRUE(state.logs().empty());
    EXPECT_EQ(evaluate_status(state, 1, END), CampaignStatus::Failed);
    ASSERT_EQ(state.logs().size(), 1);
    EXPECT_EQ(state.logs()[0].type, EventType::StatusChanged);
}

TEST(Lifecycle, evaluate_status_with_debug_logging)
{
    auto *const logger = quill::get_root_logger();
    auto const level = logger->log_level();
    logger->set_log_level(quill::LogLevel::Debug);

    LedgerState state{100};
    ASSERT_EQ(state.next_campaign_id(), 1);
    state.set_campaign(make_campaign(FundingModel::AllOrNothing));
    state.set_balance(1, raised(1000));
    ASSERT_EQ(state.depth(), 0);

    EXPECT_EQ(evaluate_status(state, 1, START), CampaignStatus::Successful);
    EXPECT_EQ(state.find_campaign(1)->status, CampaignStatus::Successful);
    EXPECT_EQ(state.logs().size(), 2);

    logger->set_log_level(level);
}

TEST(Lifecycle, withdrawal_authorization)
{
    auto const aon = make_campaign(FundingModel::AllOrNothing);
    auto const kwyr = make_campaign(FundingModel::KeepWhatYouRaise);

    EXPECT_FALSE(
        authorize_withdrawal(aon, CampaignStatus::Successful, START)
            .has_error());
    EXPECT_FALSE(
        authorize_withdrawal(kwyr, CampaignStatus::Active, END).has_error());

    EXPECT_EQ(
        authorize_withdrawal(kwyr, CampaignStatus::Active, END - 1)
            .assume_error(),
        CrowdfundError::DeadlineNotReached);
    EXPECT_EQ(
        authorize_withdrawal(aon, CampaignStatus::Active, END - 1)
            .assume_error(),
        CrowdfundError::DeadlineNotReached);
    EXPECT_EQ(
        authorize_withdrawal(aon, CampaignStatus::Failed, END).assume_error(),
        CrowdfundError::FundingGoalNotReached);
    EXPECT_FALSE(
        authorize_withdrawal(kwyr, CampaignStatus::Failed, END).has_error());
    EXPECT_EQ(
        authorize_withdrawal(kwyr, CampaignStatus::Failed, END - 1)
            .assume_error(),
        CrowdfundError::FundingGoalNotReached);
    EXPECT_EQ(
        authorize_withdrawal(aon, CampaignStatus::Deleted, END)
            .assume_error(),
        CrowdfundError::CampaignNotActive);
}
