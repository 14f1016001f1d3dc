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

#include <fundpool/core/assert.h>
#include <fundpool/core/fmt/enum_fmt.hpp>
#include <fundpool/ledger/crowdfund_error.hpp>
#include <fundpool/ledger/event.hpp>
#include <fundpool/ledger/lifecycle.hpp>

#include <boost/outcome/success_failure.hpp>

#include <quill/Quill.h>

#include <cstdint>

FUNDPOOL_NAMESPACE_BEGIN

CampaignStatus derive_status(
    Campaign const &campaign, BalanceLedger const &balance, uint64_t const now)
{
    if (campaign.status != CampaignStatus::Active) {
        return campaign.status;
    }
    if (balance.total_donations >= campaign.funding_goal) {
        return CampaignStatus::Successful;
    }
    if (campaign.funding_model == FundingModel::AllOrNothing &&
        has_ended(campaign, now)) {
        return CampaignStatus::Failed;
    }
    return CampaignStatus::Active;
}

CampaignStatus
evaluate_status(LedgerState &state, uint64_t const id, uint64_t const now)
{
    Campaign const *const stored = state.find_campaign(id);
    FUNDPOOL_ASSERT(stored != nullptr);

    CampaignStatus const status =
        derive_status(*stored, state.balance(id), now);
    if (status == stored->status) {
        return status;
    }

    // set_campaign may release the node `stored` points into
    CampaignStatus const previous = stored->status;
    Campaign campaign = *stored;
    campaign.status = status;
    state.set_campaign(campaign);

    LOG_DEBUG(
        "campaign {} status {} -> {}",
        id,
        fmt::format("{}", previous),
        fmt::format("{}", status));

    if (status == CampaignStatus::Successful) {
        state.store_log(Event{
            .type = EventType::GoalReached,
            .campaign_id = id,
            .token = campaign.token,
            .amount = state.balance(id).total_donations});
    }
    state.store_log(Event{
        .type = EventType::StatusChanged,
        .campaign_id = id,
        .value = static_cast<uint64_t>(status)});
    return status;
}

Result<void> authorize_withdrawal(
    Campaign const &campaign, CampaignStatus const status, uint64_t const now)
{
    switch (status) {
    case CampaignStatus::Successful:
        return outcome::success();
    case CampaignStatus::Failed:
        if (campaign.funding_model == FundingModel::KeepWhatYouRaise &&
            has_ended(campaign, now)) {
            return outcome::success();
        }
        return CrowdfundError::FundingGoalNotReached;
    case CampaignStatus::Deleted:
        return CrowdfundError::CampaignNotActive;
    case CampaignStatus::Active:
        break;
    }
    if (!has_ended(campaign, now)) {
        return CrowdfundError::DeadlineNotReached;
    }
    if (campaign.funding_model == FundingModel::KeepWhatYouRaise) {
        return outcome::success();
    }
    return CrowdfundError::FundingGoalNotReached;
}

FUNDPOOL_NAMESPACE_END
