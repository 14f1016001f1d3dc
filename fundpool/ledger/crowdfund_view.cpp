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
#include <fundpool/ledger/crowdfund_error.hpp>
#include <fundpool/ledger/crowdfund_view.hpp>
#include <fundpool/ledger/fee.hpp>
#include <fundpool/ledger/lifecycle.hpp>

#include <boost/outcome/try.hpp>

#include <cstdint>
#include <vector>

FUNDPOOL_NAMESPACE_BEGIN

CrowdfundView::CrowdfundView(
    LedgerState const &state, LedgerConfig const &config)
    : state_{state}
    , config_{config}
{
}

Result<Campaign> CrowdfundView::get_campaign(uint64_t const id) const
{
    Campaign const *const campaign = state_.find_campaign(id);
    if (campaign == nullptr) {
        return CrowdfundError::CampaignNotFound;
    }
    return *campaign;
}

Result<BalanceLedger> CrowdfundView::get_balance(uint64_t const id) const
{
    if (state_.find_campaign(id) == nullptr) {
        return CrowdfundError::CampaignNotFound;
    }
    return state_.balance(id);
}

Result<uint256_t> CrowdfundView::funding_progress(uint64_t const id) const
{
    BOOST_OUTCOME_TRY(auto const campaign, get_campaign(id));
    if (campaign.funding_goal == 0) {
        return uint256_t{0};
    }
    BOOST_OUTCOME_TRY(
        auto const scaled,
        checked_mul(state_.balance(id).total_donations, uint256_t{100}));
    return checked_div(scaled, campaign.funding_goal);
}

std::vector<uint64_t>
CrowdfundView::campaigns_by_creator(Address const &creator) const
{
    auto const ids = state_.created_by(creator);
    return std::vector<uint64_t>(ids.begin(), ids.end());
}

std::vector<uint64_t>
CrowdfundView::campaigns_by_donor(Address const &donor) const
{
    auto const ids = state_.donated_by(donor);
    return std::vector<uint64_t>(ids.begin(), ids.end());
}

Result<DonorRecord>
CrowdfundView::donor_details(uint64_t const id, Address const &donor) const
{
    if (state_.find_campaign(id) == nullptr) {
        return CrowdfundError::CampaignNotFound;
    }
    return state_.donor_record(id, donor);
}

Result<std::vector<Address>> CrowdfundView::donors(uint64_t const id) const
{
    if (state_.find_campaign(id) == nullptr) {
        return CrowdfundError::CampaignNotFound;
    }
    auto const list = state_.donors(id);
    return std::vector<Address>(list.begin(), list.end());
}

Result<bool>
CrowdfundView::is_successful(uint64_t const id, uint64_t const now) const
{
    BOOST_OUTCOME_TRY(auto const campaign, get_campaign(id));
    return derive_status(campaign, state_.balance(id), now) ==
           CampaignStatus::Successful;
}

Result<bool>
CrowdfundView::is_failed(uint64_t const id, uint64_t const now) const
{
    BOOST_OUTCOME_TRY(auto const campaign, get_campaign(id));
    return derive_status(campaign, state_.balance(id), now) ==
           CampaignStatus::Failed;
}

Result<uint256_t> CrowdfundView::refundable_amount(
    uint64_t const id, Address const &donor, uint64_t const now) const
{
    BOOST_OUTCOME_TRY(auto const campaign, get_campaign(id));
    if (campaign.disputed ||
        campaign.funding_model != FundingModel::AllOrNothing ||
        derive_status(campaign, state_.balance(id), now) !=
            CampaignStatus::Failed) {
        return uint256_t{0};
    }
    if (now > campaign.end_time &&
        now - campaign.end_time > config_.refund_grace_period) {
        return uint256_t{0};
    }
    DonorRecord const record = state_.donor_record(id, donor);
    BOOST_OUTCOME_TRY(
        auto const net,
        net_of_fee(record.total_donated, campaign.fee_rate_bps));
    return checked_sub(net, record.refund_claimed);
}

Result<CampaignInfo>
CrowdfundView::all_info(uint64_t const id, uint64_t const now) const
{
    BOOST_OUTCOME_TRY(auto const campaign, get_campaign(id));
    BOOST_OUTCOME_TRY(auto const progress, funding_progress(id));
    BalanceLedger const balance = state_.balance(id);
    return CampaignInfo{
        .campaign = campaign,
        .balance = balance,
        .status = derive_status(campaign, balance, now),
        .progress_percent = progress,
        .donor_count = state_.donors(id).size()};
}

uint64_t CrowdfundView::latest_campaign_id() const
{
    return state_.latest_campaign_id();
}

uint64_t CrowdfundView::platform_fee_rate() const
{
    return state_.fee_rate_bps();
}

uint256_t CrowdfundView::collected_fees(Address const &token) const
{
    return state_.collected_fees(token);
}

Result<bool> CrowdfundView::is_conserved(uint64_t const id) const
{
    BOOST_OUTCOME_TRY(auto const balance, get_balance(id));
    return balance.is_conserved();
}

FUNDPOOL_NAMESPACE_END
