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

#include <fundpool/core/address.hpp>
#include <fundpool/core/config.hpp>
#include <fundpool/core/int.hpp>
#include <fundpool/core/result.hpp>
#include <fundpool/ledger/campaign.hpp>
#include <fundpool/ledger/config.hpp>
#include <fundpool/ledger/ledger_state.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

FUNDPOOL_NAMESPACE_BEGIN

struct CampaignInfo
{
    Campaign campaign;
    BalanceLedger balance;
    // status as of the query time, which may be ahead of the stored one
    CampaignStatus status;
    uint256_t progress_percent;
    size_t donor_count;
};

// Read-only queries over the ledger state. Time-dependent answers are
// derived for the given time without persisting anything.
class CrowdfundView
{
    LedgerState const &state_;
    LedgerConfig config_;

public:
    explicit CrowdfundView(
        LedgerState const &, LedgerConfig const & = DEFAULT_LEDGER_CONFIG);

    Result<Campaign> get_campaign(uint64_t id) const;
    Result<BalanceLedger> get_balance(uint64_t id) const;

    // total_donations * 100 / funding_goal, 0 when the goal is 0
    Result<uint256_t> funding_progress(uint64_t id) const;

    std::vector<uint64_t> campaigns_by_creator(Address const &) const;
    std::vector<uint64_t> campaigns_by_donor(Address const &) const;

    Result<DonorRecord> donor_details(uint64_t id, Address const &) const;
    Result<std::vector<Address>> donors(uint64_t id) const;

    Result<bool> is_successful(uint64_t id, uint64_t now) const;
    Result<bool> is_failed(uint64_t id, uint64_t now) const;

    // what claim_refund would pay `donor` at `now`, 0 if it would fail
    Result<uint256_t>
    refundable_amount(uint64_t id, Address const &donor, uint64_t now) const;

    Result<CampaignInfo> all_info(uint64_t id, uint64_t now) const;

    uint64_t latest_campaign_id() const;
    uint64_t platform_fee_rate() const;
    uint256_t collected_fees(Address const &token) const;

    Result<bool> is_conserved(uint64_t id) const;
};

FUNDPOOL_NAMESPACE_END
