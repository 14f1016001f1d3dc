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
#include <fundpool/core/result.hpp>
#include <fundpool/ledger/campaign.hpp>
#include <fundpool/ledger/ledger_state.hpp>

#include <cstdint>

FUNDPOOL_NAMESPACE_BEGIN

inline bool has_started(Campaign const &campaign, uint64_t const now)
{
    return now >= campaign.start_time;
}

// the end time itself is already outside the funding window
inline bool has_ended(Campaign const &campaign, uint64_t const now)
{
    return now >= campaign.end_time;
}

// Status the campaign is in at `now`. Terminal statuses never change; an
// Active campaign becomes Successful as soon as its goal is met and an
// AllOrNothing campaign that ended under goal becomes Failed.
CampaignStatus derive_status(
    Campaign const &, BalanceLedger const &, uint64_t now);

// Persists derive_status for campaign `id`, emitting StatusChanged (and
// GoalReached on success) when the status moves. Returns the stored status.
CampaignStatus evaluate_status(LedgerState &, uint64_t id, uint64_t now);

// Checks whether the creator may drain the withdrawable balance at `now`.
Result<void> authorize_withdrawal(
    Campaign const &, CampaignStatus, uint64_t now);

FUNDPOOL_NAMESPACE_END
