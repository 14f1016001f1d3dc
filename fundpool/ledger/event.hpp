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

#include <boost/describe/enum.hpp>

#include <cstdint>

FUNDPOOL_NAMESPACE_BEGIN

enum class EventType : uint8_t
{
    CampaignCreated = 0,
    CampaignDetailsUpdated,
    EndTimeChanged,
    CampaignCancelled,
    DonationReceived,
    GoalReached,
    StatusChanged,
    RefundClaimed,
    FundsWithdrawn,
    CampaignDisputed,
    DisputeResolved,
    Paused,
    Unpaused,
    PlatformFeeRateChanged,
    PlatformFeesCollected,
    EmergencyWithdrawal,
};

BOOST_DESCRIBE_ENUM(
    EventType, CampaignCreated, CampaignDetailsUpdated, EndTimeChanged,
    CampaignCancelled, DonationReceived, GoalReached, StatusChanged,
    RefundClaimed, FundsWithdrawn, CampaignDisputed, DisputeResolved, Paused,
    Unpaused, PlatformFeeRateChanged, PlatformFeesCollected,
    EmergencyWithdrawal)

// One emitted log entry. Fields that do not apply to an event type are left
// zero:
//   campaign_id  0 for ledger-wide events
//   account      creator, donor, admin or owner depending on the event
//   amount       token amount moved or accounted
//   value        new status, new end time, new fee rate or dispute outcome
struct Event
{
    EventType type;
    uint64_t campaign_id{0};
    Address account{};
    Address token{};
    uint256_t amount{0};
    uint64_t value{0};

    bool operator==(Event const &) const = default;
};

FUNDPOOL_NAMESPACE_END
