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

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <string>

FUNDPOOL_NAMESPACE_BEGIN

enum class FundingModel : uint8_t
{
    AllOrNothing = 0,
    KeepWhatYouRaise,
};

BOOST_DESCRIBE_ENUM(FundingModel, AllOrNothing, KeepWhatYouRaise)

enum class CampaignStatus : uint8_t
{
    Active = 0,
    Successful,
    Failed,
    Deleted,
};

BOOST_DESCRIBE_ENUM(CampaignStatus, Active, Successful, Failed, Deleted)

// creator-editable descriptive fields
struct CampaignMetadata
{
    std::string name;
    std::string description;
    std::string url;
    std::string image_url;

    bool operator==(CampaignMetadata const &) const = default;
};

// everything create_campaign needs besides the caller
struct CampaignParams
{
    uint64_t start_time;
    uint64_t end_time;
    CampaignMetadata metadata;
    uint256_t funding_goal;
    FundingModel funding_model;
    Address token;
};

struct Campaign
{
    uint64_t id{0};
    Address creator{};
    Address token{};
    CampaignMetadata metadata{};
    uint64_t start_time{0};
    uint64_t end_time{0};
    uint256_t funding_goal{0};
    FundingModel funding_model{FundingModel::AllOrNothing};
    CampaignStatus status{CampaignStatus::Active};
    // frozen at creation; later changes to the global rate never apply
    uint64_t fee_rate_bps{0};
    bool disputed{false};

    bool operator==(Campaign const &) const = default;
};

// Running totals of one campaign. Conservation:
//   total_donations == withdrawable_balance + fee_collected
//                      + fee_outstanding() + total_refunded + total_withdrawn
struct BalanceLedger
{
    uint256_t total_donations{0};
    uint256_t fee_accrued{0};
    uint256_t fee_collected{0};
    uint256_t withdrawable_balance{0};
    uint256_t total_refunded{0};
    uint256_t total_withdrawn{0};

    bool operator==(BalanceLedger const &) const = default;

    Result<uint256_t> fee_outstanding() const;

    bool is_conserved() const;
};

struct DonorRecord
{
    uint256_t total_donated{0};
    uint256_t refund_claimed{0};

    bool operator==(DonorRecord const &) const = default;
};

FUNDPOOL_NAMESPACE_END
