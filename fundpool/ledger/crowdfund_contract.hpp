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
#include <fundpool/ledger/host.hpp>
#include <fundpool/ledger/ledger_state.hpp>

#include <cstdint>
#include <mutex>

FUNDPOOL_NAMESPACE_BEGIN

struct CallContext
{
    Address sender;
    uint64_t timestamp;
};

// Mutating entry points of the crowdfunding ledger. Every call runs as one
// transaction over the ledger state: it either fully applies or leaves state
// and logs untouched. Entry points are serialized by an internal mutex; the
// state, access control and token host must not be mutated elsewhere while
// the contract is shared between threads.
class CrowdfundContract
{
    LedgerState &state_;
    AccessControl &access_;
    TokenHost &tokens_;
    Address custody_;
    LedgerConfig config_;
    std::mutex mutex_;

    template <class F>
    auto transact(char const *op, uint64_t id, CallContext const &, F &&);

    Result<void> require_not_paused() const;
    Result<void> require_admin(Address const &) const;
    Result<Campaign> load_campaign(uint64_t id) const;
    Result<Campaign> load_creator_campaign(
        uint64_t id, CallContext const &) const;
    Result<void> check_duration(uint64_t start_time, uint64_t end_time) const;

public:
    CrowdfundContract(
        LedgerState &, AccessControl &, TokenHost &, Address const &custody,
        LedgerConfig const & = DEFAULT_LEDGER_CONFIG);

    LedgerConfig const &config() const noexcept
    {
        return config_;
    }

    Address const &custody() const noexcept
    {
        return custody_;
    }

    //
    // Creator
    //

    Result<uint64_t>
    create_campaign(CallContext const &, CampaignParams const &);

    Result<void> update_campaign_details(
        CallContext const &, uint64_t id, CampaignMetadata const &);

    Result<void> change_end_time(
        CallContext const &, uint64_t id, uint64_t new_end_time);

    Result<void> cancel_campaign(CallContext const &, uint64_t id);

    Result<uint256_t> withdraw_funds(CallContext const &, uint64_t id);

    //
    // Donor
    //

    Result<void>
    donate(CallContext const &, uint64_t id, uint256_t const &amount);

    Result<uint256_t> claim_refund(CallContext const &, uint64_t id);

    //
    // Administration
    //

    Result<void> pause(CallContext const &);
    Result<void> unpause(CallContext const &);

    Result<void> flag_campaign_as_disputed(CallContext const &, uint64_t id);

    Result<void>
    resolve_dispute(CallContext const &, uint64_t id, bool favor_creator);

    Result<void> set_platform_fee_rate(CallContext const &, uint64_t rate_bps);

    Result<uint256_t>
    collect_platform_fees(CallContext const &, Address const &token);

    Result<void> emergency_withdraw(
        CallContext const &, Address const &token, uint256_t const &amount);
};

FUNDPOOL_NAMESPACE_END
