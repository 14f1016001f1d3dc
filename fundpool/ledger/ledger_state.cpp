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
#include <fundpool/ledger/ledger_state.hpp>

#include <utility>

FUNDPOOL_NAMESPACE_BEGIN

namespace
{
    template <class Map, class Key>
    typename Map::mapped_type
    get_or_default(Map const &map, Key const &key)
    {
        if (auto const *const value = map.find(key); value != nullptr) {
            return *value;
        }
        return typename Map::mapped_type{};
    }
}

LedgerState::LedgerState(uint64_t const fee_rate_bps)
{
    current_.fee_rate_bps = fee_rate_bps;
}

void LedgerState::push()
{
    stack_.push_back(current_);
}

void LedgerState::pop_accept()
{
    FUNDPOOL_ASSERT(!stack_.empty());
    stack_.pop_back();
}

void LedgerState::pop_reject()
{
    FUNDPOOL_ASSERT(!stack_.empty());
    current_ = std::move(stack_.back());
    stack_.pop_back();
}

uint64_t LedgerState::next_campaign_id()
{
    current_.latest_campaign_id += 1;
    return current_.latest_campaign_id;
}

void LedgerState::set_fee_rate_bps(uint64_t const fee_rate_bps)
{
    current_.fee_rate_bps = fee_rate_bps;
}

Campaign const *LedgerState::find_campaign(uint64_t const id) const
{
    return current_.campaigns.find(id);
}

void LedgerState::set_campaign(Campaign const &campaign)
{
    FUNDPOOL_ASSERT(
        campaign.id != 0 && campaign.id <= current_.latest_campaign_id);
    current_.campaigns = current_.campaigns.set(campaign.id, campaign);
}

BalanceLedger LedgerState::balance(uint64_t const id) const
{
    return get_or_default(current_.balances, id);
}

void LedgerState::set_balance(uint64_t const id, BalanceLedger const &balance)
{
    current_.balances = current_.balances.set(id, balance);
}

LedgerState::AddressList LedgerState::donors(uint64_t const id) const
{
    return get_or_default(current_.donors, id);
}

bool LedgerState::has_donor_record(
    uint64_t const id, Address const &donor) const
{
    return current_.donor_records.count(DonorKey{id, donor}) != 0;
}

DonorRecord
LedgerState::donor_record(uint64_t const id, Address const &donor) const
{
    return get_or_default(current_.donor_records, DonorKey{id, donor});
}

void LedgerState::set_donor_record(
    uint64_t const id, Address const &donor, DonorRecord const &record)
{
    current_.donor_records =
        current_.donor_records.set(DonorKey{id, donor}, record);
}

void LedgerState::add_donor(uint64_t const id, Address const &donor)
{
    current_.donors = current_.donors.set(id, donors(id).push_back(donor));
    current_.donated =
        current_.donated.set(donor, donated_by(donor).push_back(id));
}

LedgerState::IdList LedgerState::created_by(Address const &creator) const
{
    return get_or_default(current_.created, creator);
}

void LedgerState::add_created(Address const &creator, uint64_t const id)
{
    current_.created =
        current_.created.set(creator, created_by(creator).push_back(id));
}

LedgerState::IdList LedgerState::donated_by(Address const &donor) const
{
    return get_or_default(current_.donated, donor);
}

LedgerState::IdList LedgerState::campaigns_of_token(Address const &token) const
{
    return get_or_default(current_.token_campaigns, token);
}

void LedgerState::add_token_campaign(Address const &token, uint64_t const id)
{
    current_.token_campaigns = current_.token_campaigns.set(
        token, campaigns_of_token(token).push_back(id));
}

uint256_t LedgerState::collected_fees(Address const &token) const
{
    return get_or_default(current_.collected_fees, token);
}

void LedgerState::set_collected_fees(
    Address const &token, uint256_t const &amount)
{
    current_.collected_fees = current_.collected_fees.set(token, amount);
}

void LedgerState::store_log(Event const &event)
{
    current_.logs = current_.logs.push_back(event);
}

FUNDPOOL_NAMESPACE_END
