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

#include <fundpool/core/address.hpp>
#include <fundpool/core/int.hpp>
#include <fundpool/ledger/campaign.hpp>
#include <fundpool/ledger/event.hpp>
#include <fundpool/ledger/ledger_state.hpp>

#include <evmc/evmc.hpp>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

using namespace fundpool;
using namespace evmc::literals;
using namespace intx::literals;

namespace
{
    constexpr auto CREATOR = 0xc4ea702_address;
    constexpr auto DONOR = 0xd0404_address;
    constexpr auto TOKEN = 0x70ce4_address;

    Campaign make_campaign(uint64_t const id)
    {
        return Campaign{
            .id = id,
            .creator = CREATOR,
            .token = TOKEN,
            .start_time = 0,
            .end_time = 86'400,
            .funding_goal = 1000,
            .fee_rate_bps = 100};
    }
}

struct LedgerStateTest : public ::testing::Test
{
    LedgerState state{100};

    uint64_t add_campaign()
    {
        uint64_t const id = state.next_campaign_id();
        state.set_campaign(make_campaign(id));
        return id;
    }
};

TEST_F(LedgerStateTest, campaign_ids_start_at_one)
{
    EXPECT_EQ(state.latest_campaign_id(), 0);
    EXPECT_EQ(add_campaign(), 1);
    EXPECT_EQ(add_campaign(), 2);
    EXPECT_EQ(state.latest_campaign_id(), 2);
    EXPECT_EQ(state.find_campaign(3), nullptr);
    ASSERT_NE(state.find_campaign(2), nullptr);
    EXPECT_EQ(state.find_campaign(2)->creator, CREATOR);
}

TEST_F(LedgerStateTest, records_default_to_zero)
{
    uint64_t const id = add_campaign();
    EXPECT_EQ(state.balance(id), BalanceLedger{});
    EXPECT_FALSE(state.has_donor_record(id, DONOR));
    EXPECT_EQ(state.donor_record(id, DONOR), DonorRecord{});
    EXPECT_TRUE(state.donors(id).empty());
    EXPECT_TRUE(state.created_by(CREATOR).empty());
    EXPECT_EQ(state.collected_fees(TOKEN), 0);
}

TEST_F(LedgerStateTest, donor_indexes)
{
    uint64_t const first = add_campaign();
    uint64_t const second = add_campaign();
    state.add_donor(first, DONOR);
    state.add_donor(second, DONOR);
    state.add_donor(first, 0xd0405_address);

    auto const donors = state.donors(first);
    ASSERT_EQ(donors.size(), 2);
    EXPECT_EQ(donors[0], DONOR);
    EXPECT_EQ(donors[1], 0xd0405_address);

    auto const donated = state.donated_by(DONOR);
    ASSERT_EQ(donated.size(), 2);
    EXPECT_EQ(donated[0], first);
    EXPECT_EQ(donated[1], second);
}

TEST_F(LedgerStateTest, reject_restores_everything)
{
    uint64_t const id = add_campaign();
    state.set_balance(id, BalanceLedger{.total_donations = 10});
    state.store_log(Event{.type = EventType::CampaignCreated});

    state.push();
    EXPECT_EQ(state.depth(), 1);
    uint64_t const other = add_campaign();
    state.set_balance(id, BalanceLedger{.total_donations = 20});
    state.set_donor_record(id, DONOR, DonorRecord{.total_donated = 20});
    state.add_donor(id, DONOR);
    state.add_created(CREATOR, other);
    state.add_token_campaign(TOKEN, other);
    state.set_collected_fees(TOKEN, 5);
    state.set_fee_rate_bps(250);
    state.store_log(Event{.type = EventType::DonationReceived});
    state.pop_reject();

    EXPECT_EQ(state.depth(), 0);
    EXPECT_EQ(state.latest_campaign_id(), id);
    EXPECT_EQ(state.find_campaign(other), nullptr);
    EXPECT_EQ(state.balance(id).total_donations, 10);
    EXPECT_FALSE(state.has_donor_record(id, DONOR));
    EXPECT_TRUE(state.donors(id).empty());
    EXPECT_TRUE(state.created_by(CREATOR).empty());
    EXPECT_TRUE(state.campaigns_of_token(TOKEN).empty());
    EXPECT_EQ(state.collected_fees(TOKEN), 0);
    EXPECT_EQ(state.fee_rate_bps(), 100);
    ASSERT_EQ(state.logs().size(), 1);
    EXPECT_EQ(state.logs()[0].type, EventType::CampaignCreated);
}

TEST_F(LedgerStateTest, accept_keeps_changes)
{
    uint64_t const id = add_campaign();
    state.push();
    state.set_balance(id, BalanceLedger{.total_donations = 20});
    state.store_log(Event{.type = EventType::DonationReceived});
    state.pop_accept();

    EXPECT_EQ(state.depth(), 0);
    EXPECT_EQ(state.balance(id).total_donations, 20);
    EXPECT_EQ(state.logs().size(), 1);
}

TEST_F(LedgerStateTest, nested_versions)
{
    uint64_t const id = add_campaign();
    state.push();
    state.set_balance(id, BalanceLedger{.total_donations = 1});
    state.push();
    state.set_balance(id, BalanceLedger{.total_donations = 2});
    state.pop_reject();
    EXPECT_EQ(state.balance(id).total_donations, 1);
    state.pop_accept();
    EXPECT_EQ(state.balance(id).total_donations, 1);
}
