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
#include <fundpool/ledger/fee_sweep.hpp>
#include <fundpool/ledger/ledger_state.hpp>

#include <evmc/evmc.hpp>

#include <cstdint>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

using namespace fundpool;
using namespace evmc::literals;
using namespace intx::literals;

namespace
{
    constexpr auto TOKEN = 0x70ce4_address;
    constexpr auto OTHER_TOKEN = 0x70ce5_address;
}

struct FeeSweep : public ::testing::Test
{
    LedgerState state{100};

    uint64_t add(Address const &token, BalanceLedger const &balance)
    {
        uint64_t const id = state.next_campaign_id();
        state.set_campaign(Campaign{.id = id, .token = token});
        state.set_balance(id, balance);
        state.add_token_campaign(token, id);
        return id;
    }
};

TEST_F(FeeSweep, sweeps_only_outstanding_fees_of_token)
{
    uint64_t const partly = add(
        TOKEN,
        BalanceLedger{
            .total_donations = 1000,
            .fee_accrued = 10,
            .fee_collected = 4,
            .withdrawable_balance = 990});
    uint64_t const fresh = add(
        TOKEN,
        BalanceLedger{
            .total_donations = 500,
            .fee_accrued = 5,
            .withdrawable_balance = 495});
    uint64_t const other = add(
        OTHER_TOKEN,
        BalanceLedger{
            .total_donations = 100,
            .fee_accrued = 1,
            .withdrawable_balance = 99});
    state.set_collected_fees(TOKEN, 4);

    auto const swept = sweep_outstanding_fees(state, TOKEN);
    ASSERT_FALSE(swept.has_error());
    EXPECT_EQ(swept.value(), 11);
    EXPECT_EQ(state.collected_fees(TOKEN), 15);
    EXPECT_EQ(state.collected_fees(OTHER_TOKEN), 0);
    EXPECT_EQ(state.balance(partly).fee_collected, 10);
    EXPECT_EQ(state.balance(fresh).fee_collected, 5);
    EXPECT_EQ(state.balance(other).fee_collected, 0);
    EXPECT_TRUE(state.balance(partly).is_conserved());

    auto const again = sweep_outstanding_fees(state, TOKEN);
    ASSERT_FALSE(again.has_error());
    EXPECT_EQ(again.value(), 0);
    EXPECT_EQ(state.collected_fees(TOKEN), 15);
}

TEST_F(FeeSweep, unknown_token)
{
    auto const swept = sweep_outstanding_fees(state, 0xabc_address);
    ASSERT_FALSE(swept.has_error());
    EXPECT_EQ(swept.value(), 0);
}
