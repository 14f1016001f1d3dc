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

#include "../scenario.hpp"

#include <fundpool/ledger/config.hpp>

#include <nlohmann/json.hpp>

#include <fmt/format.h>

#include <cstddef>
#include <string>

#include <gtest/gtest.h>

using namespace fundpool;

namespace
{
    constexpr auto TOKEN = "0x00000000000000000000000000000000000070ce";
    constexpr auto OWNER = "0x00000000000000000000000000000000000e4e40";
    constexpr auto CREATOR = "0x000000000000000000000000000000000c4ea702";
    constexpr auto ALICE = "0x00000000000000000000000000000000000a11ce";

    nlohmann::json base_scenario()
    {
        return {
            {"owner", OWNER},
            {"tokens", {{TOKEN, {{ALICE, 5000}}}}},
            {"steps",
             {{{"op", "create_campaign"},
               {"sender", CREATOR},
               {"time", 100},
               {"start_time", 200},
               {"end_time", 200 + 2 * SECONDS_PER_DAY},
               {"name", "garden"},
               {"funding_goal", "1000"},
               {"funding_model", "AllOrNothing"},
               {"token", TOKEN},
               {"expect", "success"}},
              {{"op", "donate"},
               {"sender", ALICE},
               {"time", 300},
               {"campaign_id", 1},
               {"amount", 400},
               {"expect", "success"}},
              {{"op", "claim_refund"},
               {"sender", ALICE},
               {"time", 200 + 3 * SECONDS_PER_DAY},
               {"campaign_id", 1},
               {"expect", "success"}},
              {{"op", "claim_refund"},
               {"sender", ALICE},
               {"time", 200 + 3 * SECONDS_PER_DAY},
               {"campaign_id", 1},
               {"expect", "already refunded"}}}}};
    }
}

TEST(Scenario, parse)
{
    auto const scenario = try_parse_scenario(base_scenario());
    ASSERT_TRUE(scenario.has_value()) << scenario.error();
    EXPECT_TRUE(scenario->admins.empty());
    ASSERT_EQ(scenario->tokens.size(), 1);
    ASSERT_EQ(scenario->allocations.size(), 1);
    EXPECT_EQ(scenario->allocations[0].amount, 5000);
    ASSERT_EQ(scenario->steps.size(), 4);
    EXPECT_EQ(scenario->steps[0].op, ScenarioOp::CreateCampaign);
    EXPECT_EQ(scenario->steps[1].ctx.timestamp, 300);
    EXPECT_EQ(scenario->steps[3].expect.value(), "already refunded");
}

TEST(Scenario, parse_errors)
{
    auto unknown_op = base_scenario();
    unknown_op["steps"][0]["op"] = "launch";
    auto const res = try_parse_scenario(unknown_op);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), "unknown op `launch`");

    auto bad_address = base_scenario();
    bad_address["owner"] = "0xzz";
    EXPECT_FALSE(try_parse_scenario(bad_address).has_value());

    auto duplicate_holder = base_scenario();
    duplicate_holder["tokens"][TOKEN]
                    ["0x00000000000000000000000000000000000A11CE"] =
        "0xffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff";
    auto const duplicate = try_parse_scenario(duplicate_holder);
    ASSERT_FALSE(duplicate.has_value());
    EXPECT_EQ(
        duplicate.error(),
        fmt::format("duplicate allocation of token {} to {}", TOKEN, ALICE));

    auto no_steps = base_scenario();
    no_steps.erase("steps");
    EXPECT_FALSE(try_parse_scenario(no_steps).has_value());
}

TEST(Scenario, replay)
{
    auto const scenario = try_parse_scenario(base_scenario());
    ASSERT_TRUE(scenario.has_value()) << scenario.error();
    ScenarioRunner runner{scenario.value(), DEFAULT_LEDGER_CONFIG};
    for (size_t i = 0; i < scenario->steps.size(); ++i) {
        ASSERT_TRUE(runner.run_step(i, scenario->steps[i]).has_value());
    }

    EXPECT_EQ(runner.mismatches(), 0);
    ASSERT_EQ(runner.outcomes().size(), 4);
    EXPECT_EQ(runner.outcomes()[0].value, 1);
    EXPECT_EQ(runner.outcomes()[2].value, "396");

    auto const report = runner.report();
    ASSERT_EQ(report["campaigns"].size(), 1);
    auto const &campaign = report["campaigns"][0];
    EXPECT_EQ(campaign["status"], "Failed");
    EXPECT_EQ(campaign["balance"]["total_refunded"], "396");
    EXPECT_EQ(campaign["balance"]["fee_accrued"], "4");
    EXPECT_TRUE(campaign["balance"]["conserved"].get<bool>());
    EXPECT_EQ(report["custody_balances"][TOKEN], "4");
    EXPECT_EQ(report["platform_fee_rate_bps"], 100);
}

TEST(Scenario, mismatch_and_malformed_step)
{
    auto document = base_scenario();
    document["steps"][1]["expect"] = "campaign not active";
    document["steps"].push_back(
        {{"op", "donate"},
         {"sender", ALICE},
         {"time", 300},
         {"amount", 1}});
    auto const scenario = try_parse_scenario(document);
    ASSERT_TRUE(scenario.has_value()) << scenario.error();

    ScenarioRunner runner{scenario.value(), DEFAULT_LEDGER_CONFIG};
    for (size_t i = 0; i < 4; ++i) {
        ASSERT_TRUE(runner.run_step(i, scenario->steps[i]).has_value());
    }
    EXPECT_EQ(runner.mismatches(), 1);
    EXPECT_FALSE(runner.outcomes()[1].matched);
    EXPECT_EQ(runner.outcomes()[1].result, "success");

    EXPECT_FALSE(runner.run_step(4, scenario->steps[4]).has_value());
    EXPECT_EQ(runner.outcomes().size(), 4);
}
