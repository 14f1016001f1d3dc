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

#include "scenario.hpp"

#include <fundpool/core/assert.h>
#include <fundpool/core/fmt/address_fmt.hpp>
#include <fundpool/core/fmt/enum_fmt.hpp>
#include <fundpool/core/result.hpp>
#include <fundpool/ledger/campaign.hpp>
#include <fundpool/ledger/event.hpp>

#include <boost/describe/enum_from_string.hpp>

#include <evmc/evmc.hpp>

#include <intx/intx.hpp>

#include <nlohmann/json.hpp>

#include <quill/Quill.h>

#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>

FUNDPOOL_ANONYMOUS_NAMESPACE_BEGIN

std::unordered_map<std::string, ScenarioOp> const SCENARIO_OP_MAP = {
    {"create_campaign", ScenarioOp::CreateCampaign},
    {"update_campaign_details", ScenarioOp::UpdateCampaignDetails},
    {"change_end_time", ScenarioOp::ChangeEndTime},
    {"cancel_campaign", ScenarioOp::CancelCampaign},
    {"donate", ScenarioOp::Donate},
    {"claim_refund", ScenarioOp::ClaimRefund},
    {"withdraw_funds", ScenarioOp::WithdrawFunds},
    {"pause", ScenarioOp::Pause},
    {"unpause", ScenarioOp::Unpause},
    {"flag_campaign_as_disputed", ScenarioOp::FlagCampaignAsDisputed},
    {"resolve_dispute", ScenarioOp::ResolveDispute},
    {"set_platform_fee_rate", ScenarioOp::SetPlatformFeeRate},
    {"collect_platform_fees", ScenarioOp::CollectPlatformFees},
    {"emergency_withdraw", ScenarioOp::EmergencyWithdraw},
};

using namespace evmc::literals;

// the custody account used when a scenario does not name one
constexpr Address DEFAULT_CUSTODY{
    0xc0c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0_address};

Address address_from_json(nlohmann::json const &j)
{
    auto const address = evmc::from_hex<Address>(j.get<std::string>());
    if (!address.has_value()) {
        throw std::invalid_argument(
            fmt::format("invalid address {}", j.dump()));
    }
    return address.value();
}

Address address_from_string(std::string const &s)
{
    return address_from_json(nlohmann::json(s));
}

// amounts are decimal or 0x-prefixed strings, small ones may be numbers
uint256_t amount_from_json(nlohmann::json const &j)
{
    if (j.is_number_unsigned()) {
        return j.get<uint64_t>();
    }
    return intx::from_string<uint256_t>(j.get<std::string>());
}

FundingModel funding_model_from_json(nlohmann::json const &j)
{
    auto const name = j.get<std::string>();
    FundingModel model;
    if (!boost::describe::enum_from_string(name.c_str(), model)) {
        throw std::invalid_argument(
            fmt::format("invalid funding model {}", name));
    }
    return model;
}

CampaignMetadata metadata_from_json(nlohmann::json const &j)
{
    return CampaignMetadata{
        .name = j.value("name", std::string{}),
        .description = j.value("description", std::string{}),
        .url = j.value("url", std::string{}),
        .image_url = j.value("image_url", std::string{})};
}

nlohmann::json value_to_json(uint64_t const value)
{
    return value;
}

nlohmann::json value_to_json(uint256_t const &value)
{
    return intx::to_string(value);
}

template <class T>
StepOutcome make_outcome(
    size_t const index, ScenarioStep const &step, Result<T> const &res)
{
    StepOutcome step_outcome{
        .index = index,
        .op_name = step.op_name,
        .result = "success",
        .value = nullptr,
        .matched = true};
    if (res.has_error()) {
        step_outcome.result = res.assume_error().message().c_str();
    }
    else if constexpr (!std::is_void_v<T>) {
        step_outcome.value = value_to_json(res.assume_value());
    }
    if (step.expect.has_value()) {
        step_outcome.matched = step.expect.value() == step_outcome.result;
    }
    return step_outcome;
}

nlohmann::json event_to_json(Event const &event)
{
    return {
        {"type", fmt::format("{}", event.type)},
        {"campaign_id", event.campaign_id},
        {"account", fmt::format("{}", event.account)},
        {"token", fmt::format("{}", event.token)},
        {"amount", intx::to_string(event.amount)},
        {"value", event.value}};
}

nlohmann::json campaign_to_json(CampaignInfo const &info)
{
    Campaign const &campaign = info.campaign;
    BalanceLedger const &balance = info.balance;
    return {
        {"id", campaign.id},
        {"creator", fmt::format("{}", campaign.creator)},
        {"token", fmt::format("{}", campaign.token)},
        {"name", campaign.metadata.name},
        {"start_time", campaign.start_time},
        {"end_time", campaign.end_time},
        {"funding_goal", intx::to_string(campaign.funding_goal)},
        {"funding_model", fmt::format("{}", campaign.funding_model)},
        {"status", fmt::format("{}", campaign.status)},
        {"status_at_end", fmt::format("{}", info.status)},
        {"fee_rate_bps", campaign.fee_rate_bps},
        {"disputed", campaign.disputed},
        {"progress_percent", intx::to_string(info.progress_percent)},
        {"donor_count", info.donor_count},
        {"balance",
         {{"total_donations", intx::to_string(balance.total_donations)},
          {"fee_accrued", intx::to_string(balance.fee_accrued)},
          {"fee_collected", intx::to_string(balance.fee_collected)},
          {"withdrawable_balance",
           intx::to_string(balance.withdrawable_balance)},
          {"total_refunded", intx::to_string(balance.total_refunded)},
          {"total_withdrawn", intx::to_string(balance.total_withdrawn)},
          {"conserved", balance.is_conserved()}}}};
}

FUNDPOOL_ANONYMOUS_NAMESPACE_END

FUNDPOOL_NAMESPACE_BEGIN

std::expected<Scenario, std::string>
try_parse_scenario(nlohmann::json const &j)
{
    try {
        Scenario scenario{
            .owner = address_from_json(j.at("owner")),
            .admins = {},
            .custody = j.contains("custody")
                           ? address_from_json(j.at("custody"))
                           : DEFAULT_CUSTODY,
            .tokens = {},
            .allocations = {},
            .steps = {}};

        if (j.contains("admins")) {
            for (auto const &admin : j.at("admins")) {
                scenario.admins.push_back(address_from_json(admin));
            }
        }

        for (auto const &[token_string, holders] : j.at("tokens").items()) {
            Address const token = address_from_string(token_string);
            scenario.tokens.push_back(token);
            for (auto const &[holder_string, amount] : holders.items()) {
                Address const holder = address_from_string(holder_string);
                for (TokenAllocation const &allocation :
                     scenario.allocations) {
                    if (allocation.token == token &&
                        allocation.holder == holder) {
                        return std::unexpected(fmt::format(
                            "duplicate allocation of token {} to {}",
                            token,
                            holder));
                    }
                }
                scenario.allocations.push_back(TokenAllocation{
                    .token = token,
                    .holder = holder,
                    .amount = amount_from_json(amount)});
            }
        }

        for (auto const &step : j.at("steps")) {
            auto const op_name = step.at("op").get<std::string>();
            auto const it = SCENARIO_OP_MAP.find(op_name);
            if (it == SCENARIO_OP_MAP.end()) {
                return std::unexpected(
                    fmt::format("unknown op `{}`", op_name));
            }
            scenario.steps.push_back(ScenarioStep{
                .op = it->second,
                .op_name = op_name,
                .ctx =
                    CallContext{
                        .sender = address_from_json(step.at("sender")),
                        .timestamp = step.at("time").get<uint64_t>()},
                .args = step,
                .expect = step.contains("expect")
                              ? std::make_optional(
                                    step.at("expect").get<std::string>())
                              : std::nullopt});
        }
        return scenario;
    }
    catch (nlohmann::json::exception const &e) {
        return std::unexpected(std::string{e.what()});
    }
    catch (std::logic_error const &e) {
        return std::unexpected(std::string{e.what()});
    }
}

ScenarioRunner::ScenarioRunner(
    Scenario const &scenario, LedgerConfig const &config)
    : state_{config.default_fee_rate_bps}
    , access_{scenario.owner}
    , tokens_{}
    , contract_{state_, access_, tokens_, scenario.custody, config}
    , view_{state_, config}
    , token_list_{scenario.tokens}
{
    for (Address const &admin : scenario.admins) {
        access_.grant_admin(admin);
    }
    for (Address const &token : scenario.tokens) {
        tokens_.deploy(token);
    }
    for (TokenAllocation const &allocation : scenario.allocations) {
        // one allocation per (token, holder) onto a zero balance
        auto const res = tokens_.mint(
            allocation.token, allocation.holder, allocation.amount);
        FUNDPOOL_ASSERT(res.has_value());
    }
}

StepOutcome
ScenarioRunner::dispatch(size_t const index, ScenarioStep const &step)
{
    auto const &args = step.args;
    auto const &ctx = step.ctx;
    switch (step.op) {
    case ScenarioOp::CreateCampaign:
        return make_outcome(
            index,
            step,
            contract_.create_campaign(
                ctx,
                CampaignParams{
                    .start_time = args.at("start_time").get<uint64_t>(),
                    .end_time = args.at("end_time").get<uint64_t>(),
                    .metadata = metadata_from_json(args),
                    .funding_goal = amount_from_json(args.at("funding_goal")),
                    .funding_model =
                        funding_model_from_json(args.at("funding_model")),
                    .token = address_from_json(args.at("token"))}));
    case ScenarioOp::UpdateCampaignDetails:
        return make_outcome(
            index,
            step,
            contract_.update_campaign_details(
                ctx,
                args.at("campaign_id").get<uint64_t>(),
                metadata_from_json(args)));
    case ScenarioOp::ChangeEndTime:
        return make_outcome(
            index,
            step,
            contract_.change_end_time(
                ctx,
                args.at("campaign_id").get<uint64_t>(),
                args.at("end_time").get<uint64_t>()));
    case ScenarioOp::CancelCampaign:
        return make_outcome(
            index,
            step,
            contract_.cancel_campaign(
                ctx, args.at("campaign_id").get<uint64_t>()));
    case ScenarioOp::Donate:
        return make_outcome(
            index,
            step,
            contract_.donate(
                ctx,
                args.at("campaign_id").get<uint64_t>(),
                amount_from_json(args.at("amount"))));
    case ScenarioOp::ClaimRefund:
        return make_outcome(
            index,
            step,
            contract_.claim_refund(
                ctx, args.at("campaign_id").get<uint64_t>()));
    case ScenarioOp::WithdrawFunds:
        return make_outcome(
            index,
            step,
            contract_.withdraw_funds(
                ctx, args.at("campaign_id").get<uint64_t>()));
    case ScenarioOp::Pause:
        return make_outcome(index, step, contract_.pause(ctx));
    case ScenarioOp::Unpause:
        return make_outcome(index, step, contract_.unpause(ctx));
    case ScenarioOp::FlagCampaignAsDisputed:
        return make_outcome(
            index,
            step,
            contract_.flag_campaign_as_disputed(
                ctx, args.at("campaign_id").get<uint64_t>()));
    case ScenarioOp::ResolveDispute:
        return make_outcome(
            index,
            step,
            contract_.resolve_dispute(
                ctx,
                args.at("campaign_id").get<uint64_t>(),
                args.at("favor_creator").get<bool>()));
    case ScenarioOp::SetPlatformFeeRate:
        return make_outcome(
            index,
            step,
            contract_.set_platform_fee_rate(
                ctx, args.at("rate_bps").get<uint64_t>()));
    case ScenarioOp::CollectPlatformFees:
        return make_outcome(
            index,
            step,
            contract_.collect_platform_fees(
                ctx, address_from_json(args.at("token"))));
    case ScenarioOp::EmergencyWithdraw:
        return make_outcome(
            index,
            step,
            contract_.emergency_withdraw(
                ctx,
                address_from_json(args.at("token")),
                amount_from_json(args.at("amount"))));
    }
    FUNDPOOL_ASSERT(false);
}

std::expected<StepOutcome, std::string>
ScenarioRunner::run_step(size_t const index, ScenarioStep const &step)
{
    try {
        StepOutcome step_outcome = dispatch(index, step);
        last_timestamp_ = std::max(last_timestamp_, step.ctx.timestamp);
        LOG_INFO(
            "step {} {} by {} at {}: {}",
            index,
            step.op_name,
            fmt::format("{}", step.ctx.sender),
            step.ctx.timestamp,
            step_outcome.result);
        if (!step_outcome.matched) {
            LOG_ERROR(
                "step {} {} expected `{}` got `{}`",
                index,
                step.op_name,
                step.expect.value(),
                step_outcome.result);
        }
        outcomes_.push_back(step_outcome);
        return step_outcome;
    }
    catch (nlohmann::json::exception const &e) {
        return std::unexpected(
            fmt::format("step {} {}: {}", index, step.op_name, e.what()));
    }
    catch (std::logic_error const &e) {
        return std::unexpected(
            fmt::format("step {} {}: {}", index, step.op_name, e.what()));
    }
}

size_t ScenarioRunner::mismatches() const
{
    size_t n = 0;
    for (StepOutcome const &step_outcome : outcomes_) {
        if (!step_outcome.matched) {
            ++n;
        }
    }
    return n;
}

nlohmann::json ScenarioRunner::report() const
{
    nlohmann::json steps = nlohmann::json::array();
    for (StepOutcome const &step_outcome : outcomes_) {
        steps.push_back(
            {{"index", step_outcome.index},
             {"op", step_outcome.op_name},
             {"result", step_outcome.result},
             {"value", step_outcome.value},
             {"matched", step_outcome.matched}});
    }

    nlohmann::json campaigns = nlohmann::json::array();
    for (uint64_t id = 1; id <= view_.latest_campaign_id(); ++id) {
        auto const info = view_.all_info(id, last_timestamp_);
        FUNDPOOL_ASSERT(info.has_value());
        campaigns.push_back(campaign_to_json(info.value()));
    }

    nlohmann::json events = nlohmann::json::array();
    for (Event const &event : state_.logs()) {
        events.push_back(event_to_json(event));
    }

    nlohmann::json custody = nlohmann::json::object();
    nlohmann::json collected = nlohmann::json::object();
    for (Address const &token : token_list_) {
        auto const key = fmt::format("{}", token);
        custody[key] =
            intx::to_string(tokens_.balance_of(token, contract_.custody()));
        collected[key] = intx::to_string(view_.collected_fees(token));
    }

    return {
        {"steps", std::move(steps)},
        {"campaigns", std::move(campaigns)},
        {"events", std::move(events)},
        {"custody_balances", std::move(custody)},
        {"collected_fees", std::move(collected)},
        {"platform_fee_rate_bps", view_.platform_fee_rate()}};
}

FUNDPOOL_NAMESPACE_END
