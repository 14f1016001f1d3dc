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
#include <fundpool/core/checked_math.hpp>
#include <fundpool/core/fmt/address_fmt.hpp>
#include <fundpool/core/likely.h>
#include <fundpool/ledger/crowdfund_contract.hpp>
#include <fundpool/ledger/crowdfund_error.hpp>
#include <fundpool/ledger/event.hpp>
#include <fundpool/ledger/fee.hpp>
#include <fundpool/ledger/fee_sweep.hpp>
#include <fundpool/ledger/lifecycle.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <intx/intx.hpp>

#include <quill/Quill.h>

#include <cstdint>
#include <mutex>
#include <string>
#include <utility>

FUNDPOOL_ANONYMOUS_NAMESPACE_BEGIN

std::string to_hex(Address const &address)
{
    return fmt::format("{}", address);
}

FUNDPOOL_ANONYMOUS_NAMESPACE_END

FUNDPOOL_NAMESPACE_BEGIN

CrowdfundContract::CrowdfundContract(
    LedgerState &state, AccessControl &access, TokenHost &tokens,
    Address const &custody, LedgerConfig const &config)
    : state_{state}
    , access_{access}
    , tokens_{tokens}
    , custody_{custody}
    , config_{config}
{
    FUNDPOOL_ASSERT(is_valid(config_));
}

template <class F>
auto CrowdfundContract::transact(
    char const *const op, uint64_t const id, CallContext const &ctx, F &&f)
{
    std::lock_guard<std::mutex> const lock{mutex_};
    state_.push();
    auto res = std::forward<F>(f)();
    if (FUNDPOOL_UNLIKELY(res.has_error())) {
        state_.pop_reject();
        LOG_DEBUG(
            "{} rejected: campaign={} sender={} time={}: {}",
            op,
            id,
            to_hex(ctx.sender),
            ctx.timestamp,
            res.assume_error().message().c_str());
    }
    else {
        state_.pop_accept();
    }
    return res;
}

Result<void> CrowdfundContract::require_not_paused() const
{
    if (FUNDPOOL_UNLIKELY(access_.is_paused())) {
        return CrowdfundError::SystemPaused;
    }
    return outcome::success();
}

Result<void> CrowdfundContract::require_admin(Address const &account) const
{
    if (FUNDPOOL_UNLIKELY(!access_.is_admin(account))) {
        return CrowdfundError::NotAdmin;
    }
    return outcome::success();
}

Result<Campaign> CrowdfundContract::load_campaign(uint64_t const id) const
{
    Campaign const *const campaign = state_.find_campaign(id);
    if (FUNDPOOL_UNLIKELY(campaign == nullptr)) {
        return CrowdfundError::CampaignNotFound;
    }
    return *campaign;
}

Result<Campaign> CrowdfundContract::load_creator_campaign(
    uint64_t const id, CallContext const &ctx) const
{
    BOOST_OUTCOME_TRY(auto campaign, load_campaign(id));
    if (FUNDPOOL_UNLIKELY(campaign.creator != ctx.sender)) {
        return CrowdfundError::NotCampaignCreator;
    }
    return campaign;
}

Result<void> CrowdfundContract::check_duration(
    uint64_t const start_time, uint64_t const end_time) const
{
    if (FUNDPOOL_UNLIKELY(start_time >= end_time)) {
        return CrowdfundError::InvalidTimeframe;
    }
    uint64_t const duration = end_time - start_time;
    if (FUNDPOOL_UNLIKELY(
            duration < config_.min_funding_period ||
            duration > config_.max_funding_period)) {
        LOG_DEBUG(
            "funding period {} outside [{}, {}]",
            duration,
            config_.min_funding_period,
            config_.max_funding_period);
        return CrowdfundError::InvalidFundingPeriod;
    }
    return outcome::success();
}

Result<uint64_t> CrowdfundContract::create_campaign(
    CallContext const &ctx, CampaignParams const &params)
{
    return transact("create_campaign", 0, ctx, [&]() -> Result<uint64_t> {
        BOOST_OUTCOME_TRY(require_not_paused());
        BOOST_OUTCOME_TRY(check_duration(params.start_time, params.end_time));
        if (FUNDPOOL_UNLIKELY(params.funding_goal < config_.min_funding_goal)) {
            LOG_DEBUG(
                "funding goal {} below minimum {}",
                intx::to_string(params.funding_goal),
                intx::to_string(config_.min_funding_goal));
            return CrowdfundError::FundingGoalTooLow;
        }
        if (FUNDPOOL_UNLIKELY(!tokens_.is_contract(params.token))) {
            return CrowdfundError::InvalidToken;
        }

        uint64_t const id = state_.next_campaign_id();
        state_.set_campaign(Campaign{
            .id = id,
            .creator = ctx.sender,
            .token = params.token,
            .metadata = params.metadata,
            .start_time = params.start_time,
            .end_time = params.end_time,
            .funding_goal = params.funding_goal,
            .funding_model = params.funding_model,
            .status = CampaignStatus::Active,
            .fee_rate_bps = state_.fee_rate_bps(),
            .disputed = false});
        state_.set_balance(id, BalanceLedger{});
        state_.add_created(ctx.sender, id);
        state_.add_token_campaign(params.token, id);
        state_.store_log(Event{
            .type = EventType::CampaignCreated,
            .campaign_id = id,
            .account = ctx.sender,
            .token = params.token,
            .amount = params.funding_goal,
            .value = static_cast<uint64_t>(params.funding_model)});
        return id;
    });
}

Result<void> CrowdfundContract::update_campaign_details(
    CallContext const &ctx, uint64_t const id,
    CampaignMetadata const &metadata)
{
    return transact("update_campaign_details", id, ctx, [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(require_not_paused());
        BOOST_OUTCOME_TRY(auto const loaded, load_creator_campaign(id, ctx));
        if (FUNDPOOL_UNLIKELY(loaded.disputed)) {
            return CrowdfundError::CampaignDisputed;
        }
        if (evaluate_status(state_, id, ctx.timestamp) !=
            CampaignStatus::Active) {
            return CrowdfundError::CampaignNotActive;
        }

        Campaign campaign = loaded;
        campaign.metadata = metadata;
        state_.set_campaign(campaign);
        state_.store_log(Event{
            .type = EventType::CampaignDetailsUpdated,
            .campaign_id = id,
            .account = ctx.sender});
        return outcome::success();
    });
}

Result<void> CrowdfundContract::change_end_time(
    CallContext const &ctx, uint64_t const id, uint64_t const new_end_time)
{
    return transact("change_end_time", id, ctx, [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(require_not_paused());
        BOOST_OUTCOME_TRY(auto const loaded, load_creator_campaign(id, ctx));
        if (FUNDPOOL_UNLIKELY(loaded.disputed)) {
            return CrowdfundError::CampaignDisputed;
        }
        if (evaluate_status(state_, id, ctx.timestamp) !=
            CampaignStatus::Active) {
            return CrowdfundError::CampaignNotActive;
        }
        if (FUNDPOOL_UNLIKELY(new_end_time <= ctx.timestamp)) {
            LOG_DEBUG(
                "end time {} not after current time {}",
                new_end_time,
                ctx.timestamp);
            return CrowdfundError::InvalidEndTime;
        }
        BOOST_OUTCOME_TRY(check_duration(loaded.start_time, new_end_time));

        Campaign campaign = loaded;
        campaign.end_time = new_end_time;
        state_.set_campaign(campaign);
        state_.store_log(Event{
            .type = EventType::EndTimeChanged,
            .campaign_id = id,
            .account = ctx.sender,
            .value = new_end_time});
        return outcome::success();
    });
}

Result<void>
CrowdfundContract::cancel_campaign(CallContext const &ctx, uint64_t const id)
{
    return transact("cancel_campaign", id, ctx, [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(require_not_paused());
        BOOST_OUTCOME_TRY(auto const loaded, load_creator_campaign(id, ctx));
        if (evaluate_status(state_, id, ctx.timestamp) !=
            CampaignStatus::Active) {
            return CrowdfundError::CampaignNotActive;
        }
        if (FUNDPOOL_UNLIKELY(state_.balance(id).total_donations != 0)) {
            return CrowdfundError::DonationsReceived;
        }

        Campaign campaign = loaded;
        campaign.status = CampaignStatus::Deleted;
        state_.set_campaign(campaign);
        state_.store_log(Event{
            .type = EventType::CampaignCancelled,
            .campaign_id = id,
            .account = ctx.sender});
        return outcome::success();
    });
}

Result<void> CrowdfundContract::donate(
    CallContext const &ctx, uint64_t const id, uint256_t const &amount)
{
    return transact("donate", id, ctx, [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(require_not_paused());
        BOOST_OUTCOME_TRY(auto const campaign, load_campaign(id));
        if (FUNDPOOL_UNLIKELY(campaign.disputed)) {
            return CrowdfundError::CampaignDisputed;
        }
        if (FUNDPOOL_UNLIKELY(amount == 0)) {
            return CrowdfundError::InvalidAmount;
        }
        if (evaluate_status(state_, id, ctx.timestamp) !=
            CampaignStatus::Active) {
            return CrowdfundError::CampaignNotActive;
        }
        if (FUNDPOOL_UNLIKELY(!has_started(campaign, ctx.timestamp))) {
            LOG_DEBUG(
                "donation at {} before start {}",
                ctx.timestamp,
                campaign.start_time);
            return CrowdfundError::CampaignNotStarted;
        }
        if (FUNDPOOL_UNLIKELY(has_ended(campaign, ctx.timestamp))) {
            LOG_DEBUG(
                "donation at {} after end {}",
                ctx.timestamp,
                campaign.end_time);
            return CrowdfundError::CampaignEnded;
        }

        BOOST_OUTCOME_TRY(
            auto const fee, fee_of(amount, campaign.fee_rate_bps));
        BOOST_OUTCOME_TRY(auto const net, checked_sub(amount, fee));

        BalanceLedger balance = state_.balance(id);
        BOOST_OUTCOME_TRY(
            auto const total_donations,
            checked_add(balance.total_donations, amount));
        BOOST_OUTCOME_TRY(
            auto const fee_accrued, checked_add(balance.fee_accrued, fee));
        BOOST_OUTCOME_TRY(
            auto const withdrawable,
            checked_add(balance.withdrawable_balance, net));
        balance.total_donations = total_donations;
        balance.fee_accrued = fee_accrued;
        balance.withdrawable_balance = withdrawable;
        state_.set_balance(id, balance);

        if (!state_.has_donor_record(id, ctx.sender)) {
            state_.add_donor(id, ctx.sender);
        }
        DonorRecord donor = state_.donor_record(id, ctx.sender);
        BOOST_OUTCOME_TRY(
            auto const donated, checked_add(donor.total_donated, amount));
        donor.total_donated = donated;
        state_.set_donor_record(id, ctx.sender, donor);

        state_.store_log(Event{
            .type = EventType::DonationReceived,
            .campaign_id = id,
            .account = ctx.sender,
            .token = campaign.token,
            .amount = amount});
        evaluate_status(state_, id, ctx.timestamp);

        return tokens_.transfer(campaign.token, ctx.sender, custody_, amount);
    });
}

Result<uint256_t>
CrowdfundContract::claim_refund(CallContext const &ctx, uint64_t const id)
{
    return transact("claim_refund", id, ctx, [&]() -> Result<uint256_t> {
        BOOST_OUTCOME_TRY(require_not_paused());
        BOOST_OUTCOME_TRY(auto const campaign, load_campaign(id));
        if (FUNDPOOL_UNLIKELY(campaign.disputed)) {
            return CrowdfundError::CampaignDisputed;
        }
        if (evaluate_status(state_, id, ctx.timestamp) !=
            CampaignStatus::Failed) {
            return CrowdfundError::NoRefundAvailable;
        }
        if (FUNDPOOL_UNLIKELY(
                campaign.funding_model != FundingModel::AllOrNothing)) {
            return CrowdfundError::RefundsNotSupported;
        }
        DonorRecord donor = state_.donor_record(id, ctx.sender);
        if (FUNDPOOL_UNLIKELY(donor.total_donated == 0)) {
            return CrowdfundError::NotADonor;
        }
        if (FUNDPOOL_UNLIKELY(
                ctx.timestamp > campaign.end_time &&
                ctx.timestamp - campaign.end_time >
                    config_.refund_grace_period)) {
            LOG_DEBUG(
                "refund at {} past window ending {} + {}",
                ctx.timestamp,
                campaign.end_time,
                config_.refund_grace_period);
            return CrowdfundError::RefundWindowExpired;
        }

        BOOST_OUTCOME_TRY(
            auto const net,
            net_of_fee(donor.total_donated, campaign.fee_rate_bps));
        BOOST_OUTCOME_TRY(
            auto const refundable, checked_sub(net, donor.refund_claimed));
        if (FUNDPOOL_UNLIKELY(refundable == 0)) {
            return CrowdfundError::AlreadyRefunded;
        }

        BOOST_OUTCOME_TRY(
            auto const claimed, checked_add(donor.refund_claimed, refundable));
        donor.refund_claimed = claimed;
        state_.set_donor_record(id, ctx.sender, donor);

        BalanceLedger balance = state_.balance(id);
        BOOST_OUTCOME_TRY(
            auto const withdrawable,
            checked_sub(balance.withdrawable_balance, refundable));
        BOOST_OUTCOME_TRY(
            auto const refunded,
            checked_add(balance.total_refunded, refundable));
        balance.withdrawable_balance = withdrawable;
        balance.total_refunded = refunded;
        state_.set_balance(id, balance);

        state_.store_log(Event{
            .type = EventType::RefundClaimed,
            .campaign_id = id,
            .account = ctx.sender,
            .token = campaign.token,
            .amount = refundable});
        BOOST_OUTCOME_TRY(
            tokens_.transfer(campaign.token, custody_, ctx.sender, refundable));
        return refundable;
    });
}

Result<uint256_t>
CrowdfundContract::withdraw_funds(CallContext const &ctx, uint64_t const id)
{
    return transact("withdraw_funds", id, ctx, [&]() -> Result<uint256_t> {
        BOOST_OUTCOME_TRY(require_not_paused());
        BOOST_OUTCOME_TRY(auto const campaign, load_creator_campaign(id, ctx));
        if (FUNDPOOL_UNLIKELY(campaign.disputed)) {
            return CrowdfundError::CampaignDisputed;
        }
        CampaignStatus const status =
            evaluate_status(state_, id, ctx.timestamp);
        BOOST_OUTCOME_TRY(
            authorize_withdrawal(campaign, status, ctx.timestamp));

        BalanceLedger balance = state_.balance(id);
        uint256_t const amount = balance.withdrawable_balance;
        if (FUNDPOOL_UNLIKELY(amount == 0)) {
            return CrowdfundError::NoFundsToWithdraw;
        }
        BOOST_OUTCOME_TRY(
            auto const withdrawn,
            checked_add(balance.total_withdrawn, amount));
        balance.withdrawable_balance = 0;
        balance.total_withdrawn = withdrawn;
        state_.set_balance(id, balance);

        state_.store_log(Event{
            .type = EventType::FundsWithdrawn,
            .campaign_id = id,
            .account = ctx.sender,
            .token = campaign.token,
            .amount = amount});
        BOOST_OUTCOME_TRY(
            tokens_.transfer(campaign.token, custody_, ctx.sender, amount));
        return amount;
    });
}

Result<void> CrowdfundContract::pause(CallContext const &ctx)
{
    return transact("pause", 0, ctx, [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(require_admin(ctx.sender));
        if (access_.is_paused()) {
            return outcome::success();
        }
        state_.store_log(
            Event{.type = EventType::Paused, .account = ctx.sender});
        access_.set_paused(true);
        LOG_INFO("ledger paused by {}", to_hex(ctx.sender));
        return outcome::success();
    });
}

Result<void> CrowdfundContract::unpause(CallContext const &ctx)
{
    return transact("unpause", 0, ctx, [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(require_admin(ctx.sender));
        if (!access_.is_paused()) {
            return outcome::success();
        }
        state_.store_log(
            Event{.type = EventType::Unpaused, .account = ctx.sender});
        access_.set_paused(false);
        LOG_INFO("ledger unpaused by {}", to_hex(ctx.sender));
        return outcome::success();
    });
}

Result<void> CrowdfundContract::flag_campaign_as_disputed(
    CallContext const &ctx, uint64_t const id)
{
    return transact(
        "flag_campaign_as_disputed", id, ctx, [&]() -> Result<void> {
            BOOST_OUTCOME_TRY(require_admin(ctx.sender));
            BOOST_OUTCOME_TRY(auto const loaded, load_campaign(id));
            if (loaded.disputed) {
                return outcome::success();
            }

            Campaign campaign = loaded;
            campaign.disputed = true;
            state_.set_campaign(campaign);
            state_.store_log(Event{
                .type = EventType::CampaignDisputed,
                .campaign_id = id,
                .account = ctx.sender});
            return outcome::success();
        });
}

Result<void> CrowdfundContract::resolve_dispute(
    CallContext const &ctx, uint64_t const id, bool const favor_creator)
{
    return transact("resolve_dispute", id, ctx, [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(require_admin(ctx.sender));
        BOOST_OUTCOME_TRY(auto const loaded, load_campaign(id));
        if (!loaded.disputed) {
            return outcome::success();
        }

        CampaignStatus const status =
            evaluate_status(state_, id, ctx.timestamp);
        Campaign campaign = *state_.find_campaign(id);
        campaign.disputed = false;
        if (!favor_creator && status == CampaignStatus::Active) {
            campaign.status = CampaignStatus::Failed;
            state_.store_log(Event{
                .type = EventType::StatusChanged,
                .campaign_id = id,
                .value = static_cast<uint64_t>(CampaignStatus::Failed)});
        }
        state_.set_campaign(campaign);
        state_.store_log(Event{
            .type = EventType::DisputeResolved,
            .campaign_id = id,
            .account = ctx.sender,
            .value = favor_creator ? 1u : 0u});
        return outcome::success();
    });
}

Result<void> CrowdfundContract::set_platform_fee_rate(
    CallContext const &ctx, uint64_t const rate_bps)
{
    return transact("set_platform_fee_rate", 0, ctx, [&]() -> Result<void> {
        if (FUNDPOOL_UNLIKELY(!access_.is_owner(ctx.sender))) {
            return CrowdfundError::NotOwner;
        }
        if (FUNDPOOL_UNLIKELY(rate_bps > config_.max_fee_rate_bps)) {
            LOG_DEBUG(
                "fee rate {} above maximum {}",
                rate_bps,
                config_.max_fee_rate_bps);
            return CrowdfundError::InvalidFeeRate;
        }
        state_.set_fee_rate_bps(rate_bps);
        state_.store_log(Event{
            .type = EventType::PlatformFeeRateChanged,
            .account = ctx.sender,
            .value = rate_bps});
        return outcome::success();
    });
}

Result<uint256_t> CrowdfundContract::collect_platform_fees(
    CallContext const &ctx, Address const &token)
{
    return transact(
        "collect_platform_fees", 0, ctx, [&]() -> Result<uint256_t> {
            BOOST_OUTCOME_TRY(require_admin(ctx.sender));
            BOOST_OUTCOME_TRY(
                auto const collected, sweep_outstanding_fees(state_, token));
            if (collected == 0) {
                return collected;
            }
            state_.store_log(Event{
                .type = EventType::PlatformFeesCollected,
                .account = ctx.sender,
                .token = token,
                .amount = collected});
            BOOST_OUTCOME_TRY(
                tokens_.transfer(token, custody_, ctx.sender, collected));
            LOG_INFO(
                "collected {} in platform fees of token {}",
                intx::to_string(collected),
                to_hex(token));
            return collected;
        });
}

Result<void> CrowdfundContract::emergency_withdraw(
    CallContext const &ctx, Address const &token, uint256_t const &amount)
{
    return transact("emergency_withdraw", 0, ctx, [&]() -> Result<void> {
        BOOST_OUTCOME_TRY(require_admin(ctx.sender));
        if (FUNDPOOL_UNLIKELY(!access_.is_paused())) {
            return CrowdfundError::SystemNotPaused;
        }
        if (FUNDPOOL_UNLIKELY(amount == 0)) {
            return CrowdfundError::InvalidAmount;
        }
        state_.store_log(Event{
            .type = EventType::EmergencyWithdrawal,
            .account = ctx.sender,
            .token = token,
            .amount = amount});
        BOOST_OUTCOME_TRY(
            tokens_.transfer(token, custody_, ctx.sender, amount));
        LOG_INFO(
            "emergency withdrawal of {} of token {} by {}",
            intx::to_string(amount),
            to_hex(token),
            to_hex(ctx.sender));
        return outcome::success();
    });
}

FUNDPOOL_NAMESPACE_END
