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

/**
 * @file
 *
 * Scenario files for the `fundpool` replay tool: a JSON document that seeds
 * token balances and roles, followed by an ordered list of ledger calls
 */

#include <fundpool/core/address.hpp>
#include <fundpool/core/config.hpp>
#include <fundpool/core/int.hpp>
#include <fundpool/ledger/config.hpp>
#include <fundpool/ledger/crowdfund_contract.hpp>
#include <fundpool/ledger/crowdfund_view.hpp>
#include <fundpool/ledger/in_memory_host.hpp>
#include <fundpool/ledger/ledger_state.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

FUNDPOOL_NAMESPACE_BEGIN

enum class ScenarioOp : uint8_t
{
    CreateCampaign,
    UpdateCampaignDetails,
    ChangeEndTime,
    CancelCampaign,
    Donate,
    ClaimRefund,
    WithdrawFunds,
    Pause,
    Unpause,
    FlagCampaignAsDisputed,
    ResolveDispute,
    SetPlatformFeeRate,
    CollectPlatformFees,
    EmergencyWithdraw,
};

struct ScenarioStep
{
    ScenarioOp op;
    std::string op_name;
    CallContext ctx;
    nlohmann::json args; ///< op-specific fields, validated when run
    std::optional<std::string> expect; ///< "success" or an error message
};

struct TokenAllocation
{
    Address token;
    Address holder;
    uint256_t amount;
};

struct Scenario
{
    Address owner;
    std::vector<Address> admins;
    Address custody;
    std::vector<Address> tokens;
    std::vector<TokenAllocation> allocations;
    std::vector<ScenarioStep> steps;
};

/// Parse a scenario document; if a parse error occurs, return a string
/// describing the error
std::expected<Scenario, std::string>
    try_parse_scenario(nlohmann::json const &);

struct StepOutcome
{
    size_t index;
    std::string op_name;
    std::string result; ///< "success" or the error message
    nlohmann::json value; ///< returned id or amount, null for void calls
    bool matched; ///< true when the step carries no expectation
};

/// Runs a scenario against an in-memory ledger with in-memory collaborators
class ScenarioRunner
{
    LedgerState state_;
    InMemoryAccessControl access_;
    InMemoryTokenHost tokens_;
    CrowdfundContract contract_;
    CrowdfundView view_;
    std::vector<Address> token_list_;
    std::vector<StepOutcome> outcomes_;
    uint64_t last_timestamp_{0};

    StepOutcome dispatch(size_t index, ScenarioStep const &);

public:
    ScenarioRunner(Scenario const &, LedgerConfig const &);

    /// Execute one step; a malformed step yields an error string. The report
    /// derives time-dependent status as of the latest step time seen
    std::expected<StepOutcome, std::string>
    run_step(size_t index, ScenarioStep const &);

    std::vector<StepOutcome> const &outcomes() const
    {
        return outcomes_;
    }

    size_t mismatches() const;

    nlohmann::json report() const;
};

FUNDPOOL_NAMESPACE_END
