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

#include "fundpool/scenario.hpp"

#include <fundpool/core/log_level_map.hpp>
#include <fundpool/ledger/config.hpp>

#include <CLI/CLI.hpp>

#include <nlohmann/json.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>
#include <quill/detail/LogMacros.h>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

using namespace fundpool;
namespace fs = std::filesystem;

int main(int const argc, char const *argv[])
{
    CLI::App cli{"fundpool"};
    cli.option_defaults()->always_capture_default();

    fs::path scenario_path;
    fs::path report_path;
    auto log_level = quill::LogLevel::Info;
    LedgerConfig config = DEFAULT_LEDGER_CONFIG;
    uint64_t min_funding_goal = 100;

    cli.add_option("--scenario", scenario_path, "scenario file to replay")
        ->check(CLI::ExistingFile)
        ->required();
    cli.add_option(
        "--report", report_path, "write the report here instead of stdout");
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));
    cli.add_option(
        "--min_funding_period",
        config.min_funding_period,
        "shortest campaign duration in seconds");
    cli.add_option(
        "--max_funding_period",
        config.max_funding_period,
        "longest campaign duration in seconds");
    cli.add_option(
        "--min_funding_goal",
        min_funding_goal,
        "smallest funding goal in token units");
    cli.add_option(
        "--fee_rate",
        config.default_fee_rate_bps,
        "initial platform fee rate in basis points");
    cli.add_option(
        "--max_fee_rate",
        config.max_fee_rate_bps,
        "highest platform fee rate in basis points");
    cli.add_option(
        "--refund_grace_period",
        config.refund_grace_period,
        "seconds after the end time during which refunds can be claimed");

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::CallForHelp const &e) {
        return cli.exit(e);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stderr_handler = quill::stderr_handler();
    stderr_handler->set_pattern(
        "%(ascii_time) [%(thread)] %(filename):%(lineno) LOG_%(level_name)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stderr_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    config.min_funding_goal = min_funding_goal;
    if (!is_valid(config)) {
        LOG_ERROR(
            "invalid ledger configuration: funding period [{}, {}], fee rate "
            "{} max {}",
            config.min_funding_period,
            config.max_funding_period,
            config.default_fee_rate_bps,
            config.max_fee_rate_bps);
        return EXIT_FAILURE;
    }

    std::ifstream in{scenario_path};
    auto const document = nlohmann::json::parse(in, nullptr, false);
    if (document.is_discarded()) {
        LOG_ERROR("could not parse {} as json", scenario_path.string());
        return EXIT_FAILURE;
    }
    auto const scenario = try_parse_scenario(document);
    if (!scenario.has_value()) {
        LOG_ERROR(
            "invalid scenario {}: {}",
            scenario_path.string(),
            scenario.error());
        return EXIT_FAILURE;
    }

    LOG_INFO(
        "replaying {} steps from {} with fee rate {} bps",
        scenario->steps.size(),
        scenario_path.string(),
        config.default_fee_rate_bps);

    ScenarioRunner runner{scenario.value(), config};
    for (size_t i = 0; i < scenario->steps.size(); ++i) {
        auto const res = runner.run_step(i, scenario->steps[i]);
        if (!res.has_value()) {
            LOG_ERROR("malformed {}", res.error());
            return EXIT_FAILURE;
        }
    }

    auto const report = runner.report().dump(2);
    if (report_path.empty()) {
        std::cout << report << std::endl;
    }
    else {
        std::ofstream out{report_path};
        out << report << std::endl;
        if (!out) {
            LOG_ERROR("could not write report to {}", report_path.string());
            return EXIT_FAILURE;
        }
    }

    size_t const mismatches = runner.mismatches();
    if (mismatches != 0) {
        LOG_ERROR("{} steps did not match their expectation", mismatches);
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
