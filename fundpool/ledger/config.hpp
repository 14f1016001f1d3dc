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

#include <fundpool/core/config.hpp>
#include <fundpool/core/int.hpp>

#include <cstdint>

FUNDPOOL_NAMESPACE_BEGIN

inline constexpr uint64_t SECONDS_PER_DAY = 24 * 60 * 60;

// basis point precision denominator, 10000 == 100%
inline constexpr uint64_t BASIS_POINTS = 10'000;

struct LedgerConfig
{
    uint64_t min_funding_period;
    uint64_t max_funding_period;
    uint256_t min_funding_goal;
    uint64_t default_fee_rate_bps;
    uint64_t max_fee_rate_bps;
    uint64_t refund_grace_period;
};

inline constexpr LedgerConfig DEFAULT_LEDGER_CONFIG{
    .min_funding_period = 1 * SECONDS_PER_DAY,
    .max_funding_period = 90 * SECONDS_PER_DAY,
    .min_funding_goal = 100,
    .default_fee_rate_bps = 100,
    .max_fee_rate_bps = BASIS_POINTS,
    .refund_grace_period = 30 * SECONDS_PER_DAY};

// A configuration the ledger can run with: ordered funding period bounds and
// fee rates inside [0, BASIS_POINTS].
constexpr bool is_valid(LedgerConfig const &config)
{
    return config.min_funding_period > 0 &&
           config.min_funding_period <= config.max_funding_period &&
           config.max_fee_rate_bps <= BASIS_POINTS &&
           config.default_fee_rate_bps <= config.max_fee_rate_bps;
}

static_assert(is_valid(DEFAULT_LEDGER_CONFIG));

FUNDPOOL_NAMESPACE_END
