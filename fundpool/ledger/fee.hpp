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
#include <fundpool/core/result.hpp>

#include <cstdint>

FUNDPOOL_NAMESPACE_BEGIN

// floor(amount * rate_bps / BASIS_POINTS); rate_bps must be <= BASIS_POINTS
Result<uint256_t> fee_of(uint256_t const &amount, uint64_t rate_bps);

// amount - fee_of(amount, rate_bps)
Result<uint256_t> net_of_fee(uint256_t const &amount, uint64_t rate_bps);

FUNDPOOL_NAMESPACE_END
