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
#include <fundpool/ledger/config.hpp>
#include <fundpool/ledger/fee.hpp>

#include <boost/outcome/try.hpp>

FUNDPOOL_NAMESPACE_BEGIN

Result<uint256_t> fee_of(uint256_t const &amount, uint64_t const rate_bps)
{
    FUNDPOOL_ASSERT(rate_bps <= BASIS_POINTS);
    BOOST_OUTCOME_TRY(
        auto const scaled, checked_mul(amount, uint256_t{rate_bps}));
    return scaled / uint256_t{BASIS_POINTS};
}

Result<uint256_t> net_of_fee(uint256_t const &amount, uint64_t const rate_bps)
{
    BOOST_OUTCOME_TRY(auto const fee, fee_of(amount, rate_bps));
    return checked_sub(amount, fee);
}

FUNDPOOL_NAMESPACE_END
