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

#include <fundpool/core/checked_math.hpp>
#include <fundpool/ledger/campaign.hpp>

#include <boost/outcome/try.hpp>

FUNDPOOL_NAMESPACE_BEGIN

Result<uint256_t> BalanceLedger::fee_outstanding() const
{
    return checked_sub(fee_accrued, fee_collected);
}

bool BalanceLedger::is_conserved() const
{
    auto const sum = [this]() -> Result<uint256_t> {
        BOOST_OUTCOME_TRY(auto const outstanding, fee_outstanding());
        BOOST_OUTCOME_TRY(
            auto const fees, checked_add(fee_collected, outstanding));
        BOOST_OUTCOME_TRY(
            auto const paid_out, checked_add(total_refunded, total_withdrawn));
        BOOST_OUTCOME_TRY(
            auto const held, checked_add(withdrawable_balance, fees));
        return checked_add(held, paid_out);
    }();
    return sum.has_value() && sum.value() == total_donations;
}

FUNDPOOL_NAMESPACE_END
