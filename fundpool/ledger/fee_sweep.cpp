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
#include <fundpool/ledger/fee_sweep.hpp>

#include <boost/outcome/try.hpp>

#include <cstdint>

FUNDPOOL_NAMESPACE_BEGIN

Result<uint256_t>
sweep_outstanding_fees(LedgerState &state, Address const &token)
{
    uint256_t swept{0};
    for (uint64_t const id : state.campaigns_of_token(token)) {
        BalanceLedger balance = state.balance(id);
        BOOST_OUTCOME_TRY(auto const outstanding, balance.fee_outstanding());
        if (outstanding == 0) {
            continue;
        }
        BOOST_OUTCOME_TRY(auto const total, checked_add(swept, outstanding));
        swept = total;
        balance.fee_collected = balance.fee_accrued;
        state.set_balance(id, balance);
    }
    if (swept == 0) {
        return swept;
    }
    BOOST_OUTCOME_TRY(
        auto const collected, checked_add(state.collected_fees(token), swept));
    state.set_collected_fees(token, collected);
    return swept;
}

FUNDPOOL_NAMESPACE_END
