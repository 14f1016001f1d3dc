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

#include <fundpool/core/address.hpp>
#include <fundpool/core/config.hpp>
#include <fundpool/core/int.hpp>
#include <fundpool/core/result.hpp>
#include <fundpool/ledger/ledger_state.hpp>

FUNDPOOL_NAMESPACE_BEGIN

// Marks the outstanding fee of every campaign of `token` as collected and
// adds the total to the token's collected-fees accumulator. Returns the total
// swept; no funds are moved.
Result<uint256_t> sweep_outstanding_fees(LedgerState &, Address const &token);

FUNDPOOL_NAMESPACE_END
