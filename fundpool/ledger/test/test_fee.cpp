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
#include <fundpool/core/int.hpp>
#include <fundpool/ledger/config.hpp>
#include <fundpool/ledger/fee.hpp>

#include <limits>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

using namespace fundpool;
using namespace intx::literals;

TEST(Fee, rounds_down)
{
    EXPECT_EQ(fee_of(600_u256, 100).value(), 6_u256);
    EXPECT_EQ(fee_of(400_u256, 100).value(), 4_u256);
    EXPECT_EQ(fee_of(99_u256, 100).value(), 0);
    EXPECT_EQ(fee_of(199_u256, 100).value(), 1_u256);
    EXPECT_EQ(fee_of(12345_u256, 250).value(), 308_u256);
}

TEST(Fee, bounds)
{
    EXPECT_EQ(fee_of(1000_u256, 0).value(), 0);
    EXPECT_EQ(fee_of(1000_u256, BASIS_POINTS).value(), 1000_u256);
    EXPECT_EQ(fee_of(0, BASIS_POINTS).value(), 0);
}

TEST(Fee, net)
{
    EXPECT_EQ(net_of_fee(600_u256, 100).value(), 594_u256);
    EXPECT_EQ(net_of_fee(1000_u256, BASIS_POINTS).value(), 0);
    EXPECT_EQ(net_of_fee(99_u256, 100).value(), 99_u256);
}

TEST(Fee, overflow_is_an_error)
{
    auto const res = fee_of(std::numeric_limits<uint256_t>::max(), 100);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ArithmeticError::Overflow);
}
