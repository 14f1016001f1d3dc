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
#include <fundpool/core/likely.h>
#include <fundpool/core/result.hpp>

#include <boost/outcome/config.hpp>
// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>
#include <limits>

FUNDPOOL_NAMESPACE_BEGIN

enum class ArithmeticError
{
    Success = 0,
    Overflow,
    Underflow,
    DivisionByZero,
};

FUNDPOOL_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<fundpool::ArithmeticError>
    : quick_status_code_from_enum_defaults<fundpool::ArithmeticError>
{
    static constexpr auto const domain_name = "Arithmetic Error";
    static constexpr auto const domain_uuid =
        "4b7c1a92-e05d-4c3b-9a7e-2f6d8c31b5a4";

    static std::initializer_list<mapping> const &value_mappings()
    {
        using fundpool::ArithmeticError;

        static std::initializer_list<mapping> const v = {
            {ArithmeticError::Success, "success", {errc::success}},
            {ArithmeticError::Overflow, "arithmetic overflow", {}},
            {ArithmeticError::Underflow, "arithmetic underflow", {}},
            {ArithmeticError::DivisionByZero, "division by zero", {}},
        };
        return v;
    }
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END

FUNDPOOL_NAMESPACE_BEGIN

// Token amounts never wrap and never saturate. Every operation on a ledger
// total goes through one of these.

[[nodiscard]] inline Result<uint256_t>
checked_add(uint256_t const &x, uint256_t const &y)
{
    uint256_t const sum = x + y;
    if (FUNDPOOL_UNLIKELY(sum < x)) {
        return ArithmeticError::Overflow;
    }
    return sum;
}

[[nodiscard]] inline Result<uint256_t>
checked_sub(uint256_t const &x, uint256_t const &y)
{
    if (FUNDPOOL_UNLIKELY(y > x)) {
        return ArithmeticError::Underflow;
    }
    return x - y;
}

[[nodiscard]] inline Result<uint256_t>
checked_mul(uint256_t const &x, uint256_t const &y)
{
    if (x == 0 || y == 0) {
        return uint256_t{0};
    }
    if (FUNDPOOL_UNLIKELY(x > std::numeric_limits<uint256_t>::max() / y)) {
        return ArithmeticError::Overflow;
    }
    return x * y;
}

[[nodiscard]] inline Result<uint256_t>
checked_div(uint256_t const &x, uint256_t const &y)
{
    if (FUNDPOOL_UNLIKELY(y == 0)) {
        return ArithmeticError::DivisionByZero;
    }
    return x / y;
}

FUNDPOOL_NAMESPACE_END
