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

FUNDPOOL_NAMESPACE_BEGIN

enum class TokenError
{
    Success = 0,
    NotAContract,
    InsufficientBalance,
    BalanceOverflow,
};

FUNDPOOL_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<fundpool::TokenError>
    : quick_status_code_from_enum_defaults<fundpool::TokenError>
{
    static constexpr auto const domain_name = "Token Error";
    static constexpr auto const domain_uuid =
        "c2a85e17-3f94-4d6b-8e0a-51b7d9f4c326";

    static std::initializer_list<mapping> const &value_mappings()
    {
        using fundpool::TokenError;

        static std::initializer_list<mapping> const v = {
            {TokenError::Success, "success", {errc::success}},
            {TokenError::NotAContract, "token is not a contract", {}},
            {TokenError::InsufficientBalance, "insufficient balance", {}},
            {TokenError::BalanceOverflow, "balance overflow", {}},
        };
        return v;
    }
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END

FUNDPOOL_NAMESPACE_BEGIN

// Identity and pause gate consulted by the ledger. Role administration
// happens behind this interface.
class AccessControl
{
public:
    virtual ~AccessControl() = default;

    virtual bool is_admin(Address const &) const = 0;
    virtual bool is_owner(Address const &) const = 0;
    virtual bool is_paused() const = 0;
    virtual void set_paused(bool) = 0;
};

// Fungible token movement. A transfer either moves the full amount or
// fails without effect.
class TokenHost
{
public:
    virtual ~TokenHost() = default;

    virtual bool is_contract(Address const &token) const = 0;

    virtual Result<void> transfer(
        Address const &token, Address const &from, Address const &to,
        uint256_t const &amount) = 0;
};

FUNDPOOL_NAMESPACE_END
