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
#include <fundpool/ledger/host.hpp>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <cstdint>
#include <functional>

FUNDPOOL_NAMESPACE_BEGIN

class InMemoryAccessControl final : public AccessControl
{
    Address owner_;
    ankerl::unordered_dense::set<Address, std::hash<Address>> admins_{};
    bool paused_{false};

public:
    explicit InMemoryAccessControl(Address const &owner);

    bool is_admin(Address const &) const override;
    bool is_owner(Address const &) const override;
    bool is_paused() const override;
    void set_paused(bool) override;

    void grant_admin(Address const &);
    void revoke_admin(Address const &);
};

// Balances of every token held in memory. Tokens must be deployed before
// they are recognized as contracts.
class InMemoryTokenHost final : public TokenHost
{
    struct BalanceKey
    {
        Address token;
        Address holder;

        bool operator==(BalanceKey const &) const = default;
    };

    struct BalanceKeyHash
    {
        using is_avalanching = void;

        uint64_t operator()(BalanceKey const &key) const noexcept;
    };

    ankerl::unordered_dense::set<Address, std::hash<Address>> tokens_{};
    ankerl::unordered_dense::map<BalanceKey, uint256_t, BalanceKeyHash>
        balances_{};

public:
    void deploy(Address const &token);
    Result<void> mint(
        Address const &token, Address const &holder, uint256_t const &amount);

    uint256_t balance_of(Address const &token, Address const &holder) const;

    bool is_contract(Address const &token) const override;

    Result<void> transfer(
        Address const &token, Address const &from, Address const &to,
        uint256_t const &amount) override;
};

FUNDPOOL_NAMESPACE_END
