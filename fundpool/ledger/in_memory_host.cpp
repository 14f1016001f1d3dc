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
#include <fundpool/core/likely.h>
#include <fundpool/ledger/in_memory_host.hpp>

#include <ankerl/unordered_dense.h>

#include <boost/outcome/success_failure.hpp>

#include <string_view>

FUNDPOOL_NAMESPACE_BEGIN

InMemoryAccessControl::InMemoryAccessControl(Address const &owner)
    : owner_{owner}
{
    admins_.insert(owner);
}

bool InMemoryAccessControl::is_admin(Address const &account) const
{
    return admins_.contains(account);
}

bool InMemoryAccessControl::is_owner(Address const &account) const
{
    return account == owner_;
}

bool InMemoryAccessControl::is_paused() const
{
    return paused_;
}

void InMemoryAccessControl::set_paused(bool const paused)
{
    paused_ = paused;
}

void InMemoryAccessControl::grant_admin(Address const &account)
{
    admins_.insert(account);
}

void InMemoryAccessControl::revoke_admin(Address const &account)
{
    admins_.erase(account);
}

uint64_t InMemoryTokenHost::BalanceKeyHash::operator()(
    BalanceKey const &key) const noexcept
{
    return ankerl::unordered_dense::detail::wyhash::hash(&key, sizeof(key));
}

void InMemoryTokenHost::deploy(Address const &token)
{
    tokens_.insert(token);
}

Result<void> InMemoryTokenHost::mint(
    Address const &token, Address const &holder, uint256_t const &amount)
{
    if (FUNDPOOL_UNLIKELY(!is_contract(token))) {
        return TokenError::NotAContract;
    }
    auto &balance = balances_[BalanceKey{token, holder}];
    auto const minted = checked_add(balance, amount);
    if (FUNDPOOL_UNLIKELY(minted.has_error())) {
        return TokenError::BalanceOverflow;
    }
    balance = minted.value();
    return outcome::success();
}

uint256_t InMemoryTokenHost::balance_of(
    Address const &token, Address const &holder) const
{
    auto const it = balances_.find(BalanceKey{token, holder});
    if (it == balances_.end()) {
        return 0;
    }
    return it->second;
}

bool InMemoryTokenHost::is_contract(Address const &token) const
{
    return tokens_.contains(token);
}

Result<void> InMemoryTokenHost::transfer(
    Address const &token, Address const &from, Address const &to,
    uint256_t const &amount)
{
    if (FUNDPOOL_UNLIKELY(!is_contract(token))) {
        return TokenError::NotAContract;
    }
    uint256_t const from_balance = balance_of(token, from);
    if (FUNDPOOL_UNLIKELY(from_balance < amount)) {
        return TokenError::InsufficientBalance;
    }
    if (from == to) {
        return outcome::success();
    }
    uint256_t const to_balance = balance_of(token, to);
    auto const credited = checked_add(to_balance, amount);
    if (FUNDPOOL_UNLIKELY(credited.has_error())) {
        return TokenError::BalanceOverflow;
    }
    balances_[BalanceKey{token, from}] = from_balance - amount;
    balances_[BalanceKey{token, to}] = credited.value();
    return outcome::success();
}

FUNDPOOL_NAMESPACE_END
