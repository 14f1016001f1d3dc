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
#include <fundpool/ledger/campaign.hpp>
#include <fundpool/ledger/event.hpp>

#include <immer/map.hpp>
#include <immer/vector.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

FUNDPOOL_NAMESPACE_BEGIN

struct DonorKey
{
    uint64_t campaign_id;
    Address donor;

    bool operator==(DonorKey const &) const = default;
};

struct DonorKeyHash
{
    size_t operator()(DonorKey const &key) const noexcept
    {
        size_t const h1 = std::hash<uint64_t>{}(key.campaign_id);
        size_t const h2 = std::hash<Address>{}(key.donor);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

// Persistent store of the ledger. Every collection is an immutable map so a
// version push is a constant-time copy of the root; rejecting a version
// restores the previous roots wholesale.
class LedgerState
{
public:
    template <class Key, class T, class Hash = std::hash<Key>>
    using Map = immer::map<Key, T, Hash>;
    using IdList = immer::vector<uint64_t>;
    using AddressList = immer::vector<Address>;
    using Logs = immer::vector<Event>;

private:
    struct Version
    {
        uint64_t latest_campaign_id{0};
        uint64_t fee_rate_bps{0};
        Map<uint64_t, Campaign> campaigns{};
        Map<uint64_t, BalanceLedger> balances{};
        Map<uint64_t, AddressList> donors{};
        Map<DonorKey, DonorRecord, DonorKeyHash> donor_records{};
        Map<Address, IdList> created{};
        Map<Address, IdList> donated{};
        Map<Address, IdList> token_campaigns{};
        Map<Address, uint256_t> collected_fees{};
        Logs logs{};
    };

    Version current_{};
    std::vector<Version> stack_{};

public:
    explicit LedgerState(uint64_t fee_rate_bps);

    LedgerState(LedgerState const &) = delete;
    LedgerState &operator=(LedgerState const &) = delete;

    //
    // Versioning
    //
    void push();
    void pop_accept();
    void pop_reject();

    size_t depth() const noexcept
    {
        return stack_.size();
    }

    //
    // Scalars
    //
    uint64_t latest_campaign_id() const noexcept
    {
        return current_.latest_campaign_id;
    }

    uint64_t next_campaign_id();

    uint64_t fee_rate_bps() const noexcept
    {
        return current_.fee_rate_bps;
    }

    void set_fee_rate_bps(uint64_t);

    //
    // Keyed by campaign id
    //
    Campaign const *find_campaign(uint64_t id) const;
    void set_campaign(Campaign const &);

    BalanceLedger balance(uint64_t id) const;
    void set_balance(uint64_t id, BalanceLedger const &);

    AddressList donors(uint64_t id) const;

    //
    // Keyed by (campaign id, donor)
    //
    bool has_donor_record(uint64_t id, Address const &) const;
    DonorRecord donor_record(uint64_t id, Address const &) const;
    void set_donor_record(uint64_t id, Address const &, DonorRecord const &);

    // first donation of `donor` to campaign `id`
    void add_donor(uint64_t id, Address const &donor);

    //
    // Keyed by address
    //
    IdList created_by(Address const &) const;
    void add_created(Address const &creator, uint64_t id);

    IdList donated_by(Address const &) const;

    IdList campaigns_of_token(Address const &) const;
    void add_token_campaign(Address const &token, uint64_t id);

    uint256_t collected_fees(Address const &token) const;
    void set_collected_fees(Address const &token, uint256_t const &);

    //
    // Logs
    //
    void store_log(Event const &);

    Logs const &logs() const noexcept
    {
        return current_.logs;
    }
};

FUNDPOOL_NAMESPACE_END
