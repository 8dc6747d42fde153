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

#include <govgate/core/address.hpp>
#include <govgate/core/byte_string.hpp>
#include <govgate/core/config.hpp>
#include <govgate/core/result.hpp>
#include <govgate/timelock/calldata_check.hpp>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

GOVGATE_NAMESPACE_BEGIN

// Calldata whitelist keyed by (target, selector). Each key owns a list of
// checks, any one of which may admit a call.
//
// Removal swaps the removed element with the last one, so an index refers to
// the storage order at the time of the call and is invalidated by any removal
// on the same key.
//
// The registry does not authorize its callers; see TimelockGate.
class CheckRegistry
{
    struct PairState
    {
        size_t count;
        bool wildcard;
    };

    using Map = ankerl::unordered_dense::map<
        CheckKey, std::vector<CalldataCheck>, CheckKeyHash>;

    Address self_;
    Address trusted_operator_;
    Map checks_;

    PairState pair_state(CheckKey const &) const;

    Result<void> validate_add(
        CheckKey const &, CalldataCheck const &, PairState const &) const;

public:
    CheckRegistry(Address const &self, Address const &trusted_operator);

    Address const &self() const noexcept
    {
        return self_;
    }

    Address const &trusted_operator() const noexcept
    {
        return trusted_operator_;
    }

    Result<void> add_check(
        Address const &target, uint32_t selector, uint16_t start_index,
        uint16_t end_index, std::vector<byte_string> data,
        std::vector<bool> is_self_address_check);

    // All-or-nothing. Element i is validated against the registry as left by
    // elements [0, i).
    Result<void> add_checks(
        std::span<Address const> targets, std::span<uint32_t const> selectors,
        std::span<uint16_t const> start_indexes,
        std::span<uint16_t const> end_indexes,
        std::span<std::vector<byte_string> const> datas,
        std::span<std::vector<bool> const> is_self_address_checks);

    Result<void>
    remove_check(Address const &target, uint32_t selector, size_t index);

    // All-or-nothing. Each index is interpreted against the storage order left
    // by the preceding removals.
    Result<void> remove_checks(
        std::span<Address const> targets, std::span<uint32_t const> selectors,
        std::span<size_t const> indexes);

    std::span<CalldataCheck const>
    get_checks(Address const &target, uint32_t selector) const;

    std::vector<CheckKey> pairs() const;

    size_t size() const noexcept
    {
        return checks_.size();
    }

    bool empty() const noexcept
    {
        return checks_.empty();
    }
};

GOVGATE_NAMESPACE_END
