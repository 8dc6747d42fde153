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
#include <govgate/core/contract/abi_encode.hpp>

#include <boost/functional/hash.hpp>

#include <intx/intx.hpp>

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <vector>

GOVGATE_NAMESPACE_BEGIN

// First calldata offset past the selector. A check covering [4, 4) whose only
// candidate is empty is the wildcard; its self address flag is not consulted.
// Any other check over [4, 4) compares an empty slice.
inline constexpr uint16_t MIN_START_INDEX = SELECTOR_SIZE;

struct CalldataCheck
{
    uint16_t start_index;
    uint16_t end_index;
    std::vector<byte_string> data;
    std::vector<bool> is_self_address_check;

    bool is_wildcard() const noexcept
    {
        return start_index == MIN_START_INDEX &&
               end_index == MIN_START_INDEX && data.size() == 1 &&
               data.front().empty();
    }

    bool operator==(CalldataCheck const &) const = default;
};

struct CheckKey
{
    Address target;
    uint32_t selector;

    bool operator==(CheckKey const &) const = default;
};

struct CheckKeyHash
{
    size_t operator()(CheckKey const &key) const noexcept
    {
        size_t seed = 0;
        boost::hash_combine(
            seed,
            boost::hash_range(
                std::begin(key.target.bytes), std::end(key.target.bytes)));
        boost::hash_combine(seed, key.selector);
        return seed;
    }
};

// caller guarantees at least SELECTOR_SIZE bytes
inline uint32_t load_selector(byte_string_view const calldata) noexcept
{
    return intx::be::unsafe::load<uint32_t>(calldata.data());
}

GOVGATE_NAMESPACE_END
