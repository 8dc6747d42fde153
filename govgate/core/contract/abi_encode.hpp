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
#include <govgate/core/bytes.hpp>
#include <govgate/core/config.hpp>

#include <intx/intx.hpp>

#include <cstdint>
#include <cstring>
#include <utility>
#include <vector>

GOVGATE_NAMESPACE_BEGIN

// Helpers for building solidity ABI calldata: a 4 byte selector followed by
// the encoded argument tuple. Used to author whitelist patterns and to build
// call payloads for the validator.
//
// https://docs.soliditylang.org/en/latest/abi-spec.html#types

inline constexpr size_t SELECTOR_SIZE = 4;

// Address embedded in an argument slot: right aligned, zero padded.
inline bytes32_t abi_encode_address(Address const &address)
{
    bytes32_t output{};
    std::memcpy(&output.bytes[12], address.bytes, sizeof(Address));
    return output;
}

inline bytes32_t abi_encode_uint(uint256_t const &value)
{
    return intx::be::store<bytes32_t>(value);
}

inline bytes32_t abi_encode_bool(bool const value)
{
    return abi_encode_uint(value ? 1 : 0);
}

inline byte_string abi_encode_bytes(byte_string_view const input)
{
    size_t const padded =
        (input.size() + sizeof(bytes32_t) - 1) / sizeof(bytes32_t) *
        sizeof(bytes32_t);
    byte_string output;
    output += byte_string_view{
        abi_encode_uint(input.size()).bytes, sizeof(bytes32_t)};
    output += input;
    output.append(padded - input.size(), 0);
    return output;
}

inline byte_string abi_encode_selector(uint32_t const selector)
{
    byte_string output(SELECTOR_SIZE, 0);
    intx::be::unsafe::store(output.data(), selector);
    return output;
}

// Encodes `selector(args...)`
//  * static types : padded out to a word and added to the "head".
//  * dynamic types: the "head" stores the offset of the data in the tail,
//                   relative to the start of the arguments (the selector is
//                   not counted).
//
// https://docs.soliditylang.org/en/latest/abi-spec.html#formal-specification-of-the-encoding
class CalldataEncoder
{
    uint32_t selector_;
    byte_string head_;
    byte_string tail_;
    std::vector<std::pair<size_t, size_t>> unresolved_offsets_;

    void add_static(bytes32_t const &word)
    {
        head_ += byte_string_view{word.bytes, sizeof(bytes32_t)};
    }

    void add_dynamic(byte_string const &data)
    {
        unresolved_offsets_.emplace_back(head_.size(), tail_.size());
        add_static(bytes32_t{});
        tail_ += data;
    }

public:
    explicit CalldataEncoder(uint32_t const selector)
        : selector_{selector}
    {
    }

    CalldataEncoder &add_address(Address const &address)
    {
        add_static(abi_encode_address(address));
        return *this;
    }

    CalldataEncoder &add_uint(uint256_t const &value)
    {
        add_static(abi_encode_uint(value));
        return *this;
    }

    CalldataEncoder &add_bool(bool const value)
    {
        add_static(abi_encode_bool(value));
        return *this;
    }

    CalldataEncoder &add_bytes(byte_string_view const data)
    {
        add_dynamic(abi_encode_bytes(data));
        return *this;
    }

    byte_string encode_final()
    {
        for (auto const [unresolved, tail_cumsum] : unresolved_offsets_) {
            bytes32_t const encoded = abi_encode_uint(head_.size() + tail_cumsum);
            std::memcpy(&head_[unresolved], encoded.bytes, sizeof(bytes32_t));
        }
        unresolved_offsets_.clear();

        return abi_encode_selector(selector_) + std::move(head_) +
               std::move(tail_);
    }
};

GOVGATE_NAMESPACE_END
