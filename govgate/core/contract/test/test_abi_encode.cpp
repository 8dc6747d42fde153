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

#include <govgate/core/address.hpp>
#include <govgate/core/byte_string.hpp>
#include <govgate/core/bytes.hpp>
#include <govgate/core/contract/abi_encode.hpp>

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>

#include <gtest/gtest.h>

#include <intx/intx.hpp>

using namespace govgate;
using namespace intx::literals;

namespace
{
    byte_string word(bytes32_t const &w)
    {
        return byte_string{w.bytes, sizeof(w)};
    }
}

TEST(AbiEncode, uint)
{
    byte_string const expected =
        evmc::from_hex(
            "0x0000000000000000000000000000000000000000000cb3"
            "9f00c54ee156444be5")
            .value();
    EXPECT_EQ(word(abi_encode_uint(15355346523654236542356453_u256)), expected);
}

TEST(AbiEncode, address)
{
    constexpr Address input{0xDEADBEEF000000000000000000F00D0000000100_address};
    byte_string const expected =
        evmc::from_hex(
            "000000000000000000000000deadbeef000000000000000000f00d0000000100")
            .value();
    EXPECT_EQ(word(abi_encode_address(input)), expected);
}

TEST(AbiEncode, bool)
{
    EXPECT_EQ(abi_encode_bool(true), abi_encode_uint(1));
    EXPECT_EQ(abi_encode_bool(false), bytes32_t{});
}

TEST(AbiEncode, selector)
{
    EXPECT_EQ(
        abi_encode_selector(0xa9059cbb), (byte_string{0xa9, 0x05, 0x9c, 0xbb}));
}

TEST(AbiEncode, bytes)
{
    byte_string const input = evmc::from_hex("0x8568627900").value();
    byte_string const expected =
        evmc::from_hex(
            "0000000000000000000000000000000000000000000000000000000000000005"
            "8568627900000000000000000000000000000000000000000000000000000000")
            .value();
    EXPECT_EQ(abi_encode_bytes(input), expected);
    EXPECT_EQ(abi_encode_bytes({}), word(bytes32_t{}));
}

TEST(AbiEncode, transfer_calldata)
{
    // transfer(0xdeadbeef, 1000)
    byte_string const expected =
        evmc::from_hex(
            "a9059cbb"
            "00000000000000000000000000000000000000000000000000000000deadbeef"
            "00000000000000000000000000000000000000000000000000000000000003e8")
            .value();
    auto const output = CalldataEncoder{0xa9059cbb}
                            .add_address(
                                0x00000000000000000000000000000000deadbeef_address)
                            .add_uint(1000)
                            .encode_final();
    EXPECT_EQ(output, expected);
}

TEST(AbiEncode, dynamic_offsets_skip_selector)
{
    // f(bytes,uint256,bool)
    byte_string const expected =
        evmc::from_hex(
            "12345678"
            "0000000000000000000000000000000000000000000000000000000000000060"
            "0000000000000000000000000000000000000000000000000000000000000007"
            "0000000000000000000000000000000000000000000000000000000000000001"
            "0000000000000000000000000000000000000000000000000000000000000002"
            "abcd000000000000000000000000000000000000000000000000000000000000")
            .value();
    auto const output = CalldataEncoder{0x12345678}
                            .add_bytes(byte_string{0xab, 0xcd})
                            .add_uint(7)
                            .add_bool(true)
                            .encode_final();
    EXPECT_EQ(output, expected);
}
