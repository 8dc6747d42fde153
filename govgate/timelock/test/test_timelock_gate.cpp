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
#include <govgate/core/contract/abi_encode.hpp>
#include <govgate/timelock/timelock_error.hpp>
#include <govgate/timelock/timelock_gate.hpp>

#include <gtest/gtest.h>

#include <quill/Quill.h>

#include <cstddef>
#include <cstdint>
#include <vector>

using namespace govgate;

struct Gate : public ::testing::Test
{
    static constexpr auto SELF{
        0x36928500bc1dcd7af6a2b4008875cc336b927d57_address};
    static constexpr auto OPERATOR{
        0x00000000000000000000000000000000000000aa_address};
    static constexpr auto EXECUTOR{
        0x00000000000000000000000000000000000000ee_address};
    static constexpr auto STRANGER{
        0x00000000000000000000000000000000000000bb_address};
    static constexpr auto LENDING{
        0x00000000000000000000000000000000deadbeef_address};
    static constexpr uint32_t SUPPLY = 0x617ba037;

    TimelockGate gate{SELF, OPERATOR, EXECUTOR};

    static void SetUpTestSuite()
    {
        quill::start();
    }

    // supply(address asset, uint256 amount, address onBehalfOf, uint16 code)
    static byte_string
    supply(Address const &asset, uint64_t const amount, Address const &owner)
    {
        return CalldataEncoder{SUPPLY}
            .add_address(asset)
            .add_uint(amount)
            .add_address(owner)
            .add_uint(0)
            .encode_final();
    }
};

TEST_F(Gate, accessors)
{
    EXPECT_EQ(gate.executor(), EXECUTOR);
    EXPECT_EQ(gate.registry().self(), SELF);
    EXPECT_EQ(gate.registry().trusted_operator(), OPERATOR);
    EXPECT_TRUE(gate.registry().empty());
}

TEST_F(Gate, add_check_revert_unauthorized)
{
    auto const res =
        gate.add_check(STRANGER, LENDING, SUPPLY, 4, 4, {{}}, {false});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), TimelockError::Unauthorized);
    EXPECT_TRUE(gate.registry().empty());

    auto const op_res =
        gate.add_check(OPERATOR, LENDING, SUPPLY, 4, 4, {{}}, {false});
    ASSERT_TRUE(op_res.has_error());
    EXPECT_EQ(op_res.assume_error(), TimelockError::Unauthorized);
}

TEST_F(Gate, remove_check_revert_unauthorized)
{
    ASSERT_FALSE(
        gate.add_check(EXECUTOR, LENDING, SUPPLY, 4, 4, {{}}, {false})
            .has_error());

    auto const res = gate.remove_check(STRANGER, LENDING, SUPPLY, 0);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), TimelockError::Unauthorized);
    EXPECT_EQ(gate.registry().get_checks(LENDING, SUPPLY).size(), 1);

    std::vector<Address> const targets{LENDING};
    std::vector<uint32_t> const selectors{SUPPLY};
    std::vector<size_t> const indexes{0};
    auto const batch_res =
        gate.remove_checks(SELF, targets, selectors, indexes);
    ASSERT_TRUE(batch_res.has_error());
    EXPECT_EQ(batch_res.assume_error(), TimelockError::Unauthorized);
    EXPECT_EQ(gate.registry().get_checks(LENDING, SUPPLY).size(), 1);
}

TEST_F(Gate, registry_errors_pass_through)
{
    auto const res =
        gate.add_check(EXECUTOR, LENDING, SUPPLY, 3, 4, {{0x01}}, {false});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), TimelockError::StartIndexTooSmall);

    auto const remove_res = gate.remove_check(EXECUTOR, LENDING, SUPPLY, 0);
    ASSERT_TRUE(remove_res.has_error());
    EXPECT_EQ(remove_res.assume_error(), TimelockError::NoChecksForPair);
}

TEST_F(Gate, check_call)
{
    // funds may only be supplied on behalf of the timelock itself
    ASSERT_FALSE(
        gate.add_check(EXECUTOR, LENDING, SUPPLY, 80, 100, {{}}, {true})
            .has_error());

    EXPECT_FALSE(gate.check_call(LENDING, supply(LENDING, 5, SELF)).has_error());

    auto const res = gate.check_call(LENDING, supply(LENDING, 5, STRANGER));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), TimelockError::CalldataNotWhitelisted);

    auto const short_res =
        gate.check_call(LENDING, byte_string{0x61, 0x7b, 0xa0});
    ASSERT_TRUE(short_res.has_error());
    EXPECT_EQ(short_res.assume_error(), TimelockError::CalldataTooShort);

    auto const unknown = gate.check_call(SELF, supply(LENDING, 5, SELF));
    ASSERT_TRUE(unknown.has_error());
    EXPECT_EQ(unknown.assume_error(), TimelockError::CalldataNotWhitelisted);
}

TEST_F(Gate, batch_then_remove)
{
    std::vector<Address> const targets{LENDING, LENDING};
    std::vector<uint32_t> const selectors{SUPPLY, SUPPLY};
    std::vector<uint16_t> const starts{16, 80};
    std::vector<uint16_t> const ends{36, 100};
    std::vector<std::vector<byte_string>> const datas{
        {byte_string{LENDING.bytes, sizeof(LENDING)}}, {{}}};
    std::vector<std::vector<bool>> const selfs{{false}, {true}};

    auto const unauthorized = gate.add_checks(
        STRANGER, targets, selectors, starts, ends, datas, selfs);
    ASSERT_TRUE(unauthorized.has_error());
    EXPECT_EQ(unauthorized.assume_error(), TimelockError::Unauthorized);
    EXPECT_TRUE(gate.registry().empty());

    ASSERT_FALSE(
        gate.add_checks(EXECUTOR, targets, selectors, starts, ends, datas, selfs)
            .has_error());
    EXPECT_EQ(gate.registry().get_checks(LENDING, SUPPLY).size(), 2);

    // asset check or owner check
    auto const other_asset =
        0x000000000000000000000000000000000000c0de_address;
    EXPECT_FALSE(
        gate.check_call(LENDING, supply(LENDING, 1, STRANGER)).has_error());
    EXPECT_FALSE(
        gate.check_call(LENDING, supply(other_asset, 1, SELF)).has_error());
    EXPECT_TRUE(
        gate.check_call(LENDING, supply(other_asset, 1, STRANGER)).has_error());

    std::vector<size_t> const indexes{0, 0};
    ASSERT_FALSE(
        gate.remove_checks(EXECUTOR, targets, selectors, indexes).has_error());
    EXPECT_TRUE(gate.registry().empty());
    EXPECT_TRUE(
        gate.check_call(LENDING, supply(LENDING, 1, SELF)).has_error());
}
