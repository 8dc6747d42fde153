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
#include <govgate/timelock/calldata_check.hpp>

#include <cstddef>
#include <optional>

GOVGATE_NAMESPACE_BEGIN

class CheckRegistry;

// True when `slice` holds `self` in its low order bytes with zeroes above, the
// way an address sits in an argument slot. Slices narrower than an address
// never match.
bool matches_self_address(byte_string_view slice, Address const &self);

bool check_matches(
    CalldataCheck const &, byte_string_view calldata, Address const &self);

// Decides whether a call payload matches a whitelisted pattern. First match in
// storage order wins. An absent check list is a mismatch; whether the
// selector may be called at all is decided elsewhere.
class CalldataValidator
{
    CheckRegistry const &registry_;

public:
    explicit CalldataValidator(CheckRegistry const &);

    bool is_valid(Address const &target, byte_string_view calldata) const;

    // index of the first matching check
    std::optional<size_t>
    match(Address const &target, byte_string_view calldata) const;
};

GOVGATE_NAMESPACE_END
