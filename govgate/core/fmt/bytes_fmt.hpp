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

/**
 * @file
 *
 * fmtlib formatters for addresses and raw byte strings, so they can be passed
 * straight to the logging macros.
 */

#include <govgate/core/address.hpp>
#include <govgate/core/byte_string.hpp>

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>

#include <quill/bundled/fmt/format.h>

#include <string>
#include <string_view>

template <>
struct fmt::formatter<govgate::Address> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(govgate::Address const &value, FormatContext &ctx) const
    {
        std::string const s =
            "0x" + evmc::hex(evmc::bytes_view{value.bytes, sizeof(value)});
        return fmt::formatter<std::string_view>::format(s, ctx);
    }
};

template <>
struct fmt::formatter<govgate::byte_string> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(govgate::byte_string const &value, FormatContext &ctx) const
    {
        std::string const s = "0x" + evmc::hex(value);
        return fmt::formatter<std::string_view>::format(s, ctx);
    }
};
