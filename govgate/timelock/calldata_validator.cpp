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

#include <govgate/core/likely.h>
#include <govgate/timelock/calldata_validator.hpp>
#include <govgate/timelock/check_registry.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>

GOVGATE_NAMESPACE_BEGIN

bool matches_self_address(byte_string_view const slice, Address const &self)
{
    if (slice.size() < sizeof(Address)) {
        return false;
    }
    size_t const padding = slice.size() - sizeof(Address);
    return std::all_of(
               slice.begin(),
               slice.begin() + static_cast<ptrdiff_t>(padding),
               [](uint8_t const b) { return b == 0; }) &&
           slice.substr(padding) ==
               byte_string_view{self.bytes, sizeof(Address)};
}

bool check_matches(
    CalldataCheck const &check, byte_string_view const calldata,
    Address const &self)
{
    if (check.is_wildcard()) {
        return true;
    }
    if (calldata.size() < check.end_index) {
        return false;
    }

    byte_string_view const slice = calldata.substr(
        check.start_index,
        static_cast<size_t>(check.end_index - check.start_index));

    for (size_t i = 0; i < check.data.size(); ++i) {
        bool const matched = check.is_self_address_check[i]
                                 ? matches_self_address(slice, self)
                                 : slice == check.data[i];
        if (matched) {
            return true;
        }
    }
    return false;
}

CalldataValidator::CalldataValidator(CheckRegistry const &registry)
    : registry_{registry}
{
}

std::optional<size_t> CalldataValidator::match(
    Address const &target, byte_string_view const calldata) const
{
    if (GOVGATE_UNLIKELY(calldata.size() < SELECTOR_SIZE)) {
        return std::nullopt;
    }

    auto const checks =
        registry_.get_checks(target, load_selector(calldata));
    for (size_t i = 0; i < checks.size(); ++i) {
        if (check_matches(checks[i], calldata, registry_.self())) {
            return i;
        }
    }
    return std::nullopt;
}

bool CalldataValidator::is_valid(
    Address const &target, byte_string_view const calldata) const
{
    return match(target, calldata).has_value();
}

GOVGATE_NAMESPACE_END
