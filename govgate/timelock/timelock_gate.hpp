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
#include <govgate/timelock/calldata_validator.hpp>
#include <govgate/timelock/check_registry.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

GOVGATE_NAMESPACE_BEGIN

// Front door of the whitelist. Mutations are only accepted from the executor;
// calls proposed for execution are matched against the registry and rejections
// are logged with enough context to diagnose the mismatch.
class TimelockGate
{
    Address executor_;
    CheckRegistry registry_;
    CalldataValidator validator_;

    Result<void> authorize(Address const &sender) const;

public:
    TimelockGate(
        Address const &self, Address const &trusted_operator,
        Address const &executor);

    TimelockGate(TimelockGate const &) = delete;
    TimelockGate &operator=(TimelockGate const &) = delete;

    Address const &executor() const noexcept
    {
        return executor_;
    }

    CheckRegistry const &registry() const noexcept
    {
        return registry_;
    }

    CalldataValidator const &validator() const noexcept
    {
        return validator_;
    }

    Result<void> add_check(
        Address const &sender, Address const &target, uint32_t selector,
        uint16_t start_index, uint16_t end_index,
        std::vector<byte_string> data, std::vector<bool> is_self_address_check);

    Result<void> add_checks(
        Address const &sender, std::span<Address const> targets,
        std::span<uint32_t const> selectors,
        std::span<uint16_t const> start_indexes,
        std::span<uint16_t const> end_indexes,
        std::span<std::vector<byte_string> const> datas,
        std::span<std::vector<bool> const> is_self_address_checks);

    Result<void> remove_check(
        Address const &sender, Address const &target, uint32_t selector,
        size_t index);

    Result<void> remove_checks(
        Address const &sender, std::span<Address const> targets,
        std::span<uint32_t const> selectors, std::span<size_t const> indexes);

    Result<void>
    check_call(Address const &target, byte_string_view calldata) const;
};

GOVGATE_NAMESPACE_END
