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

#include <govgate/core/fmt/bytes_fmt.hpp> // NOLINT
#include <govgate/core/likely.h>
#include <govgate/timelock/timelock_error.hpp>
#include <govgate/timelock/timelock_gate.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <span>
#include <string>
#include <utility>

GOVGATE_ANONYMOUS_NAMESPACE_BEGIN

std::string describe_ranges(std::span<CalldataCheck const> const checks)
{
    fmt::memory_buffer mb;
    std::back_insert_iterator i{mb};
    for (auto const &check : checks) {
        if (mb.size() != 0) {
            *i++ = ' ';
        }
        i = fmt::format_to(i, "[{},{})", check.start_index, check.end_index);
    }
    return fmt::to_string(mb);
}

template <typename T>
Result<T> log_failure(char const *const op, Result<T> res)
{
    if (GOVGATE_UNLIKELY(res.has_error())) {
        LOG_WARNING("{} rejected: {}", op, res.error().message().c_str());
    }
    return res;
}

GOVGATE_ANONYMOUS_NAMESPACE_END

GOVGATE_NAMESPACE_BEGIN

TimelockGate::TimelockGate(
    Address const &self, Address const &trusted_operator,
    Address const &executor)
    : executor_{executor}
    , registry_{self, trusted_operator}
    , validator_{registry_}
{
}

Result<void> TimelockGate::authorize(Address const &sender) const
{
    if (GOVGATE_UNLIKELY(sender != executor_)) {
        LOG_WARNING("unauthorized sender {}", sender);
        return TimelockError::Unauthorized;
    }
    return outcome::success();
}

Result<void> TimelockGate::add_check(
    Address const &sender, Address const &target, uint32_t const selector,
    uint16_t const start_index, uint16_t const end_index,
    std::vector<byte_string> data, std::vector<bool> is_self_address_check)
{
    BOOST_OUTCOME_TRY(authorize(sender));
    size_t const candidates = data.size();
    BOOST_OUTCOME_TRY(log_failure(
        "add_check",
        registry_.add_check(
            target,
            selector,
            start_index,
            end_index,
            std::move(data),
            std::move(is_self_address_check))));

    LOG_INFO(
        "calldata check added target={} selector={:#010x} range=[{},{}) "
        "candidates={}",
        target,
        selector,
        start_index,
        end_index,
        candidates);
    return outcome::success();
}

Result<void> TimelockGate::add_checks(
    Address const &sender, std::span<Address const> const targets,
    std::span<uint32_t const> const selectors,
    std::span<uint16_t const> const start_indexes,
    std::span<uint16_t const> const end_indexes,
    std::span<std::vector<byte_string> const> const datas,
    std::span<std::vector<bool> const> const is_self_address_checks)
{
    BOOST_OUTCOME_TRY(authorize(sender));
    BOOST_OUTCOME_TRY(log_failure(
        "add_checks",
        registry_.add_checks(
            targets,
            selectors,
            start_indexes,
            end_indexes,
            datas,
            is_self_address_checks)));

    LOG_INFO("{} calldata checks added", targets.size());
    return outcome::success();
}

Result<void> TimelockGate::remove_check(
    Address const &sender, Address const &target, uint32_t const selector,
    size_t const index)
{
    BOOST_OUTCOME_TRY(authorize(sender));
    BOOST_OUTCOME_TRY(log_failure(
        "remove_check", registry_.remove_check(target, selector, index)));

    LOG_INFO(
        "calldata check removed target={} selector={:#010x} index={}",
        target,
        selector,
        index);
    return outcome::success();
}

Result<void> TimelockGate::remove_checks(
    Address const &sender, std::span<Address const> const targets,
    std::span<uint32_t const> const selectors,
    std::span<size_t const> const indexes)
{
    BOOST_OUTCOME_TRY(authorize(sender));
    BOOST_OUTCOME_TRY(log_failure(
        "remove_checks",
        registry_.remove_checks(targets, selectors, indexes)));

    LOG_INFO("{} calldata checks removed", targets.size());
    return outcome::success();
}

Result<void> TimelockGate::check_call(
    Address const &target, byte_string_view const calldata) const
{
    if (GOVGATE_UNLIKELY(calldata.size() < SELECTOR_SIZE)) {
        LOG_WARNING(
            "call to {} rejected: {} byte calldata has no selector",
            target,
            calldata.size());
        return TimelockError::CalldataTooShort;
    }

    auto const selector = load_selector(calldata);
    auto const matched = validator_.match(target, calldata);
    if (GOVGATE_UNLIKELY(!matched.has_value())) {
        auto const checks = registry_.get_checks(target, selector);
        LOG_WARNING(
            "call to {} rejected: selector={:#010x} calldata_size={} "
            "checks={} ranges={}",
            target,
            selector,
            calldata.size(),
            checks.size(),
            describe_ranges(checks));
        return TimelockError::CalldataNotWhitelisted;
    }

    LOG_DEBUG(
        "call to {} selector={:#010x} matched check {}",
        target,
        selector,
        matched.value());
    return outcome::success();
}

GOVGATE_NAMESPACE_END
