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

#include <govgate/core/assert.h>
#include <govgate/core/likely.h>
#include <govgate/timelock/check_registry.hpp>
#include <govgate/timelock/timelock_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

GOVGATE_NAMESPACE_BEGIN

CheckRegistry::CheckRegistry(
    Address const &self, Address const &trusted_operator)
    : self_{self}
    , trusted_operator_{trusted_operator}
{
}

CheckRegistry::PairState CheckRegistry::pair_state(CheckKey const &key) const
{
    auto const it = checks_.find(key);
    if (it == checks_.end() || it->second.empty()) {
        return {.count = 0, .wildcard = false};
    }
    return {
        .count = it->second.size(),
        .wildcard = it->second.front().is_wildcard()};
}

Result<void> CheckRegistry::validate_add(
    CheckKey const &key, CalldataCheck const &check,
    PairState const &state) const
{
    if (GOVGATE_UNLIKELY(key.target == self_)) {
        return TimelockError::TargetIsSelf;
    }
    if (GOVGATE_UNLIKELY(key.target == trusted_operator_)) {
        return TimelockError::TargetIsTrustedOperator;
    }
    if (GOVGATE_UNLIKELY(
            check.data.size() != check.is_self_address_check.size())) {
        return TimelockError::ArityMismatch;
    }
    if (GOVGATE_UNLIKELY(check.start_index < MIN_START_INDEX)) {
        return TimelockError::StartIndexTooSmall;
    }
    if (check.start_index == check.end_index) {
        if (GOVGATE_UNLIKELY(check.start_index != MIN_START_INDEX)) {
            return TimelockError::EqualIndexesNotWildcard;
        }
    }
    else if (GOVGATE_UNLIKELY(check.end_index < check.start_index)) {
        return TimelockError::EndIndexNotGreater;
    }

    if (check.is_wildcard()) {
        if (GOVGATE_UNLIKELY(state.count != 0)) {
            return TimelockError::WildcardWithExistingChecks;
        }
    }
    else if (GOVGATE_UNLIKELY(state.wildcard)) {
        return TimelockError::CheckAfterWildcard;
    }

    return outcome::success();
}

Result<void> CheckRegistry::add_check(
    Address const &target, uint32_t const selector, uint16_t const start_index,
    uint16_t const end_index, std::vector<byte_string> data,
    std::vector<bool> is_self_address_check)
{
    CheckKey const key{.target = target, .selector = selector};
    CalldataCheck check{
        .start_index = start_index,
        .end_index = end_index,
        .data = std::move(data),
        .is_self_address_check = std::move(is_self_address_check)};

    BOOST_OUTCOME_TRY(validate_add(key, check, pair_state(key)));

    checks_[key].push_back(std::move(check));
    return outcome::success();
}

Result<void> CheckRegistry::add_checks(
    std::span<Address const> const targets,
    std::span<uint32_t const> const selectors,
    std::span<uint16_t const> const start_indexes,
    std::span<uint16_t const> const end_indexes,
    std::span<std::vector<byte_string> const> const datas,
    std::span<std::vector<bool> const> const is_self_address_checks)
{
    size_t const n = targets.size();
    if (GOVGATE_UNLIKELY(
            selectors.size() != n || start_indexes.size() != n ||
            end_indexes.size() != n || datas.size() != n ||
            is_self_address_checks.size() != n)) {
        return TimelockError::BatchArityMismatch;
    }

    std::vector<std::pair<CheckKey, CalldataCheck>> staged;
    staged.reserve(n);
    ankerl::unordered_dense::map<CheckKey, PairState, CheckKeyHash> states;

    for (size_t i = 0; i < n; ++i) {
        CheckKey const key{.target = targets[i], .selector = selectors[i]};
        CalldataCheck check{
            .start_index = start_indexes[i],
            .end_index = end_indexes[i],
            .data = datas[i],
            .is_self_address_check = is_self_address_checks[i]};

        auto [it, inserted] = states.try_emplace(key);
        if (inserted) {
            it->second = pair_state(key);
        }
        BOOST_OUTCOME_TRY(validate_add(key, check, it->second));

        if (it->second.count == 0) {
            it->second.wildcard = check.is_wildcard();
        }
        ++it->second.count;
        staged.emplace_back(key, std::move(check));
    }

    for (auto &[key, check] : staged) {
        checks_[key].push_back(std::move(check));
    }
    return outcome::success();
}

Result<void> CheckRegistry::remove_check(
    Address const &target, uint32_t const selector, size_t const index)
{
    auto const it =
        checks_.find(CheckKey{.target = target, .selector = selector});
    if (GOVGATE_UNLIKELY(it == checks_.end() || it->second.empty())) {
        return TimelockError::NoChecksForPair;
    }

    auto &list = it->second;
    if (GOVGATE_UNLIKELY(index >= list.size())) {
        return TimelockError::IndexOutOfBounds;
    }

    if (index != list.size() - 1) {
        list[index] = std::move(list.back());
    }
    list.pop_back();

    if (list.empty()) {
        checks_.erase(it);
    }
    return outcome::success();
}

Result<void> CheckRegistry::remove_checks(
    std::span<Address const> const targets,
    std::span<uint32_t const> const selectors,
    std::span<size_t const> const indexes)
{
    size_t const n = targets.size();
    if (GOVGATE_UNLIKELY(selectors.size() != n || indexes.size() != n)) {
        return TimelockError::BatchRemoveArityMismatch;
    }

    // only the sizes matter for validation
    ankerl::unordered_dense::map<CheckKey, size_t, CheckKeyHash> sizes;
    for (size_t i = 0; i < n; ++i) {
        CheckKey const key{.target = targets[i], .selector = selectors[i]};
        auto [it, inserted] = sizes.try_emplace(key);
        if (inserted) {
            it->second = pair_state(key).count;
        }
        if (GOVGATE_UNLIKELY(it->second == 0)) {
            return TimelockError::NoChecksForPair;
        }
        if (GOVGATE_UNLIKELY(indexes[i] >= it->second)) {
            return TimelockError::IndexOutOfBounds;
        }
        --it->second;
    }

    for (size_t i = 0; i < n; ++i) {
        auto const res = remove_check(targets[i], selectors[i], indexes[i]);
        GOVGATE_ASSERT(res.has_value());
    }
    return outcome::success();
}

std::span<CalldataCheck const>
CheckRegistry::get_checks(Address const &target, uint32_t const selector) const
{
    auto const it =
        checks_.find(CheckKey{.target = target, .selector = selector});
    if (it == checks_.end()) {
        return {};
    }
    return it->second;
}

std::vector<CheckKey> CheckRegistry::pairs() const
{
    std::vector<CheckKey> keys;
    keys.reserve(checks_.size());
    for (auto const &[key, _] : checks_) {
        keys.push_back(key);
    }
    return keys;
}

GOVGATE_NAMESPACE_END
