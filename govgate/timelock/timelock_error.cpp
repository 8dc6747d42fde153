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

#include <govgate/timelock/timelock_error.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<govgate::TimelockError>::mapping> const &
quick_status_code_from_enum<govgate::TimelockError>::value_mappings()
{
    using govgate::TimelockError;

    static std::initializer_list<mapping> const v = {
        {TimelockError::Success, "success", {errc::success}},
        {TimelockError::BatchArityMismatch,
         "array length mismatch on batched add",
         {errc::invalid_argument}},
        {TimelockError::StartIndexTooSmall,
         "start index must be greater than 3",
         {errc::invalid_argument}},
        {TimelockError::EndIndexNotGreater,
         "end index must be greater than start index",
         {errc::invalid_argument}},
        {TimelockError::EqualIndexesNotWildcard,
         "end index equals start index only when it equals 4",
         {errc::invalid_argument}},
        {TimelockError::WildcardWithExistingChecks,
         "wildcard can only be added if no existing check for the pair",
         {}},
        {TimelockError::CheckAfterWildcard,
         "cannot add a non-wildcard check once a wildcard exists for the pair",
         {}},
        {TimelockError::TargetIsSelf,
         "target address cannot equal the registry's own address",
         {errc::invalid_argument}},
        {TimelockError::TargetIsTrustedOperator,
         "target address cannot equal the trusted-operator address",
         {errc::invalid_argument}},
        {TimelockError::ArityMismatch,
         "data and self address check lengths must match",
         {errc::invalid_argument}},
        {TimelockError::NoChecksForPair, "no checks exist for the pair", {}},
        {TimelockError::IndexOutOfBounds,
         "check index out of bounds",
         {errc::result_out_of_range}},
        {TimelockError::BatchRemoveArityMismatch,
         "array length mismatch on batched remove",
         {errc::invalid_argument}},
        {TimelockError::Unauthorized,
         "sender is not the executor",
         {errc::permission_denied}},
        {TimelockError::CalldataTooShort,
         "calldata shorter than a selector",
         {errc::invalid_argument}},
        {TimelockError::CalldataNotWhitelisted,
         "calldata does not match any check",
         {errc::permission_denied}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
