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
#include <govgate/timelock/calldata_check.hpp>
#include <govgate/timelock/check_registry.hpp>
#include <govgate/timelock/config_error.hpp>
#include <govgate/timelock/timelock_gate.hpp>
#include <govgate/timelock/whitelist_config.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <evmc/hex.hpp>

#include <intx/intx.hpp>

#include <nlohmann/json.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>
#include <utility>
#include <vector>

GOVGATE_ANONYMOUS_NAMESPACE_BEGIN

Result<nlohmann::json const *>
field(nlohmann::json const &j, char const *const name)
{
    if (GOVGATE_UNLIKELY(!j.is_object() || !j.contains(name))) {
        LOG_ERROR("whitelist: missing field \"{}\"", name);
        return ConfigError::MissingField;
    }
    return &j.at(name);
}

Result<std::string>
string_field(nlohmann::json const &j, char const *const name)
{
    BOOST_OUTCOME_TRY(auto const *const value, field(j, name));
    if (GOVGATE_UNLIKELY(!value->is_string())) {
        LOG_ERROR("whitelist: field \"{}\" is not a string", name);
        return ConfigError::InvalidType;
    }
    return value->get<std::string>();
}

Result<byte_string> decode_hex(std::string const &s)
{
    auto decoded = evmc::from_hex(s);
    if (GOVGATE_UNLIKELY(!decoded.has_value())) {
        LOG_ERROR("whitelist: \"{}\" is not hex", s);
        return ConfigError::InvalidHex;
    }
    return byte_string{decoded->data(), decoded->size()};
}

Result<Address> address_field(nlohmann::json const &j, char const *const name)
{
    BOOST_OUTCOME_TRY(auto const s, string_field(j, name));
    auto const decoded = evmc::from_hex(s);
    if (GOVGATE_UNLIKELY(
            !decoded.has_value() || decoded->size() != sizeof(Address))) {
        LOG_ERROR("whitelist: field \"{}\" is not an address: {}", name, s);
        return ConfigError::InvalidAddress;
    }
    Address address{};
    std::memcpy(address.bytes, decoded->data(), sizeof(Address));
    return address;
}

Result<uint32_t> selector_field(nlohmann::json const &j)
{
    BOOST_OUTCOME_TRY(auto const s, string_field(j, "selector"));
    auto const decoded = evmc::from_hex(s);
    if (GOVGATE_UNLIKELY(
            !decoded.has_value() || decoded->size() != SELECTOR_SIZE)) {
        LOG_ERROR("whitelist: \"{}\" is not a 4 byte selector", s);
        return ConfigError::InvalidSelector;
    }
    return intx::be::unsafe::load<uint32_t>(decoded->data());
}

Result<uint16_t> index_field(nlohmann::json const &j, char const *const name)
{
    BOOST_OUTCOME_TRY(auto const *const value, field(j, name));
    if (GOVGATE_UNLIKELY(!value->is_number_unsigned())) {
        LOG_ERROR("whitelist: field \"{}\" is not an unsigned integer", name);
        return ConfigError::InvalidType;
    }
    auto const index = value->get<uint64_t>();
    if (GOVGATE_UNLIKELY(index > std::numeric_limits<uint16_t>::max())) {
        LOG_ERROR("whitelist: field \"{}\" out of range: {}", name, index);
        return ConfigError::InvalidIndex;
    }
    return static_cast<uint16_t>(index);
}

Result<WhitelistEntry> parse_entry(nlohmann::json const &j)
{
    WhitelistEntry entry{};
    BOOST_OUTCOME_TRY(entry.target, address_field(j, "target"));
    BOOST_OUTCOME_TRY(entry.selector, selector_field(j));
    BOOST_OUTCOME_TRY(entry.start_index, index_field(j, "start_index"));
    BOOST_OUTCOME_TRY(entry.end_index, index_field(j, "end_index"));

    BOOST_OUTCOME_TRY(auto const *const data, field(j, "data"));
    if (GOVGATE_UNLIKELY(!data->is_array())) {
        LOG_ERROR("whitelist: field \"data\" is not an array");
        return ConfigError::InvalidType;
    }
    for (auto const &candidate : *data) {
        if (GOVGATE_UNLIKELY(!candidate.is_string())) {
            LOG_ERROR("whitelist: data candidate is not a string");
            return ConfigError::InvalidType;
        }
        BOOST_OUTCOME_TRY(
            auto bytes, decode_hex(candidate.get<std::string>()));
        entry.data.push_back(std::move(bytes));
    }

    if (!j.contains("self_address")) {
        entry.is_self_address_check.assign(entry.data.size(), false);
        return entry;
    }
    auto const &flags = j.at("self_address");
    if (GOVGATE_UNLIKELY(!flags.is_array())) {
        LOG_ERROR("whitelist: field \"self_address\" is not an array");
        return ConfigError::InvalidType;
    }
    for (auto const &flag : flags) {
        if (GOVGATE_UNLIKELY(!flag.is_boolean())) {
            LOG_ERROR("whitelist: self_address flag is not a boolean");
            return ConfigError::InvalidType;
        }
        entry.is_self_address_check.push_back(flag.get<bool>());
    }
    return entry;
}

std::string to_hex(byte_string_view const bytes)
{
    return "0x" + evmc::hex(bytes);
}

GOVGATE_ANONYMOUS_NAMESPACE_END

GOVGATE_NAMESPACE_BEGIN

Result<WhitelistConfig> parse_whitelist_config(nlohmann::json const &j)
{
    WhitelistConfig config{};
    BOOST_OUTCOME_TRY(config.self, address_field(j, "self"));
    BOOST_OUTCOME_TRY(
        config.trusted_operator, address_field(j, "trusted_operator"));
    BOOST_OUTCOME_TRY(config.executor, address_field(j, "executor"));

    if (!j.contains("checks")) {
        return config;
    }
    auto const &checks = j.at("checks");
    if (GOVGATE_UNLIKELY(!checks.is_array())) {
        LOG_ERROR("whitelist: field \"checks\" is not an array");
        return ConfigError::InvalidType;
    }
    config.checks.reserve(checks.size());
    for (auto const &check : checks) {
        BOOST_OUTCOME_TRY(auto entry, parse_entry(check));
        config.checks.push_back(std::move(entry));
    }
    return config;
}

Result<WhitelistConfig>
read_whitelist_config(std::filesystem::path const &path)
{
    std::ifstream ifile(path);
    if (GOVGATE_UNLIKELY(!ifile.is_open())) {
        LOG_ERROR("whitelist: cannot open {}", path.string());
        return ConfigError::FileNotFound;
    }
    auto const j = nlohmann::json::parse(ifile, nullptr, false);
    if (GOVGATE_UNLIKELY(j.is_discarded())) {
        LOG_ERROR("whitelist: {} is not valid json", path.string());
        return ConfigError::InvalidJson;
    }
    return parse_whitelist_config(j);
}

Result<void> apply_whitelist(WhitelistConfig const &config, TimelockGate &gate)
{
    size_t const n = config.checks.size();
    std::vector<Address> targets;
    std::vector<uint32_t> selectors;
    std::vector<uint16_t> start_indexes;
    std::vector<uint16_t> end_indexes;
    std::vector<std::vector<byte_string>> datas;
    std::vector<std::vector<bool>> is_self_address_checks;
    targets.reserve(n);
    selectors.reserve(n);
    start_indexes.reserve(n);
    end_indexes.reserve(n);
    datas.reserve(n);
    is_self_address_checks.reserve(n);

    for (auto const &entry : config.checks) {
        targets.push_back(entry.target);
        selectors.push_back(entry.selector);
        start_indexes.push_back(entry.start_index);
        end_indexes.push_back(entry.end_index);
        datas.push_back(entry.data);
        is_self_address_checks.push_back(entry.is_self_address_check);
    }

    return gate.add_checks(
        gate.executor(),
        targets,
        selectors,
        start_indexes,
        end_indexes,
        datas,
        is_self_address_checks);
}

nlohmann::json dump_whitelist(TimelockGate const &gate)
{
    auto const &registry = gate.registry();
    auto const address_hex = [](Address const &a) {
        return to_hex(byte_string_view{a.bytes, sizeof(Address)});
    };

    nlohmann::json j;
    j["self"] = address_hex(registry.self());
    j["trusted_operator"] = address_hex(registry.trusted_operator());
    j["executor"] = address_hex(gate.executor());
    j["checks"] = nlohmann::json::array();

    auto keys = registry.pairs();
    std::ranges::sort(keys, [](CheckKey const &a, CheckKey const &b) {
        int const c =
            std::memcmp(a.target.bytes, b.target.bytes, sizeof(Address));
        return c != 0 ? c < 0 : a.selector < b.selector;
    });

    for (auto const &key : keys) {
        auto const checks = registry.get_checks(key.target, key.selector);
        for (auto const &check : checks) {
            nlohmann::json entry;
            entry["target"] = address_hex(key.target);
            entry["selector"] = to_hex(abi_encode_selector(key.selector));
            entry["start_index"] = check.start_index;
            entry["end_index"] = check.end_index;
            entry["data"] = nlohmann::json::array();
            for (auto const &candidate : check.data) {
                entry["data"].push_back(to_hex(candidate));
            }
            entry["self_address"] = nlohmann::json::array();
            for (bool const flag : check.is_self_address_check) {
                entry["self_address"].push_back(flag);
            }
            j["checks"].push_back(std::move(entry));
        }
    }
    return j;
}

GOVGATE_NAMESPACE_END
