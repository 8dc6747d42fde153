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

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <vector>

GOVGATE_NAMESPACE_BEGIN

class TimelockGate;

struct WhitelistEntry
{
    Address target;
    uint32_t selector;
    uint16_t start_index;
    uint16_t end_index;
    std::vector<byte_string> data;
    std::vector<bool> is_self_address_check;
};

// On disk form of a gate and its whitelist:
//
// {
//   "self": "0x..", "trusted_operator": "0x..", "executor": "0x..",
//   "checks": [{
//     "target": "0x..", "selector": "0xa9059cbb",
//     "start_index": 16, "end_index": 36,
//     "data": ["0x..", ""], "self_address": [false, true]
//   }]
// }
//
// "self_address" may be omitted, in which case every candidate is literal.
struct WhitelistConfig
{
    Address self;
    Address trusted_operator;
    Address executor;
    std::vector<WhitelistEntry> checks;
};

Result<WhitelistConfig> parse_whitelist_config(nlohmann::json const &);

Result<WhitelistConfig> read_whitelist_config(std::filesystem::path const &);

// Adds every entry as the executor in one all-or-nothing batch.
Result<void> apply_whitelist(WhitelistConfig const &, TimelockGate &);

nlohmann::json dump_whitelist(TimelockGate const &);

GOVGATE_NAMESPACE_END
