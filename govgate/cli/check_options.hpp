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

#include <govgate/core/config.hpp>
#include <govgate/core/log_level_map.hpp>

#include <CLI/CLI.hpp>

#include <quill/Quill.h>

#include <filesystem>
#include <optional>
#include <string>

GOVGATE_NAMESPACE_BEGIN

struct CheckOptions
{
    std::filesystem::path config_path;
    std::optional<std::string> target;
    std::optional<std::string> calldata;
    bool list{false};
    quill::LogLevel log_level{quill::LogLevel::Info};
};

// --target and --calldata only make sense together
inline void add_check_options(CLI::App &cli, CheckOptions &opts)
{
    cli.add_option("--config", opts.config_path, "Whitelist json file")
        ->required()
        ->check(CLI::ExistingFile);
    auto *const target_opt = cli.add_option(
        "--target", opts.target, "Address of the call target");
    auto *const calldata_opt = cli.add_option(
        "--calldata", opts.calldata, "Hex encoded call payload");
    target_opt->needs(calldata_opt);
    calldata_opt->needs(target_opt);
    cli.add_flag("--list", opts.list, "Print the loaded whitelist as json");
    cli.add_option("--log_level", opts.log_level, "Logging level")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));
}

GOVGATE_NAMESPACE_END
