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

#include <govgate/cli/check_options.hpp>
#include <govgate/core/address.hpp>
#include <govgate/core/byte_string.hpp>
#include <govgate/core/fmt/bytes_fmt.hpp> // NOLINT
#include <govgate/timelock/timelock_gate.hpp>
#include <govgate/timelock/whitelist_config.hpp>

#include <CLI/CLI.hpp>

#include <evmc/hex.hpp>

#include <quill/Quill.h>
#include <quill/bundled/fmt/core.h>
#include <quill/bundled/fmt/format.h>

#include <cstring>

using namespace govgate;

int main(int argc, char *argv[])
{
    CheckOptions opts;
    CLI::App cli{"govgate_check"};
    add_check_options(cli, opts);

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::CallForHelp const &e) {
        return cli.exit(e);
    }
    catch (CLI::ParseError const &e) {
        cli.exit(e);
        return 2;
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(time) [%(thread_id)] %(file_name):%(line_number) LOG_%(log_level)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(opts.log_level);

    auto const config = read_whitelist_config(opts.config_path);
    if (!config) {
        LOG_ERROR(
            "failed to load {}: {}",
            opts.config_path.string(),
            config.error().message().c_str());
        quill::flush();
        return 2;
    }

    TimelockGate gate{
        config.value().self,
        config.value().trusted_operator,
        config.value().executor};
    if (auto const res = apply_whitelist(config.value(), gate); !res) {
        LOG_ERROR(
            "failed to apply {}: {}",
            opts.config_path.string(),
            res.error().message().c_str());
        quill::flush();
        return 2;
    }
    LOG_INFO(
        "loaded {} checks over {} pairs from {}",
        config.value().checks.size(),
        gate.registry().size(),
        opts.config_path.string());

    if (opts.list) {
        fmt::println("{}", dump_whitelist(gate).dump(2));
    }

    if (!opts.calldata.has_value()) {
        quill::flush();
        return 0;
    }

    auto const target_bytes = evmc::from_hex(opts.target.value());
    if (!target_bytes.has_value() || target_bytes->size() != sizeof(Address)) {
        LOG_ERROR("invalid target address {}", opts.target.value());
        quill::flush();
        return 2;
    }
    Address target{};
    std::memcpy(target.bytes, target_bytes->data(), sizeof(Address));

    auto const calldata = evmc::from_hex(opts.calldata.value());
    if (!calldata.has_value()) {
        LOG_ERROR("invalid calldata {}", opts.calldata.value());
        quill::flush();
        return 2;
    }

    auto const res = gate.check_call(target, *calldata);
    quill::flush();
    if (!res) {
        fmt::println("rejected: {}", res.error().message().c_str());
        return 1;
    }
    fmt::println("allowed");
    return 0;
}
