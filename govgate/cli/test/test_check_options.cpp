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

#include <CLI/CLI.hpp>

#include <gtest/gtest.h>

#include <quill/Quill.h>

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <string>

using namespace govgate;

struct CheckCli : public ::testing::Test
{
    static constexpr char const *TARGET =
        "0x00000000000000000000000000000000deadbeef";
    static constexpr char const *CALLDATA = "0xa9059cbb";

    std::filesystem::path config;
    CheckOptions opts;
    CLI::App cli{"govgate_check"};

    void SetUp() override
    {
        config = std::filesystem::temp_directory_path() /
                 ("govgate_cli_" + std::to_string(getpid()) + ".json");
        std::ofstream{config} << "{}";
        add_check_options(cli, opts);
    }

    void TearDown() override
    {
        std::filesystem::remove(config);
    }

    void parse(std::string const &args)
    {
        cli.parse("--config " + config.string() + " " + args, false);
    }
};

TEST_F(CheckCli, config_only)
{
    parse("");
    EXPECT_EQ(opts.config_path, config);
    EXPECT_FALSE(opts.target.has_value());
    EXPECT_FALSE(opts.calldata.has_value());
    EXPECT_FALSE(opts.list);
    EXPECT_EQ(opts.log_level, quill::LogLevel::Info);
}

TEST_F(CheckCli, target_and_calldata)
{
    parse(
        std::string{"--target "} + TARGET + " --calldata " + CALLDATA +
        " --list --log_level DEBUG");
    EXPECT_EQ(opts.target, TARGET);
    EXPECT_EQ(opts.calldata, CALLDATA);
    EXPECT_TRUE(opts.list);
    EXPECT_EQ(opts.log_level, quill::LogLevel::Debug);
}

TEST_F(CheckCli, target_requires_calldata)
{
    EXPECT_THROW(parse(std::string{"--target "} + TARGET), CLI::RequiresError);
}

TEST_F(CheckCli, calldata_requires_target)
{
    EXPECT_THROW(
        parse(std::string{"--calldata "} + CALLDATA), CLI::RequiresError);
}

TEST_F(CheckCli, config_is_required)
{
    EXPECT_THROW(cli.parse("--list", false), CLI::RequiredError);
}

TEST_F(CheckCli, config_must_exist)
{
    EXPECT_THROW(
        cli.parse("--config " + config.string() + ".missing", false),
        CLI::ValidationError);
}

TEST_F(CheckCli, unknown_log_level)
{
    EXPECT_THROW(parse("--log_level verbose"), CLI::ValidationError);
}
