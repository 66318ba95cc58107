/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <climits>
#include <string>
#include <tuple>

#include <boost/program_options.hpp>

#include "libocmirror/CLIArguments.hpp"
#include "libocmirror/Error.hpp"
#include "cli/Utility.hpp"
#include "test_utility/unittest_main_function.hpp"


namespace ocmirror {
namespace cli {
namespace test {

TEST_GROUP(CLIUtilityTestGroup) {
};

static std::tuple<libocmirror::CLIArguments, libocmirror::CLIArguments> generateGroupedArguments(
        const libocmirror::CLIArguments& args,
        const boost::program_options::options_description& optionsDescription) {
    return cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);
}

static boost::program_options::options_description makeMirrorOptions(std::string& config, std::string& from) {
    auto optionsDescription = boost::program_options::options_description();
    optionsDescription.add_options()
        ("config,c", boost::program_options::value<std::string>(&config), "Configuration")
        ("from", boost::program_options::value<std::string>(&from), "Source directory")
        ("quiet,q", "Quiet")
        ("force,f", "Force");
    return optionsDescription;
}

TEST(CLIUtilityTestGroup, command_name_only) {
    auto optionsDescription = boost::program_options::options_description();
    libocmirror::CLIArguments nameAndOptionArgs, positionalArgs;
    std::tie(nameAndOptionArgs, positionalArgs) = generateGroupedArguments({"mirror"}, optionsDescription);
    CHECK(positionalArgs.empty());
    CHECK_EQUAL(nameAndOptionArgs.argc(), 1);
    CHECK_EQUAL(std::string{nameAndOptionArgs.argv()[0]}, std::string{"mirror"});
}

TEST(CLIUtilityTestGroup, options_with_separated_values) {
    auto config = std::string{};
    auto from = std::string{};
    auto optionsDescription = makeMirrorOptions(config, from);
    libocmirror::CLIArguments nameAndOptionArgs, positionalArgs;
    std::tie(nameAndOptionArgs, positionalArgs) = generateGroupedArguments(
        {"mirror", "--config", "isc.json", "--from", "file:///tmp/mirror", "docker://registry.example.com"},
        optionsDescription);

    CHECK_EQUAL(nameAndOptionArgs.argc(), 5);
    CHECK_EQUAL(std::string{nameAndOptionArgs.argv()[2]}, std::string{"isc.json"});
    CHECK_EQUAL(std::string{nameAndOptionArgs.argv()[4]}, std::string{"file:///tmp/mirror"});

    CHECK_EQUAL(positionalArgs.argc(), 1);
    CHECK_EQUAL(std::string{positionalArgs.argv()[0]}, std::string{"docker://registry.example.com"});
}

TEST(CLIUtilityTestGroup, options_with_adjacent_values) {
    auto config = std::string{};
    auto from = std::string{};
    auto optionsDescription = makeMirrorOptions(config, from);
    libocmirror::CLIArguments nameAndOptionArgs, positionalArgs;
    std::tie(nameAndOptionArgs, positionalArgs) = generateGroupedArguments(
        {"mirror", "-cisc.json", "--from=file:///tmp/mirror", "docker://registry.example.com"},
        optionsDescription);

    CHECK_EQUAL(nameAndOptionArgs.argc(), 3);
    CHECK_EQUAL(std::string{nameAndOptionArgs.argv()[1]}, std::string{"-cisc.json"});
    CHECK_EQUAL(std::string{nameAndOptionArgs.argv()[2]}, std::string{"--from=file:///tmp/mirror"});

    CHECK_EQUAL(positionalArgs.argc(), 1);
    CHECK_EQUAL(std::string{positionalArgs.argv()[0]}, std::string{"docker://registry.example.com"});
}

TEST(CLIUtilityTestGroup, sticky_short_options) {
    auto config = std::string{};
    auto from = std::string{};
    auto optionsDescription = makeMirrorOptions(config, from);
    libocmirror::CLIArguments nameAndOptionArgs, positionalArgs;
    std::tie(nameAndOptionArgs, positionalArgs) = generateGroupedArguments(
        {"mirror", "-qfc", "isc.json", "file:///tmp/mirror"},
        optionsDescription);

    CHECK_EQUAL(nameAndOptionArgs.argc(), 3);
    CHECK_EQUAL(std::string{nameAndOptionArgs.argv()[1]}, std::string{"-qfc"});
    CHECK_EQUAL(std::string{nameAndOptionArgs.argv()[2]}, std::string{"isc.json"});

    CHECK_EQUAL(positionalArgs.argc(), 1);
    CHECK_EQUAL(std::string{positionalArgs.argv()[0]}, std::string{"file:///tmp/mirror"});
}

TEST(CLIUtilityTestGroup, options_after_first_positional_are_positionals) {
    auto config = std::string{};
    auto from = std::string{};
    auto optionsDescription = makeMirrorOptions(config, from);
    libocmirror::CLIArguments nameAndOptionArgs, positionalArgs;
    std::tie(nameAndOptionArgs, positionalArgs) = generateGroupedArguments(
        {"mirror", "-q", "file:///tmp/mirror", "--config", "isc.json"},
        optionsDescription);

    CHECK_EQUAL(nameAndOptionArgs.argc(), 2);
    CHECK_EQUAL(positionalArgs.argc(), 3);
    CHECK_EQUAL(std::string{positionalArgs.argv()[0]}, std::string{"file:///tmp/mirror"});
    CHECK_EQUAL(std::string{positionalArgs.argv()[1]}, std::string{"--config"});
}

TEST(CLIUtilityTestGroup, option_value_missing_at_the_end) {
    auto config = std::string{};
    auto from = std::string{};
    auto optionsDescription = makeMirrorOptions(config, from);
    libocmirror::CLIArguments nameAndOptionArgs, positionalArgs;
    std::tie(nameAndOptionArgs, positionalArgs) = generateGroupedArguments(
        {"prepare", "-q", "--from"},
        optionsDescription);

    CHECK(positionalArgs.empty());
    CHECK_EQUAL(nameAndOptionArgs.argc(), 3);
    CHECK_EQUAL(std::string{nameAndOptionArgs.argv()[2]}, std::string{"--from"});
}

TEST(CLIUtilityTestGroup, validateNumberOfPositionalArguments) {
    // no positionals expected
    cli::utility::validateNumberOfPositionalArguments({}, 0, 0, "prepare");
    // exactly one destination
    cli::utility::validateNumberOfPositionalArguments({"file:///tmp/mirror"}, 1, 1, "mirror");
    // at least 1 positional expected
    cli::utility::validateNumberOfPositionalArguments({"arg0", "arg1", "arg2"}, 1, INT_MAX, "command");
    // too few arguments
    CHECK_THROWS(libocmirror::Error, cli::utility::validateNumberOfPositionalArguments({}, 1, 1, "mirror"));
    // too few arguments with no max
    CHECK_THROWS(libocmirror::Error, cli::utility::validateNumberOfPositionalArguments({"arg0"}, 2, INT_MAX, "command"));
    // too many arguments with 0 max
    CHECK_THROWS(libocmirror::Error, cli::utility::validateNumberOfPositionalArguments({"arg0"}, 0, 0, "prepare"));
    // too many arguments with non-zero max
    CHECK_THROWS(libocmirror::Error, cli::utility::validateNumberOfPositionalArguments({"arg0", "arg1"}, 1, 1, "mirror"));
}

}}}

OCMIRROR_UNITTEST_MAIN_FUNCTION();
