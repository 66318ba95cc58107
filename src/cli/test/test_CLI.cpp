/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <memory>
#include <string>

#include "libocmirror/CLIArguments.hpp"
#include "libocmirror/Error.hpp"
#include "libocmirror/Logger.hpp"
#include "common/Config.hpp"
#include "cli/CLI.hpp"
#include "cli/CommandHelp.hpp"
#include "cli/CommandHelpOfCommand.hpp"
#include "cli/CommandMirror.hpp"
#include "cli/CommandObjectsFactory.hpp"
#include "cli/CommandPrepare.hpp"
#include "cli/CommandVersion.hpp"
#include "test_utility/config.hpp"
#include "test_utility/unittest_main_function.hpp"


namespace ocmirror {
namespace cli {
namespace test {

TEST_GROUP(CLITestGroup) {
    void teardown() {
        libocmirror::Logger::getInstance().setLevel(libocmirror::LogLevel::WARN);
    }
};

std::unique_ptr<cli::Command> generateCommandFromCLIArguments(const libocmirror::CLIArguments& args,
                                                              std::shared_ptr<common::Config> config) {
    auto cli = cli::CLI{};
    return cli.parseCommandLine(args, std::move(config));
}

std::unique_ptr<cli::Command> generateCommandFromCLIArguments(const libocmirror::CLIArguments& args) {
    auto configRAII = test_utility::config::makeConfig();
    return generateCommandFromCLIArguments(args, configRAII.config);
}

template<class ExpectedDynamicType>
void checkCommandDynamicType(const cli::Command& command) {
    CHECK(dynamic_cast<const ExpectedDynamicType*>(&command) != nullptr);
}

TEST(CLITestGroup, CommandTypes) {
    auto command = generateCommandFromCLIArguments({"oc-mirror"});
    checkCommandDynamicType<cli::CommandHelp>(*command);

    command = generateCommandFromCLIArguments({"oc-mirror", "help"});
    checkCommandDynamicType<cli::CommandHelp>(*command);

    command = generateCommandFromCLIArguments({"oc-mirror", "--help"});
    checkCommandDynamicType<cli::CommandHelp>(*command);

    command = generateCommandFromCLIArguments({"oc-mirror", "help", "mirror"});
    checkCommandDynamicType<cli::CommandHelpOfCommand>(*command);

    command = generateCommandFromCLIArguments({"oc-mirror", "help", "prepare"});
    checkCommandDynamicType<cli::CommandHelpOfCommand>(*command);

    command = generateCommandFromCLIArguments({"oc-mirror", "mirror", "-c", "isc.json", "file:///tmp/mirror"});
    checkCommandDynamicType<cli::CommandMirror>(*command);

    command = generateCommandFromCLIArguments({"oc-mirror", "prepare", "-c", "isc.json", "--from", "file:///tmp/mirror"});
    checkCommandDynamicType<cli::CommandPrepare>(*command);

    command = generateCommandFromCLIArguments({"oc-mirror", "version"});
    checkCommandDynamicType<cli::CommandVersion>(*command);

    command = generateCommandFromCLIArguments({"oc-mirror", "--version"});
    checkCommandDynamicType<cli::CommandVersion>(*command);
}

TEST(CLITestGroup, UnknownCommandOrOption) {
    CHECK_THROWS(libocmirror::Error, generateCommandFromCLIArguments({"oc-mirror", "pull"}));
    CHECK_THROWS(libocmirror::Error, generateCommandFromCLIArguments({"oc-mirror", "help", "pull"}));
    CHECK_THROWS(libocmirror::Error, generateCommandFromCLIArguments({"oc-mirror", "--invalid-option"}));
    CHECK_THROWS(libocmirror::Error, generateCommandFromCLIArguments({"oc-mirror", "help", "mirror", "prepare"}));
}

TEST(CLITestGroup, CommandNames) {
    auto names = cli::CommandObjectsFactory{}.getCommandNames();
    CHECK(names.size() == 4);
    CHECK(cli::CommandObjectsFactory{}.isValidCommandName("mirror"));
    CHECK(cli::CommandObjectsFactory{}.isValidCommandName("prepare"));
    CHECK(!cli::CommandObjectsFactory{}.isValidCommandName("run"));
}

TEST(CLITestGroup, mirror_to_disk_options) {
    auto configRAII = test_utility::config::makeConfig();
    auto config = configRAII.config;

    generateCommandFromCLIArguments({"oc-mirror", "mirror",
                                     "--config", "isc.json",
                                     "--loglevel", "debug",
                                     "--dir", "custom-dir",
                                     "--port", "55000",
                                     "-q", "-f", "--secure-policy",
                                     "--src-tls-verify", "false",
                                     "file:///tmp/mirror"}, config);

    CHECK_EQUAL(config->global.configPath, std::string{"isc.json"});
    CHECK_EQUAL(config->global.logLevel, std::string{"debug"});
    CHECK_EQUAL(config->global.workingDirName, std::string{"custom-dir"});
    CHECK(config->global.port == 55000);
    CHECK(config->global.from.empty());
    CHECK(config->global.quiet);
    CHECK(config->global.force);
    CHECK(config->global.securePolicy);
    CHECK(!config->global.srcTlsVerify);
    CHECK(config->global.destTlsVerify);
    CHECK(libocmirror::Logger::getInstance().getLevel() == libocmirror::LogLevel::DEBUG);
}

TEST(CLITestGroup, mirror_default_options) {
    auto configRAII = test_utility::config::makeConfig();
    auto config = configRAII.config;

    generateCommandFromCLIArguments({"oc-mirror", "mirror", "-c", "isc.json",
                                     "--from", "file:///tmp/mirror",
                                     "docker://registry.example.com:5000/mirror"}, config);

    CHECK_EQUAL(config->global.logLevel, std::string{"info"});
    CHECK_EQUAL(config->global.workingDirName, std::string{"working-dir"});
    CHECK_EQUAL(config->global.from, std::string{"file:///tmp/mirror"});
    CHECK(config->global.port == 5000);
    CHECK(!config->global.quiet);
    CHECK(!config->global.force);
    CHECK(config->global.srcTlsVerify);
    CHECK(config->global.destTlsVerify);
}

TEST(CLITestGroup, mirror_invalid_arguments) {
    // missing destination
    CHECK_THROWS(libocmirror::Error, generateCommandFromCLIArguments({"oc-mirror", "mirror", "-c", "isc.json"}));
    // too many destinations
    CHECK_THROWS(libocmirror::Error, generateCommandFromCLIArguments({"oc-mirror", "mirror", "-c", "isc.json",
                                                                      "file:///tmp/a", "file:///tmp/b"}));
    // missing --config
    CHECK_THROWS(libocmirror::Error, generateCommandFromCLIArguments({"oc-mirror", "mirror", "file:///tmp/mirror"}));
    // docker:// destination without --from
    CHECK_THROWS(libocmirror::Error, generateCommandFromCLIArguments({"oc-mirror", "mirror", "-c", "isc.json",
                                                                      "docker://registry.example.com"}));
    // file:// destination with --from
    CHECK_THROWS(libocmirror::Error, generateCommandFromCLIArguments({"oc-mirror", "mirror", "-c", "isc.json",
                                                                      "--from", "file:///tmp/a", "file:///tmp/b"}));
    // unknown protocol
    CHECK_THROWS(libocmirror::Error, generateCommandFromCLIArguments({"oc-mirror", "mirror", "-c", "isc.json",
                                                                      "oci:///tmp/mirror"}));
    // invalid log level
    CHECK_THROWS(libocmirror::Error, generateCommandFromCLIArguments({"oc-mirror", "mirror", "-c", "isc.json",
                                                                      "--loglevel", "verbose", "file:///tmp/mirror"}));
    // invalid port
    CHECK_THROWS(libocmirror::Error, generateCommandFromCLIArguments({"oc-mirror", "mirror", "-c", "isc.json",
                                                                      "--port", "not-a-port", "file:///tmp/mirror"}));
    // unknown option
    CHECK_THROWS(libocmirror::Error, generateCommandFromCLIArguments({"oc-mirror", "mirror", "-c", "isc.json",
                                                                      "--unknown", "file:///tmp/mirror"}));
}

TEST(CLITestGroup, prepare_options) {
    auto configRAII = test_utility::config::makeConfig();
    auto config = configRAII.config;

    generateCommandFromCLIArguments({"oc-mirror", "prepare", "-c", "isc.json",
                                     "--from", "file:///tmp/mirror", "-p", "6000"}, config);

    CHECK_EQUAL(config->global.configPath, std::string{"isc.json"});
    CHECK_EQUAL(config->global.from, std::string{"file:///tmp/mirror"});
    CHECK(config->global.port == 6000);
}

TEST(CLITestGroup, prepare_invalid_arguments) {
    // missing --from
    CHECK_THROWS(libocmirror::Error, generateCommandFromCLIArguments({"oc-mirror", "prepare", "-c", "isc.json"}));
    // --from without file://
    CHECK_THROWS(libocmirror::Error, generateCommandFromCLIArguments({"oc-mirror", "prepare", "-c", "isc.json",
                                                                      "--from", "/tmp/mirror"}));
    // missing --config
    CHECK_THROWS(libocmirror::Error, generateCommandFromCLIArguments({"oc-mirror", "prepare",
                                                                      "--from", "file:///tmp/mirror"}));
    // positional arguments are not accepted
    CHECK_THROWS(libocmirror::Error, generateCommandFromCLIArguments({"oc-mirror", "prepare", "-c", "isc.json",
                                                                      "--from", "file:///tmp/mirror", "docker://registry"}));
    // mirror-only option
    CHECK_THROWS(libocmirror::Error, generateCommandFromCLIArguments({"oc-mirror", "prepare", "-c", "isc.json",
                                                                      "--force", "--from", "file:///tmp/mirror"}));
}

}}}

OCMIRROR_UNITTEST_MAIN_FUNCTION();
