/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_cli_CommandVersion_hpp
#define ocmirror_cli_CommandVersion_hpp

#include <iostream>
#include <memory>

#include <boost/format.hpp>
#include <boost/program_options.hpp>

#include "libocmirror/CLIArguments.hpp"
#include "libocmirror/Error.hpp"
#include "libocmirror/Logger.hpp"
#include "common/Config.hpp"
#include "cli/Command.hpp"
#include "cli/HelpMessage.hpp"
#include "cli/Utility.hpp"


namespace ocmirror {
namespace cli {

class CommandVersion : public Command {
public:
    CommandVersion() = default;

    CommandVersion(const libocmirror::CLIArguments& args, std::shared_ptr<const common::Config> conf)
        : conf{std::move(conf)}
    {
        parseCommandArguments(args);
    }

    void execute() override {
        libocmirror::Logger::getInstance().log(conf->buildTime.version, "CommandVersion", libocmirror::LogLevel::GENERAL);
    }

    std::string getBriefDescription() const override {
        return "Show the oc-mirror version information";
    }

    void printHelpMessage() const override {
        auto printer = cli::HelpMessage()
            .setUsage("oc-mirror version")
            .setDescription(getBriefDescription());
        std::cout << printer;
    }

private:
    void parseCommandArguments(const libocmirror::CLIArguments& args) {
        cli::utility::printLog(boost::format("parsing CLI arguments of version command"), libocmirror::LogLevel::DEBUG);

        auto optionsDescription = boost::program_options::options_description();
        libocmirror::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);

        // the version command doesn't support positional arguments
        cli::utility::validateNumberOfPositionalArguments(positionalArgs, 0, 0, "version");

        // the version command doesn't support options
        if(nameAndOptionArgs.argc() > 1) {
            auto message = boost::format("Command 'version' doesn't support options"
                                         "\nSee 'oc-mirror help version'");
            utility::printLog(message, libocmirror::LogLevel::GENERAL, std::cerr);
            OCMIRROR_THROW_ERROR(message.str(), libocmirror::LogLevel::INFO);
        }

        cli::utility::printLog(boost::format("successfully parsed CLI arguments"), libocmirror::LogLevel::DEBUG);
    }

private:
    std::shared_ptr<const common::Config> conf;
};

}
}

#endif
