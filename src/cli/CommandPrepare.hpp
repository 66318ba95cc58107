/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_cli_CommandPrepare_hpp
#define ocmirror_cli_CommandPrepare_hpp

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

#include <boost/format.hpp>
#include <boost/program_options.hpp>

#include "libocmirror/CLIArguments.hpp"
#include "libocmirror/Error.hpp"
#include "libocmirror/Utility.hpp"
#include "common/Config.hpp"
#include "common/Context.hpp"
#include "cli/Command.hpp"
#include "cli/HelpMessage.hpp"
#include "cli/Utility.hpp"
#include "workflow/Executor.hpp"


namespace ocmirror {
namespace cli {

class CommandPrepare : public Command {
public:
    CommandPrepare() {
        initializeOptionsDescription();
    }

    CommandPrepare(const libocmirror::CLIArguments& args, std::shared_ptr<common::Config> conf)
        : conf{std::move(conf)}
    {
        initializeOptionsDescription();
        parseCommandArguments(args);
    }

    void execute() override {
        workflow::Executor executor{conf};
        executor.completePrepare();
        executor.prepareStorageAndLogs();
        executor.runPrepare(common::Context{});
    }

    std::string getBriefDescription() const override {
        return "Verify that the images to mirror are available in the local cache";
    }

    void printHelpMessage() const override {
        auto printer = cli::HelpMessage()
            .setUsage("oc-mirror prepare [OPTIONS]")
            .setDescription(
                "Collects the images of the image set configuration and verifies their existence in the local cache.\n"
                "The checked images are listed in <from>/logs/cached-images.txt.")
            .setExamples("  oc-mirror prepare --config imageset-config.json --from file:///home/user/mirror")
            .setOptionsDescription(optionsDescription);
        std::cout << printer;
    }

private:
    void initializeOptionsDescription() {
        optionsDescription.add_options()
            ("config,c",
                boost::program_options::value<std::string>(&configPath),
                "Path to imageset configuration file")
            ("loglevel",
                boost::program_options::value<std::string>(&logLevel)->default_value("info"),
                "Log level one of (info, debug, trace, warn, error)")
            ("dir",
                boost::program_options::value<std::string>(&workingDirName)->default_value("working-dir"),
                "Assets directory")
            ("from",
                boost::program_options::value<std::string>(&from),
                "Local storage directory holding the mirror archives (prefix: file://)")
            ("port,p",
                boost::program_options::value<std::uint16_t>(&port)->default_value(5000),
                "HTTP port used by oc-mirror's local storage instance");
    }

    void parseCommandArguments(const libocmirror::CLIArguments& args) {
        cli::utility::printLog(boost::format("parsing CLI arguments of prepare command"), libocmirror::LogLevel::DEBUG);

        libocmirror::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);

        // the prepare command doesn't support positional arguments
        cli::utility::validateNumberOfPositionalArguments(positionalArgs, 0, 0, "prepare");

        try {
            boost::program_options::variables_map values;
            boost::program_options::store(
                boost::program_options::command_line_parser(nameAndOptionArgs.argc(), nameAndOptionArgs.argv())
                        .options(optionsDescription)
                        .style(boost::program_options::command_line_style::unix_style)
                        .run(), values);
            boost::program_options::notify(values);

            libocmirror::Logger::getInstance().setLevel(libocmirror::parseLogLevel(logLevel));

            conf->global.configPath = configPath;
            conf->global.logLevel = logLevel;
            conf->global.workingDirName = workingDirName;
            conf->global.from = from;
            conf->global.port = port;
        }
        catch (std::exception& e) {
            auto message = boost::format("%s\nSee 'oc-mirror help prepare'") % e.what();
            cli::utility::printLog(message, libocmirror::LogLevel::GENERAL, std::cerr);
            OCMIRROR_THROW_ERROR(message.str(), libocmirror::LogLevel::INFO);
        }

        workflow::Executor::validatePrepare(*conf);

        cli::utility::printLog(boost::format("successfully parsed CLI arguments"), libocmirror::LogLevel::DEBUG);
    }

private:
    boost::program_options::options_description optionsDescription{"Options"};
    std::shared_ptr<common::Config> conf;
    std::string configPath;
    std::string logLevel;
    std::string workingDirName;
    std::string from;
    std::uint16_t port = 5000;
};

}
}

#endif
