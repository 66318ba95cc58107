/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_cli_CommandMirror_hpp
#define ocmirror_cli_CommandMirror_hpp

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

class CommandMirror : public Command {
public:
    CommandMirror() {
        initializeOptionsDescription();
    }

    CommandMirror(const libocmirror::CLIArguments& args, std::shared_ptr<common::Config> conf)
        : conf{std::move(conf)}
    {
        initializeOptionsDescription();
        parseCommandArguments(args);
    }

    void execute() override {
        workflow::Executor executor{conf};
        executor.complete(destination);
        executor.prepareStorageAndLogs();
        executor.run(common::Context{});
    }

    std::string getBriefDescription() const override {
        return "Manage mirrors per user configuration";
    }

    void printHelpMessage() const override {
        auto printer = cli::HelpMessage()
            .setUsage("oc-mirror mirror [OPTIONS] DESTINATION")
            .setDescription(
                "Create and publish user-configured mirrors with a declarative configuration input.\n"
                "\n"
                "1. Destination prefix is file:// - the images are mirrored to the local storage cache\n"
                "   and packaged into an archive in the destination directory (mirror to disk).\n"
                "2. Destination prefix is docker:// - the archives found in the --from directory are\n"
                "   unpacked and their images are mirrored to the destination registry (disk to mirror).")
            .setExamples(
                "  # Mirror to a directory\n"
                "  oc-mirror mirror --config imageset-config.json file:///home/user/mirror\n"
                "\n"
                "  # Mirror from a directory to a disconnected registry\n"
                "  oc-mirror mirror --config imageset-config.json --from file:///home/user/mirror docker://registry.example.com:5000")
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
                "Local storage directory for disk to mirror workflow")
            ("port,p",
                boost::program_options::value<std::uint16_t>(&port)->default_value(5000),
                "HTTP port used by oc-mirror's local storage instance")
            ("quiet,q", "Disable detailed logging when copying images")
            ("force,f", "Force the copy and mirror functionality")
            ("secure-policy", "Enable signature verification (secure policy for signature verification)")
            ("src-tls-verify",
                boost::program_options::value<bool>(&srcTlsVerify)->default_value(true),
                "Require HTTPS and verify certificates when talking to the source registry")
            ("dest-tls-verify",
                boost::program_options::value<bool>(&destTlsVerify)->default_value(true),
                "Require HTTPS and verify certificates when talking to the destination registry");
    }

    void parseCommandArguments(const libocmirror::CLIArguments& args) {
        cli::utility::printLog(boost::format("parsing CLI arguments of mirror command"), libocmirror::LogLevel::DEBUG);

        libocmirror::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);

        // the mirror command expects exactly one positional argument: the destination
        cli::utility::validateNumberOfPositionalArguments(positionalArgs, 1, 1, "mirror");

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
            conf->global.quiet = values.count("quiet");
            conf->global.force = values.count("force");
            conf->global.securePolicy = values.count("secure-policy");
            conf->global.srcTlsVerify = srcTlsVerify;
            conf->global.destTlsVerify = destTlsVerify;

            destination = positionalArgs.argv()[0];
        }
        catch (std::exception& e) {
            auto message = boost::format("%s\nSee 'oc-mirror help mirror'") % e.what();
            cli::utility::printLog(message, libocmirror::LogLevel::GENERAL, std::cerr);
            OCMIRROR_THROW_ERROR(message.str(), libocmirror::LogLevel::INFO);
        }

        workflow::Executor::validate(*conf, destination);

        cli::utility::printLog(boost::format("successfully parsed CLI arguments"), libocmirror::LogLevel::DEBUG);
    }

private:
    boost::program_options::options_description optionsDescription{"Options"};
    std::shared_ptr<common::Config> conf;
    std::string destination;
    std::string configPath;
    std::string logLevel;
    std::string workingDirName;
    std::string from;
    std::uint16_t port = 5000;
    bool srcTlsVerify = true;
    bool destTlsVerify = true;
};

}
}

#endif
