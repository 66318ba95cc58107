/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_cli_CommandHelp_hpp
#define ocmirror_cli_CommandHelp_hpp

#include <iostream>
#include <algorithm>
#include <memory>

#include "libocmirror/CLIArguments.hpp"
#include "libocmirror/Error.hpp"
#include "common/Config.hpp"
#include "cli/Utility.hpp"
#include "cli/Command.hpp"
#include "cli/CLI.hpp"
#include "cli/HelpMessage.hpp"
#include "cli/CommandObjectsFactory.hpp"

namespace ocmirror {
namespace cli {

class CommandHelp : public Command {
public:
    CommandHelp() = default;

    CommandHelp(const libocmirror::CLIArguments& args, std::shared_ptr<common::Config>) {
        if(args.argc() > 1) {
            auto message = boost::format("Command 'help' doesn't support options");
            utility::printLog(message, libocmirror::LogLevel::GENERAL, std::cerr);
            OCMIRROR_THROW_ERROR(message.str(), libocmirror::LogLevel::INFO);
        }
    }

    void execute() override {
        std::cout
        << "Usage: oc-mirror COMMAND\n"
        << "\n"
        << cli::CLI{}.getOptionsDescription()
        << "\n"
        << "Commands:\n";

        auto factory = CommandObjectsFactory{};
        auto commandNames = factory.getCommandNames();
        std::sort(commandNames.begin(), commandNames.end());
        for(const auto& name : commandNames) {
            auto description = factory.makeCommandObject(name)->getBriefDescription();
            std::cout << "   " << name << ": " << description << "\n";
        }
        std::cout << "\nRun 'oc-mirror help COMMAND' for more information on a command\n";
    }

    std::string getBriefDescription() const override {
        return "Print help message about a command";
    }

    void printHelpMessage() const override {
        auto printer = cli::HelpMessage()
            .setUsage("oc-mirror help [COMMAND]")
            .setDescription(getBriefDescription());
        std::cout << printer;
    }
};

}
}

#endif
