/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "CommandObjectsFactory.hpp"

#include <iostream>

#include <boost/format.hpp>

#include "libocmirror/Error.hpp"
#include "libocmirror/Logger.hpp"
#include "cli/CommandHelp.hpp"
#include "cli/CommandHelpOfCommand.hpp"
#include "cli/CommandMirror.hpp"
#include "cli/CommandPrepare.hpp"
#include "cli/CommandVersion.hpp"


namespace ocmirror {
namespace cli {

CommandObjectsFactory::CommandObjectsFactory() {
    addCommand<cli::CommandHelp>("help");
    addCommand<cli::CommandMirror>("mirror");
    addCommand<cli::CommandPrepare>("prepare");
    addCommand<cli::CommandVersion>("version");
}

bool CommandObjectsFactory::isValidCommandName(const std::string& commandName) const {
    return map.find(commandName) != map.cend();
}

std::vector<std::string> CommandObjectsFactory::getCommandNames() const {
    auto names = std::vector<std::string>{};
    names.reserve(map.size());
    for(const auto& kv : map) {
        names.push_back(kv.first);
    }
    return names;
}

std::unique_ptr<cli::Command> CommandObjectsFactory::makeCommandObject(const std::string& commandName) const {
    throwIfInvalidCommandName(commandName);
    auto it = map.find(commandName);
    return it->second();
}

std::unique_ptr<cli::Command> CommandObjectsFactory::makeCommandObject(
    const std::string& commandName,
    const libocmirror::CLIArguments& commandArgs,
    std::shared_ptr<common::Config> config) const {
    throwIfInvalidCommandName(commandName);
    auto it = mapWithArguments.find(commandName);
    return it->second(commandArgs, std::move(config));
}

std::unique_ptr<cli::Command> CommandObjectsFactory::makeCommandObjectHelpOfCommand(const std::string& commandName) const {
    auto commandObject = makeCommandObject(commandName);
    auto ptr = new cli::CommandHelpOfCommand{std::move(commandObject)};
    return std::unique_ptr<cli::Command>{ptr};
}

void CommandObjectsFactory::throwIfInvalidCommandName(const std::string& commandName) const {
    if(!isValidCommandName(commandName)) {
        auto message = boost::format("'%s' is not an oc-mirror command\nSee 'oc-mirror help'")
            % commandName;
        libocmirror::Logger::getInstance().log(message, "CommandObjectsFactory", libocmirror::LogLevel::GENERAL, std::cerr);
        OCMIRROR_THROW_ERROR(message.str(), libocmirror::LogLevel::DEBUG);
    }
}

}
}
