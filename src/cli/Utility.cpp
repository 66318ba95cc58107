/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "cli/Utility.hpp"

#include <cassert>
#include <cstring>

#include "libocmirror/Error.hpp"
#include "libocmirror/Logger.hpp"


namespace ocmirror {
namespace cli {
namespace utility {

static bool hasDashPrefix(const char* s) {
    bool result = strlen(s) > 1 && s[0]=='-' && s[1]!='-';
    return result;
}

static bool hasDashDashPrefix(const char* s) {
    bool result = strlen(s) > 2 && s[0]=='-' && s[1]=='-' && s[2]!='-';
    return result;
}

static bool isOption(const char* s) {
    return hasDashPrefix(s) || hasDashDashPrefix(s);
}

static bool optionTakesValue(const boost::program_options::option_description* option) {
    bool result = option->semantic()->max_tokens() > 0;
    return result;
}

static libocmirror::CLIArguments::const_iterator processPossibleValueInNextToken(libocmirror::CLIArguments::const_iterator arg,
        libocmirror::CLIArguments::const_iterator argsEnd, libocmirror::CLIArguments& argsGroup) {
    // always include the current token (the option)
    argsGroup.push_back(*arg);

    // if next arg token exists and does not start with dash it's the value: include it and skip over
    auto nextArg = arg+1;
    if (nextArg != argsEnd) {
        if(!hasDashPrefix(*nextArg)){
            argsGroup.push_back(*nextArg);
            ++arg;
        }
    }

    return arg;
}

static libocmirror::CLIArguments::const_iterator processDashDashOption(libocmirror::CLIArguments::const_iterator arg,
        libocmirror::CLIArguments::const_iterator argsEnd, libocmirror::CLIArguments& argsGroup,
        const boost::program_options::options_description& optionsDescription) {
    auto argString = std::string{*arg};

    // if token contains '=' then it's using adjacent style and already provides a value
    if(argString.find('=') != std::string::npos) {
        argsGroup.push_back(argString);
    }
    else {
        // extract name by removing "--" prefix
        auto argName = argString.substr(2);

        // find if this is an option for the current command
        auto argOption = optionsDescription.find_nothrow(argName, false);

        // not an option: include and continue to next token (Boost will detect error about wrong option)
        if(!argOption) {
            argsGroup.push_back(*arg);
            return arg;
        }

        // check if option might take a value
        if(optionTakesValue(argOption)) {
            arg = processPossibleValueInNextToken(arg, argsEnd, argsGroup);
        }
        else {
            argsGroup.push_back(*arg);
        }
    }

    return arg;
}

static libocmirror::CLIArguments::const_iterator processDashOption(libocmirror::CLIArguments::const_iterator arg,
        libocmirror::CLIArguments::const_iterator argsEnd, libocmirror::CLIArguments& argsGroup,
        const boost::program_options::options_description& optionsDescription) {
    auto argString = std::string{*arg};

    // remove '-' prefix
    auto argSubstring = argString.substr(1);

    for(auto it = argSubstring.cbegin(); it != argSubstring.cend(); ++it) {
        // find if this is an option for the current command
        auto findArg = std::string{"-"} + *it;
        auto argOption = optionsDescription.find_nothrow(findArg, false);

        // not an option: include and continue to next token (Boost will detect error about wrong option)
        if(!argOption) {
            argsGroup.push_back(*arg);
            break;
        }

        // check if option might take a value
        if(optionTakesValue(argOption)) {
            // is token finished?
            if(it+1 == argSubstring.end()) {
                arg = processPossibleValueInNextToken(arg, argsEnd, argsGroup);
            }
            else {
                argsGroup.push_back(*arg);
                break;
            }
        }
        else {
            // current option takes no value. If token continues it could contain "sticky" short options
            // is token finished?
            if(it+1 == argSubstring.end()) {
                argsGroup.push_back(*arg);
            }
            else {
                // analyze next character
                continue;
            }
        }
    }

    return arg;
}

/**
 * Group option arguments and positional arguments into two individual CLIArguments objects.
 *
 * The first group contains the program/command name, its options and their values, if present;
 * it is meant to be further processed by boost::program_option functions.
 * The second group contains all the arguments from the first detected positional argument
 * (not an option or a value) onwards.
 * The second group may contain options for subcommands or container applications; such options
 * are not parsed by this function.
 * The second group can be passed around to access subcommand arguments and parse them appropriately.
 *
 * If there are no positional arguments, the second CLIArguments object is empty.
 *
 * The style used for identifying options and the terminology (e.g. "short", "long", "sticky") takes
 * as reference the UNIX style of boost::program_options:
 * https://www.boost.org/doc/libs/1_65_0/doc/html/boost/program_options/command_line_style/style_t.html
 * The same style is also used in the Command classes for parsing the command line with Boost.
 *
 * E.g. the arguments "mirror --config isc.json -p 5001 file:///tmp/mirror" of the mirror command
 * are grouped into two CLIArguments objects ("mirror --config isc.json -p 5001", "file:///tmp/mirror").
 */
std::tuple<libocmirror::CLIArguments, libocmirror::CLIArguments> groupOptionsAndPositionalArguments(
        const libocmirror::CLIArguments& args,
        const boost::program_options::options_description& optionsDescription) {

    libocmirror::CLIArguments nameAndOptionArgs, positionalArgs;

    if(args.argc() == 0) {
        return std::tuple<libocmirror::CLIArguments, libocmirror::CLIArguments>{nameAndOptionArgs, positionalArgs};
    }

    // Initialize the first arguments group with the first input argument (the name of the program or command)
    assert(!isOption(args.argv()[0]));
    nameAndOptionArgs.push_back(args.argv()[0]);

    // Start analysis from second argument
    for(auto arg = args.begin()+1; arg != args.end(); ++arg) {
        if(!isOption(*arg)) {
            positionalArgs = libocmirror::CLIArguments{arg, args.end()};
            break;
        }

        if(hasDashDashPrefix(*arg)) {
            arg = processDashDashOption(arg, args.end(), nameAndOptionArgs, optionsDescription);
        }
        else if(hasDashPrefix(*arg)) {
            arg = processDashOption(arg, args.end(), nameAndOptionArgs, optionsDescription);
        }
    }

    return std::tuple<libocmirror::CLIArguments, libocmirror::CLIArguments>{nameAndOptionArgs, positionalArgs};
}

void validateNumberOfPositionalArguments(const libocmirror::CLIArguments& positionalArgs, const int min, const int max,
        const std::string& command) {
    auto numberOfArguments = positionalArgs.argc();
    if(numberOfArguments < min || numberOfArguments > max) {
        auto quantity = numberOfArguments < min ? std::string("few") : std::string("many");
        auto message = boost::format("Too %s arguments for command '%s'\n"
                                     "See 'oc-mirror help %s'") % quantity % command % command;
        printLog(message, libocmirror::LogLevel::GENERAL, std::cerr);
        OCMIRROR_THROW_ERROR(message.str(), libocmirror::LogLevel::INFO);
    }
}

void printLog(const std::string& message, libocmirror::LogLevel LogLevel, std::ostream& outStream, std::ostream& errStream) {
    auto systemName = "CLI";
    libocmirror::Logger::getInstance().log(message, systemName, LogLevel, outStream, errStream);
}

void printLog(const boost::format& message, libocmirror::LogLevel LogLevel, std::ostream& outStream, std::ostream& errStream) {
    printLog(message.str(), LogLevel, outStream, errStream);
}

}
}
}
