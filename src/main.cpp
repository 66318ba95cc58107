/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <exception>
#include <iostream>
#include <memory>
#include <chrono>
#include <clocale>

#include <sys/types.h>
#include <sys/stat.h>

#include <boost/filesystem.hpp>
#include <boost/format.hpp>

#include "common/Config.hpp"
#include "common/Context.hpp"
#include "libocmirror/Error.hpp"
#include "libocmirror/Logger.hpp"
#include "libocmirror/CLIArguments.hpp"
#include "cli/CLI.hpp"

using namespace ocmirror;

int main(int argc, char* argv[]) {
    std::setlocale(LC_CTYPE, "C.UTF-8"); // enable handling of non-ascii characters

    // the archives and the working directory are shared with other users of the mirror
    umask(022);

    auto& logger = libocmirror::Logger::getInstance();

    try {
        auto program_start = std::chrono::high_resolution_clock::now();

        // Initialize Config object
        auto installationPrefixDir = boost::filesystem::canonical("/proc/self/exe").parent_path().parent_path();
        auto config = std::make_shared<common::Config>(installationPrefixDir);
        config->program_start = program_start;

        // SIGINT and SIGTERM cancel the running workflow, which then cleans up
        common::Context::installInterruptHandlers();

        // Process command
        auto args = libocmirror::CLIArguments(argc, argv);
        auto command = cli::CLI{}.parseCommandLine(args, config);
        command->execute();
    }
    catch(const libocmirror::Error& e) {
        logger.logErrorTrace(e, "main");
        return 1;
    }
    catch(const std::exception& e) {
        auto message = boost::format("Caught exception in main function. No error trace available."
                                     " Exception message: %s") % e.what();
        logger.log(message.str(), "main", libocmirror::LogLevel::ERROR);
        return 1;
    }

    return 0;
}
