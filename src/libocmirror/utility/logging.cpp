/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "logging.hpp"

#include "libocmirror/Error.hpp"
#include "libocmirror/Logger.hpp"

namespace libocmirror {

void logMessage(const boost::format& message, LogLevel level, std::ostream& out, std::ostream& err) {
    logMessage(message.str(), level, out, err);
}

void logMessage(const std::string& message, LogLevel level, std::ostream& out, std::ostream& err) {
    auto subsystemName = "CommonUtility";
    Logger::getInstance().log(message, subsystemName, level, out, err);
}

LogLevel parseLogLevel(const std::string& name) {
    if(name == "info") {
        return LogLevel::INFO;
    }
    else if(name == "debug" || name == "trace") {
        return LogLevel::DEBUG;
    }
    else if(name == "warn") {
        return LogLevel::WARN;
    }
    else if(name == "error") {
        return LogLevel::ERROR;
    }

    auto message = boost::format("Invalid log level '%s'. Supported values are: info, debug, trace, warn, error") % name;
    logMessage(message, LogLevel::GENERAL, std::cerr);
    OCMIRROR_THROW_ERROR(message.str(), LogLevel::INFO);
}

}
