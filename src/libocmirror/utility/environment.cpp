/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "environment.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include "libocmirror/Error.hpp"
#include "libocmirror/utility/logging.hpp"

namespace libocmirror {
namespace environment {

boost::optional<std::string> findVariable(const std::string& key) {
    const char* p = getenv(key.c_str());
    if(p == nullptr) {
        logMessage(boost::format("Environment variable %s is not set") % key, libocmirror::LogLevel::DEBUG);
        return {};
    }
    logMessage(boost::format("Got environment variable %s=%s") % key % p, libocmirror::LogLevel::DEBUG);
    return std::string{p};
}

void setVariable(const std::string& key, const std::string& value) {
    int overwrite = 1;
    if(setenv(key.c_str(), value.c_str(), overwrite) != 0) {
        auto message = boost::format("Failed to setenv(%s, %s, %d): %s")
            % key % value % overwrite % strerror(errno);
        OCMIRROR_THROW_ERROR(message.str());
    }
    logMessage(boost::format("Set environment variable %s=%s") % key % value, libocmirror::LogLevel::DEBUG);
}

void unsetVariable(const std::string& key) {
    if(unsetenv(key.c_str()) != 0) {
        auto message = boost::format("Failed to unsetenv(%s): %s") % key % strerror(errno);
        OCMIRROR_THROW_ERROR(message.str());
    }
}

}}
