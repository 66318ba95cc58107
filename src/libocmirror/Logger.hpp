/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libocmirror_Logger_hpp
#define libocmirror_Logger_hpp

#include <string>
#include <iostream>
#include <mutex>
#include <atomic>

#include <boost/format.hpp>

#include "libocmirror/LogLevel.hpp"
#include "libocmirror/Error.hpp"

namespace libocmirror {

class Logger {
public:
    static Logger& getInstance();

    void log(const std::string& message, const std::string& sysName, const libocmirror::LogLevel& logLevel,
             std::ostream& out_stream = std::cout, std::ostream& err_stream = std::cerr);
    void log(const boost::format& message, const std::string& sysName, const libocmirror::LogLevel& logLevel,
             std::ostream& out_stream = std::cout, std::ostream& err_stream = std::cerr);
    void logErrorTrace(const libocmirror::Error& error, const std::string& sysName, std::ostream& errStream = std::cerr);
    void setLevel(libocmirror::LogLevel logLevel) { level = logLevel; };
    libocmirror::LogLevel getLevel() { return level; };

private:
    Logger();
    Logger(const Logger&) = delete;
    Logger(Logger&&) = delete;

    std::string makeSubmessageWithTimestamp(libocmirror::LogLevel logLevel) const;
    std::string makeSubmessageWithInstanceID(libocmirror::LogLevel logLevel) const;
    std::string makeSubmessageWithSystemName(libocmirror::LogLevel logLevel,
                                             const std::string& systemName) const;
    std::string makeSubmessageWithLogLevel(libocmirror::LogLevel logLevel) const;

private:
    std::atomic<libocmirror::LogLevel> level;
    // batch workers and the registry watcher log concurrently
    std::mutex streamMutex;
};

}

#endif
