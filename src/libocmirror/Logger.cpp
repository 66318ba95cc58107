/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "libocmirror/Logger.hpp"

#include <string>
#include <iostream>
#include <cerrno>

#include <time.h>
#include <sys/types.h>
#include <unistd.h>

#include <boost/format.hpp>

#include "libocmirror/Error.hpp"
#include "libocmirror/Utility.hpp"

namespace libocmirror {

    Logger& Logger::getInstance() {
        static Logger logger;
        return logger;
    }

    Logger::Logger()
        : level{ libocmirror::LogLevel::INFO }
    {}

    void Logger::log(const std::string& message, const std::string& systemName, const libocmirror::LogLevel& logLevel,
                     std::ostream& out_stream, std::ostream& err_stream) {
        if(logLevel < level) {
            return;
        }

        auto fullLogMessage = makeSubmessageWithTimestamp(logLevel)
            + makeSubmessageWithInstanceID(logLevel)
            + makeSubmessageWithSystemName(logLevel, systemName)
            + makeSubmessageWithLogLevel(logLevel)
            + message;

        std::lock_guard<std::mutex> lock{streamMutex};

        // WARNING and ERROR messages go to stderr
        if ( logLevel == libocmirror::LogLevel::WARN || logLevel == libocmirror::LogLevel::ERROR ) {
            err_stream << fullLogMessage << std::endl;
        }
        // rest goes to stdout
        else {
            out_stream << fullLogMessage << std::endl;
        }
    }

    void Logger::log(const boost::format& message, const std::string& systemName, const libocmirror::LogLevel& logLevel,
                     std::ostream& out_stream, std::ostream& err_stream) {
        log(message.str(), systemName, logLevel, out_stream, err_stream);
    }

    void Logger::logErrorTrace(const libocmirror::Error& error, const std::string& systemName, std::ostream& errStream) {
        if(error.getLogLevel() < level) {
            return;
        }

        log("Error trace (most nested error last):", systemName, LogLevel::ERROR, std::cout, errStream);

        std::lock_guard<std::mutex> lock{streamMutex};
        const auto& trace = error.getErrorTrace();
        for(size_t i=0; i!=trace.size(); ++i) {
            const auto& entry = trace[trace.size()-i-1];
            auto line = boost::format("#%-3.3s %s at %s:%s %s\n")
                % i % entry.functionName % entry.fileName % (entry.fileLine != -1 ? std::to_string(entry.fileLine) : "")
                % entry.errorMessage;
            errStream << line;
        }
    }

    std::string Logger::makeSubmessageWithTimestamp(libocmirror::LogLevel logLevel) const {
        if(logLevel == libocmirror::LogLevel::GENERAL) {
            return "";
        }

        auto tp = timespec{};
        if(clock_gettime(CLOCK_MONOTONIC, &tp) != 0) {
            auto message = boost::format("logger failed to retrieve monotonic time (%s)") % strerror(errno);
            OCMIRROR_THROW_ERROR(message.str());
        }

        auto timestamp = boost::format("[%d.%09d] ") % tp.tv_sec % tp.tv_nsec;
        return timestamp.str();
    }

    std::string Logger::makeSubmessageWithInstanceID(libocmirror::LogLevel logLevel) const {
        if(logLevel == libocmirror::LogLevel::GENERAL) {
            return "";
        }

        auto id = boost::format("[%s-%d] ") % libocmirror::process::getHostname() % getpid();
        return id.str();
    }

    std::string Logger::makeSubmessageWithSystemName(libocmirror::LogLevel logLevel, const std::string& systemName) const {
        if(logLevel == libocmirror::LogLevel::GENERAL) {
            return "";
        }

        return "[" + systemName + "] ";
    }

    std::string Logger::makeSubmessageWithLogLevel(libocmirror::LogLevel logLevel) const {
        switch(logLevel) {
            case libocmirror::LogLevel::DEBUG:   return "[DEBUG] ";
            case libocmirror::LogLevel::INFO :   return "[INFO] ";
            case libocmirror::LogLevel::WARN :   return "[WARN] ";
            case libocmirror::LogLevel::ERROR:   return "[ERROR] ";
            case libocmirror::LogLevel::GENERAL: return "";
        }
        OCMIRROR_THROW_ERROR("logger failed to convert unknown log level to string");
    }

}
