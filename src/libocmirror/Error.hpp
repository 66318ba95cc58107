/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libocmirror_Error_hpp
#define libocmirror_Error_hpp

#include <type_traits>
#include <exception>
#include <string>
#include <vector>
#include <cassert>
#include <cstring>

#include <boost/filesystem.hpp>

#include "libocmirror/LogLevel.hpp"

namespace libocmirror {

/**
 * Error trace propagated as an exception through the mirroring workflow.
 *
 * Each entry records the message together with the file, line and function
 * where it was created. The first entry is created by OCMIRROR_THROW_ERROR,
 * further entries are appended by OCMIRROR_RETHROW_ERROR while the stack unwinds.
 *
 * Instances are meant to be thrown only through those macros and caught by
 * non-const reference, so that the trace can be extended.
 */
class Error : public std::exception {
public:
    struct ErrorTraceEntry {
        std::string errorMessage;
        boost::filesystem::path fileName;
        int fileLine;
        std::string functionName;
    };

public:
    Error(LogLevel logLevel, const ErrorTraceEntry& entry)
        : logLevel{ logLevel }
        , errorTrace{ entry }
    {}

    const char* what() const noexcept override {
        // the message of the innermost error, as if it had been propagated
        // without intermediate catch-rethrows
        return errorTrace.front().errorMessage.c_str();
    }

    void appendErrorTraceEntry(const ErrorTraceEntry& entry) {
        errorTrace.push_back(entry);
    }

    const std::vector<ErrorTraceEntry>& getErrorTrace() const {
        return errorTrace;
    }

    LogLevel getLogLevel() const {
        return logLevel;
    }

    void setLogLevel(LogLevel value) {
        logLevel = value;
    }

private:
    LogLevel logLevel = LogLevel::ERROR;
    std::vector<ErrorTraceEntry> errorTrace;
};

inline bool operator==(const Error::ErrorTraceEntry& lhs, const Error::ErrorTraceEntry& rhs) {
    return lhs.errorMessage == rhs.errorMessage
        && lhs.fileName == rhs.fileName
        && lhs.fileLine == rhs.fileLine
        && lhs.functionName == rhs.functionName;
}

inline bool operator!=(const Error::ErrorTraceEntry& lhs, const Error::ErrorTraceEntry& rhs) {
    return !(lhs == rhs);
}

std::string getExceptionTypeString(const std::exception& e);

}


// OCMIRROR_THROW_ERROR macros
#define __FILENAME__ (strrchr(__FILE__, '/') ? strrchr(__FILE__, '/') + 1 : __FILE__)

#define OCMIRROR_GET_OVERLOADED_THROW_ERROR(_1, _2, NAME, ...) NAME

#define OCMIRROR_THROW_ERROR_2(errorMessage, logLevel) { \
    auto errorTraceEntry = libocmirror::Error::ErrorTraceEntry{errorMessage, __FILENAME__, __LINE__, __func__}; \
    throw libocmirror::Error{logLevel, errorTraceEntry}; \
}

#define OCMIRROR_THROW_ERROR_1(errorMessage) OCMIRROR_THROW_ERROR_2(errorMessage, libocmirror::LogLevel::ERROR)

#define OCMIRROR_THROW_ERROR(...) OCMIRROR_GET_OVERLOADED_THROW_ERROR(__VA_ARGS__, OCMIRROR_THROW_ERROR_2, OCMIRROR_THROW_ERROR_1)(__VA_ARGS__)


// OCMIRROR_RETHROW_ERROR macros
#define OCMIRROR_GET_OVERLOADED_RETHROW_ERROR(_1, _2, _3, NAME, ...) NAME

#define OCMIRROR_RETHROW_ERROR_3(exception, errorMessage, logLevel) { \
    auto errorTraceEntry = libocmirror::Error::ErrorTraceEntry{errorMessage, __FILENAME__, __LINE__, __func__}; \
    const auto* cp = dynamic_cast<const libocmirror::Error*>(&exception); \
    if(cp) { /* dynamic type is libocmirror::Error */ \
        assert(!std::is_const<decltype(exception)>{}); /* must be caught as non-const reference to extend the trace */ \
        auto* p = const_cast<libocmirror::Error*>(cp); \
        p->setLogLevel(logLevel); \
        p->appendErrorTraceEntry(errorTraceEntry); \
        throw; \
    } \
    else { \
        auto previousErrorTraceEntry = libocmirror::Error::ErrorTraceEntry{exception.what(), "unspecified location", -1, \
                                                                           libocmirror::getExceptionTypeString(exception)}; \
        auto error = libocmirror::Error{logLevel, previousErrorTraceEntry}; \
        error.appendErrorTraceEntry(errorTraceEntry); \
        throw error; \
    } \
}

#define OCMIRROR_RETHROW_ERROR_2(exception, errorMessage) { \
    const auto* cp = dynamic_cast<const libocmirror::Error*>(&exception); \
    if(cp) { \
        OCMIRROR_RETHROW_ERROR_3(exception, errorMessage, cp->getLogLevel()) \
    } \
    else { \
        OCMIRROR_RETHROW_ERROR_3(exception, errorMessage, libocmirror::LogLevel::ERROR) \
    } \
}

#define OCMIRROR_RETHROW_ERROR(...) OCMIRROR_GET_OVERLOADED_RETHROW_ERROR(__VA_ARGS__, OCMIRROR_RETHROW_ERROR_3, OCMIRROR_RETHROW_ERROR_2)(__VA_ARGS__)

#endif
