/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Lockfile.hpp"

#include <cerrno>
#include <cstring>
#include <chrono>
#include <thread>
#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

#include <boost/format.hpp>

#include "libocmirror/Error.hpp"
#include "libocmirror/Logger.hpp"

namespace libocmirror {

Lockfile::Lockfile()
    : logger(&libocmirror::Logger::getInstance())
{}

Lockfile::Lockfile(const boost::filesystem::path& file, unsigned int timeoutMs, unsigned int warningMs)
    : logger(&libocmirror::Logger::getInstance())
    , lockfile{convertToLockfile(file)}
{
    auto message = boost::format("acquiring lock on %s") % file;
    logger->log(message.str(), loggerSubsystemName, libocmirror::LogLevel::DEBUG);

    unsigned int elapsedTimeMs = 0;
    while(!createLockfileAtomically()) {
        if(timeoutMs != noTimeout && elapsedTimeMs >= timeoutMs) {
            auto failedLock = *lockfile;
            lockfile.reset();
            message = boost::format("Failed to acquire lock on %s (expired timeout of %d milliseconds)") % failedLock % timeoutMs;
            OCMIRROR_THROW_ERROR(message.str());
        }
        const int backoffTimeMs = 100;
        std::this_thread::sleep_for(std::chrono::milliseconds(backoffTimeMs));
        elapsedTimeMs += backoffTimeMs;
        if(elapsedTimeMs % warningMs == 0) {
            message = boost::format("Still attempting to acquire lock on %s after %d ms...") % *lockfile % elapsedTimeMs;
            logger->log(message.str(), loggerSubsystemName, libocmirror::LogLevel::WARN);
        }
    }

    logger->log("successfully acquired lock", loggerSubsystemName, libocmirror::LogLevel::DEBUG);
}

Lockfile::Lockfile(Lockfile&& rhs)
    : logger{rhs.logger}
    , lockfile{rhs.lockfile}
{
    rhs.lockfile.reset();
}

Lockfile& Lockfile::operator=(Lockfile&& rhs) {
    if(this != &rhs) {
        removeLockfile();
        lockfile = rhs.lockfile;
        rhs.lockfile.reset();
    }
    return *this;
}

Lockfile::~Lockfile() {
    removeLockfile();
}

void Lockfile::removeLockfile() {
    if(!lockfile) {
        return;
    }
    auto message = boost::format("removing lockfile %s") % *lockfile;
    logger->log(message.str(), loggerSubsystemName, libocmirror::LogLevel::DEBUG);

    auto ec = boost::system::error_code{};
    boost::filesystem::remove(*lockfile, ec);
    if(ec) {
        message = boost::format("Failed to remove lockfile %s: %s") % *lockfile % ec.message();
        logger->log(message.str(), loggerSubsystemName, libocmirror::LogLevel::WARN);
    }
    lockfile.reset();
}

boost::filesystem::path Lockfile::convertToLockfile(const boost::filesystem::path& file) const {
    auto lockfile = file;
    lockfile += ".lock";
    return lockfile;
}

bool Lockfile::createLockfileAtomically() const {
    auto fd = open(lockfile->string().c_str(), O_CREAT | O_EXCL | O_RDONLY | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if(fd == -1) {
        if(errno != EEXIST) {
            auto message = boost::format("Failed to create lockfile %s: %s") % *lockfile % strerror(errno);
            OCMIRROR_THROW_ERROR(message.str());
        }
        return false;
    }

    if(close(fd) != 0) {
        auto message = boost::format("Failed to close file descriptor of lockfile %s") % *lockfile;
        OCMIRROR_THROW_ERROR(message.str());
    }
    return true;
}

}
