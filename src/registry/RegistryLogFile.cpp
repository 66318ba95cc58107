/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "RegistryLogFile.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>

#include <boost/format.hpp>

#include "libocmirror/Error.hpp"
#include "libocmirror/Logger.hpp"


namespace ocmirror {
namespace registry {

RegistryLogFile::RegistryLogFile(const boost::filesystem::path& file)
    : path{file}
{
    fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if(fd == -1) {
        auto message = boost::format("Failed to open local storage registry log %s: %s") % path % strerror(errno);
        OCMIRROR_THROW_ERROR(message.str());
    }
}

RegistryLogFile::~RegistryLogFile() {
    try {
        close();
    }
    catch(const libocmirror::Error& e) {
        libocmirror::Logger::getInstance().log(e.what(), "RegistryLogFile", libocmirror::LogLevel::WARN);
    }
}

int RegistryLogFile::getFileDescriptor() const {
    return fd;
}

const boost::filesystem::path& RegistryLogFile::getPath() const {
    return path;
}

bool RegistryLogFile::isOpen() const {
    return fd != -1;
}

void RegistryLogFile::close() {
    if(fd == -1) {
        return;
    }
    auto status = ::close(fd);
    fd = -1;
    if(status != 0) {
        auto message = boost::format("Failed to close local storage registry log %s: %s") % path % strerror(errno);
        OCMIRROR_THROW_ERROR(message.str());
    }
}

}
}
