/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_registry_RegistryLogFile_hpp
#define ocmirror_registry_RegistryLogFile_hpp

#include <boost/filesystem.hpp>


namespace ocmirror {
namespace registry {

/**
 * Owns the file descriptor of the local storage registry log.
 * The registry child process writes its stdout and stderr there.
 */
class RegistryLogFile {
public:
    RegistryLogFile(const boost::filesystem::path& file);
    RegistryLogFile(const RegistryLogFile&) = delete;
    RegistryLogFile& operator=(const RegistryLogFile&) = delete;
    ~RegistryLogFile();

    int getFileDescriptor() const;
    const boost::filesystem::path& getPath() const;
    bool isOpen() const;
    void close();

private:
    boost::filesystem::path path;
    int fd = -1;
};

}
}

#endif
