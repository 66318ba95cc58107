/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libocmirror_Lockfile_hpp
#define libocmirror_Lockfile_hpp

#include <limits>
#include <string>

#include <boost/optional.hpp>
#include <boost/filesystem.hpp>

namespace libocmirror {

class Logger;

/**
 * Exclusive access to a shared resource on the filesystem, such as the
 * local storage cache.
 *
 * The constructor atomically creates "<file>.lock" and busy waits while
 * somebody else holds it. The destructor removes the lock file.
 */
class Lockfile {
public:
    static constexpr unsigned int noTimeout = std::numeric_limits<unsigned int>::max();

public:
    Lockfile();
    Lockfile(const boost::filesystem::path& file, unsigned int timeoutMs=noTimeout, unsigned int warningMs=1000);
    Lockfile(const Lockfile&) = delete;
    Lockfile(Lockfile&&);
    ~Lockfile();

    Lockfile& operator=(const Lockfile&) = delete;
    Lockfile& operator=(Lockfile&&);

private:
    boost::filesystem::path convertToLockfile(const boost::filesystem::path& file) const;
    bool createLockfileAtomically() const;
    void removeLockfile();

private:
    libocmirror::Logger* logger;
    std::string loggerSubsystemName = "Lockfile";
    boost::optional<boost::filesystem::path> lockfile;
};

}

#endif
