/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_archive_Archiver_hpp
#define ocmirror_archive_Archiver_hpp

#include <vector>

#include <boost/filesystem.hpp>

#include "common/Context.hpp"
#include "common/WorkItem.hpp"


namespace ocmirror {
namespace archive {

class Archiver {
public:
    virtual ~Archiver() = default;
    // Packages the local storage cache and the working directory, returns the archive path
    virtual boost::filesystem::path buildArchive(const common::Context& context,
                                                 const std::vector<common::WorkItem>& items) = 0;
    virtual void close() = 0;
};

class UnArchiver {
public:
    virtual ~UnArchiver() = default;
    // Restores the local storage cache and the working directory from the archives
    virtual void unarchive(const common::Context& context) = 0;
    virtual void close() = 0;
};

}
}

#endif
