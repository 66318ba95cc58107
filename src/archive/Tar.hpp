/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_archive_Tar_hpp
#define ocmirror_archive_Tar_hpp

#include <string>
#include <vector>

#include <boost/filesystem.hpp>

#include "common/Context.hpp"


/**
 * Tar archives of directory trees, written and read with libarchive
 */

namespace ocmirror {
namespace archive {
namespace tar {

// The tree (or file) parentDirectory/name is stored under "name" in the archive
struct Entry {
    boost::filesystem::path parentDirectory;
    std::string name;
};

void create(const common::Context& context,
            const boost::filesystem::path& archivePath,
            const std::vector<Entry>& entries);

void extract(const common::Context& context,
             const boost::filesystem::path& archivePath,
             const boost::filesystem::path& expandDir);

std::vector<std::string> listEntries(const boost::filesystem::path& archivePath);

}
}
}

#endif
