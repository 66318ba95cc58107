/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "PathRAII.hpp"

#include <boost/format.hpp>

#include "Error.hpp"
#include "Logger.hpp"
#include "Utility.hpp"

namespace libocmirror {

PathRAII::PathRAII(const boost::filesystem::path& path)
    : path{path}
{}

PathRAII::PathRAII(PathRAII&& rhs)
    : path{std::move(rhs.path)}
{
    rhs.release();
}

PathRAII& PathRAII::operator=(PathRAII&& rhs) {
    if(this != &rhs) {
        remove();
        path = std::move(rhs.path);
        rhs.release();
    }
    return *this;
}

PathRAII::~PathRAII() {
    try {
        remove();
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to remove %s: %s") % *path % e.what();
        Logger::getInstance().log(message, "PathRAII", LogLevel::WARN);
    }
}

const boost::filesystem::path& PathRAII::getPath() const {
    return path.value();
}

void PathRAII::release() {
    path.reset();
}

void PathRAII::remove() {
    if(path && boost::filesystem::exists(*path)) {
        // registry blobs extracted from an archive may lack owner write permissions
        setFilesAsRemovableByOwner();
        boost::filesystem::remove_all(*path);
    }
    path.reset();
}

void PathRAII::setFilesAsRemovableByOwner() const {
    auto requiredPermissions = boost::filesystem::perms::owner_write | boost::filesystem::perms::owner_exe;
    boost::filesystem::permissions(*path, boost::filesystem::perms::add_perms | requiredPermissions);

    if (boost::filesystem::is_regular_file(*path)) {
        return;
    }

    for (const auto& entry : boost::filesystem::recursive_directory_iterator(*path)) {
        if (!libocmirror::filesystem::isSymlink(entry.path())) {
            boost::filesystem::permissions(entry.path(), boost::filesystem::perms::add_perms | requiredPermissions);
        }
    }
}

}
