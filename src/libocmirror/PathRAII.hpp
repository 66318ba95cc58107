/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libocmirror_PathRAII_hpp
#define libocmirror_PathRAII_hpp

#include <boost/optional.hpp>
#include <boost/filesystem.hpp>

namespace libocmirror {

// Owns a path on the filesystem: the path is removed recursively
// when the object goes out of scope, unless it was released.
class PathRAII {
public:
    PathRAII() = default;
    PathRAII(const boost::filesystem::path& path);
    PathRAII(const PathRAII&) = delete;
    PathRAII(PathRAII&&);
    PathRAII& operator=(const PathRAII&) = delete;
    PathRAII& operator=(PathRAII&&);
    ~PathRAII();

    const boost::filesystem::path& getPath() const;
    void release();
    void remove();

private:
    void setFilesAsRemovableByOwner() const;

    boost::optional<boost::filesystem::path> path;
};

}

#endif
