/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libocmirror_utility_filesystem_hpp
#define libocmirror_utility_filesystem_hpp

#include <string>
#include <vector>
#include <ios>

#include <boost/filesystem.hpp>

/**
 * Utility functions for filesystem manipulation and investigation
 */

namespace libocmirror {
namespace filesystem {

void createFoldersIfNecessary(const boost::filesystem::path&);
void copyFile(const boost::filesystem::path& src, const boost::filesystem::path& dst);
void copyFolder(const boost::filesystem::path& src, const boost::filesystem::path& dst);
void mergeFolder(const boost::filesystem::path& src, const boost::filesystem::path& dst);
std::string readFile(const boost::filesystem::path& path);
void writeTextFile(const std::string& text,
                   const boost::filesystem::path& filename,
                   const std::ios_base::openmode mode = std::ios_base::out);
boost::filesystem::path makeUniquePathWithRandomSuffix(const boost::filesystem::path&);
std::vector<boost::filesystem::path> listFilesMatching(const boost::filesystem::path& directory,
                                                       const std::string& filenameRegex);
bool isSymlink(const boost::filesystem::path& path);
void changeDirectory(const boost::filesystem::path& path);

}}

#endif
