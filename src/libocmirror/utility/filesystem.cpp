/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "filesystem.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <sys/stat.h>

#include <boost/regex.hpp>
#include <boost/format.hpp>

#include "libocmirror/Error.hpp"
#include "libocmirror/utility/logging.hpp"
#include "libocmirror/utility/string.hpp"

/**
 * Utility functions for filesystem manipulation
 */

namespace libocmirror {
namespace filesystem {

void createFoldersIfNecessary(const boost::filesystem::path& path) {
    auto currentPath = boost::filesystem::path("");

    if(!boost::filesystem::exists(path)) {
        logMessage(boost::format{"Creating directory %s"} % path, LogLevel::DEBUG);
    }

    for(const auto& element : path) {
        currentPath /= element;
        if(!boost::filesystem::exists(currentPath)) {
            bool created = false;
            try {
                created = boost::filesystem::create_directory(currentPath);
            } catch(const std::exception& e) {
                auto message = boost::format("Failed to create directory %s") % currentPath;
                OCMIRROR_RETHROW_ERROR(e, message.str());
            }
            if(!created) {
                // another process may have concurrently created the same directory
                if(!boost::filesystem::is_directory(currentPath)) {
                    auto message = boost::format("Failed to create directory %s") % currentPath;
                    OCMIRROR_THROW_ERROR(message.str());
                }
            }
        }
    }
}

void copyFile(const boost::filesystem::path& src, const boost::filesystem::path& dst) {
    logMessage(boost::format{"Copying %s -> %s"} % src % dst, LogLevel::DEBUG);
    try {
        createFoldersIfNecessary(dst.parent_path());
        boost::filesystem::remove(dst); // remove dst if already exists
        boost::filesystem::copy_file(src, dst);
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to copy %s to %s") % src % dst;
        OCMIRROR_RETHROW_ERROR(e, message.str());
    }
}

void copyFolder(const boost::filesystem::path& src, const boost::filesystem::path& dst) {
    if(!boost::filesystem::exists(src) || !boost::filesystem::is_directory(src)) {
        auto message = boost::format("Failed to copy %s to %s: source folder doesn't exist.") % src % dst;
        OCMIRROR_THROW_ERROR(message.str());
    }

    if(boost::filesystem::exists(dst)) {
        auto message = boost::format("Failed to copy %s to %s: destination already exists.") % src % dst;
        OCMIRROR_THROW_ERROR(message.str());
    }

    createFoldersIfNecessary(dst);

    // for each file/folder in the directory
    for(boost::filesystem::directory_iterator entry{src};
        entry != boost::filesystem::directory_iterator{};
        ++entry) {
        if(boost::filesystem::is_directory(entry->path())) {
            copyFolder(entry->path(), dst / entry->path().filename());
        }
        else {
            copyFile(entry->path(), dst / entry->path().filename());
        }
    }
}

// rename(), or copy and remove when src and dst are on different filesystems
static void move(const boost::filesystem::path& src, const boost::filesystem::path& dst) {
    auto ec = boost::system::error_code{};
    boost::filesystem::rename(src, dst, ec);
    if(!ec) {
        return;
    }
    if(ec != boost::system::errc::cross_device_link) {
        auto message = boost::format("Failed to move %s to %s: %s") % src % dst % ec.message();
        OCMIRROR_THROW_ERROR(message.str());
    }

    if(boost::filesystem::is_directory(src) && !isSymlink(src)) {
        copyFolder(src, dst);
    }
    else {
        copyFile(src, dst);
    }
    boost::filesystem::remove_all(src);
}

/**
 * Moves the content of src into dst. Entries of dst with the same relative path
 * as an entry of src are replaced. When dst doesn't exist, src is simply renamed.
 */
void mergeFolder(const boost::filesystem::path& src, const boost::filesystem::path& dst) {
    if(!boost::filesystem::is_directory(src)) {
        auto message = boost::format("Failed to merge %s into %s: source folder doesn't exist.") % src % dst;
        OCMIRROR_THROW_ERROR(message.str());
    }

    if(!boost::filesystem::exists(dst)) {
        createFoldersIfNecessary(dst.parent_path());
        move(src, dst);
        return;
    }

    for(boost::filesystem::directory_iterator entry{src};
        entry != boost::filesystem::directory_iterator{};
        ++entry) {
        auto target = dst / entry->path().filename();
        if(boost::filesystem::is_directory(entry->path()) && !isSymlink(entry->path())) {
            mergeFolder(entry->path(), target);
        }
        else {
            boost::filesystem::remove(target);
            move(entry->path(), target);
        }
    }
}

std::string readFile(const boost::filesystem::path& path) {
    std::ifstream ifs(path.string());
    if(!ifs) {
        auto message = boost::format("Failed to open %s for reading") % path;
        OCMIRROR_THROW_ERROR(message.str());
    }
    auto s = std::string(   std::istreambuf_iterator<char>(ifs),
                            std::istreambuf_iterator<char>());
    return s;
}

void writeTextFile(const std::string& text, const boost::filesystem::path& filename, const std::ios_base::openmode mode) {
    try {
        createFoldersIfNecessary(filename.parent_path());
        auto ofs = std::ofstream{filename.string(), mode};
        if (!ofs) {
            auto message = boost::format("Failed to open std::ofstream for %s") % filename;
            OCMIRROR_THROW_ERROR(message.str());
        }
        ofs << text;
        ofs.close();
        if(!ofs) {
            auto message = boost::format("Failed to write to %s") % filename;
            OCMIRROR_THROW_ERROR(message.str());
        }
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to write text file %s") % filename;
        OCMIRROR_RETHROW_ERROR(e, message.str());
    }
}

/**
 * Appends a random suffix to the given path, retrying until the result doesn't exist.
 *
 * Note: boost::filesystem::unique_path offers a similar functionality, but it
 * throws when the locale configuration is invalid.
 */
boost::filesystem::path makeUniquePathWithRandomSuffix(const boost::filesystem::path& path) {
    auto uniquePath = std::string{};

    do {
        const size_t sizeOfRandomSuffix = 16;
        uniquePath = path.string() + "-" + string::generateRandom(sizeOfRandomSuffix);
    } while(boost::filesystem::exists(uniquePath));

    return uniquePath;
}

// Regular files directly inside directory whose name fully matches the regex, sorted by name
std::vector<boost::filesystem::path> listFilesMatching(const boost::filesystem::path& directory,
                                                       const std::string& filenameRegex) {
    if(!boost::filesystem::is_directory(directory)) {
        auto message = boost::format("Failed to list files in %s: path is not an existing directory") % directory;
        OCMIRROR_THROW_ERROR(message.str());
    }

    auto re = boost::regex(filenameRegex);
    auto files = std::vector<boost::filesystem::path>{};
    for(boost::filesystem::directory_iterator entry{directory};
        entry != boost::filesystem::directory_iterator{};
        ++entry) {
        if(boost::filesystem::is_regular_file(entry->path())
           && boost::regex_match(entry->path().filename().string(), re)) {
            files.push_back(entry->path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

bool isSymlink(const boost::filesystem::path& path) {
    struct stat sb;
    if (lstat(path.c_str(), &sb) != 0) {
        return false;
    }
    return S_ISLNK(sb.st_mode);
}

void changeDirectory(const boost::filesystem::path& path) {
    if(!boost::filesystem::exists(path)) {
        auto message = boost::format("attempted to cd into %s, but directory doesn't exist") % path;
        OCMIRROR_THROW_ERROR(message.str());
    }

    if(chdir(path.string().c_str()) != 0) {
        auto message = boost::format("failed to cd into %s: %s") % path % strerror(errno);
        OCMIRROR_THROW_ERROR(message.str());
    }
}

}}
