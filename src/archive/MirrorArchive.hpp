/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_archive_MirrorArchive_hpp
#define ocmirror_archive_MirrorArchive_hpp

#include <memory>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>
#include <boost/format.hpp>
#include <rapidjson/document.h>

#include "libocmirror/Lockfile.hpp"
#include "libocmirror/LogLevel.hpp"
#include "libocmirror/PathRAII.hpp"
#include "common/Config.hpp"
#include "archive/Archiver.hpp"


namespace ocmirror {
namespace archive {

extern const std::string archiveFilenameRegex;
extern const std::string stagedImageSetConfigFilename;
extern const std::string stagedImagesFilename;

boost::filesystem::path getNextArchivePath(const boost::filesystem::path& directory);
rapidjson::Document makeImagesJSON(const std::vector<common::WorkItem>& items);
std::vector<common::WorkItem> readImagesJSON(const boost::filesystem::path& file);

/**
 * Writes <root>/mirror_NNNNNN.tar with the "docker" registry storage of the
 * local storage cache, the working directory, the image set configuration
 * and the list of mirrored images.
 */
class MirrorArchive : public Archiver {
public:
    MirrorArchive(std::shared_ptr<const common::Config> config);
    ~MirrorArchive();

    boost::filesystem::path buildArchive(const common::Context& context,
                                         const std::vector<common::WorkItem>& items) override;
    void close() override;

private:
    void stageMetadata(const std::vector<common::WorkItem>& items) const;
    void printLog(const boost::format& message, libocmirror::LogLevel level) const;

private:
    const std::string sysname = "MirrorArchive";
    std::shared_ptr<const common::Config> config;
    libocmirror::Lockfile cacheLock;
    libocmirror::PathRAII staging;
};

/**
 * Extracts every mirror_NNNNNN.tar found in the root directory, in sequence
 * order, then merges the registry storage into the local storage cache and
 * the working directory into the current one.
 */
class ArchiveExtractor : public UnArchiver {
public:
    ArchiveExtractor(std::shared_ptr<const common::Config> config);
    ~ArchiveExtractor();

    void unarchive(const common::Context& context) override;
    void close() override;

private:
    void printLog(const boost::format& message, libocmirror::LogLevel level) const;

private:
    const std::string sysname = "ArchiveExtractor";
    std::shared_ptr<const common::Config> config;
    libocmirror::Lockfile cacheLock;
    libocmirror::PathRAII staging;
};

}
}

#endif
