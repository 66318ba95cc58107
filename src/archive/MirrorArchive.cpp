/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "MirrorArchive.hpp"

#include <chrono>

#include "libocmirror/Error.hpp"
#include "libocmirror/Logger.hpp"
#include "libocmirror/Utility.hpp"
#include "archive/Tar.hpp"


namespace rj = rapidjson;

namespace ocmirror {
namespace archive {

const std::string archiveFilenameRegex = "mirror_[0-9]{6}\\.tar";
const std::string stagedImageSetConfigFilename = "imageset-config.json";
const std::string stagedImagesFilename = "images.json";

static const std::string registryStorageDirName = "docker";

boost::filesystem::path getNextArchivePath(const boost::filesystem::path& directory) {
    for(int sequence = 1; sequence <= 999999; ++sequence) {
        auto candidate = directory / (boost::format("mirror_%06d.tar") % sequence).str();
        if(!boost::filesystem::exists(candidate)) {
            return candidate;
        }
    }
    auto message = boost::format("Failed to find a free archive name in %s") % directory;
    OCMIRROR_THROW_ERROR(message.str());
}

rj::Document makeImagesJSON(const std::vector<common::WorkItem>& items) {
    auto json = rj::Document{rj::kArrayType};
    auto& allocator = json.GetAllocator();
    for(const auto& item : items) {
        auto entry = rj::Value{rj::kObjectType};
        entry.AddMember("source", rj::Value{item.source.c_str(), allocator}, allocator);
        entry.AddMember("destination", rj::Value{item.destination.c_str(), allocator}, allocator);
        entry.AddMember("origin", rj::Value{item.origin.c_str(), allocator}, allocator);
        entry.AddMember("type", rj::Value{common::toString(item.type).c_str(), allocator}, allocator);
        json.PushBack(entry, allocator);
    }
    return json;
}

std::vector<common::WorkItem> readImagesJSON(const boost::filesystem::path& file) {
    auto json = libocmirror::json::read(file);
    if(!json.IsArray()) {
        auto message = boost::format("Failed to read archived image list %s: expected a JSON array") % file;
        OCMIRROR_THROW_ERROR(message.str());
    }

    auto items = std::vector<common::WorkItem>{};
    for(const auto& entry : json.GetArray()) {
        if(!entry.IsObject() || !entry.HasMember("source") || !entry.HasMember("destination")) {
            auto message = boost::format("Failed to read archived image list %s: malformed entry") % file;
            OCMIRROR_THROW_ERROR(message.str());
        }
        auto item = common::WorkItem{};
        item.source = entry["source"].GetString();
        item.destination = entry["destination"].GetString();
        if(entry.HasMember("origin")) {
            item.origin = entry["origin"].GetString();
        }
        items.push_back(item);
    }
    return items;
}

MirrorArchive::MirrorArchive(std::shared_ptr<const common::Config> config)
    : config{std::move(config)}
{}

MirrorArchive::~MirrorArchive() {
    try {
        close();
    }
    catch(const std::exception& e) {
        libocmirror::Logger::getInstance().log(e.what(), sysname, libocmirror::LogLevel::WARN);
    }
}

boost::filesystem::path MirrorArchive::buildArchive(const common::Context& context,
                                                    const std::vector<common::WorkItem>& items) {
    context.throwIfCancelled("archive creation");

    const auto& directories = config->directories;
    auto start = std::chrono::high_resolution_clock::now();

    cacheLock = libocmirror::Lockfile{directories.localStorageCache,
                                      config->getUnsignedSetting("cacheLockTimeoutMs", 60000)};

    staging = libocmirror::PathRAII{libocmirror::filesystem::makeUniquePathWithRandomSuffix(directories.rootDir / ".archive-staging")};
    stageMetadata(items);

    auto archive = getNextArchivePath(directories.rootDir);
    auto temporaryArchive = libocmirror::PathRAII{
        libocmirror::filesystem::makeUniquePathWithRandomSuffix(directories.rootDir / ("." + archive.filename().string()))};
    printLog(boost::format("creating archive %s") % archive, libocmirror::LogLevel::INFO);

    auto entries = std::vector<tar::Entry>{};
    if(boost::filesystem::is_directory(directories.localStorageCache / registryStorageDirName)) {
        entries.push_back({directories.localStorageCache, registryStorageDirName});
    }
    if(boost::filesystem::is_directory(directories.workingDir)) {
        entries.push_back({directories.rootDir, directories.workingDir.filename().string()});
    }
    entries.push_back({staging.getPath(), stagedImageSetConfigFilename});
    entries.push_back({staging.getPath(), stagedImagesFilename});

    try {
        tar::create(context, temporaryArchive.getPath(), entries);
    }
    catch(const libocmirror::Error& e) {
        auto message = boost::format("Failed to create archive %s") % archive;
        OCMIRROR_RETHROW_ERROR(e, message.str());
    }

    boost::filesystem::rename(temporaryArchive.getPath(), archive);
    temporaryArchive.release();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::high_resolution_clock::now() - start).count() / double(1000);
    printLog(boost::format("archive %s created in %s [sec]") % archive % elapsed, libocmirror::LogLevel::INFO);
    return archive;
}

void MirrorArchive::stageMetadata(const std::vector<common::WorkItem>& items) const {
    libocmirror::filesystem::createFoldersIfNecessary(staging.getPath());
    libocmirror::json::write(config->imageSetConfig, staging.getPath() / stagedImageSetConfigFilename);
    libocmirror::json::write(makeImagesJSON(items), staging.getPath() / stagedImagesFilename);
}

void MirrorArchive::close() {
    staging.remove();
    cacheLock = libocmirror::Lockfile{};
}

void MirrorArchive::printLog(const boost::format& message, libocmirror::LogLevel level) const {
    libocmirror::Logger::getInstance().log(message, sysname, level);
}

ArchiveExtractor::ArchiveExtractor(std::shared_ptr<const common::Config> config)
    : config{std::move(config)}
{}

ArchiveExtractor::~ArchiveExtractor() {
    try {
        close();
    }
    catch(const std::exception& e) {
        libocmirror::Logger::getInstance().log(e.what(), sysname, libocmirror::LogLevel::WARN);
    }
}

void ArchiveExtractor::unarchive(const common::Context& context) {
    context.throwIfCancelled("archive extraction");

    const auto& directories = config->directories;
    auto archives = libocmirror::filesystem::listFilesMatching(directories.rootDir, archiveFilenameRegex);
    if(archives.empty()) {
        auto message = boost::format("no archive (mirror_NNNNNN.tar) found in %s") % directories.rootDir;
        OCMIRROR_THROW_ERROR(message.str());
    }

    libocmirror::filesystem::createFoldersIfNecessary(directories.localStorageCache);
    cacheLock = libocmirror::Lockfile{directories.localStorageCache,
                                      config->getUnsignedSetting("cacheLockTimeoutMs", 60000)};

    staging = libocmirror::PathRAII{libocmirror::filesystem::makeUniquePathWithRandomSuffix(directories.rootDir / ".unarchive-staging")};
    libocmirror::filesystem::createFoldersIfNecessary(staging.getPath());

    for(const auto& archive : archives) {
        context.throwIfCancelled("archive extraction");
        printLog(boost::format("extracting archive %s") % archive, libocmirror::LogLevel::INFO);
        tar::extract(context, archive, staging.getPath());
    }

    auto stagedRegistryStorage = staging.getPath() / registryStorageDirName;
    if(boost::filesystem::is_directory(stagedRegistryStorage)) {
        libocmirror::filesystem::mergeFolder(stagedRegistryStorage, directories.localStorageCache / registryStorageDirName);
    }
    auto stagedWorkingDir = staging.getPath() / directories.workingDir.filename();
    if(boost::filesystem::is_directory(stagedWorkingDir)) {
        libocmirror::filesystem::mergeFolder(stagedWorkingDir, directories.workingDir);
    }

    auto stagedImages = staging.getPath() / stagedImagesFilename;
    if(boost::filesystem::exists(stagedImages)) {
        printLog(boost::format("archives hold %d images") % readImagesJSON(stagedImages).size(),
                 libocmirror::LogLevel::DEBUG);
    }
}

void ArchiveExtractor::close() {
    staging.remove();
    cacheLock = libocmirror::Lockfile{};
}

void ArchiveExtractor::printLog(const boost::format& message, libocmirror::LogLevel level) const {
    libocmirror::Logger::getInstance().log(message, sysname, level);
}

}
}
