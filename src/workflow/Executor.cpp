/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Executor.hpp"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/filesystem.hpp>

#include "libocmirror/Error.hpp"
#include "libocmirror/Logger.hpp"
#include "libocmirror/Utility.hpp"
#include "registry/RegistryConfig.hpp"


namespace ocmirror {
namespace workflow {

static void throwUsageError(const std::string& message) {
    libocmirror::Logger::getInstance().log(message, "Executor", libocmirror::LogLevel::GENERAL, std::cerr);
    OCMIRROR_THROW_ERROR(message, libocmirror::LogLevel::INFO);
}

static double secondsBetween(const std::chrono::system_clock::time_point& start,
                             const std::chrono::system_clock::time_point& end) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count() / double(1000);
}

Executor::Executor(std::shared_ptr<common::Config> config, std::shared_ptr<const CollaboratorFactory> factory)
    : config{std::move(config)}
    , factory{std::move(factory)}
{
    if(!this->config || !this->factory) {
        OCMIRROR_THROW_ERROR("Failed to create workflow executor: missing configuration or collaborator factory");
    }
}

Executor::~Executor() {
    cleanUp();
}

void Executor::validate(const common::Config& config, const std::string& destination) {
    const auto& from = config.global.from;
    if(config.global.configPath.empty()) {
        throwUsageError("use the --config flag it is mandatory");
    }
    if(boost::starts_with(destination, common::dockerProtocol) && from.empty()) {
        throwUsageError("when destination is docker://, diskToMirror workflow is assumed,"
                        " and the --from argument become mandatory");
    }
    if(boost::starts_with(destination, common::fileProtocol) && !from.empty()) {
        throwUsageError("when destination is file://, mirrorToDisk workflow is assumed,"
                        " and the --from argument is not needed");
    }
    if(!from.empty() && !boost::starts_with(from, common::fileProtocol)) {
        throwUsageError("when --from is used, it must have file:// prefix");
    }
    if(!boost::starts_with(destination, common::fileProtocol) && !boost::starts_with(destination, common::dockerProtocol)) {
        throwUsageError("destination must have either file:// (mirror to disk) or docker:// (diskToMirror) protocol prefixes");
    }
}

void Executor::validatePrepare(const common::Config& config) {
    const auto& from = config.global.from;
    if(config.global.configPath.empty()) {
        throwUsageError("use the --config flag it is mandatory");
    }
    if(from.empty()) {
        throwUsageError("with prepare command, the --from argument become mandatory(prefix : file://)");
    }
    if(!boost::starts_with(from, common::fileProtocol)) {
        throwUsageError("when --from is used, it must have file:// prefix");
    }
}

void Executor::complete(const std::string& destination) {
    config->runOptions.mode = common::resolveWorkflowMode(destination);
    config->runOptions.destination = destination;

    auto rootDirectory = config->runOptions.mode == common::WorkflowMode::MirrorToDisk
        ? libocmirror::string::removePrefix(destination, common::fileProtocol)
        : libocmirror::string::removePrefix(config->global.from, common::fileProtocol);
    completeCommon(rootDirectory);
}

void Executor::completePrepare() {
    config->runOptions.mode = common::WorkflowMode::Prepare;
    completeCommon(libocmirror::string::removePrefix(config->global.from, common::fileProtocol));
}

void Executor::completeCommon(const std::string& rootDirectory) {
    if(rootDirectory.empty()) {
        auto message = boost::format("Failed to determine the root directory of the %s workflow: empty path")
            % config->runOptions.mode;
        OCMIRROR_THROW_ERROR(message.str());
    }

    config->directories.initialize(rootDirectory, config->global.workingDirName, config->runOptions.mode, config->buildTime);
    config->runOptions.localStorageFQDN = "localhost:" + std::to_string(config->global.port);

    setupLogsLevelAndDir();
    printLog(boost::format("mode %s") % config->runOptions.mode, libocmirror::LogLevel::INFO);

    printLog(boost::format("imagesetconfig file %s") % config->global.configPath, libocmirror::LogLevel::DEBUG);
    config->readImageSetConfig();
    printLog(boost::format("imagesetconfig %s") % libocmirror::json::serialize(config->imageSetConfig),
             libocmirror::LogLevel::DEBUG);

    setupWorkingDir();
    setupLocalStorageDir();
    makeCollaborators();
}

void Executor::setupLogsLevelAndDir() {
    libocmirror::Logger::getInstance().setLevel(libocmirror::parseLogLevel(config->global.logLevel));

    const auto& logs = config->directories.logs;
    try {
        boost::filesystem::remove_all(logs);
        libocmirror::filesystem::createFoldersIfNecessary(logs);
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to set up logs directory %s") % logs;
        OCMIRROR_RETHROW_ERROR(e, message.str());
    }
}

void Executor::setupWorkingDir() const {
    const auto& directories = config->directories;
    for(const auto* directory : { &directories.workingDir,
                                  &directories.signatures,
                                  &directories.releaseImages,
                                  &directories.holdRelease,
                                  &directories.holdOperator }) {
        printLog(boost::format("creating directory %s") % *directory, libocmirror::LogLevel::DEBUG);
        libocmirror::filesystem::createFoldersIfNecessary(*directory);
    }
}

void Executor::setupLocalStorageDir() const {
    try {
        libocmirror::filesystem::createFoldersIfNecessary(config->directories.localStorageCache);
    }
    catch(const std::exception& e) {
        auto message = boost::format("unable to set up folder for oc-mirror local storage %s")
            % config->directories.localStorageCache;
        OCMIRROR_RETHROW_ERROR(e, message.str());
    }
}

void Executor::makeCollaborators() {
    auto constConfig = std::shared_ptr<const common::Config>{config};

    aggregator.reset(new collector::Aggregator{ factory->makeReleaseCollector(constConfig),
                                                factory->makeOperatorCollector(constConfig),
                                                factory->makeAdditionalImagesCollector(constConfig) });
    mirror = factory->makeMirror(constConfig);
    clusterResources = factory->makeClusterResourcesGenerator(constConfig);

    if(config->runOptions.mode == common::WorkflowMode::MirrorToDisk) {
        archiver = factory->makeArchiver(constConfig);
    }
    else if(config->runOptions.mode == common::WorkflowMode::DiskToMirror) {
        unArchiver = factory->makeUnArchiver(constConfig);
    }

    if(config->runOptions.mode != common::WorkflowMode::Prepare) {
        batch = factory->makeBatch(constConfig, mirror);
    }
}

void Executor::prepareStorageAndLogs() {
    if(!aggregator) {
        OCMIRROR_THROW_ERROR("Failed to prepare local storage: the workflow was not completed");
    }

    const auto& directories = config->directories;
    if(!boost::filesystem::is_directory(directories.localStorageCache)) {
        OCMIRROR_THROW_ERROR("error using the local storage folder for caching");
    }

    auto registryConfig = registry::RegistryConfig{ directories.localStorageCache,
                                                    config->global.port,
                                                    config->global.logLevel };
    registryConfig.write(directories.registryConfigFile);

    try {
        registryLogFile.reset(new registry::RegistryLogFile{directories.registryLogFile});
        printLog(boost::format("local storage registry will log to %s") % directories.registryLogFile,
                 libocmirror::LogLevel::INFO);
    }
    catch(const libocmirror::Error& e) {
        printLog(boost::format("Failed to create log file for local storage registry, using default stderr (%s)")
                    % e.what(),
                 libocmirror::LogLevel::WARN);
    }

    registry = factory->makeRegistry(config, directories.registryConfigFile, registryLogFile.get());
}

void Executor::startLocalStorage() {
    if(!registry) {
        OCMIRROR_THROW_ERROR("Failed to start local storage: storage and logs were not prepared");
    }
    printLog(boost::format("starting local storage on localhost:%d") % config->global.port, libocmirror::LogLevel::INFO);
    registry->start();

    auto timeout = std::chrono::milliseconds{ config->getUnsignedSetting("registryReadinessTimeoutMs", 30000) };
    registry->waitUntilReady(timeout);
}

void Executor::run(const common::Context& context) {
    // make sure we always get multi-arch images
    config->runOptions.multiArch = "all";

    try {
        switch(config->runOptions.mode) {
        case common::WorkflowMode::MirrorToDisk:
            runMirrorToDisk(context);
            break;
        case common::WorkflowMode::DiskToMirror:
            runDiskToMirror(context);
            break;
        case common::WorkflowMode::Prepare:
            OCMIRROR_THROW_ERROR("the prepare workflow only verifies the cache, it doesn't mirror");
        }
    }
    catch(const std::exception& e) {
        cleanUp();
        auto message = boost::format("Failed to run %s workflow") % config->runOptions.mode;
        OCMIRROR_RETHROW_ERROR(e, message.str());
    }
    cleanUp();
}

void Executor::runMirrorToDisk(const common::Context& context) {
    auto startTime = std::chrono::system_clock::now();

    startLocalStorage();

    auto allImages = collectAll(context);
    auto collectionFinish = std::chrono::system_clock::now();

    batch->worker(context, allImages);

    // the archive must not include a cache that is still being written
    printLog("end of mirroring to disk. Stopping local storage to prepare the archive", libocmirror::LogLevel::INFO);
    registry->shutdown();

    auto archiveFile = archiver->buildArchive(context, allImages);
    archiver->close();
    archiver.reset();
    printLog(boost::format("archive file generated: %s") % archiveFile, libocmirror::LogLevel::INFO);

    logTimes(startTime, collectionFinish, std::chrono::system_clock::now());
}

void Executor::runDiskToMirror(const common::Context& context) {
    auto startTime = std::chrono::system_clock::now();

    // the cache served by the registry must be complete before anything is collected
    unArchiver->unarchive(context);

    startLocalStorage();

    auto allImages = collectAll(context);
    auto collectionFinish = std::chrono::system_clock::now();

    batch->worker(context, allImages);
    clusterResources->generate(context, allImages);

    unArchiver->close();
    unArchiver.reset();

    logTimes(startTime, collectionFinish, std::chrono::system_clock::now());
}

void Executor::runPrepare(const common::Context& context) {
    try {
        if(config->runOptions.mode != common::WorkflowMode::Prepare) {
            auto message = boost::format("cache verification requires the prepare workflow, current mode is %s")
                % config->runOptions.mode;
            OCMIRROR_THROW_ERROR(message.str());
        }
        startLocalStorage();
        verifyCache(context);
    }
    catch(const std::exception& e) {
        cleanUp();
        OCMIRROR_RETHROW_ERROR(e, "Failed to verify the local storage cache");
    }
    cleanUp();
}

void Executor::verifyCache(const common::Context& context) {
    auto allImages = collectAll(context);

    const auto& report = config->directories.cachedImagesReport;
    libocmirror::filesystem::writeTextFile("", report);

    auto missingImages = std::vector<std::string>{};
    for(const auto& item : allImages) {
        context.throwIfCancelled("cache verification");

        libocmirror::filesystem::writeTextFile(item.destination + "\n", report, std::ios_base::app);

        auto isCached = false;
        try {
            isCached = mirror->check(context, item.destination);
        }
        catch(const std::exception& e) {
            printLog(boost::format("unable to check existence of %s in local cache: %s") % item.destination % e.what(),
                     libocmirror::LogLevel::WARN);
        }

        if(!isCached) {
            missingImages.push_back(item.destination);
        }
    }

    if(!missingImages.empty()) {
        auto message = std::stringstream{};
        message << "all images necessary for mirroring are not available in the cache."
                << "\nplease re-run the mirror to disk process"
                << "\nmissing images:";
        for(const auto& image : missingImages) {
            message << "\n  " << image;
        }
        printLog(message.str(), libocmirror::LogLevel::ERROR);
        OCMIRROR_THROW_ERROR(message.str());
    }

    printLog(boost::format("all %d images required for mirroring are available in local cache."
                           " You may proceed with mirroring from disk to disconnected registry")
                % allImages.size(),
             libocmirror::LogLevel::INFO);
    printLog(boost::format("full list in : %s") % report, libocmirror::LogLevel::INFO);
}

std::vector<common::WorkItem> Executor::collectAll(const common::Context& context) {
    if(!aggregator) {
        OCMIRROR_THROW_ERROR("Failed to collect images: the workflow was not completed");
    }
    try {
        return aggregator->collectAll(context);
    }
    catch(const std::exception& e) {
        cleanUp();
        OCMIRROR_RETHROW_ERROR(e, "Failed to collect the images to mirror");
    }
}

void Executor::logTimes(const std::chrono::system_clock::time_point& start,
                        const std::chrono::system_clock::time_point& collectionFinish,
                        const std::chrono::system_clock::time_point& mirrorFinish) const {
    auto startTime = std::chrono::system_clock::to_time_t(start);
    auto formattedStartTime = std::stringstream{};
    formattedStartTime << std::put_time(std::localtime(&startTime), "%Y-%m-%d %H:%M:%S");
    printLog(boost::format("start time      : %s") % formattedStartTime.str(), libocmirror::LogLevel::INFO);
    printLog(boost::format("collection time : %s [sec]") % secondsBetween(start, collectionFinish),
             libocmirror::LogLevel::INFO);
    printLog(boost::format("mirror time     : %s [sec]") % secondsBetween(start, mirrorFinish),
             libocmirror::LogLevel::INFO);
}

void Executor::cleanUp() {
    if(isCleanedUp) {
        return;
    }
    isCleanedUp = true;
    printLog("cleaning up", libocmirror::LogLevel::DEBUG);

    if(registry) {
        try {
            if(registry->isRunning()) {
                registry->shutdown();
            }
        }
        catch(const std::exception& e) {
            printLog(boost::format("Failed to stop local storage: %s") % e.what(), libocmirror::LogLevel::WARN);
        }
        registry.reset();
    }

    if(archiver) {
        try {
            archiver->close();
        }
        catch(const std::exception& e) {
            printLog(boost::format("Failed to release archive resources: %s") % e.what(), libocmirror::LogLevel::WARN);
        }
        archiver.reset();
    }

    if(unArchiver) {
        try {
            unArchiver->close();
        }
        catch(const std::exception& e) {
            printLog(boost::format("Failed to release unarchive resources: %s") % e.what(), libocmirror::LogLevel::WARN);
        }
        unArchiver.reset();
    }

    if(registryLogFile) {
        try {
            registryLogFile->close();
        }
        catch(const std::exception& e) {
            printLog(boost::format("error closing log file %s: %s") % registryLogFile->getPath() % e.what(),
                     libocmirror::LogLevel::WARN);
        }
        registryLogFile.reset();
    }

    // the prepare workflow keeps its report
    const auto& logs = config->directories.logs;
    if(config->runOptions.mode != common::WorkflowMode::Prepare && !logs.empty()) {
        auto ec = boost::system::error_code{};
        boost::filesystem::remove_all(logs, ec);
        if(ec) {
            printLog(boost::format("Failed to remove logs directory %s: %s") % logs % ec.message(),
                     libocmirror::LogLevel::WARN);
        }
    }
}

void Executor::printLog(const boost::format& message, libocmirror::LogLevel level) const {
    libocmirror::Logger::getInstance().log(message, sysname, level);
}

void Executor::printLog(const std::string& message, libocmirror::LogLevel level) const {
    libocmirror::Logger::getInstance().log(message, sysname, level);
}

}
}
