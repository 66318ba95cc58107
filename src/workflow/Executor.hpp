/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_workflow_Executor_hpp
#define ocmirror_workflow_Executor_hpp

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <boost/format.hpp>

#include "libocmirror/LogLevel.hpp"
#include "common/Config.hpp"
#include "common/Context.hpp"
#include "common/WorkItem.hpp"
#include "archive/Archiver.hpp"
#include "clusterresources/ClusterResourcesGenerator.hpp"
#include "collector/Aggregator.hpp"
#include "mirror/Batch.hpp"
#include "mirror/MirrorInterface.hpp"
#include "registry/RegistryInterface.hpp"
#include "registry/RegistryLogFile.hpp"
#include "workflow/CollaboratorFactory.hpp"


namespace ocmirror {
namespace workflow {

/**
 * Drives one mirroring run.
 *
 * Usage: validate() or validatePrepare(), then complete() or completePrepare(),
 * prepareStorageAndLogs(), and finally run() or runPrepare().
 *
 * mirror to disk: local storage -> collect -> copy -> stop local storage -> archive
 * disk to mirror: unarchive -> local storage -> collect -> copy -> cluster resources
 * prepare:        local storage -> collect -> check presence in the cache
 *
 * Whatever the outcome, the resources of the run (local storage registry,
 * archive staging, registry log, logs directory) are released exactly once.
 */
class Executor {
public:
    Executor(std::shared_ptr<common::Config> config,
             std::shared_ptr<const CollaboratorFactory> factory = std::make_shared<DefaultCollaboratorFactory>());
    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;
    ~Executor();

    static void validate(const common::Config& config, const std::string& destination);
    static void validatePrepare(const common::Config& config);

    void complete(const std::string& destination);
    void completePrepare();
    void prepareStorageAndLogs();

    void run(const common::Context& context);
    void runPrepare(const common::Context& context);
    std::vector<common::WorkItem> collectAll(const common::Context& context);

private:
    void completeCommon(const std::string& rootDirectory);
    void setupLogsLevelAndDir();
    void setupWorkingDir() const;
    void setupLocalStorageDir() const;
    void makeCollaborators();
    void startLocalStorage();
    void runMirrorToDisk(const common::Context& context);
    void runDiskToMirror(const common::Context& context);
    void verifyCache(const common::Context& context);
    void logTimes(const std::chrono::system_clock::time_point& start,
                  const std::chrono::system_clock::time_point& collectionFinish,
                  const std::chrono::system_clock::time_point& mirrorFinish) const;
    void cleanUp();
    void printLog(const boost::format& message, libocmirror::LogLevel level) const;
    void printLog(const std::string& message, libocmirror::LogLevel level) const;

private:
    const std::string sysname = "Executor";
    std::shared_ptr<common::Config> config;
    std::shared_ptr<const CollaboratorFactory> factory;

    std::unique_ptr<collector::Aggregator> aggregator;
    std::shared_ptr<mirror::MirrorInterface> mirror;
    std::unique_ptr<mirror::BatchInterface> batch;
    std::unique_ptr<archive::Archiver> archiver;
    std::unique_ptr<archive::UnArchiver> unArchiver;
    std::unique_ptr<clusterresources::GeneratorInterface> clusterResources;

    // the registry writes to the log file, the file must outlive it
    std::unique_ptr<registry::RegistryLogFile> registryLogFile;
    std::unique_ptr<registry::RegistryInterface> registry;

    bool isCleanedUp = false;
};

}
}

#endif
