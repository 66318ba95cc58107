/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_registry_LocalRegistry_hpp
#define ocmirror_registry_LocalRegistry_hpp

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include <sys/types.h>

#include <boost/filesystem.hpp>
#include <boost/format.hpp>
#include <boost/optional.hpp>

#include "libocmirror/LogLevel.hpp"
#include "common/Config.hpp"
#include "registry/RegistryInterface.hpp"
#include "registry/RegistryLogFile.hpp"
#include "registry/ShutdownReason.hpp"


namespace ocmirror {
namespace registry {

/**
 * Runs the distribution registry executable as a child process serving
 * the local storage cache. A dedicated watcher thread waits for the child
 * and records why it stopped. A stop that was not requested through
 * shutdown() is a fault and is reported to the fault handler.
 */
class LocalRegistry : public RegistryInterface {
public:
    enum class State { Constructed, Starting, Serving, ShuttingDown, Stopped };
    using FaultHandler = std::function<void(const ShutdownReason&)>;

public:
    LocalRegistry(std::shared_ptr<const common::Config> config,
                  const boost::filesystem::path& configFile,
                  const RegistryLogFile* logFile,
                  FaultHandler faultHandler = terminateProcess);
    LocalRegistry(const LocalRegistry&) = delete;
    LocalRegistry& operator=(const LocalRegistry&) = delete;
    ~LocalRegistry();

    void start() override;
    void waitUntilReady(std::chrono::milliseconds timeout) override;
    void shutdown() override;
    bool isRunning() const override;

    State getState() const;
    boost::optional<ShutdownReason> getShutdownReason() const;
    pid_t getPid() const;

    static void terminateProcess(const ShutdownReason& reason);

private:
    void watchChild();
    bool isAcceptingConnections() const;
    void printLog(const boost::format& message, libocmirror::LogLevel level) const;
    void printLog(const std::string& message, libocmirror::LogLevel level) const;

private:
    const std::string sysname = "LocalRegistry";
    std::shared_ptr<const common::Config> config;
    boost::filesystem::path configFile;
    const RegistryLogFile* logFile;
    FaultHandler faultHandler;
    std::chrono::milliseconds shutdownTimeout;

    mutable std::mutex mutex;
    std::condition_variable stoppedCondition;
    State state = State::Constructed;
    boost::optional<ShutdownReason> shutdownReason;
    pid_t pid = -1;
    std::thread watcher;
};

std::ostream& operator<<(std::ostream&, LocalRegistry::State);

}
}

#endif
