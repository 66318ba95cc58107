/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "LocalRegistry.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>

#include <unistd.h>
#include <sys/wait.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>

#include "libocmirror/Error.hpp"
#include "libocmirror/Logger.hpp"
#include "libocmirror/CLIArguments.hpp"


namespace ocmirror {
namespace registry {

LocalRegistry::LocalRegistry(std::shared_ptr<const common::Config> config,
                             const boost::filesystem::path& configFile,
                             const RegistryLogFile* logFile,
                             FaultHandler faultHandler)
    : config{std::move(config)}
    , configFile{configFile}
    , logFile{logFile}
    , faultHandler{std::move(faultHandler)}
{
    shutdownTimeout = std::chrono::milliseconds{
        this->config->getUnsignedSetting("registryShutdownTimeoutMs", 10000)};
}

LocalRegistry::~LocalRegistry() {
    try {
        shutdown();
    }
    catch(const std::exception& e) {
        libocmirror::Logger::getInstance().log(e.what(), sysname, libocmirror::LogLevel::WARN);
    }
    if(watcher.joinable()) {
        watcher.join();
    }
}

void LocalRegistry::start() {
    std::unique_lock<std::mutex> lock{mutex};
    if(state != State::Constructed) {
        auto message = boost::format("Failed to start local storage registry: registry is %s, it cannot be started again")
            % state;
        OCMIRROR_THROW_ERROR(message.str());
    }

    auto registryPath = std::string{config->json["registryPath"].GetString()};
    // prepared before fork: only async-signal-safe calls are allowed in the child
    auto args = libocmirror::CLIArguments{registryPath, "serve", configFile.string()};
    auto logFd = logFile && logFile->isOpen() ? logFile->getFileDescriptor() : -1;

    printLog(boost::format("starting local storage registry: %s") % args, libocmirror::LogLevel::DEBUG);

    auto childPid = fork();
    if(childPid == -1) {
        auto message = boost::format("Failed to fork local storage registry: %s") % strerror(errno);
        OCMIRROR_THROW_ERROR(message.str());
    }

    if(childPid == 0) {
        // terminal interrupts are handled by the parent, which stops the registry
        setpgid(0, 0);
        if(logFd != -1) {
            dup2(logFd, STDOUT_FILENO);
            dup2(logFd, STDERR_FILENO);
        }
        execv(args.argv()[0], args.argv());
        const char prefix[] = "Failed to execv local storage registry ";
        write(STDERR_FILENO, prefix, sizeof(prefix)-1);
        write(STDERR_FILENO, args.argv()[0], strlen(args.argv()[0]));
        write(STDERR_FILENO, "\n", 1);
        _exit(127);
    }

    pid = childPid;
    state = State::Starting;
    watcher = std::thread{&LocalRegistry::watchChild, this};
    printLog(boost::format("local storage registry started (pid %d)") % pid, libocmirror::LogLevel::DEBUG);
}

void LocalRegistry::watchChild() {
    int status = 0;
    while(true) {
        if(waitpid(pid, &status, 0) == -1) {
            if(errno == EINTR) {
                continue;
            }
            status = -1;
            break;
        }
        if(WIFEXITED(status) || WIFSIGNALED(status)) {
            break;
        }
    }

    auto details = std::string{};
    if(status == -1) {
        details = std::string{"failed to wait for registry process: "} + strerror(errno);
    }
    else if(WIFEXITED(status)) {
        details = (boost::format("registry process exited with status %d") % WEXITSTATUS(status)).str();
    }
    else {
        details = (boost::format("registry process terminated by signal %d") % WTERMSIG(status)).str();
    }

    auto reason = ShutdownReason{};
    {
        std::lock_guard<std::mutex> lock{mutex};
        reason = state == State::ShuttingDown ? ShutdownReason::requested() : ShutdownReason::fault(details);
    }

    // the fault is reported before the stop becomes observable
    if(reason.isRequested()) {
        printLog(boost::format("local storage registry stopped (%s)") % details, libocmirror::LogLevel::DEBUG);
    }
    else if(faultHandler) {
        faultHandler(reason);
    }

    {
        std::lock_guard<std::mutex> lock{mutex};
        shutdownReason = reason;
        state = State::Stopped;
    }
    stoppedCondition.notify_all();
}

bool LocalRegistry::isAcceptingConnections() const {
    auto fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if(fd == -1) {
        auto message = boost::format("Failed to create socket to check readiness of local storage registry: %s") % strerror(errno);
        OCMIRROR_THROW_ERROR(message.str());
    }

    struct sockaddr_in address;
    std::memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_port = htons(config->global.port);
    address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    auto connected = connect(fd, reinterpret_cast<struct sockaddr*>(&address), sizeof(address)) == 0;
    close(fd);
    return connected;
}

void LocalRegistry::waitUntilReady(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    const auto pollInterval = std::chrono::milliseconds{50};

    while(true) {
        {
            std::unique_lock<std::mutex> lock{mutex};
            if(state == State::Serving) {
                return;
            }
            if(state == State::Constructed) {
                OCMIRROR_THROW_ERROR("Failed to wait for local storage registry: registry was not started");
            }
            if(state != State::Starting) {
                auto reason = shutdownReason ? shutdownReason->details : std::string{"shutdown requested"};
                auto message = boost::format("local storage registry stopped before becoming ready (%s), see %s")
                    % reason % (logFile ? logFile->getPath().string() : std::string{"stderr"});
                OCMIRROR_THROW_ERROR(message.str());
            }
        }

        if(isAcceptingConnections()) {
            std::lock_guard<std::mutex> lock{mutex};
            if(state == State::Starting) {
                state = State::Serving;
                printLog(boost::format("local storage registry listening on port %d") % config->global.port,
                         libocmirror::LogLevel::DEBUG);
            }
            continue;
        }

        if(std::chrono::steady_clock::now() >= deadline) {
            auto message = boost::format("local storage registry did not become ready within %d ms")
                % timeout.count();
            OCMIRROR_THROW_ERROR(message.str());
        }

        std::unique_lock<std::mutex> lock{mutex};
        stoppedCondition.wait_for(lock, pollInterval, [this]() { return state == State::Stopped; });
    }
}

void LocalRegistry::shutdown() {
    std::unique_lock<std::mutex> lock{mutex};
    if(state == State::Constructed) {
        state = State::Stopped;
        return;
    }

    if(state == State::Starting || state == State::Serving) {
        printLog("stopping local storage registry", libocmirror::LogLevel::DEBUG);
        state = State::ShuttingDown;
        if(kill(pid, SIGTERM) != 0 && errno != ESRCH) {
            auto message = boost::format("Failed to send SIGTERM to local storage registry (pid %d): %s")
                % pid % strerror(errno);
            OCMIRROR_THROW_ERROR(message.str());
        }

        auto isStopped = [this]() { return state == State::Stopped; };
        if(!stoppedCondition.wait_for(lock, shutdownTimeout, isStopped)) {
            printLog(boost::format("local storage registry did not stop within %d ms, sending SIGKILL")
                        % shutdownTimeout.count(),
                     libocmirror::LogLevel::WARN);
            kill(pid, SIGKILL);
            stoppedCondition.wait(lock, isStopped);
        }
    }
    lock.unlock();

    if(watcher.joinable() && watcher.get_id() != std::this_thread::get_id()) {
        watcher.join();
    }
}

bool LocalRegistry::isRunning() const {
    std::lock_guard<std::mutex> lock{mutex};
    return state == State::Starting || state == State::Serving || state == State::ShuttingDown;
}

LocalRegistry::State LocalRegistry::getState() const {
    std::lock_guard<std::mutex> lock{mutex};
    return state;
}

boost::optional<ShutdownReason> LocalRegistry::getShutdownReason() const {
    std::lock_guard<std::mutex> lock{mutex};
    return shutdownReason;
}

pid_t LocalRegistry::getPid() const {
    std::lock_guard<std::mutex> lock{mutex};
    return pid;
}

void LocalRegistry::terminateProcess(const ShutdownReason& reason) {
    auto message = boost::format("local storage registry failed unexpectedly (%s), aborting") % reason.details;
    libocmirror::Logger::getInstance().log(message, "LocalRegistry", libocmirror::LogLevel::ERROR);
    std::cerr.flush();
    // the watcher thread cannot unwind the main thread, skip static destructors
    std::_Exit(EXIT_FAILURE);
}

void LocalRegistry::printLog(const boost::format& message, libocmirror::LogLevel level) const {
    libocmirror::Logger::getInstance().log(message, sysname, level);
}

void LocalRegistry::printLog(const std::string& message, libocmirror::LogLevel level) const {
    libocmirror::Logger::getInstance().log(message, sysname, level);
}

std::ostream& operator<<(std::ostream& os, LocalRegistry::State state) {
    switch(state) {
        case LocalRegistry::State::Constructed: os << "constructed"; break;
        case LocalRegistry::State::Starting: os << "starting"; break;
        case LocalRegistry::State::Serving: os << "serving"; break;
        case LocalRegistry::State::ShuttingDown: os << "shutting down"; break;
        case LocalRegistry::State::Stopped: os << "stopped"; break;
    }
    return os;
}

}
}
