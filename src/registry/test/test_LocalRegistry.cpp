/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <atomic>
#include <chrono>
#include <cstring>
#include <mutex>
#include <thread>

#include <unistd.h>
#include <sys/socket.h>
#include <netinet/in.h>

#include <boost/filesystem.hpp>

#include "libocmirror/Utility.hpp"
#include "registry/LocalRegistry.hpp"
#include "registry/RegistryConfig.hpp"
#include "registry/RegistryLogFile.hpp"
#include "test_utility/config.hpp"
#include "test_utility/unittest_main_function.hpp"


namespace ocmirror {
namespace registry {
namespace test {

static std::uint16_t findFreePort() {
    auto fd = socket(AF_INET, SOCK_STREAM, 0);
    struct sockaddr_in address;
    std::memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_port = 0;
    address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    bind(fd, reinterpret_cast<struct sockaddr*>(&address), sizeof(address));
    socklen_t length = sizeof(address);
    getsockname(fd, reinterpret_cast<struct sockaddr*>(&address), &length);
    close(fd);
    return ntohs(address.sin_port);
}

class Fixture {
public:
    explicit Fixture(const std::string& mockBehaviour = "") {
        libocmirror::environment::setVariable("REGISTRY_MOCK_BEHAVIOUR", mockBehaviour);

        auto& config = *configRAII.config;
        auto& allocator = config.json.GetAllocator();
        config.json["registryPath"].SetString(REGISTRY_MOCK_PATH, allocator);
        config.global.port = findFreePort();

        auto logs = configRAII.baseDir / "logs";
        libocmirror::filesystem::createFoldersIfNecessary(logs);
        configFile = logs / "registry-config.yml";
        RegistryConfig{configRAII.baseDir / "cache", config.global.port, "info"}.write(configFile);
        logFile.reset(new RegistryLogFile{logs / "registry.log"});
    }

    std::unique_ptr<LocalRegistry> makeRegistry() {
        auto handler = [this](const ShutdownReason& reason) {
            std::lock_guard<std::mutex> lock{mutex};
            faults.push_back(reason);
        };
        return std::unique_ptr<LocalRegistry>{
            new LocalRegistry{configRAII.config, configFile, logFile.get(), handler}};
    }

    std::vector<ShutdownReason> getFaults() {
        std::lock_guard<std::mutex> lock{mutex};
        return faults;
    }

    std::string readLog() const {
        return libocmirror::filesystem::readFile(logFile->getPath());
    }

    test_utility::config::ConfigRAII configRAII = test_utility::config::makeConfig();
    boost::filesystem::path configFile;
    std::unique_ptr<RegistryLogFile> logFile;

private:
    std::mutex mutex;
    std::vector<ShutdownReason> faults;
};

TEST_GROUP(LocalRegistryTestGroup) {
    void teardown() {
        libocmirror::environment::unsetVariable("REGISTRY_MOCK_BEHAVIOUR");
    }
};

TEST(LocalRegistryTestGroup, start_ready_and_requested_shutdown) {
    Fixture fixture;
    auto registry = fixture.makeRegistry();

    CHECK(registry->getState() == LocalRegistry::State::Constructed);
    CHECK(!registry->isRunning());

    registry->start();
    CHECK(registry->isRunning());
    registry->waitUntilReady(std::chrono::milliseconds{5000});
    CHECK(registry->getState() == LocalRegistry::State::Serving);

    registry->shutdown();
    CHECK(registry->getState() == LocalRegistry::State::Stopped);
    CHECK(!registry->isRunning());
    CHECK(*registry->getShutdownReason() == ShutdownReason::requested());
    CHECK(fixture.getFaults().empty());
    CHECK(fixture.readLog().find("registry mock listening") != std::string::npos);

    // shutdown is idempotent
    registry->shutdown();
    CHECK(registry->getState() == LocalRegistry::State::Stopped);
}

TEST(LocalRegistryTestGroup, restart_of_stopped_registry_fails) {
    Fixture fixture;
    auto registry = fixture.makeRegistry();
    registry->start();
    registry->waitUntilReady(std::chrono::milliseconds{5000});
    registry->shutdown();

    CHECK_THROWS(libocmirror::Error, registry->start());
}

TEST(LocalRegistryTestGroup, wait_before_start_fails) {
    Fixture fixture;
    auto registry = fixture.makeRegistry();
    CHECK_THROWS(libocmirror::Error, registry->waitUntilReady(std::chrono::milliseconds{100}));
}

TEST(LocalRegistryTestGroup, shutdown_before_start) {
    Fixture fixture;
    auto registry = fixture.makeRegistry();
    registry->shutdown();
    CHECK(registry->getState() == LocalRegistry::State::Stopped);
    CHECK(!registry->getShutdownReason());
    CHECK_THROWS(libocmirror::Error, registry->start());
}

TEST(LocalRegistryTestGroup, exit_before_ready_is_reported) {
    Fixture fixture{"exit-immediately"};
    auto registry = fixture.makeRegistry();
    registry->start();

    CHECK_THROWS(libocmirror::Error, registry->waitUntilReady(std::chrono::milliseconds{5000}));
    CHECK(registry->getState() == LocalRegistry::State::Stopped);
    CHECK(*registry->getShutdownReason() == ShutdownReason::fault("registry process exited with status 2"));

    auto faults = fixture.getFaults();
    CHECK(faults.size() == 1);
    CHECK(fixture.readLog().find("registry mock exiting immediately") != std::string::npos);
}

TEST(LocalRegistryTestGroup, unexpected_exit_is_a_fault) {
    Fixture fixture{"crash-after-listen"};
    auto registry = fixture.makeRegistry();
    registry->start();
    registry->waitUntilReady(std::chrono::milliseconds{5000});

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{5};
    while(registry->isRunning() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds{20});
    }

    CHECK(!registry->isRunning());
    auto faults = fixture.getFaults();
    CHECK(faults.size() == 1);
    CHECK(faults.front() == ShutdownReason::fault("registry process exited with status 3"));
    CHECK(*registry->getShutdownReason() == faults.front());

    // a stopped registry needs no shutdown, the fault is not reported again
    registry->shutdown();
    CHECK(fixture.getFaults().size() == 1);
}

TEST(LocalRegistryTestGroup, registry_ignoring_sigterm_is_killed) {
    Fixture fixture{"ignore-sigterm"};
    auto registry = fixture.makeRegistry();
    registry->start();
    registry->waitUntilReady(std::chrono::milliseconds{5000});

    registry->shutdown();
    CHECK(registry->getState() == LocalRegistry::State::Stopped);
    CHECK(registry->getShutdownReason()->isRequested());
    CHECK(fixture.getFaults().empty());
}

TEST(LocalRegistryTestGroup, readiness_timeout) {
    Fixture fixture{"never-listen"};
    auto registry = fixture.makeRegistry();
    registry->start();
    CHECK_THROWS(libocmirror::Error, registry->waitUntilReady(std::chrono::milliseconds{300}));
    CHECK(registry->getState() == LocalRegistry::State::Starting);

    registry->shutdown();
    CHECK(registry->getShutdownReason()->isRequested());
    CHECK(fixture.getFaults().empty());
}

}
}
}

OCMIRROR_UNITTEST_MAIN_FUNCTION_WITH_THREADS();
