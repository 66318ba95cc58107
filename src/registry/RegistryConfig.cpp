/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "RegistryConfig.hpp"

#include <boost/format.hpp>

#include "libocmirror/Error.hpp"
#include "libocmirror/Utility.hpp"


namespace ocmirror {
namespace registry {

static const std::string configTemplate =
R"(version: 0.1
log:
  accesslog:
    disabled: $$PLACEHOLDER_ACCESS_LOG_OFF$$
  level: $$PLACEHOLDER_LOG_LEVEL$$
  formatter: text
  fields:
    service: registry
storage:
  cache:
    blobdescriptor: inmemory
  filesystem:
    rootdirectory: $$PLACEHOLDER_ROOT$$
http:
  addr: :$$PLACEHOLDER_PORT$$
  headers:
    X-Content-Type-Options: [nosniff]
health:
  storagedriver:
    enabled: true
    interval: 10s
    threshold: 3
)";

RegistryConfig::RegistryConfig(const boost::filesystem::path& rootDirectory, std::uint16_t port, const std::string& logLevel)
    : rootDirectory{rootDirectory}
    , port{port}
    , logLevel{logLevel}
{
    if(rootDirectory.empty()) {
        OCMIRROR_THROW_ERROR("Failed to configure local storage registry: root directory is empty");
    }
    if(port == 0) {
        OCMIRROR_THROW_ERROR("Failed to configure local storage registry: port 0 is not allowed");
    }
}

std::string RegistryConfig::generate() const {
    auto config = configTemplate;
    auto accessLogOff = logLevel == "debug" ? "false" : "true";
    libocmirror::string::replace(config, "$$PLACEHOLDER_ROOT$$", rootDirectory.string());
    libocmirror::string::replace(config, "$$PLACEHOLDER_PORT$$", std::to_string(port));
    libocmirror::string::replace(config, "$$PLACEHOLDER_LOG_LEVEL$$", toRegistryLogLevel(logLevel));
    libocmirror::string::replace(config, "$$PLACEHOLDER_ACCESS_LOG_OFF$$", accessLogOff);

    if(config.find("$$PLACEHOLDER_") != std::string::npos) {
        OCMIRROR_THROW_ERROR("Failed to generate local storage registry configuration: unresolved placeholder");
    }
    return config;
}

void RegistryConfig::write(const boost::filesystem::path& file) const {
    auto message = boost::format("writing local storage registry configuration to %s") % file;
    libocmirror::logMessage(message, libocmirror::LogLevel::DEBUG);
    libocmirror::filesystem::writeTextFile(generate(), file);
}

// the registry knows no "trace" level
std::string RegistryConfig::toRegistryLogLevel(const std::string& logLevel) {
    if(logLevel == "trace") {
        return "debug";
    }
    else if(logLevel == "warn") {
        return "warn";
    }
    else if(logLevel == "debug" || logLevel == "error") {
        return logLevel;
    }
    return "info";
}

}
}
