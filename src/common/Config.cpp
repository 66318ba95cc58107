/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "common/Config.hpp"

#include <boost/format.hpp>

#include "libocmirror/Error.hpp"
#include "libocmirror/Utility.hpp"


namespace ocmirror {
namespace common {

Config::Config(const boost::filesystem::path& installationPrefixDir)
    : Config{installationPrefixDir / "etc/ocmirror.json", installationPrefixDir / "etc/ocmirror.schema.json"}
{}

Config::Config(const boost::filesystem::path& configFilename,
               const boost::filesystem::path& configSchemaFilename)
    : json{ libocmirror::json::readAndValidate(configFilename, configSchemaFilename) }
{}

void Config::Directories::initialize(const boost::filesystem::path& rootDirectory,
                                     const std::string& workingDirName,
                                     WorkflowMode mode,
                                     const BuildTime& buildTime) {
    auto cacheBaseDir = libocmirror::environment::findVariable(buildTime.cacheEnvironmentVariable);
    if(!cacheBaseDir || cacheBaseDir->empty()) {
        cacheBaseDir = libocmirror::environment::findVariable("HOME");
    }
    if(!cacheBaseDir || cacheBaseDir->empty()) {
        auto message = boost::format("Failed to determine the local storage cache directory: neither %s nor HOME are set")
            % buildTime.cacheEnvironmentVariable;
        OCMIRROR_THROW_ERROR(message.str());
    }
    localStorageCache = boost::filesystem::path{*cacheBaseDir} / buildTime.cacheRelativePath;

    rootDir = boost::filesystem::absolute(rootDirectory);
    workingDir = rootDir / workingDirName;
    if(mode == WorkflowMode::DiskToMirror) {
        logs = localStorageCache.parent_path() / "logs";
    }
    else {
        logs = rootDir / "logs";
    }
    signatures = workingDir / "signatures";
    releaseImages = workingDir / "release-images";
    holdRelease = workingDir / "hold-release";
    holdOperator = workingDir / "hold-operator";
    clusterResources = workingDir / "cluster-resources";
    registryConfigFile = logs / "registry-config.yml";
    registryLogFile = logs / "registry.log";
    cachedImagesReport = logs / "cached-images.txt";

    libocmirror::logMessage(boost::format("working directory %s, logs %s, local storage cache %s")
                                % workingDir % logs % localStorageCache,
                            libocmirror::LogLevel::DEBUG);
}

void Config::readImageSetConfig() {
    if(global.configPath.empty()) {
        OCMIRROR_THROW_ERROR("use the --config flag it is mandatory", libocmirror::LogLevel::INFO);
    }
    try {
        imageSetConfig = libocmirror::json::readAndValidate(global.configPath, getImageSetConfigSchemaFile());
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to read image set configuration %s") % global.configPath;
        OCMIRROR_RETHROW_ERROR(e, message.str());
    }
}

boost::filesystem::path Config::getImageSetConfigSchemaFile() const {
    return boost::filesystem::path{ json["prefixDir"].GetString() } / "etc/imageset-config.schema.json";
}

unsigned int Config::getUnsignedSetting(const char* key, unsigned int defaultValue) const {
    if(!json.HasMember(key)) {
        return defaultValue;
    }
    return json[key].GetUint();
}

std::string Config::getLocalStorageURL() const {
    return dockerProtocol + runOptions.localStorageFQDN;
}

}} // namespaces
