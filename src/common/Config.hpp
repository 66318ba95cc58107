/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_common_Config_hpp
#define ocmirror_common_Config_hpp

#include <string>
#include <chrono>
#include <cstdint>

#include <boost/filesystem.hpp>
#include <rapidjson/document.h>

#include "common/WorkflowMode.hpp"


namespace ocmirror {
namespace common {

class Config {
    public:
        Config() = default;
        Config(const boost::filesystem::path& configFilename,
               const boost::filesystem::path& configSchemaFilename);
        Config(const boost::filesystem::path& installationPrefixDir);

        struct BuildTime {
            BuildTime();
            std::string version;
            boost::filesystem::path cacheRelativePath = ".oc-mirror/.cache";
            std::string cacheEnvironmentVariable = "OC_MIRROR_CACHE";
        };

        // command line options of the mirror and prepare commands
        struct Global {
            std::string configPath;
            std::string logLevel = "info";
            std::string workingDirName = "working-dir";
            std::string from;
            std::uint16_t port = 5000;
            bool quiet = false;
            bool force = false;
            bool securePolicy = false;
            bool srcTlsVerify = true;
            bool destTlsVerify = true;
        };

        struct RunOptions {
            WorkflowMode mode = WorkflowMode::MirrorToDisk;
            std::string destination;
            std::string multiArch = "system";
            std::string localStorageFQDN;
        };

        struct Directories {
            // Logs stay off the --from transport directory in the disk to mirror workflow
            void initialize(const boost::filesystem::path& rootDirectory,
                            const std::string& workingDirName,
                            WorkflowMode mode,
                            const BuildTime& buildTime);
            boost::filesystem::path rootDir;
            boost::filesystem::path workingDir;
            boost::filesystem::path logs;
            boost::filesystem::path signatures;
            boost::filesystem::path releaseImages;
            boost::filesystem::path holdRelease;
            boost::filesystem::path holdOperator;
            boost::filesystem::path clusterResources;
            boost::filesystem::path localStorageCache;
            boost::filesystem::path registryConfigFile;
            boost::filesystem::path registryLogFile;
            boost::filesystem::path cachedImagesReport;
        };

        void readImageSetConfig();
        boost::filesystem::path getImageSetConfigSchemaFile() const;
        unsigned int getUnsignedSetting(const char* key, unsigned int defaultValue) const;
        std::string getLocalStorageURL() const;

        BuildTime buildTime;
        Global global;
        RunOptions runOptions;
        Directories directories;
        rapidjson::Document json{ rapidjson::kObjectType };
        rapidjson::Document imageSetConfig{ rapidjson::kObjectType };

        std::chrono::high_resolution_clock::time_point program_start; // for time measurement
};

}
}

#endif
