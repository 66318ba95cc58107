/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <boost/filesystem.hpp>

#include "common/Config.hpp"
#include "libocmirror/Utility.hpp"
#include "test_utility/config.hpp"
#include "test_utility/unittest_main_function.hpp"


namespace ocmirror {
namespace common {
namespace test {

TEST_GROUP(ConfigTestGroup) {
};

TEST(ConfigTestGroup, directories_layout) {
    auto configRAII = test_utility::config::makeConfig();
    auto& config = *configRAII.config;

    config.directories.initialize(configRAII.baseDir / "mirror", "my-working-dir", WorkflowMode::MirrorToDisk, config.buildTime);

    const auto& dirs = config.directories;
    CHECK(dirs.rootDir == configRAII.baseDir / "mirror");
    CHECK(dirs.workingDir == configRAII.baseDir / "mirror/my-working-dir");
    CHECK(dirs.logs == configRAII.baseDir / "mirror/logs");
    CHECK(dirs.signatures == dirs.workingDir / "signatures");
    CHECK(dirs.releaseImages == dirs.workingDir / "release-images");
    CHECK(dirs.holdRelease == dirs.workingDir / "hold-release");
    CHECK(dirs.holdOperator == dirs.workingDir / "hold-operator");
    CHECK(dirs.registryLogFile == dirs.logs / "registry.log");
    CHECK(dirs.cachedImagesReport == dirs.logs / "cached-images.txt");
    // nothing is created on disk
    CHECK(!boost::filesystem::exists(dirs.workingDir));
}

TEST(ConfigTestGroup, disk_to_mirror_logs_stay_off_the_archive_directory) {
    auto configRAII = test_utility::config::makeConfig();
    auto& config = *configRAII.config;

    config.directories.initialize(configRAII.baseDir / "from", "working-dir", WorkflowMode::DiskToMirror, config.buildTime);

    const auto& dirs = config.directories;
    CHECK(dirs.workingDir == configRAII.baseDir / "from/working-dir");
    CHECK(dirs.logs == configRAII.baseDir / "cache-home/.oc-mirror/logs");
    CHECK(dirs.registryConfigFile == dirs.logs / "registry-config.yml");
    CHECK(dirs.registryLogFile == dirs.logs / "registry.log");
}

TEST(ConfigTestGroup, local_storage_cache_location) {
    auto configRAII = test_utility::config::makeConfig();
    auto& config = *configRAII.config;
    auto cacheVariable = config.buildTime.cacheEnvironmentVariable;

    config.directories.initialize(configRAII.baseDir, "working-dir", WorkflowMode::Prepare, config.buildTime);
    CHECK(config.directories.localStorageCache == configRAII.baseDir / "cache-home/.oc-mirror/.cache");

    // fallback to HOME
    auto home = libocmirror::environment::findVariable("HOME");
    libocmirror::environment::unsetVariable(cacheVariable);
    libocmirror::environment::setVariable("HOME", (configRAII.baseDir / "home").string());
    config.directories.initialize(configRAII.baseDir, "working-dir", WorkflowMode::Prepare, config.buildTime);
    CHECK(config.directories.localStorageCache == configRAII.baseDir / "home/.oc-mirror/.cache");

    libocmirror::environment::unsetVariable("HOME");
    CHECK_THROWS(libocmirror::Error, config.directories.initialize(configRAII.baseDir, "working-dir", WorkflowMode::Prepare, config.buildTime));

    if(home) {
        libocmirror::environment::setVariable("HOME", *home);
    }
}

TEST(ConfigTestGroup, readImageSetConfig) {
    auto configRAII = test_utility::config::makeConfig();
    auto& config = *configRAII.config;

    config.readImageSetConfig();
    CHECK(config.imageSetConfig["mirror"]["additionalImages"].IsArray());

    test_utility::config::writeImageSetConfig(config, R"({"kind": "ImageSetConfiguration", "mirror": {"unknown": []}})");
    CHECK_THROWS(libocmirror::Error, config.readImageSetConfig());

    test_utility::config::writeImageSetConfig(config, R"({"kind": "Wrong", "mirror": {}})");
    CHECK_THROWS(libocmirror::Error, config.readImageSetConfig());

    config.global.configPath = (configRAII.baseDir / "missing.json").string();
    CHECK_THROWS(libocmirror::Error, config.readImageSetConfig());

    config.global.configPath.clear();
    CHECK_THROWS(libocmirror::Error, config.readImageSetConfig());
}

TEST(ConfigTestGroup, installation_settings) {
    auto configRAII = test_utility::config::makeConfig();
    auto& config = *configRAII.config;

    CHECK_EQUAL(config.getUnsignedSetting("batchConcurrency", 8), 2u);
    CHECK_EQUAL(config.getUnsignedSetting("settingThatIsNotThere", 42), 42u);
    CHECK_EQUAL(config.getLocalStorageURL(), std::string{"docker://localhost:5000"});
}

}}}

OCMIRROR_UNITTEST_MAIN_FUNCTION();
