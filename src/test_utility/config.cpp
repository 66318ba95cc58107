/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "config.hpp"

#include <memory>

#include "libocmirror/Error.hpp"
#include "libocmirror/Utility.hpp"

namespace rj = rapidjson;
using namespace ocmirror;

namespace test_utility {
namespace config {

ConfigRAII::ConfigRAII(ConfigRAII&& rhs)
    : config{std::move(rhs.config)}
    , baseDir{std::move(rhs.baseDir)}
{
    rhs.config.reset();
    rhs.baseDir.clear();
}

ConfigRAII::~ConfigRAII() {
    if(!baseDir.empty()) {
        auto ec = boost::system::error_code{};
        boost::filesystem::remove_all(baseDir, ec);
    }
}

static boost::filesystem::path findExecutable(const std::string& name) {
    for(const auto* dir : {"/bin", "/usr/bin", "/usr/local/bin"}) {
        auto candidate = boost::filesystem::path{dir} / name;
        if(boost::filesystem::exists(candidate)) {
            return candidate;
        }
    }
    // fine for tests that never execute it
    return boost::filesystem::path{"/usr/bin"} / name;
}

static void populateJSON(rj::Document& document, const boost::filesystem::path& prefixDir) {
    auto& allocator = document.GetAllocator();

    document.AddMember( "prefixDir",
                        rj::Value{prefixDir.c_str(), allocator},
                        allocator);
    document.AddMember( "skopeoPath",
                        rj::Value{findExecutable("skopeo").c_str(), allocator},
                        allocator);
    document.AddMember( "registryPath",
                        rj::Value{findExecutable("registry").c_str(), allocator},
                        allocator);
    document.AddMember("registryReadinessTimeoutMs", 5000, allocator);
    document.AddMember("registryShutdownTimeoutMs", 2000, allocator);
    document.AddMember("cacheLockTimeoutMs", 1000, allocator);
    document.AddMember("batchConcurrency", 2, allocator);
    document.AddMember("copyRetryTimes", 0, allocator);
}

void writeImageSetConfig(common::Config& config, const std::string& json) {
    auto file = boost::filesystem::path{config.global.configPath};
    if(file.empty()) {
        OCMIRROR_THROW_ERROR("test configuration has no image set configuration path");
    }
    libocmirror::filesystem::writeTextFile(json, file);
}

ConfigRAII makeConfig() {
    auto raii = ConfigRAII{};
    raii.baseDir = libocmirror::filesystem::makeUniquePathWithRandomSuffix("/tmp/oc-mirror-test");
    raii.config = std::make_shared<common::Config>();

    auto prefixDir = raii.baseDir / "prefix";
    populateJSON(raii.config->json, prefixDir);

    // JSON schemas
    auto repoRootDir = boost::filesystem::path{__FILE__}.parent_path().parent_path().parent_path();
    libocmirror::filesystem::copyFile(repoRootDir / "etc/ocmirror.schema.json", prefixDir / "etc/ocmirror.schema.json");
    libocmirror::filesystem::copyFile(repoRootDir / "etc/imageset-config.schema.json", prefixDir / "etc/imageset-config.schema.json");

    // local storage cache below the test directory
    libocmirror::environment::setVariable(raii.config->buildTime.cacheEnvironmentVariable, (raii.baseDir / "cache-home").string());

    raii.config->global.configPath = (raii.baseDir / "imageset-config.json").string();
    writeImageSetConfig(*raii.config, R"(
    {
        "kind": "ImageSetConfiguration",
        "apiVersion": "mirror.openshift.io/v1alpha2",
        "mirror": {
            "platform": {
                "releases": [
                    { "image": "quay.io/openshift-release-dev/ocp-release:4.14.1-x86_64" }
                ]
            },
            "operators": [
                { "catalog": "registry.redhat.io/redhat/redhat-operator-index:v4.14" }
            ],
            "additionalImages": [
                { "name": "registry.redhat.io/ubi8/ubi:latest" }
            ]
        }
    })");

    raii.config->runOptions.localStorageFQDN = "localhost:5000";

    return raii;
}

}
}
