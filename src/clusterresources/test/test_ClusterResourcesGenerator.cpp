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
#include <yaml-cpp/yaml.h>

#include "libocmirror/Error.hpp"
#include "libocmirror/Utility.hpp"
#include "clusterresources/ClusterResourcesGenerator.hpp"
#include "test_utility/config.hpp"
#include "test_utility/unittest_main_function.hpp"


namespace ocmirror {
namespace clusterresources {
namespace test {

using common::WorkItem;

static const auto items = std::vector<WorkItem>{
    {"docker://localhost:5000/openshift-release-dev/ocp-release:4.14.1-x86_64",
     "docker://mirror.example.com/ocp/openshift-release-dev/ocp-release:4.14.1-x86_64",
     "quay.io/openshift-release-dev/ocp-release:4.14.1-x86_64",
     common::ContentType::Release},
    {"docker://localhost:5000/openshift-release-dev/ocp-v4.0-art-dev@sha256:0123456789abcdef0123456789abcdef0123456789abcdef0123456789abcdef",
     "docker://mirror.example.com/ocp/openshift-release-dev/ocp-v4.0-art-dev@sha256:0123456789abcdef0123456789abcdef0123456789abcdef0123456789abcdef",
     "quay.io/openshift-release-dev/ocp-v4.0-art-dev@sha256:0123456789abcdef0123456789abcdef0123456789abcdef0123456789abcdef",
     common::ContentType::Release},
    {"docker://localhost:5000/openshift-release-dev/ocp-v4.0-art-dev@sha256:456789abcdef0123456789abcdef0123456789abcdef0123456789abcdef0123",
     "docker://mirror.example.com/ocp/openshift-release-dev/ocp-v4.0-art-dev@sha256:456789abcdef0123456789abcdef0123456789abcdef0123456789abcdef0123",
     "quay.io/openshift-release-dev/ocp-v4.0-art-dev@sha256:456789abcdef0123456789abcdef0123456789abcdef0123456789abcdef0123",
     common::ContentType::Release},
    {"docker://localhost:5000/ubi8/ubi:latest",
     "docker://mirror.example.com/ocp/ubi8/ubi:latest",
     "registry.redhat.io/ubi8/ubi:latest",
     common::ContentType::Additional}
};

TEST_GROUP(ClusterResourcesTestGroup) {
};

static YAML::Node loadMirrorSet(const boost::optional<std::string>& yaml,
                                const std::string& kind,
                                const std::string& name) {
    CHECK(yaml);
    CHECK(yaml->compare(0, 4, "---\n") == 0);
    auto document = YAML::Load(*yaml);
    CHECK_EQUAL(std::string{"config.openshift.io/v1"}, document["apiVersion"].as<std::string>());
    CHECK_EQUAL(kind, document["kind"].as<std::string>());
    CHECK_EQUAL(name, document["metadata"]["name"].as<std::string>());
    return document["spec"];
}

TEST(ClusterResourcesTestGroup, digest_mirror_set) {
    auto spec = loadMirrorSet(ClusterResourcesGenerator::generateDigestMirrorSet(items),
                              "ImageDigestMirrorSet", "idms-oc-mirror");
    auto mirrors = spec["imageDigestMirrors"];
    CHECK(mirrors.IsSequence());
    CHECK_EQUAL(1, mirrors.size());
    CHECK_EQUAL(std::string{"quay.io/openshift-release-dev/ocp-v4.0-art-dev"}, mirrors[0]["source"].as<std::string>());
    CHECK_EQUAL(1, mirrors[0]["mirrors"].size());
    CHECK_EQUAL(std::string{"mirror.example.com/ocp/openshift-release-dev/ocp-v4.0-art-dev"},
                mirrors[0]["mirrors"][0].as<std::string>());
}

TEST(ClusterResourcesTestGroup, tag_mirror_set) {
    auto spec = loadMirrorSet(ClusterResourcesGenerator::generateTagMirrorSet(items),
                              "ImageTagMirrorSet", "itms-oc-mirror");
    auto mirrors = spec["imageTagMirrors"];
    CHECK_EQUAL(2, mirrors.size());
    CHECK_EQUAL(std::string{"quay.io/openshift-release-dev/ocp-release"}, mirrors[0]["source"].as<std::string>());
    CHECK_EQUAL(std::string{"mirror.example.com/ocp/openshift-release-dev/ocp-release"},
                mirrors[0]["mirrors"][0].as<std::string>());
    CHECK_EQUAL(std::string{"registry.redhat.io/ubi8/ubi"}, mirrors[1]["source"].as<std::string>());
    CHECK_EQUAL(std::string{"mirror.example.com/ocp/ubi8/ubi"}, mirrors[1]["mirrors"][0].as<std::string>());
}

TEST(ClusterResourcesTestGroup, one_source_several_mirrors) {
    auto twoMirrors = std::vector<WorkItem>{
        items[3],
        {"docker://localhost:5000/ubi8/ubi:9",
         "docker://[fd00::1]:8443/ubi8/ubi:9",
         "registry.redhat.io/ubi8/ubi:9",
         common::ContentType::Additional},
        {"docker://localhost:5000/ubi8/ubi:8",
         "docker://mirror.example.com/ocp/ubi8/ubi:8",
         "registry.redhat.io/ubi8/ubi:8",
         common::ContentType::Additional}
    };
    auto spec = loadMirrorSet(ClusterResourcesGenerator::generateTagMirrorSet(twoMirrors),
                              "ImageTagMirrorSet", "itms-oc-mirror");
    auto mirrors = spec["imageTagMirrors"];
    CHECK_EQUAL(1, mirrors.size());
    CHECK_EQUAL(2, mirrors[0]["mirrors"].size());
    CHECK_EQUAL(std::string{"mirror.example.com/ocp/ubi8/ubi"}, mirrors[0]["mirrors"][0].as<std::string>());
    // scalars with YAML indicators survive the round trip
    CHECK_EQUAL(std::string{"[fd00::1]:8443/ubi8/ubi"}, mirrors[0]["mirrors"][1].as<std::string>());
}

TEST(ClusterResourcesTestGroup, empty_mirror_sets) {
    CHECK(!ClusterResourcesGenerator::generateDigestMirrorSet({}));
    CHECK(!ClusterResourcesGenerator::generateTagMirrorSet({}));
    auto tagsOnly = std::vector<WorkItem>{items[0]};
    CHECK(!ClusterResourcesGenerator::generateDigestMirrorSet(tagsOnly));
}

TEST(ClusterResourcesTestGroup, generate_files) {
    auto configRAII = test_utility::config::makeConfig();
    auto& config = *configRAII.config;
    config.directories.initialize(configRAII.baseDir / "from", "working-dir", common::WorkflowMode::DiskToMirror, config.buildTime);
    const auto& dir = config.directories.clusterResources;

    ClusterResourcesGenerator{configRAII.config}.generate(common::Context{}, items);
    CHECK_EQUAL(*ClusterResourcesGenerator::generateDigestMirrorSet(items),
                libocmirror::filesystem::readFile(dir / "idms-oc-mirror.yaml"));
    CHECK_EQUAL(*ClusterResourcesGenerator::generateTagMirrorSet(items),
                libocmirror::filesystem::readFile(dir / "itms-oc-mirror.yaml"));

    // only tags
    boost::filesystem::remove_all(dir);
    ClusterResourcesGenerator{configRAII.config}.generate(common::Context{}, {items[3]});
    CHECK(!boost::filesystem::exists(dir / "idms-oc-mirror.yaml"));
    CHECK(boost::filesystem::exists(dir / "itms-oc-mirror.yaml"));

    auto context = common::Context{};
    context.cancel();
    CHECK_THROWS(libocmirror::Error, ClusterResourcesGenerator{configRAII.config}.generate(context, items));
}

}
}
}

OCMIRROR_UNITTEST_MAIN_FUNCTION();
