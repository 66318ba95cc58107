/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "common/ImageReference.hpp"
#include "common/WorkItem.hpp"
#include "common/WorkflowMode.hpp"
#include "test_utility/unittest_main_function.hpp"


namespace ocmirror {
namespace common {
namespace test {

TEST_GROUP(ImageReferenceTestGroup) {
};

TEST(ImageReferenceTestGroup, parse_tagged_reference) {
    auto reference = ImageReference::parse("quay.io/openshift-release-dev/ocp-release:4.14.1-x86_64");
    CHECK_EQUAL(reference.domain, std::string{"quay.io"});
    CHECK_EQUAL(reference.path, std::string{"openshift-release-dev/ocp-release"});
    CHECK_EQUAL(reference.tag, std::string{"4.14.1-x86_64"});
    CHECK(reference.digest.empty());
    CHECK(!reference.isPinnedByDigest());
    CHECK_EQUAL(reference.getPathWithTagOrDigest(), std::string{"openshift-release-dev/ocp-release:4.14.1-x86_64"});
}

TEST(ImageReferenceTestGroup, parse_digest_reference) {
    auto digest = std::string{"sha256:1111111111111111111111111111111111111111111111111111111111111111"};
    auto reference = ImageReference::parse("docker://registry.redhat.io/ubi8/ubi@" + digest);
    CHECK_EQUAL(reference.domain, std::string{"registry.redhat.io"});
    CHECK_EQUAL(reference.path, std::string{"ubi8/ubi"});
    CHECK(reference.tag.empty());
    CHECK_EQUAL(reference.digest, digest);
    CHECK(reference.isPinnedByDigest());
    CHECK_EQUAL(reference.getRepository(), std::string{"registry.redhat.io/ubi8/ubi"});
    CHECK_EQUAL(reference.getPathWithTagOrDigest(), "ubi8/ubi@" + digest);
}

TEST(ImageReferenceTestGroup, parse_reference_with_port) {
    auto reference = ImageReference::parse("localhost:5000/ubi8/ubi");
    CHECK_EQUAL(reference.domain, std::string{"localhost:5000"});
    CHECK_EQUAL(reference.path, std::string{"ubi8/ubi"});
    CHECK(reference.tag.empty());
    CHECK_EQUAL(reference.string(), std::string{"localhost:5000/ubi8/ubi"});
}

TEST(ImageReferenceTestGroup, parse_reference_without_domain) {
    auto reference = ImageReference::parse("library/alpine:3.18");
    CHECK(reference.domain.empty());
    CHECK_EQUAL(reference.path, std::string{"library/alpine"});
    CHECK_EQUAL(reference.tag, std::string{"3.18"});
    CHECK_EQUAL(reference.string(), std::string{"library/alpine:3.18"});

    CHECK_THROWS(libocmirror::Error, ImageReference::parse(""));
    CHECK_THROWS(libocmirror::Error, ImageReference::parse("docker://"));
}

TEST(ImageReferenceTestGroup, parse_rejects_invalid_references) {
    CHECK_THROWS(libocmirror::Error, ImageReference::parse("quay.io/a/b:1;touch /tmp/pwned"));
    CHECK_THROWS(libocmirror::Error, ImageReference::parse("docker://quay.io/a/b:1 --debug"));
    CHECK_THROWS(libocmirror::Error, ImageReference::parse("quay.io/a/$(id)"));
    CHECK_THROWS(libocmirror::Error, ImageReference::parse("quay.io/Upper/case:1"));
    CHECK_THROWS(libocmirror::Error, ImageReference::parse("quay.io/../etc:1"));
    CHECK_THROWS(libocmirror::Error, ImageReference::parse("quay.io/ubi8/ubi@sha256:0123"));
    CHECK_THROWS(libocmirror::Error, ImageReference::parse("quay.io/ubi8/ubi:"));

    // a dotted first component is a domain only if it is a valid host
    auto reference = ImageReference::parse("my_ns.v2/app:1");
    CHECK(reference.domain.empty());
    CHECK_EQUAL(reference.path, std::string{"my_ns.v2/app"});
}

TEST_GROUP(WorkflowModeTestGroup) {
};

TEST(WorkflowModeTestGroup, resolveWorkflowMode) {
    CHECK(resolveWorkflowMode("file:///tmp/mirror") == WorkflowMode::MirrorToDisk);
    CHECK(resolveWorkflowMode("docker://registry.example.com:5000/mirror") == WorkflowMode::DiskToMirror);
    CHECK_THROWS(libocmirror::Error, resolveWorkflowMode("oci:///tmp/mirror"));
    CHECK_THROWS(libocmirror::Error, resolveWorkflowMode("/tmp/mirror"));
    CHECK_EQUAL(toString(WorkflowMode::Prepare), std::string{"prepare"});
}

TEST_GROUP(WorkItemTestGroup) {
};

TEST(WorkItemTestGroup, identity) {
    auto item = WorkItem{"docker://a", "docker://b", "a", ContentType::Release};
    auto sameTransfer = WorkItem{"docker://a", "docker://b", "other-origin", ContentType::Additional};
    auto otherDestination = WorkItem{"docker://a", "docker://c", "a", ContentType::Release};

    CHECK(item == sameTransfer);
    CHECK(item != otherDestination);
    CHECK_EQUAL(toString(ContentType::Operator), std::string{"operator"});
}

}}}

OCMIRROR_UNITTEST_MAIN_FUNCTION();
