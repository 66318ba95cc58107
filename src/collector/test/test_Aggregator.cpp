/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <memory>
#include <vector>

#include "libocmirror/Error.hpp"
#include "common/WorkItem.hpp"
#include "collector/Aggregator.hpp"
#include "collector/ImageSetCollector.hpp"
#include "test_utility/config.hpp"
#include "test_utility/unittest_main_function.hpp"


namespace ocmirror {
namespace collector {
namespace test {

using common::WorkItem;

class FakeCollector : public CollectorInterface {
public:
    FakeCollector(std::vector<std::string> origins, bool fails = false)
        : origins(std::move(origins))
        , fails{fails}
    {}

    std::vector<WorkItem> collect(const common::Context&) override {
        ++calls;
        if(fails) {
            OCMIRROR_THROW_ERROR("collector failure");
        }
        auto items = std::vector<WorkItem>{};
        for(const auto& origin : origins) {
            items.push_back(WorkItem{"docker://" + origin, "docker://localhost:5000/" + origin, origin});
        }
        return items;
    }

    std::vector<std::string> origins;
    bool fails;
    int calls = 0;
};

static std::vector<std::string> getOrigins(const std::vector<WorkItem>& items) {
    auto origins = std::vector<std::string>{};
    for(const auto& item : items) {
        origins.push_back(item.origin);
    }
    return origins;
}

TEST_GROUP(AggregatorTestGroup) {
};

TEST(AggregatorTestGroup, mergeImages) {
    auto current = std::vector<WorkItem>{ {"a", "b", "a"} };
    auto batch = std::vector<WorkItem>{ {"c", "d", "c"}, {"a", "b", "a"} };

    auto merged = mergeImages(current, batch);
    CHECK(merged.size() == 3);
    CHECK(merged[0] == current[0]);
    CHECK(merged[1] == batch[0]);
    CHECK(merged[2] == batch[1]);
    // inputs are untouched
    CHECK(current.size() == 1);

    CHECK(mergeImages({}, {}).empty());
    CHECK(mergeImages(current, {}).size() == 1);
}

TEST(AggregatorTestGroup, collection_order_and_content_type) {
    auto release = std::make_shared<FakeCollector>(std::vector<std::string>{"r1", "r2"});
    auto operators = std::make_shared<FakeCollector>(std::vector<std::string>{"o1"});
    auto additional = std::make_shared<FakeCollector>(std::vector<std::string>{"a1", "a2"});

    auto items = Aggregator{release, operators, additional}.collectAll(common::Context{});

    CHECK((getOrigins(items) == std::vector<std::string>{"r1", "r2", "o1", "a1", "a2"}));
    CHECK(items[0].type == common::ContentType::Release);
    CHECK(items[1].type == common::ContentType::Release);
    CHECK(items[2].type == common::ContentType::Operator);
    CHECK(items[3].type == common::ContentType::Additional);
    CHECK(items[4].type == common::ContentType::Additional);
}

TEST(AggregatorTestGroup, empty_collectors) {
    auto empty = std::make_shared<FakeCollector>(std::vector<std::string>{});
    auto items = Aggregator{empty, empty, empty}.collectAll(common::Context{});
    CHECK(items.empty());
    CHECK_EQUAL(3, empty->calls);
}

TEST(AggregatorTestGroup, failing_collector_stops_collection) {
    auto release = std::make_shared<FakeCollector>(std::vector<std::string>{"r1"});
    auto operators = std::make_shared<FakeCollector>(std::vector<std::string>{"o1"}, true);
    auto additional = std::make_shared<FakeCollector>(std::vector<std::string>{"a1"});

    try {
        Aggregator{release, operators, additional}.collectAll(common::Context{});
        FAIL("expected collection failure");
    }
    catch(const libocmirror::Error& e) {
        CHECK_EQUAL(std::string{"collector failure"}, std::string{e.what()});
        const auto& trace = e.getErrorTrace();
        CHECK(trace.back().errorMessage.find("operator") != std::string::npos);
        CHECK(trace.back().errorMessage.find("1 images collected so far") != std::string::npos);
    }
    CHECK_EQUAL(1, release->calls);
    CHECK_EQUAL(1, operators->calls);
    CHECK_EQUAL(0, additional->calls);
}

TEST(AggregatorTestGroup, missing_collector) {
    auto collector = std::make_shared<FakeCollector>(std::vector<std::string>{});
    CHECK_THROWS(libocmirror::Error, Aggregator(collector, nullptr, collector));
}

TEST_GROUP(ImageSetCollectorTestGroup) {
};

static const char* imageSetConfig = R"(
{
    "kind": "ImageSetConfiguration",
    "mirror": {
        "platform": {
            "releases": [
                {
                    "image": "quay.io/openshift-release-dev/ocp-release:4.14.1-x86_64",
                    "images": ["quay.io/openshift-release-dev/ocp-v4.0-art-dev@sha256:0123456789abcdef0123456789abcdef0123456789abcdef0123456789abcdef"]
                }
            ]
        },
        "operators": [
            {
                "catalog": "registry.redhat.io/redhat/redhat-operator-index:v4.14",
                "bundles": ["registry.redhat.io/rhel8/aws-load-balancer-operator-bundle:v1.1.0"]
            }
        ],
        "additionalImages": [
            { "name": "registry.redhat.io/ubi8/ubi:latest" },
            { "name": "docker://quay.io/fedora/fedora:39" }
        ]
    }
})";

TEST(ImageSetCollectorTestGroup, mirror_to_disk_mapping) {
    auto configRAII = test_utility::config::makeConfig();
    auto& config = *configRAII.config;
    config.runOptions.mode = common::WorkflowMode::MirrorToDisk;
    test_utility::config::writeImageSetConfig(config, imageSetConfig);
    config.readImageSetConfig();

    auto releases = ReleaseCollector{configRAII.config}.collect(common::Context{});
    CHECK(releases.size() == 2);
    CHECK_EQUAL(std::string{"docker://quay.io/openshift-release-dev/ocp-release:4.14.1-x86_64"}, releases[0].source);
    CHECK_EQUAL(std::string{"docker://localhost:5000/openshift-release-dev/ocp-release:4.14.1-x86_64"}, releases[0].destination);
    CHECK_EQUAL(std::string{"quay.io/openshift-release-dev/ocp-release:4.14.1-x86_64"}, releases[0].origin);
    CHECK_EQUAL(std::string{"docker://localhost:5000/openshift-release-dev/ocp-v4.0-art-dev@sha256:0123456789abcdef0123456789abcdef0123456789abcdef0123456789abcdef"}, releases[1].destination);

    auto operators = OperatorCollector{configRAII.config}.collect(common::Context{});
    CHECK(operators.size() == 2);
    CHECK_EQUAL(std::string{"docker://localhost:5000/redhat/redhat-operator-index:v4.14"}, operators[0].destination);
    CHECK_EQUAL(std::string{"docker://localhost:5000/rhel8/aws-load-balancer-operator-bundle:v1.1.0"}, operators[1].destination);

    auto additional = AdditionalImagesCollector{configRAII.config}.collect(common::Context{});
    CHECK(additional.size() == 2);
    CHECK_EQUAL(std::string{"docker://registry.redhat.io/ubi8/ubi:latest"}, additional[0].source);
    CHECK_EQUAL(std::string{"docker://localhost:5000/ubi8/ubi:latest"}, additional[0].destination);
    CHECK_EQUAL(std::string{"docker://quay.io/fedora/fedora:39"}, additional[1].source);
    CHECK_EQUAL(std::string{"docker://quay.io/fedora/fedora:39"}, additional[1].origin);
}

TEST(ImageSetCollectorTestGroup, disk_to_mirror_mapping) {
    auto configRAII = test_utility::config::makeConfig();
    auto& config = *configRAII.config;
    config.runOptions.mode = common::WorkflowMode::DiskToMirror;
    config.runOptions.destination = "docker://mirror.example.com:8443/ocp/";
    test_utility::config::writeImageSetConfig(config, imageSetConfig);
    config.readImageSetConfig();

    auto additional = AdditionalImagesCollector{configRAII.config}.collect(common::Context{});
    CHECK(additional.size() == 2);
    CHECK_EQUAL(std::string{"docker://localhost:5000/ubi8/ubi:latest"}, additional[0].source);
    CHECK_EQUAL(std::string{"docker://mirror.example.com:8443/ocp/ubi8/ubi:latest"}, additional[0].destination);
    CHECK_EQUAL(std::string{"registry.redhat.io/ubi8/ubi:latest"}, additional[0].origin);
}

TEST(ImageSetCollectorTestGroup, prepare_uses_mirror_to_disk_mapping) {
    auto configRAII = test_utility::config::makeConfig();
    auto& config = *configRAII.config;
    config.runOptions.mode = common::WorkflowMode::Prepare;
    config.readImageSetConfig();

    auto additional = AdditionalImagesCollector{configRAII.config}.collect(common::Context{});
    CHECK(additional.size() == 1);
    CHECK_EQUAL(std::string{"docker://localhost:5000/ubi8/ubi:latest"}, additional[0].destination);
}

TEST(ImageSetCollectorTestGroup, missing_sections) {
    auto configRAII = test_utility::config::makeConfig();
    auto& config = *configRAII.config;
    test_utility::config::writeImageSetConfig(config, R"({"kind": "ImageSetConfiguration", "mirror": {}})");
    config.readImageSetConfig();

    CHECK(ReleaseCollector{configRAII.config}.collect(common::Context{}).empty());
    CHECK(OperatorCollector{configRAII.config}.collect(common::Context{}).empty());
    CHECK(AdditionalImagesCollector{configRAII.config}.collect(common::Context{}).empty());
}

TEST(ImageSetCollectorTestGroup, configuration_not_read) {
    auto configRAII = test_utility::config::makeConfig();
    CHECK_THROWS(libocmirror::Error, ReleaseCollector{configRAII.config}.collect(common::Context{}));
}

TEST(ImageSetCollectorTestGroup, cancelled_context) {
    auto configRAII = test_utility::config::makeConfig();
    configRAII.config->readImageSetConfig();
    auto context = common::Context{};
    context.cancel();
    CHECK_THROWS(libocmirror::Error, OperatorCollector{configRAII.config}.collect(context));
}

}
}
}

OCMIRROR_UNITTEST_MAIN_FUNCTION();
