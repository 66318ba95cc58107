/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "ClusterResourcesGenerator.hpp"

#include <algorithm>
#include <map>

#include <boost/format.hpp>
#include <yaml-cpp/yaml.h>

#include "libocmirror/Error.hpp"
#include "libocmirror/Logger.hpp"
#include "libocmirror/Utility.hpp"
#include "common/ImageReference.hpp"


namespace ocmirror {
namespace clusterresources {

static const std::string sysname = "ClusterResourcesGenerator";

// source repository -> mirror repositories, in order of appearance
using MirrorMap = std::map<std::string, std::vector<std::string>>;

static MirrorMap groupMirrors(const std::vector<common::WorkItem>& items, bool pinnedByDigest) {
    auto mirrors = MirrorMap{};
    for(const auto& item : items) {
        auto origin = common::ImageReference::parse(item.origin);
        if(origin.isPinnedByDigest() != pinnedByDigest) {
            continue;
        }
        auto mirror = common::ImageReference::parse(item.destination).getRepository();
        auto& entry = mirrors[origin.getRepository()];
        if(std::find(entry.cbegin(), entry.cend(), mirror) == entry.cend()) {
            entry.push_back(mirror);
        }
    }
    return mirrors;
}

static boost::optional<std::string> generateMirrorSet(const MirrorMap& mirrors,
                                                      const std::string& kind,
                                                      const std::string& name,
                                                      const std::string& listName) {
    if(mirrors.empty()) {
        return {};
    }

    YAML::Emitter yaml;
    yaml << YAML::BeginDoc << YAML::BeginMap;
    yaml << YAML::Key << "apiVersion" << YAML::Value << "config.openshift.io/v1";
    yaml << YAML::Key << "kind" << YAML::Value << kind;
    yaml << YAML::Key << "metadata" << YAML::Value
         << YAML::BeginMap << YAML::Key << "name" << YAML::Value << name << YAML::EndMap;
    yaml << YAML::Key << "spec" << YAML::Value << YAML::BeginMap;
    yaml << YAML::Key << listName << YAML::Value << YAML::BeginSeq;
    for(const auto& entry : mirrors) {
        yaml << YAML::BeginMap;
        yaml << YAML::Key << "mirrors" << YAML::Value << YAML::BeginSeq;
        for(const auto& mirror : entry.second) {
            yaml << mirror;
        }
        yaml << YAML::EndSeq;
        yaml << YAML::Key << "source" << YAML::Value << entry.first;
        yaml << YAML::EndMap;
    }
    yaml << YAML::EndSeq << YAML::EndMap << YAML::EndMap;

    if(!yaml.good()) {
        auto message = boost::format("Failed to emit %s: %s") % kind % yaml.GetLastError();
        OCMIRROR_THROW_ERROR(message.str());
    }
    return std::string{yaml.c_str()} + "\n";
}

ClusterResourcesGenerator::ClusterResourcesGenerator(std::shared_ptr<const common::Config> config)
    : config{std::move(config)}
{}

boost::optional<std::string> ClusterResourcesGenerator::generateDigestMirrorSet(const std::vector<common::WorkItem>& items) {
    return generateMirrorSet(groupMirrors(items, true), "ImageDigestMirrorSet", "idms-oc-mirror", "imageDigestMirrors");
}

boost::optional<std::string> ClusterResourcesGenerator::generateTagMirrorSet(const std::vector<common::WorkItem>& items) {
    return generateMirrorSet(groupMirrors(items, false), "ImageTagMirrorSet", "itms-oc-mirror", "imageTagMirrors");
}

void ClusterResourcesGenerator::generate(const common::Context& context, const std::vector<common::WorkItem>& items) {
    context.throwIfCancelled("cluster resources generation");

    const auto& outputDir = config->directories.clusterResources;
    auto write = [&outputDir](const boost::optional<std::string>& yaml, const std::string& filename) {
        if(!yaml) {
            return;
        }
        auto file = outputDir / filename;
        libocmirror::filesystem::writeTextFile(*yaml, file);
        libocmirror::Logger::getInstance().log(boost::format("%s file created") % file, sysname, libocmirror::LogLevel::INFO);
    };

    try {
        write(generateDigestMirrorSet(items), "idms-oc-mirror.yaml");
        write(generateTagMirrorSet(items), "itms-oc-mirror.yaml");
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to generate cluster resources in %s") % outputDir;
        OCMIRROR_RETHROW_ERROR(e, message.str());
    }
}

}
}
