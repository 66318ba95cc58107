/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "ImageSetCollector.hpp"

#include "libocmirror/Error.hpp"
#include "libocmirror/Logger.hpp"
#include "common/ImageReference.hpp"


namespace rj = rapidjson;

namespace ocmirror {
namespace collector {

ImageSetCollector::ImageSetCollector(std::shared_ptr<const common::Config> config, const std::string& sysname)
    : config{std::move(config)}
    , sysname{sysname}
{}

common::WorkItem ImageSetCollector::makeWorkItem(const std::string& reference) const {
    auto image = common::ImageReference::parse(reference);
    auto localStorage = config->getLocalStorageURL() + "/" + image.getPathWithTagOrDigest();

    auto item = common::WorkItem{};
    item.origin = reference;
    if(config->runOptions.mode == common::WorkflowMode::DiskToMirror) {
        auto destination = config->runOptions.destination;
        while(!destination.empty() && destination.back() == '/') {
            destination.pop_back();
        }
        item.source = localStorage;
        item.destination = destination + "/" + image.getPathWithTagOrDigest();
    }
    else {
        item.source = common::dockerProtocol + image.string();
        item.destination = localStorage;
    }

    printLog(boost::format("collected %s") % item, libocmirror::LogLevel::DEBUG);
    return item;
}

const rj::Value* ImageSetCollector::findMirrorSection(const char* name) const {
    const auto& imageSetConfig = config->imageSetConfig;
    if(!imageSetConfig.IsObject() || !imageSetConfig.HasMember("mirror")) {
        OCMIRROR_THROW_ERROR("image set configuration has no mirror section, was it read?");
    }
    const auto& mirror = imageSetConfig["mirror"];
    auto section = mirror.FindMember(name);
    if(section == mirror.MemberEnd()) {
        return nullptr;
    }
    return &section->value;
}

void ImageSetCollector::printLog(const boost::format& message, libocmirror::LogLevel level) const {
    libocmirror::Logger::getInstance().log(message, sysname, level);
}

ReleaseCollector::ReleaseCollector(std::shared_ptr<const common::Config> config)
    : ImageSetCollector{std::move(config), "ReleaseCollector"}
{}

std::vector<common::WorkItem> ReleaseCollector::collect(const common::Context& context) {
    context.throwIfCancelled("release collection");

    auto items = std::vector<common::WorkItem>{};
    const auto* platform = findMirrorSection("platform");
    if(!platform || !platform->HasMember("releases")) {
        return items;
    }

    for(const auto& release : (*platform)["releases"].GetArray()) {
        items.push_back(makeWorkItem(release["image"].GetString()));
        if(release.HasMember("images")) {
            for(const auto& component : release["images"].GetArray()) {
                items.push_back(makeWorkItem(component.GetString()));
            }
        }
    }
    return items;
}

OperatorCollector::OperatorCollector(std::shared_ptr<const common::Config> config)
    : ImageSetCollector{std::move(config), "OperatorCollector"}
{}

std::vector<common::WorkItem> OperatorCollector::collect(const common::Context& context) {
    context.throwIfCancelled("operator collection");

    auto items = std::vector<common::WorkItem>{};
    const auto* operators = findMirrorSection("operators");
    if(!operators) {
        return items;
    }

    for(const auto& entry : operators->GetArray()) {
        items.push_back(makeWorkItem(entry["catalog"].GetString()));
        if(entry.HasMember("bundles")) {
            for(const auto& bundle : entry["bundles"].GetArray()) {
                items.push_back(makeWorkItem(bundle.GetString()));
            }
        }
    }
    return items;
}

AdditionalImagesCollector::AdditionalImagesCollector(std::shared_ptr<const common::Config> config)
    : ImageSetCollector{std::move(config), "AdditionalImagesCollector"}
{}

std::vector<common::WorkItem> AdditionalImagesCollector::collect(const common::Context& context) {
    context.throwIfCancelled("additional images collection");

    auto items = std::vector<common::WorkItem>{};
    const auto* additionalImages = findMirrorSection("additionalImages");
    if(!additionalImages) {
        return items;
    }

    for(const auto& image : additionalImages->GetArray()) {
        items.push_back(makeWorkItem(image["name"].GetString()));
    }
    return items;
}

}
}
