/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Aggregator.hpp"

#include <boost/format.hpp>

#include "libocmirror/Error.hpp"
#include "libocmirror/Logger.hpp"


namespace ocmirror {
namespace collector {

std::vector<common::WorkItem> mergeImages(std::vector<common::WorkItem> current,
                                          const std::vector<common::WorkItem>& batch) {
    current.insert(current.end(), batch.cbegin(), batch.cend());
    return current;
}

Aggregator::Aggregator(std::shared_ptr<CollectorInterface> releaseCollector,
                       std::shared_ptr<CollectorInterface> operatorCollector,
                       std::shared_ptr<CollectorInterface> additionalCollector)
    : releaseCollector{std::move(releaseCollector)}
    , operatorCollector{std::move(operatorCollector)}
    , additionalCollector{std::move(additionalCollector)}
{
    if(!this->releaseCollector || !this->operatorCollector || !this->additionalCollector) {
        OCMIRROR_THROW_ERROR("Failed to create image collection aggregator: missing collector");
    }
}

std::vector<common::WorkItem> Aggregator::collectAll(const common::Context& context) const {
    struct Step {
        CollectorInterface* collector;
        common::ContentType type;
    };
    const Step steps[] = {
        {releaseCollector.get(), common::ContentType::Release},
        {operatorCollector.get(), common::ContentType::Operator},
        {additionalCollector.get(), common::ContentType::Additional}
    };

    auto allImages = std::vector<common::WorkItem>{};
    for(const auto& step : steps) {
        auto batch = std::vector<common::WorkItem>{};
        try {
            batch = step.collector->collect(context);
        }
        catch(const std::exception& e) {
            auto message = boost::format("Failed to collect %s images (%d images collected so far)")
                % common::toString(step.type) % allImages.size();
            OCMIRROR_RETHROW_ERROR(e, message.str());
        }

        for(auto& item : batch) {
            item.type = step.type;
        }
        auto message = boost::format("total %s images to copy %d") % common::toString(step.type) % batch.size();
        libocmirror::Logger::getInstance().log(message, "Aggregator", libocmirror::LogLevel::INFO);

        allImages = mergeImages(std::move(allImages), batch);
    }
    return allImages;
}

}
}
