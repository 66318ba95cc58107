/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_collector_Aggregator_hpp
#define ocmirror_collector_Aggregator_hpp

#include <memory>
#include <vector>

#include "common/Context.hpp"
#include "common/WorkItem.hpp"
#include "collector/CollectorInterface.hpp"


namespace ocmirror {
namespace collector {

// Appends batch to current, preserving the order of both
std::vector<common::WorkItem> mergeImages(std::vector<common::WorkItem> current,
                                          const std::vector<common::WorkItem>& batch);

/**
 * Runs the release, operator and additional images collectors, in this
 * order, and merges their results into one work list. A failing collector
 * stops the collection.
 */
class Aggregator {
public:
    Aggregator(std::shared_ptr<CollectorInterface> releaseCollector,
               std::shared_ptr<CollectorInterface> operatorCollector,
               std::shared_ptr<CollectorInterface> additionalCollector);

    std::vector<common::WorkItem> collectAll(const common::Context& context) const;

private:
    std::shared_ptr<CollectorInterface> releaseCollector;
    std::shared_ptr<CollectorInterface> operatorCollector;
    std::shared_ptr<CollectorInterface> additionalCollector;
};

}
}

#endif
