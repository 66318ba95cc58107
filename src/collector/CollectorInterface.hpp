/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_collector_CollectorInterface_hpp
#define ocmirror_collector_CollectorInterface_hpp

#include <vector>

#include "common/Context.hpp"
#include "common/WorkItem.hpp"


namespace ocmirror {
namespace collector {

class CollectorInterface {
public:
    virtual ~CollectorInterface() = default;
    // Returns a fresh list on every call
    virtual std::vector<common::WorkItem> collect(const common::Context& context) = 0;
};

}
}

#endif
