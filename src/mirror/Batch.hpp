/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_mirror_Batch_hpp
#define ocmirror_mirror_Batch_hpp

#include <memory>
#include <string>
#include <vector>

#include <boost/format.hpp>
#include <boost/optional.hpp>

#include "libocmirror/LogLevel.hpp"
#include "common/Config.hpp"
#include "common/Context.hpp"
#include "common/WorkItem.hpp"
#include "mirror/MirrorInterface.hpp"


namespace ocmirror {
namespace mirror {

class BatchInterface {
public:
    virtual ~BatchInterface() = default;
    // Returns once every item was attempted, throws if any of them failed
    virtual void worker(const common::Context& context, const std::vector<common::WorkItem>& items) = 0;
};

/**
 * Copies the work list in chunks of "batchConcurrency" items, the items of
 * a chunk are copied in parallel. When mirroring to disk without --force,
 * images already present in the local storage cache are skipped.
 */
class Batch : public BatchInterface {
public:
    Batch(std::shared_ptr<const common::Config> config, std::shared_ptr<MirrorInterface> mirror);

    void worker(const common::Context& context, const std::vector<common::WorkItem>& items) override;

private:
    struct Outcome {
        bool skipped = false;
        boost::optional<std::string> failure;
    };

    Outcome transfer(const common::Context& context, const common::WorkItem& item) const;
    bool isSkippable(const common::Context& context, const common::WorkItem& item) const;
    void printLog(const boost::format& message, libocmirror::LogLevel level) const;

private:
    const std::string sysname = "Batch";
    std::shared_ptr<const common::Config> config;
    std::shared_ptr<MirrorInterface> mirror;
    std::size_t concurrency;
};

}
}

#endif
