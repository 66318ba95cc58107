/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Batch.hpp"

#include <algorithm>
#include <future>
#include <sstream>

#include "libocmirror/Error.hpp"
#include "libocmirror/Logger.hpp"


namespace ocmirror {
namespace mirror {

Batch::Batch(std::shared_ptr<const common::Config> config, std::shared_ptr<MirrorInterface> mirror)
    : config{std::move(config)}
    , mirror{std::move(mirror)}
{
    if(!this->mirror) {
        OCMIRROR_THROW_ERROR("Failed to create batch worker: missing mirror");
    }
    concurrency = this->config->getUnsignedSetting("batchConcurrency", 8);
    if(concurrency == 0) {
        concurrency = 1;
    }
}

void Batch::worker(const common::Context& context, const std::vector<common::WorkItem>& items) {
    printLog(boost::format("images to copy %d") % items.size(), libocmirror::LogLevel::INFO);

    auto failures = std::vector<std::pair<const common::WorkItem*, std::string>>{};
    std::size_t skipped = 0;

    for(std::size_t chunkBegin = 0; chunkBegin < items.size(); chunkBegin += concurrency) {
        auto chunkEnd = std::min(chunkBegin + concurrency, items.size());

        auto outcomes = std::vector<std::future<Outcome>>{};
        for(auto i = chunkBegin; i < chunkEnd; ++i) {
            const auto& item = items[i];
            outcomes.push_back(std::async(std::launch::async, [this, &context, &item]() {
                return transfer(context, item);
            }));
        }

        for(auto i = chunkBegin; i < chunkEnd; ++i) {
            auto outcome = outcomes[i - chunkBegin].get();
            if(outcome.failure) {
                failures.emplace_back(&items[i], *outcome.failure);
            }
            else if(outcome.skipped) {
                ++skipped;
            }
        }
    }

    auto succeeded = items.size() - failures.size();
    printLog(boost::format("%d / %d images mirrored successfully (%d already in cache)")
                % succeeded % items.size() % skipped,
             libocmirror::LogLevel::INFO);

    if(!failures.empty()) {
        auto message = std::stringstream{};
        message << "failed to mirror " << failures.size() << " of " << items.size() << " images:";
        for(const auto& failure : failures) {
            message << "\n  " << *failure.first << ": " << failure.second;
        }
        OCMIRROR_THROW_ERROR(message.str());
    }
}

Batch::Outcome Batch::transfer(const common::Context& context, const common::WorkItem& item) const {
    auto outcome = Outcome{};
    if(context.isCancelled()) {
        outcome.failure = std::string{"cancelled"};
        return outcome;
    }

    try {
        if(isSkippable(context, item)) {
            printLog(boost::format("skipping %s, already in local storage cache") % item.origin,
                     libocmirror::LogLevel::DEBUG);
            outcome.skipped = true;
            return outcome;
        }
        mirror->copy(context, item.source, item.destination);
        printLog(boost::format("copied %s %s") % common::toString(item.type) % item.origin,
                 libocmirror::LogLevel::INFO);
    }
    catch(const std::exception& e) {
        printLog(boost::format("failed to copy %s: %s") % item % e.what(), libocmirror::LogLevel::ERROR);
        outcome.failure = std::string{e.what()};
    }
    return outcome;
}

bool Batch::isSkippable(const common::Context& context, const common::WorkItem& item) const {
    if(config->runOptions.mode != common::WorkflowMode::MirrorToDisk || config->global.force) {
        return false;
    }
    try {
        return mirror->check(context, item.destination);
    }
    catch(const std::exception& e) {
        printLog(boost::format("failed to check %s in local storage cache, copying it: %s") % item.destination % e.what(),
                 libocmirror::LogLevel::WARN);
        return false;
    }
}

void Batch::printLog(const boost::format& message, libocmirror::LogLevel level) const {
    libocmirror::Logger::getInstance().log(message, sysname, level);
}

}
}
