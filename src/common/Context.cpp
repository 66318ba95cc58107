/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Context.hpp"

#include <csignal>
#include <cstring>
#include <cerrno>

#include <boost/format.hpp>

#include "libocmirror/Error.hpp"


namespace ocmirror {
namespace common {

static std::atomic<bool> interrupted{false};

extern "C" void handleInterrupt(int) {
    interrupted = true;
}

Context::Context()
    : cancelled{std::make_shared<std::atomic<bool>>(false)}
{}

void Context::cancel() {
    *cancelled = true;
}

bool Context::isCancelled() const {
    return *cancelled || interrupted;
}

void Context::throwIfCancelled(const std::string& operation) const {
    if(isCancelled()) {
        auto message = boost::format("%s was cancelled") % operation;
        OCMIRROR_THROW_ERROR(message.str());
    }
}

void Context::installInterruptHandlers() {
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = handleInterrupt;
    action.sa_flags = SA_RESTART;
    sigemptyset(&action.sa_mask);

    for(auto signal : {SIGINT, SIGTERM}) {
        if(sigaction(signal, &action, nullptr) != 0) {
            auto message = boost::format("Failed to install handler for signal %d: %s") % signal % strerror(errno);
            OCMIRROR_THROW_ERROR(message.str());
        }
    }
}

}
}
