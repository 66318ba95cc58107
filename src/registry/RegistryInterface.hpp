/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_registry_RegistryInterface_hpp
#define ocmirror_registry_RegistryInterface_hpp

#include <chrono>


namespace ocmirror {
namespace registry {

class RegistryInterface {
public:
    virtual ~RegistryInterface() = default;

    // Launches the registry, returns without waiting for it to serve
    virtual void start() = 0;
    virtual void waitUntilReady(std::chrono::milliseconds timeout) = 0;
    // Normal interrupt: stops the registry and waits for it to terminate
    virtual void shutdown() = 0;
    virtual bool isRunning() const = 0;
};

}
}

#endif
