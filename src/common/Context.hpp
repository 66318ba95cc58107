/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_common_Context_hpp
#define ocmirror_common_Context_hpp

#include <atomic>
#include <memory>
#include <string>


namespace ocmirror {
namespace common {

/**
 * Cancellation scope threaded through collection, transfer and archiving.
 * Copies share the same cancellation state. A context is also cancelled
 * once the process received SIGINT or SIGTERM, provided that
 * installInterruptHandlers() was called.
 */
class Context {
public:
    Context();

    void cancel();
    bool isCancelled() const;
    void throwIfCancelled(const std::string& operation) const;

    static void installInterruptHandlers();

private:
    std::shared_ptr<std::atomic<bool>> cancelled;
};

}
}

#endif
