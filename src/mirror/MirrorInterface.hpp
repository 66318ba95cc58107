/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_mirror_MirrorInterface_hpp
#define ocmirror_mirror_MirrorInterface_hpp

#include <string>

#include "common/Context.hpp"


namespace ocmirror {
namespace mirror {

/**
 * Copies single images between transport-qualified locators.
 * Implementations are called concurrently by the batch worker.
 */
class MirrorInterface {
public:
    virtual ~MirrorInterface() = default;
    virtual void copy(const common::Context& context, const std::string& source, const std::string& destination) = 0;
    // Whether the image exists. Errors other than "image not found" are thrown.
    virtual bool check(const common::Context& context, const std::string& reference) = 0;
};

}
}

#endif
