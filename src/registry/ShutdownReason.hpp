/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_registry_ShutdownReason_hpp
#define ocmirror_registry_ShutdownReason_hpp

#include <ostream>
#include <string>


namespace ocmirror {
namespace registry {

// Why the local storage registry stopped serving
struct ShutdownReason {
    enum class Kind { Requested, Fault };

    static ShutdownReason requested();
    static ShutdownReason fault(const std::string& details);

    bool isRequested() const;

    Kind kind = Kind::Requested;
    std::string details;
};

bool operator==(const ShutdownReason&, const ShutdownReason&);
bool operator!=(const ShutdownReason&, const ShutdownReason&);
std::ostream& operator<<(std::ostream&, const ShutdownReason&);

}
}

#endif
