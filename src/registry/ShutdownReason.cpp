/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "ShutdownReason.hpp"


namespace ocmirror {
namespace registry {

ShutdownReason ShutdownReason::requested() {
    return ShutdownReason{Kind::Requested, ""};
}

ShutdownReason ShutdownReason::fault(const std::string& details) {
    return ShutdownReason{Kind::Fault, details};
}

bool ShutdownReason::isRequested() const {
    return kind == Kind::Requested;
}

bool operator==(const ShutdownReason& lhs, const ShutdownReason& rhs) {
    return lhs.kind == rhs.kind && lhs.details == rhs.details;
}

bool operator!=(const ShutdownReason& lhs, const ShutdownReason& rhs) {
    return !(lhs == rhs);
}

std::ostream& operator<<(std::ostream& os, const ShutdownReason& reason) {
    if(reason.isRequested()) {
        os << "shutdown requested";
    }
    else {
        os << "fault: " << reason.details;
    }
    return os;
}

}
}
