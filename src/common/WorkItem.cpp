/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "WorkItem.hpp"

#include "libocmirror/Error.hpp"


namespace ocmirror {
namespace common {

std::string toString(ContentType type) {
    switch(type) {
        case ContentType::Unknown:    return "unknown";
        case ContentType::Release:    return "release";
        case ContentType::Operator:   return "operator";
        case ContentType::Additional: return "additional";
    }
    OCMIRROR_THROW_ERROR("failed to convert unknown content type to string");
}

bool operator==(const WorkItem& lhs, const WorkItem& rhs) {
    return lhs.source == rhs.source
        && lhs.destination == rhs.destination;
}

bool operator!=(const WorkItem& lhs, const WorkItem& rhs) {
    return !(lhs == rhs);
}

std::ostream& operator<<(std::ostream& os, const WorkItem& item) {
    os << item.source << " -> " << item.destination;
    return os;
}

}
}
