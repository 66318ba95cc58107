/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "WorkflowMode.hpp"

#include <boost/format.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include "libocmirror/Error.hpp"


namespace ocmirror {
namespace common {

const std::string dockerProtocol{"docker://"};
const std::string fileProtocol{"file://"};

WorkflowMode resolveWorkflowMode(const std::string& destination) {
    if(boost::starts_with(destination, fileProtocol)) {
        return WorkflowMode::MirrorToDisk;
    }
    else if(boost::starts_with(destination, dockerProtocol)) {
        return WorkflowMode::DiskToMirror;
    }
    auto message = boost::format("destination must have either %s (mirror to disk) or %s (diskToMirror) protocol prefixes")
        % fileProtocol % dockerProtocol;
    OCMIRROR_THROW_ERROR(message.str(), libocmirror::LogLevel::INFO);
}

std::string toString(WorkflowMode mode) {
    switch(mode) {
        case WorkflowMode::MirrorToDisk: return "mirrorToDisk";
        case WorkflowMode::DiskToMirror: return "diskToMirror";
        case WorkflowMode::Prepare:      return "prepare";
    }
    OCMIRROR_THROW_ERROR("failed to convert unknown workflow mode to string");
}

std::ostream& operator<<(std::ostream& os, WorkflowMode mode) {
    os << toString(mode);
    return os;
}

}
}
