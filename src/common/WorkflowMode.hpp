/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_common_WorkflowMode_hpp
#define ocmirror_common_WorkflowMode_hpp

#include <ostream>
#include <string>


namespace ocmirror {
namespace common {

extern const std::string dockerProtocol;
extern const std::string fileProtocol;

enum class WorkflowMode { MirrorToDisk, DiskToMirror, Prepare };

// The mode of a mirror run follows from the protocol prefix of its destination
WorkflowMode resolveWorkflowMode(const std::string& destination);

std::string toString(WorkflowMode);
std::ostream& operator<<(std::ostream&, WorkflowMode);

}
}

#endif
