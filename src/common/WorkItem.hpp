/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_common_WorkItem_hpp
#define ocmirror_common_WorkItem_hpp

#include <ostream>
#include <string>
#include <vector>


namespace ocmirror {
namespace common {

enum class ContentType { Unknown, Release, Operator, Additional };

std::string toString(ContentType);

/**
 * One image to transfer. Source and destination are transport-qualified
 * locators (e.g. docker://localhost:5000/ubi8/ubi:latest), origin is the image
 * reference as written in the image set configuration.
 * Two items are the same transfer when source and destination match.
 */
struct WorkItem {
    std::string source;
    std::string destination;
    std::string origin;
    ContentType type = ContentType::Unknown;
};

bool operator==(const WorkItem&, const WorkItem&);
bool operator!=(const WorkItem&, const WorkItem&);

std::ostream& operator<<(std::ostream&, const WorkItem&);

}
}

#endif
