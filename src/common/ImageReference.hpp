/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_common_ImageReference_hpp
#define ocmirror_common_ImageReference_hpp

#include <string>
#include <ostream>


namespace ocmirror {
namespace common {

/**
 * Components of an image reference such as
 * "quay.io/openshift-release-dev/ocp-release:4.14.1-x86_64" or
 * "registry.redhat.io/ubi8/ubi@sha256:...".
 *
 * parse() rejects anything that doesn't match common::regex::reference.
 * A leading docker:// transport is dropped.
 */
struct ImageReference {
    std::string domain;
    std::string path;
    std::string tag;
    std::string digest;

    static ImageReference parse(const std::string& reference);

    std::string getRepository() const;
    std::string getPathWithTagOrDigest() const;
    std::string string() const;
    bool isPinnedByDigest() const;
};

bool operator==(const ImageReference&, const ImageReference&);

std::ostream& operator<<(std::ostream&, const ImageReference&);

}
}

#endif
