/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "ImageReference.hpp"

#include <sstream>

#include <boost/format.hpp>
#include <boost/regex.hpp>

#include "libocmirror/Error.hpp"
#include "libocmirror/utility/string.hpp"
#include "common/WorkflowMode.hpp"
#include "common/regex.hpp"


namespace ocmirror {
namespace common {

// Only a first component that looks like a host is a domain, "library/alpine" has none
static bool looksLikeDomain(const std::string& component) {
    return (component.find('.') != std::string::npos
            || component.find(':') != std::string::npos
            || component == "localhost")
        && boost::regex_match(component, regex::domain);
}

ImageReference ImageReference::parse(const std::string& input) {
    auto reference = libocmirror::string::removePrefix(input, dockerProtocol);
    if(reference.empty()) {
        OCMIRROR_THROW_ERROR("Failed to parse image reference: reference is empty");
    }

    boost::smatch matches;
    if(!boost::regex_match(reference, matches, regex::reference)) {
        auto message = boost::format("Failed to parse image reference '%s': invalid reference format") % input;
        OCMIRROR_THROW_ERROR(message.str());
    }

    auto result = ImageReference{};
    auto name = matches[1].str();
    if(matches[2].matched) {
        result.tag = matches[2].str();
    }
    if(matches[3].matched) {
        result.digest = matches[3].str();
    }

    auto firstSlash = name.find('/');
    if(firstSlash != std::string::npos && looksLikeDomain(name.substr(0, firstSlash))) {
        result.domain = name.substr(0, firstSlash);
        result.path = name.substr(firstSlash + 1);
    }
    else {
        result.path = name;
    }

    return result;
}

std::string ImageReference::getRepository() const {
    if(domain.empty()) {
        return path;
    }
    return domain + "/" + path;
}

// Reference relative to the registry, as used when re-homing an image on another registry
std::string ImageReference::getPathWithTagOrDigest() const {
    auto output = std::stringstream{};
    output << path;
    if(!digest.empty()) {
        output << "@" << digest;
    }
    else if(!tag.empty()) {
        output << ":" << tag;
    }
    return output.str();
}

std::string ImageReference::string() const {
    auto output = std::stringstream{};
    output << getRepository();
    if (!tag.empty()){
        output << ":" << tag;
    }
    if (!digest.empty()){
        output << "@" << digest;
    }
    return output.str();
}

bool ImageReference::isPinnedByDigest() const {
    return !digest.empty();
}

bool operator==(const ImageReference& lhs, const ImageReference& rhs) {
    return lhs.domain == rhs.domain
        && lhs.path == rhs.path
        && lhs.tag == rhs.tag
        && lhs.digest == rhs.digest;
}

std::ostream& operator<<(std::ostream& os, const ImageReference& imageReference) {
    os << imageReference.string();
    return os;
}

}
}
