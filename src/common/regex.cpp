/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "common/regex.hpp"

#include <sstream>


namespace ocmirror {
namespace common {
namespace regex {
namespace strings {

// Grammar of the container image references accepted by registries
// (github.com/distribution/reference). Repository paths are lower case.

const std::string alphaNumeric{"[a-z0-9]+"};

// one period, one or two underscores, or any number of dashes
const std::string separator{"(?:[._]|__|[-]+)"};

const std::string pathComponent = concatenate({ alphaNumeric,
                                                optional(repeated(separator + alphaNumeric))
                                              });

const std::string domainNameComponent{"(?:[a-zA-Z0-9]|[a-zA-Z0-9][a-zA-Z0-9-]*[a-zA-Z0-9])"};

// IPv6 in compressed or uncompressed form only (RFC 5952), no zone identifiers
const std::string ipv6Address{"\\[(?:[a-fA-F0-9:]+)\\]"};

const std::string port{"\\:[0-9]+"};

const std::string domainName = concatenate({ domainNameComponent,
                                             optional(repeated("\\." + domainNameComponent))
                                           });

// URI host subcomponent (RFC 3986)
const std::string host = group(concatenate({domainName, "|", ipv6Address}));

const std::string domain = host + optional(port);

// <namespace>/<repository>, one or more path components
const std::string remoteName = concatenate({ pathComponent,
                                             optional(repeated("\\/" + pathComponent))
                                           });

const std::string name = concatenate({ optional(domain + "\\/"),
                                       remoteName
                                     });

const std::string tag{"[\\w][\\w.-]{0,127}"};

const std::string digest{"[A-Za-z][A-Za-z0-9]*(?:[-_+.][A-Za-z][A-Za-z0-9]*)*[:][0-9A-Fa-f]{32,}"};

// capturing groups: 1 name, 2 tag, 3 digest
const std::string reference = anchored(capture(name)
                                       + optional("\\:" + capture(tag))
                                       + optional("\\@" + capture(digest))
                                      );

std::string concatenate(const std::initializer_list<std::string> expr) {
    auto output = std::stringstream{};
    for (const auto& exp : expr) {
        output << exp;
    }
    return output.str();
}

std::string optional(const std::string& expr) {
    return group(expr) + "?";
}

std::string repeated(const std::string& expr) {
    return group(expr) + "+";
}

std::string group(const std::string& expr) {
    return "(?:" + expr + ")";
}

std::string capture(const std::string& expr) {
    return "(" + expr + ")";
}

std::string anchored(const std::string& expr) {
    return "^" + expr + "$";
}

} // namespace

const boost::regex domain(strings::domain);
const boost::regex name(strings::name);
const boost::regex tag(strings::tag);
const boost::regex digest(strings::digest);
const boost::regex reference(strings::reference);

} // namespace
} // namespace
} // namespace
