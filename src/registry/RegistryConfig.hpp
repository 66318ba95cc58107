/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_registry_RegistryConfig_hpp
#define ocmirror_registry_RegistryConfig_hpp

#include <cstdint>
#include <string>

#include <boost/filesystem.hpp>


namespace ocmirror {
namespace registry {

/**
 * Configuration document of the local storage registry (distribution format,
 * version 0.1): filesystem storage rooted at the cache directory, in-memory
 * blob descriptor cache, listener on the given port and a storage health check.
 */
class RegistryConfig {
public:
    RegistryConfig(const boost::filesystem::path& rootDirectory, std::uint16_t port, const std::string& logLevel);

    std::string generate() const;
    void write(const boost::filesystem::path& file) const;

    static std::string toRegistryLogLevel(const std::string& logLevel);

private:
    boost::filesystem::path rootDirectory;
    std::uint16_t port;
    std::string logLevel;
};

}
}

#endif
