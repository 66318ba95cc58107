/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_test_utility_config_hpp
#define ocmirror_test_utility_config_hpp

#include <memory>
#include <string>

#include <boost/filesystem.hpp>

#include "common/Config.hpp"

namespace test_utility {
namespace config {

/**
 * Temporary installation prefix, cache and image set configuration.
 * Everything lives below baseDir and is removed with the object.
 */
struct ConfigRAII {
    ConfigRAII() = default;
    ConfigRAII(const ConfigRAII&) = delete;
    ConfigRAII(ConfigRAII&&);
    ~ConfigRAII();

    std::shared_ptr<ocmirror::common::Config> config;
    boost::filesystem::path baseDir;
};

ConfigRAII makeConfig();

void writeImageSetConfig(ocmirror::common::Config& config, const std::string& json);

}
}

#endif
