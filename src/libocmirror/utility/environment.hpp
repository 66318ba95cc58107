/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libocmirror_utility_environment_hpp
#define libocmirror_utility_environment_hpp

#include <string>

#include <boost/optional.hpp>

/**
 * Utility functions for environment variables
 */

namespace libocmirror {
namespace environment {

boost::optional<std::string> findVariable(const std::string& key);
void setVariable(const std::string& key, const std::string& value);
void unsetVariable(const std::string& key);

}}

#endif
