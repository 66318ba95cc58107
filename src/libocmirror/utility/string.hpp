/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libocmirror_utility_string_hpp
#define libocmirror_utility_string_hpp

#include <string>

/**
 * Utility functions for string manipulation
 */

namespace libocmirror {
namespace string {

std::string replace(std::string &buf, const std::string& from, const std::string& to);
std::string removePrefix(const std::string& s, const std::string& prefix);
std::string generateRandom(size_t size);

}}

#endif
