/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "string.hpp"

#include <algorithm>
#include <random>

#include <boost/format.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include "libocmirror/Error.hpp"

/**
 * Utility functions for string manipulation
 */

namespace libocmirror {
namespace string {

std::string replace(std::string &buf, const std::string& from, const std::string& to) {
    std::string::size_type pos = buf.find(from);
    while(pos != std::string::npos){
        buf.replace(pos, from.size(), to);
        pos = buf.find(from, pos + to.size());
    }
    return buf;
}

std::string removePrefix(const std::string& s, const std::string& prefix) {
    if(!boost::starts_with(s, prefix)) {
        return s;
    }
    return s.substr(prefix.size());
}

std::string generateRandom(size_t size) {
    auto dist = std::uniform_int_distribution<std::mt19937::result_type>(0, 'z'-'a');
    std::mt19937 generator;
    generator.seed(std::random_device()());

    auto string = std::string(size, '.');

    for(size_t i=0; i<string.size(); ++i) {
        string[i] = 'a' + dist(generator);
    }

    return string;
}

}}
