/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libocmirror_utility_process_hpp
#define libocmirror_utility_process_hpp

#include <functional>
#include <iostream>
#include <string>

#include <boost/optional.hpp>

#include "libocmirror/CLIArguments.hpp"

/**
 * Utility functions for process operations
 */

namespace libocmirror {
namespace process {

int forkExecWait(const libocmirror::CLIArguments& args,
                 const boost::optional<std::function<void()>>& preExecChildActions = {},
                 const boost::optional<std::function<void(int)>>& postForkParentActions = {},
                 std::iostream* const childStdoutStream = nullptr);
std::string getHostname();

}}

#endif
