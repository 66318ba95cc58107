/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_test_utility_unittest_main_function_hpp
#define ocmirror_test_utility_unittest_main_function_hpp

#include "libocmirror/Error.hpp"
#include "libocmirror/Logger.hpp"

// WATCH OUT!
// boost libraries must be included before CppUTest, so in order to be
// on the safe side include this file as the last header file in the test code
#include <CppUTest/CommandLineTestRunner.h>
#include <CppUTest/MemoryLeakWarningPlugin.h>


#define OCMIRROR_UNITTEST_MAIN_FUNCTION() \
int main(int argc, char **argv) { \
    try { \
        return CommandLineTestRunner::RunAllTests(argc, argv); \
    } \
    catch(const libocmirror::Error& e) { \
        libocmirror::Logger::getInstance().logErrorTrace(e, "test"); \
        throw; \
    } \
}

// For the tests that start worker threads: their allocations are not
// scoped to a single test, so the new/delete leak checks are turned off.
#define OCMIRROR_UNITTEST_MAIN_FUNCTION_WITH_THREADS() \
int main(int argc, char **argv) { \
    MemoryLeakWarningPlugin::turnOffNewDeleteOverloads(); \
    try { \
        return CommandLineTestRunner::RunAllTests(argc, argv); \
    } \
    catch(const libocmirror::Error& e) { \
        libocmirror::Logger::getInstance().logErrorTrace(e, "test"); \
        throw; \
    } \
}

#endif
