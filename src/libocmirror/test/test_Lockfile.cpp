/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <type_traits>

#include <boost/filesystem.hpp>

#include "aux/unitTestMain.hpp"
#include "libocmirror/Error.hpp"
#include "libocmirror/Lockfile.hpp"
#include "libocmirror/Utility.hpp"


namespace libocmirror {
namespace test {

TEST_GROUP(LockfileTestGroup) {
    boost::filesystem::path fileToLock = libocmirror::filesystem::makeUniquePathWithRandomSuffix("/tmp/oc-mirror-cache");
    boost::filesystem::path lockfile = fileToLock.string() + ".lock";
};

TEST(LockfileTestGroup, creation_of_physical_lockfile) {
    CHECK(!boost::filesystem::exists(lockfile));
    {
        libocmirror::Lockfile lock{fileToLock};
        CHECK(boost::filesystem::exists(lockfile));
    }
    CHECK(!boost::filesystem::exists(lockfile));
}

TEST(LockfileTestGroup, lock_acquisition) {
    {
        libocmirror::Lockfile lock{fileToLock};
    }
    {
        // previous lock was released when it went out of scope
        libocmirror::Lockfile lock{fileToLock};
    }
    {
        libocmirror::Lockfile lock{fileToLock};
        CHECK_THROWS(libocmirror::Error, libocmirror::Lockfile(fileToLock, 0));
        // a failed acquisition must not remove the lock held by somebody else
        CHECK(boost::filesystem::exists(lockfile));
        CHECK_THROWS(libocmirror::Error, libocmirror::Lockfile(fileToLock, 200));
    }
}

TEST(LockfileTestGroup, move_constructor) {
    libocmirror::Lockfile original{fileToLock};
    {
        libocmirror::Lockfile moveConstructed{std::move(original)};
        CHECK_THROWS(libocmirror::Error, libocmirror::Lockfile(fileToLock, 0));
    }
    libocmirror::Lockfile newlock{fileToLock};
}

TEST(LockfileTestGroup, move_assignment) {
    libocmirror::Lockfile original{fileToLock};
    {
        libocmirror::Lockfile moveAssigned;
        moveAssigned = std::move(original);
        CHECK_THROWS(libocmirror::Error, libocmirror::Lockfile(fileToLock, 0));
    }
    libocmirror::Lockfile newlock{fileToLock};
}

static_assert(!std::is_copy_constructible<libocmirror::Lockfile>::value, "");
static_assert(!std::is_copy_assignable<libocmirror::Lockfile>::value, "");
static_assert(std::is_move_constructible<libocmirror::Lockfile>::value, "");
static_assert(std::is_move_assignable<libocmirror::Lockfile>::value, "");

}}

OCMIRROR_UNITTEST_MAIN_FUNCTION();
