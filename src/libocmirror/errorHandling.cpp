/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "Error.hpp"

#include <future>
#include <ios>
#include <stdexcept>
#include <system_error>

namespace libocmirror {

std::string getExceptionTypeString(const std::exception& e) {
    if (dynamic_cast<const std::future_error*>(&e)) {
        return "future error";
    }
    else if (dynamic_cast<const std::logic_error*>(&e)) {
        return "logic error";
    }
    else if (dynamic_cast<const std::ios_base::failure*>(&e)) {
        return "ios_base failure";
    }
    else if (dynamic_cast<const std::system_error*>(&e)) {
        return "system error";
    }
    else if (dynamic_cast<const std::runtime_error*>(&e)) {
        return "runtime error";
    }
    else if (dynamic_cast<const std::bad_alloc*>(&e)) {
        return "bad alloc";
    }
    return "generic exception";
}

}
