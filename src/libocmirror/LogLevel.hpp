/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libocmirror_LogLevel_hpp
#define libocmirror_LogLevel_hpp

namespace libocmirror {

enum class LogLevel {DEBUG, INFO, WARN, ERROR, GENERAL};

}

#endif
