/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libocmirror_Utility_hpp
#define libocmirror_Utility_hpp

/*
 * All utility headers.
 */

#include "libocmirror/utility/environment.hpp"
#include "libocmirror/utility/filesystem.hpp"
#include "libocmirror/utility/json.hpp"
#include "libocmirror/utility/logging.hpp"
#include "libocmirror/utility/process.hpp"
#include "libocmirror/utility/string.hpp"

#endif
