/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_mirror_SkopeoDriver_hpp
#define ocmirror_mirror_SkopeoDriver_hpp

#include <iostream>
#include <memory>
#include <string>

#include <boost/format.hpp>
#include <boost/filesystem.hpp>

#include "libocmirror/CLIArguments.hpp"
#include "libocmirror/LogLevel.hpp"
#include "common/Config.hpp"
#include "mirror/MirrorInterface.hpp"


namespace ocmirror {
namespace mirror {

class SkopeoDriver : public MirrorInterface {
public:
    SkopeoDriver(std::shared_ptr<const common::Config> config);

    void copy(const common::Context& context, const std::string& source, const std::string& destination) override;
    bool check(const common::Context& context, const std::string& reference) override;

    libocmirror::CLIArguments generateBaseArgs() const;
    libocmirror::CLIArguments generateCopyArgs(const std::string& source, const std::string& destination) const;
    libocmirror::CLIArguments generateInspectArgs(const std::string& reference) const;

private:
    std::string getVerbosityOption() const;
    libocmirror::CLIArguments getPolicyOption() const;
    libocmirror::CLIArguments getMultiArchOption() const;
    bool isLocalStorage(const std::string& reference) const;
    void printLog(const boost::format &message, libocmirror::LogLevel,
                  std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr) const;
    void printLog(const std::string& message, libocmirror::LogLevel,
                  std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr) const;

private:
    std::shared_ptr<const common::Config> config;
    boost::filesystem::path skopeoPath;
    boost::filesystem::path customPolicyPath;
    bool enforceCustomPolicy;
    unsigned int retryTimes;
    const std::string sysname = "SkopeoDriver";
};

}
}

#endif
