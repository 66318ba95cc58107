/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "mirror/SkopeoDriver.hpp"

#include <chrono>
#include <functional>
#include <sstream>

#include <unistd.h>

#include <rapidjson/document.h>
#include <rapidjson/pointer.h>

#include "libocmirror/Error.hpp"
#include "libocmirror/Logger.hpp"
#include "libocmirror/Utility.hpp"


namespace ocmirror {
namespace mirror {

SkopeoDriver::SkopeoDriver(std::shared_ptr<const common::Config> config)
    : config{std::move(config)}
{
    skopeoPath = this->config->json["skopeoPath"].GetString();
    if (!boost::filesystem::is_regular_file(skopeoPath)) {
        auto message = boost::format("The path to the Skopeo executable '%s' configured in ocmirror.json does not "
                                     "lead to a regular file. "
                                     "Please contact your system administrator.") % skopeoPath;
        OCMIRROR_THROW_ERROR(message.str());
    }

    if (const rapidjson::Value* configPolicy = rapidjson::Pointer("/containersPolicy/path").Get(this->config->json)) {
        if (!boost::filesystem::is_regular_file(configPolicy->GetString())) {
            auto message = boost::format("Custom containers policy file '%s' configured in ocmirror.json is not a regular file. "
                                         "Please contact your system administrator.") % configPolicy->GetString();
            OCMIRROR_THROW_ERROR(message.str());
        }
        customPolicyPath = boost::filesystem::path(configPolicy->GetString());
    }

    if (const rapidjson::Value* configEnforcePolicy = rapidjson::Pointer("/containersPolicy/enforce").Get(this->config->json)) {
        enforceCustomPolicy = configEnforcePolicy->GetBool();
    }
    else {
        enforceCustomPolicy = false;
    }

    retryTimes = this->config->getUnsignedSetting("copyRetryTimes", 2);
}

void SkopeoDriver::copy(const common::Context& context, const std::string& source, const std::string& destination) {
    context.throwIfCancelled(std::string{"copy of "} + source);
    printLog(boost::format("copying %s to %s") % source % destination, libocmirror::LogLevel::DEBUG);

    auto args = generateCopyArgs(source, destination);

    auto start = std::chrono::system_clock::now();
    auto status = libocmirror::process::forkExecWait(args);
    if(status != 0) {
        auto message = boost::format("Failed to copy '%s' to '%s' (skopeo exit status %d)") % source % destination % status;
        OCMIRROR_THROW_ERROR(message.str());
    }
    auto end = std::chrono::system_clock::now();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count() / double(1000);
    printLog(boost::format("Elapsed time on copy operation of %s: %s [sec]") % source % elapsed, libocmirror::LogLevel::DEBUG);
}

bool SkopeoDriver::check(const common::Context& context, const std::string& reference) {
    context.throwIfCancelled(std::string{"check of "} + reference);

    auto args = generateInspectArgs(reference);

    // arguments go straight to execvp, stderr is captured together with stdout
    auto output = std::stringstream{};
    auto redirectStderr = std::function<void()>{[]() {
        dup2(STDOUT_FILENO, STDERR_FILENO);
    }};
    auto status = libocmirror::process::forkExecWait(args, redirectStderr, {}, &output);

    if(status != 0) {
        auto errorMessage = output.str();

        // Registries report a missing image with different wordings
        for(const auto* notFound : {"manifest unknown", "name unknown", "not found"}) {
            if(errorMessage.find(notFound) != std::string::npos) {
                printLog(boost::format("image %s not found") % reference, libocmirror::LogLevel::DEBUG);
                return false;
            }
        }
        auto message = boost::format("Failed to check existence of image '%s' (skopeo exit status %d). "
                                     "Skopeo output:\n\n%s") % reference % status % errorMessage;
        OCMIRROR_THROW_ERROR(message.str());
    }

    printLog(boost::format("image %s found") % reference, libocmirror::LogLevel::DEBUG);
    return true;
}

libocmirror::CLIArguments SkopeoDriver::generateBaseArgs() const {
    auto args = libocmirror::CLIArguments{skopeoPath.string()};

    auto verbosity = getVerbosityOption();
    if (!verbosity.empty()) {
        args.push_back(verbosity);
    }

    args += getPolicyOption();

    return args;
}

libocmirror::CLIArguments SkopeoDriver::generateCopyArgs(const std::string& source, const std::string& destination) const {
    auto args = generateBaseArgs();
    args.push_back("copy");
    args += getMultiArchOption();
    if (config->global.quiet) {
        args.push_back("--quiet");
    }
    args += libocmirror::CLIArguments{"--retry-times", std::to_string(retryTimes)};

    if (isLocalStorage(source) || !config->global.srcTlsVerify) {
        args.push_back("--src-tls-verify=false");
    }
    if (isLocalStorage(destination) || !config->global.destTlsVerify) {
        args.push_back("--dest-tls-verify=false");
    }

    args += libocmirror::CLIArguments{source, destination};
    return args;
}

libocmirror::CLIArguments SkopeoDriver::generateInspectArgs(const std::string& reference) const {
    auto args = generateBaseArgs() + libocmirror::CLIArguments{"inspect", "--raw"};
    if (isLocalStorage(reference) || !config->global.srcTlsVerify) {
        args.push_back("--tls-verify=false");
    }
    args.push_back(reference);
    return args;
}

std::string SkopeoDriver::getVerbosityOption() const {
    auto logLevel = libocmirror::Logger::getInstance().getLevel();
    if (logLevel == libocmirror::LogLevel::DEBUG) {
        return std::string{"--debug"};
    }
    return std::string{};
}

libocmirror::CLIArguments SkopeoDriver::getPolicyOption() const {
    if (!config->global.securePolicy) {
        return libocmirror::CLIArguments{"--insecure-policy"};
    }

    auto userPolicyPath = boost::filesystem::path{};
    if (auto home = libocmirror::environment::findVariable("HOME")) {
        userPolicyPath = boost::filesystem::path{*home} / ".config/containers/policy.json";
    }
    auto systemPolicyPath = boost::filesystem::path("/etc/containers/policy.json");

    if (enforceCustomPolicy) {
        return libocmirror::CLIArguments{"--policy", customPolicyPath.string()};
    }
    else if ((!userPolicyPath.empty() && boost::filesystem::exists(userPolicyPath))
             || boost::filesystem::exists(systemPolicyPath)) {
        return libocmirror::CLIArguments{};
    }
    else if (!customPolicyPath.empty()) {
        return libocmirror::CLIArguments{"--policy", customPolicyPath.string()};
    }
    else {
        OCMIRROR_THROW_ERROR("Failed to detect default containers policy files and "
                             "no fallback policy file defined in ocmirror.json. "
                             "Please contact your system administrator.")
    }
}

libocmirror::CLIArguments SkopeoDriver::getMultiArchOption() const {
    const auto& multiArch = config->runOptions.multiArch;
    if (multiArch == "all") {
        return libocmirror::CLIArguments{"--all"};
    }
    else if (multiArch.empty() || multiArch == "system") {
        return libocmirror::CLIArguments{};
    }
    return libocmirror::CLIArguments{"--multi-arch", multiArch};
}

bool SkopeoDriver::isLocalStorage(const std::string& reference) const {
    auto localStorage = config->getLocalStorageURL() + "/";
    return !config->runOptions.localStorageFQDN.empty()
        && reference.compare(0, localStorage.size(), localStorage) == 0;
}

void SkopeoDriver::printLog(const boost::format &message, libocmirror::LogLevel level,
                            std::ostream& outStream, std::ostream& errStream) const {
    printLog(message.str(), level, outStream, errStream);
}

void SkopeoDriver::printLog(const std::string& message, libocmirror::LogLevel level,
                            std::ostream& outStream, std::ostream& errStream) const {
    libocmirror::Logger::getInstance().log(message, sysname, level, outStream, errStream);
}

}} // namespace
