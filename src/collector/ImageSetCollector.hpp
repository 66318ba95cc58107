/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_collector_ImageSetCollector_hpp
#define ocmirror_collector_ImageSetCollector_hpp

#include <memory>
#include <string>

#include <boost/format.hpp>
#include <rapidjson/document.h>

#include "libocmirror/LogLevel.hpp"
#include "common/Config.hpp"
#include "collector/CollectorInterface.hpp"


namespace ocmirror {
namespace collector {

/**
 * Base of the collectors that read their images from a section of the
 * image set configuration. It maps an image reference to the transfer that
 * the current workflow mode requires:
 *
 * mirror to disk, prepare: docker://<ref> -> docker://<local storage>/<path>
 * disk to mirror:          docker://<local storage>/<path> -> <destination>/<path>
 */
class ImageSetCollector : public CollectorInterface {
public:
    ImageSetCollector(std::shared_ptr<const common::Config> config, const std::string& sysname);

protected:
    common::WorkItem makeWorkItem(const std::string& reference) const;
    const rapidjson::Value* findMirrorSection(const char* name) const;
    void printLog(const boost::format& message, libocmirror::LogLevel level) const;

protected:
    std::shared_ptr<const common::Config> config;

private:
    std::string sysname;
};

class ReleaseCollector : public ImageSetCollector {
public:
    ReleaseCollector(std::shared_ptr<const common::Config> config);
    std::vector<common::WorkItem> collect(const common::Context& context) override;
};

class OperatorCollector : public ImageSetCollector {
public:
    OperatorCollector(std::shared_ptr<const common::Config> config);
    std::vector<common::WorkItem> collect(const common::Context& context) override;
};

class AdditionalImagesCollector : public ImageSetCollector {
public:
    AdditionalImagesCollector(std::shared_ptr<const common::Config> config);
    std::vector<common::WorkItem> collect(const common::Context& context) override;
};

}
}

#endif
