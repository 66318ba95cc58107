/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_clusterresources_ClusterResourcesGenerator_hpp
#define ocmirror_clusterresources_ClusterResourcesGenerator_hpp

#include <memory>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "common/Config.hpp"
#include "common/Context.hpp"
#include "common/WorkItem.hpp"


namespace ocmirror {
namespace clusterresources {

class GeneratorInterface {
public:
    virtual ~GeneratorInterface() = default;
    virtual void generate(const common::Context& context, const std::vector<common::WorkItem>& items) = 0;
};

/**
 * Writes the mirror sets that redirect a cluster to the mirrored images:
 * idms-oc-mirror.yaml (ImageDigestMirrorSet) for images referenced by digest
 * and itms-oc-mirror.yaml (ImageTagMirrorSet) for images referenced by tag.
 * Files are written to <working-dir>/cluster-resources only when they
 * contain at least one mirror.
 */
class ClusterResourcesGenerator : public GeneratorInterface {
public:
    ClusterResourcesGenerator(std::shared_ptr<const common::Config> config);

    void generate(const common::Context& context, const std::vector<common::WorkItem>& items) override;

    // Returns none when no item qualifies for the mirror set
    static boost::optional<std::string> generateDigestMirrorSet(const std::vector<common::WorkItem>& items);
    static boost::optional<std::string> generateTagMirrorSet(const std::vector<common::WorkItem>& items);

private:
    std::shared_ptr<const common::Config> config;
};

}
}

#endif
