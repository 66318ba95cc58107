/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_workflow_CollaboratorFactory_hpp
#define ocmirror_workflow_CollaboratorFactory_hpp

#include <memory>

#include <boost/filesystem.hpp>

#include "common/Config.hpp"
#include "archive/Archiver.hpp"
#include "clusterresources/ClusterResourcesGenerator.hpp"
#include "collector/CollectorInterface.hpp"
#include "mirror/Batch.hpp"
#include "mirror/MirrorInterface.hpp"
#include "registry/RegistryInterface.hpp"
#include "registry/RegistryLogFile.hpp"


namespace ocmirror {
namespace workflow {

/**
 * Creates the collaborators of the workflow executor. The executor only
 * knows the interfaces, tests replace the factory to observe the workflow.
 */
class CollaboratorFactory {
public:
    virtual ~CollaboratorFactory() = default;

    virtual std::shared_ptr<collector::CollectorInterface> makeReleaseCollector(
        std::shared_ptr<const common::Config> config) const = 0;
    virtual std::shared_ptr<collector::CollectorInterface> makeOperatorCollector(
        std::shared_ptr<const common::Config> config) const = 0;
    virtual std::shared_ptr<collector::CollectorInterface> makeAdditionalImagesCollector(
        std::shared_ptr<const common::Config> config) const = 0;
    virtual std::shared_ptr<mirror::MirrorInterface> makeMirror(
        std::shared_ptr<const common::Config> config) const = 0;
    virtual std::unique_ptr<mirror::BatchInterface> makeBatch(
        std::shared_ptr<const common::Config> config,
        std::shared_ptr<mirror::MirrorInterface> mirror) const = 0;
    virtual std::unique_ptr<archive::Archiver> makeArchiver(
        std::shared_ptr<const common::Config> config) const = 0;
    virtual std::unique_ptr<archive::UnArchiver> makeUnArchiver(
        std::shared_ptr<const common::Config> config) const = 0;
    virtual std::unique_ptr<clusterresources::GeneratorInterface> makeClusterResourcesGenerator(
        std::shared_ptr<const common::Config> config) const = 0;
    // logFile is null when the registry inherits stderr
    virtual std::unique_ptr<registry::RegistryInterface> makeRegistry(
        std::shared_ptr<const common::Config> config,
        const boost::filesystem::path& configFile,
        const registry::RegistryLogFile* logFile) const = 0;
};

class DefaultCollaboratorFactory : public CollaboratorFactory {
public:
    std::shared_ptr<collector::CollectorInterface> makeReleaseCollector(
        std::shared_ptr<const common::Config> config) const override;
    std::shared_ptr<collector::CollectorInterface> makeOperatorCollector(
        std::shared_ptr<const common::Config> config) const override;
    std::shared_ptr<collector::CollectorInterface> makeAdditionalImagesCollector(
        std::shared_ptr<const common::Config> config) const override;
    std::shared_ptr<mirror::MirrorInterface> makeMirror(
        std::shared_ptr<const common::Config> config) const override;
    std::unique_ptr<mirror::BatchInterface> makeBatch(
        std::shared_ptr<const common::Config> config,
        std::shared_ptr<mirror::MirrorInterface> mirror) const override;
    std::unique_ptr<archive::Archiver> makeArchiver(
        std::shared_ptr<const common::Config> config) const override;
    std::unique_ptr<archive::UnArchiver> makeUnArchiver(
        std::shared_ptr<const common::Config> config) const override;
    std::unique_ptr<clusterresources::GeneratorInterface> makeClusterResourcesGenerator(
        std::shared_ptr<const common::Config> config) const override;
    std::unique_ptr<registry::RegistryInterface> makeRegistry(
        std::shared_ptr<const common::Config> config,
        const boost::filesystem::path& configFile,
        const registry::RegistryLogFile* logFile) const override;
};

}
}

#endif
