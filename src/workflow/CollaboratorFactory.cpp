/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "CollaboratorFactory.hpp"

#include "archive/MirrorArchive.hpp"
#include "collector/ImageSetCollector.hpp"
#include "mirror/SkopeoDriver.hpp"
#include "registry/LocalRegistry.hpp"


namespace ocmirror {
namespace workflow {

std::shared_ptr<collector::CollectorInterface> DefaultCollaboratorFactory::makeReleaseCollector(
        std::shared_ptr<const common::Config> config) const {
    return std::make_shared<collector::ReleaseCollector>(std::move(config));
}

std::shared_ptr<collector::CollectorInterface> DefaultCollaboratorFactory::makeOperatorCollector(
        std::shared_ptr<const common::Config> config) const {
    return std::make_shared<collector::OperatorCollector>(std::move(config));
}

std::shared_ptr<collector::CollectorInterface> DefaultCollaboratorFactory::makeAdditionalImagesCollector(
        std::shared_ptr<const common::Config> config) const {
    return std::make_shared<collector::AdditionalImagesCollector>(std::move(config));
}

std::shared_ptr<mirror::MirrorInterface> DefaultCollaboratorFactory::makeMirror(
        std::shared_ptr<const common::Config> config) const {
    return std::make_shared<mirror::SkopeoDriver>(std::move(config));
}

std::unique_ptr<mirror::BatchInterface> DefaultCollaboratorFactory::makeBatch(
        std::shared_ptr<const common::Config> config,
        std::shared_ptr<mirror::MirrorInterface> mirror) const {
    return std::unique_ptr<mirror::BatchInterface>{ new mirror::Batch{std::move(config), std::move(mirror)} };
}

std::unique_ptr<archive::Archiver> DefaultCollaboratorFactory::makeArchiver(
        std::shared_ptr<const common::Config> config) const {
    return std::unique_ptr<archive::Archiver>{ new archive::MirrorArchive{std::move(config)} };
}

std::unique_ptr<archive::UnArchiver> DefaultCollaboratorFactory::makeUnArchiver(
        std::shared_ptr<const common::Config> config) const {
    return std::unique_ptr<archive::UnArchiver>{ new archive::ArchiveExtractor{std::move(config)} };
}

std::unique_ptr<clusterresources::GeneratorInterface> DefaultCollaboratorFactory::makeClusterResourcesGenerator(
        std::shared_ptr<const common::Config> config) const {
    return std::unique_ptr<clusterresources::GeneratorInterface>{
        new clusterresources::ClusterResourcesGenerator{std::move(config)} };
}

std::unique_ptr<registry::RegistryInterface> DefaultCollaboratorFactory::makeRegistry(
        std::shared_ptr<const common::Config> config,
        const boost::filesystem::path& configFile,
        const registry::RegistryLogFile* logFile) const {
    return std::unique_ptr<registry::RegistryInterface>{
        new registry::LocalRegistry{std::move(config), configFile, logFile} };
}

}
}
