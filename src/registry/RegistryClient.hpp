/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_registry_RegistryClient_hpp
#define skiff_registry_RegistryClient_hpp

#include <memory>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <pplx/pplxtasks.h>

#include "common/Config.hpp"
#include "registry/AuthNegotiator.hpp"
#include "registry/BlobStreamer.hpp"
#include "registry/Credential.hpp"
#include "registry/HttpTransport.hpp"
#include "registry/ManifestResolver.hpp"
#include "registry/Pagination.hpp"
#include "registry/RegistryEndpoint.hpp"
#include "registry/RequestPipeline.hpp"


namespace skiff {
namespace registry {

/**
 * Client of one registry endpoint.
 *
 * All operations are asynchronous and report failures as RegistryError
 * through the returned tasks. Malformed repository names and references
 * are rejected synchronously with libskiff::Error.
 */
class RegistryClient {
public:
    RegistryClient(const RegistryEndpoint& endpoint,
                   std::shared_ptr<HttpTransport> transport,
                   const std::vector<std::string>& manifestMediaTypes = {},
                   const boost::optional<size_t>& defaultPageSize = boost::none);

    // Client on top of cpprestsdk, with the static credential of the configuration (if any)
    static RegistryClient fromConfig(const common::Config& config);

    // Installs a static credential and verifies it against the registry's API version check
    pplx::task<void> login(const BasicCredential& credential);
    pplx::task<bool> isV2Supported() const;

    std::shared_ptr<PageStream> listTags(const std::string& repository,
                                         const boost::optional<size_t>& pageSize = boost::none) const;
    std::shared_ptr<PageStream> listCatalog(const boost::optional<size_t>& pageSize = boost::none) const;

    pplx::task<ManifestDescriptor> getManifest(const std::string& repository, const Reference& reference) const;
    pplx::task<ManifestDescriptor> getChildManifest(const std::string& repository, const ManifestListEntry& entry) const;
    pplx::task<bool> hasManifest(const std::string& repository, const Reference& reference) const;

    pplx::task<std::shared_ptr<BlobStream>> getBlob(const std::string& repository, const Digest& digest,
                                                    const boost::optional<uint64_t>& expectedSize = boost::none) const;
    pplx::task<bool> hasBlob(const std::string& repository, const Digest& digest) const;

    const RegistryEndpoint& getEndpoint() const { return endpoint; }
    const std::shared_ptr<AuthNegotiator>& getNegotiator() const { return negotiator; }

private:
    RegistryEndpoint endpoint;
    std::shared_ptr<HttpTransport> transport;
    std::shared_ptr<AuthNegotiator> negotiator;
    std::shared_ptr<const RequestPipeline> pipeline;
    ManifestResolver manifestResolver;
    BlobStreamer blobStreamer;
    boost::optional<size_t> defaultPageSize;
};

}
}

#endif
