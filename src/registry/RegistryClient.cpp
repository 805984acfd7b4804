/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "registry/RegistryClient.hpp"

#include <boost/format.hpp>

#include "libskiff/Logger.hpp"
#include "registry/CppRestTransport.hpp"


namespace skiff {
namespace registry {

RegistryClient::RegistryClient(const RegistryEndpoint& endpoint,
                               std::shared_ptr<HttpTransport> transport,
                               const std::vector<std::string>& manifestMediaTypes,
                               const boost::optional<size_t>& defaultPageSize)
    : endpoint{endpoint}
    , transport{transport}
    , negotiator{std::make_shared<AuthNegotiator>(transport, endpoint.getPolicy())}
    , pipeline{std::make_shared<RequestPipeline>(endpoint, transport, negotiator)}
    , manifestResolver{pipeline, manifestMediaTypes}
    , blobStreamer{pipeline}
    , defaultPageSize{defaultPageSize}
{}

RegistryClient RegistryClient::fromConfig(const common::Config& config) {
    auto endpoint = RegistryEndpoint::fromConfig(config);
    auto transport = std::make_shared<CppRestTransport>(endpoint.getPolicy());
    auto client = RegistryClient{endpoint, transport, config.registry.manifestMediaTypes, config.registry.pageSize};

    if(config.authentication.isAuthenticationNeeded) {
        client.negotiator->setStaticCredential(
            BasicCredential{config.authentication.username, config.authentication.password});
    }

    libskiff::Logger::getInstance().log(
        boost::format("Created registry client for %s") % endpoint.getBaseUrl(),
        "RegistryClient", libskiff::LogLevel::DEBUG);

    return client;
}

pplx::task<void> RegistryClient::login(const BasicCredential& credential) {
    negotiator->setStaticCredential(credential);

    auto username = credential.username;
    auto baseUrl = endpoint.getBaseUrl();
    return pipeline->execute(RegistryRequest::makeApiVersionCheck()).then([username, baseUrl](HttpResponse) {
        libskiff::Logger::getInstance().log(
            boost::format("Logged in to %s as %s") % baseUrl % username,
            "RegistryClient", libskiff::LogLevel::INFO);
    });
}

pplx::task<bool> RegistryClient::isV2Supported() const {
    return pipeline->executeWithoutNegotiation(RegistryRequest::makeApiVersionCheck())
        .then([](pplx::task<HttpResponse> responseTask) {
            auto response = HttpResponse{};
            try {
                response = responseTask.get();
            }
            catch(const RegistryError& e) {
                if(e.getKind() == ErrorKind::NotFound || e.getKind() == ErrorKind::RegistryRejected) {
                    return false;
                }
                throw;
            }
            auto version = response.getHeader("Docker-Distribution-API-Version");
            return (response.status == 200 || response.status == 401)
                && version && *version == "registry/2.0";
        });
}

std::shared_ptr<PageStream> RegistryClient::listTags(const std::string& repository,
                                                     const boost::optional<size_t>& pageSize) const {
    auto cursor = PaginationCursor{pipeline, PaginationCursor::Listing::Tags, repository,
                                   pageSize ? pageSize : defaultPageSize};
    return std::make_shared<PageStream>(cursor);
}

std::shared_ptr<PageStream> RegistryClient::listCatalog(const boost::optional<size_t>& pageSize) const {
    auto cursor = PaginationCursor{pipeline, PaginationCursor::Listing::Catalog, std::string{},
                                   pageSize ? pageSize : defaultPageSize};
    return std::make_shared<PageStream>(cursor);
}

pplx::task<ManifestDescriptor> RegistryClient::getManifest(const std::string& repository,
                                                           const Reference& reference) const {
    return manifestResolver.resolve(repository, reference);
}

pplx::task<ManifestDescriptor> RegistryClient::getChildManifest(const std::string& repository,
                                                                const ManifestListEntry& entry) const {
    return manifestResolver.resolveChild(repository, entry);
}

pplx::task<bool> RegistryClient::hasManifest(const std::string& repository, const Reference& reference) const {
    return manifestResolver.exists(repository, reference);
}

pplx::task<std::shared_ptr<BlobStream>> RegistryClient::getBlob(const std::string& repository, const Digest& digest,
                                                                const boost::optional<uint64_t>& expectedSize) const {
    return blobStreamer.fetch(repository, digest, expectedSize);
}

pplx::task<bool> RegistryClient::hasBlob(const std::string& repository, const Digest& digest) const {
    return blobStreamer.exists(repository, digest);
}

}
}
