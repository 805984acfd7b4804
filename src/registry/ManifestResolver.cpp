/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "registry/ManifestResolver.hpp"

#include <algorithm>
#include <utility>

#include "libskiff/Logger.hpp"
#include "registry/MediaTypes.hpp"


namespace skiff {
namespace registry {

// Manifests are small, a larger body is not a manifest
static const size_t maxManifestSize = 4 * 1024 * 1024;

ManifestResolver::ManifestResolver(std::shared_ptr<const RequestPipeline> pipeline,
                                   std::vector<std::string> acceptedMediaTypes)
    : pipeline{std::move(pipeline)}
    , acceptedMediaTypes{std::move(acceptedMediaTypes)}
{
    if(this->acceptedMediaTypes.empty()) {
        this->acceptedMediaTypes = getDefaultManifestMediaTypes();
    }
}

pplx::task<ManifestDescriptor> ManifestResolver::resolve(const std::string& repository,
                                                         const Reference& reference) const {
    validateRepositoryName(repository);

    auto request = RegistryRequest::makeManifestGet(repository, reference.string());
    request.headers["Accept"] = makeAcceptHeader(acceptedMediaTypes);

    printLog(boost::format("Resolving manifest %s:%s") % repository % reference, libskiff::LogLevel::DEBUG);

    // copy, so that the continuations do not depend on the lifetime of this resolver
    auto resolver = *this;
    return pipeline->execute(request).then([resolver, repository, reference](HttpResponse response) {
        auto headers = response.headers;
        auto context = RegistryRequest::makeManifestGet(repository, reference.string()).makeErrorContext();
        return readBody(response.body, maxManifestSize).then([resolver, repository, reference, headers, context](pplx::task<std::string> bodyTask) {
            auto body = std::string{};
            try {
                body = bodyTask.get();
            }
            catch(const RegistryError&) {
                throw;
            }
            catch(const std::exception& e) {
                auto message = boost::format("Failed to read manifest %s:%s: %s") % repository % reference % e.what();
                SKIFF_THROW_REGISTRY_ERROR(ErrorKind::TransportError, context, message.str());
            }
            return resolver.verifyAndParse(repository, reference, headers, std::move(body));
        });
    });
}

pplx::task<ManifestDescriptor> ManifestResolver::resolveChild(const std::string& repository,
                                                              const ManifestListEntry& entry) const {
    printLog(boost::format("Resolving child manifest %s for platform %s") % entry.digest % entry.platform.string(),
             libskiff::LogLevel::DEBUG);
    return resolve(repository, Reference::fromDigest(entry.digest));
}

pplx::task<bool> ManifestResolver::exists(const std::string& repository, const Reference& reference) const {
    validateRepositoryName(repository);

    auto request = RegistryRequest::makeManifestHead(repository, reference.string());
    request.headers["Accept"] = makeAcceptHeader(acceptedMediaTypes);

    return pipeline->execute(request).then([](pplx::task<HttpResponse> responseTask) {
        try {
            responseTask.get();
            return true;
        }
        catch(const RegistryError& e) {
            if(e.getKind() == ErrorKind::NotFound) {
                return false;
            }
            throw;
        }
    });
}

ManifestDescriptor ManifestResolver::verifyAndParse(const std::string& repository, const Reference& reference,
                                                    const HeaderMap& headers, std::string body) const {
    auto context = RegistryRequest::makeManifestGet(repository, reference.string()).makeErrorContext();
    context.httpStatus = 200;

    auto contentType = headers.find("Content-Type");
    if(contentType == headers.cend() || contentType->second.empty()) {
        auto message = boost::format("Registry returned manifest %s:%s without Content-Type") % repository % reference;
        SKIFF_THROW_REGISTRY_ERROR(ErrorKind::UnsupportedManifestType, context, message.str());
    }
    auto mediaType = stripMediaTypeParameters(contentType->second);
    auto kind = classifyManifestMediaType(mediaType);
    auto isAccepted = std::find(acceptedMediaTypes.cbegin(), acceptedMediaTypes.cend(), mediaType)
                      != acceptedMediaTypes.cend();
    if(!kind || !isAccepted) {
        auto message = boost::format("Registry returned manifest %s:%s with unsupported media type '%s'")
            % repository % reference % mediaType;
        SKIFF_THROW_REGISTRY_ERROR(ErrorKind::UnsupportedManifestType, context, message.str());
    }

    // signed schema 1 manifests are addressed, and parsed, by their JWS payload only
    auto payload = *kind == ManifestKind::SignedSchemaV1 ? extractJwsPayload(body, context) : body;

    auto algorithm = reference.isDigest() ? reference.getDigest().getAlgorithm() : DigestAlgorithm::SHA256;
    auto digest = Digest::fromBytes(algorithm, payload);

    if(reference.isDigest() && digest != reference.getDigest()) {
        auto message = boost::format("Digest mismatch for manifest %s@%s: computed %s")
            % repository % reference % digest;
        SKIFF_THROW_REGISTRY_ERROR(ErrorKind::DigestMismatch, context, message.str());
    }

    auto headerDigest = headers.find("Docker-Content-Digest");
    if(headerDigest != headers.cend()) {
        auto serverDigest = boost::optional<Digest>{};
        try {
            serverDigest = Digest::parse(headerDigest->second);
        }
        catch(const RegistryError& e) {
            printLog(boost::format("Ignoring unparsable Docker-Content-Digest header '%s': %s")
                        % headerDigest->second % e.what(),
                     libskiff::LogLevel::WARN);
        }
        if(serverDigest) {
            // compare with the server's algorithm, which may differ from the one of the reference
            auto expected = serverDigest->getAlgorithm() == digest.getAlgorithm()
                ? digest
                : Digest::fromBytes(serverDigest->getAlgorithm(), payload);
            if(expected != *serverDigest) {
                auto message = boost::format("Digest mismatch for manifest %s:%s: registry announced %s, computed %s")
                    % repository % reference % *serverDigest % expected;
                SKIFF_THROW_REGISTRY_ERROR(ErrorKind::DigestMismatch, context, message.str());
            }
        }
    }

    auto content = parseManifest(*kind, payload, context);

    printLog(boost::format("Resolved manifest %s:%s to %s (%s)") % repository % reference % digest % mediaType,
             libskiff::LogLevel::DEBUG);

    return ManifestDescriptor{mediaType, std::move(body), digest, std::move(content)};
}

void ManifestResolver::printLog(const boost::format& message, libskiff::LogLevel level) const {
    libskiff::Logger::getInstance().log(message, "ManifestResolver", level);
}

boost::optional<ManifestListEntry> selectPlatform(const ManifestList& list,
                                                  const std::string& os,
                                                  const std::string& architecture,
                                                  const std::string& variant) {
    for(const auto& entry : list.manifests) {
        if(entry.platform.os == os
           && entry.platform.architecture == architecture
           && (variant.empty() || entry.platform.variant == variant)) {
            return entry;
        }
    }
    return boost::none;
}

}
}
