/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_registry_RequestPipeline_hpp
#define skiff_registry_RequestPipeline_hpp

#include <memory>
#include <string>

#include <boost/format.hpp>
#include <pplx/pplxtasks.h>

#include "libskiff/LogLevel.hpp"
#include "registry/AuthNegotiator.hpp"
#include "registry/HttpTransport.hpp"
#include "registry/RegistryEndpoint.hpp"
#include "registry/RegistryError.hpp"


namespace skiff {
namespace registry {

enum class Operation {
    ApiVersionCheck,
    ManifestGet,
    ManifestHead,
    BlobGet,
    BlobHead,
    TagList,
    Catalog
};

std::string toString(Operation);

struct RegistryRequest {
    Operation operation;
    std::string repository;  // empty for ApiVersionCheck and Catalog
    std::string reference;   // tag or digest, for error reporting
    std::string pathAndQuery;
    HeaderMap headers;

    static RegistryRequest makeApiVersionCheck();
    static RegistryRequest makeManifestGet(const std::string& repository, const std::string& reference);
    static RegistryRequest makeManifestHead(const std::string& repository, const std::string& reference);
    static RegistryRequest makeBlobGet(const std::string& repository, const std::string& digest);
    static RegistryRequest makeBlobHead(const std::string& repository, const std::string& digest);
    static RegistryRequest makeTagList(const std::string& repository, const std::string& pathAndQuery);
    static RegistryRequest makeCatalog(const std::string& pathAndQuery);

    std::string getMethod() const;
    // Authorization scope of the request, empty for the API version check
    std::string getScope() const;
    ErrorContext makeErrorContext() const;
};

/**
 * Executes registry API requests: attaches credentials and user agent,
 * answers authentication challenges (one retry per request) and maps
 * unsuccessful responses to RegistryError.
 * Must be owned by a std::shared_ptr, pending requests keep it alive.
 */
class RequestPipeline : public std::enable_shared_from_this<RequestPipeline> {
public:
    RequestPipeline(const RegistryEndpoint& endpoint,
                    std::shared_ptr<HttpTransport> transport,
                    std::shared_ptr<AuthNegotiator> negotiator);

    // The returned task yields only 2xx responses, with the body still to be consumed
    pplx::task<HttpResponse> execute(const RegistryRequest& request) const;

    // Like execute, but 401 responses are returned instead of negotiated
    pplx::task<HttpResponse> executeWithoutNegotiation(const RegistryRequest& request) const;

    const RegistryEndpoint& getEndpoint() const { return endpoint; }
    const std::shared_ptr<AuthNegotiator>& getNegotiator() const { return negotiator; }

private:
    pplx::task<HttpResponse> send(const RegistryRequest& request, const Credential& credential) const;
    pplx::task<HttpResponse> handleUnauthorized(const RegistryRequest& request,
                                                const HttpResponse& response,
                                                const Credential& rejected) const;
    pplx::task<HttpResponse> interpret(const RegistryRequest& request, HttpResponse response) const;
    void printLog(const boost::format& message, libskiff::LogLevel level) const;

private:
    RegistryEndpoint endpoint;
    std::shared_ptr<HttpTransport> transport;
    std::shared_ptr<AuthNegotiator> negotiator;
};

// Formats the errors of a registry error document, or returns an empty string
std::string parseRegistryErrors(const std::string& body);
bool hasRegistryErrorCode(const std::string& body, const std::string& code);

}
}

#endif
