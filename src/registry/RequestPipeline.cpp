/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "registry/RequestPipeline.hpp"

#include <exception>
#include <sstream>
#include <utility>

#include <rapidjson/document.h>

#include "libskiff/Logger.hpp"
#include "libskiff/utility/json.hpp"
#include "registry/AuthChallenge.hpp"


namespace skiff {
namespace registry {

static const size_t maxErrorBodySize = 64 * 1024;

std::string toString(Operation operation) {
    switch(operation) {
        case Operation::ApiVersionCheck: return "API version check";
        case Operation::ManifestGet: return "manifest GET";
        case Operation::ManifestHead: return "manifest HEAD";
        case Operation::BlobGet: return "blob GET";
        case Operation::BlobHead: return "blob HEAD";
        case Operation::TagList: return "tag list";
        case Operation::Catalog: return "catalog";
    }
    SKIFF_THROW_ERROR("failed to convert unknown registry operation to string");
}

RegistryRequest RegistryRequest::makeApiVersionCheck() {
    return RegistryRequest{Operation::ApiVersionCheck, std::string{}, std::string{}, "/v2/", HeaderMap{}};
}

RegistryRequest RegistryRequest::makeManifestGet(const std::string& repository, const std::string& reference) {
    return RegistryRequest{Operation::ManifestGet, repository, reference,
                           "/v2/" + repository + "/manifests/" + reference, HeaderMap{}};
}

RegistryRequest RegistryRequest::makeManifestHead(const std::string& repository, const std::string& reference) {
    auto request = makeManifestGet(repository, reference);
    request.operation = Operation::ManifestHead;
    return request;
}

RegistryRequest RegistryRequest::makeBlobGet(const std::string& repository, const std::string& digest) {
    return RegistryRequest{Operation::BlobGet, repository, digest,
                           "/v2/" + repository + "/blobs/" + digest, HeaderMap{}};
}

RegistryRequest RegistryRequest::makeBlobHead(const std::string& repository, const std::string& digest) {
    auto request = makeBlobGet(repository, digest);
    request.operation = Operation::BlobHead;
    return request;
}

RegistryRequest RegistryRequest::makeTagList(const std::string& repository, const std::string& pathAndQuery) {
    return RegistryRequest{Operation::TagList, repository, std::string{}, pathAndQuery, HeaderMap{}};
}

RegistryRequest RegistryRequest::makeCatalog(const std::string& pathAndQuery) {
    return RegistryRequest{Operation::Catalog, std::string{}, std::string{}, pathAndQuery, HeaderMap{}};
}

std::string RegistryRequest::getMethod() const {
    if(operation == Operation::ManifestHead || operation == Operation::BlobHead) {
        return "HEAD";
    }
    return "GET";
}

std::string RegistryRequest::getScope() const {
    switch(operation) {
        case Operation::ApiVersionCheck:
            return std::string{};
        case Operation::Catalog:
            return "registry:catalog:*";
        default:
            return "repository:" + repository + ":pull";
    }
}

ErrorContext RegistryRequest::makeErrorContext() const {
    auto context = ErrorContext{};
    context.repository = repository;
    context.reference = reference;
    return context;
}

RequestPipeline::RequestPipeline(const RegistryEndpoint& endpoint,
                                 std::shared_ptr<HttpTransport> transport,
                                 std::shared_ptr<AuthNegotiator> negotiator)
    : endpoint{endpoint}
    , transport{std::move(transport)}
    , negotiator{std::move(negotiator)}
{}

pplx::task<HttpResponse> RequestPipeline::execute(const RegistryRequest& request) const {
    auto self = shared_from_this();
    auto credential = negotiator->getCredential(request.getScope());

    return send(request, credential).then([self, request, credential](HttpResponse response) {
        if(response.status == 401) {
            return self->handleUnauthorized(request, response, credential);
        }
        return self->interpret(request, std::move(response));
    });
}

pplx::task<HttpResponse> RequestPipeline::executeWithoutNegotiation(const RegistryRequest& request) const {
    auto self = shared_from_this();
    auto credential = negotiator->getCredential(request.getScope());

    return send(request, credential).then([self, request](HttpResponse response) {
        if(response.status == 401) {
            return pplx::task_from_result(response);
        }
        return self->interpret(request, std::move(response));
    });
}

pplx::task<HttpResponse> RequestPipeline::send(const RegistryRequest& request, const Credential& credential) const {
    auto httpRequest = HttpRequest{};
    httpRequest.method = request.getMethod();
    httpRequest.url = endpoint.makeUrl(request.pathAndQuery);
    httpRequest.headers = request.headers;
    httpRequest.headers["User-Agent"] = endpoint.getPolicy().userAgent;
    httpRequest.timeout = endpoint.getPolicy().requestTimeout;
    if(auto authorization = makeAuthorizationHeader(credential)) {
        httpRequest.headers["Authorization"] = *authorization;
    }

    printLog(boost::format("%s %s (credential: %s)") % httpRequest.method % httpRequest.url % describe(credential),
             libskiff::LogLevel::DEBUG);

    auto response = pplx::task<HttpResponse>{};
    try {
        response = transport->perform(httpRequest);
    }
    catch(const std::exception&) {
        response = pplx::task_from_exception<HttpResponse>(std::current_exception());
    }

    auto context = request.makeErrorContext();
    auto url = httpRequest.url;
    return response.then([context, url](pplx::task<HttpResponse> responseTask) {
        try {
            return responseTask.get();
        }
        catch(const RegistryError&) {
            throw;
        }
        catch(const std::exception& e) {
            auto message = boost::format("Failed to perform HTTP request %s: %s") % url % e.what();
            SKIFF_THROW_REGISTRY_ERROR(ErrorKind::TransportError, context, message.str());
        }
    });
}

pplx::task<HttpResponse> RequestPipeline::handleUnauthorized(const RegistryRequest& request,
                                                             const HttpResponse& response,
                                                             const Credential& rejected) const {
    auto context = request.makeErrorContext();
    context.httpStatus = 401;

    auto header = response.getHeader("WWW-Authenticate");
    if(!header) {
        auto message = boost::format("Registry %s replied HTTP 401 to %s %s without authentication challenge")
            % endpoint.getHost() % request.getMethod() % request.pathAndQuery;
        SKIFF_THROW_REGISTRY_ERROR(ErrorKind::AuthenticationFailed, context, message.str());
    }

    auto challenge = AuthChallenge::parse(*header);
    printLog(boost::format("Received authentication challenge: %s") % challenge, libskiff::LogLevel::DEBUG);

    auto self = shared_from_this();
    auto scope = request.getScope();
    return negotiator->negotiate(scope, challenge, rejected).then([self, request, scope, context](Credential credential) {
        return self->send(request, credential).then([self, request, scope, context, credential](HttpResponse retried) {
            if(retried.status == 401) {
                self->negotiator->invalidate(scope, credential);
                auto message = boost::format("Registry %s rejected the credential %s obtained for scope '%s'")
                    % self->endpoint.getHost() % describe(credential) % scope;
                SKIFF_THROW_REGISTRY_ERROR(ErrorKind::AuthenticationFailed, context, message.str());
            }
            return self->interpret(request, std::move(retried));
        });
    });
}

pplx::task<HttpResponse> RequestPipeline::interpret(const RegistryRequest& request, HttpResponse response) const {
    if(response.status >= 200 && response.status < 300) {
        return pplx::task_from_result(std::move(response));
    }

    auto self = shared_from_this();
    auto status = response.status;
    return readBody(response.body, maxErrorBodySize).then([self, request, status](pplx::task<std::string> bodyTask) -> HttpResponse {
        auto body = std::string{};
        try {
            body = bodyTask.get();
        }
        catch(const std::exception& e) {
            self->printLog(boost::format("Failed to read body of HTTP %d response: %s") % status % e.what(),
                           libskiff::LogLevel::DEBUG);
        }

        auto context = request.makeErrorContext();
        context.httpStatus = status;
        context.responseBody = body;

        auto registryErrors = parseRegistryErrors(body);
        auto message = boost::format("Registry %s replied HTTP %d to %s of %s%s")
            % self->endpoint.getHost()
            % status
            % toString(request.operation)
            % request.pathAndQuery
            % (registryErrors.empty() ? std::string{} : ": " + registryErrors);

        if(status == 404) {
            if(hasRegistryErrorCode(body, "NAME_UNKNOWN")) {
                context.notFoundTarget = NotFoundTarget::Repository;
            }
            else {
                switch(request.operation) {
                    case Operation::ManifestGet:
                    case Operation::ManifestHead:
                        context.notFoundTarget = NotFoundTarget::Manifest;
                        break;
                    case Operation::BlobGet:
                    case Operation::BlobHead:
                        context.notFoundTarget = NotFoundTarget::Blob;
                        break;
                    case Operation::TagList:
                    case Operation::Catalog:
                        context.notFoundTarget = NotFoundTarget::Repository;
                        break;
                    case Operation::ApiVersionCheck:
                        context.notFoundTarget = NotFoundTarget::None;
                        break;
                }
            }
            SKIFF_THROW_REGISTRY_ERROR(ErrorKind::NotFound, context, message.str());
        }
        if(status == 429 || status >= 500) {
            SKIFF_THROW_REGISTRY_ERROR(ErrorKind::Transient, context, message.str());
        }
        SKIFF_THROW_REGISTRY_ERROR(ErrorKind::RegistryRejected, context, message.str());
    });
}

void RequestPipeline::printLog(const boost::format& message, libskiff::LogLevel level) const {
    libskiff::Logger::getInstance().log(message, "RequestPipeline", level);
}

static const rapidjson::Value* findErrorsArray(const rapidjson::Document& json) {
    if(json.HasParseError() || !json.IsObject()) {
        return nullptr;
    }
    auto it = json.FindMember("errors");
    if(it == json.MemberEnd() || !it->value.IsArray()) {
        return nullptr;
    }
    return &it->value;
}

std::string parseRegistryErrors(const std::string& body) {
    auto json = rapidjson::Document{};
    json.Parse(body.c_str(), body.size());
    const auto* errors = findErrorsArray(json);
    if(!errors) {
        return std::string{};
    }

    std::stringstream ss;
    auto separator = "";
    for(const auto& error : errors->GetArray()) {
        ss << separator << libskiff::json::getStringMember(error, "code");
        auto message = libskiff::json::getStringMember(error, "message");
        if(!message.empty()) {
            ss << " (" << message << ")";
        }
        separator = ", ";
    }
    return ss.str();
}

bool hasRegistryErrorCode(const std::string& body, const std::string& code) {
    auto json = rapidjson::Document{};
    json.Parse(body.c_str(), body.size());
    const auto* errors = findErrorsArray(json);
    if(!errors) {
        return false;
    }
    for(const auto& error : errors->GetArray()) {
        if(libskiff::json::getStringMember(error, "code") == code) {
            return true;
        }
    }
    return false;
}

}
}
