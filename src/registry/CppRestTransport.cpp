/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "registry/CppRestTransport.hpp"

#include <utility>

#include <boost/algorithm/string.hpp>

#include "libskiff/Error.hpp"
#include "libskiff/Logger.hpp"


namespace skiff {
namespace registry {

namespace {

/**
 * Body of a cpprest response. Holds the client and the response, because
 * the underlying connection is owned by them.
 */
class CppRestBodyStream : public BodyStream {
public:
    CppRestBodyStream(std::shared_ptr<web::http::client::http_client> client,
                      web::http::http_response response,
                      size_t chunkSize)
        : client{std::move(client)}
        , response{std::move(response)}
        , stream{this->response.body()}
        , chunkSize{chunkSize}
    {}

    pplx::task<boost::optional<Chunk>> readChunk() override {
        auto chunk = std::make_shared<Chunk>(chunkSize);
        return stream.streambuf().getn(chunk->data(), chunk->size()).then([chunk](size_t bytesRead) {
            if(bytesRead == 0) {
                return boost::optional<Chunk>{};
            }
            chunk->resize(bytesRead);
            return boost::optional<Chunk>{std::move(*chunk)};
        });
    }

private:
    std::shared_ptr<web::http::client::http_client> client;
    web::http::http_response response;
    concurrency::streams::istream stream;
    size_t chunkSize;
};

std::string getHost(const std::string& url) {
    return utility::conversions::to_utf8string(web::uri{utility::conversions::to_string_t(url)}.host());
}

} // namespace

bool isRedirectStatus(int status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

std::string resolveRedirectLocation(const std::string& currentUrl, const std::string& location) {
    if(location.find("://") != std::string::npos) {
        return location;
    }
    auto current = web::uri{utility::conversions::to_string_t(currentUrl)};
    auto origin = utility::conversions::to_utf8string(current.scheme()) + "://"
                + utility::conversions::to_utf8string(current.host());
    if(current.port() > 0) {
        origin += ":" + std::to_string(current.port());
    }
    if(!location.empty() && location.front() == '/') {
        return origin + location;
    }
    auto path = utility::conversions::to_utf8string(current.path());
    return origin + path.substr(0, path.rfind('/') + 1) + location;
}

CppRestTransport::CppRestTransport(const TransportPolicy& policy)
    : policy{policy}
{}

pplx::task<HttpResponse> CppRestTransport::perform(const HttpRequest& request) {
    return performWithRedirects(request, 0);
}

pplx::task<HttpResponse> CppRestTransport::performWithRedirects(HttpRequest request, unsigned int redirects) const {
    auto uri = web::uri{utility::conversions::to_string_t(request.url)};
    auto timeout = request.timeout.count() > 0 ? request.timeout : policy.requestTimeout;
    auto client = makeClient(uri, timeout);

    auto httpRequest = web::http::http_request{utility::conversions::to_string_t(request.method)};
    httpRequest.set_request_uri(uri.resource());
    for(const auto& header : request.headers) {
        httpRequest.headers().add(utility::conversions::to_string_t(header.first),
                                  utility::conversions::to_string_t(header.second));
    }
    if(request.body) {
        httpRequest.set_body(*request.body);
    }

    // copy, the continuation may outlive this transport
    auto transport = *this;
    return client->request(httpRequest).then([transport, client, request, redirects](web::http::http_response response) {
        auto status = static_cast<int>(response.status_code());

        auto location = response.headers().find(U("Location"));
        if(isRedirectStatus(status) && location != response.headers().end()) {
            if(redirects >= transport.policy.maxRedirects) {
                auto message = boost::format("Too many redirects (more than %d) for %s")
                    % transport.policy.maxRedirects % request.url;
                SKIFF_THROW_ERROR(message.str());
            }

            auto redirected = request;
            redirected.url = resolveRedirectLocation(request.url, utility::conversions::to_utf8string(location->second));
            if(status == 303) {
                redirected.method = "GET";
                redirected.body = boost::none;
            }
            if(getHost(redirected.url) != getHost(request.url)) {
                redirected.headers.erase("Authorization");
            }
            transport.printLog(boost::format("HTTP %d redirect from %s to %s") % status % request.url % redirected.url,
                               libskiff::LogLevel::DEBUG);
            return transport.performWithRedirects(redirected, redirects + 1);
        }

        auto output = HttpResponse{};
        output.status = status;
        for(const auto& header : response.headers()) {
            output.headers[utility::conversions::to_utf8string(header.first)] =
                utility::conversions::to_utf8string(header.second);
        }
        if(request.method != "HEAD") {
            output.body = std::make_shared<CppRestBodyStream>(client, response, transport.policy.chunkSize);
        }
        return pplx::task_from_result(output);
    });
}

std::shared_ptr<web::http::client::http_client> CppRestTransport::makeClient(const web::uri& uri,
                                                                             std::chrono::milliseconds timeout) const {
    web::http::client::http_client_config clientConfig;
    clientConfig.set_validate_certificates(policy.validateCertificates);
    clientConfig.set_timeout(timeout);
    clientConfig.set_chunksize(policy.chunkSize);
    if(!policy.proxy.empty()) {
        printLog(boost::format("Setting proxy for HTTP client: %s") % policy.proxy, libskiff::LogLevel::DEBUG);
        clientConfig.set_proxy(web::web_proxy(utility::conversions::to_string_t(policy.proxy)));
    }

    return std::make_shared<web::http::client::http_client>(uri.authority(), clientConfig);
}

void CppRestTransport::printLog(const boost::format& message, libskiff::LogLevel level) const {
    libskiff::Logger::getInstance().log(message, "CppRestTransport", level);
}

}
}
