/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_registry_CppRestTransport_hpp
#define skiff_registry_CppRestTransport_hpp

#include <memory>
#include <string>

#include <boost/format.hpp>
#include <cpprest/http_client.h>

#include "libskiff/LogLevel.hpp"
#include "registry/HttpTransport.hpp"
#include "registry/RegistryEndpoint.hpp"


namespace skiff {
namespace registry {

/**
 * HttpTransport on top of cpprestsdk's http_client.
 *
 * Redirects are followed here (up to TransportPolicy::maxRedirects), because
 * blob downloads are usually redirected to a storage backend. The
 * Authorization header is not forwarded to a different host.
 */
class CppRestTransport : public HttpTransport {
public:
    explicit CppRestTransport(const TransportPolicy& policy);

    pplx::task<HttpResponse> perform(const HttpRequest& request) override;

private:
    pplx::task<HttpResponse> performWithRedirects(HttpRequest request, unsigned int redirects) const;
    std::shared_ptr<web::http::client::http_client> makeClient(const web::uri& uri,
                                                               std::chrono::milliseconds timeout) const;
    void printLog(const boost::format& message, libskiff::LogLevel level) const;

private:
    TransportPolicy policy;
};

// Target of a redirect, resolving a relative Location against the current URL
std::string resolveRedirectLocation(const std::string& currentUrl, const std::string& location);
bool isRedirectStatus(int status);

}
}

#endif
