/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_registry_HttpTransport_hpp
#define skiff_registry_HttpTransport_hpp

#include <chrono>
#include <limits>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <pplx/pplxtasks.h>


namespace skiff {
namespace registry {

struct CaseInsensitiveLess {
    bool operator()(const std::string& lhs, const std::string& rhs) const;
};

// HTTP header names are case-insensitive
using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;

using Chunk = std::vector<unsigned char>;

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    HeaderMap headers;
    boost::optional<std::string> body;
    // Zero means the transport's default
    std::chrono::milliseconds timeout{0};
};

/**
 * Body of an HTTP response, consumed chunk by chunk.
 */
class BodyStream {
public:
    virtual ~BodyStream() = default;
    // Next chunk of the body, or an empty optional once the body is exhausted
    virtual pplx::task<boost::optional<Chunk>> readChunk() = 0;
};

struct HttpResponse {
    int status = 0;
    HeaderMap headers;
    // Null for responses without body (e.g. HEAD)
    std::shared_ptr<BodyStream> body;

    boost::optional<std::string> getHeader(const std::string& name) const;
};

/**
 * The HTTP execution capability the registry client is built on.
 *
 * Implementations own TLS, proxies, connection reuse and redirects.
 * Failures to obtain a response (DNS, connection, TLS, timeout) are
 * reported as exceptions of the returned task.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual pplx::task<HttpResponse> perform(const HttpRequest& request) = 0;
};

// Reads the remaining body into a string, failing if it exceeds maxSize bytes
pplx::task<std::string> readBody(std::shared_ptr<BodyStream> body,
                                 size_t maxSize = std::numeric_limits<size_t>::max());

}
}

#endif
