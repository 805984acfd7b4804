/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

/**
 * @brief In-memory HTTP transport to be used in the tests.
 */

#ifndef skiff_test_utility_FakeTransport_hpp
#define skiff_test_utility_FakeTransport_hpp

#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "registry/HttpTransport.hpp"

namespace test_utility {
namespace transport {

struct FakeResponse {
    int status = 200;
    skiff::registry::HeaderMap headers;
    std::string body;
    // Zero means the whole body in one chunk
    size_t chunkSize = 0;
    // The response is delivered after this delay, on a pplx worker thread
    std::chrono::milliseconds delay{0};
    // Simulates a connection failure instead of a response
    bool failConnection = false;
    // Simulates a connection drop after the given number of body chunks
    bool failBodyAfterChunks = false;
    size_t numberOfChunksBeforeFailure = 0;
};

FakeResponse makeResponse(int status, const std::string& body = {},
                          const skiff::registry::HeaderMap& headers = {});

/**
 * Scripted HTTP transport.
 *
 * Responses are registered per method and URL. A route with several responses
 * serves them in order and keeps serving the last one. A request whose URL has
 * no route is matched against the routes without query string. A request
 * without any matching route fails as a connection error.
 *
 * All requests are recorded. Thread-safe.
 */
class FakeTransport : public skiff::registry::HttpTransport {
public:
    void addResponse(const std::string& method, const std::string& url, const FakeResponse& response);
    pplx::task<skiff::registry::HttpResponse> perform(const skiff::registry::HttpRequest& request) override;

    std::vector<skiff::registry::HttpRequest> getRequests() const;
    // Number of requests to the exact URL
    size_t countRequests(const std::string& method, const std::string& url) const;
    // Number of requests whose URL starts with the prefix
    size_t countRequestsWithPrefix(const std::string& urlPrefix) const;

private:
    using RouteKey = std::pair<std::string, std::string>;

    FakeResponse takeResponse(const skiff::registry::HttpRequest& request);

private:
    mutable std::mutex mutex;
    std::map<RouteKey, std::deque<FakeResponse>> routes;
    std::vector<skiff::registry::HttpRequest> requests;
};

}
}

#endif
