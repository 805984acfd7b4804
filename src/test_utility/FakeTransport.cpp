/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "FakeTransport.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/format.hpp>

namespace registry = skiff::registry;

namespace test_utility {
namespace transport {

namespace {

class FakeBodyStream : public registry::BodyStream {
public:
    FakeBodyStream(std::string body, size_t chunkSize, bool failAfterChunks, size_t numberOfChunksBeforeFailure)
        : body(std::move(body))
        , chunkSize(chunkSize == 0 ? std::max<size_t>(this->body.size(), 1) : chunkSize)
        , failAfterChunks(failAfterChunks)
        , numberOfChunksBeforeFailure(numberOfChunksBeforeFailure)
    {}

    pplx::task<boost::optional<registry::Chunk>> readChunk() override {
        if(failAfterChunks && numberOfChunksDelivered >= numberOfChunksBeforeFailure) {
            return pplx::task_from_exception<boost::optional<registry::Chunk>>(
                std::runtime_error("connection reset by peer"));
        }
        if(offset >= body.size()) {
            return pplx::task_from_result(boost::optional<registry::Chunk>{});
        }
        auto size = std::min(chunkSize, body.size() - offset);
        auto chunk = registry::Chunk(body.cbegin() + offset, body.cbegin() + offset + size);
        offset += size;
        ++numberOfChunksDelivered;
        return pplx::task_from_result(boost::optional<registry::Chunk>{std::move(chunk)});
    }

private:
    std::string body;
    size_t chunkSize;
    bool failAfterChunks;
    size_t numberOfChunksBeforeFailure;
    size_t offset = 0;
    size_t numberOfChunksDelivered = 0;
};

std::string stripQuery(const std::string& url) {
    return url.substr(0, url.find('?'));
}

}

FakeResponse makeResponse(int status, const std::string& body, const registry::HeaderMap& headers) {
    auto response = FakeResponse{};
    response.status = status;
    response.body = body;
    response.headers = headers;
    return response;
}

void FakeTransport::addResponse(const std::string& method, const std::string& url, const FakeResponse& response) {
    std::lock_guard<std::mutex> lock{mutex};
    routes[RouteKey{method, url}].push_back(response);
}

pplx::task<registry::HttpResponse> FakeTransport::perform(const registry::HttpRequest& request) {
    auto fake = takeResponse(request);

    auto makeHttpResponse = [fake, request]() {
        if(fake.failConnection) {
            auto message = boost::format("failed to connect to %s") % request.url;
            throw std::runtime_error(message.str());
        }
        auto response = registry::HttpResponse{};
        response.status = fake.status;
        response.headers = fake.headers;
        if(request.method != "HEAD") {
            response.body = std::make_shared<FakeBodyStream>(
                fake.body, fake.chunkSize, fake.failBodyAfterChunks, fake.numberOfChunksBeforeFailure);
        }
        return response;
    };

    if(fake.delay.count() > 0) {
        auto delay = fake.delay;
        return pplx::create_task([delay, makeHttpResponse]() {
            std::this_thread::sleep_for(delay);
            return makeHttpResponse();
        });
    }

    try {
        return pplx::task_from_result(makeHttpResponse());
    }
    catch(const std::exception&) {
        return pplx::task_from_exception<registry::HttpResponse>(std::current_exception());
    }
}

FakeResponse FakeTransport::takeResponse(const registry::HttpRequest& request) {
    std::lock_guard<std::mutex> lock{mutex};
    requests.push_back(request);

    auto route = routes.find(RouteKey{request.method, request.url});
    if(route == routes.end()) {
        route = routes.find(RouteKey{request.method, stripQuery(request.url)});
    }
    if(route == routes.end() || route->second.empty()) {
        auto response = FakeResponse{};
        response.failConnection = true;
        return response;
    }

    auto response = route->second.front();
    if(route->second.size() > 1) {
        route->second.pop_front();
    }
    return response;
}

std::vector<registry::HttpRequest> FakeTransport::getRequests() const {
    std::lock_guard<std::mutex> lock{mutex};
    return requests;
}

size_t FakeTransport::countRequests(const std::string& method, const std::string& url) const {
    std::lock_guard<std::mutex> lock{mutex};
    return std::count_if(requests.cbegin(), requests.cend(), [&](const registry::HttpRequest& request) {
        return request.method == method && request.url == url;
    });
}

size_t FakeTransport::countRequestsWithPrefix(const std::string& urlPrefix) const {
    std::lock_guard<std::mutex> lock{mutex};
    return std::count_if(requests.cbegin(), requests.cend(), [&](const registry::HttpRequest& request) {
        return boost::starts_with(request.url, urlPrefix);
    });
}

}
}
