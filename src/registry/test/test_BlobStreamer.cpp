/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <memory>
#include <sstream>
#include <string>

#include "registry/BlobStreamer.hpp"
#include "registry/RegistryClient.hpp"
#include "test_utility/FakeTransport.hpp"
#include "test_utility/registry.hpp"
#include "libskiff/test/aux/unitTestMain.hpp"

namespace skiff {
namespace registry {
namespace test {

using test_utility::registry::baseUrl;
using test_utility::registry::getErrorKind;
using test_utility::registry::makeClient;
using test_utility::registry::sha256;
using test_utility::transport::FakeResponse;
using test_utility::transport::FakeTransport;
using test_utility::transport::makeResponse;

static const std::string repository = "library/alpine";
static const std::string content = "layer content, split into several chunks by the transport";

static std::string makeBlobUrl(const Digest& digest) {
    return baseUrl + "/v2/library/alpine/blobs/" + digest.string();
}

static FakeResponse makeBlobResponse(const std::string& body, const std::string& contentLength) {
    auto response = makeResponse(200, body, HeaderMap{{"Content-Length", contentLength}});
    response.chunkSize = 7;
    return response;
}

static std::string readAll(std::shared_ptr<BlobStream> stream) {
    auto output = std::string{};
    while(auto chunk = stream->readChunk().get()) {
        output.append(chunk->cbegin(), chunk->cend());
    }
    return output;
}

TEST_GROUP(BlobStreamerTestGroup) {
};

TEST(BlobStreamerTestGroup, readChunks) {
    auto digest = sha256(content);
    auto transport = std::make_shared<FakeTransport>();
    transport->addResponse("GET", makeBlobUrl(digest), makeBlobResponse(content, std::to_string(content.size())));
    auto client = makeClient(transport);

    auto stream = client.getBlob(repository, digest).get();
    CHECK(*stream->getExpectedSize() == content.size());
    CHECK_EQUAL(readAll(stream), content);
    CHECK(stream->isFinished());
    CHECK_EQUAL(stream->getBytesRead(), uint64_t{content.size()});

    // reading past the end is a programming error
    CHECK_THROWS(libskiff::Error, stream->readChunk());
}

TEST(BlobStreamerTestGroup, writeTo) {
    auto digest = sha256(content);
    auto transport = std::make_shared<FakeTransport>();
    transport->addResponse("GET", makeBlobUrl(digest), makeBlobResponse(content, std::to_string(content.size())));
    auto client = makeClient(transport);

    auto sink = std::stringstream{};
    auto bytes = client.getBlob(repository, digest, uint64_t{content.size()}).get()->writeTo(sink).get();
    CHECK_EQUAL(bytes, uint64_t{content.size()});
    CHECK_EQUAL(sink.str(), content);
}

TEST(BlobStreamerTestGroup, withoutContentLength) {
    auto digest = sha256(content);
    auto transport = std::make_shared<FakeTransport>();
    transport->addResponse("GET", makeBlobUrl(digest), makeResponse(200, content));
    auto client = makeClient(transport);

    auto stream = client.getBlob(repository, digest).get();
    CHECK_FALSE(stream->getExpectedSize());
    CHECK_EQUAL(readAll(stream), content);
}

TEST(BlobStreamerTestGroup, digestMismatch) {
    auto digest = sha256("other content");
    auto transport = std::make_shared<FakeTransport>();
    transport->addResponse("GET", makeBlobUrl(digest), makeBlobResponse(content, std::to_string(content.size())));
    auto client = makeClient(transport);

    auto stream = client.getBlob(repository, digest).get();
    try {
        readAll(stream);
        FAIL("expected a digest mismatch");
    }
    catch(const RegistryError& e) {
        CHECK(e.getKind() == ErrorKind::DigestMismatch);
        CHECK(e.isIntegrityFailure());
        CHECK_EQUAL(e.getContext().reference, digest.string());
    }

    // writeTo reports the mismatch as well
    auto sink = std::stringstream{};
    auto again = client.getBlob(repository, digest).get();
    CHECK(getErrorKind([&]() { again->writeTo(sink).get(); }) == ErrorKind::DigestMismatch);
}

TEST(BlobStreamerTestGroup, truncated) {
    auto digest = sha256(content);
    auto transport = std::make_shared<FakeTransport>();
    // connection closed before the announced length
    transport->addResponse("GET", makeBlobUrl(digest),
                           makeBlobResponse(content.substr(0, 10), std::to_string(content.size())));
    auto client = makeClient(transport);

    auto stream = client.getBlob(repository, digest).get();
    CHECK(getErrorKind([&]() { readAll(stream); }) == ErrorKind::TruncatedBlob);
    CHECK_EQUAL(stream->getBytesRead(), uint64_t{10});
}

TEST(BlobStreamerTestGroup, largerThanAnnounced) {
    auto digest = sha256(content);
    auto transport = std::make_shared<FakeTransport>();
    transport->addResponse("GET", makeBlobUrl(digest), makeBlobResponse(content, "10"));
    auto client = makeClient(transport);

    auto stream = client.getBlob(repository, digest).get();
    CHECK(getErrorKind([&]() { readAll(stream); }) == ErrorKind::TruncatedBlob);
    // failed streams cannot be read any further
    CHECK_THROWS(libskiff::Error, stream->readChunk());
}

TEST(BlobStreamerTestGroup, contentLengthDiffersFromExpectedSize) {
    auto digest = sha256(content);
    auto transport = std::make_shared<FakeTransport>();
    transport->addResponse("GET", makeBlobUrl(digest), makeBlobResponse(content, std::to_string(content.size())));
    auto client = makeClient(transport);

    auto task = client.getBlob(repository, digest, uint64_t{content.size() + 1});
    CHECK(getErrorKind([&]() { task.get(); }) == ErrorKind::TruncatedBlob);
}

TEST(BlobStreamerTestGroup, connectionDrop) {
    auto digest = sha256(content);
    auto response = makeBlobResponse(content, std::to_string(content.size()));
    response.failBodyAfterChunks = true;
    response.numberOfChunksBeforeFailure = 2;
    auto transport = std::make_shared<FakeTransport>();
    transport->addResponse("GET", makeBlobUrl(digest), response);
    auto client = makeClient(transport);

    auto stream = client.getBlob(repository, digest).get();
    CHECK(stream->readChunk().get());
    CHECK(stream->readChunk().get());
    CHECK(getErrorKind([&]() { stream->readChunk().get(); }) == ErrorKind::TransportError);
    CHECK_EQUAL(stream->getBytesRead(), uint64_t{14});
}

TEST(BlobStreamerTestGroup, notFound) {
    auto digest = sha256(content);
    auto transport = std::make_shared<FakeTransport>();
    transport->addResponse("GET", makeBlobUrl(digest),
                           makeResponse(404, R"({"errors": [{"code": "BLOB_UNKNOWN", "message": "blob unknown to registry"}]})"));
    auto client = makeClient(transport);

    try {
        client.getBlob(repository, digest).get();
        FAIL("expected a not found error");
    }
    catch(const RegistryError& e) {
        CHECK(e.getKind() == ErrorKind::NotFound);
        CHECK(e.getContext().notFoundTarget == NotFoundTarget::Blob);
        CHECK_FALSE(e.isIntegrityFailure());
    }
}

TEST(BlobStreamerTestGroup, exists) {
    auto present = sha256(content);
    auto missing = sha256("missing");
    auto transport = std::make_shared<FakeTransport>();
    transport->addResponse("HEAD", makeBlobUrl(present), makeResponse(200));
    transport->addResponse("HEAD", makeBlobUrl(missing), makeResponse(404));
    auto client = makeClient(transport);

    CHECK(client.hasBlob(repository, present).get());
    CHECK_FALSE(client.hasBlob(repository, missing).get());
    CHECK_EQUAL(transport->getRequests().front().method, std::string{"HEAD"});
}

}}}

SKIFF_UNITTEST_MAIN_FUNCTION();
