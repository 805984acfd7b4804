/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <chrono>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/Config.hpp"
#include "registry/CppRestTransport.hpp"
#include "registry/RegistryClient.hpp"
#include "registry/RegistryEndpoint.hpp"
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
using test_utility::registry::tokenUrl;
using test_utility::transport::FakeTransport;
using test_utility::transport::makeResponse;

static const std::string versionUrl = baseUrl + "/v2/";
static const std::string manifestUrl = baseUrl + "/v2/library/alpine/manifests/latest";
static const HeaderMap versionHeader = HeaderMap{{"Docker-Distribution-API-Version", "registry/2.0"}};

static const std::string manifest = R"({
   "schemaVersion": 2,
   "mediaType": "application/vnd.docker.distribution.manifest.v2+json",
   "config": {
      "mediaType": "application/vnd.docker.container.image.v1+json",
      "size": 1472,
      "digest": "sha256:c1aabb73d2339c5ebaa3681de2e9d9c18d57485045a4e311d9f8004bec208d67"
   },
   "layers": [
      {
         "mediaType": "application/vnd.docker.image.rootfs.diff.tar.gzip",
         "size": 3397879,
         "digest": "sha256:7264a8db6415046d36d16ba98b79778e18accee6ffa71850405994cffa9be7de"
      }
   ]
})";

TEST_GROUP(RegistryClientTestGroup) {
};

TEST(RegistryClientTestGroup, endpoint) {
    auto endpoint = RegistryEndpoint{"https://registry.example.com:5000/"};
    CHECK_EQUAL(endpoint.getBaseUrl(), std::string{"https://registry.example.com:5000"});
    CHECK_EQUAL(endpoint.getHost(), std::string{"registry.example.com:5000"});
    CHECK_EQUAL(endpoint.makeUrl("/v2/"), std::string{"https://registry.example.com:5000/v2/"});
    CHECK_THROWS(libskiff::Error, endpoint.makeUrl("v2/"));

    CHECK_EQUAL(RegistryEndpoint::fromServer("docker.io", true).getBaseUrl(),
                std::string{"https://registry-1.docker.io"});
    CHECK_EQUAL(RegistryEndpoint::fromServer("index.docker.io", true).getBaseUrl(),
                std::string{"https://registry-1.docker.io"});
    CHECK_EQUAL(RegistryEndpoint::fromServer("localhost:5000", false).getBaseUrl(),
                std::string{"http://localhost:5000"});

    CHECK_THROWS(libskiff::Error, RegistryEndpoint{"registry.example.com"});
    CHECK_THROWS(libskiff::Error, RegistryEndpoint{"ftp://registry.example.com"});
}

TEST(RegistryClientTestGroup, endpointFromConfig) {
    auto config = common::Config{};
    config.registry.serverAddress = "registry.example.com";
    config.registry.requestTimeout = std::chrono::seconds{5};
    config.registry.userAgent = "skiff-test";
    config.hostEnvironment = {{"https_proxy", "http://proxy.example.com:3128"}};

    auto endpoint = RegistryEndpoint::fromConfig(config);
    CHECK_EQUAL(endpoint.getBaseUrl(), std::string{"https://registry.example.com"});
    CHECK(endpoint.getPolicy().requestTimeout == std::chrono::seconds{5});
    CHECK_EQUAL(endpoint.getPolicy().userAgent, std::string{"skiff-test"});
    CHECK_EQUAL(endpoint.getPolicy().proxy, std::string{"http://proxy.example.com:3128"});

    // the configured proxy wins over the environment
    config.registry.proxy = "http://other.example.com:8080";
    CHECK_EQUAL(RegistryEndpoint::fromConfig(config).getPolicy().proxy, std::string{"http://other.example.com:8080"});

    config.registry.proxy.clear();
    config.registry.enforceSecureServer = false;
    endpoint = RegistryEndpoint::fromConfig(config);
    CHECK_EQUAL(endpoint.getBaseUrl(), std::string{"http://registry.example.com"});
    CHECK(endpoint.getPolicy().proxy.empty());
    CHECK_FALSE(endpoint.getPolicy().validateCertificates);
}

TEST(RegistryClientTestGroup, proxyFromEnvironment) {
    using Environment = std::unordered_map<std::string, std::string>;
    auto host = std::string{"registry.example.com"};

    CHECK(getProxyFromEnvironment(host, true, Environment{}).empty());
    CHECK_EQUAL(getProxyFromEnvironment(host, true, Environment{{"HTTPS_PROXY", "http://upper:1"}}),
                std::string{"http://upper:1"});
    CHECK_EQUAL(getProxyFromEnvironment(host, true, Environment{{"HTTPS_PROXY", "http://upper:1"},
                                                                {"https_proxy", "http://lower:1"}}),
                std::string{"http://lower:1"});
    CHECK_EQUAL(getProxyFromEnvironment(host, true, Environment{{"ALL_PROXY", "socks5://all:1"},
                                                                {"https_proxy", "http://lower:1"}}),
                std::string{"socks5://all:1"});

    // http_proxy only applies to insecure servers, and only in lower case
    CHECK(getProxyFromEnvironment(host, true, Environment{{"http_proxy", "http://plain:1"}}).empty());
    CHECK_EQUAL(getProxyFromEnvironment(host, false, Environment{{"http_proxy", "http://plain:1"}}),
                std::string{"http://plain:1"});
    CHECK(getProxyFromEnvironment(host, false, Environment{{"HTTP_PROXY", "http://plain:1"}}).empty());

    // no_proxy
    auto proxied = Environment{{"https_proxy", "http://lower:1"}};
    for(const auto& noProxy : {"registry.example.com", "example.com", ".example.com", "other.org, example.com", "*"}) {
        auto environment = proxied;
        environment["no_proxy"] = noProxy;
        CHECK(getProxyFromEnvironment(host, true, environment).empty());
    }
    proxied["NO_PROXY"] = "ample.com,other.org";
    CHECK_EQUAL(getProxyFromEnvironment(host, true, proxied), std::string{"http://lower:1"});
}

TEST(RegistryClientTestGroup, isV2Supported) {
    auto check = [](const test_utility::transport::FakeResponse& response) {
        auto transport = std::make_shared<FakeTransport>();
        transport->addResponse("GET", versionUrl, response);
        return makeClient(transport).isV2Supported().get();
    };

    CHECK(check(makeResponse(200, "{}", versionHeader)));
    // registries requiring authentication answer the version check with 401
    auto unauthorized = versionHeader;
    unauthorized["WWW-Authenticate"] = R"(Bearer realm="https://auth.example.com/token",service="registry.example.com")";
    CHECK(check(makeResponse(401, "", unauthorized)));

    CHECK_FALSE(check(makeResponse(200, "<html/>")));
    CHECK_FALSE(check(makeResponse(404)));
    CHECK_FALSE(check(makeResponse(400)));

    auto transport = std::make_shared<FakeTransport>();
    auto unreachable = makeClient(transport).isV2Supported();
    CHECK(getErrorKind([&]() { unreachable.get(); }) == ErrorKind::TransportError);
}

TEST(RegistryClientTestGroup, bearerFlowRequestsOneToken) {
    auto transport = std::make_shared<FakeTransport>();
    auto challenge = test_utility::registry::makeBearerChallenge("repository:library/alpine:pull");
    auto manifestHeaders = HeaderMap{{"Content-Type", "application/vnd.docker.distribution.manifest.v2+json"}};
    const size_t numberOfRequests = 4;
    for(size_t i=0; i<numberOfRequests; ++i) {
        transport->addResponse("GET", manifestUrl, makeResponse(401, "", challenge));
    }
    transport->addResponse("GET", manifestUrl, makeResponse(200, manifest, manifestHeaders));
    auto token = makeResponse(200, R"({"token": "t0k3n", "expires_in": 300})");
    token.delay = std::chrono::milliseconds{200};
    transport->addResponse("GET", tokenUrl, token);
    auto client = makeClient(transport);

    auto tasks = std::vector<pplx::task<ManifestDescriptor>>{};
    for(size_t i=0; i<numberOfRequests; ++i) {
        tasks.push_back(client.getManifest("library/alpine", Reference::parse("latest")));
    }
    for(auto& task : tasks) {
        CHECK(task.get().getDigest() == sha256(manifest));
    }

    CHECK_EQUAL(transport->countRequestsWithPrefix(tokenUrl), size_t{1});
    CHECK_EQUAL(client.getNegotiator()->getNumberOfTokenRequests(), size_t{1});
    CHECK_EQUAL(transport->countRequests("GET", manifestUrl), 2 * numberOfRequests);

    // the token is reused by later requests of the same scope
    CHECK(client.getManifest("library/alpine", Reference::parse("latest")).get().getDigest() == sha256(manifest));
    CHECK_EQUAL(transport->countRequestsWithPrefix(tokenUrl), size_t{1});
}

TEST(RegistryClientTestGroup, bearerTokenRejected) {
    auto transport = std::make_shared<FakeTransport>();
    transport->addResponse("GET", manifestUrl,
        makeResponse(401, "", test_utility::registry::makeBearerChallenge("repository:library/alpine:pull")));
    transport->addResponse("GET", tokenUrl, makeResponse(200, R"({"token": "t0k3n"})"));
    auto client = makeClient(transport);

    auto task = client.getManifest("library/alpine", Reference::parse("latest"));
    CHECK(getErrorKind([&]() { task.get(); }) == ErrorKind::AuthenticationFailed);
    CHECK_EQUAL(transport->countRequests("GET", manifestUrl), size_t{2});
    CHECK_EQUAL(transport->countRequestsWithPrefix(tokenUrl), size_t{1});
}

TEST(RegistryClientTestGroup, login) {
    auto basicChallenge = HeaderMap{{"WWW-Authenticate", R"(Basic realm="Registry Realm")"}};

    // accepted
    {
        auto transport = std::make_shared<FakeTransport>();
        transport->addResponse("GET", versionUrl, makeResponse(401, "", basicChallenge));
        transport->addResponse("GET", versionUrl, makeResponse(200, "{}", versionHeader));
        auto client = makeClient(transport);

        client.login(BasicCredential{"user", "pass"}).get();
        auto requests = transport->getRequests();
        CHECK_EQUAL(requests.size(), size_t{2});
        CHECK_EQUAL(requests[1].headers["Authorization"], std::string{"Basic dXNlcjpwYXNz"});
        CHECK(client.getNegotiator()->getStaticCredential());
    }
    // rejected
    {
        auto transport = std::make_shared<FakeTransport>();
        transport->addResponse("GET", versionUrl, makeResponse(401, "", basicChallenge));
        auto client = makeClient(transport);

        auto task = client.login(BasicCredential{"user", "wrong"});
        CHECK(getErrorKind([&]() { task.get(); }) == ErrorKind::AuthenticationFailed);
    }
    // static credentials are used to request tokens
    {
        auto transport = std::make_shared<FakeTransport>();
        transport->addResponse("GET", versionUrl, makeResponse(401, "",
            HeaderMap{{"WWW-Authenticate", R"(Bearer realm="https://auth.example.com/token",service="registry.example.com")"}}));
        transport->addResponse("GET", versionUrl, makeResponse(200, "{}", versionHeader));
        transport->addResponse("GET", tokenUrl, makeResponse(200, R"({"token": "t0k3n"})"));
        auto client = makeClient(transport);

        client.login(BasicCredential{"user", "pass"}).get();
        auto requests = transport->getRequests();
        CHECK_EQUAL(requests.size(), size_t{3});
        CHECK_EQUAL(requests[1].headers["Authorization"], std::string{"Basic dXNlcjpwYXNz"});
        CHECK_EQUAL(requests[2].headers["Authorization"], std::string{"Bearer t0k3n"});
    }
}

TEST(RegistryClientTestGroup, anonymousBasicChallenge) {
    auto transport = std::make_shared<FakeTransport>();
    transport->addResponse("GET", manifestUrl,
        makeResponse(401, "", HeaderMap{{"WWW-Authenticate", R"(Basic realm="Registry Realm")"}}));
    auto client = makeClient(transport);

    auto task = client.getManifest("library/alpine", Reference::parse("latest"));
    CHECK(getErrorKind([&]() { task.get(); }) == ErrorKind::AuthenticationFailed);
}

TEST(RegistryClientTestGroup, redirects) {
    CHECK(isRedirectStatus(307));
    CHECK(isRedirectStatus(302));
    CHECK_FALSE(isRedirectStatus(304));
    CHECK_FALSE(isRedirectStatus(200));

    auto current = std::string{"https://registry.example.com:5000/v2/library/alpine/blobs/sha256:abc"};
    CHECK_EQUAL(resolveRedirectLocation(current, "https://storage.example.com/blob?sig=x"),
                std::string{"https://storage.example.com/blob?sig=x"});
    CHECK_EQUAL(resolveRedirectLocation(current, "/storage/blob"),
                std::string{"https://registry.example.com:5000/storage/blob"});
    CHECK_EQUAL(resolveRedirectLocation(current, "other"),
                std::string{"https://registry.example.com:5000/v2/library/alpine/blobs/other"});
}

}}}

SKIFF_UNITTEST_MAIN_FUNCTION();
