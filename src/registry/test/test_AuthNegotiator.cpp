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
#include <thread>
#include <vector>

#include <boost/algorithm/string.hpp>

#include "registry/AuthNegotiator.hpp"
#include "registry/RequestPipeline.hpp"
#include "test_utility/FakeTransport.hpp"
#include "test_utility/registry.hpp"
#include "libskiff/test/aux/unitTestMain.hpp"

namespace skiff {
namespace registry {
namespace test {

using test_utility::registry::baseUrl;
using test_utility::registry::getErrorKind;
using test_utility::registry::tokenUrl;
using test_utility::transport::FakeResponse;
using test_utility::transport::FakeTransport;
using test_utility::transport::makeResponse;

static const std::string scope = "repository:library/alpine:pull";

static AuthChallenge makeBearerChallenge() {
    return AuthChallenge::parse(test_utility::registry::makeBearerChallenge(scope)["WWW-Authenticate"]);
}

static ScopeKey makeKey() {
    return ScopeKey{tokenUrl, "registry.example.com", scope};
}

static std::string getToken(const Credential& credential) {
    const auto* bearer = boost::get<BearerCredential>(&credential);
    return bearer ? bearer->token : std::string{};
}

TEST_GROUP(AuthNegotiatorTestGroup) {
};

TEST(AuthNegotiatorTestGroup, acquiresBearerToken) {
    auto transport = std::make_shared<FakeTransport>();
    transport->addResponse("GET", tokenUrl, makeResponse(200, R"({"token": "t0k3n", "expires_in": 300})"));
    auto negotiator = std::make_shared<AuthNegotiator>(transport, TransportPolicy{});

    CHECK(negotiator->getState(makeKey()) == AuthNegotiator::State::Unauthenticated);
    CHECK(negotiator->getCredential(scope).which() == 0);

    auto credential = negotiator->negotiate(scope, makeBearerChallenge(), NoCredential{}).get();
    CHECK_EQUAL(getToken(credential), std::string{"t0k3n"});
    CHECK(negotiator->getState(makeKey()) == AuthNegotiator::State::Authenticated);
    CHECK(negotiator->getCredential(scope) == credential);
    CHECK_EQUAL(negotiator->getNumberOfCachedCredentials(), size_t{1});
    CHECK_EQUAL(negotiator->getNumberOfTokenRequests(), size_t{1});

    // anonymous request with service and scope as query parameters
    auto requests = transport->getRequests();
    CHECK_EQUAL(requests.size(), size_t{1});
    CHECK(boost::starts_with(requests[0].url, tokenUrl + "?"));
    CHECK(requests[0].url.find("service=registry.example.com") != std::string::npos);
    CHECK(requests[0].url.find("scope=repository") != std::string::npos);
    CHECK(requests[0].headers.find("Authorization") == requests[0].headers.cend());
}

TEST(AuthNegotiatorTestGroup, timeouts) {
    auto policy = TransportPolicy{};
    policy.requestTimeout = std::chrono::milliseconds{4000};
    policy.tokenTimeout = std::chrono::milliseconds{1500};

    auto manifestUrl = baseUrl + "/v2/library/alpine/manifests/latest";
    auto transport = std::make_shared<FakeTransport>();
    transport->addResponse("GET", manifestUrl,
        makeResponse(401, "", test_utility::registry::makeBearerChallenge(scope)));
    transport->addResponse("GET", manifestUrl, makeResponse(200, "{}"));
    transport->addResponse("GET", tokenUrl, makeResponse(200, R"({"token": "t0k3n"})"));

    auto endpoint = RegistryEndpoint{baseUrl, policy};
    auto negotiator = std::make_shared<AuthNegotiator>(transport, endpoint.getPolicy());
    auto pipeline = std::make_shared<RequestPipeline>(endpoint, transport, negotiator);
    CHECK_EQUAL(pipeline->execute(RegistryRequest::makeManifestGet("library/alpine", "latest")).get().status, 200);

    auto requests = transport->getRequests();
    CHECK_EQUAL(requests.size(), size_t{3});
    CHECK_EQUAL(requests[0].url, manifestUrl);
    CHECK(requests[0].timeout == std::chrono::milliseconds{4000});
    CHECK(boost::starts_with(requests[1].url, tokenUrl + "?"));
    CHECK(requests[1].timeout == std::chrono::milliseconds{1500});
    CHECK_EQUAL(requests[2].url, manifestUrl);
    CHECK(requests[2].timeout == std::chrono::milliseconds{4000});
}

TEST(AuthNegotiatorTestGroup, tokenRequestCarriesStaticCredential) {
    auto transport = std::make_shared<FakeTransport>();
    transport->addResponse("GET", tokenUrl, makeResponse(200, R"({"access_token": "t0k3n"})"));
    auto negotiator = std::make_shared<AuthNegotiator>(transport, TransportPolicy{});
    negotiator->setStaticCredential(BasicCredential{"user", "pass"});

    auto credential = negotiator->negotiate(scope, makeBearerChallenge(), NoCredential{}).get();
    CHECK_EQUAL(getToken(credential), std::string{"t0k3n"});

    auto requests = transport->getRequests();
    CHECK_EQUAL(requests[0].headers["Authorization"], std::string{"Basic dXNlcjpwYXNz"});
}

TEST(AuthNegotiatorTestGroup, concurrentNegotiationsShareOneTokenRequest) {
    auto transport = std::make_shared<FakeTransport>();
    auto response = makeResponse(200, R"({"token": "shared"})");
    response.delay = std::chrono::milliseconds{200};
    transport->addResponse("GET", tokenUrl, response);
    auto negotiator = std::make_shared<AuthNegotiator>(transport, TransportPolicy{});

    const size_t numberOfRequests = 8;
    auto tokens = std::vector<std::string>(numberOfRequests);
    auto threads = std::vector<std::thread>{};
    for(size_t i=0; i<numberOfRequests; ++i) {
        threads.emplace_back([&negotiator, &tokens, i]() {
            auto credential = negotiator->negotiate(scope, makeBearerChallenge(), NoCredential{}).get();
            tokens[i] = getToken(credential);
        });
    }
    for(auto& thread : threads) {
        thread.join();
    }

    CHECK_EQUAL(transport->countRequestsWithPrefix(tokenUrl), size_t{1});
    CHECK_EQUAL(negotiator->getNumberOfTokenRequests(), size_t{1});
    for(const auto& token : tokens) {
        CHECK_EQUAL(token, std::string{"shared"});
    }
}

TEST(AuthNegotiatorTestGroup, negotiationInFlight) {
    auto transport = std::make_shared<FakeTransport>();
    auto response = makeResponse(200, R"({"token": "slow"})");
    response.delay = std::chrono::milliseconds{200};
    transport->addResponse("GET", tokenUrl, response);
    auto negotiator = std::make_shared<AuthNegotiator>(transport, TransportPolicy{});

    auto first = negotiator->negotiate(scope, makeBearerChallenge(), NoCredential{});
    CHECK(negotiator->getState(makeKey()) == AuthNegotiator::State::Negotiating);
    auto second = negotiator->negotiate(scope, makeBearerChallenge(), NoCredential{});

    CHECK_EQUAL(getToken(first.get()), std::string{"slow"});
    CHECK_EQUAL(getToken(second.get()), std::string{"slow"});
    CHECK_EQUAL(negotiator->getNumberOfTokenRequests(), size_t{1});
}

TEST(AuthNegotiatorTestGroup, reusesCredentialRefreshedByOtherRequest) {
    auto transport = std::make_shared<FakeTransport>();
    transport->addResponse("GET", tokenUrl, makeResponse(200, R"({"token": "first"})"));
    transport->addResponse("GET", tokenUrl, makeResponse(200, R"({"token": "second"})"));
    auto negotiator = std::make_shared<AuthNegotiator>(transport, TransportPolicy{});

    auto first = negotiator->negotiate(scope, makeBearerChallenge(), NoCredential{}).get();

    // a request that was sent anonymously before the token arrived gets the cached token
    auto cached = negotiator->negotiate(scope, makeBearerChallenge(), NoCredential{}).get();
    CHECK(cached == first);
    CHECK_EQUAL(negotiator->getNumberOfTokenRequests(), size_t{1});

    // a request whose token was rejected triggers a new acquisition
    auto refreshed = negotiator->negotiate(scope, makeBearerChallenge(), first).get();
    CHECK_EQUAL(getToken(refreshed), std::string{"second"});
    CHECK_EQUAL(negotiator->getNumberOfTokenRequests(), size_t{2});
}

TEST(AuthNegotiatorTestGroup, invalidate) {
    auto transport = std::make_shared<FakeTransport>();
    transport->addResponse("GET", tokenUrl, makeResponse(200, R"({"token": "t0k3n"})"));
    auto negotiator = std::make_shared<AuthNegotiator>(transport, TransportPolicy{});

    auto credential = negotiator->negotiate(scope, makeBearerChallenge(), NoCredential{}).get();

    // a different credential does not evict the cached one
    negotiator->invalidate(scope, BearerCredential{"other", std::chrono::steady_clock::now()});
    CHECK(negotiator->getCredential(scope) == credential);

    negotiator->invalidate(scope, credential);
    CHECK(negotiator->getCredential(scope).which() == 0);
    CHECK(negotiator->getState(makeKey()) == AuthNegotiator::State::Unauthenticated);

    // unknown scopes are ignored
    negotiator->invalidate("repository:unknown:pull", credential);
}

TEST(AuthNegotiatorTestGroup, basicChallenge) {
    auto transport = std::make_shared<FakeTransport>();
    auto negotiator = std::make_shared<AuthNegotiator>(transport, TransportPolicy{});
    auto challenge = AuthChallenge::parse(R"(Basic realm="Registry Realm")");

    // no credentials to answer with
    CHECK(getErrorKind([&]() { negotiator->negotiate(scope, challenge, NoCredential{}); })
          == ErrorKind::AuthenticationFailed);

    negotiator->setStaticCredential(BasicCredential{"user", "pass"});
    auto credential = negotiator->negotiate(scope, challenge, NoCredential{}).get();
    CHECK(credential == Credential{BasicCredential{"user", "pass"}});
    CHECK(negotiator->getCredential(scope) == credential);

    // the static credential was rejected
    CHECK(getErrorKind([&]() { negotiator->negotiate(scope, challenge, credential); })
          == ErrorKind::AuthenticationFailed);

    // no token server involved
    CHECK(transport->getRequests().empty());
}

TEST(AuthNegotiatorTestGroup, tokenServerFailures) {
    auto expectFailure = [](const FakeResponse& response, ErrorKind expected) {
        auto transport = std::make_shared<FakeTransport>();
        transport->addResponse("GET", tokenUrl, response);
        auto negotiator = std::make_shared<AuthNegotiator>(transport, TransportPolicy{});

        auto task = negotiator->negotiate(scope, makeBearerChallenge(), NoCredential{});
        CHECK(getErrorKind([&]() { task.get(); }) == expected);
        // nothing cached, nothing in flight
        CHECK(negotiator->getState(makeKey()) == AuthNegotiator::State::Unauthenticated);
        CHECK_EQUAL(negotiator->getNumberOfCachedCredentials(), size_t{0});
    };

    expectFailure(makeResponse(401, "unauthorized"), ErrorKind::AuthenticationFailed);
    expectFailure(makeResponse(403, "forbidden"), ErrorKind::AuthenticationFailed);
    expectFailure(makeResponse(500, "internal error"), ErrorKind::AuthServerError);
    expectFailure(makeResponse(200, "not json"), ErrorKind::AuthServerError);
    expectFailure(makeResponse(200, R"({"expires_in": 60})"), ErrorKind::AuthServerError);

    auto unreachable = FakeResponse{};
    unreachable.failConnection = true;
    expectFailure(unreachable, ErrorKind::AuthServerError);
}

TEST(AuthNegotiatorTestGroup, retryAfterFailedAcquisition) {
    auto transport = std::make_shared<FakeTransport>();
    transport->addResponse("GET", tokenUrl, makeResponse(503, "unavailable"));
    transport->addResponse("GET", tokenUrl, makeResponse(200, R"({"token": "t0k3n"})"));
    auto negotiator = std::make_shared<AuthNegotiator>(transport, TransportPolicy{});

    auto failed = negotiator->negotiate(scope, makeBearerChallenge(), NoCredential{});
    CHECK(getErrorKind([&]() { failed.get(); }) == ErrorKind::AuthServerError);

    auto credential = negotiator->negotiate(scope, makeBearerChallenge(), NoCredential{}).get();
    CHECK_EQUAL(getToken(credential), std::string{"t0k3n"});
    CHECK_EQUAL(negotiator->getNumberOfTokenRequests(), size_t{2});
}

TEST(AuthNegotiatorTestGroup, expiredTokenIsNotAttached) {
    auto transport = std::make_shared<FakeTransport>();
    transport->addResponse("GET", tokenUrl, makeResponse(200, R"({"token": "t0k3n", "expires_in": 1})"));
    auto negotiator = std::make_shared<AuthNegotiator>(transport, TransportPolicy{});

    negotiator->negotiate(scope, makeBearerChallenge(), NoCredential{}).get();
    CHECK(negotiator->getCredential(scope).which() != 0);

    std::this_thread::sleep_for(std::chrono::milliseconds{1100});
    CHECK(negotiator->getCredential(scope).which() == 0);
    CHECK(negotiator->getState(makeKey()) == AuthNegotiator::State::Unauthenticated);
}

}}}

SKIFF_UNITTEST_MAIN_FUNCTION();
