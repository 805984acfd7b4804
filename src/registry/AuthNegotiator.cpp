/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "registry/AuthNegotiator.hpp"

#include <exception>
#include <tuple>

#include <cpprest/uri_builder.h>

#include "libskiff/Logger.hpp"
#include "libskiff/utility/json.hpp"
#include "libskiff/utility/string.hpp"
#include "registry/RegistryError.hpp"


namespace skiff {
namespace registry {

static const size_t maxTokenResponseSize = 1024 * 1024;
static const int defaultTokenLifetimeSeconds = 60;

bool operator<(const ScopeKey& lhs, const ScopeKey& rhs) {
    return std::tie(lhs.realm, lhs.service, lhs.scope) < std::tie(rhs.realm, rhs.service, rhs.scope);
}

bool operator==(const ScopeKey& lhs, const ScopeKey& rhs) {
    return lhs.realm == rhs.realm && lhs.service == rhs.service && lhs.scope == rhs.scope;
}

AuthNegotiator::AuthNegotiator(std::shared_ptr<HttpTransport> transport, const TransportPolicy& policy)
    : transport{std::move(transport)}
    , policy{policy}
{}

void AuthNegotiator::setStaticCredential(const boost::optional<BasicCredential>& credential) {
    std::lock_guard<std::mutex> lock{mutex};
    staticCredential = credential;
}

boost::optional<BasicCredential> AuthNegotiator::getStaticCredential() const {
    std::lock_guard<std::mutex> lock{mutex};
    return staticCredential;
}

Credential AuthNegotiator::getCredential(const std::string& requestScope) const {
    std::lock_guard<std::mutex> lock{mutex};

    auto key = scopeIndex.find(requestScope);
    if(key == scopeIndex.cend()) {
        return NoCredential{};
    }
    auto entry = cache.find(key->second);
    if(entry == cache.cend() || isExpired(entry->second.credential)) {
        return NoCredential{};
    }
    return entry->second.credential;
}

pplx::task<Credential> AuthNegotiator::negotiate(const std::string& requestScope,
                                                 const AuthChallenge& challenge,
                                                 const Credential& rejected) {
    auto key = makeKey(challenge);

    // build the URL before touching the cache, a malformed realm must not leave an entry behind
    auto tokenUrl = std::string{};
    if(challenge.scheme == AuthChallenge::Scheme::Bearer) {
        tokenUrl = makeTokenUrl(challenge);
    }

    auto completion = pplx::task_completion_event<Credential>{};
    auto tokenCredential = boost::optional<BasicCredential>{};
    size_t generation = 0;
    {
        std::lock_guard<std::mutex> lock{mutex};
        scopeIndex[requestScope] = key;
        auto& entry = cache[key];

        if(entry.inFlight) {
            printLog(boost::format("Joining in-flight token acquisition for scope '%s'") % key.scope,
                     libskiff::LogLevel::DEBUG);
            return *entry.inFlight;
        }

        auto hasCredential = entry.credential.which() != 0;
        if(hasCredential && !isExpired(entry.credential) && !(entry.credential == rejected)) {
            printLog(boost::format("Reusing credential %s refreshed by a concurrent request for scope '%s'")
                        % describe(entry.credential) % requestScope,
                     libskiff::LogLevel::DEBUG);
            return pplx::task_from_result(entry.credential);
        }

        if(challenge.scheme == AuthChallenge::Scheme::Basic) {
            auto context = ErrorContext{};
            context.httpStatus = 401;
            if(!staticCredential) {
                auto message = boost::format("Registry requested Basic authentication (realm \"%s\")"
                                             " but no username/password was provided") % challenge.realm;
                SKIFF_THROW_REGISTRY_ERROR(ErrorKind::AuthenticationFailed, context, message.str());
            }
            if(Credential{*staticCredential} == rejected) {
                auto message = boost::format("Registry rejected the Basic credentials of user '%s'")
                    % staticCredential->username;
                SKIFF_THROW_REGISTRY_ERROR(ErrorKind::AuthenticationFailed, context, message.str());
            }
            entry.credential = *staticCredential;
            return pplx::task_from_result(entry.credential);
        }

        generation = ++entry.generation;
        entry.credential = NoCredential{};
        entry.inFlight = pplx::create_task(completion);
        tokenCredential = staticCredential;
    }

    // started outside the lock: the transport may complete inline
    startTokenAcquisition(key, generation, tokenUrl, tokenCredential, completion);

    std::lock_guard<std::mutex> lock{mutex};
    auto& entry = cache[key];
    if(entry.inFlight && entry.generation == generation) {
        return *entry.inFlight;
    }
    return pplx::create_task(completion);
}

void AuthNegotiator::invalidate(const std::string& requestScope, const Credential& rejected) {
    std::lock_guard<std::mutex> lock{mutex};

    auto key = scopeIndex.find(requestScope);
    if(key == scopeIndex.cend()) {
        return;
    }
    auto entry = cache.find(key->second);
    if(entry != cache.end() && entry->second.credential == rejected) {
        printLog(boost::format("Invalidating credential %s for scope '%s'")
                    % describe(rejected) % requestScope,
                 libskiff::LogLevel::DEBUG);
        entry->second.credential = NoCredential{};
    }
}

AuthNegotiator::State AuthNegotiator::getState(const ScopeKey& key) const {
    std::lock_guard<std::mutex> lock{mutex};

    auto entry = cache.find(key);
    if(entry == cache.cend()) {
        return State::Unauthenticated;
    }
    if(entry->second.inFlight) {
        return State::Negotiating;
    }
    if(entry->second.credential.which() != 0 && !isExpired(entry->second.credential)) {
        return State::Authenticated;
    }
    return State::Unauthenticated;
}

size_t AuthNegotiator::getNumberOfCachedCredentials() const {
    std::lock_guard<std::mutex> lock{mutex};

    size_t count = 0;
    for(const auto& entry : cache) {
        if(entry.second.credential.which() != 0) {
            ++count;
        }
    }
    return count;
}

ScopeKey AuthNegotiator::makeKey(const AuthChallenge& challenge) {
    if(challenge.scheme == AuthChallenge::Scheme::Basic) {
        return ScopeKey{challenge.realm, std::string{}, std::string{}};
    }
    return ScopeKey{challenge.realm, challenge.service, challenge.scope};
}

std::string AuthNegotiator::makeTokenUrl(const AuthChallenge& challenge) const {
    try {
        auto builder = web::uri_builder{web::uri{utility::conversions::to_string_t(challenge.realm)}};
        if(!challenge.service.empty()) {
            builder.append_query(U("service"), utility::conversions::to_string_t(challenge.service));
        }
        if(!challenge.scope.empty()) {
            builder.append_query(U("scope"), utility::conversions::to_string_t(challenge.scope));
        }
        return utility::conversions::to_utf8string(builder.to_string());
    }
    catch(const std::exception& e) {
        auto message = boost::format("Malformed realm '%s' in authentication challenge: %s")
            % challenge.realm % e.what();
        auto context = ErrorContext{};
        context.responseBody = challenge.realm;
        SKIFF_THROW_REGISTRY_ERROR(ErrorKind::MalformedChallenge, context, message.str());
    }
}

void AuthNegotiator::startTokenAcquisition(const ScopeKey& key, size_t generation, const std::string& tokenUrl,
                                           const boost::optional<BasicCredential>& tokenCredential,
                                           pplx::task_completion_event<Credential> completion) {
    auto self = shared_from_this();

    auto onCompletion = [self, key, generation, completion](pplx::task<Credential> acquisition) {
        try {
            auto credential = acquisition.get();
            {
                std::lock_guard<std::mutex> lock{self->mutex};
                auto& entry = self->cache[key];
                if(entry.generation == generation) {
                    entry.credential = credential;
                    entry.inFlight = boost::none;
                }
            }
            completion.set(credential);
        }
        catch(const std::exception&) {
            {
                std::lock_guard<std::mutex> lock{self->mutex};
                auto& entry = self->cache[key];
                if(entry.generation == generation) {
                    entry.inFlight = boost::none;
                }
            }
            // every waiter of the shared task observes the failure
            completion.set_exception(std::current_exception());
        }
    };

    try {
        requestToken(key, tokenUrl, tokenCredential).then(onCompletion);
    }
    catch(const std::exception&) {
        onCompletion(pplx::task_from_exception<Credential>(std::current_exception()));
    }
}

pplx::task<Credential> AuthNegotiator::requestToken(const ScopeKey& key, const std::string& tokenUrl,
                                                    const boost::optional<BasicCredential>& tokenCredential) const {
    auto request = HttpRequest{};
    request.method = "GET";
    request.url = tokenUrl;
    request.timeout = policy.tokenTimeout;
    request.headers["User-Agent"] = policy.userAgent;
    if(tokenCredential) {
        request.headers["Authorization"] = *makeAuthorizationHeader(*tokenCredential);
    }

    ++numberOfTokenRequests;
    printLog(boost::format("Requesting token: realm=%s, service=%s, scope=%s, credentials=%s")
                % key.realm % key.service % key.scope
                % (tokenCredential ? describe(*tokenCredential) : std::string{"anonymous"}),
             libskiff::LogLevel::DEBUG);

    auto self = shared_from_this();
    auto context = ErrorContext{};
    context.reference = key.scope;

    return transport->perform(request).then([self, key, context](pplx::task<HttpResponse> responseTask) {
        auto response = HttpResponse{};
        try {
            response = responseTask.get();
        }
        catch(const std::exception& e) {
            auto message = boost::format("Failed to reach authentication server %s: %s") % key.realm % e.what();
            SKIFF_THROW_REGISTRY_ERROR(ErrorKind::AuthServerError, context, message.str());
        }

        auto status = response.status;
        return readBody(response.body, maxTokenResponseSize).then([self, key, context, status](pplx::task<std::string> bodyTask) {
            auto body = std::string{};
            auto errorContext = context;
            errorContext.httpStatus = status;
            try {
                body = bodyTask.get();
            }
            catch(const std::exception& e) {
                auto message = boost::format("Failed to read response of authentication server %s: %s")
                    % key.realm % e.what();
                SKIFF_THROW_REGISTRY_ERROR(ErrorKind::AuthServerError, errorContext, message.str());
            }
            errorContext.responseBody = body;

            if(status == 401 || status == 403) {
                auto message = boost::format("Authentication server %s refused the token request (HTTP %d)")
                    % key.realm % status;
                SKIFF_THROW_REGISTRY_ERROR(ErrorKind::AuthenticationFailed, errorContext, message.str());
            }
            if(status < 200 || status >= 300) {
                auto message = boost::format("Authentication server %s replied to token request with HTTP %d")
                    % key.realm % status;
                SKIFF_THROW_REGISTRY_ERROR(ErrorKind::AuthServerError, errorContext, message.str());
            }

            return self->parseTokenResponse(key, body);
        });
    });
}

Credential AuthNegotiator::parseTokenResponse(const ScopeKey& key, const std::string& body) const {
    auto context = ErrorContext{};
    context.reference = key.scope;
    context.responseBody = body;

    auto json = rapidjson::Document{};
    try {
        json = libskiff::json::parse(body);
    }
    catch(const std::exception& e) {
        auto message = boost::format("Authentication server %s returned an invalid token response: %s")
            % key.realm % e.what();
        SKIFF_THROW_REGISTRY_ERROR(ErrorKind::AuthServerError, context, message.str());
    }

    auto token = libskiff::json::getStringMember(json, "token");
    if(token.empty()) {
        token = libskiff::json::getStringMember(json, "access_token");
    }
    if(token.empty()) {
        auto message = boost::format("Authentication server %s returned no token") % key.realm;
        SKIFF_THROW_REGISTRY_ERROR(ErrorKind::AuthServerError, context, message.str());
    }

    auto lifetime = defaultTokenLifetimeSeconds;
    if(json.IsObject() && json.HasMember("expires_in") && json["expires_in"].IsInt() && json["expires_in"].GetInt() > 0) {
        lifetime = json["expires_in"].GetInt();
    }

    printLog(boost::format("Obtained token %s for scope '%s', expires in %ds")
                % libskiff::string::maskSecret(token) % key.scope % lifetime,
             libskiff::LogLevel::DEBUG);

    return BearerCredential{token, std::chrono::steady_clock::now() + std::chrono::seconds{lifetime}};
}

void AuthNegotiator::printLog(const boost::format& message, libskiff::LogLevel level) const {
    libskiff::Logger::getInstance().log(message, "AuthNegotiator", level);
}

}
}
