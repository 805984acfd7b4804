/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_registry_AuthNegotiator_hpp
#define skiff_registry_AuthNegotiator_hpp

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <boost/format.hpp>
#include <boost/optional.hpp>
#include <pplx/pplxtasks.h>

#include "libskiff/LogLevel.hpp"
#include "registry/AuthChallenge.hpp"
#include "registry/Credential.hpp"
#include "registry/HttpTransport.hpp"
#include "registry/RegistryEndpoint.hpp"


namespace skiff {
namespace registry {

struct ScopeKey {
    std::string realm;
    std::string service;
    std::string scope;
};

bool operator<(const ScopeKey&, const ScopeKey&);
bool operator==(const ScopeKey&, const ScopeKey&);

/**
 * Turns authentication challenges into credentials and caches them.
 *
 * One credential is cached per (realm, service, scope) key. At most one token
 * acquisition is in flight per key: concurrent negotiations for the same key
 * share the task of the first one. The negotiator must be owned by a
 * std::shared_ptr, because pending acquisitions keep it alive.
 */
class AuthNegotiator : public std::enable_shared_from_this<AuthNegotiator> {
public:
    enum class State { Unauthenticated, Negotiating, Authenticated };

public:
    AuthNegotiator(std::shared_ptr<HttpTransport> transport, const TransportPolicy& policy);

    void setStaticCredential(const boost::optional<BasicCredential>& credential);
    boost::optional<BasicCredential> getStaticCredential() const;

    // Credential to attach up front to a request with the given scope
    Credential getCredential(const std::string& requestScope) const;

    /**
     * Handles a 401 response carrying a challenge. "rejected" is the credential
     * the rejected request carried. If the cache already holds a different, valid
     * credential for the challenge's key, that one is returned without network
     * round trip.
     *
     * Throws RegistryError(AuthenticationFailed) synchronously for a Basic
     * challenge that cannot be answered; token acquisition failures are
     * reported through the returned task.
     */
    pplx::task<Credential> negotiate(const std::string& requestScope,
                                     const AuthChallenge& challenge,
                                     const Credential& rejected);

    // Forgets the credential cached for the request scope if it is the rejected one
    void invalidate(const std::string& requestScope, const Credential& rejected);

    State getState(const ScopeKey& key) const;
    size_t getNumberOfCachedCredentials() const;
    // Total token requests sent to auth servers
    size_t getNumberOfTokenRequests() const { return numberOfTokenRequests; }

private:
    struct CacheEntry {
        Credential credential;
        boost::optional<pplx::task<Credential>> inFlight;
        // Incremented at each acquisition, so that a stale acquisition cannot overwrite a newer one
        size_t generation = 0;
    };

    static ScopeKey makeKey(const AuthChallenge& challenge);
    std::string makeTokenUrl(const AuthChallenge& challenge) const;
    void startTokenAcquisition(const ScopeKey& key, size_t generation, const std::string& tokenUrl,
                               const boost::optional<BasicCredential>& tokenCredential,
                               pplx::task_completion_event<Credential> completion);
    pplx::task<Credential> requestToken(const ScopeKey& key, const std::string& tokenUrl,
                                        const boost::optional<BasicCredential>& tokenCredential) const;
    Credential parseTokenResponse(const ScopeKey& key, const std::string& body) const;
    void printLog(const boost::format& message, libskiff::LogLevel level) const;

private:
    std::shared_ptr<HttpTransport> transport;
    TransportPolicy policy;

    mutable std::mutex mutex;
    boost::optional<BasicCredential> staticCredential;
    std::map<ScopeKey, CacheEntry> cache;
    std::unordered_map<std::string, ScopeKey> scopeIndex;
    mutable std::atomic<size_t> numberOfTokenRequests{0};
};

}
}

#endif
