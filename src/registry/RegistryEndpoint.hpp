/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_registry_RegistryEndpoint_hpp
#define skiff_registry_RegistryEndpoint_hpp

#include <chrono>
#include <string>
#include <unordered_map>

#include "common/Config.hpp"


namespace skiff {
namespace registry {

struct TransportPolicy {
    bool validateCertificates = true;
    std::chrono::milliseconds requestTimeout{std::chrono::seconds{60}};
    std::chrono::milliseconds tokenTimeout{std::chrono::seconds{30}};
    unsigned int maxRedirects = 10;
    size_t chunkSize = 64 * 1024;
    std::string userAgent = "skiff";
    // Empty means no proxy
    std::string proxy;
};

/**
 * Base URL of a registry plus the policy used to talk to it.
 * Immutable once constructed.
 */
class RegistryEndpoint {
public:
    RegistryEndpoint(const std::string& baseUrl, const TransportPolicy& policy = TransportPolicy{});

    // "host[:port]" to "https://host[:port]" (or "http://" when secure is false).
    // Docker Hub aliases map to the Docker Hub API host.
    static RegistryEndpoint fromServer(const std::string& server, bool secure,
                                       const TransportPolicy& policy = TransportPolicy{});
    static RegistryEndpoint fromConfig(const common::Config& config);

    const std::string& getBaseUrl() const { return baseUrl; }
    const std::string& getHost() const { return host; }
    const TransportPolicy& getPolicy() const { return policy; }

    // pathAndQuery must start with '/'
    std::string makeUrl(const std::string& pathAndQuery) const;

private:
    std::string baseUrl;
    std::string host;
    TransportPolicy policy;
};

/**
 * Proxy to use for a registry host given the host environment, or an empty string.
 * Lower case variables take precedence; https variables are only considered for
 * secure servers, http_proxy only for insecure ones.
 */
std::string getProxyFromEnvironment(const std::string& host, bool secure,
                                    const std::unordered_map<std::string, std::string>& environment);

}
}

#endif
