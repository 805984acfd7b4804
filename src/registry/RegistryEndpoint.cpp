/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "registry/RegistryEndpoint.hpp"

#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>
#include <boost/regex.hpp>

#include "libskiff/Error.hpp"
#include "libskiff/utility/environment.hpp"
#include "libskiff/utility/logging.hpp"
#include "common/regex.hpp"


namespace skiff {
namespace registry {

RegistryEndpoint::RegistryEndpoint(const std::string& baseUrl, const TransportPolicy& policy)
    : baseUrl{boost::algorithm::trim_right_copy_if(baseUrl, boost::is_any_of("/"))}
    , policy{policy}
{
    boost::smatch matches;
    if(!boost::regex_match(this->baseUrl, matches, common::regex::registryUrl)) {
        auto message = boost::format("Invalid registry base URL '%s': expected http(s)://host[:port]") % baseUrl;
        SKIFF_THROW_ERROR(message.str());
    }
    host = matches[2].str();
}

RegistryEndpoint RegistryEndpoint::fromServer(const std::string& server, bool secure, const TransportPolicy& policy) {
    auto apiHost = server;
    if(server == "docker.io" || server == "index.docker.io") {
        apiHost = "registry-1.docker.io";
    }
    auto scheme = secure ? "https://" : "http://";
    return RegistryEndpoint{scheme + apiHost, policy};
}

RegistryEndpoint RegistryEndpoint::fromConfig(const common::Config& config) {
    const auto& settings = config.registry;

    auto policy = TransportPolicy{};
    policy.validateCertificates = settings.enforceSecureServer;
    policy.requestTimeout = settings.requestTimeout;
    policy.tokenTimeout = settings.tokenTimeout;
    policy.maxRedirects = settings.maxRedirects;
    policy.chunkSize = settings.chunkSize;
    policy.userAgent = settings.userAgent;
    policy.proxy = settings.proxy;

    if(policy.proxy.empty()) {
        policy.proxy = getProxyFromEnvironment(settings.serverAddress, settings.enforceSecureServer,
                                               config.hostEnvironment);
    }
    if(!policy.proxy.empty()) {
        libskiff::logMessage(boost::format("Using proxy %s for registry %s") % policy.proxy % settings.serverAddress,
                             libskiff::LogLevel::DEBUG);
    }

    return fromServer(settings.serverAddress, settings.enforceSecureServer, policy);
}

std::string RegistryEndpoint::makeUrl(const std::string& pathAndQuery) const {
    if(pathAndQuery.empty() || pathAndQuery.front() != '/') {
        auto message = boost::format("Invalid registry request path '%s': expected an absolute path") % pathAndQuery;
        SKIFF_THROW_ERROR(message.str());
    }
    return baseUrl + pathAndQuery;
}

static bool isHostInNoProxyList(const std::string& host, const std::string& noProxyList) {
    if (noProxyList == "*") {
        return true;
    }
    auto hostnames = std::vector<std::string>{};
    boost::split(hostnames, noProxyList, boost::is_any_of(","));
    for (auto entry : hostnames) {
        boost::algorithm::trim(entry);
        if (entry.empty()) {
            continue;
        }
        if (entry == host) {
            return true;
        }
        // ".example.com" and "example.com" both match subdomains of example.com
        auto suffix = entry.front() == '.' ? entry : "." + entry;
        if (boost::algorithm::ends_with(host, suffix)) {
            return true;
        }
    }
    return false;
}

std::string getProxyFromEnvironment(const std::string& host, bool secure,
                                    const std::unordered_map<std::string, std::string>& environment) {
    using libskiff::environment::findVariable;

    // Lower case names first, as Python's urllib does
    auto noProxy = findVariable(environment, {"no_proxy", "NO_PROXY"});
    if(noProxy && isHostInNoProxyList(host, *noProxy)) {
        return std::string{};
    }

    if(auto proxy = findVariable(environment, {"ALL_PROXY"})) {
        return *proxy;
    }

    if(secure) {
        if(auto proxy = findVariable(environment, {"https_proxy", "HTTPS_PROXY"})) {
            return *proxy;
        }
    }
    // Only the lower case version, the upper case one can be set by CGI clients
    else if(auto proxy = findVariable(environment, {"http_proxy"})) {
        return *proxy;
    }

    return std::string{};
}

}
}
