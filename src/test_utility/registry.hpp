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
 * @brief Helpers for the tests of the registry client.
 */

#ifndef skiff_test_utility_registry_hpp
#define skiff_test_utility_registry_hpp

#include <memory>
#include <string>

#include <boost/optional.hpp>

#include "registry/Digest.hpp"
#include "registry/RegistryError.hpp"
#include "registry/RegistryEndpoint.hpp"
#include "registry/RegistryClient.hpp"
#include "test_utility/FakeTransport.hpp"

namespace test_utility {
namespace registry {

const std::string baseUrl = "https://registry.example.com";
const std::string tokenUrl = "https://auth.example.com/token";

/**
 * Runs the function and returns the kind of the RegistryError it threw,
 * or an empty optional if it threw nothing.
 */
template<typename Function>
boost::optional<skiff::registry::ErrorKind> getErrorKind(Function&& function) {
    try {
        function();
    }
    catch(const skiff::registry::RegistryError& e) {
        return e.getKind();
    }
    return boost::none;
}

inline skiff::registry::Digest sha256(const std::string& content) {
    return skiff::registry::Digest::fromBytes(skiff::registry::DigestAlgorithm::SHA256, content);
}

inline skiff::registry::HeaderMap makeBearerChallenge(const std::string& scope) {
    return skiff::registry::HeaderMap{
        {"WWW-Authenticate",
         "Bearer realm=\"" + tokenUrl + "\",service=\"registry.example.com\",scope=\"" + scope + "\""}
    };
}

inline skiff::registry::RegistryClient makeClient(std::shared_ptr<transport::FakeTransport> transport,
                                                  const boost::optional<size_t>& pageSize = boost::none) {
    return skiff::registry::RegistryClient{skiff::registry::RegistryEndpoint{baseUrl}, transport, {}, pageSize};
}

}
}

#endif
