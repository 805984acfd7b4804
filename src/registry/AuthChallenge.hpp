/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_registry_AuthChallenge_hpp
#define skiff_registry_AuthChallenge_hpp

#include <ostream>
#include <string>


namespace skiff {
namespace registry {

/**
 * Challenge carried by the WWW-Authenticate header of a 401 response:
 *
 *     Bearer realm="https://auth.example/token",service="registry",scope="repository:foo:pull"
 *     Basic realm="Registry Realm"
 *
 * Only the first challenge of the header is considered.
 */
struct AuthChallenge {
    enum class Scheme { Basic, Bearer };

    Scheme scheme;
    std::string realm;
    std::string service;
    std::string scope;

    // Throws RegistryError(MalformedChallenge)
    static AuthChallenge parse(const std::string& header);
};

bool operator==(const AuthChallenge&, const AuthChallenge&);
std::ostream& operator<<(std::ostream&, const AuthChallenge&);

}
}

#endif
