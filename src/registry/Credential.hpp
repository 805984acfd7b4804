/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_registry_Credential_hpp
#define skiff_registry_Credential_hpp

#include <chrono>
#include <string>

#include <boost/optional.hpp>
#include <boost/variant.hpp>


namespace skiff {
namespace registry {

struct NoCredential {};

struct BasicCredential {
    std::string username;
    std::string secret;
};

struct BearerCredential {
    std::string token;
    std::chrono::steady_clock::time_point expiry;
};

using Credential = boost::variant<NoCredential, BasicCredential, BearerCredential>;

bool operator==(const NoCredential&, const NoCredential&);
bool operator==(const BasicCredential&, const BasicCredential&);
bool operator==(const BearerCredential&, const BearerCredential&);

// Value of the Authorization header, none for NoCredential
boost::optional<std::string> makeAuthorizationHeader(const Credential&);

// Only bearer tokens expire
bool isExpired(const Credential&,
               std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

// Printable form with secrets masked, for log messages
std::string describe(const Credential&);

}
}

#endif
