/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "registry/Credential.hpp"

#include <boost/format.hpp>

#include "libskiff/utility/base64.hpp"
#include "libskiff/utility/string.hpp"


namespace skiff {
namespace registry {

bool operator==(const NoCredential&, const NoCredential&) {
    return true;
}

bool operator==(const BasicCredential& lhs, const BasicCredential& rhs) {
    return lhs.username == rhs.username && lhs.secret == rhs.secret;
}

bool operator==(const BearerCredential& lhs, const BearerCredential& rhs) {
    return lhs.token == rhs.token && lhs.expiry == rhs.expiry;
}

namespace {

class AuthorizationHeaderVisitor : public boost::static_visitor<boost::optional<std::string>> {
public:
    boost::optional<std::string> operator()(const NoCredential&) const {
        return boost::none;
    }
    boost::optional<std::string> operator()(const BasicCredential& credential) const {
        return "Basic " + libskiff::base64::encode(credential.username + ":" + credential.secret);
    }
    boost::optional<std::string> operator()(const BearerCredential& credential) const {
        return "Bearer " + credential.token;
    }
};

class DescriptionVisitor : public boost::static_visitor<std::string> {
public:
    std::string operator()(const NoCredential&) const {
        return "anonymous";
    }
    std::string operator()(const BasicCredential& credential) const {
        return (boost::format("basic(user=%s, password=%s)")
            % credential.username
            % libskiff::string::maskSecret(credential.secret, 0)).str();
    }
    std::string operator()(const BearerCredential& credential) const {
        return (boost::format("bearer(%s)") % libskiff::string::maskSecret(credential.token)).str();
    }
};

} // namespace

boost::optional<std::string> makeAuthorizationHeader(const Credential& credential) {
    return boost::apply_visitor(AuthorizationHeaderVisitor{}, credential);
}

bool isExpired(const Credential& credential, std::chrono::steady_clock::time_point now) {
    const auto* bearer = boost::get<BearerCredential>(&credential);
    return bearer && bearer->expiry <= now;
}

std::string describe(const Credential& credential) {
    return boost::apply_visitor(DescriptionVisitor{}, credential);
}

}
}
