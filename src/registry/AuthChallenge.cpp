/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "registry/AuthChallenge.hpp"

#include <cctype>
#include <unordered_map>

#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>

#include "registry/RegistryError.hpp"


namespace skiff {
namespace registry {

namespace {

/**
 * Tokenizer for the challenge grammar of RFC 7235:
 *
 *     challenge   = auth-scheme [ 1*SP ( token68 / #auth-param ) ]
 *     auth-param  = token BWS "=" BWS ( token / quoted-string )
 */
class ChallengeTokenizer {
public:
    ChallengeTokenizer(const std::string& header)
        : header{header}
    {}

    void skipWhitespaces() {
        while(position < header.size() && (header[position] == ' ' || header[position] == '\t')) {
            ++position;
        }
    }

    bool skipCharacter(char c) {
        skipWhitespaces();
        if(position < header.size() && header[position] == c) {
            ++position;
            return true;
        }
        return false;
    }

    bool isAtEnd() {
        skipWhitespaces();
        return position >= header.size();
    }

    std::string readToken() {
        skipWhitespaces();
        auto begin = position;
        while(position < header.size() && isTokenCharacter(header[position])) {
            ++position;
        }
        return header.substr(begin, position - begin);
    }

    std::string readQuotedString() {
        // opening quote already consumed
        auto value = std::string{};
        while(position < header.size()) {
            auto c = header[position++];
            if(c == '"') {
                return value;
            }
            if(c == '\\') {
                if(position >= header.size()) {
                    break;
                }
                c = header[position++];
            }
            value.push_back(c);
        }
        fail("unterminated quoted string");
    }

    size_t getPosition() const { return position; }
    void setPosition(size_t value) { position = value; }

    [[noreturn]] void fail(const std::string& reason) const {
        auto message = boost::format("Malformed WWW-Authenticate header '%s': %s") % header % reason;
        auto context = ErrorContext{};
        context.responseBody = header;
        SKIFF_THROW_REGISTRY_ERROR(ErrorKind::MalformedChallenge, context, message.str());
    }

private:
    static bool isTokenCharacter(char c) {
        return std::isalnum(static_cast<unsigned char>(c))
            || std::string{"!#$%&'*+-.^_`|~/:"}.find(c) != std::string::npos;
    }

private:
    const std::string& header;
    size_t position = 0;
};

} // namespace

AuthChallenge AuthChallenge::parse(const std::string& header) {
    auto tokenizer = ChallengeTokenizer{header};

    auto schemeName = boost::algorithm::to_lower_copy(tokenizer.readToken());
    if(schemeName.empty()) {
        tokenizer.fail("missing authentication scheme");
    }

    auto challenge = AuthChallenge{};
    if(schemeName == "bearer") {
        challenge.scheme = Scheme::Bearer;
    }
    else if(schemeName == "basic") {
        challenge.scheme = Scheme::Basic;
    }
    else {
        tokenizer.fail("unsupported authentication scheme '" + schemeName + "'");
    }

    auto parameters = std::unordered_map<std::string, std::string>{};
    while(!tokenizer.isAtEnd()) {
        if(tokenizer.skipCharacter(',')) {
            continue;
        }

        auto parameterStart = tokenizer.getPosition();
        auto name = boost::algorithm::to_lower_copy(tokenizer.readToken());
        if(name.empty()) {
            tokenizer.fail("expected a parameter name");
        }
        if(!tokenizer.skipCharacter('=')) {
            // a token without '=' starts the next challenge (or is a token68, not used by registries)
            if(parameters.empty()) {
                tokenizer.fail("expected '=' after parameter '" + name + "'");
            }
            tokenizer.setPosition(parameterStart);
            break;
        }

        auto value = std::string{};
        if(tokenizer.skipCharacter('"')) {
            value = tokenizer.readQuotedString();
        }
        else {
            value = tokenizer.readToken();
        }

        if(parameters.find(name) != parameters.cend()) {
            tokenizer.fail("duplicated parameter '" + name + "'");
        }
        parameters[name] = value;

        if(!tokenizer.isAtEnd() && !tokenizer.skipCharacter(',')) {
            // whitespace-separated next challenge
            break;
        }
    }

    challenge.realm = parameters["realm"];
    challenge.service = parameters["service"];
    challenge.scope = parameters["scope"];

    if(challenge.scheme == Scheme::Bearer) {
        if(challenge.realm.empty()) {
            tokenizer.fail("Bearer challenge without realm");
        }
        if(!boost::algorithm::istarts_with(challenge.realm, "https://")
           && !boost::algorithm::istarts_with(challenge.realm, "http://")) {
            tokenizer.fail("Bearer realm '" + challenge.realm + "' is not an HTTP URL");
        }
    }

    return challenge;
}

bool operator==(const AuthChallenge& lhs, const AuthChallenge& rhs) {
    return lhs.scheme == rhs.scheme
        && lhs.realm == rhs.realm
        && lhs.service == rhs.service
        && lhs.scope == rhs.scope;
}

std::ostream& operator<<(std::ostream& os, const AuthChallenge& challenge) {
    if(challenge.scheme == AuthChallenge::Scheme::Basic) {
        os << "Basic realm=\"" << challenge.realm << "\"";
    }
    else {
        os << "Bearer realm=\"" << challenge.realm << "\""
           << ",service=\"" << challenge.service << "\""
           << ",scope=\"" << challenge.scope << "\"";
    }
    return os;
}

}
}
