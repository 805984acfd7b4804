/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "common/regex.hpp"

#include <initializer_list>
#include <string>


namespace skiff {
namespace common {
namespace regex {

namespace {

std::string join(std::initializer_list<std::string> expressions) {
    auto output = std::string{};
    for(const auto& expression : expressions) {
        output += expression;
    }
    return output;
}

std::string group(const std::string& expression) {
    return "(?:" + expression + ")";
}

std::string capture(const std::string& expression) {
    return "(" + expression + ")";
}

std::string maybe(const std::string& expression) {
    return group(expression) + "?";
}

std::string oneOrMore(const std::string& expression) {
    return group(expression) + "+";
}

std::string anchored(const std::string& expression) {
    return "^" + expression + "$";
}

/**
 * Grammar of the Docker distribution project (reference/regexp.go), which
 * every registry implementing the API v2 validates repository names against.
 */
namespace grammar {

// Lower case only: repository names are case sensitive on the registry
const std::string alphaNumeric{"[a-z0-9]+"};

// "." or "_" or "__" or any number of "-"
const std::string separator{"(?:[._]|__|[-]+)"};

const std::string pathComponent = alphaNumeric + maybe(oneOrMore(separator + alphaNumeric));

const std::string domainLabel{"(?:[a-zA-Z0-9]|[a-zA-Z0-9][a-zA-Z0-9-]*[a-zA-Z0-9])"};

// RFC 5952 text forms, without zone identifiers
const std::string ipv6{"\\[(?:[a-fA-F0-9:]+)\\]"};

const std::string port{"\\:[0-9]+"};

const std::string host = group(join({ domainLabel + maybe(oneOrMore("\\." + domainLabel)),
                                      "|",
                                      ipv6 }));

const std::string domain = host + maybe(port);

// The <name> of /v2/<name>/... request paths
const std::string repository = pathComponent + maybe(oneOrMore("\\/" + pathComponent));

const std::string name = maybe(domain + "\\/") + repository;

const std::string tag{"[\\w][\\w.-]{0,127}"};

const std::string digest{"[A-Za-z][A-Za-z0-9]*(?:[-_+.][A-Za-z][A-Za-z0-9]*)*[:][0-9A-Fa-f]{32,}"};

const std::string reference = join({ capture(name),
                                     maybe("\\:" + capture(tag)),
                                     maybe("\\@" + capture(digest)) });

const std::string registryUrl = capture("https?") + "\\:\\/\\/" + capture(domain);

const std::string platformComponent{"[A-Za-z0-9_.-]+"};

const std::string platform = join({ capture(platformComponent),
                                    "\\/" + capture(platformComponent),
                                    maybe("\\/" + capture(platformComponent)) });

}

}

const boost::regex domain(anchored(grammar::domain));
const boost::regex name(anchored(grammar::name));
const boost::regex repository(anchored(grammar::repository));
const boost::regex tag(anchored(grammar::tag));
const boost::regex digest(anchored(grammar::digest));
const boost::regex reference(anchored(grammar::reference));
const boost::regex registryUrl(anchored(grammar::registryUrl));
const boost::regex platform(anchored(grammar::platform));

}
}
}
