/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "registry/Reference.hpp"

#include <boost/format.hpp>
#include <boost/regex.hpp>

#include "libskiff/Error.hpp"
#include "common/regex.hpp"


namespace skiff {
namespace registry {

Reference Reference::parse(const std::string& reference) {
    if(Digest::isDigestString(reference)) {
        return fromDigest(Digest::parse(reference));
    }
    return fromTag(reference);
}

Reference Reference::fromTag(const std::string& tag) {
    if(!boost::regex_match(tag, common::regex::tag)) {
        auto message = boost::format("Invalid tag '%s'") % tag;
        SKIFF_THROW_ERROR(message.str());
    }
    auto output = Reference{};
    output.tag = tag;
    return output;
}

Reference Reference::fromDigest(const Digest& digest) {
    auto output = Reference{};
    output.digest = digest;
    return output;
}

const std::string& Reference::getTag() const {
    if(isDigest()) {
        auto message = boost::format("Requested tag of reference %s, which is a digest") % string();
        SKIFF_THROW_ERROR(message.str());
    }
    return tag;
}

const Digest& Reference::getDigest() const {
    if(!isDigest()) {
        auto message = boost::format("Requested digest of reference %s, which is a tag") % tag;
        SKIFF_THROW_ERROR(message.str());
    }
    return *digest;
}

std::string Reference::string() const {
    return isDigest() ? digest->string() : tag;
}

std::ostream& operator<<(std::ostream& os, const Reference& reference) {
    os << reference.string();
    return os;
}

void validateRepositoryName(const std::string& repository) {
    if(repository.size() > 255 || !boost::regex_match(repository, common::regex::repository)) {
        auto message = boost::format("Invalid repository name '%s'") % repository;
        SKIFF_THROW_ERROR(message.str());
    }
}

}
}
