/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "ImageReference.hpp"

#include <sstream>
#include <tuple>

#include <boost/format.hpp>
#include <boost/regex.hpp>

#include "libskiff/Error.hpp"
#include "libskiff/utility/logging.hpp"
#include "common/regex.hpp"


namespace skiff {
namespace common {

const std::string ImageReference::DEFAULT_SERVER{"index.docker.io"};
const std::string ImageReference::DEFAULT_REPOSITORY_NAMESPACE{"library"};
const std::string ImageReference::DEFAULT_TAG{"latest"};

std::string ImageReference::getFullName() const {
    auto format =  boost::format{"%s/%s"}
            % server
            % repository;
    return format.str();
}

std::string ImageReference::string() const {
    auto output = std::stringstream{};
    output << getFullName();
    if (!tag.empty()){
        output << ":" << tag;
    }
    if (!digest.empty()){
        output << "@" << digest;
    }
    return output.str();
}

std::string ImageReference::getManifestReference() const {
    if(!digest.empty()) {
        return digest;
    }
    if(!tag.empty()) {
        return tag;
    }
    auto message = boost::format("Malformed image reference %s: it has neither a tag nor a digest") % string();
    SKIFF_THROW_ERROR(message.str());
}

/**
 * Normalizing a reference means clearing the tag if the digest is also present,
 * as Docker does: when a digest is given the tag is ignored.
 */
ImageReference ImageReference::normalize() const {
    auto output = *this;
    if (!digest.empty() && !tag.empty()){
        output.tag.clear();
    }
    return output;
}

/**
 * Splits a string matching regex::name into server and repository.
 * The first component is a server only when it looks like a hostname
 * (contains a dot or a port, or is "localhost"), as Docker does.
 */
static std::tuple<std::string, std::string> parseNameMatch(const std::string& in) {
    auto server = ImageReference::DEFAULT_SERVER;
    auto repository = in;

    auto firstSeparator = in.find_first_of("/");
    if(firstSeparator != std::string::npos) {
        auto firstComponent = in.substr(0, firstSeparator);
        if(firstComponent.find_first_of(".:") != std::string::npos || firstComponent == "localhost") {
            server = firstComponent;
            repository = in.substr(firstSeparator + 1);
        }
    }

    // Docker Hub official images live in the "library" namespace
    if(server == ImageReference::DEFAULT_SERVER && repository.find('/') == std::string::npos) {
        repository = ImageReference::DEFAULT_REPOSITORY_NAMESPACE + "/" + repository;
    }

    return std::tuple<std::string, std::string>{server, repository};
}

ImageReference ImageReference::parse(const std::string& input) {
    libskiff::logMessage(boost::format("Parsing image reference from string: %s") % input, libskiff::LogLevel::DEBUG);

    if(input.find("..") != std::string::npos) {
        auto message = boost::format("Invalid image reference '%s'\n"
                                     "Image references are not allowed to contain the sequence '..'") % input;
        SKIFF_THROW_ERROR(message.str());
    }

    auto reference = ImageReference{};

    boost::smatch matches;
    if (!boost::regex_match(input, matches, regex::reference)) {
        auto message = boost::format("Invalid image reference '%s'") % input;
        SKIFF_THROW_ERROR(message.str());
    }

    auto nameMatch   = matches[1];
    auto tagMatch    = matches[2];
    auto digestMatch = matches[3];

    std::tie(reference.server, reference.repository) = parseNameMatch(nameMatch.str());

    if (tagMatch.matched) {
        reference.tag = tagMatch.str();
    }
    else if (!digestMatch.matched) {
        reference.tag = DEFAULT_TAG;
    }

    if (digestMatch.matched) {
        reference.digest = digestMatch.str();
    }

    libskiff::logMessage(boost::format("Successfully parsed image reference %s") % reference, libskiff::LogLevel::DEBUG);
    return reference;
}

bool operator==(const ImageReference& lhs, const ImageReference& rhs) {
    return lhs.server == rhs.server
        && lhs.repository == rhs.repository
        && lhs.tag == rhs.tag
        && lhs.digest == rhs.digest;
}

std::ostream& operator<<(std::ostream& os, const ImageReference& imageReference) {
    os << imageReference.string();
    return os;
}

}
}
