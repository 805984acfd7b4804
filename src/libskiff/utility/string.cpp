/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "string.hpp"

#include <algorithm>
#include <random>

#include <boost/format.hpp>

#include "libskiff/Error.hpp"

/**
 * Utility functions for string manipulation
 */

namespace libskiff {
namespace string {

std::pair<std::string, std::string> parseKeyValuePair(const std::string& pairString, const char separator) {
    auto keyEnd = std::find(pairString.cbegin(), pairString.cend(), separator);
    auto key = std::string(pairString.cbegin(), keyEnd);
    auto value = keyEnd != pairString.cend() ? std::string(keyEnd+1, pairString.cend()) : std::string{};
    if(key.empty()) {
        auto message = boost::format("Failed to parse key-value pair '%s': key is empty") % pairString;
        SKIFF_THROW_ERROR(message.str())
    }
    return std::pair<std::string, std::string>{key, value};
}

/**
 * Returns a printable version of a token or password: only the first
 * characters are kept, the rest is replaced by an ellipsis.
 */
std::string maskSecret(const std::string& secret, size_t visibleCharacters) {
    if(secret.empty()) {
        return "<empty>";
    }
    if(secret.size() <= visibleCharacters) {
        return std::string(secret.size(), '*');
    }
    return secret.substr(0, visibleCharacters) + "...";
}

std::string generateRandom(size_t size) {
    auto dist = std::uniform_int_distribution<std::mt19937::result_type>(0, 'z'-'a');
    std::mt19937 generator;
    generator.seed(std::random_device()());

    auto string = std::string(size, '.');
    for(size_t i=0; i<string.size(); ++i) {
        string[i] = 'a' + dist(generator);
    }
    return string;
}

}}
