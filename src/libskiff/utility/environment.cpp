/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "environment.hpp"

#include <tuple>

#include <boost/format.hpp>

#include "libskiff/Error.hpp"
#include "libskiff/utility/string.hpp"

/**
 * Utility functions for environment variables
 */

namespace libskiff {
namespace environment {

std::unordered_map<std::string, std::string> parseVariables(char** env) {
    auto map = std::unordered_map<std::string, std::string>{};
    for(size_t i=0; env[i] != nullptr; ++i) {
        std::string key, value;
        std::tie(key, value) = parseVariable(env[i]);
        map[key] = value;
    }
    return map;
}

std::pair<std::string, std::string> parseVariable(const std::string& variable) {
    std::pair<std::string, std::string> kvPair;
    try {
        kvPair = string::parseKeyValuePair(variable);
    }
    catch(libskiff::Error& e) {
        auto message = boost::format("Failed to parse environment variable: %s") % e.what();
        SKIFF_RETHROW_ERROR(e, message.str());
    }
    return kvPair;
}

boost::optional<std::string> findVariable(const std::unordered_map<std::string, std::string>& environment,
                                          std::initializer_list<std::string> keys) {
    for(const auto& key : keys) {
        auto it = environment.find(key);
        if(it != environment.cend() && !it->second.empty()) {
            return it->second;
        }
    }
    return boost::none;
}

}}
