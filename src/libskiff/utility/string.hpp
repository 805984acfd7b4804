/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libskiff_utility_string_hpp
#define libskiff_utility_string_hpp

#include <string>
#include <utility>

/**
 * Utility functions for string manipulation
 */

namespace libskiff {
namespace string {

std::pair<std::string, std::string> parseKeyValuePair(const std::string& pairString, const char separator = '=');
std::string maskSecret(const std::string& secret, size_t visibleCharacters = 8);
std::string generateRandom(size_t size);

}}

#endif
