/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libskiff_utility_environment_hpp
#define libskiff_utility_environment_hpp

#include <initializer_list>
#include <string>
#include <unordered_map>
#include <utility>

#include <boost/optional.hpp>

/**
 * Utility functions for environment variables
 */

namespace libskiff {
namespace environment {

std::unordered_map<std::string, std::string> parseVariables(char** env);
std::pair<std::string, std::string> parseVariable(const std::string& variable);

// Value of the first of the keys that is set to a non-empty value
boost::optional<std::string> findVariable(const std::unordered_map<std::string, std::string>& environment,
                                          std::initializer_list<std::string> keys);

}}

#endif
