/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libskiff_utility_base64_hpp
#define libskiff_utility_base64_hpp

#include <string>

/**
 * Base64 encoding and decoding (RFC 4648)
 */

namespace libskiff {
namespace base64 {

std::string encode(const std::string& data);
std::string decode(const std::string& encoded);
// URL-safe alphabet, padding optional (as used by JOSE)
std::string decodeUrl(const std::string& encoded);

}}

#endif
