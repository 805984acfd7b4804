/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "base64.hpp"

#include <algorithm>
#include <vector>

#include <boost/format.hpp>
#include <openssl/evp.h>

#include "libskiff/Error.hpp"

namespace libskiff {
namespace base64 {

std::string encode(const std::string& data) {
    // EVP_EncodeBlock writes ceil(n/3)*4 characters plus a terminating null
    std::vector<unsigned char> out((data.size() + 2) / 3 * 4 + 1);
    auto length = EVP_EncodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(data.data()),
                                  static_cast<int>(data.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(length));
}

std::string decode(const std::string& encoded) {
    if(encoded.size() % 4 != 0) {
        auto message = boost::format("Failed to decode base64 string '%s': length is not a multiple of 4") % encoded;
        SKIFF_THROW_ERROR(message.str());
    }
    if(encoded.empty()) {
        return std::string{};
    }

    std::vector<unsigned char> out(encoded.size() / 4 * 3);
    auto length = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(encoded.data()),
                                  static_cast<int>(encoded.size()));
    if(length < 0) {
        auto message = boost::format("Failed to decode base64 string '%s'") % encoded;
        SKIFF_THROW_ERROR(message.str());
    }

    // EVP_DecodeBlock does not account for padding
    auto padding = static_cast<size_t>(std::count(encoded.end() - 2, encoded.end(), '='));
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(length) - padding);
}

std::string decodeUrl(const std::string& encoded) {
    auto standard = encoded;
    std::replace(standard.begin(), standard.end(), '-', '+');
    std::replace(standard.begin(), standard.end(), '_', '/');
    while(standard.size() % 4 != 0) {
        standard.push_back('=');
    }
    return decode(standard);
}

}}
