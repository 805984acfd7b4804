/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "filesystem.hpp"

#include <boost/format.hpp>

#include "libskiff/Error.hpp"
#include "libskiff/utility/string.hpp"

namespace libskiff {
namespace filesystem {

boost::filesystem::path makeUniquePathWithRandomSuffix(const boost::filesystem::path& path) {
    auto uniquePath = std::string{};

    do {
        const size_t sizeOfRandomSuffix = 16;
        uniquePath = path.string() + "-" + string::generateRandom(sizeOfRandomSuffix);
    } while(boost::filesystem::exists(uniquePath));

    return uniquePath;
}

void createFoldersIfNecessary(const boost::filesystem::path& path) {
    if(path.empty() || boost::filesystem::is_directory(path)) {
        return;
    }
    try {
        boost::filesystem::create_directories(path);
    }
    catch(const std::exception& e) {
        auto message = boost::format("Failed to create directory %s") % path;
        SKIFF_RETHROW_ERROR(e, message.str());
    }
}

}}
