/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "config.hpp"

#include <fstream>

#include "libskiff/Error.hpp"
#include "libskiff/utility/filesystem.hpp"

using namespace skiff;

namespace test_utility {
namespace config {

ConfigRAII::~ConfigRAII() {
    if(config && !config->prefixDir.empty()) {
        auto ec = boost::system::error_code{};
        boost::filesystem::remove_all(config->prefixDir, ec);
    }
}

boost::filesystem::path ConfigRAII::writeConfigFile(const std::string& content) const {
    auto path = libskiff::filesystem::makeUniquePathWithRandomSuffix(config->prefixDir / "etc/skiff-test.json");
    std::ofstream os(path.string());
    os << content;
    os.close();
    if(!os) {
        SKIFF_THROW_ERROR("Failed to write test configuration file " + path.string());
    }
    return path;
}

boost::filesystem::path getRepositoryRootDir() {
    return boost::filesystem::path{__FILE__}.parent_path().parent_path().parent_path();
}

ConfigRAII makeConfig() {
    auto raii = ConfigRAII{};
    raii.config = std::make_shared<common::Config>();

    auto prefixDir = libskiff::filesystem::makeUniquePathWithRandomSuffix(
        boost::filesystem::temp_directory_path() / "skiff-test-prefix-dir");
    raii.config->prefixDir = prefixDir;

    libskiff::filesystem::createFoldersIfNecessary(prefixDir / "etc");
    boost::filesystem::copy_file(getRepositoryRootDir() / "etc/skiff.schema.json",
                                 prefixDir / "etc/skiff.schema.json");

    return raii;
}

}
}
