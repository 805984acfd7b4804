/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

/**
 * @brief Utility functions to be used in the tests.
 */

#ifndef skiff_test_utility_config_hpp
#define skiff_test_utility_config_hpp

#include <memory>
#include <string>

#include <boost/filesystem.hpp>

#include "common/Config.hpp"

namespace test_utility {
namespace config {

/**
 * Configuration with a temporary installation prefix that contains the
 * configuration schema. The prefix is removed on destruction.
 */
struct ConfigRAII {
    ConfigRAII() = default;
    ConfigRAII(ConfigRAII&&) = default;
    ~ConfigRAII();

    // Writes a configuration file under the prefix and returns its path
    boost::filesystem::path writeConfigFile(const std::string& content) const;

    std::shared_ptr<skiff::common::Config> config;
};

ConfigRAII makeConfig();

boost::filesystem::path getRepositoryRootDir();

}
}

#endif
