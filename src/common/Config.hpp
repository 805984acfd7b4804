/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_common_Config_hpp
#define skiff_common_Config_hpp

#include <chrono>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/filesystem.hpp>
#include <boost/optional.hpp>
#include <rapidjson/document.h>

#include "common/ImageReference.hpp"


namespace skiff {
namespace common {

class Config {
    public:
        Config() = default;
        Config(const boost::filesystem::path& configFilename,
               const boost::filesystem::path& configSchemaFilename);
        explicit Config(const boost::filesystem::path& installationPrefixDir);

        struct Registry {
            std::string serverAddress;
            bool enforceSecureServer = true;
            std::chrono::seconds requestTimeout{60};
            std::chrono::seconds tokenTimeout{30};
            unsigned int maxRedirects = 10;
            std::string userAgent = "skiff";
            std::string proxy;
            boost::optional<size_t> pageSize;
            size_t chunkSize = 64 * 1024;
            // Empty means the built-in list of manifest media types
            std::vector<std::string> manifestMediaTypes;
        };

        struct Authentication {
            bool isAuthenticationNeeded = false;
            std::string username;
            std::string password;
        };

        // Installation prefix, where etc/skiff.schema.json is looked up
        boost::filesystem::path prefixDir;
        rapidjson::Document json{ rapidjson::kObjectType };
        Registry registry;
        Authentication authentication;
        std::unordered_map<std::string, std::string> hostEnvironment;

        // set by the CLI commands
        ImageReference imageReference;
        std::string platform;
        boost::filesystem::path outputPath;

    private:
        void initializeFromJSON();
};

}
}

#endif
