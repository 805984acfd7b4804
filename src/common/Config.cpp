/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "common/Config.hpp"

#include <boost/format.hpp>

#include "libskiff/Error.hpp"
#include "libskiff/utility/json.hpp"
#include "libskiff/utility/logging.hpp"


namespace skiff {
namespace common {

Config::Config(const boost::filesystem::path& installationPrefixDir)
    : Config{installationPrefixDir / "etc/skiff.json", installationPrefixDir / "etc/skiff.schema.json"}
{
    prefixDir = installationPrefixDir;
}

Config::Config(const boost::filesystem::path& configFilename,
               const boost::filesystem::path& configSchemaFilename)
    : json{ libskiff::json::readAndValidate(configFilename, configSchemaFilename) }
{
    try {
        initializeFromJSON();
    }
    catch(libskiff::Error& e) {
        auto message = boost::format("Failed to initialize configuration from %s") % configFilename;
        SKIFF_RETHROW_ERROR(e, message.str());
    }
}

/**
 * The schema has already validated types and ranges, here we only copy
 * the values into their typed counterparts.
 */
void Config::initializeFromJSON() {
    registry.serverAddress = json["serverAddress"].GetString();

    if(json.HasMember("enforceSecureServer")) {
        registry.enforceSecureServer = json["enforceSecureServer"].GetBool();
    }
    if(json.HasMember("requestTimeoutSeconds")) {
        registry.requestTimeout = std::chrono::seconds{json["requestTimeoutSeconds"].GetUint()};
    }
    if(json.HasMember("tokenTimeoutSeconds")) {
        registry.tokenTimeout = std::chrono::seconds{json["tokenTimeoutSeconds"].GetUint()};
    }
    if(json.HasMember("maxRedirects")) {
        registry.maxRedirects = json["maxRedirects"].GetUint();
    }
    if(json.HasMember("userAgent")) {
        registry.userAgent = json["userAgent"].GetString();
    }
    if(json.HasMember("proxy")) {
        registry.proxy = json["proxy"].GetString();
    }
    if(json.HasMember("pageSize")) {
        registry.pageSize = static_cast<size_t>(json["pageSize"].GetUint());
    }
    if(json.HasMember("chunkSize")) {
        registry.chunkSize = static_cast<size_t>(json["chunkSize"].GetUint());
    }
    if(json.HasMember("manifestMediaTypes")) {
        for(const auto& mediaType : json["manifestMediaTypes"].GetArray()) {
            registry.manifestMediaTypes.emplace_back(mediaType.GetString());
        }
    }

    if(json.HasMember("username")) {
        authentication.isAuthenticationNeeded = true;
        authentication.username = json["username"].GetString();
        if(json.HasMember("password")) {
            authentication.password = json["password"].GetString();
        }
        libskiff::logMessage(boost::format("Configuration provides credentials for user %s") % authentication.username,
                             libskiff::LogLevel::DEBUG);
    }

    libskiff::logMessage(boost::format("Loaded configuration for registry server %s") % registry.serverAddress,
                         libskiff::LogLevel::DEBUG);
}

}} // namespaces
