/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <chrono>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>

#include "common/Config.hpp"
#include "test_utility/config.hpp"
#include "libskiff/test/aux/unitTestMain.hpp"

namespace skiff {
namespace common {
namespace test {

TEST_GROUP(ConfigTestGroup) {
};

static common::Config loadConfig(const test_utility::config::ConfigRAII& raii, const std::string& content) {
    auto file = raii.writeConfigFile(content);
    return common::Config{file, raii.config->prefixDir / "etc/skiff.schema.json"};
}

TEST(ConfigTestGroup, defaults) {
    auto raii = test_utility::config::makeConfig();
    auto config = loadConfig(raii, R"({"serverAddress": "registry.example.com"})");

    CHECK_EQUAL(config.registry.serverAddress, std::string{"registry.example.com"});
    CHECK(config.registry.enforceSecureServer);
    CHECK(config.registry.requestTimeout == std::chrono::seconds{60});
    CHECK(config.registry.tokenTimeout == std::chrono::seconds{30});
    CHECK_EQUAL(config.registry.maxRedirects, 10u);
    CHECK(!config.registry.pageSize);
    CHECK(config.registry.manifestMediaTypes.empty());
    CHECK(!config.authentication.isAuthenticationNeeded);
}

TEST(ConfigTestGroup, allSettings) {
    auto raii = test_utility::config::makeConfig();
    auto config = loadConfig(raii, R"({
        "serverAddress": "localhost:5000",
        "enforceSecureServer": false,
        "requestTimeoutSeconds": 5,
        "tokenTimeoutSeconds": 3,
        "maxRedirects": 2,
        "userAgent": "skiff-test",
        "proxy": "http://proxy.example.com:3128",
        "pageSize": 50,
        "chunkSize": 1024,
        "manifestMediaTypes": [
            "application/vnd.oci.image.index.v1+json",
            "application/vnd.oci.image.manifest.v1+json"
        ],
        "username": "user",
        "password": "secret"
    })");

    CHECK_EQUAL(config.registry.serverAddress, std::string{"localhost:5000"});
    CHECK(!config.registry.enforceSecureServer);
    CHECK(config.registry.requestTimeout == std::chrono::seconds{5});
    CHECK(config.registry.tokenTimeout == std::chrono::seconds{3});
    CHECK_EQUAL(config.registry.maxRedirects, 2u);
    CHECK_EQUAL(config.registry.userAgent, std::string{"skiff-test"});
    CHECK_EQUAL(config.registry.proxy, std::string{"http://proxy.example.com:3128"});
    CHECK(config.registry.pageSize == size_t{50});
    CHECK_EQUAL(config.registry.chunkSize, size_t{1024});
    auto expectedMediaTypes = std::vector<std::string>{
        "application/vnd.oci.image.index.v1+json",
        "application/vnd.oci.image.manifest.v1+json"
    };
    CHECK(config.registry.manifestMediaTypes == expectedMediaTypes);
    CHECK(config.authentication.isAuthenticationNeeded);
    CHECK_EQUAL(config.authentication.username, std::string{"user"});
    CHECK_EQUAL(config.authentication.password, std::string{"secret"});
}

TEST(ConfigTestGroup, invalidFiles) {
    auto raii = test_utility::config::makeConfig();

    // missing required member
    CHECK_THROWS(libskiff::Error, loadConfig(raii, R"({"pageSize": 10})"));
    // unknown member
    CHECK_THROWS(libskiff::Error, loadConfig(raii, R"({"serverAddress": "a.io", "unknown": 1})"));
    // wrong type
    CHECK_THROWS(libskiff::Error, loadConfig(raii, R"({"serverAddress": "a.io", "maxRedirects": "ten"})"));
    // out of range
    CHECK_THROWS(libskiff::Error, loadConfig(raii, R"({"serverAddress": "a.io", "pageSize": 0})"));
    // not JSON
    CHECK_THROWS(libskiff::Error, loadConfig(raii, "serverAddress=a.io"));
    // missing file
    CHECK_THROWS(libskiff::Error, (common::Config{raii.config->prefixDir / "etc/missing.json",
                                                  raii.config->prefixDir / "etc/skiff.schema.json"}));
}

TEST(ConfigTestGroup, installedConfiguration) {
    auto prefixDir = test_utility::config::getRepositoryRootDir();
    auto config = common::Config{prefixDir};

    CHECK(config.prefixDir == prefixDir);
    CHECK_EQUAL(config.registry.serverAddress, std::string{"registry-1.docker.io"});
    CHECK(config.registry.pageSize == size_t{100});
    CHECK_EQUAL(config.registry.manifestMediaTypes.size(), 6u);
}

}}} // namespace

SKIFF_UNITTEST_MAIN_FUNCTION();
