/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <string>

#include "common/regex.hpp"
#include "libskiff/test/aux/unitTestMain.hpp"

namespace skiff {
namespace common {
namespace test {

static const std::string digest = "sha256:d4ff818577bc193b309b355b02ebc9220427090057b54a59e73b79bdfe139b83";

static bool matches(const std::string& input, const boost::regex& re) {
    return boost::regex_match(input, re);
}

// Checks the name, tag and digest captured from a reference; empty means unmatched
static void checkReference(const std::string& input,
                           const std::string& expectedName,
                           const std::string& expectedTag,
                           const std::string& expectedDigest) {
    boost::smatch groups;
    CHECK(boost::regex_match(input, groups, regex::reference));
    CHECK_EQUAL(groups[1].str(), expectedName);
    CHECK_EQUAL(groups[2].matched, !expectedTag.empty());
    CHECK_EQUAL(groups[2].str(), expectedTag);
    CHECK_EQUAL(groups[3].matched, !expectedDigest.empty());
    CHECK_EQUAL(groups[3].str(), expectedDigest);
}

TEST_GROUP(RegexTestGroup) {
};

TEST(RegexTestGroup, domain) {
    CHECK(matches("localhost", regex::domain));
    CHECK(matches("localhost:5000", regex::domain));
    CHECK(matches("registry.example.com", regex::domain));
    CHECK(matches("registry-1.docker.io:443", regex::domain));
    CHECK(matches("dom0--dom1.org", regex::domain));
    CHECK(matches("[::1]:5000", regex::domain));

    CHECK_FALSE(matches("server:port", regex::domain));
    CHECK_FALSE(matches("-server.com", regex::domain));
    CHECK_FALSE(matches("serv.-er", regex::domain));
    CHECK_FALSE(matches("serv..er.com", regex::domain));
    CHECK_FALSE(matches("serv_er.com:1234", regex::domain));
}

TEST(RegexTestGroup, name) {
    CHECK(matches("alpine", regex::name));
    CHECK(matches("library/alpine", regex::name));
    CHECK(matches("registry.example.com:5000/team/project/tool", regex::name));
    CHECK(matches("dashed--image--name", regex::name));
    CHECK(matches("image_name.v2", regex::name));

    CHECK_FALSE(matches("", regex::name));
    // component initiators and terminators
    CHECK_FALSE(matches("-image", regex::name));
    CHECK_FALSE(matches("space/image-", regex::name));
    CHECK_FALSE(matches("_image", regex::name));
    // slashes
    CHECK_FALSE(matches("/library/alpine", regex::name));
    CHECK_FALSE(matches("library/alpine/", regex::name));
    CHECK_FALSE(matches("team//tool", regex::name));
    // characters and dots
    CHECK_FALSE(matches("team/im@ge", regex::name));
    CHECK_FALSE(matches("../alpine", regex::name));
    CHECK_FALSE(matches("team/.tool", regex::name));
    CHECK_FALSE(matches("spa..ce/image", regex::name));
}

TEST(RegexTestGroup, reference) {
    checkReference("alpine", "alpine", "", "");
    checkReference("alpine:tAg-195", "alpine", "tAg-195", "");
    checkReference("alpine@" + digest, "alpine", "", digest);
    checkReference("library/alpine:3.18@" + digest, "library/alpine", "3.18", digest);
    checkReference("registry.example.com:5000/team/tool:1.0", "registry.example.com:5000/team/tool", "1.0", "");
    checkReference("registry.example.com/a/b/c/tool@" + digest, "registry.example.com/a/b/c/tool", "", digest);

    // without a repository path, a port is read as a tag
    checkReference("localhost:5000@" + digest, "localhost", "5000", digest);

    CHECK_FALSE(matches("registry.example.com/tool:invalid~tag", regex::reference));
    CHECK_FALSE(matches("registry.example.com/tool@hashlessdigest", regex::reference));
    CHECK_FALSE(matches("alpine:3.18:latest", regex::reference));
}

TEST(RegexTestGroup, repository) {
    CHECK(matches("library/alpine", regex::repository));
    CHECK(matches("team/project/image", regex::repository));
    CHECK(matches("my_org/my-image.v2", regex::repository));

    // the server is not part of the repository path
    CHECK_FALSE(matches("server.io:5000/image", regex::repository));
    CHECK_FALSE(matches("Library/alpine", regex::repository));
    CHECK_FALSE(matches("alpine:latest", regex::repository));
}

TEST(RegexTestGroup, tagAndDigest) {
    CHECK(matches("latest", regex::tag));
    CHECK(matches("v1.2.3-rc_1", regex::tag));
    CHECK_FALSE(matches(".hidden", regex::tag));
    CHECK_FALSE(matches("-dash", regex::tag));
    CHECK_FALSE(matches(std::string(129, 'a'), regex::tag));

    CHECK(matches(digest, regex::digest));
    CHECK(matches("sha512+b64u:d4ff818577bc193b309b355b02ebc922", regex::digest));
    CHECK_FALSE(matches("sha256:1234", regex::digest));
    CHECK_FALSE(matches("sha256d4ff818577bc193b309b355b02ebc9220427090057b54a59e73b79bdfe139b83", regex::digest));
}

TEST(RegexTestGroup, registryUrl) {
    boost::smatch groups;
    auto url = std::string{"https://registry.example.com:5000"};
    CHECK(boost::regex_match(url, groups, regex::registryUrl));
    CHECK_EQUAL(groups[1].str(), std::string{"https"});
    CHECK_EQUAL(groups[2].str(), std::string{"registry.example.com:5000"});

    CHECK(matches("http://localhost:5000", regex::registryUrl));
    CHECK(matches("http://[::1]:5000", regex::registryUrl));

    CHECK_FALSE(matches("registry.example.com", regex::registryUrl));
    CHECK_FALSE(matches("ftp://registry.example.com", regex::registryUrl));
    CHECK_FALSE(matches("https://registry.example.com/v2", regex::registryUrl));
    CHECK_FALSE(matches("https://", regex::registryUrl));
}

TEST(RegexTestGroup, platform) {
    boost::smatch groups;
    auto platform = std::string{"linux/arm64/v8"};
    CHECK(boost::regex_match(platform, groups, regex::platform));
    CHECK_EQUAL(groups[1].str(), std::string{"linux"});
    CHECK_EQUAL(groups[2].str(), std::string{"arm64"});
    CHECK_EQUAL(groups[3].str(), std::string{"v8"});

    platform = "windows/amd64";
    CHECK(boost::regex_match(platform, groups, regex::platform));
    CHECK_FALSE(groups[3].matched);

    CHECK_FALSE(matches("linux", regex::platform));
    CHECK_FALSE(matches("linux//v8", regex::platform));
    CHECK_FALSE(matches("linux/arm64/v8/extra", regex::platform));
    CHECK_FALSE(matches("linux/arm 64", regex::platform));
}

}}} // namespace

SKIFF_UNITTEST_MAIN_FUNCTION();
