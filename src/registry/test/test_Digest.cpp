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

#include "registry/Digest.hpp"
#include "registry/Reference.hpp"
#include "test_utility/registry.hpp"
#include "libskiff/test/aux/unitTestMain.hpp"

namespace skiff {
namespace registry {
namespace test {

static const std::string emptySha256 = "sha256:e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
static const std::string abcSha256 = "sha256:ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

TEST_GROUP(DigestTestGroup) {
};

TEST(DigestTestGroup, parse) {
    auto digest = Digest::parse(abcSha256);
    CHECK(digest.getAlgorithm() == DigestAlgorithm::SHA256);
    CHECK_EQUAL(digest.getHex(), std::string{"ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"});
    CHECK_EQUAL(digest.string(), abcSha256);

    // hex is normalized to lower case
    auto upper = Digest::parse("sha256:BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD");
    CHECK(upper == digest);
    CHECK_EQUAL(upper.string(), abcSha256);

    auto sha512 = Digest::parse("sha512:" + std::string(128, 'a'));
    CHECK(sha512.getAlgorithm() == DigestAlgorithm::SHA512);
}

TEST(DigestTestGroup, parseMalformed) {
    using test_utility::registry::getErrorKind;
    auto malformed = ErrorKind::MalformedDigest;

    CHECK(getErrorKind([]() { Digest::parse("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"); }) == malformed);
    CHECK(getErrorKind([]() { Digest::parse("md5:d41d8cd98f00b204e9800998ecf8427e"); }) == malformed);
    CHECK(getErrorKind([]() { Digest::parse("sha256:abc"); }) == malformed);
    CHECK(getErrorKind([]() { Digest::parse("sha256:" + std::string(64, 'g')); }) == malformed);
    CHECK(getErrorKind([]() { Digest::parse("sha512:" + std::string(64, 'a')); }) == malformed);
    CHECK(getErrorKind([]() { Digest::parse(":"); }) == malformed);
}

TEST(DigestTestGroup, fromBytes) {
    CHECK_EQUAL(Digest::fromBytes(DigestAlgorithm::SHA256, std::string{}).string(), emptySha256);
    CHECK_EQUAL(Digest::fromBytes(DigestAlgorithm::SHA256, std::string{"abc"}).string(), abcSha256);
    CHECK_EQUAL(Digest::fromBytes(DigestAlgorithm::SHA512, std::string{"abc"}).getHex().size(), size_t{128});
}

TEST(DigestTestGroup, accumulator) {
    auto accumulator = DigestAccumulator{};
    accumulator.update(std::string{"a"});
    accumulator.update(std::string{});
    accumulator.update(std::string{"bc"});
    CHECK_EQUAL(accumulator.getByteCount(), uint64_t{3});

    auto digest = accumulator.finalize();
    CHECK(accumulator.isFinalized());
    CHECK_EQUAL(digest.string(), abcSha256);

    CHECK_THROWS(libskiff::Error, accumulator.update(std::string{"d"}));
    CHECK_THROWS(libskiff::Error, accumulator.finalize());
}

TEST(DigestTestGroup, comparison) {
    auto a = Digest::parse(abcSha256);
    auto b = Digest::parse(emptySha256);
    CHECK(a != b);
    CHECK(b < a);
    CHECK(Digest{} != a);
}

TEST(DigestTestGroup, reference) {
    auto tag = Reference::parse("3.18");
    CHECK_FALSE(tag.isDigest());
    CHECK_EQUAL(tag.getTag(), std::string{"3.18"});
    CHECK_EQUAL(tag.string(), std::string{"3.18"});
    CHECK_THROWS(libskiff::Error, tag.getDigest());

    auto digest = Reference::parse(abcSha256);
    CHECK(digest.isDigest());
    CHECK_EQUAL(digest.getDigest().string(), abcSha256);
    CHECK_EQUAL(digest.string(), abcSha256);
    CHECK_THROWS(libskiff::Error, digest.getTag());

    // strings with ':' are digests
    CHECK(test_utility::registry::getErrorKind([]() { Reference::parse("sha256:abc"); })
          == ErrorKind::MalformedDigest);

    CHECK_THROWS(libskiff::Error, Reference::parse(""));
    CHECK_THROWS(libskiff::Error, Reference::parse("-tag"));
    CHECK_THROWS(libskiff::Error, Reference::parse("t@g"));
    CHECK_THROWS(libskiff::Error, Reference::parse(std::string(129, 't')));
}

TEST(DigestTestGroup, repositoryName) {
    validateRepositoryName("library/alpine");
    validateRepositoryName("org/team/project-1");
    validateRepositoryName("alpine");

    CHECK_THROWS(libskiff::Error, validateRepositoryName(""));
    CHECK_THROWS(libskiff::Error, validateRepositoryName("Library/alpine"));
    CHECK_THROWS(libskiff::Error, validateRepositoryName("library//alpine"));
    CHECK_THROWS(libskiff::Error, validateRepositoryName("/alpine"));
    CHECK_THROWS(libskiff::Error, validateRepositoryName("registry.example.com:5000/alpine"));
    CHECK_THROWS(libskiff::Error, validateRepositoryName(std::string(256, 'a')));
}

}}}

SKIFF_UNITTEST_MAIN_FUNCTION();
