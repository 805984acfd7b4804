/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <sstream>
#include <string>
#include <vector>

#include "libskiff/CLIArguments.hpp"
#include "aux/unitTestMain.hpp"


namespace libskiff {
namespace test {

TEST_GROUP(CLIArgumentsTestGroup) {
};

TEST(CLIArgumentsTestGroup, argcAndArgv) {
    auto args = libskiff::CLIArguments{"skiff", "tags", "alpine"};

    CHECK_EQUAL(args.argc(), 3);
    STRCMP_EQUAL(args.argv()[0], "skiff");
    STRCMP_EQUAL(args.argv()[2], "alpine");
    // null-terminated, as expected by getopt-like parsers
    CHECK(args.argv()[3] == nullptr);
    CHECK(!args.empty());

    args.clear();
    CHECK_EQUAL(args.argc(), 0);
    CHECK(args.empty());
    CHECK(args.argv()[0] == nullptr);
}

TEST(CLIArgumentsTestGroup, copyAndSubrange) {
    auto args = libskiff::CLIArguments{"skiff", "--debug", "ping"};

    auto copy = args;
    CHECK(copy == args);

    auto tail = libskiff::CLIArguments{args.begin() + 1, args.end()};
    CHECK(tail == (libskiff::CLIArguments{"--debug", "ping"}));

    tail.push_back("registry.example.com");
    CHECK_EQUAL(tail.argc(), 3);
    CHECK(!(tail == args));
}

TEST(CLIArgumentsTestGroup, serialize) {
    auto args = libskiff::CLIArguments{"command", "arg0", "arg1"};

    std::stringstream os;
    os << args;

    CHECK_EQUAL(os.str(), std::string{"[\"command\", \"arg0\", \"arg1\"]"});
}

TEST(CLIArgumentsTestGroup, string) {
    auto args = libskiff::CLIArguments{"command", "arg0", "arg1"};
    CHECK_EQUAL(args.string(), std::string{"command arg0 arg1"});
}

}}

SKIFF_UNITTEST_MAIN_FUNCTION();
