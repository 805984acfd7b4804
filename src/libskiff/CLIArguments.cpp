/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "CLIArguments.hpp"

#include <cstdlib>
#include <cstring>

#include <boost/algorithm/string/join.hpp>

namespace libskiff {

CLIArguments::CLIArguments() {
    args.push_back(nullptr); // array is null-terminated
}

CLIArguments::CLIArguments(const CLIArguments& rhs) : CLIArguments() {
    for(auto* arg : rhs) {
        push_back(arg);
    }
}

CLIArguments::CLIArguments(int argc, char* argv[]) : CLIArguments() {
    for(int i=0; i<argc; ++i) {
        push_back(argv[i]);
    }
}

CLIArguments::CLIArguments(std::initializer_list<std::string> args) : CLIArguments() {
    for(const auto& arg : args) {
        push_back(arg);
    }
}

CLIArguments::~CLIArguments() {
    clear();
}

CLIArguments& CLIArguments::operator=(const CLIArguments& rhs) {
    if(this == &rhs) {
        return *this;
    }
    clear();
    for(auto* arg : rhs) {
        push_back(arg);
    }
    return *this;
}

void CLIArguments::push_back(const std::string& arg) {
    args.back() = strdup(arg.c_str());
    args.push_back(nullptr);
}

int CLIArguments::argc() const {
    return static_cast<int>(args.size()) - 1;
}

char** CLIArguments::argv() const {
    return const_cast<char**>(args.data());
}

CLIArguments::const_iterator CLIArguments::begin() const {
    return args.cbegin();
}

CLIArguments::const_iterator CLIArguments::end() const {
    return args.cend() - 1;
}

bool CLIArguments::empty() const {
    return begin() == end();
}

void CLIArguments::clear() {
    for(auto* ptr : args) {
        free(ptr);
    }
    args = { nullptr };
}

std::string CLIArguments::string() const {
    auto stringArgs = std::vector<std::string>{begin(), end()};
    return boost::algorithm::join(stringArgs, " ");
}

bool operator==(const CLIArguments& lhs, const CLIArguments& rhs) {
    if(lhs.argc() != rhs.argc()) {
        return false;
    }
    for(int i=0; i<lhs.argc(); ++i) {
        if(strcmp(lhs.argv()[i], rhs.argv()[i]) != 0) {
            return false;
        }
    }
    return true;
}

std::ostream& operator<<(std::ostream& os, const CLIArguments& args) {
    os << "[";
    auto separator = "";
    for(const auto* arg : args) {
        os << separator << "\"" << arg << "\"";
        separator = ", ";
    }
    os << "]";
    return os;
}

}
