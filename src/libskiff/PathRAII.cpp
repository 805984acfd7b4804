/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "PathRAII.hpp"

namespace libskiff {

PathRAII::PathRAII(const boost::filesystem::path& path)
    : path{path}
{}

PathRAII::PathRAII(PathRAII&& rhs)
    : path{std::move(rhs.path)}
{
    rhs.release();
}

PathRAII& PathRAII::operator=(PathRAII&& rhs) {
    path = std::move(rhs.path);
    rhs.release();
    return *this;
}

PathRAII::~PathRAII() {
    if(path) {
        // removal errors are not propagated out of a destructor
        auto ec = boost::system::error_code{};
        boost::filesystem::remove_all(*path, ec);
    }
}

const boost::filesystem::path& PathRAII::getPath() const {
    return path.value();
}

void PathRAII::release() {
    path.reset();
}

}
