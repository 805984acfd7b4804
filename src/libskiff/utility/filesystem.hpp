/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libskiff_utility_filesystem_hpp
#define libskiff_utility_filesystem_hpp

#include <boost/filesystem.hpp>

/**
 * Utility functions for filesystem operations
 */

namespace libskiff {
namespace filesystem {

boost::filesystem::path makeUniquePathWithRandomSuffix(const boost::filesystem::path& path);
void createFoldersIfNecessary(const boost::filesystem::path& path);

}}

#endif
