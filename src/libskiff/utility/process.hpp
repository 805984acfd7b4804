/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libskiff_utility_process_hpp
#define libskiff_utility_process_hpp

#include <string>

/**
 * Utility functions for process information
 */

namespace libskiff {
namespace process {

std::string getHostname();
void setStdinEcho(bool flag);

}}

#endif
