/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_common_regex_hpp
#define skiff_common_regex_hpp

#include <boost/regex.hpp>

namespace skiff {
namespace common {
namespace regex {

// Image references: [domain/]repository[:tag][@digest]
extern const boost::regex domain;
extern const boost::regex name;
extern const boost::regex repository;
extern const boost::regex tag;
extern const boost::regex digest;
// Anchored, captures name, tag and digest
extern const boost::regex reference;

// Registry base URL http(s)://domain, captures scheme and domain
extern const boost::regex registryUrl;

// OS/ARCH[/VARIANT], captures the three components
extern const boost::regex platform;

}
}
}

#endif
