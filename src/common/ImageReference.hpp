/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_common_ImageReference_hpp
#define skiff_common_ImageReference_hpp

#include <string>
#include <ostream>


namespace skiff {
namespace common {

/**
 * An image reference of the form [server/]repository[:tag][@digest].
 *
 * The repository is kept as a single path (e.g. "library/alpine"), which is the
 * name the registry API expects in /v2/<repository>/... paths.
 */
struct ImageReference {
    std::string server;
    std::string repository;
    std::string tag;
    std::string digest;

    std::string getFullName() const;
    std::string string() const;
    // Reference to resolve on the registry: the digest if present, the tag otherwise
    std::string getManifestReference() const;
    ImageReference normalize() const;

    static ImageReference parse(const std::string& input);

    static const std::string DEFAULT_SERVER;
    static const std::string DEFAULT_REPOSITORY_NAMESPACE;
    static const std::string DEFAULT_TAG;
};

bool operator==(const ImageReference&, const ImageReference&);

std::ostream& operator<<(std::ostream&, const ImageReference&);

}
}

#endif
