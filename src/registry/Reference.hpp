/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_registry_Reference_hpp
#define skiff_registry_Reference_hpp

#include <ostream>
#include <string>

#include <boost/optional.hpp>

#include "registry/Digest.hpp"


namespace skiff {
namespace registry {

/**
 * Manifest reference: either a tag or a digest.
 */
class Reference {
public:
    // A string containing ':' is parsed as a digest (MalformedDigest on failure),
    // anything else must be a valid tag.
    static Reference parse(const std::string& reference);
    static Reference fromTag(const std::string& tag);
    static Reference fromDigest(const Digest& digest);

    bool isDigest() const { return static_cast<bool>(digest); }
    const std::string& getTag() const;
    const Digest& getDigest() const;
    std::string string() const;

private:
    Reference() = default;

private:
    std::string tag;
    boost::optional<Digest> digest;
};

std::ostream& operator<<(std::ostream&, const Reference&);

// Throws libskiff::Error if the repository name is not valid for the registry API
void validateRepositoryName(const std::string& repository);

}
}

#endif
