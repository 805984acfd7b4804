/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_registry_MediaTypes_hpp
#define skiff_registry_MediaTypes_hpp

#include <string>
#include <vector>

#include <boost/optional.hpp>


namespace skiff {
namespace registry {
namespace mediatypes {

extern const char* const dockerManifestV2;
extern const char* const dockerManifestList;
extern const char* const ociManifest;
extern const char* const ociIndex;
extern const char* const dockerManifestV1Signed;
extern const char* const dockerManifestV1;

}

enum class ManifestKind { SchemaV1, SignedSchemaV1, SchemaV2, ManifestList };

// Accepted manifest media types, in order of preference
const std::vector<std::string>& getDefaultManifestMediaTypes();

std::string makeAcceptHeader(const std::vector<std::string>& mediaTypes);

// "application/json; charset=utf-8" -> "application/json"
std::string stripMediaTypeParameters(const std::string& contentType);

// Empty for media types that are not manifests
boost::optional<ManifestKind> classifyManifestMediaType(const std::string& mediaType);

}
}

#endif
