/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "registry/MediaTypes.hpp"

#include <boost/algorithm/string.hpp>


namespace skiff {
namespace registry {
namespace mediatypes {

const char* const dockerManifestV2 = "application/vnd.docker.distribution.manifest.v2+json";
const char* const dockerManifestList = "application/vnd.docker.distribution.manifest.list.v2+json";
const char* const ociManifest = "application/vnd.oci.image.manifest.v1+json";
const char* const ociIndex = "application/vnd.oci.image.index.v1+json";
const char* const dockerManifestV1Signed = "application/vnd.docker.distribution.manifest.v1+prettyjws";
const char* const dockerManifestV1 = "application/vnd.docker.distribution.manifest.v1+json";

}

const std::vector<std::string>& getDefaultManifestMediaTypes() {
    static const auto mediaTypes = std::vector<std::string>{
        mediatypes::dockerManifestV2,
        mediatypes::dockerManifestList,
        mediatypes::ociManifest,
        mediatypes::ociIndex,
        mediatypes::dockerManifestV1Signed,
        mediatypes::dockerManifestV1
    };
    return mediaTypes;
}

std::string makeAcceptHeader(const std::vector<std::string>& mediaTypes) {
    return boost::algorithm::join(mediaTypes, ", ");
}

std::string stripMediaTypeParameters(const std::string& contentType) {
    auto mediaType = contentType.substr(0, contentType.find(';'));
    boost::algorithm::trim(mediaType);
    boost::algorithm::to_lower(mediaType);
    return mediaType;
}

boost::optional<ManifestKind> classifyManifestMediaType(const std::string& mediaType) {
    if(mediaType == mediatypes::dockerManifestV2 || mediaType == mediatypes::ociManifest) {
        return ManifestKind::SchemaV2;
    }
    if(mediaType == mediatypes::dockerManifestList || mediaType == mediatypes::ociIndex) {
        return ManifestKind::ManifestList;
    }
    if(mediaType == mediatypes::dockerManifestV1Signed) {
        return ManifestKind::SignedSchemaV1;
    }
    if(mediaType == mediatypes::dockerManifestV1) {
        return ManifestKind::SchemaV1;
    }
    return boost::none;
}

}
}
