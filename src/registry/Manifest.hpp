/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_registry_Manifest_hpp
#define skiff_registry_Manifest_hpp

#include <cstdint>
#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/variant.hpp>

#include "registry/Digest.hpp"
#include "registry/MediaTypes.hpp"
#include "registry/RegistryError.hpp"


namespace skiff {
namespace registry {

struct Descriptor {
    std::string mediaType;
    Digest digest;
    boost::optional<uint64_t> size;
};

struct Platform {
    std::string architecture;
    std::string os;
    std::string osVersion;
    std::string variant;
    std::vector<std::string> features;

    std::string string() const;  // e.g. "linux/arm64/v8"
};

struct SchemaV1Manifest {
    std::string name;
    std::string tag;
    std::string architecture;
    // In manifest order, i.e. from the topmost layer to the base layer
    std::vector<Digest> layerDigests;
};

struct SchemaV2Manifest {
    Descriptor config;
    // From the base layer to the topmost layer
    std::vector<Descriptor> layers;
};

struct ManifestListEntry {
    Platform platform;
    Digest digest;
    std::string mediaType;
    boost::optional<uint64_t> size;
};

struct ManifestList {
    std::vector<ManifestListEntry> manifests;
};

using ManifestContent = boost::variant<SchemaV1Manifest, SchemaV2Manifest, ManifestList>;

/**
 * A manifest as returned by the registry, verified against its digest.
 */
class ManifestDescriptor {
public:
    ManifestDescriptor() = default;
    ManifestDescriptor(std::string mediaType, std::string body, Digest digest, ManifestContent content);

    const std::string& getMediaType() const { return mediaType; }
    const std::string& getBody() const { return body; }
    const Digest& getDigest() const { return digest; }
    const ManifestContent& getContent() const { return content; }

    bool isManifestList() const;
    // Throw libskiff::Error if the content is of a different kind
    const SchemaV1Manifest& getSchemaV1() const;
    const SchemaV2Manifest& getSchemaV2() const;
    const ManifestList& getManifestList() const;

    // Empty for manifest lists
    std::vector<Digest> getLayerDigests() const;

private:
    std::string mediaType;
    std::string body;
    Digest digest;
    ManifestContent content;
};

// Throws RegistryError(MalformedManifest) if the body does not match the kind
ManifestContent parseManifest(ManifestKind kind, const std::string& body, const ErrorContext& context);

/**
 * Payload of a signed schema 1 manifest (JWS JSON serialization with the
 * "signatures" member appended), which is what the registry digests.
 * The payload is rebuilt from the formatLength and formatTail fields of
 * the first signature's protected header. A formatLength that does not end
 * right before the "signatures" member is a MalformedManifest.
 */
std::string extractJwsPayload(const std::string& body, const ErrorContext& context);

}
}

#endif
