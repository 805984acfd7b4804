/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "registry/Manifest.hpp"

#include <cstring>
#include <utility>

#include <boost/format.hpp>
#include <rapidjson/document.h>

#include "libskiff/Error.hpp"
#include "libskiff/utility/base64.hpp"
#include "libskiff/utility/json.hpp"


namespace skiff {
namespace registry {

std::string Platform::string() const {
    auto output = os + "/" + architecture;
    if(!variant.empty()) {
        output += "/" + variant;
    }
    return output;
}

ManifestDescriptor::ManifestDescriptor(std::string mediaType, std::string body, Digest digest, ManifestContent content)
    : mediaType{std::move(mediaType)}
    , body{std::move(body)}
    , digest{std::move(digest)}
    , content{std::move(content)}
{}

bool ManifestDescriptor::isManifestList() const {
    return boost::get<ManifestList>(&content) != nullptr;
}

const SchemaV1Manifest& ManifestDescriptor::getSchemaV1() const {
    const auto* manifest = boost::get<SchemaV1Manifest>(&content);
    if(!manifest) {
        auto message = boost::format("Manifest %s (%s) is not a schema 1 manifest") % digest % mediaType;
        SKIFF_THROW_ERROR(message.str());
    }
    return *manifest;
}

const SchemaV2Manifest& ManifestDescriptor::getSchemaV2() const {
    const auto* manifest = boost::get<SchemaV2Manifest>(&content);
    if(!manifest) {
        auto message = boost::format("Manifest %s (%s) is not an image manifest") % digest % mediaType;
        SKIFF_THROW_ERROR(message.str());
    }
    return *manifest;
}

const ManifestList& ManifestDescriptor::getManifestList() const {
    const auto* list = boost::get<ManifestList>(&content);
    if(!list) {
        auto message = boost::format("Manifest %s (%s) is not a manifest list") % digest % mediaType;
        SKIFF_THROW_ERROR(message.str());
    }
    return *list;
}

std::vector<Digest> ManifestDescriptor::getLayerDigests() const {
    if(const auto* v1 = boost::get<SchemaV1Manifest>(&content)) {
        return v1->layerDigests;
    }
    auto digests = std::vector<Digest>{};
    if(const auto* v2 = boost::get<SchemaV2Manifest>(&content)) {
        for(const auto& layer : v2->layers) {
            digests.push_back(layer.digest);
        }
    }
    return digests;
}

namespace {

[[noreturn]] void throwMalformed(const ErrorContext& context, const std::string& reason) {
    auto message = boost::format("Malformed manifest %s of repository %s: %s")
        % context.reference % context.repository % reason;
    SKIFF_THROW_REGISTRY_ERROR(ErrorKind::MalformedManifest, context, message.str());
}

rapidjson::Document parseJson(const std::string& body, const ErrorContext& context) {
    auto json = rapidjson::Document{};
    json.Parse(body.c_str(), body.size());
    if(json.HasParseError() || !json.IsObject()) {
        throwMalformed(context, "body is not a JSON object");
    }
    return json;
}

const rapidjson::Value& getMember(const rapidjson::Value& object, const char* name, const ErrorContext& context) {
    auto it = object.FindMember(name);
    if(it == object.MemberEnd()) {
        throwMalformed(context, std::string{"missing field '"} + name + "'");
    }
    return it->value;
}

std::string getString(const rapidjson::Value& object, const char* name, const ErrorContext& context) {
    const auto& value = getMember(object, name, context);
    if(!value.IsString()) {
        throwMalformed(context, std::string{"field '"} + name + "' is not a string");
    }
    return std::string(value.GetString(), value.GetStringLength());
}

const rapidjson::Value& getArray(const rapidjson::Value& object, const char* name, const ErrorContext& context) {
    const auto& value = getMember(object, name, context);
    if(!value.IsArray()) {
        throwMalformed(context, std::string{"field '"} + name + "' is not an array");
    }
    return value;
}

Digest getDigest(const rapidjson::Value& object, const char* name, const ErrorContext& context) {
    auto digestString = getString(object, name, context);
    try {
        return Digest::parse(digestString);
    }
    catch(const RegistryError& e) {
        throwMalformed(context, e.what());
    }
}

boost::optional<uint64_t> getOptionalSize(const rapidjson::Value& object) {
    auto it = object.FindMember("size");
    if(it == object.MemberEnd() || !it->value.IsUint64()) {
        return boost::none;
    }
    return it->value.GetUint64();
}

void checkSchemaVersion(const rapidjson::Value& json, int expected, const ErrorContext& context) {
    const auto& version = getMember(json, "schemaVersion", context);
    if(!version.IsInt() || version.GetInt() != expected) {
        throwMalformed(context, (boost::format("expected schemaVersion %d") % expected).str());
    }
}

Descriptor parseDescriptor(const rapidjson::Value& value, const ErrorContext& context) {
    if(!value.IsObject()) {
        throwMalformed(context, "descriptor is not a JSON object");
    }
    return Descriptor{ libskiff::json::getStringMember(value, "mediaType"),
                       getDigest(value, "digest", context),
                       getOptionalSize(value) };
}

Platform parsePlatform(const rapidjson::Value& entry) {
    auto platform = Platform{};
    auto it = entry.FindMember("platform");
    if(it == entry.MemberEnd() || !it->value.IsObject()) {
        return platform;
    }
    const auto& value = it->value;
    platform.architecture = libskiff::json::getStringMember(value, "architecture");
    platform.os = libskiff::json::getStringMember(value, "os");
    platform.osVersion = libskiff::json::getStringMember(value, "os.version");
    platform.variant = libskiff::json::getStringMember(value, "variant");
    auto features = value.FindMember("features");
    if(features != value.MemberEnd() && features->value.IsArray()) {
        for(const auto& feature : features->value.GetArray()) {
            if(feature.IsString()) {
                platform.features.push_back(feature.GetString());
            }
        }
    }
    return platform;
}

SchemaV1Manifest parseSchemaV1(const std::string& body, const ErrorContext& context) {
    auto json = parseJson(body, context);
    checkSchemaVersion(json, 1, context);

    auto manifest = SchemaV1Manifest{};
    manifest.name = getString(json, "name", context);
    manifest.tag = getString(json, "tag", context);
    manifest.architecture = libskiff::json::getStringMember(json, "architecture");
    for(const auto& layer : getArray(json, "fsLayers", context).GetArray()) {
        if(!layer.IsObject()) {
            throwMalformed(context, "entry of 'fsLayers' is not a JSON object");
        }
        manifest.layerDigests.push_back(getDigest(layer, "blobSum", context));
    }
    return manifest;
}

SchemaV2Manifest parseSchemaV2(const std::string& body, const ErrorContext& context) {
    auto json = parseJson(body, context);
    checkSchemaVersion(json, 2, context);

    auto config = parseDescriptor(getMember(json, "config", context), context);
    auto manifest = SchemaV2Manifest{config, {}};
    for(const auto& layer : getArray(json, "layers", context).GetArray()) {
        manifest.layers.push_back(parseDescriptor(layer, context));
    }
    return manifest;
}

ManifestList parseManifestList(const std::string& body, const ErrorContext& context) {
    auto json = parseJson(body, context);
    checkSchemaVersion(json, 2, context);

    auto list = ManifestList{};
    for(const auto& entry : getArray(json, "manifests", context).GetArray()) {
        if(!entry.IsObject()) {
            throwMalformed(context, "entry of 'manifests' is not a JSON object");
        }
        list.manifests.push_back(ManifestListEntry{ parsePlatform(entry),
                                                    getDigest(entry, "digest", context),
                                                    getString(entry, "mediaType", context),
                                                    getOptionalSize(entry) });
    }
    return list;
}

} // namespace

ManifestContent parseManifest(ManifestKind kind, const std::string& body, const ErrorContext& context) {
    switch(kind) {
        case ManifestKind::SchemaV1:
        case ManifestKind::SignedSchemaV1:
            return parseSchemaV1(body, context);
        case ManifestKind::SchemaV2:
            return parseSchemaV2(body, context);
        case ManifestKind::ManifestList:
            return parseManifestList(body, context);
    }
    SKIFF_THROW_ERROR("failed to parse manifest of unknown kind");
}

std::string extractJwsPayload(const std::string& body, const ErrorContext& context) {
    auto json = parseJson(body, context);

    const auto& signatures = getArray(json, "signatures", context);
    if(signatures.Empty() || !signatures[0].IsObject()) {
        throwMalformed(context, "signed manifest without signatures");
    }
    auto encodedHeader = getString(signatures[0], "protected", context);

    auto protectedHeader = rapidjson::Document{};
    try {
        auto decoded = libskiff::base64::decodeUrl(encodedHeader);
        protectedHeader = parseJson(decoded, context);
    }
    catch(const RegistryError&) {
        throw;
    }
    catch(const libskiff::Error& e) {
        throwMalformed(context, std::string{"invalid protected header: "} + e.what());
    }

    const auto& formatLength = getMember(protectedHeader, "formatLength", context);
    if(!formatLength.IsUint64() || formatLength.GetUint64() > body.size()) {
        throwMalformed(context, "invalid formatLength in protected header");
    }
    auto formatTail = std::string{};
    try {
        formatTail = libskiff::base64::decodeUrl(getString(protectedHeader, "formatTail", context));
    }
    catch(const RegistryError&) {
        throw;
    }
    catch(const libskiff::Error& e) {
        throwMalformed(context, std::string{"invalid formatTail in protected header: "} + e.what());
    }

    // the signed part must run up to the "signatures" member appended to it
    auto signedLength = static_cast<size_t>(formatLength.GetUint64());
    auto signaturesStart = body.find_first_not_of(", \t\r\n", signedLength);
    if(signedLength == 0 || signaturesStart == std::string::npos
       || body.compare(signaturesStart, std::strlen("\"signatures\""), "\"signatures\"") != 0) {
        throwMalformed(context, "formatLength in protected header does not end before the signatures");
    }

    return body.substr(0, signedLength) + formatTail;
}

}
}
