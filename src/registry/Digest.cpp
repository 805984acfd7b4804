/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "registry/Digest.hpp"

#include <cctype>
#include <utility>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>

#include "libskiff/Error.hpp"
#include "registry/RegistryError.hpp"


namespace skiff {
namespace registry {

static const EVP_MD* getMessageDigest(DigestAlgorithm algorithm) {
    switch(algorithm) {
        case DigestAlgorithm::SHA256: return EVP_sha256();
        case DigestAlgorithm::SHA512: return EVP_sha512();
    }
    SKIFF_THROW_ERROR("unknown digest algorithm");
}

std::string toString(DigestAlgorithm algorithm) {
    switch(algorithm) {
        case DigestAlgorithm::SHA256: return "sha256";
        case DigestAlgorithm::SHA512: return "sha512";
    }
    SKIFF_THROW_ERROR("failed to convert unknown digest algorithm to string");
}

size_t getHexLength(DigestAlgorithm algorithm) {
    switch(algorithm) {
        case DigestAlgorithm::SHA256: return 64;
        case DigestAlgorithm::SHA512: return 128;
    }
    SKIFF_THROW_ERROR("unknown digest algorithm");
}

static std::string encodeHex(const unsigned char* data, size_t size) {
    static const char* characters = "0123456789abcdef";
    auto hex = std::string(size * 2, '0');
    for(size_t i=0; i<size; ++i) {
        hex[2*i]   = characters[data[i] >> 4];
        hex[2*i+1] = characters[data[i] & 0x0f];
    }
    return hex;
}

Digest::Digest(DigestAlgorithm algorithm, std::string hex)
    : algorithm{algorithm}
    , hex{std::move(hex)}
{}

Digest Digest::parse(const std::string& digestString) {
    auto context = ErrorContext{};
    context.reference = digestString;

    auto separator = digestString.find(':');
    if(separator == std::string::npos) {
        auto message = boost::format("Malformed digest '%s': expected the form algorithm:hex") % digestString;
        SKIFF_THROW_REGISTRY_ERROR(ErrorKind::MalformedDigest, context, message.str());
    }

    auto algorithmString = digestString.substr(0, separator);
    auto hex = boost::algorithm::to_lower_copy(digestString.substr(separator + 1));

    DigestAlgorithm algorithm;
    if(algorithmString == "sha256") {
        algorithm = DigestAlgorithm::SHA256;
    }
    else if(algorithmString == "sha512") {
        algorithm = DigestAlgorithm::SHA512;
    }
    else {
        auto message = boost::format("Malformed digest '%s': unsupported algorithm '%s'") % digestString % algorithmString;
        SKIFF_THROW_REGISTRY_ERROR(ErrorKind::MalformedDigest, context, message.str());
    }

    if(hex.size() != getHexLength(algorithm)) {
        auto message = boost::format("Malformed digest '%s': expected %d hex characters for %s, found %d")
            % digestString % getHexLength(algorithm) % algorithmString % hex.size();
        SKIFF_THROW_REGISTRY_ERROR(ErrorKind::MalformedDigest, context, message.str());
    }

    for(auto c : hex) {
        if(!std::isxdigit(static_cast<unsigned char>(c))) {
            auto message = boost::format("Malformed digest '%s': invalid hex character '%c'") % digestString % c;
            SKIFF_THROW_REGISTRY_ERROR(ErrorKind::MalformedDigest, context, message.str());
        }
    }

    return Digest{algorithm, hex};
}

bool Digest::isDigestString(const std::string& string) {
    return string.find(':') != std::string::npos;
}

Digest Digest::fromBytes(DigestAlgorithm algorithm, const void* data, size_t size) {
    auto accumulator = DigestAccumulator{algorithm};
    accumulator.update(data, size);
    return accumulator.finalize();
}

Digest Digest::fromBytes(DigestAlgorithm algorithm, const std::string& data) {
    return fromBytes(algorithm, data.data(), data.size());
}

std::string Digest::string() const {
    return toString(algorithm) + ":" + hex;
}

bool operator==(const Digest& lhs, const Digest& rhs) {
    return lhs.getAlgorithm() == rhs.getAlgorithm() && lhs.getHex() == rhs.getHex();
}

bool operator!=(const Digest& lhs, const Digest& rhs) {
    return !(lhs == rhs);
}

bool operator<(const Digest& lhs, const Digest& rhs) {
    return lhs.string() < rhs.string();
}

std::ostream& operator<<(std::ostream& os, const Digest& digest) {
    os << digest.string();
    return os;
}

DigestAccumulator::DigestAccumulator(DigestAlgorithm algorithm)
    : algorithm{algorithm}
    , context{EVP_MD_CTX_new()}
{
    if(!context) {
        SKIFF_THROW_ERROR("Failed to allocate OpenSSL message digest context");
    }
    if(EVP_DigestInit_ex(context.get(), getMessageDigest(algorithm), nullptr) != 1) {
        auto message = boost::format("Failed to initialize %s message digest") % toString(algorithm);
        SKIFF_THROW_ERROR(message.str());
    }
}

void DigestAccumulator::update(const void* data, size_t size) {
    if(finalized) {
        SKIFF_THROW_ERROR("Attempted to update a digest accumulator that was already finalized");
    }
    if(size == 0) {
        return;
    }
    if(EVP_DigestUpdate(context.get(), data, size) != 1) {
        auto message = boost::format("Failed to update %s message digest") % toString(algorithm);
        SKIFF_THROW_ERROR(message.str());
    }
    byteCount += size;
}

void DigestAccumulator::update(const std::string& data) {
    update(data.data(), data.size());
}

Digest DigestAccumulator::finalize() {
    if(finalized) {
        SKIFF_THROW_ERROR("Attempted to finalize a digest accumulator twice");
    }

    auto hash = std::vector<unsigned char>(EVP_MAX_MD_SIZE);
    unsigned int length = 0;
    if(EVP_DigestFinal_ex(context.get(), hash.data(), &length) != 1) {
        auto message = boost::format("Failed to finalize %s message digest") % toString(algorithm);
        SKIFF_THROW_ERROR(message.str());
    }
    finalized = true;

    return Digest{algorithm, encodeHex(hash.data(), length)};
}

}
}
