/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_registry_Digest_hpp
#define skiff_registry_Digest_hpp

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>

#include <openssl/evp.h>


namespace skiff {
namespace registry {

enum class DigestAlgorithm { SHA256, SHA512 };

std::string toString(DigestAlgorithm);
size_t getHexLength(DigestAlgorithm);

/**
 * Content address of a manifest or blob, in the form "algorithm:hex".
 * The hex part is always lowercase.
 */
class Digest {
public:
    // Placeholder value (e.g. for default-constructed task results), never equal to a parsed digest
    Digest() = default;

    static Digest parse(const std::string& digestString);
    // Whether the string is meant as a digest (algorithm:hex), regardless of its validity
    static bool isDigestString(const std::string& string);
    static Digest fromBytes(DigestAlgorithm algorithm, const void* data, size_t size);
    static Digest fromBytes(DigestAlgorithm algorithm, const std::string& data);

    DigestAlgorithm getAlgorithm() const { return algorithm; }
    const std::string& getHex() const { return hex; }
    std::string string() const;

private:
    friend class DigestAccumulator;

    Digest(DigestAlgorithm algorithm, std::string hex);

private:
    DigestAlgorithm algorithm = DigestAlgorithm::SHA256;
    std::string hex;
};

bool operator==(const Digest&, const Digest&);
bool operator!=(const Digest&, const Digest&);
bool operator<(const Digest&, const Digest&);
std::ostream& operator<<(std::ostream&, const Digest&);

/**
 * Incremental hash over a byte sequence, finalized once into a Digest.
 */
class DigestAccumulator {
public:
    explicit DigestAccumulator(DigestAlgorithm algorithm = DigestAlgorithm::SHA256);

    void update(const void* data, size_t size);
    void update(const std::string& data);
    Digest finalize();

    DigestAlgorithm getAlgorithm() const { return algorithm; }
    uint64_t getByteCount() const { return byteCount; }
    bool isFinalized() const { return finalized; }

private:
    struct ContextDeleter {
        void operator()(EVP_MD_CTX* context) const {
            EVP_MD_CTX_free(context);
        }
    };

    DigestAlgorithm algorithm;
    std::unique_ptr<EVP_MD_CTX, ContextDeleter> context;
    uint64_t byteCount = 0;
    bool finalized = false;
};

}
}

#endif
