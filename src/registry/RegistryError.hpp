/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_registry_RegistryError_hpp
#define skiff_registry_RegistryError_hpp

#include <ostream>
#include <string>

#include <boost/optional.hpp>

#include "libskiff/Error.hpp"


namespace skiff {
namespace registry {

enum class ErrorKind {
    MalformedDigest,
    MalformedChallenge,
    AuthServerError,
    AuthenticationFailed,
    NotFound,
    DigestMismatch,
    TruncatedBlob,
    UnsupportedManifestType,
    MalformedManifest,
    RegistryRejected,
    Transient,
    TransportError
};

enum class NotFoundTarget { None, Manifest, Blob, Repository };

/**
 * What the failed operation was about. Fields that do not apply are left empty.
 */
struct ErrorContext {
    std::string repository;
    std::string reference;  // tag or digest
    boost::optional<int> httpStatus;
    std::string responseBody;
    NotFoundTarget notFoundTarget = NotFoundTarget::None;
};

/**
 * Error caused by the remote registry, the auth server or the content they returned.
 *
 * Thrown through SKIFF_THROW_REGISTRY_ERROR; it can be rethrown with
 * SKIFF_RETHROW_ERROR like any libskiff::Error, which keeps kind and context.
 */
class RegistryError : public libskiff::Error {
public:
    RegistryError(ErrorKind kind, const ErrorContext& context, const ErrorTraceEntry& entry)
        : libskiff::Error{libskiff::LogLevel::ERROR, entry}
        , kind{kind}
        , context{context}
    {}

    ErrorKind getKind() const {
        return kind;
    }

    const ErrorContext& getContext() const {
        return context;
    }

    // DigestMismatch and TruncatedBlob: any content already consumed must be discarded
    bool isIntegrityFailure() const {
        return kind == ErrorKind::DigestMismatch || kind == ErrorKind::TruncatedBlob;
    }

private:
    ErrorKind kind;
    ErrorContext context;
};

std::string toString(ErrorKind);
std::string toString(NotFoundTarget);
std::ostream& operator<<(std::ostream&, ErrorKind);

}
}

#define SKIFF_THROW_REGISTRY_ERROR(kind, context, errorMessage) { \
    throw skiff::registry::RegistryError{kind, context, SKIFF_MAKE_ERROR_TRACE_ENTRY(errorMessage)}; \
}

#endif
