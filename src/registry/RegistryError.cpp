/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "registry/RegistryError.hpp"


namespace skiff {
namespace registry {

std::string toString(ErrorKind kind) {
    switch(kind) {
        case ErrorKind::MalformedDigest:         return "MalformedDigest";
        case ErrorKind::MalformedChallenge:      return "MalformedChallenge";
        case ErrorKind::AuthServerError:         return "AuthServerError";
        case ErrorKind::AuthenticationFailed:    return "AuthenticationFailed";
        case ErrorKind::NotFound:                return "NotFound";
        case ErrorKind::DigestMismatch:          return "DigestMismatch";
        case ErrorKind::TruncatedBlob:           return "TruncatedBlob";
        case ErrorKind::UnsupportedManifestType: return "UnsupportedManifestType";
        case ErrorKind::MalformedManifest:       return "MalformedManifest";
        case ErrorKind::RegistryRejected:        return "RegistryRejected";
        case ErrorKind::Transient:               return "Transient";
        case ErrorKind::TransportError:          return "TransportError";
    }
    SKIFF_THROW_ERROR("failed to convert unknown registry error kind to string");
}

std::string toString(NotFoundTarget target) {
    switch(target) {
        case NotFoundTarget::None:       return "none";
        case NotFoundTarget::Manifest:   return "manifest";
        case NotFoundTarget::Blob:       return "blob";
        case NotFoundTarget::Repository: return "repository";
    }
    SKIFF_THROW_ERROR("failed to convert unknown not-found target to string");
}

std::ostream& operator<<(std::ostream& os, ErrorKind kind) {
    os << toString(kind);
    return os;
}

}
}
