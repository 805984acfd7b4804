/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_registry_ManifestResolver_hpp
#define skiff_registry_ManifestResolver_hpp

#include <memory>
#include <string>
#include <vector>

#include <boost/format.hpp>
#include <boost/optional.hpp>
#include <pplx/pplxtasks.h>

#include "libskiff/LogLevel.hpp"
#include "registry/Manifest.hpp"
#include "registry/Reference.hpp"
#include "registry/RequestPipeline.hpp"


namespace skiff {
namespace registry {

/**
 * Fetches manifests by tag or digest. A manifest is handed out only after
 * its digest matched the requested digest and the Docker-Content-Digest
 * header sent by the registry.
 */
class ManifestResolver {
public:
    // An empty list of media types means the default list
    ManifestResolver(std::shared_ptr<const RequestPipeline> pipeline,
                     std::vector<std::string> acceptedMediaTypes = {});

    pplx::task<ManifestDescriptor> resolve(const std::string& repository, const Reference& reference) const;
    pplx::task<ManifestDescriptor> resolveChild(const std::string& repository, const ManifestListEntry& entry) const;
    // HEAD request: false if the registry reports the manifest as not found
    pplx::task<bool> exists(const std::string& repository, const Reference& reference) const;

    const std::vector<std::string>& getAcceptedMediaTypes() const { return acceptedMediaTypes; }

private:
    ManifestDescriptor verifyAndParse(const std::string& repository, const Reference& reference,
                                      const HeaderMap& headers, std::string body) const;
    void printLog(const boost::format& message, libskiff::LogLevel level) const;

private:
    std::shared_ptr<const RequestPipeline> pipeline;
    std::vector<std::string> acceptedMediaTypes;
};

/**
 * First entry of the list matching the platform. An empty variant matches
 * any variant. Returns an empty optional if no entry matches.
 */
boost::optional<ManifestListEntry> selectPlatform(const ManifestList& list,
                                                  const std::string& os,
                                                  const std::string& architecture,
                                                  const std::string& variant = std::string{});

}
}

#endif
