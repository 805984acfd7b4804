/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_cli_Utility_hpp
#define skiff_cli_Utility_hpp

#include <iostream>
#include <string>
#include <tuple>

#include <boost/format.hpp>
#include <boost/program_options.hpp>

#include "libskiff/Logger.hpp"
#include "libskiff/Error.hpp"
#include "libskiff/CLIArguments.hpp"
#include "common/Config.hpp"
#include "common/ImageReference.hpp"
#include "registry/RegistryClient.hpp"

namespace skiff {
namespace cli {
namespace utility {

// True if the first component of the image name is a registry host
bool hasExplicitServer(const std::string& input);

/**
 * Parses "[server/]repository[:tag][@digest]". Without an explicit server the
 * registry of the configuration is used (Docker Hub if none is configured).
 */
common::ImageReference parseImageReference(const std::string& input, const common::Config& config);

// As parseImageReference, but tags and digests are not accepted
common::ImageReference parseRepositoryReference(const std::string& input, const common::Config& config);

// Selects the registry server, falling back to the configured one and then to Docker Hub
void setRegistryServer(common::Config& config, const std::string& server);

registry::RegistryClient makeRegistryClient(const common::Config& config);

std::tuple<libskiff::CLIArguments, libskiff::CLIArguments> groupOptionsAndPositionalArguments(
        const libskiff::CLIArguments&,
        const boost::program_options::options_description& optionsDescription);

void validateNumberOfPositionalArguments(const libskiff::CLIArguments& positionalArgs,
        const int min, const int max, const std::string& command);

std::string readPasswordFromStdin();

void printLog(  const std::string& message, libskiff::LogLevel LogLevel,
                std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr);

void printLog(  const boost::format& message, libskiff::LogLevel LogLevel,
                std::ostream& outStream=std::cout, std::ostream& errStream=std::cerr);

}
}
}

#endif
