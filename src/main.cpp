/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <exception>
#include <clocale>
#include <memory>

#include <unistd.h>

#include <boost/filesystem.hpp>
#include <boost/format.hpp>

#include "common/Config.hpp"
#include "libskiff/CLIArguments.hpp"
#include "libskiff/Error.hpp"
#include "libskiff/Logger.hpp"
#include "libskiff/utility/environment.hpp"
#include "cli/CLI.hpp"

using namespace skiff;

static std::shared_ptr<common::Config> makeConfig(const boost::filesystem::path& prefixDir);

int main(int argc, char* argv[]) {
    std::setlocale(LC_CTYPE, "C.UTF-8"); // enable handling of non-ascii characters

    auto& logger = libskiff::Logger::getInstance();

    try {
        auto skiffInstallationPrefixDir = boost::filesystem::canonical("/proc/self/exe").parent_path().parent_path();
        auto config = makeConfig(skiffInstallationPrefixDir);
        config->hostEnvironment = libskiff::environment::parseVariables(environ);

        auto args = libskiff::CLIArguments(argc, argv);
        auto command = cli::CLI{}.parseCommandLine(args, config);
        command->execute();
    }
    catch(const libskiff::Error& e) {
        logger.logErrorTrace(e, "main");
        return 1;
    }
    catch(const std::exception& e) {
        auto message = boost::format("Caught exception in main function. No error trace available."
                                     " Exception message: %s") % e.what();
        logger.log(message.str(), "main", libskiff::LogLevel::ERROR);
        return 1;
    }

    return 0;
}

/**
 * The installed configuration file is optional: without it Skiff talks to
 * Docker Hub with the default settings.
 */
static std::shared_ptr<common::Config> makeConfig(const boost::filesystem::path& prefixDir) {
    if(boost::filesystem::exists(prefixDir / "etc/skiff.json")) {
        return std::make_shared<common::Config>(prefixDir);
    }
    auto config = std::make_shared<common::Config>();
    config->prefixDir = prefixDir;
    return config;
}
