/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_cli_CLI_hpp
#define skiff_cli_CLI_hpp

#include <memory>

#include <boost/program_options.hpp>

#include "libskiff/CLIArguments.hpp"
#include "common/Config.hpp"
#include "cli/Command.hpp"


namespace skiff {
namespace cli {

class CLI {
public:
    CLI();
    std::unique_ptr<cli::Command> parseCommandLine(const libskiff::CLIArguments&, std::shared_ptr<common::Config>) const;

// these methods are public for test purpose
public:
    const boost::program_options::options_description& getOptionsDescription() const;

private:
    std::unique_ptr<cli::Command> parseCommandHelpOfCommand(const libskiff::CLIArguments&) const;
    void loadConfigFile(const boost::filesystem::path& configFile, common::Config& config) const;

private:
    boost::program_options::options_description optionsDescription{"Options"};
};

}
}

#endif
