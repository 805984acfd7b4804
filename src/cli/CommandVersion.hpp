/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_cli_CommandVersion_hpp
#define skiff_cli_CommandVersion_hpp

#include <iostream>
#include <memory>

#include <boost/format.hpp>
#include <boost/program_options.hpp>

#include "common/Config.hpp"
#include "libskiff/CLIArguments.hpp"
#include "libskiff/Logger.hpp"
#include "cli/Command.hpp"
#include "cli/HelpMessage.hpp"
#include "cli/Utility.hpp"

#ifndef SKIFF_VERSION
#define SKIFF_VERSION "unknown"
#endif


namespace skiff {
namespace cli {

class CommandVersion : public Command {
public:
    CommandVersion() = default;

    CommandVersion(const libskiff::CLIArguments& args, std::shared_ptr<common::Config>) {
        parseCommandArguments(args);
    }

    void execute() override {
        libskiff::Logger::getInstance().log(SKIFF_VERSION, "CommandVersion", libskiff::LogLevel::GENERAL);
    }

    std::string getBriefDescription() const override {
        return "Show the Skiff version information";
    }

    void printHelpMessage() const override {
        auto printer = cli::HelpMessage()
            .setUsage("skiff version")
            .setDescription(getBriefDescription());
        std::cout << printer;
    }

private:
    void parseCommandArguments(const libskiff::CLIArguments& args) {
        cli::utility::printLog(boost::format("parsing CLI arguments of version command"), libskiff::LogLevel::DEBUG);

        auto optionsDescription = boost::program_options::options_description();
        libskiff::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);

        // the version command doesn't support positional arguments
        cli::utility::validateNumberOfPositionalArguments(positionalArgs, 0, 0, "version");

        if(nameAndOptionArgs.argc() > 1) {
            auto message = boost::format("Command 'version' doesn't support options"
                                         "\nSee 'skiff help version'");
            utility::printLog(message, libskiff::LogLevel::GENERAL, std::cerr);
            SKIFF_THROW_ERROR(message.str(), libskiff::LogLevel::INFO);
        }

        cli::utility::printLog(boost::format("successfully parsed CLI arguments"), libskiff::LogLevel::DEBUG);
    }
};

}
}

#endif
