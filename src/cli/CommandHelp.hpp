/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_cli_CommandHelp_hpp
#define skiff_cli_CommandHelp_hpp

#include <algorithm>
#include <iostream>
#include <memory>

#include <boost/format.hpp>

#include "common/Config.hpp"
#include "libskiff/CLIArguments.hpp"
#include "cli/Utility.hpp"
#include "cli/Command.hpp"
#include "cli/CLI.hpp"
#include "cli/HelpMessage.hpp"
#include "cli/CommandObjectsFactory.hpp"

namespace skiff {
namespace cli {

class CommandHelp : public Command {
public:
    CommandHelp() = default;

    CommandHelp(const libskiff::CLIArguments& args, std::shared_ptr<common::Config>) {
        if(args.argc() > 1) {
            auto message = boost::format("Command 'help' doesn't support options");
            utility::printLog(message, libskiff::LogLevel::GENERAL, std::cerr);
            SKIFF_THROW_ERROR(message.str(), libskiff::LogLevel::INFO);
        }
    }

    void execute() override {
        std::cout
        << "Usage: skiff [OPTIONS] COMMAND\n"
        << "\n"
        << cli::CLI{}.getOptionsDescription()
        << "\n"
        << "Commands:\n";

        auto factory = CommandObjectsFactory{};
        auto commandNames = factory.getCommandNames();
        std::sort(commandNames.begin(), commandNames.end());
        for(const auto& name : commandNames) {
            auto description = factory.makeCommandObject(name)->getBriefDescription();
            std::cout << "   " << name << ": " << description << "\n";
        }
    }

    std::string getBriefDescription() const override {
        return "Print help message about a command";
    }

    void printHelpMessage() const override {
        auto printer = cli::HelpMessage()
            .setUsage("skiff help [COMMAND]")
            .setDescription(getBriefDescription());
        std::cout << printer;
    }
};

}
}

#endif
