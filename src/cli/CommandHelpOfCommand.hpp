/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_cli_CommandHelpOfCommand_hpp
#define skiff_cli_CommandHelpOfCommand_hpp

#include <memory>

#include "libskiff/Error.hpp"
#include "cli/Command.hpp"

namespace skiff {
namespace cli {

class CommandHelpOfCommand : public Command {
public:
    CommandHelpOfCommand() = default;

    CommandHelpOfCommand(std::unique_ptr<cli::Command> command)
        : command(std::move(command))
    {}

    void execute() override {
        command->printHelpMessage();
    }

    std::string getBriefDescription() const override {
        SKIFF_THROW_ERROR("This function must not be executed."
                          " The developer should review the program's logic.");
    }

    void printHelpMessage() const override {
        SKIFF_THROW_ERROR("This function must not be executed."
                          " The developer should review the program's logic.");
    }

private:
    std::unique_ptr<cli::Command> command;
};

}
}

#endif
