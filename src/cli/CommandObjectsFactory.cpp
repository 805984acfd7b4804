/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "CommandObjectsFactory.hpp"

#include <boost/format.hpp>

#include "libskiff/Error.hpp"
#include "libskiff/Logger.hpp"
#include "cli/CommandBlob.hpp"
#include "cli/CommandCatalog.hpp"
#include "cli/CommandHelp.hpp"
#include "cli/CommandHelpOfCommand.hpp"
#include "cli/CommandManifest.hpp"
#include "cli/CommandPing.hpp"
#include "cli/CommandTags.hpp"
#include "cli/CommandVersion.hpp"


namespace skiff {
namespace cli {

CommandObjectsFactory::CommandObjectsFactory() {
    addCommand<cli::CommandBlob>("blob");
    addCommand<cli::CommandCatalog>("catalog");
    addCommand<cli::CommandHelp>("help");
    addCommand<cli::CommandManifest>("manifest");
    addCommand<cli::CommandPing>("ping");
    addCommand<cli::CommandTags>("tags");
    addCommand<cli::CommandVersion>("version");
}

bool CommandObjectsFactory::isValidCommandName(const std::string& commandName) const {
    return map.find(commandName) != map.cend();
}

std::vector<std::string> CommandObjectsFactory::getCommandNames() const {
    auto names = std::vector<std::string>{};
    names.reserve(map.size());
    for(const auto& kv : map) {
        names.push_back(kv.first);
    }
    return names;
}

std::unique_ptr<cli::Command> CommandObjectsFactory::makeCommandObject(const std::string& commandName) const {
    validateCommandName(commandName);
    auto it = map.find(commandName);
    return it->second();
}

std::unique_ptr<cli::Command> CommandObjectsFactory::makeCommandObject(
    const std::string& commandName,
    const libskiff::CLIArguments& commandArgs,
    std::shared_ptr<common::Config> config) const {
    validateCommandName(commandName);
    auto it = mapWithArguments.find(commandName);
    return it->second(commandArgs, std::move(config));
}

std::unique_ptr<cli::Command> CommandObjectsFactory::makeCommandObjectHelpOfCommand(const std::string& commandName) const {
    auto commandObject = makeCommandObject(commandName);
    auto ptr = new cli::CommandHelpOfCommand{std::move(commandObject)};
    return std::unique_ptr<cli::Command>{ptr};
}

void CommandObjectsFactory::validateCommandName(const std::string& commandName) const {
    if(!isValidCommandName(commandName)) {
        auto message = boost::format("'%s' is not a Skiff command\nSee 'skiff help'")
            % commandName;
        libskiff::Logger::getInstance().log(message, "CommandObjectsFactory", libskiff::LogLevel::GENERAL, std::cerr);
        SKIFF_THROW_ERROR(message.str(), libskiff::LogLevel::DEBUG);
    }
}

}
}
