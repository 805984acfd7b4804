/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "CLI.hpp"

#include <iostream>
#include <string>

#include <boost/filesystem.hpp>
#include <boost/format.hpp>

#include "libskiff/Error.hpp"
#include "libskiff/Logger.hpp"
#include "cli/Utility.hpp"
#include "cli/CommandObjectsFactory.hpp"


namespace skiff {
namespace cli {

CLI::CLI() {
    optionsDescription.add_options()
        ("help", "Print help")
        ("version", "Print version information and quit")
        ("debug", "Enable debug mode (print all log messages with DEBUG level or higher)")
        ("verbose", "Enable verbose mode (print all log messages with INFO level or higher)")
        ("config", boost::program_options::value<std::string>(),
            "Configuration file (default: <prefix>/etc/skiff.json)")
        ("username,u", boost::program_options::value<std::string>(), "Username for the registry")
        ("password-stdin", "Read the password for the registry from stdin");
}

std::unique_ptr<cli::Command> CLI::parseCommandLine(const libskiff::CLIArguments& args, std::shared_ptr<common::Config> conf) const {
    libskiff::CLIArguments nameAndOptionArgs, positionalArgs;
    std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);
    boost::program_options::variables_map values;
    auto factory = cli::CommandObjectsFactory{};
    auto& logger = libskiff::Logger::getInstance();

    try {
        boost::program_options::store(
            boost::program_options::command_line_parser(nameAndOptionArgs.argc(), nameAndOptionArgs.argv())
                .options(optionsDescription)
                .style(boost::program_options::command_line_style::unix_style)
                .run(), values);
        boost::program_options::notify(values); // throw if options are invalid
    }
    catch (const std::exception& e) {
        auto message = boost::format("%s\nSee 'skiff help'") % e.what();
        logger.log(message, "CLI", libskiff::LogLevel::GENERAL, std::cerr);
        SKIFF_THROW_ERROR(message.str(), libskiff::LogLevel::INFO);
    }

    // configure logger
    if(values.count("debug")) {
        logger.setLevel(libskiff::LogLevel::DEBUG);
    }
    else if(values.count("verbose")) {
        logger.setLevel(libskiff::LogLevel::INFO);
    }
    else {
        logger.setLevel(libskiff::LogLevel::WARN);
    }

    // --help option
    if(values.count("help")) {
        // --help overrides other arguments and options
        return factory.makeCommandObject("help", libskiff::CLIArguments{}, std::move(conf));
    }

    // --version option
    if(values.count("version")) {
        return factory.makeCommandObject("version", libskiff::CLIArguments{}, std::move(conf));
    }

    if(values.count("config")) {
        loadConfigFile(values["config"].as<std::string>(), *conf);
    }

    if(values.count("username")) {
        auto username = values["username"].as<std::string>();
        if(username.empty()) {
            SKIFF_THROW_ERROR("Invalid username: empty value provided");
        }
        conf->authentication.isAuthenticationNeeded = true;
        conf->authentication.username = username;
    }

    if(values.count("password-stdin")) {
        if(!conf->authentication.isAuthenticationNeeded) {
            auto message = boost::format("Option '--password-stdin' requires '--username'\nSee 'skiff help'");
            logger.log(message, "CLI", libskiff::LogLevel::GENERAL, std::cerr);
            SKIFF_THROW_ERROR(message.str(), libskiff::LogLevel::INFO);
        }
        conf->authentication.password = cli::utility::readPasswordFromStdin();
    }

    // no command name => return help command
    if(positionalArgs.empty()) {
        return factory.makeCommandObject("help");
    }

    auto commandName = std::string{positionalArgs.argv()[0]};

    bool isCommandHelpFollowedByAnArgument = commandName == "help" && positionalArgs.argc() > 1;
    if(isCommandHelpFollowedByAnArgument) {
        return parseCommandHelpOfCommand(positionalArgs);
    }

    return factory.makeCommandObject(commandName, positionalArgs, std::move(conf));
}

const boost::program_options::options_description& CLI::getOptionsDescription() const {
    return optionsDescription;
}

std::unique_ptr<cli::Command> CLI::parseCommandHelpOfCommand(const libskiff::CLIArguments& args) const {
    auto optionsDescription = boost::program_options::options_description();
    libskiff::CLIArguments nameAndOptionArgs, positionalArgs;
    std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);
    if(nameAndOptionArgs.argc() > 1) {
        auto message = boost::format("Command 'help' doesn't support options");
        utility::printLog(message, libskiff::LogLevel::GENERAL, std::cerr);
        SKIFF_THROW_ERROR(message.str(), libskiff::LogLevel::INFO);
    }
    if(positionalArgs.argc() > 1) {
        auto message = boost::format("Too many arguments for command 'help'"
                                     "\nSee 'skiff help help'");
        utility::printLog(message, libskiff::LogLevel::GENERAL, std::cerr);
        SKIFF_THROW_ERROR(message.str(), libskiff::LogLevel::INFO);
    }
    auto factory = cli::CommandObjectsFactory{};
    auto commandName = std::string{ positionalArgs.argv()[0] };
    return factory.makeCommandObjectHelpOfCommand(commandName);
}

/**
 * Replaces the settings of the configuration with the ones of the given file.
 * The installation prefix and the host environment are kept.
 */
void CLI::loadConfigFile(const boost::filesystem::path& configFile, common::Config& config) const {
    utility::printLog(boost::format("loading configuration file %s") % configFile, libskiff::LogLevel::DEBUG);

    auto prefixDir = config.prefixDir;
    auto hostEnvironment = std::move(config.hostEnvironment);

    config = common::Config{configFile, prefixDir / "etc/skiff.schema.json"};
    config.prefixDir = prefixDir;
    config.hostEnvironment = std::move(hostEnvironment);
}

} // namespace
} // namespace
