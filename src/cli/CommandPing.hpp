/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_cli_CommandPing_hpp
#define skiff_cli_CommandPing_hpp

#include <iostream>
#include <memory>
#include <string>

#include <boost/format.hpp>
#include <boost/program_options.hpp>

#include "common/Config.hpp"
#include "libskiff/CLIArguments.hpp"
#include "registry/Credential.hpp"
#include "registry/RegistryClient.hpp"
#include "cli/Command.hpp"
#include "cli/HelpMessage.hpp"
#include "cli/Utility.hpp"


namespace skiff {
namespace cli {

class CommandPing : public Command {
public:
    CommandPing() = default;

    CommandPing(const libskiff::CLIArguments& args, std::shared_ptr<common::Config> conf)
        : conf{std::move(conf)}
    {
        parseCommandArguments(args);
    }

    void execute() override {
        auto client = cli::utility::makeRegistryClient(*conf);
        const auto& baseUrl = client.getEndpoint().getBaseUrl();

        if(!client.isV2Supported().get()) {
            auto message = boost::format("Registry %s does not implement the registry API v2") % baseUrl;
            SKIFF_THROW_ERROR(message.str());
        }
        std::cout << boost::format("Registry %s implements the registry API v2") % baseUrl << std::endl;

        if(conf->authentication.isAuthenticationNeeded) {
            const auto& authentication = conf->authentication;
            client.login(registry::BasicCredential{authentication.username, authentication.password}).get();
            std::cout << boost::format("Login succeeded as %s") % authentication.username << std::endl;
        }
    }

    std::string getBriefDescription() const override {
        return "Check that a registry implements the registry API v2";
    }

    void printHelpMessage() const override {
        auto printer = cli::HelpMessage()
            .setUsage("skiff ping [SERVER]")
            .setDescription(getBriefDescription()
                + "\nWith credentials, also verify that the registry accepts them");
        std::cout << printer;
    }

private:
    void parseCommandArguments(const libskiff::CLIArguments& args) {
        cli::utility::printLog(boost::format("parsing CLI arguments of ping command"), libskiff::LogLevel::DEBUG);

        auto optionsDescription = boost::program_options::options_description();
        libskiff::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);

        cli::utility::validateNumberOfPositionalArguments(positionalArgs, 0, 1, "ping");

        if(nameAndOptionArgs.argc() > 1) {
            auto message = boost::format("Command 'ping' doesn't support options"
                                         "\nSee 'skiff help ping'");
            utility::printLog(message, libskiff::LogLevel::GENERAL, std::cerr);
            SKIFF_THROW_ERROR(message.str(), libskiff::LogLevel::INFO);
        }

        auto server = positionalArgs.argc() == 1 ? std::string{positionalArgs.argv()[0]} : std::string{};
        cli::utility::setRegistryServer(*conf, server);

        cli::utility::printLog(boost::format("successfully parsed CLI arguments"), libskiff::LogLevel::DEBUG);
    }

private:
    std::shared_ptr<common::Config> conf;
};

}
}

#endif
