/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_cli_CommandCatalog_hpp
#define skiff_cli_CommandCatalog_hpp

#include <iostream>
#include <memory>
#include <string>

#include <boost/format.hpp>
#include <boost/program_options.hpp>

#include "common/Config.hpp"
#include "libskiff/CLIArguments.hpp"
#include "registry/Pagination.hpp"
#include "registry/RegistryClient.hpp"
#include "cli/Command.hpp"
#include "cli/HelpMessage.hpp"
#include "cli/Utility.hpp"


namespace skiff {
namespace cli {

class CommandCatalog : public Command {
public:
    CommandCatalog() {
        initializeOptionsDescription();
    }

    CommandCatalog(const libskiff::CLIArguments& args, std::shared_ptr<common::Config> conf)
        : conf{std::move(conf)}
    {
        initializeOptionsDescription();
        parseCommandArguments(args);
    }

    void execute() override {
        auto client = cli::utility::makeRegistryClient(*conf);
        auto pages = client.listCatalog();

        auto numberOfRepositories = size_t{0};
        while(auto page = pages->nextPage().get()) {
            for(const auto& repository : page->items) {
                std::cout << repository << "\n";
            }
            numberOfRepositories += page->items.size();
        }
        std::cout.flush();

        cli::utility::printLog(boost::format("listed %d repositories of %s")
                               % numberOfRepositories % client.getEndpoint().getBaseUrl(),
                               libskiff::LogLevel::INFO);
    }

    std::string getBriefDescription() const override {
        return "List the repositories of a registry";
    }

    void printHelpMessage() const override {
        auto printer = cli::HelpMessage()
            .setUsage("skiff catalog [OPTIONS] [SERVER]")
            .setDescription(getBriefDescription()
                + "\nDocker Hub does not serve the catalog, use a self-hosted registry")
            .setOptionsDescription(optionsDescription);
        std::cout << printer;
    }

private:
    void initializeOptionsDescription() {
        optionsDescription.add_options()
            ("page-size,n",
                boost::program_options::value<size_t>(),
                "Number of repositories requested per page");
    }

    void parseCommandArguments(const libskiff::CLIArguments& args) {
        cli::utility::printLog(boost::format("parsing CLI arguments of catalog command"), libskiff::LogLevel::DEBUG);

        libskiff::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);

        cli::utility::validateNumberOfPositionalArguments(positionalArgs, 0, 1, "catalog");

        try {
            boost::program_options::variables_map values;
            boost::program_options::store(
                boost::program_options::command_line_parser(nameAndOptionArgs.argc(), nameAndOptionArgs.argv())
                        .options(optionsDescription)
                        .style(boost::program_options::command_line_style::unix_style)
                        .run(), values);
            boost::program_options::notify(values);

            if(values.count("page-size")) {
                auto pageSize = values["page-size"].as<size_t>();
                if(pageSize == 0) {
                    SKIFF_THROW_ERROR("Invalid page size: expected a positive number");
                }
                conf->registry.pageSize = pageSize;
            }

            auto server = positionalArgs.argc() == 1 ? std::string{positionalArgs.argv()[0]} : std::string{};
            cli::utility::setRegistryServer(*conf, server);
        }
        catch (std::exception& e) {
            auto message = boost::format("%s\nSee 'skiff help catalog'") % e.what();
            cli::utility::printLog(message, libskiff::LogLevel::GENERAL, std::cerr);
            SKIFF_THROW_ERROR(message.str(), libskiff::LogLevel::INFO);
        }

        cli::utility::printLog(boost::format("successfully parsed CLI arguments"), libskiff::LogLevel::DEBUG);
    }

private:
    boost::program_options::options_description optionsDescription{"Options"};
    std::shared_ptr<common::Config> conf;
};

}
}

#endif
