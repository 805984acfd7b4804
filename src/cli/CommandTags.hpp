/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_cli_CommandTags_hpp
#define skiff_cli_CommandTags_hpp

#include <iostream>
#include <memory>
#include <string>

#include <boost/format.hpp>
#include <boost/program_options.hpp>

#include "common/Config.hpp"
#include "common/ImageReference.hpp"
#include "libskiff/CLIArguments.hpp"
#include "registry/Pagination.hpp"
#include "registry/RegistryClient.hpp"
#include "cli/Command.hpp"
#include "cli/HelpMessage.hpp"
#include "cli/Utility.hpp"


namespace skiff {
namespace cli {

class CommandTags : public Command {
public:
    CommandTags() {
        initializeOptionsDescription();
    }

    CommandTags(const libskiff::CLIArguments& args, std::shared_ptr<common::Config> conf)
        : conf{std::move(conf)}
    {
        initializeOptionsDescription();
        parseCommandArguments(args);
    }

    void execute() override {
        const auto& repository = conf->imageReference;
        auto client = cli::utility::makeRegistryClient(*conf);
        auto pages = client.listTags(repository.repository);

        // print as pages arrive, a large repository may have many
        while(auto page = pages->nextPage().get()) {
            for(const auto& tag : page->items) {
                std::cout << tag << "\n";
            }
        }
        std::cout.flush();

        cli::utility::printLog(boost::format("listed tags of %s in %d pages")
                               % repository.getFullName() % pages->getNumberOfPagesFetched(),
                               libskiff::LogLevel::INFO);
    }

    std::string getBriefDescription() const override {
        return "List the tags of a repository";
    }

    void printHelpMessage() const override {
        auto printer = cli::HelpMessage()
            .setUsage("skiff tags [OPTIONS] [SERVER/]REPOSITORY")
            .setDescription(getBriefDescription())
            .setOptionsDescription(optionsDescription)
            .addExample("skiff tags alpine", "All tags of the official alpine image on Docker Hub")
            .addExample("skiff tags -n 50 registry.example.com:5000/team/tool",
                        "Tags of a private repository, 50 per request");
        std::cout << printer;
    }

private:
    void initializeOptionsDescription() {
        optionsDescription.add_options()
            ("page-size,n",
                boost::program_options::value<size_t>(),
                "Number of tags requested per page");
    }

    void parseCommandArguments(const libskiff::CLIArguments& args) {
        cli::utility::printLog(boost::format("parsing CLI arguments of tags command"), libskiff::LogLevel::DEBUG);

        libskiff::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);

        cli::utility::validateNumberOfPositionalArguments(positionalArgs, 1, 1, "tags");

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

            conf->imageReference = cli::utility::parseRepositoryReference(positionalArgs.argv()[0], *conf);
            cli::utility::setRegistryServer(*conf, conf->imageReference.server);
        }
        catch (std::exception& e) {
            auto message = boost::format("%s\nSee 'skiff help tags'") % e.what();
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
