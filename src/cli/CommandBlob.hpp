/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_cli_CommandBlob_hpp
#define skiff_cli_CommandBlob_hpp

#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include <boost/filesystem.hpp>
#include <boost/format.hpp>
#include <boost/program_options.hpp>

#include "common/Config.hpp"
#include "libskiff/CLIArguments.hpp"
#include "libskiff/PathRAII.hpp"
#include "libskiff/utility/filesystem.hpp"
#include "registry/BlobStreamer.hpp"
#include "registry/Digest.hpp"
#include "registry/RegistryClient.hpp"
#include "cli/Command.hpp"
#include "cli/HelpMessage.hpp"
#include "cli/Utility.hpp"


namespace skiff {
namespace cli {

class CommandBlob : public Command {
public:
    CommandBlob() {
        initializeOptionsDescription();
    }

    CommandBlob(const libskiff::CLIArguments& args, std::shared_ptr<common::Config> conf)
        : conf{std::move(conf)}
    {
        initializeOptionsDescription();
        parseCommandArguments(args);
    }

    /**
     * The blob is written to a temporary file next to the output path, which
     * is renamed only once size and digest have been verified.
     */
    void execute() override {
        const auto& repository = conf->imageReference.repository;
        auto digest = registry::Digest::parse(conf->imageReference.digest);
        auto client = cli::utility::makeRegistryClient(*conf);

        auto outputPath = boost::filesystem::absolute(conf->outputPath);
        libskiff::filesystem::createFoldersIfNecessary(outputPath.parent_path());
        auto tempFile = libskiff::PathRAII{libskiff::filesystem::makeUniquePathWithRandomSuffix(outputPath)};

        auto blob = client.getBlob(repository, digest).get();
        {
            std::ofstream sink(tempFile.getPath().string(), std::ios::binary | std::ios::trunc);
            if(!sink) {
                auto message = boost::format("Failed to open %s for writing") % tempFile.getPath();
                SKIFF_THROW_ERROR(message.str());
            }
            auto bytes = blob->writeTo(sink).get();
            sink.close();
            if(!sink) {
                auto message = boost::format("Failed to write %s") % tempFile.getPath();
                SKIFF_THROW_ERROR(message.str());
            }
            cli::utility::printLog(boost::format("verified %d bytes of blob %s") % bytes % digest,
                                   libskiff::LogLevel::INFO);
        }

        try {
            boost::filesystem::rename(tempFile.getPath(), outputPath);
        }
        catch(const std::exception& e) {
            auto message = boost::format("Failed to move %s to %s") % tempFile.getPath() % outputPath;
            SKIFF_RETHROW_ERROR(e, message.str());
        }
        tempFile.release();

        std::cout << boost::format("Saved blob %s to %s") % digest % outputPath.string() << std::endl;
    }

    std::string getBriefDescription() const override {
        return "Download a blob and verify its digest";
    }

    void printHelpMessage() const override {
        auto printer = cli::HelpMessage()
            .setUsage("skiff blob [OPTIONS] [SERVER/]REPOSITORY DIGEST")
            .setDescription(getBriefDescription())
            .setOptionsDescription(optionsDescription)
            .addExample("skiff blob -o config.json library/alpine sha256:<hex>",
                        "Save the configuration blob of an image");
        std::cout << printer;
    }

private:
    void initializeOptionsDescription() {
        optionsDescription.add_options()
            ("output,o",
                boost::program_options::value<std::string>(),
                "File where the blob is saved (required)");
    }

    void parseCommandArguments(const libskiff::CLIArguments& args) {
        cli::utility::printLog(boost::format("parsing CLI arguments of blob command"), libskiff::LogLevel::DEBUG);

        libskiff::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);

        cli::utility::validateNumberOfPositionalArguments(positionalArgs, 2, 2, "blob");

        try {
            boost::program_options::variables_map values;
            boost::program_options::store(
                boost::program_options::command_line_parser(nameAndOptionArgs.argc(), nameAndOptionArgs.argv())
                        .options(optionsDescription)
                        .style(boost::program_options::command_line_style::unix_style)
                        .run(), values);
            boost::program_options::notify(values);

            if(!values.count("output")) {
                SKIFF_THROW_ERROR("Missing required option '--output'");
            }
            conf->outputPath = values["output"].as<std::string>();

            conf->imageReference = cli::utility::parseRepositoryReference(positionalArgs.argv()[0], *conf);
            // fails early on malformed digests
            conf->imageReference.digest = registry::Digest::parse(positionalArgs.argv()[1]).string();
            cli::utility::setRegistryServer(*conf, conf->imageReference.server);
        }
        catch (std::exception& e) {
            auto message = boost::format("%s\nSee 'skiff help blob'") % e.what();
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
