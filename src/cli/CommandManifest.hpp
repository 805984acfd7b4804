/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_cli_CommandManifest_hpp
#define skiff_cli_CommandManifest_hpp

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <boost/format.hpp>
#include <boost/program_options.hpp>
#include <boost/regex.hpp>
#include <boost/variant.hpp>

#include "common/Config.hpp"
#include "common/regex.hpp"
#include "libskiff/CLIArguments.hpp"
#include "registry/Manifest.hpp"
#include "registry/ManifestResolver.hpp"
#include "registry/Reference.hpp"
#include "registry/RegistryClient.hpp"
#include "cli/Command.hpp"
#include "cli/HelpMessage.hpp"
#include "cli/Utility.hpp"


namespace skiff {
namespace cli {

namespace detail {

class ManifestPrinter : public boost::static_visitor<void> {
public:
    explicit ManifestPrinter(std::ostream& os) : os(os) {}

    void operator()(const registry::SchemaV1Manifest& manifest) const {
        os << "Name: " << manifest.name << "\n"
           << "Tag: " << manifest.tag << "\n"
           << "Architecture: " << manifest.architecture << "\n"
           << "Layers:\n";
        for(const auto& digest : manifest.layerDigests) {
            os << "   " << digest << "\n";
        }
    }

    void operator()(const registry::SchemaV2Manifest& manifest) const {
        os << "Config: " << manifest.config.digest << "\n"
           << "Layers:\n";
        for(const auto& layer : manifest.layers) {
            os << "   " << layer.digest;
            if(layer.size) {
                os << " " << *layer.size;
            }
            os << "\n";
        }
    }

    void operator()(const registry::ManifestList& list) const {
        os << "Platforms:\n";
        for(const auto& entry : list.manifests) {
            os << "   " << entry.platform.string() << " " << entry.digest << "\n";
        }
    }

private:
    std::ostream& os;
};

}

class CommandManifest : public Command {
public:
    CommandManifest() {
        initializeOptionsDescription();
    }

    CommandManifest(const libskiff::CLIArguments& args, std::shared_ptr<common::Config> conf)
        : conf{std::move(conf)}
    {
        initializeOptionsDescription();
        parseCommandArguments(args);
    }

    void execute() override {
        const auto& image = conf->imageReference;
        auto client = cli::utility::makeRegistryClient(*conf);
        auto reference = registry::Reference::parse(image.getManifestReference());

        auto manifest = client.getManifest(image.repository, reference).get();

        if(manifest.isManifestList() && !conf->platform.empty()) {
            manifest = resolvePlatform(client, manifest);
        }

        std::cout << "Media type: " << manifest.getMediaType() << "\n"
                  << "Digest: " << manifest.getDigest() << "\n";
        boost::apply_visitor(detail::ManifestPrinter{std::cout}, manifest.getContent());
        std::cout.flush();
    }

    std::string getBriefDescription() const override {
        return "Show the manifest of an image";
    }

    void printHelpMessage() const override {
        auto printer = cli::HelpMessage()
            .setUsage("skiff manifest [OPTIONS] [SERVER/]REPOSITORY[:TAG][@DIGEST]")
            .setDescription(getBriefDescription())
            .setOptionsDescription(optionsDescription)
            .addExample("skiff manifest alpine:3.18", "Platforms listed by a multi-architecture image")
            .addExample("skiff manifest --platform linux/arm64/v8 alpine:3.18",
                        "Layers of the arm64 image");
        std::cout << printer;
    }

private:
    void initializeOptionsDescription() {
        optionsDescription.add_options()
            ("platform",
                boost::program_options::value<std::string>(),
                "Resolve manifest lists to the image for OS/ARCH[/VARIANT], e.g. linux/arm64/v8");
    }

    void parseCommandArguments(const libskiff::CLIArguments& args) {
        cli::utility::printLog(boost::format("parsing CLI arguments of manifest command"), libskiff::LogLevel::DEBUG);

        libskiff::CLIArguments nameAndOptionArgs, positionalArgs;
        std::tie(nameAndOptionArgs, positionalArgs) = cli::utility::groupOptionsAndPositionalArguments(args, optionsDescription);

        cli::utility::validateNumberOfPositionalArguments(positionalArgs, 1, 1, "manifest");

        try {
            boost::program_options::variables_map values;
            boost::program_options::store(
                boost::program_options::command_line_parser(nameAndOptionArgs.argc(), nameAndOptionArgs.argv())
                        .options(optionsDescription)
                        .style(boost::program_options::command_line_style::unix_style)
                        .run(), values);
            boost::program_options::notify(values);

            if(values.count("platform")) {
                conf->platform = values["platform"].as<std::string>();
                parsePlatform(conf->platform);
            }

            conf->imageReference = cli::utility::parseImageReference(positionalArgs.argv()[0], *conf).normalize();
            cli::utility::setRegistryServer(*conf, conf->imageReference.server);
        }
        catch (std::exception& e) {
            auto message = boost::format("%s\nSee 'skiff help manifest'") % e.what();
            cli::utility::printLog(message, libskiff::LogLevel::GENERAL, std::cerr);
            SKIFF_THROW_ERROR(message.str(), libskiff::LogLevel::INFO);
        }

        cli::utility::printLog(boost::format("successfully parsed CLI arguments"), libskiff::LogLevel::DEBUG);
    }

    // "os/arch[/variant]"
    static std::vector<std::string> parsePlatform(const std::string& platform) {
        boost::smatch matches;
        if(!boost::regex_match(platform, matches, common::regex::platform)) {
            auto message = boost::format("Invalid platform '%s': expected OS/ARCH[/VARIANT]") % platform;
            SKIFF_THROW_ERROR(message.str());
        }
        return std::vector<std::string>{ matches[1].str(), matches[2].str(), matches[3].str() };
    }

    registry::ManifestDescriptor resolvePlatform(const registry::RegistryClient& client,
                                                 const registry::ManifestDescriptor& list) const {
        auto platform = parsePlatform(conf->platform);
        auto entry = registry::selectPlatform(list.getManifestList(), platform[0], platform[1], platform[2]);
        if(!entry) {
            auto message = boost::format("Image %s has no manifest for platform %s")
                % conf->imageReference % conf->platform;
            SKIFF_THROW_ERROR(message.str());
        }
        cli::utility::printLog(boost::format("selected manifest %s for platform %s")
                               % entry->digest % entry->platform.string(),
                               libskiff::LogLevel::INFO);
        return client.getChildManifest(conf->imageReference.repository, *entry).get();
    }

private:
    boost::program_options::options_description optionsDescription{"Options"};
    std::shared_ptr<common::Config> conf;
};

}
}

#endif
