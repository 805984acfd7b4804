/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "cli/Utility.hpp"

#include <cstring>

#include <boost/algorithm/string/predicate.hpp>

#include "libskiff/utility/process.hpp"


namespace skiff {
namespace cli {
namespace utility {

static bool isDockerHub(const std::string& server) {
    return server == "docker.io"
        || server == "index.docker.io"
        || server == "registry-1.docker.io";
}

bool hasExplicitServer(const std::string& input) {
    auto firstSeparator = input.find('/');
    if(firstSeparator == std::string::npos) {
        return false;
    }
    auto firstComponent = input.substr(0, firstSeparator);
    return firstComponent.find_first_of(".:") != std::string::npos || firstComponent == "localhost";
}

common::ImageReference parseImageReference(const std::string& input, const common::Config& config) {
    auto reference = common::ImageReference::parse(input);

    const auto& configuredServer = config.registry.serverAddress;
    if(hasExplicitServer(input) || configuredServer.empty() || isDockerHub(configuredServer)) {
        return reference;
    }

    // the "library/" namespace only exists on Docker Hub
    reference.server = configuredServer;
    auto defaultNamespace = common::ImageReference::DEFAULT_REPOSITORY_NAMESPACE + "/";
    if(boost::starts_with(reference.repository, defaultNamespace) && !boost::starts_with(input, defaultNamespace)) {
        reference.repository = reference.repository.substr(defaultNamespace.size());
    }

    printLog(boost::format("Resolved image reference %s against configured registry") % reference,
             libskiff::LogLevel::DEBUG);
    return reference;
}

common::ImageReference parseRepositoryReference(const std::string& input, const common::Config& config) {
    if(input.find('@') != std::string::npos) {
        auto message = boost::format("Invalid repository '%s': a digest is not allowed here") % input;
        SKIFF_THROW_ERROR(message.str());
    }
    auto lastSeparator = input.find_last_of('/');
    auto lastComponent = lastSeparator == std::string::npos ? input : input.substr(lastSeparator + 1);
    if(lastComponent.find(':') != std::string::npos) {
        auto message = boost::format("Invalid repository '%s': a tag is not allowed here") % input;
        SKIFF_THROW_ERROR(message.str());
    }

    auto reference = parseImageReference(input, config);
    reference.tag.clear();
    return reference;
}

void setRegistryServer(common::Config& config, const std::string& server) {
    if(!server.empty()) {
        config.registry.serverAddress = server;
    }
    else if(config.registry.serverAddress.empty()) {
        config.registry.serverAddress = common::ImageReference::DEFAULT_SERVER;
    }
}

registry::RegistryClient makeRegistryClient(const common::Config& config) {
    printLog(boost::format("using registry server %s") % config.registry.serverAddress, libskiff::LogLevel::INFO);
    return registry::RegistryClient::fromConfig(config);
}

static bool hasDashPrefix(const char* s) {
    bool result = strlen(s) > 1 && s[0]=='-' && s[1]!='-';
    return result;
}

static bool hasDashDashPrefix(const char* s) {
    bool result = strlen(s) > 2 && s[0]=='-' && s[1]=='-' && s[2]!='-';
    return result;
}

static bool isOption(const char* s) {
    return hasDashPrefix(s) || hasDashDashPrefix(s);
}

static bool optionTakesValue(const boost::program_options::option_description* option) {
    bool result = option->semantic()->max_tokens() > 0;
    return result;
}

static libskiff::CLIArguments::const_iterator processPossibleValueInNextToken(libskiff::CLIArguments::const_iterator arg,
        libskiff::CLIArguments::const_iterator argsEnd, libskiff::CLIArguments& argsGroup) {
    // always include the current token (the option)
    argsGroup.push_back(*arg);

    // if next arg token exists and does not start with dash it's the value: include it and skip over
    auto nextArg = arg+1;
    if (nextArg != argsEnd) {
        if(!hasDashPrefix(*nextArg)){
            argsGroup.push_back(*nextArg);
            ++arg;
        }
    }

    return arg;
}

static libskiff::CLIArguments::const_iterator processDashDashOption(libskiff::CLIArguments::const_iterator arg,
        libskiff::CLIArguments::const_iterator argsEnd, libskiff::CLIArguments& argsGroup,
        const boost::program_options::options_description& optionsDescription) {
    auto argString = std::string{*arg};

    // adjacent style ("--option=value") already provides the value
    if(argString.find('=') != std::string::npos) {
        argsGroup.push_back(argString);
        return arg;
    }

    auto argName = argString.substr(2);
    auto argOption = optionsDescription.find_nothrow(argName, false);

    // unknown option: keep it, Boost reports the error
    if(!argOption) {
        argsGroup.push_back(*arg);
        return arg;
    }

    if(optionTakesValue(argOption)) {
        arg = processPossibleValueInNextToken(arg, argsEnd, argsGroup);
    }
    else {
        argsGroup.push_back(*arg);
    }

    return arg;
}

static libskiff::CLIArguments::const_iterator processDashOption(libskiff::CLIArguments::const_iterator arg,
        libskiff::CLIArguments::const_iterator argsEnd, libskiff::CLIArguments& argsGroup,
        const boost::program_options::options_description& optionsDescription) {
    auto argString = std::string{*arg};
    auto argSubstring = argString.substr(1);

    for(auto it = argSubstring.cbegin(); it != argSubstring.cend(); ++it) {
        auto findArg = std::string{"-"} + *it;
        auto argOption = optionsDescription.find_nothrow(findArg, false);

        if(!argOption) {
            argsGroup.push_back(*arg);
            break;
        }

        if(optionTakesValue(argOption)) {
            if(it+1 == argSubstring.end()) {
                arg = processPossibleValueInNextToken(arg, argsEnd, argsGroup);
            }
            else {
                // "sticky" value, e.g. "-ofile"
                argsGroup.push_back(*arg);
                break;
            }
        }
        else if(it+1 == argSubstring.end()) {
            argsGroup.push_back(*arg);
        }
    }

    return arg;
}

/**
 * Group option arguments and positional arguments into two individual CLIArguments objects.
 *
 * The first group contains the program/command name, its options and their values, if present;
 * it is meant to be further processed by boost::program_option functions.
 * The second group contains all the arguments from the first detected positional argument
 * (not an option or a value) onwards, i.e. the command and its own arguments.
 *
 * E.g. the CLI arguments "skiff --verbose tags --page-size 10 alpine" are grouped into
 * ("skiff --verbose", "tags --page-size 10 alpine").
 */
std::tuple<libskiff::CLIArguments, libskiff::CLIArguments> groupOptionsAndPositionalArguments(
        const libskiff::CLIArguments& args,
        const boost::program_options::options_description& optionsDescription) {

    libskiff::CLIArguments nameAndOptionArgs, positionalArgs;

    if(args.argc() == 0) {
        return std::tuple<libskiff::CLIArguments, libskiff::CLIArguments>{nameAndOptionArgs, positionalArgs};
    }

    if(isOption(args.argv()[0])) {
        auto message = boost::format("Expected a program or command name as first argument, got '%s'")
            % args.argv()[0];
        SKIFF_THROW_ERROR(message.str());
    }
    nameAndOptionArgs.push_back(args.argv()[0]);

    for(auto arg = args.begin()+1; arg != args.end(); ++arg) {
        if(!isOption(*arg)) {
            positionalArgs = libskiff::CLIArguments{arg, args.end()};
            break;
        }

        if(hasDashDashPrefix(*arg)) {
            arg = processDashDashOption(arg, args.end(), nameAndOptionArgs, optionsDescription);
        }
        else if(hasDashPrefix(*arg)) {
            arg = processDashOption(arg, args.end(), nameAndOptionArgs, optionsDescription);
        }
    }

    return std::tuple<libskiff::CLIArguments, libskiff::CLIArguments>{nameAndOptionArgs, positionalArgs};
}

void validateNumberOfPositionalArguments(const libskiff::CLIArguments& positionalArgs, const int min, const int max,
        const std::string& command) {
    auto numberOfArguments = positionalArgs.argc();
    if(numberOfArguments < min || numberOfArguments > max) {
        auto quantity = numberOfArguments < min ? std::string("few") : std::string("many");
        auto message = boost::format("Too %s arguments for command '%s'\n"
                                     "See 'skiff help %s'") % quantity % command % command;
        printLog(message, libskiff::LogLevel::GENERAL, std::cerr);
        SKIFF_THROW_ERROR(message.str(), libskiff::LogLevel::INFO);
    }
}

std::string readPasswordFromStdin() {
    printLog(boost::format("reading password from stdin"), libskiff::LogLevel::DEBUG);

    auto password = std::string{};

    libskiff::process::setStdinEcho(false);
    std::getline(std::cin, password);
    libskiff::process::setStdinEcho(true);

    if(password.empty()) {
        SKIFF_THROW_ERROR("Failed to read password from stdin: empty value provided");
    }

    return password;
}

void printLog(const std::string& message, libskiff::LogLevel LogLevel, std::ostream& outStream, std::ostream& errStream) {
    auto systemName = "CLI";
    libskiff::Logger::getInstance().log(message, systemName, LogLevel, outStream, errStream);
}

void printLog(const boost::format& message, libskiff::LogLevel LogLevel, std::ostream& outStream, std::ostream& errStream) {
    printLog(message.str(), LogLevel, outStream, errStream);
}

} // namespace
} // namespace
} // namespace
