/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "HelpMessage.hpp"


namespace skiff {
namespace cli {

HelpMessage::HelpMessage()
    : optionsDescription{new boost::program_options::options_description}
{}

HelpMessage::HelpMessage(const HelpMessage& rhs)
    : usage{rhs.usage}
    , description{rhs.description}
    , optionsDescription{new boost::program_options::options_description{*rhs.optionsDescription}}
    , examples{rhs.examples}
{}

HelpMessage& HelpMessage::setUsage(const std::string& usage) {
    this->usage = usage;
    return *this;
}

HelpMessage& HelpMessage::setDescription(const std::string& description) {
    this->description = description;
    return *this;
}

HelpMessage& HelpMessage::setOptionsDescription(const boost::program_options::options_description& optionsDescription) {
    // options_description has no copy assignment operator, keep a heap copy
    this->optionsDescription.reset(new boost::program_options::options_description{optionsDescription});
    return *this;
}

HelpMessage& HelpMessage::addExample(const std::string& commandLine, const std::string& explanation) {
    examples.emplace_back(commandLine, explanation);
    return *this;
}

std::ostream& operator<<(std::ostream& os, const HelpMessage& printer) {
    os  << "Usage: " << printer.usage << "\n"
        << "\n"
        << printer.description << "\n";
    if(!printer.optionsDescription->options().empty()) {
        os << "\n" << *printer.optionsDescription;
    }
    if(!printer.examples.empty()) {
        os << "\nExamples:\n";
        for(const auto& example : printer.examples) {
            os << "  # " << example.second << "\n"
               << "  " << example.first << "\n";
        }
    }
    return os;
}

}
}
