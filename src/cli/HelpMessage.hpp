/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef skiff_cli_HelpMessage_hpp
#define skiff_cli_HelpMessage_hpp

#include <ostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <boost/program_options.hpp>


namespace skiff {
namespace cli {

class HelpMessage {
    friend std::ostream& operator<<(std::ostream&, const HelpMessage&);

public:
    HelpMessage();
    HelpMessage(const HelpMessage&);
    HelpMessage& setUsage(const std::string&);
    HelpMessage& setDescription(const std::string&);
    HelpMessage& setOptionsDescription(const boost::program_options::options_description&);
    // Example invocations, printed after the options
    HelpMessage& addExample(const std::string& commandLine, const std::string& explanation);

private:
    std::string usage;
    std::string description;
    std::unique_ptr<boost::program_options::options_description> optionsDescription;
    std::vector<std::pair<std::string, std::string>> examples;
};

std::ostream& operator<<(std::ostream&, const HelpMessage&);

}
}

#endif
