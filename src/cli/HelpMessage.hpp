/*
 * oc-mirror
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef ocmirror_cli_HelpMessage_hpp
#define ocmirror_cli_HelpMessage_hpp

#include <ostream>
#include <memory>
#include <string>

#include <boost/program_options.hpp>


namespace ocmirror {
namespace cli {

class HelpMessage {
    friend std::ostream& operator<<(std::ostream&, const HelpMessage&);

public:
    HelpMessage();
    HelpMessage(const HelpMessage&);
    HelpMessage& setUsage(const std::string&);
    HelpMessage& setDescription(const std::string&);
    HelpMessage& setExamples(const std::string&);
    HelpMessage& setOptionsDescription(const boost::program_options::options_description&);

private:
    std::string usage;
    std::string description;
    std::string examples;
    std::unique_ptr<boost::program_options::options_description> optionsDescription;
};

std::ostream& operator<<(std::ostream&, const HelpMessage&);

}
}

#endif
