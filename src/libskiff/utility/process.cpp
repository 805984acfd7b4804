/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "process.hpp"

#include <cerrno>
#include <cstring>
#include <limits.h>
#include <termios.h>
#include <unistd.h>

#include <boost/format.hpp>

#include "libskiff/Error.hpp"

/**
 * Utility functions for process information
 */

namespace libskiff {
namespace process {

std::string getHostname() {
    char hostname[HOST_NAME_MAX];
    if(gethostname(hostname, HOST_NAME_MAX) != 0) {
        auto message = boost::format("failed to retrieve hostname (%s)") % strerror(errno);
        SKIFF_THROW_ERROR(message.str());
    }
    hostname[HOST_NAME_MAX-1] = '\0';
    return hostname;
}

void setStdinEcho(bool flag) {
    struct termios tty;
    if(tcgetattr(STDIN_FILENO, &tty) != 0) {
        // not a terminal (e.g. password piped through stdin): nothing to do
        return;
    }
    if(!flag) {
        tty.c_lflag &= ~ECHO;
    }
    else {
        tty.c_lflag |= ECHO;
    }
    if(tcsetattr(STDIN_FILENO, TCSANOW, &tty) != 0) {
        auto message = boost::format("failed to %s terminal echo (%s)") % (flag ? "enable" : "disable") % strerror(errno);
        SKIFF_THROW_ERROR(message.str());
    }
}

}}
