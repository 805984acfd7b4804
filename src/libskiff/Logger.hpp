/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libskiff_Logger_hpp
#define libskiff_Logger_hpp

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>

#include <boost/format.hpp>

#include "libskiff/LogLevel.hpp"
#include "libskiff/Error.hpp"

namespace libskiff {

/**
 * Process-wide logger.
 *
 * Registry operations complete on pplx worker threads, hence writes to the
 * output streams are serialized.
 */
class Logger {
public:
    static Logger& getInstance();

    void log(const std::string& message, const std::string& sysName, const libskiff::LogLevel& logLevel,
             std::ostream& outStream = std::cout, std::ostream& errStream = std::cerr);
    void log(const boost::format& message, const std::string& sysName, const libskiff::LogLevel& logLevel,
             std::ostream& outStream = std::cout, std::ostream& errStream = std::cerr);
    void logErrorTrace(const libskiff::Error& error, const std::string& sysName, std::ostream& errStream = std::cerr);
    void setLevel(libskiff::LogLevel logLevel) { level = logLevel; }
    libskiff::LogLevel getLevel() const { return level; }

private:
    Logger();
    Logger(const Logger&) = delete;
    Logger(Logger&&) = delete;

    std::string makeSubmessageWithTimestamp(libskiff::LogLevel logLevel) const;
    std::string makeSubmessageWithInstanceID(libskiff::LogLevel logLevel) const;
    std::string makeSubmessageWithSystemName(libskiff::LogLevel logLevel,
                                             const std::string& systemName) const;
    std::string makeSubmessageWithLogLevel(libskiff::LogLevel logLevel) const;

private:
    std::atomic<libskiff::LogLevel> level;
    std::mutex streamMutex;
    std::string instanceID;
};

}

#endif
