/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "libskiff/Logger.hpp"

#include <cerrno>
#include <cstring>
#include <string>

#include <time.h>
#include <sys/types.h>
#include <unistd.h>

#include <boost/format.hpp>

#include "libskiff/Error.hpp"
#include "libskiff/utility/process.hpp"

namespace libskiff {

    Logger& Logger::getInstance() {
        static Logger logger;
        return logger;
    }

    Logger::Logger()
        : level{ libskiff::LogLevel::WARN }
        , instanceID{ (boost::format("[%s-%d] ") % libskiff::process::getHostname() % getpid()).str() }
    {}

    void Logger::log(const std::string& message, const std::string& systemName, const libskiff::LogLevel& logLevel,
                     std::ostream& outStream, std::ostream& errStream) {
        if(logLevel < level) {
            return;
        }

        auto fullLogMessage = makeSubmessageWithTimestamp(logLevel)
            + makeSubmessageWithInstanceID(logLevel)
            + makeSubmessageWithSystemName(logLevel, systemName)
            + makeSubmessageWithLogLevel(logLevel)
            + message;

        std::lock_guard<std::mutex> lock{streamMutex};

        // WARNING and ERROR messages go to stderr
        if ( logLevel == libskiff::LogLevel::WARN || logLevel == libskiff::LogLevel::ERROR ) {
            errStream << fullLogMessage << std::endl;
        }
        // rest goes to stdout
        else {
            outStream << fullLogMessage << std::endl;
        }
    }

    void Logger::log(const boost::format& message, const std::string& systemName, const libskiff::LogLevel& logLevel,
                     std::ostream& outStream, std::ostream& errStream) {
        log(message.str(), systemName, logLevel, outStream, errStream);
    }

    void Logger::logErrorTrace(const libskiff::Error& error, const std::string& systemName, std::ostream& errStream) {
        if(error.getLogLevel() < level) {
            return;
        }

        log("Error trace (most nested error last):", systemName, LogLevel::ERROR, std::cout, errStream);

        const auto& trace = error.getErrorTrace();
        std::lock_guard<std::mutex> lock{streamMutex};
        for(size_t i=0; i!=trace.size(); ++i) {
            const auto& entry = trace[trace.size()-i-1];
            auto line = boost::format("#%-3.3s %s at %s:%s %s\n")
                % i % entry.functionName % entry.fileName % (entry.fileLine != -1 ? std::to_string(entry.fileLine) : "")
                % entry.errorMessage;
            errStream << line;
        }
    }

    std::string Logger::makeSubmessageWithTimestamp(libskiff::LogLevel logLevel) const {
        if(logLevel == libskiff::LogLevel::GENERAL) {
            return "";
        }

        auto tp = timespec{};
        if(clock_gettime(CLOCK_MONOTONIC, &tp) != 0) {
            auto message = boost::format("logger failed to retrieve monotonic time (%s)") % strerror(errno);
            SKIFF_THROW_ERROR(message.str());
        }

        auto timestamp = boost::format("[%d.%09d] ") % tp.tv_sec % tp.tv_nsec;
        return timestamp.str();
    }

    std::string Logger::makeSubmessageWithInstanceID(libskiff::LogLevel logLevel) const {
        if(logLevel == libskiff::LogLevel::GENERAL) {
            return "";
        }
        return instanceID;
    }

    std::string Logger::makeSubmessageWithSystemName(libskiff::LogLevel logLevel, const std::string& systemName) const {
        if(logLevel == libskiff::LogLevel::GENERAL) {
            return "";
        }

        return "[" + systemName + "] ";
    }

    std::string Logger::makeSubmessageWithLogLevel(libskiff::LogLevel logLevel) const {
        switch(logLevel) {
            case libskiff::LogLevel::DEBUG:   return "[DEBUG] ";
            case libskiff::LogLevel::INFO :   return "[INFO] ";
            case libskiff::LogLevel::WARN :   return "[WARN] ";
            case libskiff::LogLevel::ERROR:   return "[ERROR] ";
            case libskiff::LogLevel::GENERAL: return "";
        }
        SKIFF_THROW_ERROR("logger failed to convert unknown log level to string");
    }

}
