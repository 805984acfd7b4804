/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include <sstream>
#include <string>

#include <boost/format.hpp>
#include <boost/regex.hpp>

#include "libskiff/Error.hpp"
#include "libskiff/Logger.hpp"
#include "aux/unitTestMain.hpp"


namespace libskiff {
namespace test {

TEST_GROUP(LoggerTestGroup) {
    void teardown() {
        libskiff::Logger::getInstance().setLevel(libskiff::LogLevel::WARN);
    }
};

class LoggerChecker {
public:
    LoggerChecker& log(libskiff::LogLevel logLevel, const std::string& message) {
        auto& logger = libskiff::Logger::getInstance();
        logger.log(message, "subsystem", logLevel, stdoutStream, stderrStream);
        return *this;
    }

    LoggerChecker& expectGeneralMessageInStdout(const std::string& message) {
        auto pattern = ".*^" + message + "\n.*";
        expectedPatternInStdout += pattern;
        return *this;
    }

    LoggerChecker& expectMessageInStdout(const std::string& logLevel, const std::string& message) {
        return expectMessage(logLevel, message, expectedPatternInStdout);
    }

    LoggerChecker& expectMessageInStderr(const std::string& logLevel, const std::string& message) {
        return expectMessage(logLevel, message, expectedPatternInStderr);
    }

    ~LoggerChecker() {
        check(stdoutStream, expectedPatternInStdout);
        check(stderrStream, expectedPatternInStderr);
    }

private:
    LoggerChecker& expectMessage(const std::string& logLevel, const std::string& message, std::string& expectedPattern) {
        auto messagePattern = "\\[.*\\..*\\] \\[.*\\] \\[subsystem\\] \\[" + logLevel + "\\] " + message + "\n";
        expectedPattern += messagePattern;
        return *this;
    }

    void check(const std::ostringstream& stream, const std::string& expectedPattern) const {
        auto regex = boost::regex(expectedPattern);
        boost::cmatch matches;
        CHECK(boost::regex_match(stream.str().c_str(), matches, regex));
    }

private:
    std::ostringstream stdoutStream;
    std::ostringstream stderrStream;

    std::string expectedPatternInStdout;
    std::string expectedPatternInStderr;
};

TEST(LoggerTestGroup, logger) {
    const std::string generalMessage = "GENERAL message";
    const std::string debugMessage = "DEBUG message";
    const std::string infoMessage = "INFO message";
    const std::string warnMessage = "WARN message";
    const std::string errorMessage = "ERROR message";

    // DEBUG level
    libskiff::Logger::getInstance().setLevel(libskiff::LogLevel::DEBUG);
    LoggerChecker{}
        .log(libskiff::LogLevel::GENERAL, generalMessage)
        .log(libskiff::LogLevel::DEBUG, debugMessage)
        .log(libskiff::LogLevel::INFO, infoMessage)
        .log(libskiff::LogLevel::WARN, warnMessage)
        .log(libskiff::LogLevel::ERROR, errorMessage)
        .expectGeneralMessageInStdout(generalMessage)
        .expectMessageInStdout("DEBUG", debugMessage)
        .expectMessageInStdout("INFO", infoMessage)
        .expectMessageInStderr("WARN", warnMessage)
        .expectMessageInStderr("ERROR", errorMessage);

    // INFO level
    libskiff::Logger::getInstance().setLevel(libskiff::LogLevel::INFO);
    LoggerChecker{}
        .log(libskiff::LogLevel::GENERAL, generalMessage)
        .log(libskiff::LogLevel::DEBUG, debugMessage)
        .log(libskiff::LogLevel::INFO, infoMessage)
        .log(libskiff::LogLevel::WARN, warnMessage)
        .log(libskiff::LogLevel::ERROR, errorMessage)
        .expectGeneralMessageInStdout(generalMessage)
        .expectMessageInStdout("INFO", infoMessage)
        .expectMessageInStderr("WARN", warnMessage)
        .expectMessageInStderr("ERROR", errorMessage);

    // WARN level
    libskiff::Logger::getInstance().setLevel(libskiff::LogLevel::WARN);
    LoggerChecker{}
        .log(libskiff::LogLevel::GENERAL, generalMessage)
        .log(libskiff::LogLevel::DEBUG, debugMessage)
        .log(libskiff::LogLevel::INFO, infoMessage)
        .log(libskiff::LogLevel::WARN, warnMessage)
        .log(libskiff::LogLevel::ERROR, errorMessage)
        .expectGeneralMessageInStdout(generalMessage)
        .expectMessageInStderr("WARN", warnMessage)
        .expectMessageInStderr("ERROR", errorMessage);

    // ERROR level
    libskiff::Logger::getInstance().setLevel(libskiff::LogLevel::ERROR);
    LoggerChecker{}
        .log(libskiff::LogLevel::GENERAL, generalMessage)
        .log(libskiff::LogLevel::DEBUG, debugMessage)
        .log(libskiff::LogLevel::INFO, infoMessage)
        .log(libskiff::LogLevel::WARN, warnMessage)
        .log(libskiff::LogLevel::ERROR, errorMessage)
        .expectGeneralMessageInStdout(generalMessage)
        .expectMessageInStderr("ERROR", errorMessage);
}

TEST(LoggerTestGroup, errorTrace) {
    libskiff::Logger::getInstance().setLevel(libskiff::LogLevel::WARN);

    auto error = libskiff::Error{libskiff::LogLevel::ERROR,
                                 libskiff::Error::ErrorTraceEntry{"inner message", "inner.cpp", 10, "innerFunction"}};
    error.appendErrorTraceEntry(libskiff::Error::ErrorTraceEntry{"outer message", "outer.cpp", 20, "outerFunction"});

    std::ostringstream errStream;
    libskiff::Logger::getInstance().logErrorTrace(error, "subsystem", errStream);

    // most nested error last
    auto output = errStream.str();
    auto outer = output.find("#0   outerFunction at outer.cpp:20 outer message");
    auto inner = output.find("#1   innerFunction at inner.cpp:10 inner message");
    CHECK(outer != std::string::npos);
    CHECK(inner != std::string::npos);
    CHECK(outer < inner);
}

TEST(LoggerTestGroup, errorTraceBelowLogLevel) {
    libskiff::Logger::getInstance().setLevel(libskiff::LogLevel::WARN);

    auto error = libskiff::Error{libskiff::LogLevel::INFO,
                                 libskiff::Error::ErrorTraceEntry{"message", "file.cpp", 1, "function"}};

    std::ostringstream errStream;
    libskiff::Logger::getInstance().logErrorTrace(error, "subsystem", errStream);
    CHECK(errStream.str().empty());
}

}}

SKIFF_UNITTEST_MAIN_FUNCTION();
