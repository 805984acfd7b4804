/*
 * Skiff
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef libskiff_Error_hpp
#define libskiff_Error_hpp

#include <cstring>
#include <exception>
#include <string>
#include <vector>

#include "libskiff/LogLevel.hpp"

namespace libskiff {

/**
 * Exception carrying an error trace.
 *
 * Each trace entry records the message, file, line and function where it was created.
 * The first entry is created by SKIFF_THROW_ERROR, further entries are appended by
 * SKIFF_RETHROW_ERROR while the exception travels up the stack (or through the
 * continuations of a pplx::task chain).
 *
 * Subclasses (e.g. skiff::registry::RegistryError) keep their dynamic type across
 * SKIFF_RETHROW_ERROR, because the macro rethrows the original object.
 */
class Error : public std::exception {
public:
    struct ErrorTraceEntry {
        std::string errorMessage;
        std::string fileName;
        int fileLine;
        std::string functionName;
    };

public:
    Error(LogLevel logLevel, const ErrorTraceEntry& entry)
        : logLevel{ logLevel }
        , errorTrace{ entry }
    {}

    virtual ~Error() = default;

    // The message of the first entry, i.e. the error that originated the trace
    const char* what() const noexcept override {
        return errorTrace.front().errorMessage.c_str();
    }

    void appendErrorTraceEntry(const ErrorTraceEntry& entry) {
        errorTrace.push_back(entry);
    }

    const std::vector<ErrorTraceEntry>& getErrorTrace() const {
        return errorTrace;
    }

    LogLevel getLogLevel() const {
        return logLevel;
    }

    void setLogLevel(LogLevel value) {
        logLevel = value;
    }

private:
    LogLevel logLevel = LogLevel::ERROR;
    std::vector<ErrorTraceEntry> errorTrace;
};

inline bool operator==(const Error::ErrorTraceEntry& lhs, const Error::ErrorTraceEntry& rhs) {
    return lhs.errorMessage == rhs.errorMessage
        && lhs.fileName == rhs.fileName
        && lhs.fileLine == rhs.fileLine
        && lhs.functionName == rhs.functionName;
}

inline bool operator!=(const Error::ErrorTraceEntry& lhs, const Error::ErrorTraceEntry& rhs) {
    return !(lhs == rhs);
}

std::string getExceptionTypeString(const std::exception& e);

}


#define __FILENAME__ (strrchr(__FILE__, '/') ? strrchr(__FILE__, '/') + 1 : __FILE__)

#define SKIFF_MAKE_ERROR_TRACE_ENTRY(errorMessage) \
    libskiff::Error::ErrorTraceEntry{errorMessage, __FILENAME__, __LINE__, __func__}


// SKIFF_THROW_ERROR macros
#define SKIFF_GET_OVERLOADED_THROW_ERROR(_1, _2, NAME, ...) NAME

#define SKIFF_THROW_ERROR_2(errorMessage, logLevel) { \
    throw libskiff::Error{logLevel, SKIFF_MAKE_ERROR_TRACE_ENTRY(errorMessage)}; \
}

#define SKIFF_THROW_ERROR_1(errorMessage) SKIFF_THROW_ERROR_2(errorMessage, libskiff::LogLevel::ERROR)

#define SKIFF_THROW_ERROR(...) SKIFF_GET_OVERLOADED_THROW_ERROR(__VA_ARGS__, SKIFF_THROW_ERROR_2, SKIFF_THROW_ERROR_1)(__VA_ARGS__)


// SKIFF_RETHROW_ERROR macros
#define SKIFF_GET_OVERLOADED_RETHROW_ERROR(_1, _2, _3, NAME, ...) NAME

#define SKIFF_RETHROW_ERROR_3(exception, errorMessage, logLevel) { \
    auto errorTraceEntry = SKIFF_MAKE_ERROR_TRACE_ENTRY(errorMessage); \
    const auto* cp = dynamic_cast<const libskiff::Error*>(&exception); \
    if(cp) { \
        /* thrown exception objects are never const, the trace can be extended in place */ \
        auto* p = const_cast<libskiff::Error*>(cp); \
        p->setLogLevel(logLevel); \
        p->appendErrorTraceEntry(errorTraceEntry); \
        throw; \
    } \
    else { \
        auto previousErrorTraceEntry = libskiff::Error::ErrorTraceEntry{exception.what(), "unspecified location", -1, \
                                                                         libskiff::getExceptionTypeString(exception)}; \
        auto error = libskiff::Error{logLevel, previousErrorTraceEntry}; \
        error.appendErrorTraceEntry(errorTraceEntry); \
        throw error; \
    } \
}

#define SKIFF_RETHROW_ERROR_2(exception, errorMessage) { \
    const auto* cp = dynamic_cast<const libskiff::Error*>(&exception); \
    if(cp) { \
        SKIFF_RETHROW_ERROR_3(exception, errorMessage, cp->getLogLevel()) \
    } \
    else { \
        SKIFF_RETHROW_ERROR_3(exception, errorMessage, libskiff::LogLevel::ERROR) \
    } \
}

#define SKIFF_RETHROW_ERROR(...) SKIFF_GET_OVERLOADED_RETHROW_ERROR(__VA_ARGS__, SKIFF_RETHROW_ERROR_3, SKIFF_RETHROW_ERROR_2)(__VA_ARGS__)

#endif
