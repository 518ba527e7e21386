/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef COINURI_UTIL_STATUS_HPP
#define COINURI_UTIL_STATUS_HPP

#include "../../src/CoinUri.h"
#include <ostream>
#include <string>

namespace coinuri {

/**
 * The outcome of a library call.
 * A failure carries its code, a message, and the place it was raised.
 */
class Status
{
public:
    Status();
    Status(tCU_CC value, std::string message,
        const char *file, const char *function, size_t line);

    tCU_CC value()              const { return value_; }
    std::string message()       const { return message_; }
    std::string file()          const { return file_; }
    std::string function()      const { return function_; }
    size_t line()               const { return line_; }

    /**
     * True for success.
     */
    explicit operator bool() const { return value_ == CU_CC_Ok; }

    /**
     * Sends failures to CU_DebugLog. Success logs nothing.
     */
    const Status &log() const;

    /**
     * Copies this status out to the C API error structure.
     * Long strings are truncated.
     */
    void toError(tCU_Error &error) const;

private:
    tCU_CC value_;
    std::string message_;
    const char *file_;
    const char *function_;
    size_t line_;
};

std::ostream &operator<<(std::ostream &output, const Status &s);

/**
 * Builds a failure tagged with the calling location.
 */
#define CU_ERROR(value, message) \
    Status(value, message, __FILE__, __FUNCTION__, __LINE__)

/**
 * Evaluates a Status expression and passes any failure up to the caller.
 */
#define CU_CHECK(f) \
    do { \
        Status s = (f); \
        if (!s) return s; \
    } while (false)

/**
 * Use when a C API function calls a Status function.
 * The caller needs a `tCU_CC cc` variable and an `exit` label.
 */
#define CU_CHECK_NEW(f, pError) \
    do { \
        Status s = (f); \
        if (!s) { \
            if (pError) \
                s.toError(*pError); \
            cc = s.value(); \
            goto exit; \
        } \
    } while (false)

} // namespace coinuri

#endif
