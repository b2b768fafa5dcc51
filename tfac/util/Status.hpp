/*
 *  Copyright (c) 2015, AirBitz, Inc.
 *  All rights reserved.
 */
#ifndef TFAC_UTIL_STATUS_HPP
#define TFAC_UTIL_STATUS_HPP

// We need tTFAC_CC and tTFAC_Error:
#include "../../src/TFAC.h"
#include <ostream>
#include <string>

namespace tfac {

/**
 * Describes the results of calling a core function,
 * which can be either success or failure.
 */
class Status
{
public:
    /**
     * Constructs a success status.
     */
    Status();

    /**
     * Constructs an error status.
     */
    Status(tTFAC_CC value, std::string message,
        const char *file, const char *function, size_t line);

    // Read accessors:
    tTFAC_CC value()            const { return value_; }
    std::string message()       const { return message_; }
    std::string file()          const { return file_; }
    std::string function()      const { return function_; }
    size_t line()               const { return line_; }

    /**
     * Returns true if the status code represents success.
     */
    explicit operator bool() const { return value_ == TFAC_CC_Ok; }

    /**
     * Writes the status to the debug log if it represents an error.
     */
    const Status &log() const;

    /**
     * Unpacks this status into a tTFAC_Error structure.
     */
    void toError(tTFAC_Error &error) const;

private:
    // Error information:
    tTFAC_CC value_;
    std::string message_;

    // Error location:
    const char *file_;
    const char *function_;
    size_t line_;
};

std::ostream &operator<<(std::ostream &output, const Status &s);

/**
 * Constructs an error status using the current source location.
 */
#define TFAC_ERROR(value, message) \
    Status(value, message, __FILE__, __FUNCTION__, __LINE__)

/**
 * Checks a status code, and returns if it represents an error.
 */
#define TFAC_CHECK(f) \
    do { \
        Status s = (f); \
        if (!s) return s; \
    } while (false)

/**
 * Use when a C API function calls a tfac::Status function.
 */
#define TFAC_CHECK_NEW(f) \
    do { \
        Status s = (f); \
        if (!s) { \
            s.toError(*pError); \
            cc = s.value(); \
            goto exit; \
        } \
    } while (false)

} // namespace tfac

#endif
