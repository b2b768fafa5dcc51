/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TFAC_UTIL_DEBUG_HPP
#define TFAC_UTIL_DEBUG_HPP

#include "Status.hpp"

#define DEBUG_LEVEL 1

#define TFAC_DebugLevel(level, ...)  \
{                                   \
    if (DEBUG_LEVEL >= level)       \
    {                               \
        TFAC_DebugLog(__VA_ARGS__); \
    }                               \
}

namespace tfac {

/**
 * Starts copying the debug log into a file.
 * The previous log, if any, is kept alongside with a ".prev" suffix.
 */
Status
debugInitialize(const std::string &path);

void
debugTerminate();

void TFAC_DebugLog(const char *format, ...)
#ifdef __GNUC__
    __attribute__((format(printf, 1, 2)))
#endif
    ;

} // namespace tfac

#endif
