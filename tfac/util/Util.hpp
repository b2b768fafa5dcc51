/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * General-purpose utility macros for the C API.
 */

#ifndef TFAC_UTIL_UTIL_HPP
#define TFAC_UTIL_UTIL_HPP

#include "../../src/TFAC.h"
#include "Debug.hpp"
#include <string.h>
#include <stdlib.h>
#include <string>

namespace tfac {

#ifdef DEBUG
#define TFAC_LOG_ERROR(code, err_string) \
    { \
        TFAC_DebugLog("Error: %s, code: %d, func: %s, source: %s, line: %d", err_string, code, __FUNCTION__, __FILE__, __LINE__); \
    }
#else
    #define TFAC_LOG_ERROR(code, err_string) { }
#endif

#define TFAC_SET_ERR_CODE(err, set_code) \
    if (err != NULL) { \
        err->code = set_code; \
    }

#define TFAC_RET_ERROR(err, desc) \
    { \
        if (pError) \
        { \
            pError->code = err; \
            strcpy(pError->szDescription, desc); \
            strcpy(pError->szSourceFunc, __FUNCTION__); \
            strcpy(pError->szSourceFile, __FILE__); \
            pError->nSourceLine = __LINE__; \
        } \
        cc = err; \
        TFAC_LOG_ERROR(cc, desc); \
        goto exit; \
    }

#define TFAC_CHECK_ASSERT(assert, err, desc) \
    { \
        if (!(assert)) \
        { \
            TFAC_RET_ERROR(err, desc); \
        } \
    } \

#define TFAC_CHECK_NULL(arg) \
    { \
        TFAC_CHECK_ASSERT(arg != NULL, TFAC_CC_NULLPtr, "NULL pointer"); \
    } \

/**
 * Clears and frees a C string.
 */
void
stringFree(char *string);

/**
 * Copies a C++ string into a malloc'ed C string,
 * which the caller must free.
 */
char *
stringCopy(const std::string &string);

void *TFAC_UtilGuaranteedMemset(void *v, int c, size_t n);

} // namespace tfac

#endif
