/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Utilities and helpers shared between commands.
 */

#ifndef CLI_UTIL_HPP
#define CLI_UTIL_HPP

#include "../tfac/util/Status.hpp"
#include <stdint.h>

/**
 * Parses a signed decimal integer, rejecting trailing garbage.
 */
tfac::Status
parseInteger(int64_t &result, const char *text, const char *what);

/**
 * Parses an unsigned decimal integer, rejecting signs and trailing garbage.
 */
tfac::Status
parseCounter(uint64_t &result, const char *text, const char *what);

/**
 * Parses an unsigned integer no larger than `limit`.
 */
tfac::Status
parseCount(unsigned &result, const char *text, unsigned limit,
    const char *what);

#endif
