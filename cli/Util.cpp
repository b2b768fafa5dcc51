/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Util.hpp"
#include <ctype.h>
#include <errno.h>
#include <stdlib.h>

using namespace tfac;

static Status
badNumber(const char *text, const char *what)
{
    return TFAC_ERROR(TFAC_CC_InvalidOption,
        std::string("Bad ") + what + " \"" + text + "\"");
}

Status
parseInteger(int64_t &result, const char *text, const char *what)
{
    char *end = nullptr;
    errno = 0;
    long long value = strtoll(text, &end, 10);
    if (!*text || *end || ERANGE == errno)
        return badNumber(text, what);

    result = value;
    return Status();
}

Status
parseCounter(uint64_t &result, const char *text, const char *what)
{
    // strtoull quietly negates a leading minus sign:
    if (!isdigit(static_cast<unsigned char>(*text)))
        return badNumber(text, what);

    char *end = nullptr;
    errno = 0;
    unsigned long long value = strtoull(text, &end, 10);
    if (*end || ERANGE == errno)
        return badNumber(text, what);

    result = value;
    return Status();
}

Status
parseCount(unsigned &result, const char *text, unsigned limit,
    const char *what)
{
    uint64_t value;
    TFAC_CHECK(parseCounter(value, text, what));
    if (limit < value)
        return TFAC_ERROR(TFAC_CC_InvalidOption, std::string(what) + " " +
            text + " is larger than " + std::to_string(limit));

    result = value;
    return Status();
}
