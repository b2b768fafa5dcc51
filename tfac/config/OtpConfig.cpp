/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "OtpConfig.hpp"
#include "../util/FileIO.hpp"
#include <stdlib.h>
#include <string.h>

namespace tfac {

static Status
countRange(unsigned &result, json_int_t value, json_int_t low, json_int_t high,
    const char *name)
{
    if (value < low || high < value)
        return TFAC_ERROR(TFAC_CC_InvalidOption, std::string(name) + " " +
            std::to_string(value) + " is not between " +
            std::to_string(low) + " and " + std::to_string(high));
    result = static_cast<unsigned>(value);
    return Status();
}

Status
OtpConfig::loadIfExists(const std::string &filename)
{
    if (!fileExists(filename))
    {
        reset();
        return Status();
    }
    return load(filename);
}

Status
OtpConfig::options(TotpOptions &result) const
{
    TFAC_CHECK(secretFormatValid());
    TFAC_CHECK(tokenLengthValid());
    TFAC_CHECK(intervalSecondsValid());
    TFAC_CHECK(offsetSecondsValid());
    TFAC_CHECK(acceptablePastTokensValid());
    TFAC_CHECK(acceptableFutureTokensValid());
    TFAC_CHECK(scanFullWindowValid());
    TFAC_CHECK(logFileValid());

    TotpOptions out;
    TFAC_CHECK(secretFormatFromName(out.secretFormat, secretFormat()));
    TFAC_CHECK(countRange(out.tokenLength, tokenLength(),
        1, TFAC_MAX_TOKEN_LENGTH, "tokenLength"));
    TFAC_CHECK(countRange(out.acceptablePastTokens, acceptablePastTokens(),
        0, TFAC_MAX_DRIFT_TOKENS, "acceptablePastTokens"));
    TFAC_CHECK(countRange(out.acceptableFutureTokens, acceptableFutureTokens(),
        0, TFAC_MAX_DRIFT_TOKENS, "acceptableFutureTokens"));
    out.intervalSeconds = intervalSeconds();
    out.offsetSeconds = offsetSeconds();
    out.scanFullWindow = scanFullWindow();
    TFAC_CHECK(out.check());

    result = out;
    return Status();
}

std::string
configPath()
{
    const char *home = getenv("HOME");
    if (!home || !strlen(home))
        home = "/";

    return std::string(home) + "/.config/tfac/tfac.conf";
}

} // namespace tfac
