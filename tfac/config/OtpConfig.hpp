/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TFAC_CONFIG_OTP_CONFIG_HPP
#define TFAC_CONFIG_OTP_CONFIG_HPP

#include "../json/JsonObject.hpp"
#include "../otp/Totp.hpp"

namespace tfac {

/**
 * Default token settings, stored as a JSON file.
 */
struct OtpConfig:
    public JsonObject
{
    TFAC_JSON_CONSTRUCTORS(OtpConfig, JsonObject)

    TFAC_JSON_STRING(secretFormat, "secretFormat", "binary")
    TFAC_JSON_INTEGER(tokenLength, "tokenLength", TFAC_DEFAULT_TOKEN_LENGTH)
    TFAC_JSON_INTEGER(intervalSeconds, "intervalSeconds", TFAC_DEFAULT_INTERVAL_SECONDS)
    TFAC_JSON_INTEGER(offsetSeconds, "offsetSeconds", 0)
    TFAC_JSON_INTEGER(acceptablePastTokens, "acceptablePastTokens", 0)
    TFAC_JSON_INTEGER(acceptableFutureTokens, "acceptableFutureTokens", 0)
    TFAC_JSON_BOOLEAN(scanFullWindow, "scanFullWindow", false)
    TFAC_JSON_STRING(logFile, "logFile", nullptr)

    /**
     * Loads the file if it exists.
     * A missing file leaves every setting at its default.
     */
    Status
    loadIfExists(const std::string &filename);

    /**
     * Converts the settings into validated token options.
     */
    Status
    options(TotpOptions &result) const;
};

/**
 * The default location of the configuration file:
 * ~/.config/tfac/tfac.conf
 */
std::string
configPath();

} // namespace tfac

#endif
