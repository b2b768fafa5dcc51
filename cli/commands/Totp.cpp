/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../Command.hpp"
#include "../../tfac/otp/Totp.hpp"
#include <iostream>

using namespace tfac;

COMMAND(TotpCurrent, "totp",
        " <secret>")
{
    if (argc != 1)
        return TFAC_ERROR(TFAC_CC_Error, helpString(*this));
    const std::string secret = argv[0];

    std::string token;
    TFAC_CHECK(totpCurrent(token, secret, session.options));
    std::cout << token << std::endl;

    return Status();
}

COMMAND(TotpInterval, "totp-interval",
        "")
{
    if (argc != 0)
        return TFAC_ERROR(TFAC_CC_Error, helpString(*this));

    int64_t interval;
    TFAC_CHECK(totpTimeInterval(interval, session.options));
    std::cout << interval << std::endl;

    return Status();
}

COMMAND(TotpVerify, "totp-verify",
        " <secret> <token>")
{
    if (argc != 2)
        return TFAC_ERROR(TFAC_CC_Error, helpString(*this));
    const std::string secret = argv[0];
    const auto token = argv[1];

    bool valid;
    TFAC_CHECK(totpVerify(valid, secret, token, session.options));
    std::cout << (valid ? "valid" : "invalid") << std::endl;

    return Status();
}
