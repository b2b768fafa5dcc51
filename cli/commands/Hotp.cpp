/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../Command.hpp"
#include "../Util.hpp"
#include "../../tfac/otp/Hotp.hpp"
#include <iostream>

using namespace tfac;

COMMAND(HotpGenerate, "hotp",
        " <secret> <counter>")
{
    if (argc != 2)
        return TFAC_ERROR(TFAC_CC_Error, helpString(*this));
    const std::string secret = argv[0];

    uint64_t counter;
    TFAC_CHECK(parseCounter(counter, argv[1], "counter"));

    std::string token;
    TFAC_CHECK(hotpGenerate(token, secret, counter, session.options));
    std::cout << token << std::endl;

    return Status();
}

COMMAND(HotpVerify, "hotp-verify",
        " <secret> <token> <counter>")
{
    if (argc != 3)
        return TFAC_ERROR(TFAC_CC_Error, helpString(*this));
    const std::string secret = argv[0];
    const auto token = argv[1];

    uint64_t counter;
    TFAC_CHECK(parseCounter(counter, argv[2], "counter"));

    bool valid;
    TFAC_CHECK(hotpVerify(valid, secret, token, counter, session.options));
    std::cout << (valid ? "valid" : "invalid") << std::endl;

    return Status();
}

COMMAND(HotpResync, "hotp-resync",
        " <secret> <token> <counter> <look-ahead>")
{
    if (argc != 4)
        return TFAC_ERROR(TFAC_CC_Error, helpString(*this));
    const std::string secret = argv[0];
    const auto token = argv[1];

    uint64_t counter;
    TFAC_CHECK(parseCounter(counter, argv[2], "counter"));
    unsigned lookAhead;
    TFAC_CHECK(parseCount(lookAhead, argv[3], TFAC_MAX_HOTP_LOOK_AHEAD,
        "look-ahead"));

    bool valid;
    uint64_t nextCounter;
    TFAC_CHECK(hotpResync(valid, nextCounter, secret, token, counter,
        lookAhead, session.options));
    if (valid)
        std::cout << "valid, next counter: " << nextCounter << std::endl;
    else
        std::cout << "invalid" << std::endl;

    return Status();
}
