/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Hotp.hpp"
#include "OtpKey.hpp"
#include <openssl/crypto.h>

namespace tfac {

Status
HotpOptions::check() const
{
    if (tokenLength < 1 || TFAC_MAX_TOKEN_LENGTH < tokenLength)
        return TFAC_ERROR(TFAC_CC_InvalidOption, "Token length " +
            std::to_string(tokenLength) + " is not between 1 and " +
            std::to_string(TFAC_MAX_TOKEN_LENGTH));
    return Status();
}

Status
hotpGenerate(std::string &result, DataSlice secret, uint64_t counter,
    const HotpOptions &options)
{
    TFAC_CHECK(options.check());

    OtpKey key;
    TFAC_CHECK(key.decode(secret, options.secretFormat));
    TFAC_CHECK(key.hotp(result, counter, options.tokenLength));
    return Status();
}

Status
hotpVerify(bool &result, DataSlice secret, const std::string &token,
    uint64_t counter, const HotpOptions &options)
{
    std::string expected;
    TFAC_CHECK(hotpGenerate(expected, secret, counter, options));

    result = tokenEqual(expected, token);
    return Status();
}

Status
hotpResync(bool &result, uint64_t &nextCounter,
    DataSlice secret, const std::string &token, uint64_t counter,
    unsigned lookAhead, const HotpOptions &options)
{
    TFAC_CHECK(options.check());
    if (TFAC_MAX_HOTP_LOOK_AHEAD < lookAhead)
        return TFAC_ERROR(TFAC_CC_InvalidOption, "Look-ahead " +
            std::to_string(lookAhead) + " is larger than " +
            std::to_string(TFAC_MAX_HOTP_LOOK_AHEAD));

    OtpKey key;
    TFAC_CHECK(key.decode(secret, options.secretFormat));

    for (unsigned i = 0; i <= lookAhead; ++i)
    {
        std::string expected;
        TFAC_CHECK(key.hotp(expected, counter + i, options.tokenLength));
        if (tokenEqual(expected, token))
        {
            result = true;
            nextCounter = counter + i + 1;
            return Status();
        }
    }

    result = false;
    nextCounter = counter;
    return Status();
}

bool
tokenEqual(const std::string &a, const std::string &b)
{
    if (a.size() != b.size())
        return false;
    return !a.size() || !CRYPTO_memcmp(a.data(), b.data(), a.size());
}

} // namespace tfac
