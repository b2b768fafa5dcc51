/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Counter-based one-time passwords, as defined by rfc4226.
 */

#ifndef TFAC_OTP_HOTP_HPP
#define TFAC_OTP_HOTP_HPP

#include "SecretFormat.hpp"

namespace tfac {

/**
 * Settings shared by every token calculation.
 */
struct HotpOptions
{
    SecretFormat secretFormat = SecretFormat::binary;
    unsigned tokenLength = TFAC_DEFAULT_TOKEN_LENGTH;

    /**
     * Verifies that the options are in range.
     */
    Status
    check() const;
};

/**
 * Calculates the token for a secret and counter.
 */
Status
hotpGenerate(std::string &result, DataSlice secret, uint64_t counter,
    const HotpOptions &options=HotpOptions());

/**
 * Returns true in `result` if the token belongs to the secret and counter.
 */
Status
hotpVerify(bool &result, DataSlice secret, const std::string &token,
    uint64_t counter, const HotpOptions &options=HotpOptions());

/**
 * Searches the counters `counter` through `counter + lookAhead`
 * for the token, as described in rfc4226 section 7.4.
 * On a match, `nextCounter` is the counter after the matching one.
 * Otherwise, it is the unchanged `counter`.
 */
Status
hotpResync(bool &result, uint64_t &nextCounter,
    DataSlice secret, const std::string &token, uint64_t counter,
    unsigned lookAhead, const HotpOptions &options=HotpOptions());

/**
 * Compares two tokens without leaking the position of the first mismatch.
 */
bool
tokenEqual(const std::string &a, const std::string &b);

} // namespace tfac

#endif
