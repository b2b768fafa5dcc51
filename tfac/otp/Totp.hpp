/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Time-based one-time passwords, as defined by rfc6238.
 */

#ifndef TFAC_OTP_TOTP_HPP
#define TFAC_OTP_TOTP_HPP

#include "Hotp.hpp"

namespace tfac {

/**
 * A source of the current Unix time, in seconds.
 */
class Clock
{
public:
    virtual ~Clock();
    virtual int64_t now() const = 0;
};

/**
 * The wall clock.
 */
const Clock &
systemClock();

/**
 * Settings for time-based tokens.
 * Every HOTP setting passes through to the underlying calculation.
 */
struct TotpOptions:
    public HotpOptions
{
    int64_t intervalSeconds = TFAC_DEFAULT_INTERVAL_SECONDS;
    int64_t offsetSeconds = 0;

    // Replaces the clock, for reproducible results:
    bool timestampInjected = false;
    int64_t injectedTimestamp = 0;

    // Clock-drift allowance, in whole intervals:
    unsigned acceptablePastTokens = 0;
    unsigned acceptableFutureTokens = 0;

    /**
     * Makes verification check every token in the window,
     * so the running time does not reveal which one matched.
     */
    bool scanFullWindow = false;

    void
    injectTimestamp(int64_t timestamp)
    {
        timestampInjected = true;
        injectedTimestamp = timestamp;
    }

    Status
    check() const;
};

/**
 * Calculates the HOTP counter for the current time:
 * floor((timestamp + offsetSeconds) / intervalSeconds).
 */
Status
totpTimeInterval(int64_t &result, const TotpOptions &options=TotpOptions(),
    const Clock &clock=systemClock());

/**
 * Calculates the token for the current time.
 */
Status
totpCurrent(std::string &result, DataSlice secret,
    const TotpOptions &options=TotpOptions(),
    const Clock &clock=systemClock());

/**
 * Returns true in `result` if the token matches any interval in the window
 * from `acceptablePastTokens` intervals ago to `acceptableFutureTokens`
 * intervals ahead.
 */
Status
totpVerify(bool &result, DataSlice secret, const std::string &token,
    const TotpOptions &options=TotpOptions(),
    const Clock &clock=systemClock());

} // namespace tfac

#endif
