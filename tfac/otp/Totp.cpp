/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Totp.hpp"
#include "OtpKey.hpp"
#include "../util/Debug.hpp"
#include <stdint.h>
#include <time.h>

namespace tfac {

class SystemClock:
    public Clock
{
public:
    int64_t
    now() const override
    {
        return time(nullptr);
    }
};

static bool
addOverflows(int64_t a, int64_t b)
{
    return (0 < b && INT64_MAX - b < a) || (b < 0 && a < INT64_MIN - b);
}

/**
 * Division rounding toward negative infinity, for positive divisors.
 */
static int64_t
floorDivide(int64_t a, int64_t b)
{
    int64_t q = a / b;
    if (a % b && a < 0)
        --q;
    return q;
}

static int64_t
clockTime(const TotpOptions &options, const Clock &clock)
{
    return options.timestampInjected ?
        options.injectedTimestamp : clock.now();
}

static Status
timeInterval(int64_t &result, int64_t timestamp, int64_t offsetSeconds,
    int64_t intervalSeconds)
{
    if (addOverflows(timestamp, offsetSeconds))
        return TFAC_ERROR(TFAC_CC_InvalidOption, "Timestamp " +
            std::to_string(timestamp) + " with offset " +
            std::to_string(offsetSeconds) + " is out of range");

    result = floorDivide(timestamp + offsetSeconds, intervalSeconds);
    return Status();
}

/**
 * The offset that moves the clock by `steps` whole intervals.
 */
static Status
windowOffset(int64_t &result, int64_t steps, const TotpOptions &options)
{
    if (steps && INT64_MAX / (steps < 0 ? -steps : steps) <
        options.intervalSeconds)
        return TFAC_ERROR(TFAC_CC_InvalidOption,
            "Verification window is out of range");

    int64_t shift = steps * options.intervalSeconds;
    if (addOverflows(shift, options.offsetSeconds))
        return TFAC_ERROR(TFAC_CC_InvalidOption,
            "Verification window is out of range");

    result = shift + options.offsetSeconds;
    return Status();
}

static Status
intervalToken(std::string &result, const OtpKey &key, int64_t timestamp,
    int64_t offsetSeconds, const TotpOptions &options)
{
    int64_t interval;
    TFAC_CHECK(timeInterval(interval, timestamp, offsetSeconds,
        options.intervalSeconds));

    // Intervals before the epoch wrap around, like any 64-bit counter:
    TFAC_CHECK(key.hotp(result, static_cast<uint64_t>(interval),
        options.tokenLength));
    return Status();
}

Clock::~Clock()
{
}

const Clock &
systemClock()
{
    static SystemClock clock;
    return clock;
}

Status
TotpOptions::check() const
{
    TFAC_CHECK(HotpOptions::check());

    if (intervalSeconds <= 0)
        return TFAC_ERROR(TFAC_CC_InvalidOption, "Interval of " +
            std::to_string(intervalSeconds) + " seconds is not positive");
    if (TFAC_MAX_DRIFT_TOKENS < acceptablePastTokens)
        return TFAC_ERROR(TFAC_CC_InvalidOption, "Acceptable past tokens " +
            std::to_string(acceptablePastTokens) + " is larger than " +
            std::to_string(TFAC_MAX_DRIFT_TOKENS));
    if (TFAC_MAX_DRIFT_TOKENS < acceptableFutureTokens)
        return TFAC_ERROR(TFAC_CC_InvalidOption, "Acceptable future tokens " +
            std::to_string(acceptableFutureTokens) + " is larger than " +
            std::to_string(TFAC_MAX_DRIFT_TOKENS));
    return Status();
}

Status
totpTimeInterval(int64_t &result, const TotpOptions &options,
    const Clock &clock)
{
    TFAC_CHECK(options.check());

    TFAC_CHECK(timeInterval(result, clockTime(options, clock),
        options.offsetSeconds, options.intervalSeconds));
    return Status();
}

Status
totpCurrent(std::string &result, DataSlice secret,
    const TotpOptions &options, const Clock &clock)
{
    TFAC_CHECK(options.check());

    OtpKey key;
    TFAC_CHECK(key.decode(secret, options.secretFormat));

    TFAC_CHECK(intervalToken(result, key, clockTime(options, clock),
        options.offsetSeconds, options));
    return Status();
}

Status
totpVerify(bool &result, DataSlice secret, const std::string &token,
    const TotpOptions &options, const Clock &clock)
{
    TFAC_CHECK(options.check());

    OtpKey key;
    TFAC_CHECK(key.decode(secret, options.secretFormat));

    // Read the clock once, so the window cannot straddle a tick:
    const int64_t now = clockTime(options, clock);

    const int64_t first = -static_cast<int64_t>(options.acceptablePastTokens);
    const int64_t last = options.acceptableFutureTokens;
    bool matched = false;
    for (int64_t k = first; k <= last; ++k)
    {
        int64_t offsetSeconds;
        std::string expected;
        Status s = windowOffset(offsetSeconds, k, options);
        if (s)
            s = intervalToken(expected, key, now, offsetSeconds, options);
        if (!s)
        {
            // Neighbours beyond the end of time cannot match:
            if (k && TFAC_CC_InvalidOption == s.value())
                continue;
            return s;
        }

        if (tokenEqual(expected, token))
        {
            matched = true;
            if (!options.scanFullWindow)
                break;
        }
    }

    if (matched)
        TFAC_DebugLevel(1, "TOTP token accepted");
    result = matched;
    return Status();
}

} // namespace tfac
