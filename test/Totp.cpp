/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../tfac/otp/Totp.hpp"
#include "../tfac/otp/Secret.hpp"
#include <catch2/catch.hpp>

static const std::string rfcSecret = "12345678901234567890";

class FixedClock:
    public tfac::Clock
{
public:
    FixedClock(int64_t time): time_(time) {}

    int64_t
    now() const override
    {
        ++reads;
        return time_;
    }

    mutable int reads = 0;

private:
    int64_t time_;
};

static int64_t
interval(int64_t timestamp, int64_t seconds=30, int64_t offset=0)
{
    tfac::TotpOptions options;
    options.intervalSeconds = seconds;
    options.offsetSeconds = offset;
    options.injectTimestamp(timestamp);

    int64_t out = 0;
    auto s = tfac::totpTimeInterval(out, options);
    REQUIRE(s);
    return out;
}

TEST_CASE("TOTP time intervals", "[otp][totp]")
{
    REQUIRE(interval(0) == 0);
    REQUIRE(interval(29) == 0);
    REQUIRE(interval(30) == 1);
    REQUIRE(interval(59) == 1);
    REQUIRE(interval(60) == 2);
    REQUIRE(interval(1111111109) == 37037036);
    REQUIRE(interval(100, 10) == 10);
    REQUIRE(interval(100, 10, 5) == 10);
    REQUIRE(interval(100, 10, -1) == 9);
}

TEST_CASE("TOTP intervals before the epoch round down", "[otp][totp]")
{
    REQUIRE(interval(-1) == -1);
    REQUIRE(interval(-30) == -1);
    REQUIRE(interval(-31) == -2);
    REQUIRE(interval(0, 30, -1) == -1);
}

TEST_CASE("RFC 6238 test vectors", "[otp][totp]")
{
    struct
    {
        int64_t time;
        const char *token;
    } cases[] =
    {
        {59, "94287082"},
        {1111111109, "07081804"},
        {1111111111, "14050471"},
        {1234567890, "89005924"},
        {2000000000, "69279037"},
        {20000000000, "65353130"}
    };

    tfac::TotpOptions options;
    options.tokenLength = 8;
    for (const auto &test: cases)
    {
        options.injectTimestamp(test.time);
        std::string token;
        REQUIRE(tfac::totpCurrent(token, rfcSecret, options));
        REQUIRE(token == test.token);

        bool valid = false;
        REQUIRE(tfac::totpVerify(valid, rfcSecret, test.token, options));
        REQUIRE(valid);
    }
}

TEST_CASE("TOTP tokens match HOTP at the interval counter", "[otp][totp]")
{
    tfac::DataChunk secret;
    REQUIRE(tfac::generateSecret(secret));

    tfac::TotpOptions options;
    options.injectTimestamp(1500000000);
    const int64_t base = interval(1500000000);

    for (int64_t k = -3; k <= 3; ++k)
    {
        options.offsetSeconds = k * options.intervalSeconds;
        std::string totp, hotp;
        REQUIRE(tfac::totpCurrent(totp, secret, options));
        REQUIRE(tfac::hotpGenerate(hotp, secret, base + k));
        REQUIRE(totp == hotp);
    }
}

TEST_CASE("TOTP before the epoch wraps the counter", "[otp][totp]")
{
    tfac::TotpOptions options;
    options.injectTimestamp(-1);

    std::string token;
    REQUIRE(tfac::totpCurrent(token, rfcSecret, options));
    REQUIRE(token == "094451");
}

TEST_CASE("TOTP drift window", "[otp][totp]")
{
    // At 59 seconds the counter is 1, so the neighbours are 0 and 2:
    tfac::TotpOptions options;
    options.injectTimestamp(59);
    bool valid;

    REQUIRE(tfac::totpVerify(valid, rfcSecret, "287082", options));
    REQUIRE(valid);
    REQUIRE(tfac::totpVerify(valid, rfcSecret, "755224", options));
    REQUIRE_FALSE(valid);
    REQUIRE(tfac::totpVerify(valid, rfcSecret, "359152", options));
    REQUIRE_FALSE(valid);

    options.acceptablePastTokens = 1;
    REQUIRE(tfac::totpVerify(valid, rfcSecret, "755224", options));
    REQUIRE(valid);
    REQUIRE(tfac::totpVerify(valid, rfcSecret, "359152", options));
    REQUIRE_FALSE(valid);

    options.acceptableFutureTokens = 1;
    REQUIRE(tfac::totpVerify(valid, rfcSecret, "359152", options));
    REQUIRE(valid);
    REQUIRE(tfac::totpVerify(valid, rfcSecret, "969429", options));
    REQUIRE_FALSE(valid);

    options.scanFullWindow = true;
    REQUIRE(tfac::totpVerify(valid, rfcSecret, "755224", options));
    REQUIRE(valid);
    REQUIRE(tfac::totpVerify(valid, rfcSecret, "287082", options));
    REQUIRE(valid);
    REQUIRE(tfac::totpVerify(valid, rfcSecret, "969429", options));
    REQUIRE_FALSE(valid);
}

TEST_CASE("TOTP reads an injected clock once", "[otp][totp]")
{
    FixedClock clock(59);
    tfac::TotpOptions options;
    options.acceptablePastTokens = 2;
    options.acceptableFutureTokens = 2;
    options.scanFullWindow = true;

    bool valid = false;
    REQUIRE(tfac::totpVerify(valid, rfcSecret, "969429", options, clock));
    REQUIRE(valid);
    REQUIRE(clock.reads == 1);

    std::string token;
    REQUIRE(tfac::totpCurrent(token, rfcSecret, options, clock));
    REQUIRE(token == "287082");

    // An injected timestamp wins over the clock:
    clock.reads = 0;
    options.injectTimestamp(0);
    REQUIRE(tfac::totpCurrent(token, rfcSecret, options, clock));
    REQUIRE(token == "755224");
    REQUIRE(clock.reads == 0);
}

TEST_CASE("TOTP option limits", "[otp][totp]")
{
    tfac::TotpOptions options;
    options.injectTimestamp(59);
    std::string token;
    int64_t out;

    options.intervalSeconds = 0;
    auto s = tfac::totpCurrent(token, rfcSecret, options);
    REQUIRE_FALSE(s);
    REQUIRE(TFAC_CC_InvalidOption == s.value());

    options.intervalSeconds = -30;
    s = tfac::totpTimeInterval(out, options);
    REQUIRE_FALSE(s);
    REQUIRE(TFAC_CC_InvalidOption == s.value());

    options.intervalSeconds = 30;
    options.acceptablePastTokens = TFAC_MAX_DRIFT_TOKENS + 1;
    bool valid;
    s = tfac::totpVerify(valid, rfcSecret, "287082", options);
    REQUIRE_FALSE(s);
    REQUIRE(TFAC_CC_InvalidOption == s.value());

    options.acceptablePastTokens = TFAC_MAX_DRIFT_TOKENS;
    options.acceptableFutureTokens = TFAC_MAX_DRIFT_TOKENS;
    REQUIRE(tfac::totpVerify(valid, rfcSecret, "287082", options));
    REQUIRE(valid);

    options.tokenLength = 0;
    s = tfac::totpCurrent(token, rfcSecret, options);
    REQUIRE_FALSE(s);
    REQUIRE(TFAC_CC_InvalidOption == s.value());
}

TEST_CASE("TOTP timestamps out of range", "[otp][totp]")
{
    tfac::TotpOptions options;
    options.injectTimestamp(INT64_MAX);
    options.offsetSeconds = 1;

    int64_t out;
    auto s = tfac::totpTimeInterval(out, options);
    REQUIRE_FALSE(s);
    REQUIRE(TFAC_CC_InvalidOption == s.value());

    options.offsetSeconds = 0;
    REQUIRE(tfac::totpTimeInterval(out, options));
    REQUIRE(out == INT64_MAX / 30);
}

TEST_CASE("TOTP with encoded secrets", "[otp][totp]")
{
    tfac::TotpOptions options;
    options.injectTimestamp(59);
    options.secretFormat = tfac::SecretFormat::base32;

    std::string token;
    REQUIRE(tfac::totpCurrent(token,
        std::string("GEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQ"), options));
    REQUIRE(token == "287082");

    bool valid = true;
    auto s = tfac::totpVerify(valid, std::string("not_base32"), "287082",
        options);
    REQUIRE_FALSE(s);
    REQUIRE(TFAC_CC_SecretDecodeError == s.value());
}

TEST_CASE("TOTP windows at the edges of time", "[otp][totp]")
{
    for (int64_t time: {INT64_MIN + 10, INT64_MAX - 10})
    {
        tfac::TotpOptions options;
        options.injectTimestamp(time);

        std::string token;
        REQUIRE(tfac::totpCurrent(token, rfcSecret, options));

        // Neighbours that fall off the range are skipped:
        options.acceptablePastTokens = 1;
        options.acceptableFutureTokens = 1;
        bool valid = false;
        REQUIRE(tfac::totpVerify(valid, rfcSecret, token, options));
        REQUIRE(valid);

        options.scanFullWindow = true;
        valid = false;
        REQUIRE(tfac::totpVerify(valid, rfcSecret, token, options));
        REQUIRE(valid);
    }

    // The current interval itself must still be in range:
    tfac::TotpOptions options;
    options.injectTimestamp(INT64_MAX);
    options.offsetSeconds = 1;
    options.acceptableFutureTokens = 1;
    bool valid;
    auto s = tfac::totpVerify(valid, rfcSecret, "287082", options);
    REQUIRE_FALSE(s);
    REQUIRE(TFAC_CC_InvalidOption == s.value());
}
