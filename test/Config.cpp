/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../tfac/config/OtpConfig.hpp"
#include <catch2/catch.hpp>

TEST_CASE("Default configuration", "[config]")
{
    tfac::OtpConfig config;
    REQUIRE(config.loadIfExists("/nonexistent/tfac.conf"));

    tfac::TotpOptions options;
    options.tokenLength = 9;
    REQUIRE(config.options(options));
    REQUIRE(options.secretFormat == tfac::SecretFormat::binary);
    REQUIRE(options.tokenLength == TFAC_DEFAULT_TOKEN_LENGTH);
    REQUIRE(options.intervalSeconds == TFAC_DEFAULT_INTERVAL_SECONDS);
    REQUIRE(options.offsetSeconds == 0);
    REQUIRE(options.acceptablePastTokens == 0);
    REQUIRE(options.acceptableFutureTokens == 0);
    REQUIRE_FALSE(options.scanFullWindow);
    REQUIRE_FALSE(options.timestampInjected);
    REQUIRE(!config.logFile());
}

TEST_CASE("Configuration values", "[config]")
{
    tfac::OtpConfig config;
    REQUIRE(config.decode(
        "{"
        "\"secretFormat\": \"base32\","
        "\"tokenLength\": 8,"
        "\"intervalSeconds\": 60,"
        "\"offsetSeconds\": -15,"
        "\"acceptablePastTokens\": 2,"
        "\"acceptableFutureTokens\": 1,"
        "\"scanFullWindow\": true,"
        "\"logFile\": \"/tmp/tfac.log\""
        "}"));

    tfac::TotpOptions options;
    REQUIRE(config.options(options));
    REQUIRE(options.secretFormat == tfac::SecretFormat::base32);
    REQUIRE(options.tokenLength == 8);
    REQUIRE(options.intervalSeconds == 60);
    REQUIRE(options.offsetSeconds == -15);
    REQUIRE(options.acceptablePastTokens == 2);
    REQUIRE(options.acceptableFutureTokens == 1);
    REQUIRE(options.scanFullWindow);
    REQUIRE(std::string("/tmp/tfac.log") == config.logFile());
}

TEST_CASE("Bad configuration values", "[config]")
{
    tfac::OtpConfig config;
    tfac::TotpOptions options;

    SECTION("wrong type")
    {
        REQUIRE(config.decode("{\"tokenLength\": \"6\"}"));
        auto s = config.options(options);
        REQUIRE_FALSE(s);
        REQUIRE(TFAC_CC_JSONError == s.value());
    }
    SECTION("unknown format")
    {
        REQUIRE(config.decode("{\"secretFormat\": \"hex\"}"));
        auto s = config.options(options);
        REQUIRE_FALSE(s);
        REQUIRE(TFAC_CC_InvalidFormat == s.value());
    }
    SECTION("token length")
    {
        REQUIRE(config.decode("{\"tokenLength\": 101}"));
        auto s = config.options(options);
        REQUIRE_FALSE(s);
        REQUIRE(TFAC_CC_InvalidOption == s.value());
    }
    SECTION("negative drift")
    {
        REQUIRE(config.decode("{\"acceptablePastTokens\": -1}"));
        auto s = config.options(options);
        REQUIRE_FALSE(s);
        REQUIRE(TFAC_CC_InvalidOption == s.value());
    }
    SECTION("interval")
    {
        REQUIRE(config.decode("{\"intervalSeconds\": 0}"));
        auto s = config.options(options);
        REQUIRE_FALSE(s);
        REQUIRE(TFAC_CC_InvalidOption == s.value());
    }
    SECTION("root")
    {
        auto s = config.decode("\"base32\"");
        REQUIRE_FALSE(s);
        REQUIRE(TFAC_CC_JSONError == s.value());
    }
}

TEST_CASE("Configuration path", "[config]")
{
    auto path = tfac::configPath();
    const std::string suffix = "/.config/tfac/tfac.conf";
    REQUIRE(suffix.size() < path.size());
    REQUIRE(path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0);
}
