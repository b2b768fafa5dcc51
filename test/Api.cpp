/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../src/TFAC.h"
#include <catch2/catch.hpp>
#include <string.h>

static const unsigned char rfcSecret[] = "12345678901234567890";
static const unsigned rfcLength = 20;

TEST_CASE("C API defaults", "[api]")
{
    tTFAC_TotpOptions options;
    memset(&options, 0xff, sizeof(options));
    TFAC_TotpOptionsDefault(&options);
    REQUIRE(TFAC_SecretFormat_Binary == options.secretFormat);
    REQUIRE(TFAC_DEFAULT_TOKEN_LENGTH == options.tokenLength);
    REQUIRE(TFAC_DEFAULT_INTERVAL_SECONDS == options.intervalSeconds);
    REQUIRE(0 == options.offsetSeconds);
    REQUIRE_FALSE(options.bInjectTimestamp);
    REQUIRE(0 == options.acceptablePastTokens);
    REQUIRE(0 == options.acceptableFutureTokens);
    REQUIRE_FALSE(options.bScanFullWindow);

    tTFAC_HotpOptions hotp;
    TFAC_HotpOptionsDefault(&hotp);
    REQUIRE(TFAC_SecretFormat_Binary == hotp.secretFormat);
    REQUIRE(TFAC_DEFAULT_TOKEN_LENGTH == hotp.tokenLength);

    // Harmless:
    TFAC_HotpOptionsDefault(NULL);
    TFAC_TotpOptionsDefault(NULL);
}

TEST_CASE("C API secrets", "[api]")
{
    tTFAC_Error error;
    unsigned char *pData = NULL;
    unsigned length = 0;

    REQUIRE(TFAC_CC_Ok == TFAC_GenerateSecret(20, TFAC_SecretFormat_Base32,
        &pData, &length, &error));
    REQUIRE(32 == length);
    REQUIRE(pData);

    // The encoded secret feeds straight back in:
    tTFAC_HotpOptions options;
    TFAC_HotpOptionsDefault(&options);
    options.secretFormat = TFAC_SecretFormat_Base32;
    char *szToken = NULL;
    REQUIRE(TFAC_CC_Ok == TFAC_HotpGenerate(pData, length, 0, &options,
        &szToken, &error));
    REQUIRE(6 == strlen(szToken));
    TFAC_FreeStr(szToken);
    TFAC_FreeData(pData, length);
    TFAC_FreeData(NULL, 0);

    // Binary secrets can be released with their length:
    REQUIRE(TFAC_CC_Ok == TFAC_GenerateSecret(20, TFAC_SecretFormat_Binary,
        &pData, &length, &error));
    REQUIRE(20 == length);
    TFAC_FreeData(pData, length);

    REQUIRE(TFAC_CC_InvalidFormat == TFAC_GenerateSecret(20,
        (tTFAC_SecretFormat)3, &pData, &length, &error));
    REQUIRE(TFAC_CC_InvalidFormat == error.code);

    REQUIRE(TFAC_CC_NULLPtr == TFAC_GenerateSecret(20,
        TFAC_SecretFormat_Binary, NULL, &length, &error));
    REQUIRE(TFAC_CC_NULLPtr == error.code);
}

TEST_CASE("C API HOTP", "[api]")
{
    tTFAC_Error error;
    char *szToken = NULL;

    // Null options mean the defaults:
    REQUIRE(TFAC_CC_Ok == TFAC_HotpGenerate(rfcSecret, rfcLength, 1, NULL,
        &szToken, &error));
    REQUIRE(std::string("287082") == szToken);
    TFAC_FreeStr(szToken);

    bool valid = false;
    REQUIRE(TFAC_CC_Ok == TFAC_HotpVerify(rfcSecret, rfcLength, "287082", 1,
        NULL, &valid, NULL));
    REQUIRE(valid);
    REQUIRE(TFAC_CC_Ok == TFAC_HotpVerify(rfcSecret, rfcLength, "287082", 2,
        NULL, &valid, NULL));
    REQUIRE_FALSE(valid);

    uint64_t next = 0;
    REQUIRE(TFAC_CC_Ok == TFAC_HotpResync(rfcSecret, rfcLength, "969429", 1,
        5, NULL, &valid, &next, &error));
    REQUIRE(valid);
    REQUIRE(4 == next);

    tTFAC_HotpOptions options;
    TFAC_HotpOptionsDefault(&options);
    options.tokenLength = 0;
    REQUIRE(TFAC_CC_InvalidOption == TFAC_HotpGenerate(rfcSecret, rfcLength,
        1, &options, &szToken, &error));
    REQUIRE(TFAC_CC_InvalidOption == error.code);
    REQUIRE(strlen(error.szDescription));

    options.tokenLength = 6;
    options.secretFormat = TFAC_SecretFormat_Base32;
    REQUIRE(TFAC_CC_SecretDecodeError == TFAC_HotpGenerate(
        (const unsigned char *)"not_base32", 10, 1, &options, &szToken,
        &error));

    REQUIRE(TFAC_CC_NULLPtr == TFAC_HotpGenerate(NULL, 20, 1, NULL,
        &szToken, &error));
    REQUIRE(TFAC_CC_NULLPtr == TFAC_HotpVerify(rfcSecret, rfcLength, NULL, 1,
        NULL, &valid, &error));
}

TEST_CASE("C API TOTP", "[api]")
{
    tTFAC_Error error;
    tTFAC_TotpOptions options;
    TFAC_TotpOptionsDefault(&options);
    options.tokenLength = 8;
    options.bInjectTimestamp = true;
    options.injectedTimestamp = 1111111109;

    char *szToken = NULL;
    REQUIRE(TFAC_CC_Ok == TFAC_TotpCurrent(rfcSecret, rfcLength, &options,
        &szToken, &error));
    REQUIRE(std::string("07081804") == szToken);
    TFAC_FreeStr(szToken);

    int64_t interval = 0;
    REQUIRE(TFAC_CC_Ok == TFAC_TotpTimeInterval(&options, &interval, &error));
    REQUIRE(37037036 == interval);

    bool valid = false;
    REQUIRE(TFAC_CC_Ok == TFAC_TotpVerify(rfcSecret, rfcLength, "07081804",
        &options, &valid, &error));
    REQUIRE(valid);

    options.injectedTimestamp = 59;
    options.tokenLength = 6;
    options.acceptablePastTokens = 1;
    REQUIRE(TFAC_CC_Ok == TFAC_TotpVerify(rfcSecret, rfcLength, "755224",
        &options, &valid, &error));
    REQUIRE(valid);

    options.intervalSeconds = 0;
    REQUIRE(TFAC_CC_InvalidOption == TFAC_TotpTimeInterval(&options,
        &interval, &error));
    REQUIRE(TFAC_CC_NULLPtr == TFAC_TotpTimeInterval(&options, NULL, &error));
}
