/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "TFAC.h"
#include "../tfac/otp/Hotp.hpp"
#include "../tfac/otp/Secret.hpp"
#include "../tfac/otp/Totp.hpp"
#include "../tfac/util/Debug.hpp"
#include "../tfac/util/Util.hpp"

using namespace tfac;

#define TFAC_PROLOG() \
    TFAC_DebugLog("%s called", __FUNCTION__); \
    tTFAC_CC cc = TFAC_CC_Ok; \
    tTFAC_Error localError; \
    if (!pError) \
        pError = &localError; \
    TFAC_SET_ERR_CODE(pError, TFAC_CC_Ok);

static Status
hotpOptions(HotpOptions &result, const tTFAC_HotpOptions *pOptions)
{
    HotpOptions out;
    if (pOptions)
    {
        TFAC_CHECK(secretFormatFromCode(out.secretFormat, pOptions->secretFormat));
        out.tokenLength = pOptions->tokenLength;
    }
    result = out;
    return Status();
}

static Status
totpOptions(TotpOptions &result, const tTFAC_TotpOptions *pOptions)
{
    TotpOptions out;
    if (pOptions)
    {
        TFAC_CHECK(secretFormatFromCode(out.secretFormat, pOptions->secretFormat));
        out.tokenLength = pOptions->tokenLength;
        out.intervalSeconds = pOptions->intervalSeconds;
        out.offsetSeconds = pOptions->offsetSeconds;
        if (pOptions->bInjectTimestamp)
            out.injectTimestamp(pOptions->injectedTimestamp);
        out.acceptablePastTokens = pOptions->acceptablePastTokens;
        out.acceptableFutureTokens = pOptions->acceptableFutureTokens;
        out.scanFullWindow = pOptions->bScanFullWindow;
    }
    result = out;
    return Status();
}

void TFAC_HotpOptionsDefault(tTFAC_HotpOptions *pOptions)
{
    if (!pOptions)
        return;
    pOptions->secretFormat = TFAC_SecretFormat_Binary;
    pOptions->tokenLength = TFAC_DEFAULT_TOKEN_LENGTH;
}

void TFAC_TotpOptionsDefault(tTFAC_TotpOptions *pOptions)
{
    if (!pOptions)
        return;
    pOptions->secretFormat = TFAC_SecretFormat_Binary;
    pOptions->tokenLength = TFAC_DEFAULT_TOKEN_LENGTH;
    pOptions->intervalSeconds = TFAC_DEFAULT_INTERVAL_SECONDS;
    pOptions->offsetSeconds = 0;
    pOptions->bInjectTimestamp = false;
    pOptions->injectedTimestamp = 0;
    pOptions->acceptablePastTokens = 0;
    pOptions->acceptableFutureTokens = 0;
    pOptions->bScanFullWindow = false;
}

tTFAC_CC TFAC_GenerateSecret(unsigned int byteCount,
                             tTFAC_SecretFormat format,
                             unsigned char **ppData,
                             unsigned int *pLength,
                             tTFAC_Error *pError)
{
    TFAC_PROLOG();
    TFAC_CHECK_NULL(ppData);
    TFAC_CHECK_NULL(pLength);

    {
        SecretFormat secretFormat;
        TFAC_CHECK_NEW(secretFormatFromCode(secretFormat, format));

        DataChunk secret;
        TFAC_CHECK_NEW(generateSecret(secret, byteCount, secretFormat));

        // Leave room so an empty secret is still a valid allocation:
        unsigned char *pData = (unsigned char *)malloc(secret.size() + 1);
        TFAC_CHECK_ASSERT(pData, TFAC_CC_SysError, "malloc failed (returned NULL)");
        if (secret.size())
            memcpy(pData, secret.data(), secret.size());
        *ppData = pData;
        *pLength = secret.size();
        dataWipe(secret);
    }

exit:
    return cc;
}

tTFAC_CC TFAC_HotpGenerate(const unsigned char *pSecret,
                           unsigned int secretLength,
                           uint64_t counter,
                           const tTFAC_HotpOptions *pOptions,
                           char **pszToken,
                           tTFAC_Error *pError)
{
    TFAC_PROLOG();
    TFAC_CHECK_ASSERT(pSecret || !secretLength, TFAC_CC_NULLPtr, "NULL pointer");
    TFAC_CHECK_NULL(pszToken);

    {
        HotpOptions options;
        TFAC_CHECK_NEW(hotpOptions(options, pOptions));

        std::string token;
        TFAC_CHECK_NEW(hotpGenerate(token,
            DataSlice(pSecret, pSecret + secretLength), counter, options));
        *pszToken = stringCopy(token);
    }

exit:
    return cc;
}

tTFAC_CC TFAC_HotpVerify(const unsigned char *pSecret,
                         unsigned int secretLength,
                         const char *szToken,
                         uint64_t counter,
                         const tTFAC_HotpOptions *pOptions,
                         bool *pbValid,
                         tTFAC_Error *pError)
{
    TFAC_PROLOG();
    TFAC_CHECK_ASSERT(pSecret || !secretLength, TFAC_CC_NULLPtr, "NULL pointer");
    TFAC_CHECK_NULL(szToken);
    TFAC_CHECK_NULL(pbValid);

    {
        HotpOptions options;
        TFAC_CHECK_NEW(hotpOptions(options, pOptions));

        bool valid = false;
        TFAC_CHECK_NEW(hotpVerify(valid,
            DataSlice(pSecret, pSecret + secretLength), szToken, counter,
            options));
        *pbValid = valid;
    }

exit:
    return cc;
}

tTFAC_CC TFAC_HotpResync(const unsigned char *pSecret,
                         unsigned int secretLength,
                         const char *szToken,
                         uint64_t counter,
                         unsigned int lookAhead,
                         const tTFAC_HotpOptions *pOptions,
                         bool *pbValid,
                         uint64_t *pNextCounter,
                         tTFAC_Error *pError)
{
    TFAC_PROLOG();
    TFAC_CHECK_ASSERT(pSecret || !secretLength, TFAC_CC_NULLPtr, "NULL pointer");
    TFAC_CHECK_NULL(szToken);
    TFAC_CHECK_NULL(pbValid);
    TFAC_CHECK_NULL(pNextCounter);

    {
        HotpOptions options;
        TFAC_CHECK_NEW(hotpOptions(options, pOptions));

        bool valid = false;
        uint64_t nextCounter = counter;
        TFAC_CHECK_NEW(hotpResync(valid, nextCounter,
            DataSlice(pSecret, pSecret + secretLength), szToken, counter,
            lookAhead, options));
        *pbValid = valid;
        *pNextCounter = nextCounter;
    }

exit:
    return cc;
}

tTFAC_CC TFAC_TotpCurrent(const unsigned char *pSecret,
                          unsigned int secretLength,
                          const tTFAC_TotpOptions *pOptions,
                          char **pszToken,
                          tTFAC_Error *pError)
{
    TFAC_PROLOG();
    TFAC_CHECK_ASSERT(pSecret || !secretLength, TFAC_CC_NULLPtr, "NULL pointer");
    TFAC_CHECK_NULL(pszToken);

    {
        TotpOptions options;
        TFAC_CHECK_NEW(totpOptions(options, pOptions));

        std::string token;
        TFAC_CHECK_NEW(totpCurrent(token,
            DataSlice(pSecret, pSecret + secretLength), options));
        *pszToken = stringCopy(token);
    }

exit:
    return cc;
}

tTFAC_CC TFAC_TotpTimeInterval(const tTFAC_TotpOptions *pOptions,
                               int64_t *pInterval,
                               tTFAC_Error *pError)
{
    TFAC_PROLOG();
    TFAC_CHECK_NULL(pInterval);

    {
        TotpOptions options;
        TFAC_CHECK_NEW(totpOptions(options, pOptions));

        int64_t interval = 0;
        TFAC_CHECK_NEW(totpTimeInterval(interval, options));
        *pInterval = interval;
    }

exit:
    return cc;
}

tTFAC_CC TFAC_TotpVerify(const unsigned char *pSecret,
                         unsigned int secretLength,
                         const char *szToken,
                         const tTFAC_TotpOptions *pOptions,
                         bool *pbValid,
                         tTFAC_Error *pError)
{
    TFAC_PROLOG();
    TFAC_CHECK_ASSERT(pSecret || !secretLength, TFAC_CC_NULLPtr, "NULL pointer");
    TFAC_CHECK_NULL(szToken);
    TFAC_CHECK_NULL(pbValid);

    {
        TotpOptions options;
        TFAC_CHECK_NEW(totpOptions(options, pOptions));

        bool valid = false;
        TFAC_CHECK_NEW(totpVerify(valid,
            DataSlice(pSecret, pSecret + secretLength), szToken, options));
        *pbValid = valid;
    }

exit:
    return cc;
}

void TFAC_FreeStr(char *sz)
{
    stringFree(sz);
}

void TFAC_FreeData(unsigned char *pData,
                   unsigned int length)
{
    if (pData)
    {
        TFAC_UtilGuaranteedMemset(pData, 0, length);
        free(pData);
    }
}
