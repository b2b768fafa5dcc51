/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Two-factor authentication core public API.
 * Applications only call functions found in this file.
 */

#ifndef TFAC_h
#define TFAC_h

#include <stdbool.h>
#include <stdint.h>

/** The maximum buffer length for default strings in the system */
#define TFAC_MAX_STRING_LENGTH 256

/** The longest token the HOTP truncation will be asked to produce. */
#define TFAC_MAX_TOKEN_LENGTH 100

/** The widest clock-drift allowance on either side of the current interval. */
#define TFAC_MAX_DRIFT_TOKENS 10

/** The furthest an HOTP resynchronisation will look ahead. */
#define TFAC_MAX_HOTP_LOOK_AHEAD 100

#define TFAC_DEFAULT_SECRET_BYTES 20
#define TFAC_DEFAULT_TOKEN_LENGTH 6
#define TFAC_DEFAULT_INTERVAL_SECONDS 30

#define TFAC_VERSION "0.2.0"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * Two-Factor Core Condition Codes
 *
 * All Two-Factor Core functions return this code.
 * TFAC_CC_Ok indicates that there was no issue.
 * All other values indication some issue.
 */
typedef enum eTFAC_CC
{
    /** The function completed without an error */
    TFAC_CC_Ok = 0,
    /** An error occured */
    TFAC_CC_Error = 1,
    /** Unexpected NULL pointer */
    TFAC_CC_NULLPtr = 2,
    /** A system call or the random number generator failed */
    TFAC_CC_SysError = 3,
    /** JSON parsing error */
    TFAC_CC_JSONError = 4,
    /** The secret format is not binary, base32 or base64 */
    TFAC_CC_InvalidFormat = 5,
    /** The secret does not match its declared encoding */
    TFAC_CC_SecretDecodeError = 6,
    /** An option is out of range */
    TFAC_CC_InvalidOption = 7
} tTFAC_CC;

/**
 * Two-Factor Core Error Structure
 *
 * This structure contains the detailed information associated
 * with an error.
 * Most Two-Factor Core functions should offer the option of passing
 * a pointer to this structure to be filled out in the event of
 * error.
 */
typedef struct sTFAC_Error
{
    /** The condition code code */
    tTFAC_CC code;
    /** String containing a description of the error */
    char szDescription[TFAC_MAX_STRING_LENGTH + 1];
    /** String containing the function in which the error occurred */
    char szSourceFunc[TFAC_MAX_STRING_LENGTH + 1];
    /** String containing the source file in which the error occurred */
    char szSourceFile[TFAC_MAX_STRING_LENGTH + 1];
    /** Line number in the source file in which the error occurred */
    int  nSourceLine;
} tTFAC_Error;

/**
 * Encodings a shared secret can be passed in.
 */
typedef enum eTFAC_SecretFormat
{
    TFAC_SecretFormat_Binary = 0,
    TFAC_SecretFormat_Base32 = 1,
    TFAC_SecretFormat_Base64 = 2
} tTFAC_SecretFormat;

/**
 * Options for counter-based tokens.
 */
typedef struct sTFAC_HotpOptions
{
    /** How the secret bytes are encoded */
    tTFAC_SecretFormat secretFormat;
    /** Number of decimal digits in a token */
    unsigned int tokenLength;
} tTFAC_HotpOptions;

/**
 * Options for time-based tokens.
 */
typedef struct sTFAC_TotpOptions
{
    tTFAC_SecretFormat secretFormat;
    unsigned int tokenLength;
    /** Length of one time step */
    int64_t intervalSeconds;
    /** Added to the timestamp before dividing into intervals */
    int64_t offsetSeconds;
    /** Use injectedTimestamp instead of the system clock */
    bool bInjectTimestamp;
    int64_t injectedTimestamp;
    /** Clock-drift allowance, in whole intervals */
    unsigned int acceptablePastTokens;
    unsigned int acceptableFutureTokens;
    /** Compare every token in the window, even after a match */
    bool bScanFullWindow;
} tTFAC_TotpOptions;

void TFAC_HotpOptionsDefault(tTFAC_HotpOptions *pOptions);

void TFAC_TotpOptionsDefault(tTFAC_TotpOptions *pOptions);

tTFAC_CC TFAC_GenerateSecret(unsigned int byteCount,
                             tTFAC_SecretFormat format,
                             unsigned char **ppData,
                             unsigned int *pLength,
                             tTFAC_Error *pError);

tTFAC_CC TFAC_HotpGenerate(const unsigned char *pSecret,
                           unsigned int secretLength,
                           uint64_t counter,
                           const tTFAC_HotpOptions *pOptions,
                           char **pszToken,
                           tTFAC_Error *pError);

tTFAC_CC TFAC_HotpVerify(const unsigned char *pSecret,
                         unsigned int secretLength,
                         const char *szToken,
                         uint64_t counter,
                         const tTFAC_HotpOptions *pOptions,
                         bool *pbValid,
                         tTFAC_Error *pError);

tTFAC_CC TFAC_HotpResync(const unsigned char *pSecret,
                         unsigned int secretLength,
                         const char *szToken,
                         uint64_t counter,
                         unsigned int lookAhead,
                         const tTFAC_HotpOptions *pOptions,
                         bool *pbValid,
                         uint64_t *pNextCounter,
                         tTFAC_Error *pError);

tTFAC_CC TFAC_TotpCurrent(const unsigned char *pSecret,
                          unsigned int secretLength,
                          const tTFAC_TotpOptions *pOptions,
                          char **pszToken,
                          tTFAC_Error *pError);

tTFAC_CC TFAC_TotpTimeInterval(const tTFAC_TotpOptions *pOptions,
                               int64_t *pInterval,
                               tTFAC_Error *pError);

tTFAC_CC TFAC_TotpVerify(const unsigned char *pSecret,
                         unsigned int secretLength,
                         const char *szToken,
                         const tTFAC_TotpOptions *pOptions,
                         bool *pbValid,
                         tTFAC_Error *pError);

void TFAC_FreeStr(char *sz);

/**
 * Clears and frees a buffer returned by TFAC_GenerateSecret.
 */
void TFAC_FreeData(unsigned char *pData,
                   unsigned int length);

#ifdef __cplusplus
}
#endif

#endif
