/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * CoinUri public C API. Wallets that cannot link C++ call this file.
 */

#ifndef CoinUri_h
#define CoinUri_h

#include <stdbool.h>
#include <stdint.h>

/** The maximum buffer length for default strings in the system */
#define CU_MAX_STRING_LENGTH 256

#define CU_VERSION "1.0.0"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * CoinUri Condition Codes
 *
 * All CoinUri functions return this code.
 * CU_CC_Ok indicates that there was no issue.
 * All other values indicate some issue.
 */
typedef enum eCU_CC
{
    /** The function completed without an error */
    CU_CC_Ok = 0,
    /** An error occured */
    CU_CC_Error = 1,
    /** Unexpected NULL pointer */
    CU_CC_NULLPtr = 2,
    /** Operating system failure, such as a file that will not open */
    CU_CC_SysError = 3,
    /** JSON parsing error */
    CU_CC_JSONError = 4,
    /** The text is not a well-formed URI */
    CU_CC_SyntaxError = 5,
    /** The URI scheme is missing or belongs to no known coin */
    CU_CC_UnsupportedScheme = 6,
    /** The address is not valid for any candidate coin */
    CU_CC_InvalidAddress = 7,
    /** A URI parameter appears more than once */
    CU_CC_DuplicateField = 8,
    /** A req- parameter is not understood */
    CU_CC_RequiredFieldUnknown = 9,
    /** The amount is not a decimal number */
    CU_CC_InvalidAmount = 10,
    /** The amount has more decimal places than the coin supports */
    CU_CC_PrecisionError = 11,
    /** The amount is negative */
    CU_CC_NegativeAmount = 12,
    /** The URI has neither an address nor a payment request URL */
    CU_CC_MissingDestination = 13,
    /** An amount appeared before the coin could be determined */
    CU_CC_AmbiguousCurrency = 14,
    /** A caller-supplied value is unacceptable */
    CU_CC_InvalidArgument = 15,
    /** No coin is registered under the requested id */
    CU_CC_UnknownCoin = 16
} tCU_CC;

/**
 * CoinUri Error Structure
 *
 * This structure contains the detailed information associated
 * with an error.
 */
typedef struct sCU_Error
{
    /** The condition code code */
    tCU_CC code;
    /** String containing a description of the error */
    char szDescription[CU_MAX_STRING_LENGTH + 1];
    /** String containing the function in which the error occurred */
    char szSourceFunc[CU_MAX_STRING_LENGTH + 1];
    /** String containing the source file in which the error occurred */
    char szSourceFile[CU_MAX_STRING_LENGTH + 1];
    /** Line number in the source file in which the error occurred */
    int  nSourceLine;
} tCU_Error;

/**
 * A decoded payment URI.
 * Missing strings are NULL.
 */
typedef struct sCU_ParsedUri
{
    /** Id of the coin the URI resolved to, if any */
    char *szCoinId;
    /** Recipient address */
    char *szAddress;
    /** True if the URI carries an amount */
    bool bHasAmount;
    /** Amount in the coin's smallest unit */
    int64_t amount;
    char *szLabel;
    char *szMessage;
    /** BIP 70 payment request URL */
    char *szPaymentRequestUrl;
} tCU_ParsedUri;

/**
 * Decodes a payment URI.
 * @param szCoinId Forces the URI to be read for this coin.
 * Pass NULL to pick the coin from the URI scheme.
 * @param ppResult Receives the parsed URI, which the caller frees
 * with CU_FreeParsedUri.
 */
tCU_CC CU_ParseUri(const char *szUri,
                   const char *szCoinId,
                   tCU_ParsedUri **ppResult,
                   tCU_Error *pError);

void CU_FreeParsedUri(tCU_ParsedUri *pUri);

/**
 * Builds the canonical payment URI for an address.
 * @param amount Amount in the coin's smallest unit,
 * used only if bHasAmount is set.
 * @param szLabel Optional, may be NULL.
 * @param szMessage Optional, may be NULL.
 * @param pszResult Receives the URI, which the caller frees
 * with CU_FreeString.
 */
tCU_CC CU_EncodeUri(const char *szCoinId,
                    const char *szAddress,
                    bool bHasAmount,
                    int64_t amount,
                    const char *szLabel,
                    const char *szMessage,
                    char **pszResult,
                    tCU_Error *pError);

void CU_FreeString(char *sz);

#ifdef __cplusplus
}
#endif

#endif
