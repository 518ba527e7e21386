/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Helpers for the C API layer: error-reporting macros and
 * malloc-based copies that C callers can free.
 */

#ifndef COINURI_UTIL_UTIL_HPP
#define COINURI_UTIL_UTIL_HPP

#include "../../src/CoinUri.h"
#include "Debug.hpp"
#include <new>
#include <string>
#include <stdlib.h>
#include <string.h>

namespace coinuri {

#ifdef DEBUG
#define CU_LOG_ERROR(code, err_string) \
    { \
        CU_DebugLog("Error: %s, code: %d, func: %s, source: %s, line: %d", err_string, code, __FUNCTION__, __FILE__, __LINE__); \
    }
#else
    #define CU_LOG_ERROR(code, err_string) { }
#endif

#define CU_SET_ERR_CODE(err, set_code) \
    if (err != NULL) { \
        err->code = set_code; \
    }

#define CU_RET_ERROR(err, desc) \
    { \
        if (pError) \
        { \
            pError->code = err; \
            strcpy(pError->szDescription, desc); \
            strcpy(pError->szSourceFunc, __FUNCTION__); \
            strncpy(pError->szSourceFile, __FILE__, CU_MAX_STRING_LENGTH); \
            pError->szSourceFile[CU_MAX_STRING_LENGTH] = 0; \
            pError->nSourceLine = __LINE__; \
        } \
        cc = err; \
        CU_LOG_ERROR(cc, desc); \
        goto exit; \
    }

#define CU_CHECK_ASSERT(assert, err, desc) \
    { \
        if (!(assert)) \
        { \
            CU_RET_ERROR(err, desc); \
        } \
    } \

#define CU_CHECK_NULL(arg) \
    { \
        CU_CHECK_ASSERT(arg != NULL, CU_CC_NULLPtr, "NULL pointer"); \
    } \

/**
 * Frees a string allocated by stringCopy. Accepts NULL.
 */
void
stringFree(char *string);

/**
 * Copies a string into malloc'ed memory.
 * Throws std::bad_alloc if there is no memory.
 */
char *
stringCopy(const char *string);

char *
stringCopy(const std::string &string);

/**
 * Allocates a zero-filled C structure, which the caller releases with free.
 */
template<typename T> T *
structAlloc()
{
    auto out = static_cast<T *>(calloc(1, sizeof(T)));
    if (!out)
        throw std::bad_alloc();
    return out;
}

} // namespace coinuri

#endif
