/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "CoinUri.h"
#include "../coinuri/coin/CoinRegistry.hpp"
#include "../coinuri/uri/CoinUri.hpp"
#include "../coinuri/util/Debug.hpp"
#include "../coinuri/util/Util.hpp"
#include <memory>
#include <new>

using namespace coinuri;

#define CU_PROLOG() \
    CU_DebugLog("%s called", __FUNCTION__); \
    tCU_CC cc = CU_CC_Ok; \
    CU_SET_ERR_CODE(pError, CU_CC_Ok);

static const CoinRegistry &
builtinRegistry()
{
    static const CoinRegistry registry = CoinRegistry::builtin();
    return registry;
}

static char *
optionalCopy(bool ok, const std::string &value)
{
    return ok ? stringCopy(value) : nullptr;
}

/**
 * Converts a parsed URI to its C form.
 * A partial result is freed if memory runs out part way.
 */
static Status
parsedUriCopy(tCU_ParsedUri *&result, const CoinUri &uri)
{
    std::unique_ptr<tCU_ParsedUri, void (*)(tCU_ParsedUri *)>
        out(nullptr, CU_FreeParsedUri);
    try
    {
        out.reset(structAlloc<tCU_ParsedUri>());
        out->szCoinId = uri.coin() ? stringCopy(uri.coin()->id) : nullptr;
        out->szAddress = optionalCopy(uri.addressOk(), uri.address().encoded());
        out->bHasAmount = uri.amountOk();
        out->amount = uri.amountOk() ? uri.amount().value() : 0;
        out->szLabel = optionalCopy(uri.labelOk(), uri.label());
        out->szMessage = optionalCopy(uri.messageOk(), uri.message());
        out->szPaymentRequestUrl =
            optionalCopy(uri.paymentRequestUrlOk(), uri.paymentRequestUrl());
    }
    catch (const std::bad_alloc &)
    {
        return CU_ERROR(CU_CC_SysError, "Out of memory");
    }

    result = out.release();
    return Status();
}

static Status
resultCopy(char *&result, const std::string &text)
{
    try
    {
        result = stringCopy(text);
    }
    catch (const std::bad_alloc &)
    {
        return CU_ERROR(CU_CC_SysError, "Out of memory");
    }
    return Status();
}

tCU_CC CU_ParseUri(const char *szUri,
                   const char *szCoinId,
                   tCU_ParsedUri **ppResult,
                   tCU_Error *pError)
{
    CU_PROLOG();
    CU_CHECK_NULL(szUri);
    CU_CHECK_NULL(ppResult);

    {
        CoinUri uri;
        if (szCoinId)
        {
            CoinTypePtr coin;
            CU_CHECK_NEW(builtinRegistry().coin(coin, szCoinId), pError);
            CU_CHECK_NEW(CoinUri::decode(uri, szUri, coin), pError);
        }
        else
        {
            CU_CHECK_NEW(CoinUri::decode(uri, szUri, builtinRegistry()),
                         pError);
        }

        CU_CHECK_NEW(parsedUriCopy(*ppResult, uri), pError);
    }

exit:
    return cc;
}

void CU_FreeParsedUri(tCU_ParsedUri *pUri)
{
    // Cannot use CU_PROLOG - no pError
    CU_DebugLog("%s called", __FUNCTION__);

    if (pUri)
    {
        stringFree(pUri->szCoinId);
        stringFree(pUri->szAddress);
        stringFree(pUri->szLabel);
        stringFree(pUri->szMessage);
        stringFree(pUri->szPaymentRequestUrl);
        free(pUri);
    }
}

tCU_CC CU_EncodeUri(const char *szCoinId,
                    const char *szAddress,
                    bool bHasAmount,
                    int64_t amount,
                    const char *szLabel,
                    const char *szMessage,
                    char **pszResult,
                    tCU_Error *pError)
{
    CU_PROLOG();
    CU_CHECK_NULL(szCoinId);
    CU_CHECK_NULL(szAddress);
    CU_CHECK_NULL(pszResult);

    {
        CoinTypePtr coin;
        CU_CHECK_NEW(builtinRegistry().coin(coin, szCoinId), pError);

        UriRequest request;
        CU_CHECK_NEW(addressDecode(request.address, coin, szAddress), pError);
        request.amountOk = bHasAmount;
        request.amount = Amount(coin, amount);
        if (szLabel)
            request.label = szLabel;
        if (szMessage)
            request.message = szMessage;

        std::string result;
        CU_CHECK_NEW(uriEncode(result, request), pError);
        CU_CHECK_NEW(resultCopy(*pszResult, result), pError);
    }

exit:
    return cc;
}

void CU_FreeString(char *sz)
{
    stringFree(sz);
}
