/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../Command.hpp"
#include "../../coinuri/uri/CoinUri.hpp"
#include <iostream>

using namespace coinuri;

COMMAND(UriParse, "uri-parse",
        " <uri>")
{
    if (argc != 1)
        return CU_ERROR(CU_CC_Error, usage());

    CoinUri uri;
    if (session.coin)
        CU_CHECK(CoinUri::decode(uri, argv[0], session.coin));
    else
        CU_CHECK(CoinUri::decode(uri, argv[0], session.registry));

    std::cout << "coin: " << (uri.coin() ? uri.coin()->id : "unknown") <<
              std::endl;
    for (const auto &field: uri.fields())
        std::cout << field.first << ": " << field.second.str() << std::endl;

    return Status();
}

COMMAND(UriEncode, "uri-encode",
        " <coin-id> <address> [<amount> [<label> [<message>]]]")
{
    if (argc < 2 || 5 < argc)
        return CU_ERROR(CU_CC_Error, usage());

    CoinTypePtr coin;
    CU_CHECK(session.registry.coin(coin, argv[0]));

    UriRequest request;
    CU_CHECK(addressDecode(request.address, coin, argv[1]));
    if (2 < argc)
    {
        CU_CHECK(amountDecode(request.amount, coin, argv[2]));
        request.amountOk = true;
    }
    if (3 < argc)
        request.label = argv[3];
    if (4 < argc)
        request.message = argv[4];

    std::string out;
    CU_CHECK(uriEncode(out, request));
    std::cout << out << std::endl;

    return Status();
}
