/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../Command.hpp"
#include <iostream>

using namespace coinuri;

COMMAND(CoinList, "coin-list",
        "")
{
    if (argc != 0)
        return CU_ERROR(CU_CC_Error, usage());

    for (const auto &coin: session.registry.coins())
    {
        std::cout << coin->id << ": " << coin->name << " (" <<
                  coin->symbol << "), scheme " << coin->uriScheme <<
                  ", versions " << int(coin->addressHeader) << '/' <<
                  int(coin->p2shHeader) << ", " <<
                  coin->unitExponent << " decimals" << std::endl;
    }

    return Status();
}

COMMAND(CoinExport, "coin-export",
        "")
{
    if (argc != 0)
        return CU_ERROR(CU_CC_Error, usage());

    std::string json;
    CU_CHECK(session.registry.encode(json));
    std::cout << json << std::endl;

    return Status();
}
