/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "CoinType.hpp"

namespace coinuri {

// Coin list formatter:
#define COIN_TYPE_ROW(id, name, symbol, scheme, pubkey, script, places) \
    std::make_shared<CoinType>(CoinType{id, name, symbol, scheme, \
        pubkey, script, places}),

const CoinTypes &
coinBuiltins()
{
    static const CoinTypes coins
    {
        CU_COIN_LIST(COIN_TYPE_ROW)
    };
    return coins;
}

} // namespace coinuri
