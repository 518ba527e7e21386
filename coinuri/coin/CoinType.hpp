/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * Per-coin network parameters.
 */

#ifndef COINURI_COIN_COIN_TYPE_HPP
#define COINURI_COIN_COIN_TYPE_HPP

#include <stdint.h>
#include <memory>
#include <string>
#include <vector>

namespace coinuri {

/**
 * The built-in coin list, in a format the preprocessor can understand.
 * The `_` parameter is a macro that specifies
 * how to format each list item for the C++ compiler.
 *
 * Columns: id, name, symbol, URI scheme,
 * pubkey address version, script address version, decimal places.
 *
 * Coins sharing a scheme are tried in this order when decoding URI's,
 * so main networks must come before their test networks.
 */
#define CU_COIN_LIST(_) \
    _("bitcoin.main",  "Bitcoin",       "BTC",     "bitcoin",   0,   5, 8) \
    _("bitcoin.test",  "Bitcoin Test",  "BTCTEST", "bitcoin", 111, 196, 8) \
    _("litecoin.main", "Litecoin",      "LTC",     "litecoin", 48,   5, 8) \
    _("litecoin.test", "Litecoin Test", "LTCTEST", "litecoin", 111, 196, 8) \
    _("dogecoin.main", "Dogecoin",      "DOGE",    "dogecoin", 30,  22, 8) \
    _("dogecoin.test", "Dogecoin Test", "DOGETEST","dogecoin", 113, 196, 8) \
    _("dash.main",     "Dash",          "DASH",    "dash",     76,  16, 8) \
    _("peercoin.main", "Peercoin",      "PPC",     "peercoin", 55, 117, 6) \
    _("parkbyte.main", "Parkbyte",      "PKB",     "parkbyte", 55,  28, 6) \
    _("parkbyte.test", "Parkbyte Test", "PKBTEST", "parkbyte", 111, 196, 6) \

/**
 * The largest number of decimal places an amount can use
 * without overflowing 64 bits.
 */
#define CU_MAX_UNIT_EXPONENT 18

/**
 * Everything the URI code needs to know about a coin.
 */
struct CoinType
{
    std::string id;
    std::string name;
    std::string symbol;
    std::string uriScheme;
    uint8_t addressHeader;
    uint8_t p2shHeader;
    unsigned unitExponent;

    /**
     * Returns true if addresses with this version byte belong to the coin.
     */
    bool
    acceptsVersion(uint8_t version) const
    {
        return addressHeader == version || p2shHeader == version;
    }
};

typedef std::shared_ptr<const CoinType> CoinTypePtr;
typedef std::vector<CoinTypePtr> CoinTypes;

/**
 * Returns the built-in coins, in list order.
 */
const CoinTypes &
coinBuiltins();

} // namespace coinuri

#endif
