/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "CoinRegistry.hpp"
#include "../json/JsonArray.hpp"
#include "../json/JsonObject.hpp"
#include "../util/Debug.hpp"
#include <algorithm>

namespace coinuri {

struct CoinJson:
    public JsonObject
{
    CU_JSON_CONSTRUCTORS(CoinJson, JsonObject)
    CU_JSON_STRING(id, "id", "")
    CU_JSON_STRING(name, "name", "")
    CU_JSON_STRING(symbol, "symbol", "")
    CU_JSON_STRING(uriScheme, "uriScheme", "")
    CU_JSON_INTEGER(addressHeader, "addressHeader", 0)
    CU_JSON_INTEGER(p2shHeader, "p2shHeader", 0)
    CU_JSON_INTEGER(unitExponent, "unitExponent", 0)
};

struct CoinListJson:
    public JsonObject
{
    CU_JSON_VALUE(coins, "coins", JsonArray)
};

static std::string
toLower(std::string s)
{
    for (auto &c: s)
        if ('A' <= c && c <= 'Z')
            c = c - 'A' + 'a';
    return s;
}

static Status
checkHeader(json_int_t value, const std::string &id)
{
    if (value < 0 || 0xff < value)
        return CU_ERROR(CU_CC_JSONError,
                        "Address version out of range for " + id);
    return Status();
}

/**
 * Converts one entry of the "coins" array.
 */
static Status
coinFromJson(CoinTypePtr &result, const CoinJson &json)
{
    CU_CHECK(json.idOk());
    CU_CHECK(json.nameOk());
    CU_CHECK(json.symbolOk());
    CU_CHECK(json.uriSchemeOk());
    CU_CHECK(json.addressHeaderOk());
    CU_CHECK(json.p2shHeaderOk());
    CU_CHECK(json.unitExponentOk());

    const std::string id = json.id();
    CU_CHECK(checkHeader(json.addressHeader(), id));
    CU_CHECK(checkHeader(json.p2shHeader(), id));
    if (json.unitExponent() < 0 ||
            CU_MAX_UNIT_EXPONENT < json.unitExponent())
        return CU_ERROR(CU_CC_JSONError, "Unit exponent out of range for " + id);

    auto coin = std::make_shared<CoinType>();
    coin->id = id;
    coin->name = json.name();
    coin->symbol = json.symbol();
    coin->uriScheme = json.uriScheme();
    coin->addressHeader = json.addressHeader();
    coin->p2shHeader = json.p2shHeader();
    coin->unitExponent = json.unitExponent();
    result = coin;
    return Status();
}

/**
 * Adds every coin in the list, or none of them.
 */
static Status
addJson(CoinRegistry &registry, const CoinListJson &json)
{
    const auto coins = json.coins();
    if (!coins.ok())
        return CU_ERROR(CU_CC_JSONError, "Missing coins array");

    CoinRegistry staged = registry;
    for (size_t i = 0; i < coins.size(); ++i)
    {
        CoinJson coinJson(coins[i]);
        CoinTypePtr coin;
        CU_CHECK(coinFromJson(coin, coinJson));
        CU_CHECK(staged.add(coin));
    }

    registry = staged;
    return Status();
}

CoinRegistry
CoinRegistry::builtin()
{
    CoinRegistry out;
    out.coins_ = coinBuiltins();
    return out;
}

Status
CoinRegistry::add(CoinTypePtr coin)
{
    if (!coin)
        return CU_ERROR(CU_CC_NULLPtr, "NULL coin");
    if (coin->id.empty())
        return CU_ERROR(CU_CC_InvalidArgument, "Coin id is empty");
    if (coin->uriScheme.empty())
        return CU_ERROR(CU_CC_InvalidArgument,
                        "Coin " + coin->id + " has no URI scheme");

    auto same = [&coin](const CoinTypePtr &other)
    {
        return other->id == coin->id;
    };
    if (coins_.end() != std::find_if(coins_.begin(), coins_.end(), same))
        return CU_ERROR(CU_CC_InvalidArgument,
                        "Coin " + coin->id + " is already registered");

    // Coins sharing a scheme must spell it the same way,
    // since the parser strips the first candidate's spelling:
    const auto lower = toLower(coin->uriScheme);
    for (const auto &other: coins_)
        if (toLower(other->uriScheme) == lower &&
                other->uriScheme != coin->uriScheme)
            return CU_ERROR(CU_CC_InvalidArgument,
                            "Coin " + coin->id + " spells scheme " +
                            coin->uriScheme + " differently from " +
                            other->id);

    coins_.push_back(coin);
    return Status();
}

Status
CoinRegistry::load(const std::string &filename)
{
    CoinListJson json;
    CU_CHECK(json.load(filename));
    return addJson(*this, json);
}

Status
CoinRegistry::decode(const std::string &data)
{
    CoinListJson json;
    CU_CHECK(json.decode(data));
    return addJson(*this, json);
}

Status
CoinRegistry::encode(std::string &result) const
{
    JsonArray coinsJson;
    for (const auto &coin: coins_)
    {
        CoinJson json;
        CU_CHECK(json.idSet(coin->id.c_str()));
        CU_CHECK(json.nameSet(coin->name.c_str()));
        CU_CHECK(json.symbolSet(coin->symbol.c_str()));
        CU_CHECK(json.uriSchemeSet(coin->uriScheme.c_str()));
        CU_CHECK(json.addressHeaderSet(coin->addressHeader));
        CU_CHECK(json.p2shHeaderSet(coin->p2shHeader));
        CU_CHECK(json.unitExponentSet(coin->unitExponent));
        CU_CHECK(coinsJson.append(json));
    }

    // An empty registry still gets an array:
    if (!coinsJson.ok())
        coinsJson.reset(json_array());

    CoinListJson json;
    CU_CHECK(json.coinsSet(coinsJson));
    return json.encode(result);
}

Status
CoinRegistry::coin(CoinTypePtr &result, const std::string &id) const
{
    for (const auto &coin: coins_)
    {
        if (coin->id == id)
        {
            result = coin;
            return Status();
        }
    }
    return CU_ERROR(CU_CC_UnknownCoin, "Unknown coin " + id);
}

Status
CoinRegistry::schemeCandidates(CoinTypes &result,
                               const std::string &scheme) const
{
    const auto lower = toLower(scheme);

    CoinTypes out;
    for (const auto &coin: coins_)
        if (toLower(coin->uriScheme) == lower)
            out.push_back(coin);

    if (out.empty())
        return CU_ERROR(CU_CC_UnsupportedScheme,
                        "Unsupported URI scheme: " + scheme);

    CU_DebugLog("Scheme %s has %d candidate coins",
                scheme.c_str(), static_cast<int>(out.size()));
    result = std::move(out);
    return Status();
}

} // namespace coinuri
