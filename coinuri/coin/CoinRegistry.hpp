/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef COINURI_COIN_COIN_REGISTRY_HPP
#define COINURI_COIN_COIN_REGISTRY_HPP

#include "CoinType.hpp"
#include "../util/Status.hpp"

namespace coinuri {

/**
 * An ordered collection of coins, searchable by id and URI scheme.
 *
 * The order matters: when several coins share a URI scheme,
 * `schemeCandidates` returns them in the order they were added,
 * and the URI decoder picks the first one that accepts the address.
 */
class CoinRegistry
{
public:
    /**
     * Returns a registry populated with the built-in coin list.
     */
    static CoinRegistry
    builtin();

    /**
     * Appends a coin to the end of the list.
     */
    Status
    add(CoinTypePtr coin);

    /**
     * Appends the coins described in a JSON config file.
     */
    Status
    load(const std::string &filename);

    /**
     * Appends the coins described in an in-memory JSON document.
     */
    Status
    decode(const std::string &data);

    /**
     * Writes the registry out in the same JSON format `load` reads.
     */
    Status
    encode(std::string &result) const;

    /**
     * Looks up a coin by its id.
     */
    Status
    coin(CoinTypePtr &result, const std::string &id) const;

    /**
     * Finds all the coins using a URI scheme, in registry order.
     */
    Status
    schemeCandidates(CoinTypes &result, const std::string &scheme) const;

    const CoinTypes &coins() const { return coins_; }

private:
    CoinTypes coins_;
};

} // namespace coinuri

#endif
