/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef COINURI_COIN_ADDRESS_HPP
#define COINURI_COIN_ADDRESS_HPP

#include "CoinType.hpp"
#include "../util/Status.hpp"
#include <bitcoin/bitcoin.hpp>

namespace coinuri {

/**
 * A Base58Check payment address, bound to the coin it belongs to.
 */
class Address
{
public:
    /**
     * Constructs a null address.
     */
    Address();

    Address(CoinTypePtr coin, const bc::payment_address &address);

    CoinTypePtr coin() const { return coin_; }
    uint8_t version() const { return address_.version(); }
    const bc::short_hash &hash() const { return address_.hash(); }

    /**
     * Returns true for pay-to-script-hash addresses.
     */
    bool isScript() const;

    /**
     * Returns the Base58Check text form.
     */
    std::string encoded() const;

    /**
     * Returns false for the null address.
     */
    explicit operator bool() const { return !!coin_; }

    bool operator==(const Address &other) const;
    bool operator!=(const Address &other) const { return !(*this == other); }

private:
    CoinTypePtr coin_;
    bc::payment_address address_;
};

/**
 * Decodes an address, which must belong to the given coin.
 */
Status
addressDecode(Address &result, CoinTypePtr coin, const std::string &text);

} // namespace coinuri

#endif
