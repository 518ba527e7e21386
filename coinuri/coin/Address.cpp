/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Address.hpp"

namespace coinuri {

Address::Address()
{
}

Address::Address(CoinTypePtr coin, const bc::payment_address &address):
    coin_(coin),
    address_(address)
{
}

bool
Address::isScript() const
{
    return coin_ && coin_->p2shHeader == address_.version();
}

std::string
Address::encoded() const
{
    if (!coin_)
        return std::string();
    return address_.encoded();
}

bool
Address::operator==(const Address &other) const
{
    if (!coin_ || !other.coin_)
        return !coin_ && !other.coin_;
    return coin_->id == other.coin_->id &&
        address_.version() == other.address_.version() &&
        address_.hash() == other.address_.hash();
}

Status
addressDecode(Address &result, CoinTypePtr coin, const std::string &text)
{
    if (!coin)
        return CU_ERROR(CU_CC_NULLPtr, "No coin for address " + text);

    // libbitcoin checks the length and checksum, but not the version:
    bc::payment_address address;
    if (!address.set_encoded(text))
        return CU_ERROR(CU_CC_InvalidAddress,
                        "Malformed address " + text);
    if (!coin->acceptsVersion(address.version()))
        return CU_ERROR(CU_CC_InvalidAddress,
                        "Address " + text + " is not a " + coin->name + " address");

    result = Address(coin, address);
    return Status();
}

} // namespace coinuri
