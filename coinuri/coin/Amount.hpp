/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef COINURI_COIN_AMOUNT_HPP
#define COINURI_COIN_AMOUNT_HPP

#include "CoinType.hpp"
#include "../util/Status.hpp"

namespace coinuri {

/**
 * An exact amount of some coin, counted in its smallest unit.
 */
class Amount
{
public:
    Amount();
    Amount(CoinTypePtr coin, int64_t value);

    CoinTypePtr coin() const { return coin_; }
    int64_t value() const { return value_; }

    /**
     * Returns -1, 0, or 1 depending on the sign of the value.
     */
    int signum() const { return (0 < value_) - (value_ < 0); }

    bool operator==(const Amount &other) const;
    bool operator!=(const Amount &other) const { return !(*this == other); }

private:
    CoinTypePtr coin_;
    int64_t value_;
};

/**
 * Parses a decimal string, such as "0.1", in the coin's display unit.
 * Fails if the string is not a plain decimal number,
 * or if it is more precise than the coin's smallest unit.
 * Exponent notation is not supported.
 */
Status
amountDecode(Amount &result, CoinTypePtr coin, const std::string &text);

/**
 * Formats an amount in the coin's display unit,
 * with no trailing zeros and a leading '-' if negative.
 */
std::string
amountEncode(const Amount &amount);

} // namespace coinuri

#endif
