/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Amount.hpp"
#include <bitcoin/bitcoin.hpp>
#include <algorithm>

namespace coinuri {

static bool
isDigit(char c)
{
    return '0' <= c && c <= '9';
}

Amount::Amount():
    value_(0)
{
}

Amount::Amount(CoinTypePtr coin, int64_t value):
    coin_(coin),
    value_(value)
{
}

bool
Amount::operator==(const Amount &other) const
{
    const auto id = coin_ ? coin_->id : std::string();
    const auto otherId = other.coin_ ? other.coin_->id : std::string();
    return id == otherId && value_ == other.value_;
}

Status
amountDecode(Amount &result, CoinTypePtr coin, const std::string &text)
{
    if (!coin)
        return CU_ERROR(CU_CC_AmbiguousCurrency,
                        "Cannot read amount '" + text + "' without knowing the coin");

    // Split off the sign:
    std::string digits = text;
    bool negative = false;
    if (!digits.empty() && ('-' == digits[0] || '+' == digits[0]))
    {
        negative = '-' == digits[0];
        digits.erase(0, 1);
    }

    // Split at the decimal point:
    const auto point = digits.find('.');
    std::string whole = digits.substr(0, point);
    std::string fraction;
    if (std::string::npos != point)
        fraction = digits.substr(point + 1);

    if (whole.empty() && fraction.empty())
        return CU_ERROR(CU_CC_InvalidAmount,
                        "'" + text + "' is not a valid amount");
    if (!std::all_of(whole.begin(), whole.end(), isDigit) ||
            !std::all_of(fraction.begin(), fraction.end(), isDigit))
        return CU_ERROR(CU_CC_InvalidAmount,
                        "'" + text + "' is not a valid amount");

    // Zeros at either end carry no information:
    while (!fraction.empty() && '0' == fraction.back())
        fraction.pop_back();
    whole.erase(0, whole.find_first_not_of('0'));

    if (coin->unitExponent < fraction.size())
        return CU_ERROR(CU_CC_PrecisionError,
                        "'" + text + "' has too many decimal places");
    if (CU_MAX_UNIT_EXPONENT < whole.size() + coin->unitExponent)
        return CU_ERROR(CU_CC_InvalidAmount,
                        "'" + text + "' is out of range");

    // libbitcoin rounds off extra digits, but we have already ruled those out:
    std::string plain = whole.empty() ? "0" : whole;
    if (!fraction.empty())
        plain += "." + fraction;
    uint64_t value = 0;
    if (!bc::decode_base10(value, plain, coin->unitExponent))
        return CU_ERROR(CU_CC_InvalidAmount,
                        "'" + text + "' is not a valid amount");

    const int64_t signedValue = static_cast<int64_t>(value);
    result = Amount(coin, negative ? -signedValue : signedValue);
    return Status();
}

std::string
amountEncode(const Amount &amount)
{
    const uint8_t places = amount.coin() ? amount.coin()->unitExponent : 0;
    if (amount.value() < 0)
        return "-" + bc::encode_base10(-amount.value(), places);
    return bc::encode_base10(amount.value(), places);
}

} // namespace coinuri
