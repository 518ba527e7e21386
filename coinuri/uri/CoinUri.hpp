/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */
/**
 * @file
 * BIP 21 payment URI's, for any coin in the registry.
 */

#ifndef COINURI_URI_COIN_URI_HPP
#define COINURI_URI_COIN_URI_HPP

#include "UriFields.hpp"
#include "../coin/CoinRegistry.hpp"
#include <ostream>

namespace coinuri {

/**
 * The pieces needed to build a payment URI.
 * Empty strings are left out of the URI.
 */
struct UriRequest
{
    Address address;
    bool amountOk = false;
    Amount amount;
    std::string label;
    std::string message;
};

/**
 * A decoded payment URI, such as
 * `bitcoin:1BvBMSEYstWetqTFn5Au4m4GFg7xJaNVN2?amount=0.1&label=Tacos`.
 *
 * The following rules apply to the parameters:
 * - Names are case-insensitive, and may not repeat.
 * - Names starting with `req-` make the whole URI invalid,
 *   since we don't understand any of them.
 * - Unknown names are kept, unescaped, and can be found using `get`.
 * - Parameters with empty values are ignored.
 *
 * The URI must have either an address or an `r` parameter.
 * Once decoded, the object never changes.
 */
class CoinUri
{
public:
    /**
     * Decodes a URI, picking the coin based on the scheme and address.
     * If several coins use the same scheme, the first one in the
     * registry that accepts the address wins.
     */
    static Status
    decode(CoinUri &result, const std::string &text,
           const CoinRegistry &registry);

    /**
     * Decodes a URI that must belong to a particular coin.
     */
    static Status
    decode(CoinUri &result, const std::string &text, CoinTypePtr coin);

    /**
     * The coin this URI pays in. This can be null if the URI
     * has no address and the coin was not given up front.
     */
    CoinTypePtr coin() const { return coin_; }

    bool addressOk() const;
    Address address() const;

    bool amountOk() const;
    Amount amount() const;

    bool labelOk() const;
    std::string label() const;

    bool messageOk() const;
    std::string message() const;

    /**
     * The BIP 70 payment request URL, from the `r` parameter.
     */
    bool paymentRequestUrlOk() const;
    std::string paymentRequestUrl() const;

    /**
     * Looks up any parameter by name, or returns nullptr.
     */
    const FieldValue *
    get(const std::string &name) const;

    /**
     * All the parameters, in the order they appeared.
     * The address comes first, if there is one.
     */
    const UriFields::Entries &fields() const { return fields_.entries(); }

    /**
     * Builds the canonical form of this URI.
     * Only the address, amount, label, and message survive.
     */
    Status
    encode(std::string &result) const;

private:
    static Status
    decodeFor(CoinUri &result, const std::string &text,
              const CoinTypes &candidates, CoinTypePtr coin);

    const std::string *
    text(const char *name) const;

    CoinTypePtr coin_;
    UriFields fields_;
};

/**
 * Builds a canonical payment URI.
 * The fields always appear in the order amount, label, message.
 */
Status
uriEncode(std::string &result, const UriRequest &request);

/**
 * Writes a debugging description of the URI's fields.
 */
std::ostream &operator<<(std::ostream &output, const CoinUri &uri);

} // namespace coinuri

#endif
