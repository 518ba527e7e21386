/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "CoinUri.hpp"
#include "../http/Uri.hpp"
#include "../util/Debug.hpp"
#include <algorithm>
#include <sstream>

namespace coinuri {

static std::string
toLower(std::string s)
{
    for (auto &c: s)
        if ('A' <= c && c <= 'Z')
            c = c - 'A' + 'a';
    return s;
}

static bool
startsWith(const std::string &s, const std::string &prefix)
{
    return prefix.size() <= s.size() &&
        std::equal(prefix.begin(), prefix.end(), s.begin());
}

/**
 * Splits the query at '&' characters.
 * Empty pieces at the very end are dropped, so "a=1&" is fine.
 */
static std::vector<std::string>
splitQuery(const std::string &query)
{
    std::vector<std::string> out;
    std::string::size_type start = 0;
    while (start <= query.size())
    {
        auto end = query.find('&', start);
        if (std::string::npos == end)
            end = query.size();
        out.push_back(query.substr(start, end - start));
        start = end + 1;
    }

    while (!out.empty() && out.back().empty())
        out.pop_back();
    return out;
}

Status
CoinUri::decode(CoinUri &result, const std::string &text,
                const CoinRegistry &registry)
{
    CU_DebugLog("Attempting to parse '%s' for any coin", text.c_str());

    Uri uri;
    if (!uri.decode(text))
        return CU_ERROR(CU_CC_SyntaxError, "Bad URI syntax: " + text);

    CoinTypes candidates;
    CU_CHECK(registry.schemeCandidates(candidates, uri.scheme()));
    return decodeFor(result, text, candidates, nullptr);
}

Status
CoinUri::decode(CoinUri &result, const std::string &text, CoinTypePtr coin)
{
    if (!coin)
        return CU_ERROR(CU_CC_NULLPtr, "No coin given for " + text);
    CU_DebugLog("Attempting to parse '%s' for %s",
                text.c_str(), coin->id.c_str());

    Uri uri;
    if (!uri.decode(text))
        return CU_ERROR(CU_CC_SyntaxError, "Bad URI syntax: " + text);

    return decodeFor(result, text, CoinTypes{coin}, coin);
}

Status
CoinUri::decodeFor(CoinUri &result, const std::string &text,
                   const CoinTypes &candidates, CoinTypePtr coin)
{
    // Some wallets write "bitcoin://address", so accept that too.
    // The prefix must match the canonical scheme exactly.
    // The scheme specific part stays escaped until we split the query,
    // or else "label=Tom%20%26%20Jerry" would fall apart at the '&'.
    const auto &scheme = candidates.front()->uriScheme;
    std::string rest;
    if (startsWith(text, scheme + "://"))
        rest = text.substr(scheme.size() + 3);
    else if (startsWith(text, scheme + ":"))
        rest = text.substr(scheme.size() + 1);
    else
        return CU_ERROR(CU_CC_UnsupportedScheme,
                        "Unsupported URI scheme in " + text);

    // Split off the address from the rest of the query parameters:
    if (1 < std::count(rest.begin(), rest.end(), '?'))
        return CU_ERROR(CU_CC_SyntaxError,
                        "Too many question marks in URI '" + text + "'");
    const auto question = rest.find('?');
    const auto addressToken = rest.substr(0, question); // may be empty!
    std::string query;
    if (std::string::npos != question)
        query = rest.substr(question + 1);

    UriFields fields;
    if (!addressToken.empty())
    {
        // KNOWN AMBIGUITY: two coins registered under one scheme
        // may accept the same version bytes. The first candidate
        // accepting the address wins, so registry order decides.
        Address address;
        for (const auto &candidate: candidates)
        {
            if (addressDecode(address, candidate, addressToken).log())
                break;
        }
        if (!address)
            return CU_ERROR(CU_CC_InvalidAddress,
                            "Bad address: " + addressToken);

        coin = address.coin();
        CU_CHECK(fields.put(CU_FIELD_ADDRESS, FieldValue(address)));
    }

    // Read the rest of the parameters:
    for (const auto &token: splitQuery(query))
    {
        const auto separator = token.find('=');
        if (std::string::npos == separator)
            return CU_ERROR(CU_CC_SyntaxError,
                            "Malformed URI - no separator in '" + token + "'");
        if (0 == separator)
            return CU_ERROR(CU_CC_SyntaxError,
                            "Malformed URI - empty name '" + token + "'");
        const auto name = toLower(token.substr(0, separator));
        const auto value = token.substr(separator + 1);

        if (CU_FIELD_AMOUNT == name)
        {
            Amount amount;
            CU_CHECK(amountDecode(amount, coin, value));
            if (amount.signum() < 0)
                return CU_ERROR(CU_CC_NegativeAmount,
                                "'" + value + "' Negative coins specified");
            CU_CHECK(fields.put(name, FieldValue(amount)));
        }
        else if (startsWith(name, CU_REQUIRED_PREFIX))
        {
            return CU_ERROR(CU_CC_RequiredFieldUnknown, "'" + name +
                            "' is required but not known, this URI is not valid");
        }
        else if (!value.empty())
        {
            CU_CHECK(fields.put(name, FieldValue(queryUnescape(value))));
        }
    }

    if (addressToken.empty() && !fields.find(CU_FIELD_PAYMENT_REQUEST_URL))
        return CU_ERROR(CU_CC_MissingDestination,
                        "No address and no r= parameter found");

    result.coin_ = coin;
    result.fields_ = std::move(fields);
    return Status();
}

const std::string *
CoinUri::text(const char *name) const
{
    const auto value = fields_.find(name);
    return value ? value->text() : nullptr;
}

bool
CoinUri::addressOk() const
{
    const auto value = fields_.find(CU_FIELD_ADDRESS);
    return value && value->address();
}

Address
CoinUri::address() const
{
    const auto value = fields_.find(CU_FIELD_ADDRESS);
    if (!value || !value->address())
        return Address();
    return *value->address();
}

bool
CoinUri::amountOk() const
{
    const auto value = fields_.find(CU_FIELD_AMOUNT);
    return value && value->amount();
}

Amount
CoinUri::amount() const
{
    const auto value = fields_.find(CU_FIELD_AMOUNT);
    if (!value || !value->amount())
        return Amount(coin_, 0);
    return *value->amount();
}

bool
CoinUri::labelOk() const
{
    return text(CU_FIELD_LABEL);
}

std::string
CoinUri::label() const
{
    const auto value = text(CU_FIELD_LABEL);
    return value ? *value : std::string();
}

bool
CoinUri::messageOk() const
{
    return text(CU_FIELD_MESSAGE);
}

std::string
CoinUri::message() const
{
    const auto value = text(CU_FIELD_MESSAGE);
    return value ? *value : std::string();
}

bool
CoinUri::paymentRequestUrlOk() const
{
    return text(CU_FIELD_PAYMENT_REQUEST_URL);
}

std::string
CoinUri::paymentRequestUrl() const
{
    const auto value = text(CU_FIELD_PAYMENT_REQUEST_URL);
    return value ? *value : std::string();
}

const FieldValue *
CoinUri::get(const std::string &name) const
{
    return fields_.find(toLower(name));
}

Status
CoinUri::encode(std::string &result) const
{
    if (!addressOk())
        return CU_ERROR(CU_CC_InvalidArgument,
                        "Cannot encode a URI without an address");

    UriRequest request;
    request.address = address();
    request.amountOk = amountOk();
    request.amount = amount();
    request.label = label();
    request.message = message();
    return uriEncode(result, request);
}

Status
uriEncode(std::string &result, const UriRequest &request)
{
    const auto coin = request.address.coin();
    if (!coin)
        return CU_ERROR(CU_CC_InvalidArgument, "No address to encode");
    if (request.amountOk)
    {
        if (request.amount.signum() < 0)
            return CU_ERROR(CU_CC_InvalidArgument, "Coin must be positive");
        if (request.amount.coin() && request.amount.coin()->id != coin->id)
            return CU_ERROR(CU_CC_InvalidArgument, "Amount is in " +
                            request.amount.coin()->id + ", but the address is " +
                            coin->id);
    }

    std::ostringstream out;
    out << coin->uriScheme << ':' << request.address.encoded();

    // The first parameter gets a '?', and the rest get '&':
    char separator = '?';
    if (request.amountOk)
    {
        out << separator << CU_FIELD_AMOUNT << '=' <<
            amountEncode(Amount(coin, request.amount.value()));
        separator = '&';
    }
    if (!request.label.empty())
    {
        out << separator << CU_FIELD_LABEL << '=' <<
            queryEscape(request.label);
        separator = '&';
    }
    if (!request.message.empty())
    {
        out << separator << CU_FIELD_MESSAGE << '=' <<
            queryEscape(request.message);
    }

    result = out.str();
    return Status();
}

std::ostream &operator<<(std::ostream &output, const CoinUri &uri)
{
    output << "CoinURI[";
    bool first = true;
    for (const auto &field: uri.fields())
    {
        if (!first)
            output << ',';
        first = false;
        output << '\'' << field.first << "'='" << field.second.str() << '\'';
    }
    output << ']';
    return output;
}

} // namespace coinuri
