/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef COINURI_URI_URI_FIELDS_HPP
#define COINURI_URI_URI_FIELDS_HPP

#include "../coin/Address.hpp"
#include "../coin/Amount.hpp"
#include <utility>
#include <vector>

namespace coinuri {

// Field names with special meaning:
#define CU_FIELD_ADDRESS "address"
#define CU_FIELD_AMOUNT "amount"
#define CU_FIELD_LABEL "label"
#define CU_FIELD_MESSAGE "message"
#define CU_FIELD_PAYMENT_REQUEST_URL "r"

/**
 * Prefix marking parameters the wallet must understand.
 */
#define CU_REQUIRED_PREFIX "req-"

/**
 * One URI parameter value, which is an address, an amount, or text.
 * The typed accessors return nullptr when the value holds another kind.
 */
class FieldValue
{
public:
    enum class Kind
    {
        address,
        amount,
        text
    };

    explicit FieldValue(const Address &address);
    explicit FieldValue(const Amount &amount);
    explicit FieldValue(const std::string &text);

    Kind kind() const { return kind_; }

    const Address *address() const;
    const Amount *amount() const;
    const std::string *text() const;

    /**
     * Formats the value the way it would appear in a URI, unescaped.
     */
    std::string str() const;

private:
    Kind kind_;
    Address address_;
    Amount amount_;
    std::string text_;
};

/**
 * Accumulates URI parameters in the order they appear,
 * refusing to store any name twice.
 */
class UriFields
{
public:
    typedef std::pair<std::string, FieldValue> Entry;
    typedef std::vector<Entry> Entries;

    /**
     * Stores a value, unless the name is already taken.
     */
    Status
    put(const std::string &name, const FieldValue &value);

    /**
     * Returns the value for a name, or nullptr if there is none.
     */
    const FieldValue *
    find(const std::string &name) const;

    const Entries &entries() const { return entries_; }

private:
    Entries entries_;
};

} // namespace coinuri

#endif
