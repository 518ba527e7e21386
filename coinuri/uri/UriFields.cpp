/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "UriFields.hpp"

namespace coinuri {

FieldValue::FieldValue(const Address &address):
    kind_(Kind::address),
    address_(address)
{
}

FieldValue::FieldValue(const Amount &amount):
    kind_(Kind::amount),
    amount_(amount)
{
}

FieldValue::FieldValue(const std::string &text):
    kind_(Kind::text),
    text_(text)
{
}

const Address *
FieldValue::address() const
{
    return Kind::address == kind_ ? &address_ : nullptr;
}

const Amount *
FieldValue::amount() const
{
    return Kind::amount == kind_ ? &amount_ : nullptr;
}

const std::string *
FieldValue::text() const
{
    return Kind::text == kind_ ? &text_ : nullptr;
}

std::string
FieldValue::str() const
{
    switch (kind_)
    {
    case Kind::address:
        return address_.encoded();
    case Kind::amount:
        return amountEncode(amount_);
    case Kind::text:
        return text_;
    }
    return std::string();
}

Status
UriFields::put(const std::string &name, const FieldValue &value)
{
    if (find(name))
        return CU_ERROR(CU_CC_DuplicateField,
                        "'" + name + "' is duplicated, URI is invalid");

    entries_.push_back(Entry(name, value));
    return Status();
}

const FieldValue *
UriFields::find(const std::string &name) const
{
    for (const auto &entry: entries_)
        if (entry.first == name)
            return &entry.second;
    return nullptr;
}

} // namespace coinuri
