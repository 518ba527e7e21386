/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef COINURI_JSON_JSON_OBJECT_HPP
#define COINURI_JSON_JSON_OBJECT_HPP

#include "JsonPtr.hpp"

namespace coinuri {

/**
 * Base for typed views of a JSON object.
 * Subclasses declare their fields with the CU_JSON_* macros below.
 */
class JsonObject:
    public JsonPtr
{
public:
    CU_JSON_CONSTRUCTORS(JsonObject, JsonPtr)

protected:
    /**
     * Stores a field, replacing the root with an empty object
     * if it isn't one already. Takes over the reference to `value`.
     */
    Status
    setValue(const char *key, json_t *value);

    Status hasString (const char *key) const;
    Status hasInteger(const char *key) const;

    const char *getString (const char *key, const char *fallback) const;
    json_int_t  getInteger(const char *key, json_int_t fallback) const;

private:
    Status
    hasField(const char *key, bool (*isType)(const json_t *)) const;
};

// Each macro declares `name()`, `name##Set()`, and
// for the scalar types, `name##Ok()` to check presence and type:

#define CU_JSON_VALUE(name, key, Type) \
    Type name() const \
    { return Type(json_incref(json_object_get(root_, key))); } \
    coinuri::Status name##Set(const JsonPtr &value) \
    { return setValue(key, json_incref(value.get())); }

#define CU_JSON_STRING(name, key, fallback) \
    const char *name() const \
    { return getString(key, fallback); } \
    coinuri::Status name##Ok() const \
    { return hasString(key); } \
    coinuri::Status name##Set(const char *value) \
    { return setValue(key, json_string(value)); }

#define CU_JSON_INTEGER(name, key, fallback) \
    json_int_t name() const \
    { return getInteger(key, fallback); } \
    coinuri::Status name##Ok() const \
    { return hasInteger(key); } \
    coinuri::Status name##Set(json_int_t value) \
    { return setValue(key, json_integer(value)); }

} // namespace coinuri

#endif
