/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "JsonObject.hpp"

namespace coinuri {

static bool
isString(const json_t *value)
{
    return json_is_string(value);
}

static bool
isInteger(const json_t *value)
{
    return json_is_integer(value);
}

Status
JsonObject::setValue(const char *key, json_t *value)
{
    if (!json_is_object(root_))
        reset(json_object());
    if (!root_)
    {
        json_decref(value);
        return CU_ERROR(CU_CC_JSONError, "Cannot create JSON object");
    }
    if (json_object_set_new(root_, key, value) < 0)
        return CU_ERROR(CU_CC_JSONError, "Cannot set JSON field " +
                        std::string(key));
    return Status();
}

Status
JsonObject::hasField(const char *key, bool (*isType)(const json_t *)) const
{
    const json_t *value = json_object_get(root_, key);
    if (!value)
        return CU_ERROR(CU_CC_JSONError, "JSON field " + std::string(key) +
                        " is missing");
    if (!isType(value))
        return CU_ERROR(CU_CC_JSONError, "JSON field " + std::string(key) +
                        " has the wrong type");
    return Status();
}

Status
JsonObject::hasString(const char *key) const
{
    return hasField(key, isString);
}

Status
JsonObject::hasInteger(const char *key) const
{
    return hasField(key, isInteger);
}

const char *
JsonObject::getString(const char *key, const char *fallback) const
{
    const json_t *value = json_object_get(root_, key);
    return json_is_string(value) ? json_string_value(value) : fallback;
}

json_int_t
JsonObject::getInteger(const char *key, json_int_t fallback) const
{
    const json_t *value = json_object_get(root_, key);
    return json_is_integer(value) ? json_integer_value(value) : fallback;
}

} // namespace coinuri
