/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef COINURI_JSON_JSON_ARRAY_HPP
#define COINURI_JSON_JSON_ARRAY_HPP

#include "JsonPtr.hpp"

namespace coinuri {

/**
 * A JsonPtr with an array as its root element.
 */
class JsonArray:
    public JsonPtr
{
public:
    CU_JSON_CONSTRUCTORS(JsonArray, JsonPtr)

    /**
     * Returns true if the root is actually an array.
     */
    bool ok() const { return json_is_array(root_); }

    size_t size() const { return json_array_size(root_); }

    /**
     * Returns a new reference to the element at the given index.
     */
    JsonPtr operator[](size_t i) const;

    /**
     * Adds a value to the end of the array,
     * creating the array if necessary.
     */
    Status
    append(JsonPtr value);
};

} // namespace coinuri

#endif
