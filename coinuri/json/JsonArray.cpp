/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "JsonArray.hpp"

namespace coinuri {

JsonPtr
JsonArray::operator[](size_t i) const
{
    // Out-of-range indices give null, which json_incref passes through:
    return JsonPtr(json_incref(json_array_get(root_, i)));
}

Status
JsonArray::append(JsonPtr value)
{
    if (!ok())
    {
        reset(json_array());
        if (!root_)
            return CU_ERROR(CU_CC_JSONError, "Cannot create JSON array");
    }
    if (0 != json_array_append(root_, value.get()))
        return CU_ERROR(CU_CC_JSONError, "Cannot add to JSON array");
    return Status();
}

} // namespace coinuri
