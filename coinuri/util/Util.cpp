/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Util.hpp"

namespace coinuri {

void
stringFree(char *string)
{
    free(string);
}

char *
stringCopy(const char *string)
{
    auto out = strdup(string);
    if (!out)
        throw std::bad_alloc();
    return out;
}

char *
stringCopy(const std::string &string)
{
    return stringCopy(string.c_str());
}

} // namespace coinuri
