/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Status.hpp"
#include "Debug.hpp"
#include <sstream>
#include <string.h>

namespace coinuri {

Status::Status() :
    value_(CU_CC_Ok),
    file_(""),
    function_(""),
    line_(0)
{
}

Status::Status(tCU_CC value, std::string message,
    const char *file, const char *function, size_t line) :
    value_(value),
    message_(message),
    file_(file),
    function_(function),
    line_(line)
{
}

const Status &
Status::log() const
{
    if (!*this)
    {
        std::ostringstream stream;
        stream << *this;
        CU_DebugLog("%s", stream.str().c_str());
    }
    return *this;
}

void
Status::toError(tCU_Error &error) const
{
    error.code = value_;
    strncpy(error.szDescription, message_.c_str(), CU_MAX_STRING_LENGTH);
    strncpy(error.szSourceFunc, function_, CU_MAX_STRING_LENGTH);
    strncpy(error.szSourceFile, file_, CU_MAX_STRING_LENGTH);
    error.nSourceLine = line_;

    error.szDescription[CU_MAX_STRING_LENGTH] = 0;
    error.szSourceFunc[CU_MAX_STRING_LENGTH] = 0;
    error.szSourceFile[CU_MAX_STRING_LENGTH] = 0;
}

std::ostream &operator<<(std::ostream &output, const Status &s)
{
    output <<
        s.file() << ":" << s.line() << ": " << s.function() <<
        " returned error " << s.value() << " (" << s.message() << ")";
    return output;
}

} // namespace coinuri
