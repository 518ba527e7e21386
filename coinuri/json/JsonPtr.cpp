/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "JsonPtr.hpp"
#include "../util/Debug.hpp"
#include <stdlib.h>
#include <utility>

namespace coinuri {

// Coin files are meant to be edited by hand, so write them legibly:
constexpr size_t dumpFlags = JSON_INDENT(4) | JSON_SORT_KEYS;

JsonPtr::JsonPtr(json_t *root):
    root_(root)
{}

JsonPtr::JsonPtr(const JsonPtr &copy):
    root_(json_incref(copy.root_))
{}

JsonPtr::JsonPtr(JsonPtr &&move):
    root_(nullptr)
{
    std::swap(root_, move.root_);
}

JsonPtr::~JsonPtr()
{
    json_decref(root_);
}

JsonPtr &
JsonPtr::operator=(JsonPtr other)
{
    std::swap(root_, other.root_);
    return *this;
}

void
JsonPtr::reset(json_t *root)
{
    json_decref(root_);
    root_ = root;
}

Status
JsonPtr::adopt(json_t *root, const json_error_t &error,
               const std::string &source)
{
    if (!root)
        return CU_ERROR(CU_CC_JSONError, source + error.text);
    reset(root);
    return Status();
}

Status
JsonPtr::load(const std::string &filename)
{
    CU_DebugLog("Loading JSON from %s", filename.c_str());
    json_error_t error;
    return adopt(json_load_file(filename.c_str(), 0, &error), error,
                 filename + ": ");
}

Status
JsonPtr::decode(const std::string &data)
{
    json_error_t error;
    return adopt(json_loadb(data.data(), data.size(), 0, &error), error, "");
}

Status
JsonPtr::encode(std::string &result) const
{
    char *text = json_dumps(root_, dumpFlags);
    if (!text)
        return CU_ERROR(CU_CC_JSONError, "Cannot serialize JSON");
    result.assign(text);
    free(text);
    return Status();
}

} // namespace coinuri
