/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef COINURI_JSON_JSON_PTR_HPP
#define COINURI_JSON_JSON_PTR_HPP

#include "../util/Status.hpp"
#include <jansson.h>
#include <string>

namespace coinuri {

/**
 * Owns one reference to a jansson value.
 * Copies share the value, bumping its reference count.
 */
class JsonPtr
{
public:
    /**
     * Takes over the caller's reference, which may be null.
     */
    JsonPtr(json_t *root=nullptr);
    JsonPtr(const JsonPtr &copy);
    JsonPtr(JsonPtr &&move);
    ~JsonPtr();

    JsonPtr &operator=(JsonPtr other);

    /**
     * Drops the current value in favor of a new one.
     * Takes over the caller's reference.
     */
    void
    reset(json_t *root=nullptr);

    /**
     * The underlying value, still owned by this object.
     */
    json_t *get() const { return root_; }
    explicit operator bool() const { return root_; }

    /**
     * Parses a JSON file. On failure, the old value stays in place.
     */
    Status
    load(const std::string &filename);

    /**
     * Parses JSON text. On failure, the old value stays in place.
     */
    Status
    decode(const std::string &data);

    /**
     * Serializes the value as indented text with sorted keys.
     */
    Status
    encode(std::string &result) const;

protected:
    json_t *root_;

private:
    Status
    adopt(json_t *root, const json_error_t &error, const std::string &source);
};

/**
 * Gives a JsonPtr subclass the same ways to be constructed.
 */
#define CU_JSON_CONSTRUCTORS(This, Base) \
    This() {} \
    This(JsonPtr &&move): Base(std::move(move)) {} \
    This(const JsonPtr &copy): Base(copy) {}

} // namespace coinuri

#endif
