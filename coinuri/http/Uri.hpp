/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef COINURI_HTTP_URI_HPP
#define COINURI_HTTP_URI_HPP

#include <string>

namespace coinuri {

/**
 * Splits a URI into its RFC 3986 components.
 * The pieces keep their original escaping until read back out.
 */
class Uri
{
public:
    /**
     * Breaks a string into components.
     * In strict mode, every component must stick to its RFC 3986
     * character set, and every '%' must start a valid escape.
     * The query and fragment may also hold raw non-ASCII bytes
     * and the '[' and ']' of IPv6 literals.
     */
    bool decode(const std::string &in, bool strict=true);

    /**
     * Puts the original text back together.
     */
    std::string encode() const;

    /**
     * The scheme, lowercased.
     */
    std::string scheme() const;

    // Unescaped components, and whether their delimiters were present:
    std::string authority() const;
    bool authorityOk() const { return authorityOk_; }
    std::string path() const;
    std::string query() const;
    bool queryOk() const { return queryOk_; }
    std::string fragment() const;
    bool fragmentOk() const { return fragmentOk_; }

private:
    std::string scheme_;
    std::string authority_;
    std::string path_;
    std::string query_;
    std::string fragment_;
    bool authorityOk_ = false;
    bool queryOk_ = false;
    bool fragmentOk_ = false;
};

/**
 * Decodes a form-encoded query value as UTF-8.
 * `%XX` becomes a raw byte, and '+' becomes a space.
 * Bytes that do not form valid UTF-8 each become U+FFFD.
 */
std::string
queryUnescape(const std::string &in);

/**
 * Form-encodes a query value, byte by byte.
 * Letters, digits and `.-*_` pass through. Everything else,
 * including the space, becomes an upper-case `%XX`.
 */
std::string
queryEscape(const std::string &in);

} // namespace coinuri

#endif
