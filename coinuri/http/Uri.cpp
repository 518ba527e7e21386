/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Uri.hpp"
#include <stdint.h>
#include <string.h>
#include <algorithm>

namespace coinuri {

static const char hexDigits[] = "0123456789ABCDEF";

// RFC 3986 character classes, done by hand.
// The <ctype.h> functions depend on the current locale.
static bool
inSet(char c, const char *set)
{
    return c && strchr(set, c);
}

static bool
isAlpha(char c)
{
    return ('a' <= c && c <= 'z') || ('A' <= c && c <= 'Z');
}

static bool
isDigit(char c)
{
    return '0' <= c && c <= '9';
}

static int
hexValue(char c)
{
    if (isDigit(c))
        return c - '0';
    if ('a' <= c && c <= 'f')
        return c - 'a' + 10;
    if ('A' <= c && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

static bool
isSchemeChar(char c)
{
    return isAlpha(c) || isDigit(c) || inSet(c, "+-.");
}

static bool
isPchar(char c)
{
    return isAlpha(c) || isDigit(c) ||
        inSet(c, "-._~") ||         // unreserved
        inSet(c, "!$&'()*+,;=") ||  // sub-delims
        inSet(c, ":@");
}

static bool
isPathChar(char c)
{
    return isPchar(c) || '/' == c;
}

// The query also takes raw non-ASCII bytes and IPv6 brackets:
static bool
isQueryChar(char c)
{
    return isPchar(c) || inSet(c, "/?[]") || 0x80 <= static_cast<uint8_t>(c);
}

// What java.net.URLEncoder leaves alone:
static bool
isFormSafe(char c)
{
    return isAlpha(c) || isDigit(c) || inSet(c, ".-*_");
}

/**
 * Returns the escape sequence value at position i, or -1 if there is none.
 */
static int
escapeAt(const std::string &in, size_t i)
{
    if ('%' != in[i] || in.size() < i + 3)
        return -1;
    const auto high = hexValue(in[i + 1]);
    const auto low = hexValue(in[i + 2]);
    if (high < 0 || low < 0)
        return -1;
    return high << 4 | low;
}

/**
 * True if every character is either allowed or part of a good escape.
 */
static bool
validate(const std::string &in, bool (*allowed)(char))
{
    for (size_t i = 0; i < in.size(); ++i)
    {
        if ('%' == in[i])
        {
            if (escapeAt(in, i) < 0)
                return false;
            i += 2;
        }
        else if (!allowed(in[i]))
        {
            return false;
        }
    }
    return true;
}

static std::string
unescape(const std::string &in, bool plusSpace)
{
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i)
    {
        const auto value = escapeAt(in, i);
        if (0 <= value)
        {
            out += static_cast<char>(value);
            i += 2;
        }
        else
        {
            out += plusSpace && '+' == in[i] ? ' ' : in[i];
        }
    }
    return out;
}

/**
 * Returns the length of the well-formed UTF-8 sequence at position i,
 * or 0 if the bytes there are not one.
 */
static size_t
utf8Length(const std::string &in, size_t i)
{
    const auto lead = static_cast<uint8_t>(in[i]);
    size_t size;
    uint32_t code;
    uint32_t least;
    if (lead < 0x80)
        return 1;
    else if (0xc0 == (lead & 0xe0))
        size = 2, code = lead & 0x1f, least = 0x80;
    else if (0xe0 == (lead & 0xf0))
        size = 3, code = lead & 0x0f, least = 0x800;
    else if (0xf0 == (lead & 0xf8))
        size = 4, code = lead & 0x07, least = 0x10000;
    else
        return 0;

    if (in.size() < i + size)
        return 0;
    for (size_t j = 1; j < size; ++j)
    {
        const auto next = static_cast<uint8_t>(in[i + j]);
        if (0x80 != (next & 0xc0))
            return 0;
        code = code << 6 | (next & 0x3f);
    }

    // No overlong forms, surrogates, or values past U+10FFFF:
    if (code < least || (0xd800 <= code && code <= 0xdfff) || 0x10ffff < code)
        return 0;
    return size;
}

/**
 * Replaces each byte that is not part of valid UTF-8 with U+FFFD.
 */
static std::string
utf8Repair(const std::string &in)
{
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); )
    {
        const auto size = utf8Length(in, i);
        if (size)
        {
            out.append(in, i, size);
            i += size;
        }
        else
        {
            out += "\xef\xbf\xbd";
            ++i;
        }
    }
    return out;
}

/**
 * Consumes input up to, but not including, the first stop character.
 */
static std::string
takeUntil(std::string::const_iterator &i, std::string::const_iterator end,
          const std::string &stops)
{
    const auto start = i;
    i = std::find_first_of(i, end, stops.begin(), stops.end());
    return std::string(start, i);
}

bool
Uri::decode(const std::string &in, bool strict)
{
    const auto end = in.end();
    auto i = in.begin();

    scheme_ = takeUntil(i, end, ":");
    if (end == i || scheme_.empty() || !isAlpha(scheme_[0]) ||
            !std::all_of(scheme_.begin(), scheme_.end(), isSchemeChar))
        return false;
    ++i;

    authority_.clear();
    authorityOk_ = 2 <= end - i && '/' == i[0] && '/' == i[1];
    if (authorityOk_)
    {
        i += 2;
        authority_ = takeUntil(i, end, "/?#");
    }

    path_ = takeUntil(i, end, "?#");

    query_.clear();
    queryOk_ = end != i && '?' == *i;
    if (queryOk_)
    {
        ++i;
        query_ = takeUntil(i, end, "#");
    }

    // Whatever is left must start with '#':
    fragment_.clear();
    fragmentOk_ = end != i;
    if (fragmentOk_)
        fragment_ = std::string(i + 1, end);

    return !strict || (
        validate(authority_, isPchar) &&
        validate(path_, isPathChar) &&
        validate(query_, isQueryChar) &&
        validate(fragment_, isQueryChar));
}

std::string
Uri::encode() const
{
    auto out = scheme_ + ':';
    if (authorityOk_)
        out += "//" + authority_;
    out += path_;
    if (queryOk_)
        out += '?' + query_;
    if (fragmentOk_)
        out += '#' + fragment_;
    return out;
}

std::string
Uri::scheme() const
{
    std::string out;
    for (auto c: scheme_)
        out += 'A' <= c && c <= 'Z' ? c - 'A' + 'a' : c;
    return out;
}

std::string
Uri::authority() const
{
    return unescape(authority_, false);
}

std::string
Uri::path() const
{
    return unescape(path_, false);
}

std::string
Uri::query() const
{
    return unescape(query_, false);
}

std::string
Uri::fragment() const
{
    return unescape(fragment_, false);
}

std::string
queryUnescape(const std::string &in)
{
    return utf8Repair(unescape(in, true));
}

std::string
queryEscape(const std::string &in)
{
    std::string out;
    for (auto c: in)
    {
        if (isFormSafe(c))
        {
            out += c;
        }
        else
        {
            const auto byte = static_cast<uint8_t>(c);
            out += '%';
            out += hexDigits[byte >> 4];
            out += hexDigits[byte & 0xf];
        }
    }
    return out;
}

} // namespace coinuri
