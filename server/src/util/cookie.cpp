//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "util/cookie.hpp"

#include <optional>
#include <string_view>

using namespace chatrelay;

// Grammar for the Cookie header
// https://datatracker.ietf.org/doc/html/rfc6265
//
//      cookie-header     = "Cookie:" OWS cookie-string OWS
//      cookie-string     = cookie-pair *( ";" SP cookie-pair )
//      cookie-pair       = cookie-name "=" cookie-value
//      cookie-name       = token
//      cookie-value      = *cookie-octet / ( DQUOTE *cookie-octet DQUOTE )
//      cookie-octet      = %x21 / %x23-2B / %x2D-3A / %x3C-5B / %x5D-7E

// Token characters as defined by RFC 7230
static bool is_token_char(char c) noexcept
{
    if (c >= '0' && c <= '9')
        return true;
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'))
        return true;
    return std::string_view("!#$%&'*+-.^_`|~").find(c) != std::string_view::npos;
}

static bool is_cookie_octet(char c) noexcept
{
    auto uc = static_cast<unsigned char>(c);
    return uc == 0x21 || (uc >= 0x23 && uc <= 0x2b) || (uc >= 0x2d && uc <= 0x3a) || (uc >= 0x3c && uc <= 0x5b) ||
           (uc >= 0x5d && uc <= 0x7e);
}

static std::string_view trim_ows(std::string_view from) noexcept
{
    auto first = from.find_first_not_of(" \t");
    if (first == std::string_view::npos)
        return {};
    auto last = from.find_last_not_of(" \t");
    return from.substr(first, last - first + 1);
}

std::optional<std::string_view> chatrelay::find_cookie(std::string_view header, std::string_view name) noexcept
{
    std::string_view remaining = trim_ows(header);
    bool is_first = true;

    while (!remaining.empty())
    {
        // Subsequent pairs are separated by "; "
        if (!is_first)
        {
            if (remaining.size() < 2u || remaining[0] != ';' || remaining[1] != ' ')
                return std::nullopt;
            remaining.remove_prefix(2);
        }
        is_first = false;

        // Cookie name. Empty names are not valid
        std::size_t pos = 0;
        while (pos < remaining.size() && is_token_char(remaining[pos]))
            ++pos;
        if (pos == 0u || pos == remaining.size() || remaining[pos] != '=')
            return std::nullopt;
        std::string_view cookie_name = remaining.substr(0, pos);
        remaining.remove_prefix(pos + 1);

        // Cookie value, optionally quoted
        bool is_quoted = !remaining.empty() && remaining[0] == '"';
        pos = is_quoted ? 1u : 0u;
        while (pos < remaining.size() && is_cookie_octet(remaining[pos]))
            ++pos;
        std::string_view value = remaining.substr(0, pos);
        if (is_quoted)
        {
            if (pos == remaining.size() || remaining[pos] != '"')
                return std::nullopt;
            ++pos;
            value = remaining.substr(1, pos - 2);
        }
        remaining.remove_prefix(pos);

        if (cookie_name == name)
            return value;
    }

    return std::nullopt;
}
