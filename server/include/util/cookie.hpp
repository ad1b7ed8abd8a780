//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATRELAY_SERVER_INCLUDE_UTIL_COOKIE_HPP
#define CHATRELAY_SERVER_INCLUDE_UTIL_COOKIE_HPP

#include <optional>
#include <string_view>

namespace chatrelay {

// Looks up a cookie by name in the value of a Cookie header (RFC 6265).
// Surrounding double quotes are removed from the value.
// Parsing stops at the first malformed cookie pair: cookies after it are not found.
// The returned view points into header.
std::optional<std::string_view> find_cookie(std::string_view header, std::string_view name) noexcept;

}  // namespace chatrelay

#endif
