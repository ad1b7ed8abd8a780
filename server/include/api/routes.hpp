//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATRELAY_SERVER_INCLUDE_API_ROUTES_HPP
#define CHATRELAY_SERVER_INCLUDE_API_ROUTES_HPP

#include <optional>
#include <string>
#include <string_view>

// Maps websocket upgrade targets to endpoints:
//    /ws/chat/<chat_id>/
//    /ws/call/<call_id>/
//    /ws/notifications/
// The trailing slash is optional. Query strings are ignored.

namespace chatrelay {

enum class endpoint_kind
{
    chat,
    call,
    notifications,
};

struct route
{
    endpoint_kind kind;

    // The chat or call ID (percent-decoded). Empty for notifications
    std::string resource_id;
};

// Returns an empty optional if the target is invalid or doesn't match any endpoint
std::optional<route> match_route(std::string_view target);

}  // namespace chatrelay

#endif
