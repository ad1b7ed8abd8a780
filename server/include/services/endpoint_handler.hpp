//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATRELAY_SERVER_INCLUDE_SERVICES_ENDPOINT_HANDLER_HPP
#define CHATRELAY_SERVER_INCLUDE_SERVICES_ENDPOINT_HANDLER_HPP

#include <boost/asio/awaitable.hpp>

#include <string_view>

#include "api/api_types.hpp"
#include "business_types.hpp"
#include "connection.hpp"
#include "error.hpp"

namespace chatrelay {

class session_registry;

// Endpoint-specific logic for a single websocket connection
// (chat, call or notifications). One object is created per connection.
// The connection runner calls authorize once, then on_open, then
// on_frame for each frame received, then on_close exactly once.
// Handlers never write to sockets directly: they publish to topics or
// send frames through the session registry.
class endpoint_handler
{
public:
    virtual ~endpoint_handler() {}

    // Checks whether the authenticated user may open this endpoint.
    // Returns false if access should be denied. Nothing is registered in this case.
    virtual boost::asio::awaitable<result<bool>> authorize(const user& current_user) = 0;

    // The connection has been registered. Subscribe to topics and send initial state
    virtual boost::asio::awaitable<void> on_open(const connection& conn) = 0;

    // A text frame was received from the client
    virtual boost::asio::awaitable<void> on_frame(const connection& conn, std::string_view frame) = 0;

    // The connection is closing. It's already unsubscribed from all topics
    virtual boost::asio::awaitable<void> on_close(const connection& conn) = 0;
};

// Sends an error frame to the connection whose request failed. No other connection sees it
void send_error(
    session_registry& registry,
    const connection& conn,
    std::string_view request,
    api_error_id id,
    std::string_view message
);

// Reports a failed store operation. Not-found errors are expected and stay silent.
// Anything else is logged and sent to the requester as STORE_FAILURE.
void report_store_error(
    session_registry& registry,
    const connection& conn,
    std::string_view request,
    error_code ec
);

}  // namespace chatrelay

#endif
