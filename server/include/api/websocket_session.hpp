//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATRELAY_SERVER_INCLUDE_API_WEBSOCKET_SESSION_HPP
#define CHATRELAY_SERVER_INCLUDE_API_WEBSOCKET_SESSION_HPP

#include <boost/asio/awaitable.hpp>

#include <memory>

#include "api/routes.hpp"
#include "util/websocket.hpp"

namespace chatrelay {

// Forward declaration
class shared_state;
class endpoint_handler;

// Creates the handler for an endpoint
std::unique_ptr<endpoint_handler> create_endpoint_handler(const route& r, shared_state& st);

// Runs a websocket session for the given route until the client disconnects,
// the connection breaks or falls behind, or the server stops.
// The websocket handshake must have been performed.
boost::asio::awaitable<void> run_websocket_session(
    websocket ws,
    const route& r,
    std::shared_ptr<shared_state> state
);

}  // namespace chatrelay

#endif
