//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATRELAY_SERVER_INCLUDE_HTTP_SESSION_HPP
#define CHATRELAY_SERVER_INCLUDE_HTTP_SESSION_HPP

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <memory>

namespace chatrelay {

// Forward declaration
class shared_state;

// Runs a HTTP session until the connection is closed or an error is encountered.
// Websocket upgrades to a known endpoint run a websocket session.
// Anything else gets a plain-text error response.
boost::asio::awaitable<void> run_http_session(
    boost::asio::ip::tcp::socket&& socket,
    std::shared_ptr<shared_state> state
);

}  // namespace chatrelay

#endif
