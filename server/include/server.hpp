//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATRELAY_SERVER_INCLUDE_SERVER_HPP
#define CHATRELAY_SERVER_INCLUDE_SERVER_HPP

#include <boost/asio/awaitable.hpp>

#include <memory>

namespace chatrelay {

// Forward declaration
class shared_state;

// Runs the server. It will accept connections in a loop until
// the underlying I/O context is stopped. Throws an exception
// if the listener is unable to launch (e.g. the port to bind to is not available).
// Accepts connections on the configured address until the io_context is stopped
boost::asio::awaitable<void> run_server(std::shared_ptr<shared_state> state);

}  // namespace chatrelay

#endif
