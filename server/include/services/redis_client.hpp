//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATRELAY_SERVER_INCLUDE_SERVICES_REDIS_CLIENT_HPP
#define CHATRELAY_SERVER_INCLUDE_SERVICES_REDIS_CLIENT_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "error.hpp"

// A high-level, specialized Redis client. Redis holds the session IDs
// written by the authentication service. We only read them.

namespace chatrelay {

// Using an interface to reduce build times and improve testability
class redis_client
{
public:
    virtual ~redis_client() {}

    // Starts the Redis runner task, in detached mode. This must be called once
    // to allow other operations to make progress and keep the reconnection loop
    // running
    virtual void start_run() = 0;

    // Cancels the Redis runner task. To be called at shutdown
    virtual void cancel() = 0;

    // Gets the specified key, as an int64_t.
    // Returns not_found if the key does not exist
    virtual boost::asio::awaitable<result<std::int64_t>> get_int_key(std::string_view key) = 0;
};

// Creates a concrete implementation of redis_client, connecting to the given host
std::unique_ptr<redis_client> create_redis_client(boost::asio::any_io_executor ex, std::string host);

}  // namespace chatrelay

#endif
