//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATRELAY_SERVER_INCLUDE_CONFIG_HPP
#define CHATRELAY_SERVER_INCLUDE_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <span>
#include <string>

#include "error.hpp"

// Server configuration. Listening address and port come from the command line,
// everything else from environment variables, with sensible defaults.

namespace chatrelay {

struct mysql_config
{
    std::string host{"localhost"};        // MYSQL_HOST
    std::string username{"chatrelay"};    // MYSQL_USERNAME
    std::string password;                 // MYSQL_PASSWORD
    std::string database{"chatrelay"};    // MYSQL_DATABASE
};

struct server_config
{
    // Where the server listens
    std::string ip;
    unsigned short port{};

    mysql_config mysql;

    // REDIS_HOST. Redis holds the session IDs written by the authentication service
    std::string redis_host{"localhost"};

    // CHATRELAY_WRITE_TIMEOUT_MS. A websocket write taking longer than this
    // closes the connection
    std::chrono::milliseconds write_timeout{10000};

    // CHATRELAY_MAX_QUEUED_FRAMES. A connection with this many frames
    // waiting to be written is considered too slow and is closed
    std::size_t max_queued_frames{256};
};

// Retrieves environment variables. std::getenv in production
using env_lookup = const char* (*)(const char* name);

// Builds the configuration from command line arguments (program name included)
// and the environment. Returns errc::invalid_config on malformed input.
result<server_config> load_config(std::span<const char* const> args, env_lookup getenv_fn);

}  // namespace chatrelay

#endif
