//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATRELAY_SERVER_INCLUDE_SHARED_STATE_HPP
#define CHATRELAY_SERVER_INCLUDE_SHARED_STATE_HPP

#include <boost/asio/any_io_executor.hpp>

#include <memory>

#include "config.hpp"

namespace chatrelay {

// Forward declaration
class store;
class redis_client;
class auth_service;
class session_registry;
class topic_broker;

// Contains singleton objects shared by all sessions in the server.
// Only accessed from the thread running the io_context.
class shared_state
{
    struct
    {
        server_config config_;
        std::unique_ptr<store> store_;
        std::unique_ptr<redis_client> redis_;
        std::unique_ptr<auth_service> auth_;
        std::unique_ptr<session_registry> registry_;
        std::unique_ptr<topic_broker> broker_;
    } impl_;

public:
    shared_state(server_config cfg, boost::asio::any_io_executor ex);

    // Uses the given store and Redis client. For testing
    shared_state(server_config cfg, std::unique_ptr<store> st, std::unique_ptr<redis_client> redis);

    shared_state(const shared_state&) = delete;
    shared_state(shared_state&&) noexcept;
    shared_state& operator=(const shared_state&) = delete;
    shared_state& operator=(shared_state&&) noexcept;
    ~shared_state();

    const server_config& config() const noexcept { return impl_.config_; }
    store& get_store() noexcept { return *impl_.store_; }
    redis_client& redis() noexcept { return *impl_.redis_; }
    auth_service& auth() noexcept { return *impl_.auth_; }
    session_registry& registry() noexcept { return *impl_.registry_; }
    topic_broker& broker() noexcept { return *impl_.broker_; }
};

}  // namespace chatrelay

#endif
