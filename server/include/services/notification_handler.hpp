//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATRELAY_SERVER_INCLUDE_SERVICES_NOTIFICATION_HANDLER_HPP
#define CHATRELAY_SERVER_INCLUDE_SERVICES_NOTIFICATION_HANDLER_HPP

#include <boost/asio/awaitable.hpp>

#include <string_view>

#include "services/endpoint_handler.hpp"

namespace chatrelay {

class store;
class session_registry;
class topic_broker;

// Handles /ws/notifications/ connections. Every authenticated user may connect.
// The connection receives everything published to user:<user_id>
// and may start calls.
class notification_handler final : public endpoint_handler
{
    store* store_;
    session_registry* registry_;
    topic_broker* broker_;

    struct visitor;

public:
    notification_handler(store& st, session_registry& registry, topic_broker& broker) noexcept
        : store_(&st), registry_(&registry), broker_(&broker)
    {
    }

    boost::asio::awaitable<result<bool>> authorize(const user& current_user) override final;
    boost::asio::awaitable<void> on_open(const connection& conn) override final;
    boost::asio::awaitable<void> on_frame(const connection& conn, std::string_view frame) override final;
    boost::asio::awaitable<void> on_close(const connection& conn) override final;
};

}  // namespace chatrelay

#endif
