//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATRELAY_SERVER_INCLUDE_SERVICES_PRESENCE_SERVICE_HPP
#define CHATRELAY_SERVER_INCLUDE_SERVICES_PRESENCE_SERVICE_HPP

#include <boost/asio/awaitable.hpp>

#include <cstdint>
#include <memory>

#include "business_types.hpp"
#include "connection.hpp"

// Connection lifecycle and online presence. A user is online while
// it has at least one live connection, for any endpoint.

namespace chatrelay {

class store;
class session_registry;
class topic_broker;
class endpoint_handler;

// Announces online/offline transitions
class presence_service
{
    store* store_;
    session_registry* registry_;
    topic_broker* broker_;

public:
    presence_service(store& st, session_registry& registry, topic_broker& broker) noexcept
        : store_(&st), registry_(&registry), broker_(&broker)
    {
    }

    // Persists the user's online flag and publishes user_status once
    // to every chat the user participates in. Failures are logged, not propagated:
    // presence is best-effort.
    // The registry is the source of truth. If is_online doesn't match it,
    // either on entry or after waiting on the store, the announcement was superseded
    // by a newer one and nothing is published.
    boost::asio::awaitable<void> announce(std::int64_t user_id, bool is_online);
};

// Registers and unregisters connections, running the handler
// hooks and presence announcements in the right order.
class session_lifecycle
{
    store* store_;
    session_registry* registry_;
    topic_broker* broker_;

public:
    session_lifecycle(store& st, session_registry& registry, topic_broker& broker) noexcept
        : store_(&st), registry_(&registry), broker_(&broker)
    {
    }

    // Authorized -> Active. Registers the connection, runs handler.on_open and,
    // if this is the user's first connection, announces it online.
    boost::asio::awaitable<connection> open(
        endpoint_handler& handler,
        const user& current_user,
        std::shared_ptr<connection_sink> sink
    );

    // Active -> Closed. Unsubscribes the connection from every topic, runs
    // handler.on_close, unregisters it and, if this was the user's
    // last connection, announces it offline.
    boost::asio::awaitable<void> close(endpoint_handler& handler, const connection& conn);
};

}  // namespace chatrelay

#endif
