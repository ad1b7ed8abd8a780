//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATRELAY_SERVER_INCLUDE_SERVICES_TOPIC_BROKER_HPP
#define CHATRELAY_SERVER_INCLUDE_SERVICES_TOPIC_BROKER_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "connection.hpp"

// An in-memory, topic-based publish-subscribe mechanism. Used to fan out
// events to the connections subscribed to a chat, a call or a user's
// notification channel.

namespace chatrelay {

class session_registry;

// This is an interface to reduce compile times.
class topic_broker
{
public:
    virtual ~topic_broker() {}

    // Subscribes a connection to a topic. Subscribing twice to the same
    // topic is a no-op. Returns true if a new subscription was created.
    virtual bool subscribe(std::string_view topic, connection_id conn) = 0;

    // Removes a single subscription. No-op if it doesn't exist.
    virtual void unsubscribe(std::string_view topic, connection_id conn) = 0;

    // Removes all subscriptions for the given connection. No-op if there are none.
    virtual void unsubscribe_all(connection_id conn) = 0;

    // Delivers event to every connection subscribed to topic, except exclude.
    // The event is serialized once and shared between all subscribers.
    // Delivery never fails into the publisher: subscribers that can't take the
    // event are unsubscribed from every topic. Events published to the same topic
    // are queued to each subscriber in publication order.
    // Returns the number of connections the event was queued to.
    virtual std::size_t publish(
        std::string_view topic,
        std::string event,
        std::optional<connection_id> exclude = std::nullopt
    ) = 0;

    // Connections currently subscribed to topic, in unspecified order
    virtual std::vector<connection_id> subscribers(std::string_view topic) const = 0;

    // Topics a connection is subscribed to
    virtual std::vector<std::string> topics_of(connection_id conn) const = 0;
};

// Creates a concrete topic_broker. Connection IDs are resolved into sinks
// using the registry, which must outlive the broker.
std::unique_ptr<topic_broker> create_topic_broker(session_registry& registry);

}  // namespace chatrelay

#endif
