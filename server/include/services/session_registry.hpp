//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATRELAY_SERVER_INCLUDE_SERVICES_SESSION_REGISTRY_HPP
#define CHATRELAY_SERVER_INCLUDE_SERVICES_SESSION_REGISTRY_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "connection.hpp"

// Tracks live connections and which users they belong to.
// This is the arena that owns connection sinks: everything else (topic
// subscriptions, handlers) refers to connections by connection_id.
// Like the rest of the shared state, it's accessed from a single thread.

namespace chatrelay {

class session_registry
{
    struct entry
    {
        std::int64_t user_id;
        std::shared_ptr<connection_sink> sink;
    };

    std::unordered_map<connection_id, entry> connections_;

    // Reference counting: a user is online while this contains at least one connection for it
    std::unordered_map<std::int64_t, std::unordered_set<connection_id>> user_connections_;

    connection_id next_id_{1};

public:
    // The result of registering a connection
    struct registration
    {
        // The ID assigned to the new connection
        connection_id id;

        // true if this is the user's first live connection (offline -> online)
        bool came_online;
    };

    session_registry() = default;
    session_registry(const session_registry&) = delete;
    session_registry& operator=(const session_registry&) = delete;

    // Adds a live connection for the given user
    registration register_connection(std::int64_t user_id, std::shared_ptr<connection_sink> sink);

    // Removes a connection. Returns the owning user's ID if this was the
    // user's last connection (online -> offline), and an empty optional otherwise.
    // Unregistering an unknown connection is a no-op.
    std::optional<std::int64_t> unregister_connection(connection_id id);

    // Is there at least one live connection for this user?
    bool is_online(std::int64_t user_id) const noexcept;

    // Live connections for a user. Order is unspecified
    std::vector<connection_id> connections_for(std::int64_t user_id) const;

    // Looks up a connection's sink. Returns nullptr if the connection is not registered
    connection_sink* find(connection_id id) const noexcept;

    // Delivers a frame to a single connection, bypassing topics. Used for
    // replies and errors addressed to the originating connection.
    // Returns false if the connection is not registered or can't take the frame
    bool send_to(connection_id id, std::string frame);

    // Number of live connections
    std::size_t size() const noexcept { return connections_.size(); }
};

}  // namespace chatrelay

#endif
