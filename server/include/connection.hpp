//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATRELAY_SERVER_INCLUDE_CONNECTION_HPP
#define CHATRELAY_SERVER_INCLUDE_CONNECTION_HPP

#include <cstdint>
#include <memory>
#include <string>

#include "business_types.hpp"

namespace chatrelay {

// Opaque connection identifier, assigned by the session registry.
// Topics and presence refer to connections only through these IDs.
using connection_id = std::uint64_t;

// A serialized outbound event. Shared between all the connections it's delivered to
using frame_ptr = std::shared_ptr<const std::string>;

// Anything that can receive frames. Implemented by websocket sessions
// (and by recording sinks in tests).
class connection_sink
{
public:
    virtual ~connection_sink() {}

    // Queues a frame for delivery, without blocking. Frames queued by successive
    // calls must be written in order. Returns false if the connection is broken
    // or can't keep up; the caller should then consider it disconnected.
    virtual bool deliver(frame_ptr frame) = 0;
};

// A live connection, as seen by handlers. Passed explicitly to every handler call.
struct connection
{
    connection_id id{};

    // The authenticated user that owns this connection
    user current_user;
};

}  // namespace chatrelay

#endif
