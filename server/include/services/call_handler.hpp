//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATRELAY_SERVER_INCLUDE_SERVICES_CALL_HANDLER_HPP
#define CHATRELAY_SERVER_INCLUDE_SERVICES_CALL_HANDLER_HPP

#include <boost/asio/awaitable.hpp>

#include <string>
#include <string_view>
#include <utility>

#include "services/endpoint_handler.hpp"

namespace chatrelay {

class store;
class session_registry;
class topic_broker;

// Handles /ws/call/<call_id>/ connections: relays WebRTC signaling
// between the call parties and drives the call state machine.
class call_handler final : public endpoint_handler
{
    std::string call_id_;
    store* store_;
    session_registry* registry_;
    topic_broker* broker_;

    struct visitor;

public:
    call_handler(std::string call_id, store& st, session_registry& registry, topic_broker& broker)
        : call_id_(std::move(call_id)), store_(&st), registry_(&registry), broker_(&broker)
    {
    }

    const std::string& call_id() const noexcept { return call_id_; }

    // Only the caller and the receiver may join
    boost::asio::awaitable<result<bool>> authorize(const user& current_user) override final;

    // The receiver joining an initiated call makes it ring
    boost::asio::awaitable<void> on_open(const connection& conn) override final;

    boost::asio::awaitable<void> on_frame(const connection& conn, std::string_view frame) override final;

    // Tells the remaining parties that this user left
    boost::asio::awaitable<void> on_close(const connection& conn) override final;
};

}  // namespace chatrelay

#endif
