//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATRELAY_SERVER_INCLUDE_SERVICES_CHAT_HANDLER_HPP
#define CHATRELAY_SERVER_INCLUDE_SERVICES_CHAT_HANDLER_HPP

#include <boost/asio/awaitable.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "api/api_types.hpp"
#include "services/endpoint_handler.hpp"
#include "timestamp.hpp"

namespace chatrelay {

class store;
class session_registry;
class topic_broker;

// Handles /ws/chat/<chat_id>/ connections. Only participants may connect.
// Events are fanned out through the chat:<chat_id> topic.
class chat_handler final : public endpoint_handler
{
    std::string chat_id_;
    store* store_;
    session_registry* registry_;
    topic_broker* broker_;
    clock_fn clock_;

    struct visitor;

    // Marks the user's unread messages in this chat as read and
    // publishes a single chat_read event if anything changed
    boost::asio::awaitable<void> mark_read(const connection& conn, std::optional<std::string_view> up_to);

    // Retrieves a message, checking that it belongs to this chat.
    // Store failures are reported to the requester. Returns an empty optional
    // if the frame should be dropped.
    boost::asio::awaitable<std::optional<message>> load_message(
        const connection& conn,
        std::string_view request,
        std::string_view message_id
    );

    boost::asio::awaitable<void> advance_receipt(
        const connection& conn,
        std::string_view request,
        std::string_view message_id,
        receipt_status to
    );

public:
    chat_handler(
        std::string chat_id,
        store& st,
        session_registry& registry,
        topic_broker& broker,
        clock_fn clock = &now
    )
        : chat_id_(std::move(chat_id)), store_(&st), registry_(&registry), broker_(&broker), clock_(clock)
    {
    }

    const std::string& chat_id() const noexcept { return chat_id_; }

    boost::asio::awaitable<result<bool>> authorize(const user& current_user) override final;
    boost::asio::awaitable<void> on_open(const connection& conn) override final;
    boost::asio::awaitable<void> on_frame(const connection& conn, std::string_view frame) override final;
    boost::asio::awaitable<void> on_close(const connection& conn) override final;
};

}  // namespace chatrelay

#endif
