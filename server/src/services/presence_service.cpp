//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/presence_service.hpp"

#include <boost/asio/awaitable.hpp>

#include <memory>
#include <utility>

#include "api/api_types.hpp"
#include "error.hpp"
#include "services/endpoint_handler.hpp"
#include "services/session_registry.hpp"
#include "services/store.hpp"
#include "services/topic_broker.hpp"
#include "timestamp.hpp"
#include "topic.hpp"

using namespace chatrelay;
namespace asio = boost::asio;

asio::awaitable<void> presence_service::announce(std::int64_t user_id, bool is_online)
{
    auto is_current = [this, user_id, is_online] { return registry_->is_online(user_id) == is_online; };

    if (!is_current())
        co_return;

    auto ec = co_await store_->set_user_online(user_id, is_online, now());
    if (ec)
        log_error(ec, "Persisting user presence");

    if (!is_current())
    {
        // The newer announcement may have persisted its flag before us
        ec = co_await store_->set_user_online(user_id, !is_online, now());
        if (ec)
            log_error(ec, "Restoring user presence");
        co_return;
    }

    auto chats = co_await store_->list_user_chats(user_id);
    if (chats.has_error())
    {
        log_error(chats.error(), "Listing chats for a presence announcement");
        co_return;
    }
    if (!is_current())
        co_return;

    // One event per chat, regardless of how many connections the user has
    auto payload = user_status_event{user_id, is_online}.to_json();
    for (const auto& chat_id : *chats)
        broker_->publish(chat_topic(chat_id), payload);
}

asio::awaitable<connection> session_lifecycle::open(
    endpoint_handler& handler,
    const user& current_user,
    std::shared_ptr<connection_sink> sink
)
{
    auto reg = registry_->register_connection(current_user.id, std::move(sink));
    connection conn{reg.id, current_user};

    co_await handler.on_open(conn);

    if (reg.came_online)
        co_await presence_service(*store_, *registry_, *broker_).announce(current_user.id, true);

    co_return conn;
}

asio::awaitable<void> session_lifecycle::close(endpoint_handler& handler, const connection& conn)
{
    // No more events for this connection
    broker_->unsubscribe_all(conn.id);

    co_await handler.on_close(conn);

    auto went_offline = registry_->unregister_connection(conn.id);
    if (went_offline)
        co_await presence_service(*store_, *registry_, *broker_).announce(*went_offline, false);
}
