//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/notification_handler.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/variant2/variant.hpp>

#include <string_view>
#include <utility>

#include "api/api_types.hpp"
#include "business_types.hpp"
#include "error.hpp"
#include "services/session_registry.hpp"
#include "services/store.hpp"
#include "services/topic_broker.hpp"
#include "timestamp.hpp"
#include "topic.hpp"

using namespace chatrelay;
namespace asio = boost::asio;

struct notification_handler::visitor
{
    notification_handler& self;
    const connection& conn;

    asio::awaitable<void> operator()(error_code ec) const
    {
        log_error(ec, "Dropping malformed notification frame");
        co_return;
    }

    asio::awaitable<void> operator()(const unknown_event&) const { co_return; }

    asio::awaitable<void> operator()(const start_call_request& req) const
    {
        const auto& caller = conn.current_user;
        if (req.receiver_id == caller.id)
        {
            send_error(*self.registry_, conn, "start_call", api_error_id::bad_request, "Can't call yourself");
            co_return;
        }

        // The receiver must exist
        auto receiver = co_await self.store_->get_user(req.receiver_id);
        if (receiver.has_error())
        {
            if (receiver.error() == errc::not_found)
                send_error(*self.registry_, conn, "start_call", api_error_id::bad_request, "Unknown receiver");
            else
                report_store_error(*self.registry_, conn, "start_call", receiver.error());
            co_return;
        }

        auto call = co_await self.store_->create_call(caller.id, req.receiver_id, req.type, now());
        if (call.has_error())
        {
            report_store_error(*self.registry_, conn, "start_call", call.error());
            co_return;
        }

        // An online receiver gets the notification right away, so the call is ringing
        if (self.registry_->is_online(req.receiver_id))
        {
            auto ringing = co_await self.store_->update_call(call->id, call_status::ringing, now());
            if (ringing.has_error())
                log_error(ringing.error(), "Setting new call to ringing");
            else
                *call = std::move(*ringing);
        }

        self.registry_->send_to(conn.id, call_created_event{*call}.to_json());
        self.broker_->publish(user_topic(req.receiver_id), call_notification_event{*call, caller}.to_json());
    }
};

asio::awaitable<result<bool>> notification_handler::authorize(const user&) { co_return true; }

asio::awaitable<void> notification_handler::on_open(const connection& conn)
{
    broker_->subscribe(user_topic(conn.current_user.id), conn.id);
    co_return;
}

asio::awaitable<void> notification_handler::on_frame(const connection& conn, std::string_view frame)
{
    auto evt = parse_notification_event(frame);
    co_await boost::variant2::visit(visitor{*this, conn}, evt);
}

asio::awaitable<void> notification_handler::on_close(const connection&) { co_return; }
