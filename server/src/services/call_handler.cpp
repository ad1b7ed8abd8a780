//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/call_handler.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/variant2/variant.hpp>

#include <string_view>

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

struct call_handler::visitor
{
    call_handler& self;
    const connection& conn;

    asio::awaitable<void> operator()(error_code ec) const
    {
        log_error(ec, "Dropping malformed call frame");
        co_return;
    }

    asio::awaitable<void> operator()(const unknown_event&) const { co_return; }

    // Signaling payloads are forwarded verbatim to everyone else in the call
    asio::awaitable<void> operator()(const signal_request& req) const
    {
        self.broker_->publish(
            call_topic(self.call_id_),
            signal_event{req.kind, conn.current_user.id, req.data}.to_json(),
            conn.id
        );
        co_return;
    }

    asio::awaitable<void> operator()(const call_status_request& req) const
    {
        auto updated = co_await self.store_->update_call(self.call_id_, req.status, now());
        if (updated.has_error())
        {
            if (updated.error() == errc::invalid_call_transition)
            {
                send_error(
                    *self.registry_,
                    conn,
                    "call_status",
                    api_error_id::call_conflict,
                    "The call can't transition to the requested status"
                );
            }
            else
            {
                report_store_error(*self.registry_, conn, "call_status", updated.error());
            }
            co_return;
        }

        self.broker_->publish(call_topic(self.call_id_), call_status_event{*updated}.to_json());
    }
};

asio::awaitable<result<bool>> call_handler::authorize(const user& current_user)
{
    auto call = co_await store_->get_call(call_id_);
    if (call.has_error())
    {
        if (call.error() == errc::not_found)
            co_return false;
        co_return call.error();
    }
    co_return call->caller_id == current_user.id || call->receiver_id == current_user.id;
}

asio::awaitable<void> call_handler::on_open(const connection& conn)
{
    broker_->subscribe(call_topic(call_id_), conn.id);

    auto call = co_await store_->get_call(call_id_);
    if (call.has_error())
    {
        log_error(call.error(), "Retrieving call on join");
        co_return;
    }
    if (call->receiver_id != conn.current_user.id || call->status != call_status::initiated)
        co_return;

    // Another connection may have advanced the call in the meantime. The
    // state machine rejects the transition in this case
    auto updated = co_await store_->update_call(call_id_, call_status::ringing, now());
    if (updated.has_error())
    {
        if (updated.error() != errc::invalid_call_transition)
            log_error(updated.error(), "Setting call to ringing");
        co_return;
    }
    broker_->publish(call_topic(call_id_), call_status_event{*updated}.to_json());
}

asio::awaitable<void> call_handler::on_frame(const connection& conn, std::string_view frame)
{
    auto evt = parse_call_event(frame);
    co_await boost::variant2::visit(visitor{*this, conn}, evt);
}

asio::awaitable<void> call_handler::on_close(const connection& conn)
{
    // The closing connection is no longer subscribed, so everyone that gets this is someone else
    broker_->publish(call_topic(call_id_), user_left_event{conn.current_user.id}.to_json());
    co_return;
}
