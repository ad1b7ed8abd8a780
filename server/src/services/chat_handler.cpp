//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/chat_handler.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/variant2/variant.hpp>

#include <optional>
#include <string>
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

struct chat_handler::visitor
{
    chat_handler& self;
    const connection& conn;

    const user& current_user() const noexcept { return conn.current_user; }
    std::string topic() const { return chat_topic(self.chat_id_); }

    // Parsing error
    asio::awaitable<void> operator()(error_code ec) const
    {
        log_error(ec, "Dropping malformed chat frame");
        co_return;
    }

    asio::awaitable<void> operator()(const unknown_event&) const { co_return; }

    asio::awaitable<void> operator()(chat_message_request& req) const
    {
        if (req.content.empty())
        {
            send_error(
                *self.registry_,
                conn,
                "chat_message",
                api_error_id::bad_request,
                "Message content must not be empty"
            );
            co_return;
        }

        // Replies must point to a message in this same chat
        if (req.reply_to)
        {
            auto replied = co_await self.load_message(conn, "chat_message", *req.reply_to);
            if (!replied)
                co_return;
        }

        // Persist the message and its receipts
        auto created = co_await self.store_->create_message(new_message{
            .chat_id = self.chat_id_,
            .sender_id = current_user().id,
            .type = message_type::text,
            .content = req.content,
            .created_at = self.clock_(),
            .reply_to = req.reply_to ? std::optional<std::string_view>(*req.reply_to) : std::nullopt,
        });
        if (created.has_error())
        {
            report_store_error(*self.registry_, conn, "chat_message", created.error());
            co_return;
        }

        // Everyone in the chat gets the message, including the sender's connections
        self.broker_->publish(topic(), chat_message_event{created->msg, current_user()}.to_json());

        // Recipients are notified through their personal topic
        if (!created->recipients.empty())
        {
            auto notification = message_notification_event{created->msg, current_user()}.to_json();
            for (auto recipient : created->recipients)
                self.broker_->publish(user_topic(recipient), notification);
        }
    }

    asio::awaitable<void> operator()(const typing_request& req) const
    {
        self.broker_->publish(topic(), typing_indicator_event{current_user(), req.is_typing}.to_json(), conn.id);
        co_return;
    }

    asio::awaitable<void> operator()(const read_receipt_request& req) const
    {
        co_await self.advance_receipt(conn, "read_receipt", req.message_id, receipt_status::read);
    }

    asio::awaitable<void> operator()(const delivered_receipt_request& req) const
    {
        co_await self.advance_receipt(conn, "delivered_receipt", req.message_id, receipt_status::delivered);
    }

    asio::awaitable<void> operator()(const delete_message_request& req) const
    {
        auto msg = co_await self.load_message(conn, "delete_message", req.message_id);
        if (!msg)
            co_return;

        // Only the sender may delete a message. Rejections are silent
        if (msg->sender_id != current_user().id)
            co_return;

        error_code ec;
        if (req.delete_for_everyone)
        {
            // The window is inclusive. Tombstoning twice has no further effect
            if (self.clock_() - msg->created_at > delete_for_everyone_window || msg->deleted_for_everyone)
                co_return;
            ec = co_await self.store_->tombstone_message(msg->id);
        }
        else
        {
            ec = co_await self.store_->hide_message_for_user(msg->id, current_user().id);
        }

        if (ec)
        {
            report_store_error(*self.registry_, conn, "delete_message", ec);
            co_return;
        }

        self.broker_->publish(
            topic(),
            message_deleted_event{msg->id, current_user().id, req.delete_for_everyone}.to_json()
        );
    }

    asio::awaitable<void> operator()(const reaction_request& req) const
    {
        if (req.emoji.empty())
        {
            send_error(*self.registry_, conn, "reaction", api_error_id::bad_request, "Emoji must not be empty");
            co_return;
        }

        auto msg = co_await self.load_message(conn, "reaction", req.message_id);
        if (!msg)
            co_return;

        auto action = co_await self.store_->toggle_reaction(msg->id, current_user().id, req.emoji);
        if (action.has_error())
        {
            report_store_error(*self.registry_, conn, "reaction", action.error());
            co_return;
        }

        self.broker_->publish(
            topic(),
            reaction_event{msg->id, current_user().id, req.emoji, *action}.to_json()
        );
    }

    asio::awaitable<void> operator()(const mark_chat_read_request& req) const
    {
        co_await self.mark_read(
            conn,
            req.up_to ? std::optional<std::string_view>(*req.up_to) : std::nullopt
        );
    }
};

asio::awaitable<std::optional<message>> chat_handler::load_message(
    const connection& conn,
    std::string_view request,
    std::string_view message_id
)
{
    auto msg = co_await store_->get_message(message_id);
    if (msg.has_error())
    {
        report_store_error(*registry_, conn, request, msg.error());
        co_return std::nullopt;
    }

    // Messages from other chats are treated as not found
    if (msg->chat_id != chat_id_)
        co_return std::nullopt;

    co_return std::move(*msg);
}

asio::awaitable<void> chat_handler::advance_receipt(
    const connection& conn,
    std::string_view request,
    std::string_view message_id,
    receipt_status to
)
{
    auto msg = co_await load_message(conn, request, message_id);
    if (!msg)
        co_return;

    auto changed = co_await store_->update_receipt(msg->id, conn.current_user.id, to, clock_());
    if (changed.has_error())
    {
        report_store_error(*registry_, conn, request, changed.error());
        co_return;
    }

    // Repeated receipts don't generate duplicate events
    if (!*changed)
        co_return;

    auto payload = to == receipt_status::read
                       ? read_receipt_event{msg->id, conn.current_user.id}.to_json()
                       : delivered_receipt_event{msg->id, conn.current_user.id}.to_json();
    broker_->publish(chat_topic(chat_id_), std::move(payload));
}

asio::awaitable<void> chat_handler::mark_read(const connection& conn, std::optional<std::string_view> up_to)
{
    auto ids = co_await store_->bulk_mark_read(chat_id_, conn.current_user.id, up_to, clock_());
    if (ids.has_error())
    {
        report_store_error(*registry_, conn, "mark_chat_read", ids.error());
        co_return;
    }

    if (!ids->empty())
        broker_->publish(chat_topic(chat_id_), chat_read_event{conn.current_user.id, *ids}.to_json());
}

asio::awaitable<result<bool>> chat_handler::authorize(const user& current_user)
{
    auto ch = co_await store_->get_chat(chat_id_);
    if (ch.has_error())
    {
        if (ch.error() == errc::not_found)
            co_return false;
        co_return ch.error();
    }

    co_return co_await store_->is_participant(chat_id_, current_user.id);
}

asio::awaitable<void> chat_handler::on_open(const connection& conn)
{
    broker_->subscribe(chat_topic(chat_id_), conn.id);

    // Let the new connection know who's already here
    auto participants = co_await store_->list_participants(chat_id_);
    if (participants.has_error())
    {
        log_error(participants.error(), "Listing participants for the presence snapshot");
    }
    else
    {
        for (auto user_id : *participants)
        {
            if (user_id != conn.current_user.id && registry_->is_online(user_id))
                registry_->send_to(conn.id, user_status_event{user_id, true}.to_json());
        }
    }

    // Opening a chat reads everything in it
    co_await mark_read(conn, std::nullopt);
}

asio::awaitable<void> chat_handler::on_frame(const connection& conn, std::string_view frame)
{
    auto evt = parse_chat_event(frame);
    co_await boost::variant2::visit(visitor{*this, conn}, evt);
}

asio::awaitable<void> chat_handler::on_close(const connection&) { co_return; }
