//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/chat_handler.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/json/object.hpp>
#include <boost/json/value.hpp>
#include <boost/test/unit_test.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"
#include "handler_fixture.hpp"
#include "test_utils.hpp"
#include "timestamp.hpp"

using namespace chatrelay;
using namespace chatrelay::test;
using namespace std::chrono_literals;
namespace asio = boost::asio;
namespace json = boost::json;

namespace {

std::string str(const json::value& v) { return std::string(v.as_string()); }

// Controllable clock, for tests that depend on exact times
timestamp_t fixed_time;
timestamp_t fixed_clock() { return fixed_time; }

struct fixture : handler_fixture
{
    fixture()
    {
        fixed_time = now();
        st.add_chat(chat{"c1", chat_type::personal, ""}, {1, 2});
        st.add_chat(chat{"c2", chat_type::group, "Group"}, {1, 2, 3});
    }

    // Seeds a message from sender in chat c1
    message seed_message(std::string id, std::int64_t sender_id, timestamp_t created_at = now())
    {
        message msg{
            .id = std::move(id),
            .chat_id = "c1",
            .sender_id = sender_id,
            .content = "seeded",
            .created_at = created_at,
        };
        st.add_message(msg);
        return msg;
    }

    // A chat handler that reads the time from fixed_clock
    std::unique_ptr<endpoint_handler> chat_endpoint_fixed_clock(std::string chat_id)
    {
        return std::make_unique<chat_handler>(std::move(chat_id), st, registry, *broker, &fixed_clock);
    }

    // Opens alice and bob connections to c1, discarding the frames generated on open
    asio::awaitable<std::pair<test_client, test_client>> open_both()
    {
        auto a = co_await open(chat_endpoint("c1"), alice);
        auto b = co_await open(chat_endpoint("c1"), bob);
        a.sink->clear();
        b.sink->clear();
        co_return std::pair<test_client, test_client>(std::move(a), std::move(b));
    }
};

}  // namespace

BOOST_AUTO_TEST_SUITE(chat_handler_)

//
// Authorization
//

BOOST_FIXTURE_TEST_CASE(authorize, fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        // Participants may connect
        auto res = co_await chat_endpoint("c1")->authorize(alice);
        BOOST_TEST(res.value());

        // Non-participants may not
        res = co_await chat_endpoint("c1")->authorize(carol);
        BOOST_TEST(!res.value());

        // Unknown chats are rejected, too
        res = co_await chat_endpoint("c9")->authorize(alice);
        BOOST_TEST(!res.value());

        // Store failures are errors
        st.set_failing(true);
        res = co_await chat_endpoint("c1")->authorize(alice);
        BOOST_TEST(res.has_error());
    });
}

//
// Messages
//

BOOST_FIXTURE_TEST_CASE(send_message, fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto [a, b] = co_await open_both();

        co_await send(a, R"({"type": "chat_message", "content": "hi"})");

        // One message, one receipt for the other participant
        BOOST_TEST_REQUIRE(st.messages().size() == 1u);
        const auto& msg = st.messages()[0];
        BOOST_TEST(msg.sender_id == 1);
        BOOST_TEST(msg.chat_id == "c1");
        BOOST_TEST(msg.content == "hi");
        BOOST_TEST((msg.type == message_type::text));
        BOOST_TEST(st.receipt_count(msg.id) == 1u);
        auto rec = st.find_receipt(msg.id, 2);
        BOOST_TEST_REQUIRE(rec.has_value());
        BOOST_TEST((rec->status == receipt_status::sent));

        // Everyone subscribed gets the event, including the sender
        for (const auto* sink : {a.sink.get(), b.sink.get()})
        {
            BOOST_TEST_REQUIRE(sink->frames.size() == 1u);
            auto evt = sink->objects()[0];
            BOOST_TEST(str(evt.at("type")) == "chat_message");
            const auto& wire_msg = evt.at("message").as_object();
            BOOST_TEST(str(wire_msg.at("id")) == msg.id);
            BOOST_TEST(wire_msg.at("sender_id").as_int64() == 1);
            BOOST_TEST(str(wire_msg.at("sender_name")) == "Alice");
            BOOST_TEST(str(wire_msg.at("content")) == "hi");
            BOOST_TEST(wire_msg.at("created_at").as_int64() == serialize_timestamp(msg.created_at));
            BOOST_TEST(wire_msg.at("reply_to").is_null());
        }
    });
}

BOOST_FIXTURE_TEST_CASE(send_message_multi_device, fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto [a, b] = co_await open_both();
        auto a2 = co_await open(chat_endpoint("c1"), alice);
        a2.sink->clear();

        co_await send(a, R"({"type": "chat_message", "content": "hi"})");

        BOOST_TEST(a.sink->of_type("chat_message").size() == 1u);
        BOOST_TEST(a2.sink->of_type("chat_message").size() == 1u);
        BOOST_TEST(b.sink->of_type("chat_message").size() == 1u);
    });
}

BOOST_FIXTURE_TEST_CASE(send_message_notifies_recipients, fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto [a, b] = co_await open_both();
        auto bob_notifications = co_await open(notification_endpoint(), bob);
        auto alice_notifications = co_await open(notification_endpoint(), alice);
        bob_notifications.sink->clear();
        alice_notifications.sink->clear();

        co_await send(a, R"({"type": "chat_message", "content": "hi"})");

        // Only recipients get notified
        BOOST_TEST(alice_notifications.sink->frames.empty());
        auto notifications = bob_notifications.sink->of_type("notification");
        BOOST_TEST_REQUIRE(notifications.size() == 1u);
        const auto& n = notifications[0].at("notification").as_object();
        BOOST_TEST(str(n.at("kind")) == "message");
        BOOST_TEST(str(n.at("chat_id")) == "c1");
        BOOST_TEST(str(n.at("message_id")) == st.messages().at(0).id);
        BOOST_TEST(n.at("sender_id").as_int64() == 1);
        BOOST_TEST(str(n.at("sender_name")) == "Alice");
        BOOST_TEST(str(n.at("body")) == "hi");
    });
}

BOOST_FIXTURE_TEST_CASE(send_message_reply, fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto [a, b] = co_await open_both();
        seed_message("m0", 2);

        co_await send(a, R"({"type": "chat_message", "content": "re", "reply_to": "m0"})");

        BOOST_TEST_REQUIRE(st.messages().size() == 2u);
        BOOST_TEST(st.messages()[1].reply_to.value() == "m0");
        auto evts = b.sink->of_type("chat_message");
        BOOST_TEST_REQUIRE(evts.size() == 1u);
        BOOST_TEST(str(evts[0].at("message").as_object().at("reply_to")) == "m0");
    });
}

BOOST_FIXTURE_TEST_CASE(send_message_invalid_reply, fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto [a, b] = co_await open_both();
        st.add_message(message{.id = "other", .chat_id = "c2", .sender_id = 3, .content = "x", .created_at = now()});

        // Replies to unknown messages or to messages in other chats are dropped
        co_await send(a, R"({"type": "chat_message", "content": "re", "reply_to": "nope"})");
        co_await send(a, R"({"type": "chat_message", "content": "re", "reply_to": "other"})");

        BOOST_TEST(st.messages().size() == 1u);
        BOOST_TEST(a.sink->frames.empty());
        BOOST_TEST(b.sink->frames.empty());
    });
}

BOOST_FIXTURE_TEST_CASE(send_message_empty_content, fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto [a, b] = co_await open_both();

        co_await send(a, R"({"type": "chat_message", "content": ""})");

        BOOST_TEST(st.messages().empty());
        BOOST_TEST(b.sink->frames.empty());
        auto errors = a.sink->of_type("error");
        BOOST_TEST_REQUIRE(errors.size() == 1u);
        BOOST_TEST(str(errors[0].at("error")) == "BAD_REQUEST");
        BOOST_TEST(str(errors[0].at("request")) == "chat_message");
    });
}

BOOST_FIXTURE_TEST_CASE(send_message_store_failure, fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto [a, b] = co_await open_both();

        st.set_failing(true);
        co_await send(a, R"({"type": "chat_message", "content": "hi"})");
        st.set_failing(false);

        // Nothing is published. Only the requester learns about the failure
        BOOST_TEST(st.messages().empty());
        BOOST_TEST(b.sink->frames.empty());
        BOOST_TEST_REQUIRE(a.sink->frames.size() == 1u);
        auto evt = a.sink->objects()[0];
        BOOST_TEST(str(evt.at("type")) == "error");
        BOOST_TEST(str(evt.at("error")) == "STORE_FAILURE");
    });
}

//
// Typing
//

BOOST_FIXTURE_TEST_CASE(typing_not_echoed, fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto [a, b] = co_await open_both();
        auto a2 = co_await open(chat_endpoint("c1"), alice);
        a2.sink->clear();

        co_await send(a, R"({"type": "typing", "is_typing": true})");

        // The originating connection doesn't get it. Alice's other device does
        BOOST_TEST(a.sink->frames.empty());
        BOOST_TEST(a2.sink->of_type("typing_indicator").size() == 1u);
        auto evts = b.sink->of_type("typing_indicator");
        BOOST_TEST_REQUIRE(evts.size() == 1u);
        BOOST_TEST(evts[0].at("user_id").as_int64() == 1);
        BOOST_TEST(str(evts[0].at("user_name")) == "Alice");
        BOOST_TEST(evts[0].at("is_typing").as_bool());

        // Nothing is persisted
        BOOST_TEST(st.messages().empty());
    });
}

//
// Receipts
//

BOOST_FIXTURE_TEST_CASE(read_receipt, fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto [a, b] = co_await open_both();
        co_await send(a, R"({"type": "chat_message", "content": "hi"})");
        auto msg_id = st.messages().at(0).id;
        a.sink->clear();
        b.sink->clear();

        co_await send(b, R"({"type": "read_receipt", "message_id": ")" + msg_id + "\"}");

        auto rec = st.find_receipt(msg_id, 2);
        BOOST_TEST_REQUIRE(rec.has_value());
        BOOST_TEST((rec->status == receipt_status::read));
        BOOST_TEST_REQUIRE(rec->read_at.has_value());
        auto read_at = *rec->read_at;

        // Both the sender and the reader's connections see it
        for (const auto* sink : {a.sink.get(), b.sink.get()})
        {
            auto evts = sink->of_type("read_receipt");
            BOOST_TEST_REQUIRE(evts.size() == 1u);
            BOOST_TEST(str(evts[0].at("message_id")) == msg_id);
            BOOST_TEST(evts[0].at("user_id").as_int64() == 2);
        }

        // Repeating it doesn't change anything or publish again
        co_await send(b, R"({"type": "read_receipt", "message_id": ")" + msg_id + "\"}");
        BOOST_TEST((st.find_receipt(msg_id, 2)->read_at == read_at));
        BOOST_TEST(a.sink->of_type("read_receipt").size() == 1u);
    });
}

BOOST_FIXTURE_TEST_CASE(delivered_then_read, fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto [a, b] = co_await open_both();
        seed_message("m1", 1);

        co_await send(b, R"({"type": "delivered_receipt", "message_id": "m1"})");
        BOOST_TEST((st.find_receipt("m1", 2)->status == receipt_status::delivered));
        BOOST_TEST(a.sink->of_type("delivered_receipt").size() == 1u);

        co_await send(b, R"({"type": "read_receipt", "message_id": "m1"})");
        BOOST_TEST((st.find_receipt("m1", 2)->status == receipt_status::read));
        BOOST_TEST(a.sink->of_type("read_receipt").size() == 1u);

        // Receipts never regress
        co_await send(b, R"({"type": "delivered_receipt", "message_id": "m1"})");
        BOOST_TEST((st.find_receipt("m1", 2)->status == receipt_status::read));
        BOOST_TEST(a.sink->of_type("delivered_receipt").size() == 1u);
    });
}

BOOST_FIXTURE_TEST_CASE(receipt_not_found, fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto [a, b] = co_await open_both();
        seed_message("m1", 1);

        // Unknown message, and a message the user has no receipt for (its own)
        co_await send(b, R"({"type": "read_receipt", "message_id": "nope"})");
        co_await send(a, R"({"type": "read_receipt", "message_id": "m1"})");

        // Silently ignored
        BOOST_TEST(a.sink->frames.empty());
        BOOST_TEST(b.sink->frames.empty());
    });
}

//
// Bulk read
//

BOOST_FIXTURE_TEST_CASE(open_marks_chat_read, fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto a = co_await open(chat_endpoint("c1"), alice);
        auto base = now();
        seed_message("m1", 1, base - 3min);
        seed_message("m2", 1, base - 2min);
        seed_message("m3", 2, base - 1min);  // bob's own
        a.sink->clear();

        // Bob opens the chat: everything he hadn't read is now read
        auto b = co_await open(chat_endpoint("c1"), bob);
        BOOST_TEST((st.find_receipt("m1", 2)->status == receipt_status::read));
        BOOST_TEST((st.find_receipt("m2", 2)->status == receipt_status::read));

        // Alice hasn't read bob's message
        BOOST_TEST((st.find_receipt("m3", 1)->status == receipt_status::sent));

        // A single summarized event, oldest first
        auto evts = a.sink->of_type("chat_read");
        BOOST_TEST_REQUIRE(evts.size() == 1u);
        BOOST_TEST(evts[0].at("user_id").as_int64() == 2);
        const auto& ids = evts[0].at("message_ids").as_array();
        BOOST_TEST_REQUIRE(ids.size() == 2u);
        BOOST_TEST(str(ids[0]) == "m1");
        BOOST_TEST(str(ids[1]) == "m2");
        BOOST_TEST(a.sink->of_type("read_receipt").empty());
    });
}

BOOST_FIXTURE_TEST_CASE(open_without_unread, fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto [a, b] = co_await open_both();
        auto b2 = co_await open(chat_endpoint("c1"), bob);
        BOOST_TEST(a.sink->of_type("chat_read").empty());
        BOOST_TEST(b2.sink->of_type("chat_read").empty());
    });
}

BOOST_FIXTURE_TEST_CASE(mark_chat_read_up_to, fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto [a, b] = co_await open_both();
        auto base = now();
        seed_message("m1", 1, base - 3min);
        seed_message("m2", 1, base - 2min);
        seed_message("m3", 1, base - 1min);

        co_await send(b, R"({"type": "mark_chat_read", "up_to": "m2"})");

        BOOST_TEST((st.find_receipt("m1", 2)->status == receipt_status::read));
        BOOST_TEST((st.find_receipt("m2", 2)->status == receipt_status::read));
        BOOST_TEST((st.find_receipt("m3", 2)->status == receipt_status::sent));
        auto evts = a.sink->of_type("chat_read");
        BOOST_TEST_REQUIRE(evts.size() == 1u);
        BOOST_TEST(evts[0].at("message_ids").as_array().size() == 2u);

        // The rest
        co_await send(b, R"({"type": "mark_chat_read"})");
        BOOST_TEST((st.find_receipt("m3", 2)->status == receipt_status::read));
        evts = a.sink->of_type("chat_read");
        BOOST_TEST_REQUIRE(evts.size() == 2u);
        BOOST_TEST(evts[1].at("message_ids").as_array().size() == 1u);

        // Nothing left: no event
        co_await send(b, R"({"type": "mark_chat_read"})");
        BOOST_TEST(a.sink->of_type("chat_read").size() == 2u);
    });
}

//
// Deletion
//

BOOST_FIXTURE_TEST_CASE(delete_for_everyone, fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto [a, b] = co_await open_both();
        seed_message("m1", 1, now() - 30min);

        co_await send(a, R"({"type": "delete_message", "message_id": "m1", "delete_for_everyone": true})");

        const auto& msg = st.messages().at(0);
        BOOST_TEST(msg.is_deleted);
        BOOST_TEST(msg.deleted_for_everyone);
        BOOST_TEST(msg.content == tombstone_content);

        for (const auto* sink : {a.sink.get(), b.sink.get()})
        {
            auto evts = sink->of_type("message_deleted");
            BOOST_TEST_REQUIRE(evts.size() == 1u);
            BOOST_TEST(str(evts[0].at("message_id")) == "m1");
            BOOST_TEST(evts[0].at("user_id").as_int64() == 1);
            BOOST_TEST(evts[0].at("delete_for_everyone").as_bool());
        }
    });
}

BOOST_FIXTURE_TEST_CASE(delete_for_everyone_too_late, fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto [a, b] = co_await open_both();
        seed_message("m1", 1, now() - 2h);

        co_await send(a, R"({"type": "delete_message", "message_id": "m1", "delete_for_everyone": true})");

        // Rejected: message unchanged, no event
        const auto& msg = st.messages().at(0);
        BOOST_TEST(!msg.is_deleted);
        BOOST_TEST(msg.content == "seeded");
        BOOST_TEST(a.sink->frames.empty());
        BOOST_TEST(b.sink->frames.empty());
    });
}

BOOST_FIXTURE_TEST_CASE(delete_for_everyone_window_edge, fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto created = fixed_time;
        seed_message("m1", 1, created);
        seed_message("m2", 1, created);
        auto a = co_await open(chat_endpoint_fixed_clock("c1"), alice);
        auto b = co_await open(chat_endpoint("c1"), bob);
        b.sink->clear();

        // Exactly one hour later is still within the window
        fixed_time = created + delete_for_everyone_window;
        co_await send(a, R"({"type": "delete_message", "message_id": "m1", "delete_for_everyone": true})");
        BOOST_TEST(st.messages().at(0).deleted_for_everyone);

        // One millisecond later isn't
        fixed_time = created + delete_for_everyone_window + 1ms;
        co_await send(a, R"({"type": "delete_message", "message_id": "m2", "delete_for_everyone": true})");
        BOOST_TEST(!st.messages().at(1).is_deleted);
        BOOST_TEST(st.messages().at(1).content == "seeded");

        auto evts = b.sink->of_type("message_deleted");
        BOOST_TEST_REQUIRE(evts.size() == 1u);
        BOOST_TEST(str(evts[0].at("message_id")) == "m1");
    });
}

BOOST_FIXTURE_TEST_CASE(delete_for_everyone_twice, fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto [a, b] = co_await open_both();
        seed_message("m1", 1, now() - 10min);

        co_await send(a, R"({"type": "delete_message", "message_id": "m1", "delete_for_everyone": true})");
        co_await send(a, R"({"type": "delete_message", "message_id": "m1", "delete_for_everyone": true})");

        // The second request is a silent no-op
        BOOST_TEST(st.messages().at(0).content == tombstone_content);
        BOOST_TEST(b.sink->of_type("message_deleted").size() == 1u);
        BOOST_TEST(a.sink->of_type("message_deleted").size() == 1u);
        BOOST_TEST(a.sink->of_type("error").empty());
    });
}

BOOST_FIXTURE_TEST_CASE(delete_not_sender, fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto [a, b] = co_await open_both();
        seed_message("m1", 1);

        co_await send(b, R"({"type": "delete_message", "message_id": "m1", "delete_for_everyone": true})");
        co_await send(b, R"({"type": "delete_message", "message_id": "m1"})");

        BOOST_TEST(!st.messages().at(0).is_deleted);
        BOOST_TEST(!st.is_hidden("m1", 2));
        BOOST_TEST(a.sink->frames.empty());
        BOOST_TEST(b.sink->frames.empty());
    });
}

BOOST_FIXTURE_TEST_CASE(delete_for_me, fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto [a, b] = co_await open_both();

        // Even old messages can be deleted for oneself
        seed_message("m1", 1, now() - 48h);

        co_await send(a, R"({"type": "delete_message", "message_id": "m1"})");

        BOOST_TEST(st.is_hidden("m1", 1));
        BOOST_TEST(!st.messages().at(0).is_deleted);
        auto evts = b.sink->of_type("message_deleted");
        BOOST_TEST_REQUIRE(evts.size() == 1u);
        BOOST_TEST(!evts[0].at("delete_for_everyone").as_bool());
        BOOST_TEST(evts[0].at("user_id").as_int64() == 1);
    });
}

//
// Reactions
//

BOOST_FIXTURE_TEST_CASE(reaction_toggle, fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto [a, b] = co_await open_both();
        seed_message("m1", 1);

        co_await send(b, R"({"type": "reaction", "message_id": "m1", "emoji": "👍"})");
        BOOST_TEST(st.reaction_of("m1", 2).value() == "👍");

        co_await send(b, R"({"type": "reaction", "message_id": "m1", "emoji": "❤️"})");
        BOOST_TEST(st.reaction_of("m1", 2).value() == "❤️");

        co_await send(b, R"({"type": "reaction", "message_id": "m1", "emoji": "❤️"})");
        BOOST_TEST(!st.reaction_of("m1", 2).has_value());

        auto evts = a.sink->of_type("reaction");
        BOOST_TEST_REQUIRE(evts.size() == 3u);
        BOOST_TEST(str(evts[0].at("action")) == "added");
        BOOST_TEST(str(evts[1].at("action")) == "updated");
        BOOST_TEST(str(evts[2].at("action")) == "removed");
        BOOST_TEST(str(evts[2].at("emoji")) == "❤️");
        BOOST_TEST(evts[2].at("user_id").as_int64() == 2);
        BOOST_TEST(b.sink->of_type("reaction").size() == 3u);
    });
}

BOOST_FIXTURE_TEST_CASE(reaction_empty_emoji, fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto [a, b] = co_await open_both();
        seed_message("m1", 1);

        co_await send(b, R"({"type": "reaction", "message_id": "m1", "emoji": ""})");

        BOOST_TEST(!st.reaction_of("m1", 2).has_value());
        BOOST_TEST(a.sink->frames.empty());
        BOOST_TEST(b.sink->of_type("error").size() == 1u);
    });
}

//
// Malformed and unknown frames
//

BOOST_FIXTURE_TEST_CASE(malformed_and_unknown_frames, fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto [a, b] = co_await open_both();

        co_await send(a, "not json");
        co_await send(a, R"({"type": "chat_message"})");
        co_await send(a, R"({"type": "launch_rockets"})");

        // Nothing happens. The connection keeps working
        BOOST_TEST(a.sink->frames.empty());
        BOOST_TEST(b.sink->frames.empty());
        co_await send(a, R"({"type": "chat_message", "content": "still here"})");
        BOOST_TEST(b.sink->of_type("chat_message").size() == 1u);
    });
}

//
// Presence
//

BOOST_FIXTURE_TEST_CASE(online_snapshot, fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto a = co_await open(chat_endpoint("c1"), alice);

        // Bob joins and learns that alice is here
        auto b = co_await open(chat_endpoint("c1"), bob);
        auto evts = b.sink->of_type("user_status");
        bool saw_alice = false;
        for (const auto& evt : evts)
        {
            if (evt.at("user_id").as_int64() == 1)
            {
                BOOST_TEST(evt.at("is_online").as_bool());
                saw_alice = true;
            }
        }
        BOOST_TEST(saw_alice);

        // The snapshot goes only to the joining connection
        BOOST_TEST(a.sink->of_type("user_status").size() == 2u);  // alice's own + bob's
    });
}

BOOST_AUTO_TEST_SUITE_END()
