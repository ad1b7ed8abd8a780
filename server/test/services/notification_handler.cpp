//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/notification_handler.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/json/value.hpp>
#include <boost/test/unit_test.hpp>

#include <string>

#include "business_types.hpp"
#include "handler_fixture.hpp"
#include "test_utils.hpp"

using namespace chatrelay;
using namespace chatrelay::test;
namespace asio = boost::asio;
namespace json = boost::json;

namespace {

std::string str(const json::value& v) { return std::string(v.as_string()); }

}  // namespace

BOOST_AUTO_TEST_SUITE(notification_handler_)

BOOST_FIXTURE_TEST_CASE(start_call_receiver_online, handler_fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto a = co_await open(notification_endpoint(), alice);
        auto b = co_await open(notification_endpoint(), bob);

        co_await send(a, R"({"type": "start_call", "receiver_id": 2, "call_type": "video"})");

        // The caller learns the call ID
        BOOST_TEST_REQUIRE(a.sink->frames.size() == 1u);
        auto created = a.sink->objects()[0];
        BOOST_TEST(str(created.at("type")) == "call_created");
        BOOST_TEST(str(created.at("status")) == "ringing");
        auto call_id = str(created.at("call_id"));

        // The call is persisted, ringing because bob is online
        auto call = st.find_call(call_id);
        BOOST_TEST_REQUIRE(call.has_value());
        BOOST_TEST(call->caller_id == 1);
        BOOST_TEST(call->receiver_id == 2);
        BOOST_TEST((call->type == call_type::video));
        BOOST_TEST((call->status == call_status::ringing));

        // The receiver gets the notification
        BOOST_TEST_REQUIRE(b.sink->frames.size() == 1u);
        auto evt = b.sink->objects()[0];
        BOOST_TEST(str(evt.at("type")) == "notification");
        const auto& n = evt.at("notification").as_object();
        BOOST_TEST(str(n.at("kind")) == "call");
        BOOST_TEST(str(n.at("call_id")) == call_id);
        BOOST_TEST(n.at("caller_id").as_int64() == 1);
        BOOST_TEST(str(n.at("caller_name")) == "Alice");
        BOOST_TEST(str(n.at("call_type")) == "video");
    });
}

BOOST_FIXTURE_TEST_CASE(start_call_receiver_offline, handler_fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto a = co_await open(notification_endpoint(), alice);

        co_await send(a, R"({"type": "start_call", "receiver_id": 2, "call_type": "voice"})");

        BOOST_TEST_REQUIRE(a.sink->frames.size() == 1u);
        auto created = a.sink->objects()[0];
        BOOST_TEST(str(created.at("status")) == "initiated");
        auto call = st.find_call(str(created.at("call_id")));
        BOOST_TEST_REQUIRE(call.has_value());
        BOOST_TEST((call->status == call_status::initiated));
        BOOST_TEST((call->type == call_type::voice));
    });
}

BOOST_FIXTURE_TEST_CASE(start_call_self, handler_fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto a = co_await open(notification_endpoint(), alice);

        co_await send(a, R"({"type": "start_call", "receiver_id": 1, "call_type": "voice"})");

        BOOST_TEST_REQUIRE(a.sink->frames.size() == 1u);
        auto evt = a.sink->objects()[0];
        BOOST_TEST(str(evt.at("type")) == "error");
        BOOST_TEST(str(evt.at("error")) == "BAD_REQUEST");
        BOOST_TEST(str(evt.at("request")) == "start_call");
    });
}

BOOST_FIXTURE_TEST_CASE(start_call_unknown_receiver, handler_fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto a = co_await open(notification_endpoint(), alice);

        co_await send(a, R"({"type": "start_call", "receiver_id": 42, "call_type": "voice"})");

        BOOST_TEST_REQUIRE(a.sink->frames.size() == 1u);
        BOOST_TEST(str(a.sink->objects()[0].at("error")) == "BAD_REQUEST");
    });
}

BOOST_FIXTURE_TEST_CASE(start_call_store_failure, handler_fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto a = co_await open(notification_endpoint(), alice);
        auto b = co_await open(notification_endpoint(), bob);

        st.set_failing(true);
        co_await send(a, R"({"type": "start_call", "receiver_id": 2, "call_type": "voice"})");
        st.set_failing(false);

        BOOST_TEST_REQUIRE(a.sink->frames.size() == 1u);
        BOOST_TEST(str(a.sink->objects()[0].at("error")) == "STORE_FAILURE");
        BOOST_TEST(b.sink->frames.empty());
    });
}

BOOST_FIXTURE_TEST_CASE(notifications_per_user, handler_fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        // Every device gets notified. Other users don't
        auto b1 = co_await open(notification_endpoint(), bob);
        auto b2 = co_await open(notification_endpoint(), bob);
        auto c = co_await open(notification_endpoint(), carol);
        auto a = co_await open(notification_endpoint(), alice);

        co_await send(a, R"({"type": "start_call", "receiver_id": 2, "call_type": "voice"})");

        BOOST_TEST(b1.sink->of_type("notification").size() == 1u);
        BOOST_TEST(b2.sink->of_type("notification").size() == 1u);
        BOOST_TEST(c.sink->frames.empty());
    });
}

BOOST_FIXTURE_TEST_CASE(malformed_frames, handler_fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto a = co_await open(notification_endpoint(), alice);

        co_await send(a, "{");
        co_await send(a, R"({"type": "start_call", "call_type": "voice"})");
        co_await send(a, R"({"type": "start_call", "receiver_id": 2, "call_type": "hologram"})");
        co_await send(a, R"({"type": "subscribe"})");

        BOOST_TEST(a.sink->frames.empty());
    });
}

BOOST_AUTO_TEST_SUITE_END()
