//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/presence_service.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/json/object.hpp>
#include <boost/test/unit_test.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>

#include "business_types.hpp"
#include "handler_fixture.hpp"
#include "test_utils.hpp"

using namespace chatrelay;
using namespace chatrelay::test;
namespace asio = boost::asio;
namespace json = boost::json;

namespace {

struct fixture : handler_fixture
{
    fixture()
    {
        st.add_chat(chat{"c1", chat_type::personal, ""}, {1, 2});
        st.add_chat(chat{"c2", chat_type::group, "Group"}, {1, 2, 3});
    }

    // Counts user_status events about user_id with the given online flag
    static std::size_t count_status(const recording_sink& sink, std::int64_t user_id, bool is_online)
    {
        std::size_t res = 0;
        for (const auto& evt : sink.of_type("user_status"))
        {
            if (evt.at("user_id").as_int64() == user_id && evt.at("is_online").as_bool() == is_online)
                ++res;
        }
        return res;
    }
};

}  // namespace

BOOST_AUTO_TEST_SUITE(presence_service_)

BOOST_FIXTURE_TEST_CASE(announce, fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto b1 = co_await open(chat_endpoint("c1"), bob);
        auto b2 = co_await open(chat_endpoint("c2"), bob);
        b1.sink->clear();
        b2.sink->clear();

        auto reg = registry.register_connection(alice.id, create_sink());
        co_await presence_service(st, registry, *broker).announce(alice.id, true);

        // Persisted, and published once per chat alice is in
        BOOST_TEST(st.online_flag(alice.id).value());
        BOOST_TEST(count_status(*b1.sink, alice.id, true) == 1u);
        BOOST_TEST(count_status(*b2.sink, alice.id, true) == 1u);

        registry.unregister_connection(reg.id);
        co_await presence_service(st, registry, *broker).announce(alice.id, false);
        BOOST_TEST(!st.online_flag(alice.id).value());
        BOOST_TEST(count_status(*b1.sink, alice.id, false) == 1u);
    });
}

BOOST_FIXTURE_TEST_CASE(announce_superseded, fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto b = co_await open(chat_endpoint("c1"), bob);
        b.sink->clear();

        // Alice has no connections, so announcing her online is stale
        co_await presence_service(st, registry, *broker).announce(alice.id, true);
        BOOST_TEST(!st.online_flag(alice.id).has_value());
        BOOST_TEST(b.sink->frames.empty());
    });
}

BOOST_FIXTURE_TEST_CASE(announce_persist_failure, fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        st.set_failing(true);
        registry.register_connection(alice.id, create_sink());

        // Failures are logged, not propagated
        co_await presence_service(st, registry, *broker).announce(alice.id, true);
        BOOST_TEST(!st.online_flag(alice.id).has_value());
    });
}

BOOST_FIXTURE_TEST_CASE(multiple_devices, fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto b = co_await open(chat_endpoint("c1"), bob);
        b.sink->clear();

        // Alice connects from several devices and endpoints. Only the first one is announced
        auto a1 = co_await open(chat_endpoint("c1"), alice);
        auto a2 = co_await open(chat_endpoint("c1"), alice);
        auto a3 = co_await open(notification_endpoint(), alice);
        BOOST_TEST(registry.is_online(alice.id));
        BOOST_TEST(st.online_flag(alice.id).value());
        BOOST_TEST(count_status(*b.sink, alice.id, true) == 1u);

        // Only the last disconnection is
        co_await close(a1);
        co_await close(a3);
        BOOST_TEST(registry.is_online(alice.id));
        BOOST_TEST(count_status(*b.sink, alice.id, false) == 0u);

        co_await close(a2);
        BOOST_TEST(!registry.is_online(alice.id));
        BOOST_TEST(!st.online_flag(alice.id).value());
        BOOST_TEST(count_status(*b.sink, alice.id, false) == 1u);
    });
}

BOOST_FIXTURE_TEST_CASE(reconnect_while_going_offline, fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto b = co_await open(chat_endpoint("c1"), bob);
        auto a1 = co_await open(chat_endpoint("c1"), alice);
        b.sink->clear();

        // Alice reconnects while her offline announcement is waiting on the store.
        // The online announcement completes first
        std::optional<test_client> a2;
        st.set_presence_hook([&](std::int64_t user_id, bool is_online) -> asio::awaitable<void> {
            if (user_id == alice.id && !is_online && !a2)
                a2 = co_await open(chat_endpoint("c1"), alice);
        });
        co_await close(a1);

        // Peers don't see her going offline, and the persisted flag matches
        BOOST_TEST_REQUIRE(a2.has_value());
        BOOST_TEST(registry.is_online(alice.id));
        BOOST_TEST(st.online_flag(alice.id).value());
        BOOST_TEST(count_status(*b.sink, alice.id, true) == 1u);
        BOOST_TEST(count_status(*b.sink, alice.id, false) == 0u);
    });
}

BOOST_FIXTURE_TEST_CASE(closed_connections_get_nothing, fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        auto a = co_await open(chat_endpoint("c1"), alice);
        auto b = co_await open(chat_endpoint("c1"), bob);
        a.sink->clear();
        b.sink->clear();

        co_await close(a);

        // Alice's own offline announcement doesn't reach the closed connection
        BOOST_TEST(a.sink->frames.empty());
        BOOST_TEST(count_status(*b.sink, alice.id, false) == 1u);
        BOOST_TEST(registry.size() == 1u);
    });
}

BOOST_FIXTURE_TEST_CASE(snapshot_on_join, fixture)
{
    run_coroutine([this]() -> asio::awaitable<void> {
        // Carol is online, but not in c1
        auto c = co_await open(notification_endpoint(), carol);
        auto a = co_await open(notification_endpoint(), alice);

        auto b = co_await open(chat_endpoint("c1"), bob);

        // Bob learns about alice only
        BOOST_TEST(count_status(*b.sink, alice.id, true) == 1u);
        BOOST_TEST(count_status(*b.sink, carol.id, true) == 0u);
    });
}

BOOST_AUTO_TEST_SUITE_END()
