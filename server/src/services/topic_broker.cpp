//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/topic_broker.hpp"

#include <boost/multi_index/indexed_by.hpp>
#include <boost/multi_index/mem_fun.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index_container.hpp>

#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "connection.hpp"
#include "services/session_registry.hpp"

using namespace chatrelay;

namespace {

class topic_broker_impl final : public topic_broker
{
    // The type of elements held by our container
    struct subscription
    {
        std::string topic;
        connection_id conn;

        std::string_view topic_sv() const noexcept { return topic; }
    };

    // We need to efficiently index our container by both topic and connection.
    // We use a Boost.MultiIndex container to maintain such indices,
    // so that both operations run in logarithmic time.
    // clang-format off
    using container_type = boost::multi_index::multi_index_container<
        subscription,
        boost::multi_index::indexed_by<
            // Index by topic
            boost::multi_index::ordered_non_unique<
                boost::multi_index::const_mem_fun<subscription, std::string_view, &subscription::topic_sv>
            >,
            // Index by connection
            boost::multi_index::ordered_non_unique<
                boost::multi_index::member<subscription, connection_id, &subscription::conn>
            >
        >
    >;
    // clang-format on

    container_type ct_;
    session_registry* registry_;

    bool is_subscribed(std::string_view topic, connection_id conn) const
    {
        auto [first, last] = ct_.get<1>().equal_range(conn);
        return std::any_of(first, last, [topic](const subscription& s) { return s.topic == topic; });
    }

public:
    topic_broker_impl(session_registry& registry) noexcept : registry_(&registry) {}

    bool subscribe(std::string_view topic, connection_id conn) override final
    {
        if (is_subscribed(topic, conn))
            return false;
        ct_.insert(subscription{std::string(topic), conn});
        return true;
    }

    void unsubscribe(std::string_view topic, connection_id conn) override final
    {
        auto& idx = ct_.get<1>();
        auto [first, last] = idx.equal_range(conn);
        for (auto it = first; it != last; ++it)
        {
            if (it->topic == topic)
            {
                idx.erase(it);
                return;
            }
        }
    }

    void unsubscribe_all(connection_id conn) override final { ct_.get<1>().erase(conn); }

    std::size_t publish(std::string_view topic, std::string event, std::optional<connection_id> exclude)
        override final
    {
        // Place the string into a shared object, to avoid making an individual
        // copy per subscriber
        auto frame = std::make_shared<const std::string>(std::move(event));

        // Deliver to all subscribers. Delivery just queues the frame,
        // so nothing here suspends and the subscriber set can't change under us.
        std::vector<connection_id> dead;
        std::size_t delivered = 0;
        auto [first, last] = ct_.equal_range(topic);
        for (auto it = first; it != last; ++it)
        {
            if (exclude && *exclude == it->conn)
                continue;
            auto* sink = registry_->find(it->conn);
            if (sink && sink->deliver(frame))
                ++delivered;
            else
                dead.push_back(it->conn);
        }

        // A connection that can't take frames is gone for every topic
        for (auto conn : dead)
            unsubscribe_all(conn);

        return delivered;
    }

    std::vector<connection_id> subscribers(std::string_view topic) const override final
    {
        std::vector<connection_id> res;
        auto [first, last] = ct_.equal_range(topic);
        for (auto it = first; it != last; ++it)
            res.push_back(it->conn);
        return res;
    }

    std::vector<std::string> topics_of(connection_id conn) const override final
    {
        std::vector<std::string> res;
        auto [first, last] = ct_.get<1>().equal_range(conn);
        for (auto it = first; it != last; ++it)
            res.push_back(it->topic);
        return res;
    }
};

}  // namespace

std::unique_ptr<topic_broker> chatrelay::create_topic_broker(session_registry& registry)
{
    return std::unique_ptr<topic_broker>{new topic_broker_impl(registry)};
}
