//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/session_registry.hpp"

#include <cassert>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace chatrelay;

session_registry::registration session_registry::register_connection(
    std::int64_t user_id,
    std::shared_ptr<connection_sink> sink
)
{
    auto id = next_id_++;
    connections_.emplace(id, entry{user_id, std::move(sink)});

    auto& conns = user_connections_[user_id];
    conns.insert(id);
    return registration{id, conns.size() == 1u};
}

std::optional<std::int64_t> session_registry::unregister_connection(connection_id id)
{
    auto it = connections_.find(id);
    if (it == connections_.end())
        return std::nullopt;
    auto user_id = it->second.user_id;
    connections_.erase(it);

    auto user_it = user_connections_.find(user_id);
    assert(user_it != user_connections_.end());
    user_it->second.erase(id);
    if (!user_it->second.empty())
        return std::nullopt;

    // Last connection gone
    user_connections_.erase(user_it);
    return user_id;
}

bool session_registry::is_online(std::int64_t user_id) const noexcept
{
    return user_connections_.find(user_id) != user_connections_.end();
}

std::vector<connection_id> session_registry::connections_for(std::int64_t user_id) const
{
    auto it = user_connections_.find(user_id);
    if (it == user_connections_.end())
        return {};
    return std::vector<connection_id>(it->second.begin(), it->second.end());
}

connection_sink* session_registry::find(connection_id id) const noexcept
{
    auto it = connections_.find(id);
    return it == connections_.end() ? nullptr : it->second.sink.get();
}

bool session_registry::send_to(connection_id id, std::string frame)
{
    auto* sink = find(id);
    return sink && sink->deliver(std::make_shared<const std::string>(std::move(frame)));
}
