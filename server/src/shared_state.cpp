//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "shared_state.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <memory>
#include <utility>

#include "config.hpp"
#include "services/auth_service.hpp"
#include "services/redis_client.hpp"
#include "services/session_registry.hpp"
#include "services/store.hpp"
#include "services/topic_broker.hpp"

using namespace chatrelay;

shared_state::shared_state(server_config cfg, boost::asio::any_io_executor ex)
    : shared_state(cfg, create_mysql_store(ex, cfg.mysql), create_redis_client(ex, cfg.redis_host))
{
}

shared_state::shared_state(server_config cfg, std::unique_ptr<store> st, std::unique_ptr<redis_client> redis)
    : impl_{
          std::move(cfg),
          std::move(st),
          std::move(redis),
          nullptr,
          std::make_unique<session_registry>(),
          nullptr,
      }
{
    // These depend on the objects above
    impl_.auth_ = std::make_unique<auth_service>(*impl_.redis_, *impl_.store_);
    impl_.broker_ = create_topic_broker(*impl_.registry_);
}

shared_state::shared_state(shared_state&& rhs) noexcept : impl_(std::move(rhs.impl_)) {}

shared_state& shared_state::operator=(shared_state&& rhs) noexcept
{
    impl_ = std::move(rhs.impl_);
    return *this;
}

shared_state::~shared_state() {}
