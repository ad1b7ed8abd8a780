//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/redis_client.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/redis/config.hpp>
#include <boost/redis/connection.hpp>
#include <boost/redis/request.hpp>
#include <boost/redis/response.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "error.hpp"

using namespace chatrelay;
namespace asio = boost::asio;
namespace redis = boost::redis;

namespace {

class redis_client_impl final : public redis_client
{
    redis::connection conn_;
    std::string host_;

public:
    redis_client_impl(asio::any_io_executor ex, std::string host) : conn_(std::move(ex)), host_(std::move(host))
    {
    }

    void start_run() override final
    {
        redis::config cfg;
        cfg.addr.host = host_;
        cfg.health_check_interval = std::chrono::seconds::zero();  // Disable health checks for now
        conn_.async_run(cfg, {}, asio::detached);
    }

    void cancel() override final { conn_.cancel(); }

    asio::awaitable<result<std::int64_t>> get_int_key(std::string_view key) override final
    {
        // Compose the request
        redis::request req;
        req.push("GET", key);

        // Execute it
        redis::response<std::optional<std::int64_t>> res;
        error_code ec;
        co_await conn_.async_exec(req, res, asio::redirect_error(ec));
        if (ec)
        {
            log_error(ec, "Redis GET");
            co_return ec;
        }

        // Check for errors. A value that is not an integer ends up here, too
        auto& value = std::get<0>(res);
        if (value.has_error())
        {
            log_error(errc::redis_parse_error, "Redis GET", value.error().diagnostic);
            CHATRELAY_CO_RETURN_ERROR(errc::redis_parse_error)
        }

        // Check whether the key was present
        if (!value.value().has_value())
            CHATRELAY_CO_RETURN_ERROR(errc::not_found)
        co_return *value.value();
    }
};

}  // namespace

std::unique_ptr<redis_client> chatrelay::create_redis_client(asio::any_io_executor ex, std::string host)
{
    return std::unique_ptr<redis_client>{new redis_client_impl(std::move(ex), std::move(host))};
}
