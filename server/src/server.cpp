//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "server.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/system/system_error.hpp>

#include <exception>
#include <memory>
#include <string>

#include "config.hpp"
#include "error.hpp"
#include "http_session.hpp"
#include "shared_state.hpp"

namespace asio = boost::asio;
using namespace chatrelay;

// Throws if the configured address is invalid
static asio::ip::tcp::endpoint get_listening_endpoint(const server_config& cfg)
{
    error_code ec;
    auto addr = asio::ip::make_address(cfg.ip, ec);
    if (ec)
        throw boost::system::system_error(ec, "Invalid listening address: " + cfg.ip);
    return asio::ip::tcp::endpoint(addr, cfg.port);
}

asio::awaitable<void> chatrelay::run_server(std::shared_ptr<shared_state> st)
{
    auto ex = co_await asio::this_coro::executor;
    auto listening_endpoint = get_listening_endpoint(st->config());

    asio::ip::tcp::acceptor acceptor(ex);
    acceptor.open(listening_endpoint.protocol());
    acceptor.set_option(asio::socket_base::reuse_address(true));
    acceptor.bind(listening_endpoint);
    acceptor.listen();

    // Port 0 picks an ephemeral port, so report the one we actually got
    auto local = acceptor.local_endpoint();
    log_info("Listening on " + local.address().to_string() + ":" + std::to_string(local.port()));

    // Runs until the io_context is stopped. Accept failures are fatal
    while (true)
    {
        auto sock = co_await acceptor.async_accept();

        // One coroutine per connection. An exception only ends its own session
        asio::co_spawn(ex, run_http_session(std::move(sock), st), [](std::exception_ptr exc) {
            if (exc)
                log_exception(exc, "Uncaught exception in HTTP session handler");
        });
    }
}
