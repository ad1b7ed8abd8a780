//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "util/websocket.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/stream_traits.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket/rfc6455.hpp>
#include <boost/beast/websocket/stream.hpp>

#include <memory>
#include <string>
#include <string_view>

#include "error.hpp"

namespace asio = boost::asio;
namespace beast = boost::beast;
using namespace chatrelay;

struct websocket::impl
{
    // The actual websocket
    beast::websocket::stream<beast::tcp_stream> ws;

    // The upgrade HTTP request
    websocket::upgrade_request_type upgrade_request;

    // Buffer to read data from the client
    beast::flat_buffer read_buffer;

    impl(
        asio::ip::tcp::socket&& sock,
        websocket::upgrade_request_type&& upgrade_req,
        beast::flat_buffer&& buff
    )
        : ws(std::move(sock)), upgrade_request(std::move(upgrade_req)), read_buffer(std::move(buff))
    {
    }
};

static std::string_view buffer_to_sv(asio::const_buffer buff) noexcept
{
    return std::string_view(static_cast<const char*>(buff.data()), buff.size());
}

websocket::websocket(asio::ip::tcp::socket sock, upgrade_request_type&& req, beast::flat_buffer buff)
    : impl_(new impl(std::move(sock), std::move(req), std::move(buff)))
{
}

websocket::websocket(websocket&& rhs) noexcept : impl_(std::move(rhs.impl_)) {}

websocket& websocket::operator=(websocket&& rhs) noexcept
{
    impl_ = std::move(rhs.impl_);
    return *this;
}

websocket::~websocket() {}

websocket::executor_type websocket::get_executor() noexcept { return impl_->ws.get_executor(); }

const websocket::upgrade_request_type& websocket::upgrade_request() const noexcept
{
    return impl_->upgrade_request;
}

asio::awaitable<error_code> websocket::accept()
{
    // Suggested timeouts include pings, so dead peers are detected while idle
    impl_->ws.set_option(beast::websocket::stream_base::timeout::suggested(beast::role_type::server));

    // Set a decorator to change the Server of the handshake
    impl_->ws.set_option(beast::websocket::stream_base::decorator([](beast::websocket::response_type& res) {
        res.set(beast::http::field::server, std::string(BOOST_BEAST_VERSION_STRING) + " chatrelay");
    }));

    // All our frames are JSON
    impl_->ws.text(true);

    // Accept the websocket handshake
    auto [ec] = co_await impl_->ws.async_accept(impl_->upgrade_request, asio::as_tuple);
    co_return ec;
}

asio::awaitable<result<std::string_view>> websocket::read()
{
    error_code ec;
    impl_->read_buffer.clear();
    co_await impl_->ws.async_read(impl_->read_buffer, asio::redirect_error(ec));
    if (ec)
        co_return ec;

    // Convert it to a string_view (no copy is performed)
    co_return buffer_to_sv(impl_->read_buffer.data());
}

asio::awaitable<error_code> websocket::write(std::string_view buff)
{
    error_code ec;
    co_await impl_->ws.async_write(asio::buffer(buff), asio::redirect_error(ec));
    co_return ec;
}

asio::awaitable<error_code> websocket::close(unsigned close_code)
{
    error_code ec;
    co_await impl_->ws.async_close(beast::websocket::close_reason(close_code), asio::redirect_error(ec));
    co_return ec;
}

void websocket::close_transport() noexcept { beast::get_lowest_layer(impl_->ws).close(); }
