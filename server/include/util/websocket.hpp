//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATRELAY_SERVER_INCLUDE_UTIL_WEBSOCKET_HPP
#define CHATRELAY_SERVER_INCLUDE_UTIL_WEBSOCKET_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/result.hpp>

#include <memory>
#include <string_view>

namespace chatrelay {

// A wrapper around beast's websocket stream that reduces build times
// by keeping Beast instantiations in a separate .cpp file.
// At most one read and one write may be outstanding at any time.
// Sessions achieve this with a single reader and a single writer coroutine.
class websocket
{
    // pimpl idiom, to avoid including heavyweight Beast headers
    struct impl;
    std::unique_ptr<impl> impl_;

public:
    using upgrade_request_type = boost::beast::http::request<boost::beast::http::string_body>;

    // Constructors, assignments, destructor
    websocket(
        boost::asio::ip::tcp::socket sock,
        upgrade_request_type&& upgrade_request,
        boost::beast::flat_buffer buffer
    );
    websocket(const websocket&) = delete;
    websocket(websocket&&) noexcept;
    websocket& operator=(const websocket&) = delete;
    websocket& operator=(websocket&&) noexcept;
    ~websocket();

    using executor_type = boost::asio::any_io_executor;
    executor_type get_executor() noexcept;

    // Returns the upgrade HTTP request
    const upgrade_request_type& upgrade_request() const noexcept;

    // Runs the websocket handshake. Must be called before any other operation
    boost::asio::awaitable<boost::system::error_code> accept();

    // Reads a message from the client. The returned view is valid until the next
    // read is performed.
    boost::asio::awaitable<boost::system::result<std::string_view>> read();

    // Writes a text message to the client. Supports per-operation cancellation,
    // so it can be bounded with asio::cancel_after.
    boost::asio::awaitable<boost::system::error_code> write(std::string_view buff);

    // Performs the closing handshake, sending close_code to the client.
    boost::asio::awaitable<boost::system::error_code> close(unsigned close_code);

    // Closes the underlying TCP connection without a closing handshake.
    // Outstanding reads and writes fail. Used to drop broken or slow clients.
    void close_transport() noexcept;
};

}  // namespace chatrelay

#endif
