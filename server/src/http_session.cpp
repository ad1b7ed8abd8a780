//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "http_session.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/message_generator.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket/rfc6455.hpp>

#include <chrono>
#include <exception>
#include <optional>
#include <string_view>
#include <utility>

#include "api/routes.hpp"
#include "api/websocket_session.hpp"
#include "error.hpp"
#include "shared_state.hpp"
#include "util/websocket.hpp"

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace asio = boost::asio;
using namespace chatrelay;

namespace {

using request_type = http::request<http::string_body>;

http::message_generator text_response(const request_type& req, http::status status, std::string_view body)
{
    http::response<http::string_body> res{status, req.version()};
    res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    res.set(http::field::content_type, "text/plain");
    res.keep_alive(req.keep_alive());
    res.body() = body;
    res.prepare_payload();
    return res;
}

// We only serve websockets. Known paths requested without
// an upgrade are bad requests. Anything else doesn't exist
http::message_generator handle_http_request(const request_type& req)
{
    if (match_route(req.target()).has_value())
        return text_response(req, http::status::bad_request, "This endpoint requires a websocket upgrade");
    return text_response(req, http::status::not_found, "The requested resource was not found");
}

}  // namespace

asio::awaitable<void> chatrelay::run_http_session(
    boost::asio::ip::tcp::socket&& socket,
    std::shared_ptr<shared_state> state
)
{
    error_code ec;

    // A buffer to read incoming client requests
    beast::flat_buffer buff;

    // A stream allows us to set quality-of-service parameters for the connection,
    // like timeouts.
    beast::tcp_stream stream(std::move(socket));

    while (true)
    {
        // Construct a new parser for each message
        http::request_parser<http::string_body> parser;

        // Upgrade requests have no body, and we serve nothing else.
        // Keep the limit low to prevent abuse
        parser.body_limit(10000);

        // Set the timeout.
        stream.expires_after(std::chrono::seconds(30));

        // Read a request
        co_await http::async_read(stream, buff, parser, asio::redirect_error(ec));

        if (ec == http::error::end_of_stream)
        {
            // This means they closed the connection
            stream.socket().shutdown(asio::ip::tcp::socket::shutdown_send, ec);
            co_return;
        }
        else if (ec)
        {
            // An unknown error happened
            co_return log_error(ec, "read");
        }

        // See if it is a WebSocket Upgrade to one of our endpoints
        if (beast::websocket::is_upgrade(parser.get()))
        {
            auto r = match_route(parser.get().target());
            if (r.has_value())
            {
                // The websocket manages its own timeouts
                stream.expires_never();

                // Create a websocket, transferring ownership of the socket
                // and the buffer (we're not using them again here)
                websocket ws(stream.release_socket(), parser.release(), std::move(buff));

                // Perform the session handshake
                ec = co_await ws.accept();
                if (ec)
                {
                    log_error(ec, "websocket accept");
                    co_return;
                }

                // Run the websocket session. This will run until the client
                // closes the connection or an error occurs.
                // We don't use exceptions to communicate regular failures, but an
                // unhandled exception in a websocket session shoudn't crash the server.
                try
                {
                    co_await run_websocket_session(std::move(ws), *r, state);
                }
                catch (const std::exception& err)
                {
                    log_error(
                        errc::uncaught_exception,
                        "Uncaught exception while running websocket session",
                        err.what()
                    );
                }
                co_return;
            }
        }

        // It's a regular HTTP request, or an upgrade to an unknown path.
        // Attempt to serve it and generate a response
        http::message_generator msg = handle_http_request(parser.get());

        // Determine if we should close the connection
        bool keep_alive = msg.keep_alive();

        // Send the response
        co_await beast::async_write(stream, std::move(msg), asio::redirect_error(ec));
        if (ec)
        {
            log_error(ec, "write");
            co_return;
        }

        // This means we should close the connection, usually because
        // the response indicated the "Connection: close" semantic.
        if (!keep_alive)
        {
            stream.socket().shutdown(asio::ip::tcp::socket::shutdown_send, ec);
            co_return;
        }
    }
}
