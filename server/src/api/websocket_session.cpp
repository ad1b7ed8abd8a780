//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "api/websocket_session.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/cancel_after.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/experimental/channel.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/beast/websocket/error.hpp>
#include <boost/beast/websocket/rfc6455.hpp>

#include <exception>
#include <memory>
#include <utility>

#include "connection.hpp"
#include "error.hpp"
#include "services/auth_service.hpp"
#include "services/call_handler.hpp"
#include "services/chat_handler.hpp"
#include "services/endpoint_handler.hpp"
#include "services/notification_handler.hpp"
#include "services/presence_service.hpp"
#include "shared_state.hpp"
#include "util/websocket.hpp"

using namespace chatrelay;
namespace asio = boost::asio;

namespace {

// Errors that are just the client going away
bool is_disconnect(error_code ec) noexcept
{
    return ec == boost::beast::websocket::error::closed || ec == asio::error::operation_aborted ||
           ec == asio::error::eof || ec == asio::error::connection_reset;
}

// Each websocket session is a connection sink. Frames are queued in a bounded
// channel and written in order by a dedicated writer coroutine, so that
// publishers never wait for the network.
class websocket_session final : public connection_sink, public std::enable_shared_from_this<websocket_session>
{
    using channel_type = asio::experimental::channel<void(error_code, frame_ptr)>;

    websocket ws_;
    std::unique_ptr<endpoint_handler> handler_;
    std::shared_ptr<shared_state> st_;
    channel_type outbox_;

    // Set once the connection can't take more frames
    bool broken_{false};

    void mark_broken() noexcept
    {
        if (!broken_)
        {
            broken_ = true;
            outbox_.close();

            // Makes the reader fail, so the session terminates
            ws_.close_transport();
        }
    }

    // Drains the outbox, one frame at a time
    static asio::awaitable<void> write_loop(std::shared_ptr<websocket_session> self)
    {
        auto ex = co_await asio::this_coro::executor;
        const auto timeout = self->st_->config().write_timeout;

        while (true)
        {
            auto [ec, frame] = co_await self->outbox_.async_receive(asio::as_tuple);
            if (ec)
                co_return;  // The session finished

            // Bound the write time. A client that doesn't read won't block us forever
            error_code write_ec;
            co_await asio::co_spawn(
                ex,
                [&self, &frame, &write_ec]() -> asio::awaitable<void> {
                    write_ec = co_await self->ws_.write(*frame);
                },
                asio::cancel_after(timeout)
            );

            if (write_ec)
            {
                if (!self->broken_)
                {
                    if (write_ec == asio::error::operation_aborted)
                        log_info("Websocket write timed out, dropping the connection");
                    else if (!is_disconnect(write_ec))
                        log_error(write_ec, "Writing to websocket");
                }
                self->mark_broken();
                co_return;
            }
        }
    }

    // Reads frames and dispatches them to the handler until the connection ends
    asio::awaitable<error_code> read_loop(const connection& conn)
    {
        while (true)
        {
            auto raw_msg = co_await ws_.read();
            if (raw_msg.has_error())
                co_return raw_msg.error();

            co_await handler_->on_frame(conn, raw_msg.value());
        }
    }

public:
    websocket_session(websocket socket, std::unique_ptr<endpoint_handler> handler, std::shared_ptr<shared_state> state)
        : ws_(std::move(socket)),
          handler_(std::move(handler)),
          st_(std::move(state)),
          outbox_(ws_.get_executor(), st_->config().max_queued_frames)
    {
    }

    // connection_sink
    bool deliver(frame_ptr frame) override final
    {
        if (broken_ || !outbox_.is_open())
            return false;
        if (!outbox_.try_send(error_code(), std::move(frame)))
        {
            // The client is not keeping up with the events it should receive
            log_info("Websocket outbox full, dropping the connection");
            mark_broken();
            return false;
        }
        return true;
    }

    // Runs the session until completion
    asio::awaitable<void> run()
    {
        // Check that the user is authenticated. If it's not, close the websocket.
        // This is preferred to failing the upgrade, since the client
        // doesn't have access to upgrade failure information.
        auto user_result = co_await st_->auth().user_from_request(ws_.upgrade_request());
        if (user_result.has_error())
        {
            log_error(user_result.error(), "Websocket authentication failed");
            co_await ws_.close(boost::beast::websocket::policy_error);  // Ignore the result
            co_return;
        }

        // Check that the user may access this endpoint
        auto authorized = co_await handler_->authorize(*user_result);
        if (authorized.has_error())
        {
            log_error(authorized.error(), "Websocket authorization failed");
            co_await ws_.close(boost::beast::websocket::internal_error);  // Ignore the result
            co_return;
        }
        if (!*authorized)
        {
            co_await ws_.close(boost::beast::websocket::policy_error);  // Ignore the result
            co_return;
        }

        // Start writing queued frames
        asio::co_spawn(co_await asio::this_coro::executor, write_loop(shared_from_this()), [](std::exception_ptr exc) {
            if (exc)
                log_exception(exc, "Uncaught exception in websocket writer");
        });

        // We're now live. Registering the connection makes it visible to other sessions
        session_lifecycle lifecycle(st_->get_store(), st_->registry(), st_->broker());
        auto conn = co_await lifecycle.open(*handler_, *user_result, shared_from_this());

        // Read until the connection ends. Cleanup must happen even if
        // a handler throws, and co_await is not allowed in catch blocks
        error_code ec;
        std::exception_ptr exc;
        try
        {
            ec = co_await read_loop(conn);
        }
        catch (const std::exception&)
        {
            exc = std::current_exception();
        }

        // No more frames will be written
        outbox_.close();
        co_await lifecycle.close(*handler_, conn);

        if (exc)
            std::rethrow_exception(exc);
        if (ec && !is_disconnect(ec) && !broken_)
            log_error(ec, "Reading from websocket");
    }
};

}  // namespace

std::unique_ptr<endpoint_handler> chatrelay::create_endpoint_handler(const route& r, shared_state& st)
{
    switch (r.kind)
    {
    case endpoint_kind::chat:
        return std::make_unique<chat_handler>(r.resource_id, st.get_store(), st.registry(), st.broker());
    case endpoint_kind::call:
        return std::make_unique<call_handler>(r.resource_id, st.get_store(), st.registry(), st.broker());
    case endpoint_kind::notifications:
    default: return std::make_unique<notification_handler>(st.get_store(), st.registry(), st.broker());
    }
}

asio::awaitable<void> chatrelay::run_websocket_session(
    websocket ws,
    const route& r,
    std::shared_ptr<shared_state> state
)
{
    auto handler = create_endpoint_handler(r, *state);
    auto sess = std::make_shared<websocket_session>(std::move(ws), std::move(handler), std::move(state));
    co_await sess->run();
}
