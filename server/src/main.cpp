//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <vector>

#include "config.hpp"
#include "error.hpp"
#include "server.hpp"
#include "services/redis_client.hpp"
#include "services/store.hpp"
#include "shared_state.hpp"

namespace asio = boost::asio;
using namespace chatrelay;

static void print_usage(const char* program)
{
    std::cerr << "Usage: " << program << " <address> <port>\n"
              << "Example:\n"
              << "    " << program << " 0.0.0.0 8080\n"
              << "Environment:\n"
              << "    MYSQL_HOST, MYSQL_USERNAME, MYSQL_PASSWORD, MYSQL_DATABASE, REDIS_HOST,\n"
              << "    CHATRELAY_WRITE_TIMEOUT_MS, CHATRELAY_MAX_QUEUED_FRAMES\n";
}

static int main_impl(int argc, char* argv[])
{
    // Parse the command line and the environment
    std::vector<const char*> args(argv, argv + argc);
    auto cfg = load_config(args, std::getenv);
    if (cfg.has_error())
    {
        log_error(cfg.error(), "Loading configuration");
        print_usage(argc > 0 ? argv[0] : "chatrelay");
        return EXIT_FAILURE;
    }

    // An event loop, where the application will run. The server is single-
    // threaded, so we set the concurrency hint to 1
    asio::io_context ctx(1);

    // Singleton objects shared by all connections
    auto st = std::make_shared<shared_state>(std::move(cfg).value(), ctx.get_executor());

    // A signal_set allows us to intercept SIGINT and SIGTERM and
    // exit gracefully
    asio::signal_set signals(ctx.get_executor(), SIGINT, SIGTERM);

    // Launch the Redis connection
    st->redis().start_run();

    // Launch the MySQL connection pool
    st->get_store().start_run();

    // Start listening for websocket connections. This will run until the context is stopped
    asio::co_spawn(
        // The execution context to run the coroutine on
        ctx,

        // The actual coroutine to run, as an awaitable
        run_server(st),

        // Will run when the coroutine finishes. Propagate any exceptions thrown
        // in the coroutine to main
        [](std::exception_ptr exc) {
            if (exc)
                std::rethrow_exception(exc);
        }
    );

    // Capture SIGINT and SIGTERM to perform a clean shutdown
    signals.async_wait([st, &ctx](boost::system::error_code, int) {
        // Stop the Redis reconnection loop
        st->redis().cancel();

        // Stop the MySQL connection pool
        st->get_store().cancel();

        // Stop the io_context. This will cause run() to return
        ctx.stop();
    });

    // Run the io_context. This will block until the context is stopped by
    // a signal and all outstanding async tasks are finished.
    ctx.run();

    // (If we get here, it means we got a SIGINT or SIGTERM)
    return EXIT_SUCCESS;
}

int main(int argc, char* argv[])
{
    try
    {
        return main_impl(argc, argv);
    }
    catch (const std::exception& err)
    {
        std::cerr << "Exception in main(): " << err.what() << std::endl;
        return EXIT_FAILURE;
    }
}
