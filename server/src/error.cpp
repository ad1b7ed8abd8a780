//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "error.hpp"

#include <boost/asio/error.hpp>
#include <boost/describe/enum.hpp>
#include <boost/describe/enum_to_string.hpp>

#include <exception>
#include <iostream>
#include <string_view>

namespace chatrelay {

// Adds Boost.Describe metadata to errc. Required for describe::enum_to_string
BOOST_DESCRIBE_ENUM(
    errc,
    redis_parse_error,
    websocket_parse_error,
    not_found,
    invalid_call_transition,
    invalid_argument,
    requires_auth,
    uncaught_exception,
    invalid_config
)

}  // namespace chatrelay

namespace {

static const char* to_string(chatrelay::errc v) noexcept
{
    return boost::describe::enum_to_string(v, "<unknown chatrelay error>");
}

// Custom category for chatrelay::errc. Exposed by get_chatrelay_category
class chatrelay_category final : public boost::system::error_category
{
public:
    const char* name() const noexcept final override { return "chatrelay"; }
    std::string message(int ev) const final override { return to_string(static_cast<chatrelay::errc>(ev)); }
};

static chatrelay_category cat;

}  // namespace

const boost::system::error_category& chatrelay::get_chatrelay_category() noexcept { return cat; }

void chatrelay::log_error(error_code ec, std::string_view what, std::string_view diagnostics)
{
    // Don't report on canceled operations
    if (ec == boost::asio::error::operation_aborted)
        return;

    std::cerr << what << ": " << ec << ": " << ec.message();
    if (ec.has_location())
        std::cerr << " (" << ec.location() << ")";
    if (!diagnostics.empty())
        std::cerr << "\nDiagnostics: " << diagnostics;
    std::cerr << '\n';
}

void chatrelay::log_info(std::string_view what) { std::cout << what << std::endl; }

void chatrelay::log_exception(std::exception_ptr ptr, std::string_view what)
{
    try
    {
        // Rethrowing is the only way to access the underlying exception object
        std::rethrow_exception(ptr);
    }
    catch (const std::exception& exc)
    {
        log_error(errc::uncaught_exception, what, exc.what());
    }
}
