//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATRELAY_SERVER_INCLUDE_ERROR_HPP
#define CHATRELAY_SERVER_INCLUDE_ERROR_HPP

#include <boost/assert/source_location.hpp>
#include <boost/system/error_category.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/result.hpp>

#include <exception>
#include <string_view>

// Error management infrastructure. Uses Boost.System error codes and categories.
// This is consistent with Asio, Beast, MySQL and Redis.

namespace chatrelay {

using boost::system::error_code;

template <class T>
using result = boost::system::result<T>;

// Error code enum for errors originated within our application
enum class errc
{
    redis_parse_error = 1,    // Data retrieved from Redis didn't match the format we expected
    websocket_parse_error,    // Data received from the client didn't match the format we expected
    not_found,                // couldn't retrieve a certain resource, it doesn't exist
    invalid_call_transition,  // the call state machine rejected the transition
    invalid_argument,         // a request carried a value we can't act on
    requires_auth,            // the connection didn't present valid credentials
    uncaught_exception,       // a session handler threw an unexpected exception
    invalid_config,           // a configuration value is malformed
};

// The error category for errc
const boost::system::error_category& get_chatrelay_category() noexcept;

// Allows constructing error_code from errc
inline error_code make_error_code(errc v) noexcept
{
    return error_code(static_cast<int>(v), get_chatrelay_category());
}

// Logs ec to stderr
void log_error(error_code ec, std::string_view what, std::string_view diagnostics = "");

// Logs an informational message to stdout
void log_info(std::string_view what);

// Logs an exception that escaped a session, as errc::uncaught_exception
void log_exception(std::exception_ptr ptr, std::string_view what);

}  // namespace chatrelay

// Allows constructing error_code from errc
namespace boost {
namespace system {

template <>
struct is_error_code_enum<chatrelay::errc>
{
    static constexpr bool value = true;
};
}  // namespace system
}  // namespace boost

// Returns an error_code with source-code location information on it
#define CHATRELAY_RETURN_ERROR(e)                                                 \
    {                                                                             \
        static constexpr auto loc = BOOST_CURRENT_LOCATION;                       \
        return ::boost::system::error_code(::boost::system::error_code(e), &loc); \
    }

// Same, but for co_return
#define CHATRELAY_CO_RETURN_ERROR(e)                                                 \
    {                                                                                \
        static constexpr auto loc = BOOST_CURRENT_LOCATION;                          \
        co_return ::boost::system::error_code(::boost::system::error_code(e), &loc); \
    }

#endif
