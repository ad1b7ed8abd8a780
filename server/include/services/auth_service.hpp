//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATRELAY_SERVER_INCLUDE_SERVICES_AUTH_SERVICE_HPP
#define CHATRELAY_SERVER_INCLUDE_SERVICES_AUTH_SERVICE_HPP

#include <boost/asio/awaitable.hpp>
#include <boost/beast/http/fields.hpp>

#include <cstdint>
#include <string>
#include <string_view>

#include "business_types.hpp"
#include "error.hpp"

// Resolves the user behind a websocket upgrade request.
// Sessions are created by an external authentication service, which stores
// session_<session ID> => <user ID> keys in Redis. The session ID is
// transmitted by the client in the sid cookie.

namespace chatrelay {

// Forward declarations
class redis_client;
class store;

// The name of the cookie holding the session ID
inline constexpr std::string_view session_cookie_name = "sid";

// The Redis key holding the user ID for a session
std::string session_key(std::string_view session_id);

class auth_service
{
    redis_client* redis_;
    store* store_;

public:
    auth_service(redis_client& redis, store& st) noexcept : redis_(&redis), store_(&st) {}

    // Returns the authenticated user for a request.
    // Returns errc::requires_auth if the cookie is not present, or doesn't
    // match any valid session.
    boost::asio::awaitable<result<user>> user_from_request(const boost::beast::http::fields& req_headers);
};

}  // namespace chatrelay

#endif
