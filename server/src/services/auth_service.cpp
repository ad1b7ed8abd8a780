//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/auth_service.hpp"

#include <boost/asio/awaitable.hpp>
#include <boost/beast/http/field.hpp>

#include <string>
#include <string_view>

#include "error.hpp"
#include "services/redis_client.hpp"
#include "services/store.hpp"
#include "util/cookie.hpp"

using namespace chatrelay;
namespace http = boost::beast::http;
namespace asio = boost::asio;

std::string chatrelay::session_key(std::string_view session_id)
{
    constexpr std::string_view prefix = "session_";

    std::string res;
    res.reserve(prefix.size() + session_id.size());
    res += prefix;
    res += session_id;
    return res;
}

asio::awaitable<result<user>> auth_service::user_from_request(const http::fields& req_headers)
{
    // Get the Cookie header from the request
    auto it = req_headers.find(http::field::cookie);
    if (it == req_headers.end())
        CHATRELAY_CO_RETURN_ERROR(errc::requires_auth)

    // Retrieve the session cookie
    auto session_id = find_cookie(it->value(), session_cookie_name);
    if (!session_id || session_id->empty())
        CHATRELAY_CO_RETURN_ERROR(errc::requires_auth)

    // Look it up in Redis
    auto user_id = co_await redis_->get_int_key(session_key(*session_id));
    if (user_id.has_error())
    {
        if (user_id.error() == errc::not_found)
            CHATRELAY_CO_RETURN_ERROR(errc::requires_auth)
        co_return user_id.error();
    }

    // A session for a user that no longer exists is not valid, either
    auto usr = co_await store_->get_user(*user_id);
    if (usr.has_error() && usr.error() == errc::not_found)
        CHATRELAY_CO_RETURN_ERROR(errc::requires_auth)
    co_return usr;
}
