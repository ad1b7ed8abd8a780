//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "services/endpoint_handler.hpp"

#include <string>
#include <string_view>

#include "api/api_types.hpp"
#include "error.hpp"
#include "services/session_registry.hpp"

using namespace chatrelay;

void chatrelay::send_error(
    session_registry& registry,
    const connection& conn,
    std::string_view request,
    api_error_id id,
    std::string_view message
)
{
    registry.send_to(conn.id, error_event{request, id, message}.to_json());
}

void chatrelay::report_store_error(
    session_registry& registry,
    const connection& conn,
    std::string_view request,
    error_code ec
)
{
    if (ec == errc::not_found)
        return;
    std::string what("Store failure handling ");
    what += request;
    log_error(ec, what);
    send_error(registry, conn, request, api_error_id::store_failure, "The request could not be stored");
}
