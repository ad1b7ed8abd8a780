//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "call_state.hpp"

#include <chrono>

#include "error.hpp"

using namespace chatrelay;

bool chatrelay::can_transition(call_status from, call_status to) noexcept
{
    switch (from)
    {
    case call_status::initiated:
        return to == call_status::ringing || to == call_status::missed || to == call_status::declined ||
               to == call_status::failed || to == call_status::ended;
    case call_status::ringing:
        return to == call_status::ongoing || to == call_status::missed || to == call_status::declined ||
               to == call_status::failed || to == call_status::ended;
    case call_status::ongoing: return to == call_status::ended;
    case call_status::ended:
    case call_status::missed:
    case call_status::declined:
    case call_status::failed:
    default: return false;
    }
}

error_code chatrelay::apply_call_transition(call_session& call, call_status to, timestamp_t now)
{
    if (!can_transition(call.status, to))
        CHATRELAY_RETURN_ERROR(errc::invalid_call_transition)

    call.status = to;
    if (to == call_status::ongoing)
    {
        call.answered_at = now;
    }
    else if (is_terminal(to))
    {
        call.ended_at = now;
        call.duration = call.answered_at
                            ? std::chrono::duration_cast<std::chrono::seconds>(now - *call.answered_at)
                            : std::chrono::seconds(0);
    }

    return error_code();
}
