//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATRELAY_SERVER_INCLUDE_CALL_STATE_HPP
#define CHATRELAY_SERVER_INCLUDE_CALL_STATE_HPP

#include "business_types.hpp"
#include "error.hpp"
#include "timestamp.hpp"

// The call state machine:
//
//   initiated -> ringing -> ongoing -> ended
//   initiated, ringing -> missed | declined | failed | ended
//
// ended, missed, declined and failed are terminal.

namespace chatrelay {

constexpr bool is_terminal(call_status s) noexcept
{
    return s == call_status::ended || s == call_status::missed || s == call_status::declined ||
           s == call_status::failed;
}

// Returns true if the machine accepts moving from one state to the other
bool can_transition(call_status from, call_status to) noexcept;

// Applies a transition to call, stamping answered_at when the call is answered
// (ongoing) and ended_at and duration when it ends. Returns
// errc::invalid_call_transition and leaves call untouched if the transition
// is not allowed.
error_code apply_call_transition(call_session& call, call_status to, timestamp_t now);

}  // namespace chatrelay

#endif
