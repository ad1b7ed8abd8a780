//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "delivery_state.hpp"

#include <span>

using namespace chatrelay;

bool chatrelay::advance_receipt(receipt& r, receipt_status to, timestamp_t now) noexcept
{
    if (!can_advance(r.status, to))
        return false;

    r.status = to;

    // Timestamps are set only once, the first time we enter each state
    if (!r.delivered_at)
        r.delivered_at = now;
    if (to == receipt_status::read && !r.read_at)
        r.read_at = now;

    return true;
}

std::size_t chatrelay::mark_batch_read(std::span<receipt* const> batch, timestamp_t now) noexcept
{
    std::size_t res = 0;
    for (receipt* r : batch)
    {
        if (advance_receipt(*r, receipt_status::read, now))
            ++res;
    }
    return res;
}
