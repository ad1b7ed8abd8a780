//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATRELAY_SERVER_INCLUDE_DELIVERY_STATE_HPP
#define CHATRELAY_SERVER_INCLUDE_DELIVERY_STATE_HPP

#include <cstddef>
#include <cstdint>
#include <span>

#include "business_types.hpp"
#include "timestamp.hpp"

// The receipt state machine: sent -> delivered -> read.
// These are pure functions over receipt objects. Stores call them to decide
// whether a transition applies, so both store implementations share semantics.

namespace chatrelay {

// Returns true if a receipt in state from may move to state to.
// Only strictly forward transitions are allowed (sent -> read skips delivered).
constexpr bool can_advance(receipt_status from, receipt_status to) noexcept
{
    return static_cast<int>(to) > static_cast<int>(from);
}

// Returns true if the receipt hasn't been read yet
constexpr bool is_unread(const receipt& r) noexcept { return r.status != receipt_status::read; }

// Advances r to the given status, setting delivered_at and read_at if they
// were not set. A read receipt is also considered delivered, so jumping from
// sent to read stamps both. Returns false and leaves r untouched if the
// transition would not move the receipt forward.
bool advance_receipt(receipt& r, receipt_status to, timestamp_t now) noexcept;

// Marks as read every receipt in the batch that isn't read yet.
// Returns the number of receipts that changed.
std::size_t mark_batch_read(std::span<receipt* const> batch, timestamp_t now) noexcept;

}  // namespace chatrelay

#endif
