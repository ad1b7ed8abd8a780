//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATRELAY_SERVER_INCLUDE_BUSINESS_TYPES_HPP
#define CHATRELAY_SERVER_INCLUDE_BUSINESS_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "timestamp.hpp"

// This file contains business object definitions

namespace chatrelay {

// An application user
struct user
{
    // User ID
    std::int64_t id{};

    // Login name
    std::string username;

    // User-facing name, shown next to messages and typing indicators
    std::string display_name;
};

enum class chat_type
{
    personal,
    group,
    broadcast,
};

// A chat room. Participants are stored separately
struct chat
{
    // Chat ID (UUID)
    std::string id;

    chat_type type{chat_type::personal};

    // Group name. Empty for personal chats
    std::string name;
};

enum class message_type
{
    text,
    image,
    video,
    audio,
    document,
    contact,
    location,
    sticker,
    voice,
};

// The content a message gets when deleted for everyone
inline constexpr std::string_view tombstone_content = "This message was deleted";

// How long the sender has to delete a message for everyone, measured from created_at
inline constexpr std::chrono::hours delete_for_everyone_window{1};

// A chat message
struct message
{
    // Message ID (UUID)
    std::string id;

    // The chat this message belongs to
    std::string chat_id;

    // ID of the user that sent the message
    std::int64_t sender_id{};

    message_type type{message_type::text};

    // The actual content of the message. Replaced by tombstone_content
    // when the message is deleted for everyone
    std::string content;

    // UTC timestamp when the server received the message
    timestamp_t created_at;

    // ID of the message this one replies to, if any
    std::optional<std::string> reply_to;

    bool is_deleted{};
    bool deleted_for_everyone{};
};

// The data required to create a message. The store assigns the ID
struct new_message
{
    std::string_view chat_id;
    std::int64_t sender_id{};
    message_type type{message_type::text};
    std::string_view content;
    timestamp_t created_at;
    std::optional<std::string_view> reply_to;
};

// The result of creating a message: the message itself, and the users
// that got a receipt for it (every participant but the sender)
struct created_message
{
    message msg;
    std::vector<std::int64_t> recipients;
};

// Receipt states. Ordered: a receipt may only move to a greater state
enum class receipt_status
{
    sent = 0,
    delivered,
    read,
};

// Delivery and read tracking for a (message, recipient) pair
struct receipt
{
    std::string message_id;
    std::int64_t user_id{};
    receipt_status status{receipt_status::sent};
    std::optional<timestamp_t> delivered_at;
    std::optional<timestamp_t> read_at;
};

enum class reaction_action
{
    added,
    updated,
    removed,
};

enum class call_type
{
    voice,
    video,
};

enum class call_status
{
    initiated,
    ringing,
    ongoing,
    ended,
    missed,
    declined,
    failed,
};

// A one-to-one voice or video call
struct call_session
{
    // Call ID (UUID)
    std::string id;

    std::int64_t caller_id{};
    std::int64_t receiver_id{};
    call_type type{call_type::voice};
    call_status status{call_status::initiated};
    timestamp_t started_at;
    std::optional<timestamp_t> answered_at;
    std::optional<timestamp_t> ended_at;

    // Only meaningful once status is ended
    std::chrono::seconds duration{0};
};

// String conversions. These are the representations used both in
// the wire protocol and in the database
std::string_view to_string(chat_type v) noexcept;
std::string_view to_string(message_type v) noexcept;
std::string_view to_string(receipt_status v) noexcept;
std::string_view to_string(reaction_action v) noexcept;
std::string_view to_string(call_type v) noexcept;
std::string_view to_string(call_status v) noexcept;

// Parse functions. Return an empty optional for unknown strings
std::optional<chat_type> parse_chat_type(std::string_view from) noexcept;
std::optional<message_type> parse_message_type(std::string_view from) noexcept;
std::optional<receipt_status> parse_receipt_status(std::string_view from) noexcept;
std::optional<call_type> parse_call_type(std::string_view from) noexcept;
std::optional<call_status> parse_call_status(std::string_view from) noexcept;

}  // namespace chatrelay

#endif
