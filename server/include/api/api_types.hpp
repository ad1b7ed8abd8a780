//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATRELAY_SERVER_INCLUDE_API_API_TYPES_HPP
#define CHATRELAY_SERVER_INCLUDE_API_API_TYPES_HPP

#include <boost/json/value.hpp>
#include <boost/variant2/variant.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "business_types.hpp"
#include "error.hpp"

// This file contains type definitions for websocket API objects.
// Every frame is a flat JSON object with a "type" member.
// Types for incoming events are owning, since they're used after parsing,
// and match the field names in the API.
// Types for outgoing events are non-owning and lightweight,
// since they are only used as intermediate types for serialization.

namespace chatrelay {

//
// Incoming events
//

// A well-formed event with a type we don't handle. Ignored
struct unknown_event
{
};

// Chat endpoint. Sends a new text message to the chat
struct chat_message_request
{
    std::string content;

    // ID of the message this one replies to
    std::optional<std::string> reply_to;
};

// Chat endpoint. The user started or stopped typing
struct typing_request
{
    bool is_typing{};
};

// Chat endpoint. The user read a message
struct read_receipt_request
{
    std::string message_id;
};

// Chat endpoint. A message reached one of the user's devices
struct delivered_receipt_request
{
    std::string message_id;
};

// Chat endpoint
struct delete_message_request
{
    std::string message_id;
    bool delete_for_everyone{};
};

// Chat endpoint. Adds, replaces or removes the user's reaction to a message
struct reaction_request
{
    std::string message_id;
    std::string emoji;
};

// Chat endpoint. Marks everything in the chat as read,
// optionally only up to a certain message
struct mark_chat_read_request
{
    std::optional<std::string> up_to;
};

// WebRTC signaling messages. The server relays them without interpreting them
enum class signal_kind
{
    offer,
    answer,
    ice_candidate,
};

// Call endpoint. An offer, answer or ICE candidate
struct signal_request
{
    signal_kind kind{signal_kind::offer};

    // Opaque payload. null if the client didn't send any
    boost::json::value data;
};

// Call endpoint. Requests a call status transition
struct call_status_request
{
    call_status status{call_status::initiated};
};

// Notification endpoint. Starts a call to another user
struct start_call_request
{
    std::int64_t receiver_id{};
    call_type type{call_type::voice};
};

// Variants that can represent any event that may be received from the client
// in each endpoint, or an error_code, if the client sent an invalid message.
// Events with an unrecognized type parse as unknown_event.
using chat_client_event = boost::variant2::variant<
    error_code,
    unknown_event,
    chat_message_request,
    typing_request,
    read_receipt_request,
    delivered_receipt_request,
    delete_message_request,
    reaction_request,
    mark_chat_read_request>;

using call_client_event = boost::variant2::variant<error_code, unknown_event, signal_request, call_status_request>;

using notification_client_event = boost::variant2::variant<error_code, unknown_event, start_call_request>;

// Parse a frame received from the websocket client
chat_client_event parse_chat_event(std::string_view from);
call_client_event parse_call_event(std::string_view from);
notification_client_event parse_notification_event(std::string_view from);

//
// Outgoing events
//

// A new message in a chat. Fanned out to every subscriber, sender included
struct chat_message_event
{
    const message& msg;
    const user& sender;

    std::string to_json() const;
};

// Sent to everyone but the typing connection
struct typing_indicator_event
{
    const user& who;
    bool is_typing;

    std::string to_json() const;
};

struct user_status_event
{
    std::int64_t user_id;
    bool is_online;

    std::string to_json() const;
};

struct read_receipt_event
{
    std::string_view message_id;
    std::int64_t user_id;

    std::string to_json() const;
};

struct delivered_receipt_event
{
    std::string_view message_id;
    std::int64_t user_id;

    std::string to_json() const;
};

struct message_deleted_event
{
    std::string_view message_id;

    // The user that requested the deletion
    std::int64_t user_id;

    bool delete_for_everyone;

    std::string to_json() const;
};

struct reaction_event
{
    std::string_view message_id;
    std::int64_t user_id;
    std::string_view emoji;
    reaction_action action;

    std::string to_json() const;
};

// Summarizes a bulk read: every listed message is now read by user_id
struct chat_read_event
{
    std::int64_t user_id;
    std::span<const std::string> message_ids;

    std::string to_json() const;
};

// Published to the user topic of each recipient of a new message
struct message_notification_event
{
    const message& msg;
    const user& sender;

    std::string to_json() const;
};

// Published to the user topic of the receiver of a new call
struct call_notification_event
{
    const call_session& call;
    const user& caller;

    std::string to_json() const;
};

// A relayed WebRTC signaling message
struct signal_event
{
    signal_kind kind;

    // The user that sent the signal
    std::int64_t user_id;

    const boost::json::value& data;

    std::string to_json() const;
};

struct user_left_event
{
    std::int64_t user_id;

    std::string to_json() const;
};

struct call_status_event
{
    const call_session& call;

    std::string to_json() const;
};

// Sent back to the user that requested a new call
struct call_created_event
{
    const call_session& call;

    std::string to_json() const;
};

// Used within error_event, as a way to communicate specific error conditions
// to the client.
enum class api_error_id
{
    // generic, when there is not a more specific error ID
    bad_request = 0,

    // The store couldn't persist the request. Nothing was published
    store_failure,

    // A call status transition was rejected by the call state machine
    call_conflict,
};

// Sent only to the connection whose request failed
struct error_event
{
    // The type of the request that failed
    std::string_view request;

    api_error_id error_id;

    // A human-readable explanation of the error.
    std::string_view error_message;

    std::string to_json() const;
};

}  // namespace chatrelay

#endif
