//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATRELAY_SERVER_INCLUDE_SERVICES_STORE_HPP
#define CHATRELAY_SERVER_INCLUDE_SERVICES_STORE_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "business_types.hpp"
#include "error.hpp"
#include "timestamp.hpp"

// The durable store: users, chats, participants, messages, receipts,
// reactions and calls. This is the narrow repository the messaging core
// needs, abstracting away the actual database.

namespace chatrelay {

struct mysql_config;

// Using an interface to reduce build times and improve testability
class store
{
public:
    virtual ~store() {}

    // Starts any background task the store needs (e.g. a connection pool),
    // in detached mode. Must be called once before other operations can make progress.
    virtual void start_run() = 0;

    // Cancels background tasks. To be called at shutdown
    virtual void cancel() = 0;

    //
    // Users
    //

    // Returns errc::not_found if the user doesn't exist.
    virtual boost::asio::awaitable<result<user>> get_user(std::int64_t user_id) = 0;

    // Persists the user's online flag and sets its last seen time to now
    virtual boost::asio::awaitable<error_code> set_user_online(
        std::int64_t user_id,
        bool is_online,
        timestamp_t now
    ) = 0;

    //
    // Chats and participants
    //

    // Returns errc::not_found if the chat doesn't exist.
    virtual boost::asio::awaitable<result<chat>> get_chat(std::string_view chat_id) = 0;

    // Returns false (not an error) if the chat doesn't exist
    virtual boost::asio::awaitable<result<bool>> is_participant(std::string_view chat_id, std::int64_t user_id) = 0;

    // User IDs of the chat's current participants
    virtual boost::asio::awaitable<result<std::vector<std::int64_t>>> list_participants(std::string_view chat_id
    ) = 0;

    // IDs of the chats the user participates in
    virtual boost::asio::awaitable<result<std::vector<std::string>>> list_user_chats(std::int64_t user_id) = 0;

    //
    // Messages and receipts
    //

    // Creates a message, together with a receipt in state sent for every
    // current participant of the chat except the sender. Both are written
    // atomically: either everything is persisted or nothing is.
    virtual boost::asio::awaitable<result<created_message>> create_message(const new_message& msg) = 0;

    // Returns errc::not_found if the message doesn't exist.
    virtual boost::asio::awaitable<result<message>> get_message(std::string_view message_id) = 0;

    // Returns errc::not_found if there is no receipt for the (message, user) pair
    virtual boost::asio::awaitable<result<receipt>> get_receipt(std::string_view message_id, std::int64_t user_id) = 0;

    // Advances a receipt to the given status, following the receipt state machine
    // (see delivery_state.hpp). Returns true if the receipt changed, false
    // if it already was in that state or a later one.
    // Returns errc::not_found if there is no receipt for the (message, user) pair
    virtual boost::asio::awaitable<result<bool>> update_receipt(
        std::string_view message_id,
        std::int64_t user_id,
        receipt_status status,
        timestamp_t now
    ) = 0;

    // Marks as read, in a single transaction, all receipts belonging to user_id for
    // messages in chat_id not sent by user_id that are not read yet. If up_to_message_id
    // is set, only messages created up to (and including) that message are considered.
    // Returns the IDs of the messages whose receipts changed, oldest first.
    virtual boost::asio::awaitable<result<std::vector<std::string>>> bulk_mark_read(
        std::string_view chat_id,
        std::int64_t user_id,
        std::optional<std::string_view> up_to_message_id,
        timestamp_t now
    ) = 0;

    // Irreversibly replaces the message content by tombstone_content and
    // flags it as deleted for everyone.
    virtual boost::asio::awaitable<error_code> tombstone_message(std::string_view message_id) = 0;

    // Hides the message for a single user (delete for me). Idempotent.
    virtual boost::asio::awaitable<error_code> hide_message_for_user(
        std::string_view message_id,
        std::int64_t user_id
    ) = 0;

    // Adds, replaces or removes (if emoji matches the current one) the user's reaction to a message
    virtual boost::asio::awaitable<result<reaction_action>> toggle_reaction(
        std::string_view message_id,
        std::int64_t user_id,
        std::string_view emoji
    ) = 0;

    //
    // Calls
    //

    // Creates a call in state initiated
    virtual boost::asio::awaitable<result<call_session>> create_call(
        std::int64_t caller_id,
        std::int64_t receiver_id,
        call_type type,
        timestamp_t now
    ) = 0;

    // Returns errc::not_found if the call doesn't exist.
    virtual boost::asio::awaitable<result<call_session>> get_call(std::string_view call_id) = 0;

    // Applies a transition of the call state machine (see call_state.hpp) atomically.
    // Returns the updated call, errc::invalid_call_transition if the machine
    // rejects it, or errc::not_found if the call doesn't exist.
    virtual boost::asio::awaitable<result<call_session>> update_call(
        std::string_view call_id,
        call_status status,
        timestamp_t now
    ) = 0;
};

// A store backed by MySQL, using a connection pool
std::unique_ptr<store> create_mysql_store(boost::asio::any_io_executor ex, const mysql_config& cfg);

// Generates a random UUID, formatted as a string. Used for chat, message and call IDs
std::string generate_uuid();

}  // namespace chatrelay

#endif
