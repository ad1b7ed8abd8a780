//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/mysql/any_address.hpp>
#include <boost/mysql/any_connection.hpp>
#include <boost/mysql/connection_pool.hpp>
#include <boost/mysql/diagnostics.hpp>
#include <boost/mysql/pool_params.hpp>
#include <boost/mysql/results.hpp>
#include <boost/mysql/static_results.hpp>
#include <boost/mysql/with_params.hpp>

#include <cstdint>
#include <exception>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

#include "business_types.hpp"
#include "business_types_metadata.hpp"  // Required by static_results
#include "call_state.hpp"
#include "config.hpp"
#include "delivery_state.hpp"
#include "error.hpp"
#include "services/store.hpp"
#include "timestamp.hpp"

using namespace chatrelay;
namespace mysql = boost::mysql;
namespace asio = boost::asio;

namespace {

// Extracts the diagnostic string from a diagnostics object
std::string get_message(const mysql::diagnostics& diag)
{
    return diag.client_message().empty() ? diag.server_message() : diag.client_message();
}

mysql::pool_params get_pool_params(const mysql_config& cfg)
{
    return {
        .server_address = mysql::host_and_port{cfg.host},
        .username = cfg.username,
        .password = cfg.password,
        .database = cfg.database,
    };
}

//
// Row types. Timestamps are stored as milliseconds since the epoch.
// Enums are stored as their string representation.
//

// id, chat_id, sender_id, type, content, created_at, reply_to, is_deleted, deleted_for_everyone
using message_row = std::tuple<
    std::string,
    std::string,
    std::int64_t,
    std::string,
    std::string,
    std::int64_t,
    std::optional<std::string>,
    bool,
    bool>;

// message_id, user_id, status, delivered_at, read_at
using receipt_row = std::tuple<
    std::string,
    std::int64_t,
    std::string,
    std::optional<std::int64_t>,
    std::optional<std::int64_t>>;

// id, caller_id, receiver_id, type, status, started_at, answered_at, ended_at, duration
using call_row = std::tuple<
    std::string,
    std::int64_t,
    std::int64_t,
    std::string,
    std::string,
    std::int64_t,
    std::optional<std::int64_t>,
    std::optional<std::int64_t>,
    std::int64_t>;

std::optional<timestamp_t> to_timestamp(std::optional<std::int64_t> from)
{
    return from ? std::optional<timestamp_t>(parse_timestamp(*from)) : std::nullopt;
}

std::optional<std::int64_t> to_column(std::optional<timestamp_t> from)
{
    return from ? std::optional<std::int64_t>(serialize_timestamp(*from)) : std::nullopt;
}

result<message> to_message(message_row&& row)
{
    auto type = parse_message_type(std::get<3>(row));
    if (!type)
        CHATRELAY_RETURN_ERROR(errc::invalid_argument)
    return message{
        .id = std::move(std::get<0>(row)),
        .chat_id = std::move(std::get<1>(row)),
        .sender_id = std::get<2>(row),
        .type = *type,
        .content = std::move(std::get<4>(row)),
        .created_at = parse_timestamp(std::get<5>(row)),
        .reply_to = std::move(std::get<6>(row)),
        .is_deleted = std::get<7>(row),
        .deleted_for_everyone = std::get<8>(row),
    };
}

result<receipt> to_receipt(receipt_row&& row)
{
    auto status = parse_receipt_status(std::get<2>(row));
    if (!status)
        CHATRELAY_RETURN_ERROR(errc::invalid_argument)
    return receipt{
        .message_id = std::move(std::get<0>(row)),
        .user_id = std::get<1>(row),
        .status = *status,
        .delivered_at = to_timestamp(std::get<3>(row)),
        .read_at = to_timestamp(std::get<4>(row)),
    };
}

result<call_session> to_call(call_row&& row)
{
    auto type = parse_call_type(std::get<3>(row));
    auto status = parse_call_status(std::get<4>(row));
    if (!type || !status)
        CHATRELAY_RETURN_ERROR(errc::invalid_argument)
    return call_session{
        .id = std::move(std::get<0>(row)),
        .caller_id = std::get<1>(row),
        .receiver_id = std::get<2>(row),
        .type = *type,
        .status = *status,
        .started_at = parse_timestamp(std::get<5>(row)),
        .answered_at = to_timestamp(std::get<6>(row)),
        .ended_at = to_timestamp(std::get<7>(row)),
        .duration = std::chrono::seconds(std::get<8>(row)),
    };
}

// Runs a query, logging failures together with the server diagnostics
template <class Query, class Results>
asio::awaitable<error_code> execute(
    mysql::pooled_connection& conn,
    Query query,
    Results& res,
    std::string_view operation
)
{
    mysql::diagnostics diag;
    error_code ec;
    co_await conn->async_execute(std::move(query), res, diag, asio::redirect_error(ec));
    if (ec)
        log_error(ec, operation, get_message(diag));
    co_return ec;
}

// Convenience overload for statements that don't return rows (transaction control, DML)
asio::awaitable<error_code> execute(mysql::pooled_connection& conn, std::string_view query)
{
    mysql::results res;
    co_return co_await execute(conn, query, res, query);
}

// Transactions are opened with START TRANSACTION and finished with COMMIT.
// A connection returned to the pool without committing is reset by the pool,
// which rolls back any open transaction. Early returns on errors rely on this.
class mysql_store_impl final : public store
{
    mysql::connection_pool pool_;

    asio::awaitable<result<mysql::pooled_connection>> get_connection()
    {
        mysql::diagnostics diag;
        error_code ec;
        mysql::pooled_connection conn = co_await pool_.async_get_connection(diag, asio::redirect_error(ec));
        if (ec)
        {
            log_error(ec, "Getting a MySQL connection", get_message(diag));
            co_return ec;
        }
        co_return std::move(conn);
    }

public:
    mysql_store_impl(asio::any_io_executor ex, const mysql_config& cfg)
        : pool_(std::move(ex), get_pool_params(cfg))
    {
    }

    void start_run() override final
    {
        asio::co_spawn(
            pool_.get_executor(),
            [pool = &pool_]() { return pool->async_run(asio::use_awaitable); },
            [](std::exception_ptr exc) {
                if (exc)
                    std::rethrow_exception(exc);
            }
        );
    }

    void cancel() override final { pool_.cancel(); }

    asio::awaitable<result<user>> get_user(std::int64_t user_id) override final
    {
        auto conn = co_await get_connection();
        if (conn.has_error())
            co_return conn.error();

        // static_results requires that SQL field names
        // match with C++ struct field names
        mysql::static_results<user> res;
        auto ec = co_await execute(
            *conn,
            mysql::with_params("SELECT id, username, display_name FROM users WHERE id = {}", user_id),
            res,
            "Retrieving a user"
        );
        if (ec)
            co_return ec;

        // We didn't modify the session state, so no reset is required
        conn->return_without_reset();

        if (res.rows().empty())
            CHATRELAY_CO_RETURN_ERROR(errc::not_found)
        co_return std::move(res.rows()[0]);
    }

    asio::awaitable<error_code> set_user_online(std::int64_t user_id, bool is_online, timestamp_t now)
        override final
    {
        auto conn = co_await get_connection();
        if (conn.has_error())
            co_return conn.error();

        mysql::results res;
        co_return co_await execute(
            *conn,
            mysql::with_params(
                "UPDATE users SET is_online = {}, last_seen = {} WHERE id = {}",
                is_online,
                serialize_timestamp(now),
                user_id
            ),
            res,
            "Updating a user's online status"
        );
    }

    asio::awaitable<result<chat>> get_chat(std::string_view chat_id) override final
    {
        auto conn = co_await get_connection();
        if (conn.has_error())
            co_return conn.error();

        mysql::static_results<std::tuple<std::string, std::string, std::optional<std::string>>> res;
        auto ec = co_await execute(
            *conn,
            mysql::with_params("SELECT id, type, name FROM chats WHERE id = {}", chat_id),
            res,
            "Retrieving a chat"
        );
        if (ec)
            co_return ec;
        conn->return_without_reset();

        if (res.rows().empty())
            CHATRELAY_CO_RETURN_ERROR(errc::not_found)
        auto& row = res.rows()[0];
        auto type = parse_chat_type(std::get<1>(row));
        if (!type)
            CHATRELAY_CO_RETURN_ERROR(errc::invalid_argument)
        co_return chat{
            .id = std::move(std::get<0>(row)),
            .type = *type,
            .name = std::get<2>(row).value_or(""),
        };
    }

    asio::awaitable<result<bool>> is_participant(std::string_view chat_id, std::int64_t user_id) override final
    {
        auto conn = co_await get_connection();
        if (conn.has_error())
            co_return conn.error();

        mysql::static_results<std::tuple<std::int64_t>> res;
        auto ec = co_await execute(
            *conn,
            mysql::with_params(
                "SELECT user_id FROM chat_participants WHERE chat_id = {} AND user_id = {}",
                chat_id,
                user_id
            ),
            res,
            "Checking chat membership"
        );
        if (ec)
            co_return ec;
        conn->return_without_reset();
        co_return !res.rows().empty();
    }

    asio::awaitable<result<std::vector<std::int64_t>>> list_participants(std::string_view chat_id
    ) override final
    {
        auto conn = co_await get_connection();
        if (conn.has_error())
            co_return conn.error();

        mysql::static_results<std::tuple<std::int64_t>> res;
        auto ec = co_await execute(
            *conn,
            mysql::with_params(
                "SELECT user_id FROM chat_participants WHERE chat_id = {} ORDER BY user_id",
                chat_id
            ),
            res,
            "Listing chat participants"
        );
        if (ec)
            co_return ec;
        conn->return_without_reset();

        std::vector<std::int64_t> ids;
        ids.reserve(res.rows().size());
        for (const auto& row : res.rows())
            ids.push_back(std::get<0>(row));
        co_return ids;
    }

    asio::awaitable<result<std::vector<std::string>>> list_user_chats(std::int64_t user_id) override final
    {
        auto conn = co_await get_connection();
        if (conn.has_error())
            co_return conn.error();

        mysql::static_results<std::tuple<std::string>> res;
        auto ec = co_await execute(
            *conn,
            mysql::with_params("SELECT chat_id FROM chat_participants WHERE user_id = {}", user_id),
            res,
            "Listing a user's chats"
        );
        if (ec)
            co_return ec;
        conn->return_without_reset();

        std::vector<std::string> ids;
        ids.reserve(res.rows().size());
        for (auto& row : res.rows())
            ids.push_back(std::move(std::get<0>(row)));
        co_return ids;
    }

    asio::awaitable<result<created_message>> create_message(const new_message& msg) override final
    {
        auto conn = co_await get_connection();
        if (conn.has_error())
            co_return conn.error();

        // The message and its receipts are inserted in a single transaction
        auto ec = co_await execute(*conn, "START TRANSACTION");
        if (ec)
            co_return ec;

        std::string id = generate_uuid();
        mysql::results res;
        ec = co_await execute(
            *conn,
            mysql::with_params(
                "INSERT INTO messages (id, chat_id, sender_id, type, content, created_at, reply_to) "
                "VALUES ({}, {}, {}, {}, {}, {}, {})",
                id,
                msg.chat_id,
                msg.sender_id,
                to_string(msg.type),
                msg.content,
                serialize_timestamp(msg.created_at),
                msg.reply_to
            ),
            res,
            "Inserting a message"
        );
        if (ec)
            co_return ec;

        // One receipt in state sent for every other current participant
        ec = co_await execute(
            *conn,
            mysql::with_params(
                "INSERT INTO receipts (message_id, user_id, status) "
                "SELECT {}, user_id, 'sent' FROM chat_participants WHERE chat_id = {} AND user_id <> {}",
                id,
                msg.chat_id,
                msg.sender_id
            ),
            res,
            "Inserting message receipts"
        );
        if (ec)
            co_return ec;

        mysql::static_results<std::tuple<std::int64_t>> recipients_res;
        ec = co_await execute(
            *conn,
            mysql::with_params("SELECT user_id FROM receipts WHERE message_id = {} ORDER BY user_id", id),
            recipients_res,
            "Retrieving message recipients"
        );
        if (ec)
            co_return ec;

        ec = co_await execute(*conn, "COMMIT");
        if (ec)
            co_return ec;

        created_message created{
            .msg =
                message{
                        .id = std::move(id),
                        .chat_id = std::string(msg.chat_id),
                        .sender_id = msg.sender_id,
                        .type = msg.type,
                        .content = std::string(msg.content),
                        .created_at = msg.created_at,
                        .reply_to = msg.reply_to ? std::optional<std::string>(*msg.reply_to) : std::nullopt,
                        },
            .recipients = {},
        };
        for (const auto& row : recipients_res.rows())
            created.recipients.push_back(std::get<0>(row));
        co_return created;
    }

    asio::awaitable<result<message>> get_message(std::string_view message_id) override final
    {
        auto conn = co_await get_connection();
        if (conn.has_error())
            co_return conn.error();

        mysql::static_results<message_row> res;
        auto ec = co_await execute(
            *conn,
            mysql::with_params(
                "SELECT id, chat_id, sender_id, type, content, created_at, reply_to, is_deleted, "
                "deleted_for_everyone FROM messages WHERE id = {}",
                message_id
            ),
            res,
            "Retrieving a message"
        );
        if (ec)
            co_return ec;
        conn->return_without_reset();

        if (res.rows().empty())
            CHATRELAY_CO_RETURN_ERROR(errc::not_found)
        co_return to_message(std::move(res.rows()[0]));
    }

    asio::awaitable<result<receipt>> get_receipt(std::string_view message_id, std::int64_t user_id) override final
    {
        auto conn = co_await get_connection();
        if (conn.has_error())
            co_return conn.error();

        mysql::static_results<receipt_row> res;
        auto ec = co_await execute(
            *conn,
            mysql::with_params(
                "SELECT message_id, user_id, status, delivered_at, read_at FROM receipts "
                "WHERE message_id = {} AND user_id = {}",
                message_id,
                user_id
            ),
            res,
            "Retrieving a receipt"
        );
        if (ec)
            co_return ec;
        conn->return_without_reset();

        if (res.rows().empty())
            CHATRELAY_CO_RETURN_ERROR(errc::not_found)
        co_return to_receipt(std::move(res.rows()[0]));
    }

    asio::awaitable<result<bool>> update_receipt(
        std::string_view message_id,
        std::int64_t user_id,
        receipt_status status,
        timestamp_t now
    ) override final
    {
        auto conn = co_await get_connection();
        if (conn.has_error())
            co_return conn.error();

        auto ec = co_await execute(*conn, "START TRANSACTION");
        if (ec)
            co_return ec;

        // Lock the row, so concurrent updates can't make the receipt regress
        mysql::static_results<receipt_row> res;
        ec = co_await execute(
            *conn,
            mysql::with_params(
                "SELECT message_id, user_id, status, delivered_at, read_at FROM receipts "
                "WHERE message_id = {} AND user_id = {} FOR UPDATE",
                message_id,
                user_id
            ),
            res,
            "Locking a receipt"
        );
        if (ec)
            co_return ec;
        if (res.rows().empty())
            CHATRELAY_CO_RETURN_ERROR(errc::not_found)

        auto rcpt = to_receipt(std::move(res.rows()[0]));
        if (rcpt.has_error())
            co_return rcpt.error();

        // The state machine decides. Nothing to write if it's a no-op
        if (!advance_receipt(*rcpt, status, now))
            co_return false;

        mysql::results update_res;
        ec = co_await execute(
            *conn,
            mysql::with_params(
                "UPDATE receipts SET status = {}, delivered_at = {}, read_at = {} "
                "WHERE message_id = {} AND user_id = {}",
                to_string(rcpt->status),
                to_column(rcpt->delivered_at),
                to_column(rcpt->read_at),
                message_id,
                user_id
            ),
            update_res,
            "Updating a receipt"
        );
        if (ec)
            co_return ec;

        ec = co_await execute(*conn, "COMMIT");
        if (ec)
            co_return ec;
        co_return true;
    }

    asio::awaitable<result<std::vector<std::string>>> bulk_mark_read(
        std::string_view chat_id,
        std::int64_t user_id,
        std::optional<std::string_view> up_to_message_id,
        timestamp_t now
    ) override final
    {
        auto conn = co_await get_connection();
        if (conn.has_error())
            co_return conn.error();

        auto ec = co_await execute(*conn, "START TRANSACTION");
        if (ec)
            co_return ec;

        // Messages created after this one are left untouched
        std::int64_t cutoff = std::numeric_limits<std::int64_t>::max();
        if (up_to_message_id)
        {
            mysql::static_results<std::tuple<std::int64_t>> res;
            ec = co_await execute(
                *conn,
                mysql::with_params(
                    "SELECT created_at FROM messages WHERE id = {} AND chat_id = {}",
                    *up_to_message_id,
                    chat_id
                ),
                res,
                "Retrieving the last message to mark read"
            );
            if (ec)
                co_return ec;
            if (res.rows().empty())
                CHATRELAY_CO_RETURN_ERROR(errc::not_found)
            cutoff = std::get<0>(res.rows()[0]);
        }

        // Lock the affected receipts, oldest message first
        mysql::static_results<std::tuple<std::string>> unread_res;
        ec = co_await execute(
            *conn,
            mysql::with_params(
                "SELECT r.message_id FROM receipts r JOIN messages m ON m.id = r.message_id "
                "WHERE m.chat_id = {} AND r.user_id = {} AND m.sender_id <> {} AND r.status <> 'read' "
                "AND m.created_at <= {} ORDER BY m.created_at, m.id FOR UPDATE",
                chat_id,
                user_id,
                user_id,
                cutoff
            ),
            unread_res,
            "Locking unread receipts"
        );
        if (ec)
            co_return ec;

        std::vector<std::string> ids;
        ids.reserve(unread_res.rows().size());
        for (auto& row : unread_res.rows())
            ids.push_back(std::move(std::get<0>(row)));

        // The IN clause below wouldn't be valid with an empty list
        if (ids.empty())
            co_return ids;

        // Same semantics as advance_receipt: timestamps are only set once
        mysql::results update_res;
        ec = co_await execute(
            *conn,
            mysql::with_params(
                "UPDATE receipts SET status = 'read', delivered_at = COALESCE(delivered_at, {}), "
                "read_at = COALESCE(read_at, {}) WHERE user_id = {} AND message_id IN ({})",
                serialize_timestamp(now),
                serialize_timestamp(now),
                user_id,
                ids
            ),
            update_res,
            "Marking receipts as read"
        );
        if (ec)
            co_return ec;

        ec = co_await execute(*conn, "COMMIT");
        if (ec)
            co_return ec;
        co_return ids;
    }

    asio::awaitable<error_code> tombstone_message(std::string_view message_id) override final
    {
        auto conn = co_await get_connection();
        if (conn.has_error())
            co_return conn.error();

        mysql::results res;
        co_return co_await execute(
            *conn,
            mysql::with_params(
                "UPDATE messages SET content = {}, is_deleted = TRUE, deleted_for_everyone = TRUE "
                "WHERE id = {}",
                tombstone_content,
                message_id
            ),
            res,
            "Deleting a message for everyone"
        );
    }

    asio::awaitable<error_code> hide_message_for_user(std::string_view message_id, std::int64_t user_id)
        override final
    {
        auto conn = co_await get_connection();
        if (conn.has_error())
            co_return conn.error();

        mysql::results res;
        co_return co_await execute(
            *conn,
            mysql::with_params(
                "INSERT IGNORE INTO hidden_messages (message_id, user_id) VALUES ({}, {})",
                message_id,
                user_id
            ),
            res,
            "Hiding a message"
        );
    }

    asio::awaitable<result<reaction_action>> toggle_reaction(
        std::string_view message_id,
        std::int64_t user_id,
        std::string_view emoji
    ) override final
    {
        auto conn = co_await get_connection();
        if (conn.has_error())
            co_return conn.error();

        auto ec = co_await execute(*conn, "START TRANSACTION");
        if (ec)
            co_return ec;

        mysql::static_results<std::tuple<std::string>> res;
        ec = co_await execute(
            *conn,
            mysql::with_params(
                "SELECT emoji FROM reactions WHERE message_id = {} AND user_id = {} FOR UPDATE",
                message_id,
                user_id
            ),
            res,
            "Locking a reaction"
        );
        if (ec)
            co_return ec;

        reaction_action action{};
        mysql::results write_res;
        if (res.rows().empty())
        {
            action = reaction_action::added;
            ec = co_await execute(
                *conn,
                mysql::with_params(
                    "INSERT INTO reactions (message_id, user_id, emoji) VALUES ({}, {}, {})",
                    message_id,
                    user_id,
                    emoji
                ),
                write_res,
                "Adding a reaction"
            );
        }
        else if (std::get<0>(res.rows()[0]) == emoji)
        {
            action = reaction_action::removed;
            ec = co_await execute(
                *conn,
                mysql::with_params(
                    "DELETE FROM reactions WHERE message_id = {} AND user_id = {}",
                    message_id,
                    user_id
                ),
                write_res,
                "Removing a reaction"
            );
        }
        else
        {
            action = reaction_action::updated;
            ec = co_await execute(
                *conn,
                mysql::with_params(
                    "UPDATE reactions SET emoji = {} WHERE message_id = {} AND user_id = {}",
                    emoji,
                    message_id,
                    user_id
                ),
                write_res,
                "Updating a reaction"
            );
        }
        if (ec)
            co_return ec;

        ec = co_await execute(*conn, "COMMIT");
        if (ec)
            co_return ec;
        co_return action;
    }

    asio::awaitable<result<call_session>> create_call(
        std::int64_t caller_id,
        std::int64_t receiver_id,
        call_type type,
        timestamp_t now
    ) override final
    {
        auto conn = co_await get_connection();
        if (conn.has_error())
            co_return conn.error();

        call_session call{
            .id = generate_uuid(),
            .caller_id = caller_id,
            .receiver_id = receiver_id,
            .type = type,
            .status = call_status::initiated,
            .started_at = now,
        };

        mysql::results res;
        auto ec = co_await execute(
            *conn,
            mysql::with_params(
                "INSERT INTO calls (id, caller_id, receiver_id, type, status, started_at) "
                "VALUES ({}, {}, {}, {}, {}, {})",
                call.id,
                caller_id,
                receiver_id,
                to_string(type),
                to_string(call.status),
                serialize_timestamp(now)
            ),
            res,
            "Creating a call"
        );
        if (ec)
            co_return ec;
        co_return call;
    }

    asio::awaitable<result<call_session>> get_call(std::string_view call_id) override final
    {
        auto conn = co_await get_connection();
        if (conn.has_error())
            co_return conn.error();

        mysql::static_results<call_row> res;
        auto ec = co_await execute(
            *conn,
            mysql::with_params(
                "SELECT id, caller_id, receiver_id, type, status, started_at, answered_at, ended_at, "
                "duration FROM calls WHERE id = {}",
                call_id
            ),
            res,
            "Retrieving a call"
        );
        if (ec)
            co_return ec;
        conn->return_without_reset();

        if (res.rows().empty())
            CHATRELAY_CO_RETURN_ERROR(errc::not_found)
        co_return to_call(std::move(res.rows()[0]));
    }

    asio::awaitable<result<call_session>> update_call(std::string_view call_id, call_status status, timestamp_t now)
        override final
    {
        auto conn = co_await get_connection();
        if (conn.has_error())
            co_return conn.error();

        auto ec = co_await execute(*conn, "START TRANSACTION");
        if (ec)
            co_return ec;

        mysql::static_results<call_row> res;
        ec = co_await execute(
            *conn,
            mysql::with_params(
                "SELECT id, caller_id, receiver_id, type, status, started_at, answered_at, ended_at, "
                "duration FROM calls WHERE id = {} FOR UPDATE",
                call_id
            ),
            res,
            "Locking a call"
        );
        if (ec)
            co_return ec;
        if (res.rows().empty())
            CHATRELAY_CO_RETURN_ERROR(errc::not_found)

        auto call = to_call(std::move(res.rows()[0]));
        if (call.has_error())
            co_return call.error();

        // Rejected transitions leave the row untouched
        ec = apply_call_transition(*call, status, now);
        if (ec)
            co_return ec;

        mysql::results update_res;
        ec = co_await execute(
            *conn,
            mysql::with_params(
                "UPDATE calls SET status = {}, answered_at = {}, ended_at = {}, duration = {} WHERE id = {}",
                to_string(call->status),
                to_column(call->answered_at),
                to_column(call->ended_at),
                static_cast<std::int64_t>(call->duration.count()),
                call_id
            ),
            update_res,
            "Updating a call"
        );
        if (ec)
            co_return ec;

        ec = co_await execute(*conn, "COMMIT");
        if (ec)
            co_return ec;
        co_return std::move(*call);
    }
};

}  // namespace

std::unique_ptr<store> chatrelay::create_mysql_store(asio::any_io_executor ex, const mysql_config& cfg)
{
    return std::unique_ptr<store>{new mysql_store_impl(std::move(ex), cfg)};
}
