//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "api/api_types.hpp"

#include <boost/describe/class.hpp>
#include <boost/describe/enum.hpp>
#include <boost/describe/enum_from_string.hpp>
#include <boost/describe/enum_to_string.hpp>
#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/string.hpp>
#include <boost/json/value.hpp>
#include <boost/json/value_from.hpp>
#include <boost/json/value_to.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "business_types.hpp"
#include "error.hpp"
#include "timestamp.hpp"

using namespace chatrelay;
namespace json = boost::json;

namespace chatrelay {

//
// Describe metadata for incoming types. boost::json::try_value_to uses it
// to parse frames into these structs. Member names match the wire format exactly.
// Defined in this .cpp file only: redefining it elsewhere is an ODR violation.
//

BOOST_DESCRIBE_STRUCT(chat_message_request, (), (content, reply_to))
BOOST_DESCRIBE_STRUCT(read_receipt_request, (), (message_id))
BOOST_DESCRIBE_STRUCT(delivered_receipt_request, (), (message_id))
BOOST_DESCRIBE_STRUCT(reaction_request, (), (message_id, emoji))
BOOST_DESCRIBE_STRUCT(mark_chat_read_request, (), (up_to))
BOOST_DESCRIBE_ENUM(signal_kind, offer, answer, ice_candidate)

}  // namespace chatrelay

namespace {

// Helper structs with Describe metadata for outgoing types.
// Member names match the wire format exactly.

struct wire_message
{
    std::string_view id;
    std::int64_t sender_id;
    std::string_view sender_name;
    std::string_view content;
    std::string_view message_type;
    std::int64_t created_at;
    std::optional<std::string_view> reply_to;
};
BOOST_DESCRIBE_STRUCT(wire_message, (), (id, sender_id, sender_name, content, message_type, created_at, reply_to))

struct wire_chat_message_event
{
    std::string_view type;
    wire_message message;
};
BOOST_DESCRIBE_STRUCT(wire_chat_message_event, (), (type, message))

struct wire_typing_indicator_event
{
    std::string_view type;
    std::int64_t user_id;
    std::string_view user_name;
    bool is_typing;
};
BOOST_DESCRIBE_STRUCT(wire_typing_indicator_event, (), (type, user_id, user_name, is_typing))

struct wire_user_status_event
{
    std::string_view type;
    std::int64_t user_id;
    bool is_online;
};
BOOST_DESCRIBE_STRUCT(wire_user_status_event, (), (type, user_id, is_online))

// read_receipt and delivered_receipt
struct wire_receipt_event
{
    std::string_view type;
    std::string_view message_id;
    std::int64_t user_id;
};
BOOST_DESCRIBE_STRUCT(wire_receipt_event, (), (type, message_id, user_id))

struct wire_message_deleted_event
{
    std::string_view type;
    std::string_view message_id;
    std::int64_t user_id;
    bool delete_for_everyone;
};
BOOST_DESCRIBE_STRUCT(wire_message_deleted_event, (), (type, message_id, user_id, delete_for_everyone))

struct wire_reaction_event
{
    std::string_view type;
    std::string_view message_id;
    std::int64_t user_id;
    std::string_view emoji;
    std::string_view action;
};
BOOST_DESCRIBE_STRUCT(wire_reaction_event, (), (type, message_id, user_id, emoji, action))

struct wire_message_notification
{
    std::string_view kind;
    std::string_view chat_id;
    std::string_view message_id;
    std::int64_t sender_id;
    std::string_view sender_name;
    std::string_view body;
};
BOOST_DESCRIBE_STRUCT(wire_message_notification, (), (kind, chat_id, message_id, sender_id, sender_name, body))

struct wire_call_notification
{
    std::string_view kind;
    std::string_view call_id;
    std::int64_t caller_id;
    std::string_view caller_name;
    std::string_view call_type;
};
BOOST_DESCRIBE_STRUCT(wire_call_notification, (), (kind, call_id, caller_id, caller_name, call_type))

struct wire_user_left_event
{
    std::string_view type;
    std::int64_t user_id;
};
BOOST_DESCRIBE_STRUCT(wire_user_left_event, (), (type, user_id))

struct wire_call_status_event
{
    std::string_view type;
    std::string_view call_id;
    std::string_view status;
    std::int64_t duration;
};
BOOST_DESCRIBE_STRUCT(wire_call_status_event, (), (type, call_id, status, duration))

struct wire_call_created_event
{
    std::string_view type;
    std::string_view call_id;
    std::string_view status;
};
BOOST_DESCRIBE_STRUCT(wire_call_created_event, (), (type, call_id, status))

struct wire_error_event
{
    std::string_view type;
    std::string_view request;
    std::string_view error;
    std::string_view message;
};
BOOST_DESCRIBE_STRUCT(wire_error_event, (), (type, request, error, message))

template <class T>
std::string serialize_wire(const T& value)
{
    return json::serialize(json::value_from(value));
}

// The name shown to other users
std::string_view name_of(const user& u) noexcept
{
    return u.display_name.empty() ? std::string_view(u.username) : std::string_view(u.display_name);
}

// Wire formats for incoming types that don't map one to one to our request types:
// fields with defaults, and enums sent as strings
struct wire_typing_request
{
    std::optional<bool> is_typing;
};
BOOST_DESCRIBE_STRUCT(wire_typing_request, (), (is_typing))

struct wire_delete_message_request
{
    std::string message_id;
    std::optional<bool> delete_for_everyone;
};
BOOST_DESCRIBE_STRUCT(wire_delete_message_request, (), (message_id, delete_for_everyone))

struct wire_call_status_request
{
    std::string status;
};
BOOST_DESCRIBE_STRUCT(wire_call_status_request, (), (status))

struct wire_start_call_request
{
    std::int64_t receiver_id;
    std::string call_type;
};
BOOST_DESCRIBE_STRUCT(wire_start_call_request, (), (receiver_id, call_type))

// Parses the frame and checks that it's an object with a string type member
result<json::value> parse_frame(std::string_view from)
{
    error_code ec;
    auto msg = json::parse(from, ec);
    if (ec)
        CHATRELAY_RETURN_ERROR(ec)
    auto* obj = msg.if_object();
    if (!obj)
        CHATRELAY_RETURN_ERROR(errc::websocket_parse_error)
    auto it = obj->find("type");
    if (it == obj->end() || !it->value().is_string())
        CHATRELAY_RETURN_ERROR(errc::websocket_parse_error)
    return msg;
}

std::string_view get_type(const json::value& frame)
{
    const auto& type = frame.get_object().at("type").get_string();
    return std::string_view(type.data(), type.size());
}

// Parses the frame into the struct with Describe metadata T. Members are looked up
// by name, and other members (like type) are ignored. Missing optional members are left empty.
template <class T>
result<T> parse_payload(const json::value& frame)
{
    auto res = json::try_value_to<T>(frame);
    if (res.has_error())
        CHATRELAY_RETURN_ERROR(errc::websocket_parse_error)
    return std::move(res).value();
}

// Helper to build the variants: the parsed request or the error
template <class Variant, class T>
Variant to_event(result<T>&& from)
{
    if (from.has_error())
        return from.error();
    return std::move(from).value();
}

std::string_view to_string(signal_kind kind) noexcept
{
    return boost::describe::enum_to_string(kind, "ice_candidate");
}

std::string_view to_string(api_error_id input) noexcept
{
    switch (input)
    {
    case api_error_id::bad_request: return "BAD_REQUEST";
    case api_error_id::store_failure: return "STORE_FAILURE";
    case api_error_id::call_conflict: return "CALL_CONFLICT";
    }
    return "BAD_REQUEST";
}

}  // namespace

//
// Incoming types
//

chat_client_event chatrelay::parse_chat_event(std::string_view from)
{
    auto frame = parse_frame(from);
    if (frame.has_error())
        return frame.error();
    auto type = get_type(*frame);

    if (type == "chat_message")
    {
        return to_event<chat_client_event>(parse_payload<chat_message_request>(*frame));
    }
    else if (type == "typing")
    {
        auto req = parse_payload<wire_typing_request>(*frame);
        if (req.has_error())
            return req.error();
        return typing_request{req->is_typing.value_or(false)};
    }
    else if (type == "read_receipt")
    {
        return to_event<chat_client_event>(parse_payload<read_receipt_request>(*frame));
    }
    else if (type == "delivered_receipt")
    {
        return to_event<chat_client_event>(parse_payload<delivered_receipt_request>(*frame));
    }
    else if (type == "delete_message")
    {
        auto req = parse_payload<wire_delete_message_request>(*frame);
        if (req.has_error())
            return req.error();
        return delete_message_request{std::move(req->message_id), req->delete_for_everyone.value_or(false)};
    }
    else if (type == "reaction")
    {
        return to_event<chat_client_event>(parse_payload<reaction_request>(*frame));
    }
    else if (type == "mark_chat_read")
    {
        return to_event<chat_client_event>(parse_payload<mark_chat_read_request>(*frame));
    }
    else
    {
        return unknown_event{};
    }
}

call_client_event chatrelay::parse_call_event(std::string_view from)
{
    auto frame = parse_frame(from);
    if (frame.has_error())
        return frame.error();
    auto type = get_type(*frame);

    signal_kind kind{};
    if (boost::describe::enum_from_string(type, kind))
    {
        // The payload is relayed as-is
        auto& obj = frame->get_object();
        auto it = obj.find("data");
        return signal_request{kind, it == obj.end() ? json::value() : std::move(it->value())};
    }
    else if (type == "call_status")
    {
        auto req = parse_payload<wire_call_status_request>(*frame);
        if (req.has_error())
            return req.error();
        auto status = parse_call_status(req->status);
        if (!status)
            CHATRELAY_RETURN_ERROR(errc::websocket_parse_error)
        return call_status_request{*status};
    }
    else
    {
        return unknown_event{};
    }
}

notification_client_event chatrelay::parse_notification_event(std::string_view from)
{
    auto frame = parse_frame(from);
    if (frame.has_error())
        return frame.error();

    if (get_type(*frame) == "start_call")
    {
        auto req = parse_payload<wire_start_call_request>(*frame);
        if (req.has_error())
            return req.error();
        auto type = parse_call_type(req->call_type);
        if (!type)
            CHATRELAY_RETURN_ERROR(errc::websocket_parse_error)
        return start_call_request{req->receiver_id, *type};
    }
    return unknown_event{};
}

//
// Outgoing types
//

std::string chat_message_event::to_json() const
{
    return serialize_wire(wire_chat_message_event{
        "chat_message",
        wire_message{
                     msg.id,
                     msg.sender_id,
                     name_of(sender),
                     msg.content,
                     chatrelay::to_string(msg.type),
                     serialize_timestamp(msg.created_at),
                     msg.reply_to ? std::optional<std::string_view>(*msg.reply_to) : std::nullopt,
                     },
    });
}

std::string typing_indicator_event::to_json() const
{
    return serialize_wire(wire_typing_indicator_event{"typing_indicator", who.id, name_of(who), is_typing});
}

std::string user_status_event::to_json() const
{
    return serialize_wire(wire_user_status_event{"user_status", user_id, is_online});
}

std::string read_receipt_event::to_json() const
{
    return serialize_wire(wire_receipt_event{"read_receipt", message_id, user_id});
}

std::string delivered_receipt_event::to_json() const
{
    return serialize_wire(wire_receipt_event{"delivered_receipt", message_id, user_id});
}

std::string message_deleted_event::to_json() const
{
    return serialize_wire(wire_message_deleted_event{"message_deleted", message_id, user_id, delete_for_everyone}
    );
}

std::string reaction_event::to_json() const
{
    return serialize_wire(
        wire_reaction_event{"reaction", message_id, user_id, emoji, chatrelay::to_string(action)}
    );
}

std::string chat_read_event::to_json() const
{
    json::array ids;
    ids.reserve(message_ids.size());
    for (const auto& id : message_ids)
        ids.emplace_back(id);

    json::object evt;
    evt.emplace("type", "chat_read");
    evt.emplace("user_id", user_id);
    evt.emplace("message_ids", std::move(ids));
    return json::serialize(evt);
}

std::string message_notification_event::to_json() const
{
    json::object evt;
    evt.emplace("type", "notification");
    evt.emplace(
        "notification",
        json::value_from(wire_message_notification{
            "message",
            msg.chat_id,
            msg.id,
            msg.sender_id,
            name_of(sender),
            msg.content,
        })
    );
    return json::serialize(evt);
}

std::string call_notification_event::to_json() const
{
    json::object evt;
    evt.emplace("type", "notification");
    evt.emplace(
        "notification",
        json::value_from(wire_call_notification{
            "call",
            call.id,
            call.caller_id,
            name_of(caller),
            chatrelay::to_string(call.type),
        })
    );
    return json::serialize(evt);
}

std::string signal_event::to_json() const
{
    json::object evt;
    evt.emplace("type", ::to_string(kind));
    evt.emplace("user_id", user_id);
    evt.emplace("data", data);
    return json::serialize(evt);
}

std::string user_left_event::to_json() const
{
    return serialize_wire(wire_user_left_event{"user_left", user_id});
}

std::string call_status_event::to_json() const
{
    return serialize_wire(wire_call_status_event{
        "call_status",
        call.id,
        chatrelay::to_string(call.status),
        static_cast<std::int64_t>(call.duration.count()),
    });
}

std::string call_created_event::to_json() const
{
    return serialize_wire(wire_call_created_event{"call_created", call.id, chatrelay::to_string(call.status)});
}

std::string error_event::to_json() const
{
    return serialize_wire(wire_error_event{"error", request, ::to_string(error_id), error_message});
}
