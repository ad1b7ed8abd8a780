//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "business_types.hpp"

#include <boost/describe/enum.hpp>
#include <boost/describe/enum_from_string.hpp>
#include <boost/describe/enum_to_string.hpp>

#include <optional>
#include <string_view>

namespace chatrelay {

// Enumerator names are the exact strings used in the API and in the database,
// so Describe can do all conversions for us
BOOST_DESCRIBE_ENUM(chat_type, personal, group, broadcast)
BOOST_DESCRIBE_ENUM(message_type, text, image, video, audio, document, contact, location, sticker, voice)
BOOST_DESCRIBE_ENUM(receipt_status, sent, delivered, read)
BOOST_DESCRIBE_ENUM(reaction_action, added, updated, removed)
BOOST_DESCRIBE_ENUM(call_type, voice, video)
BOOST_DESCRIBE_ENUM(call_status, initiated, ringing, ongoing, ended, missed, declined, failed)

}  // namespace chatrelay

using namespace chatrelay;

namespace {

template <class E>
std::string_view describe_to_string(E v) noexcept
{
    return boost::describe::enum_to_string(v, "");
}

template <class E>
std::optional<E> describe_from_string(std::string_view from) noexcept
{
    E res{};
    if (boost::describe::enum_from_string(from, res))
        return res;
    return std::nullopt;
}

}  // namespace

std::string_view chatrelay::to_string(chat_type v) noexcept { return describe_to_string(v); }
std::string_view chatrelay::to_string(message_type v) noexcept { return describe_to_string(v); }
std::string_view chatrelay::to_string(receipt_status v) noexcept { return describe_to_string(v); }
std::string_view chatrelay::to_string(reaction_action v) noexcept { return describe_to_string(v); }
std::string_view chatrelay::to_string(call_type v) noexcept { return describe_to_string(v); }
std::string_view chatrelay::to_string(call_status v) noexcept { return describe_to_string(v); }

std::optional<chat_type> chatrelay::parse_chat_type(std::string_view from) noexcept
{
    return describe_from_string<chat_type>(from);
}

std::optional<message_type> chatrelay::parse_message_type(std::string_view from) noexcept
{
    return describe_from_string<message_type>(from);
}

std::optional<receipt_status> chatrelay::parse_receipt_status(std::string_view from) noexcept
{
    return describe_from_string<receipt_status>(from);
}

std::optional<call_type> chatrelay::parse_call_type(std::string_view from) noexcept
{
    return describe_from_string<call_type>(from);
}

std::optional<call_status> chatrelay::parse_call_status(std::string_view from) noexcept
{
    return describe_from_string<call_status>(from);
}
