//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CHATRELAY_SERVER_INCLUDE_TOPIC_HPP
#define CHATRELAY_SERVER_INCLUDE_TOPIC_HPP

#include <cstdint>
#include <string>
#include <string_view>

// Topic keys for the broker. A topic is one of chat:<chat_id>, call:<call_id>
// or user:<user_id>.

namespace chatrelay {

inline std::string make_topic(std::string_view prefix, std::string_view id)
{
    std::string res;
    res.reserve(prefix.size() + id.size());
    res += prefix;
    res += id;
    return res;
}

inline std::string chat_topic(std::string_view chat_id) { return make_topic("chat:", chat_id); }

inline std::string call_topic(std::string_view call_id) { return make_topic("call:", call_id); }

inline std::string user_topic(std::int64_t user_id) { return make_topic("user:", std::to_string(user_id)); }

}  // namespace chatrelay

#endif
