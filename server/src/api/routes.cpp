//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "api/routes.hpp"

#include <boost/url/parse.hpp>
#include <boost/url/url.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace chatrelay;

std::optional<route> chatrelay::match_route(std::string_view target)
{
    // Request targets are in origin form (e.g. /ws/chat/abc/?x=1)
    auto parsed = boost::urls::parse_origin_form(target);
    if (parsed.has_error())
        return std::nullopt;

    // Normalizing removes dot segments and redundant percent-encodings
    boost::urls::url normalized(*parsed);
    normalized.normalize();

    std::vector<std::string> segs;
    for (auto seg : normalized.segments())
        segs.push_back(std::move(seg));

    // A trailing slash yields an empty last segment
    if (!segs.empty() && segs.back().empty())
        segs.pop_back();

    if (segs.size() < 2u || segs[0] != "ws")
        return std::nullopt;

    if (segs.size() == 2u && segs[1] == "notifications")
        return route{endpoint_kind::notifications, {}};

    if (segs.size() == 3u && !segs[2].empty())
    {
        if (segs[1] == "chat")
            return route{endpoint_kind::chat, std::move(segs[2])};
        if (segs[1] == "call")
            return route{endpoint_kind::call, std::move(segs[2])};
    }

    return std::nullopt;
}
