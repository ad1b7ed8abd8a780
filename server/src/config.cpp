//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "config.hpp"

#include <charconv>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include "error.hpp"

using namespace chatrelay;

namespace {

// Parses a decimal, positive integer that must be entirely consumed
template <class T>
std::optional<T> parse_positive(std::string_view from)
{
    T res{};
    auto [ptr, ec] = std::from_chars(from.data(), from.data() + from.size(), res);
    if (ec != std::errc() || ptr != from.data() + from.size() || !(res > T{}))
        return std::nullopt;
    return res;
}

void assign_env(env_lookup getenv_fn, const char* name, std::string& to)
{
    const char* res = getenv_fn(name);
    if (res != nullptr)
        to = res;
}

}  // namespace

result<server_config> chatrelay::load_config(std::span<const char* const> args, env_lookup getenv_fn)
{
    server_config res;

    // Command line: <program> <address> <port>
    if (args.size() != 3u)
        CHATRELAY_RETURN_ERROR(errc::invalid_config)
    res.ip = args[1];
    auto port = parse_positive<unsigned short>(args[2]);
    if (!port)
        CHATRELAY_RETURN_ERROR(errc::invalid_config)
    res.port = *port;

    // Backends
    assign_env(getenv_fn, "MYSQL_HOST", res.mysql.host);
    assign_env(getenv_fn, "MYSQL_USERNAME", res.mysql.username);
    assign_env(getenv_fn, "MYSQL_PASSWORD", res.mysql.password);
    assign_env(getenv_fn, "MYSQL_DATABASE", res.mysql.database);
    assign_env(getenv_fn, "REDIS_HOST", res.redis_host);

    // Connection tuning
    if (const char* timeout = getenv_fn("CHATRELAY_WRITE_TIMEOUT_MS"))
    {
        auto value = parse_positive<std::int64_t>(timeout);
        if (!value)
            CHATRELAY_RETURN_ERROR(errc::invalid_config)
        res.write_timeout = std::chrono::milliseconds(*value);
    }
    if (const char* max_frames = getenv_fn("CHATRELAY_MAX_QUEUED_FRAMES"))
    {
        auto value = parse_positive<std::size_t>(max_frames);
        if (!value)
            CHATRELAY_RETURN_ERROR(errc::invalid_config)
        res.max_queued_frames = *value;
    }

    return res;
}
