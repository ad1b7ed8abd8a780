//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Separate compilation for Boost.Asio, reducing build times for the other files.
// SSL is required by Boost.MySQL and Boost.Redis, even if we connect in plaintext.
// BOOST_ASIO_SEPARATE_COMPILATION must be defined for the entire build.

#include <boost/asio/impl/src.hpp>
#include <boost/asio/ssl/impl/src.hpp>
