////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `ipwatch`.
//
// Changelog:
//      2026.10.19 Initial version.
//      2026.10.20 Requests are performed by libcurl.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "../namespace.hpp"
#include "../error.hpp"
#include "../exports.hpp"
#include <chrono>
#include <string>

IPWATCH__NAMESPACE_BEGIN

namespace utils {

struct http_response
{
    int status {0};
    std::string body;
};

/**
 * Performs blocking HTTP(S) GET request. Name resolution, connection, TLS
 * handshake and transfer together are limited by @a timeout.
 *
 * Only `http` and `https` schemes are accepted, redirects are not followed.
 * Response body larger than 64 KiB is treated as failure.
 */
IPWATCH__EXPORT http_response http_get (std::string const & url
    , std::chrono::milliseconds timeout
    , error * perr = nullptr);

} // namespace utils

IPWATCH__NAMESPACE_END
