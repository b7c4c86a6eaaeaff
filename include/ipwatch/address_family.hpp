////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `ipwatch`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "namespace.hpp"
#include "exports.hpp"
#include <string>

IPWATCH__NAMESPACE_BEGIN

enum class address_family
{
      inet4
    , inet6
};

/**
 * Native (AF_INET / AF_INET6) value for @a af.
 */
IPWATCH__EXPORT int native_family (address_family af) noexcept;

IPWATCH__EXPORT std::string to_string (address_family af);

IPWATCH__NAMESPACE_END
