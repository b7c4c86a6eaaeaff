////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `ipwatch`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "ipwatch/address_family.hpp"
#include <sys/socket.h>

IPWATCH__NAMESPACE_BEGIN

int native_family (address_family af) noexcept
{
    return af == address_family::inet6 ? AF_INET6 : AF_INET;
}

std::string to_string (address_family af)
{
    switch (af) {
        case address_family::inet4:
            return std::string{"IPv4"};
        case address_family::inet6:
            return std::string{"IPv6"};
    }

    return std::string{};
}

IPWATCH__NAMESPACE_END
