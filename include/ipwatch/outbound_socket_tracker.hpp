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
#include "address_family.hpp"
#include "exports.hpp"
#include "polling_tracker.hpp"
#include <chrono>
#include <cstdint>
#include <string>

IPWATCH__NAMESPACE_BEGIN

/**
 * Infers the outbound-facing address: "connects" a datagram socket to a
 * well-known public address (no packet is sent) and reads back the source
 * address chosen by the routing table.
 */
class outbound_socket_tracker: public polling_tracker
{
public:
    // Cloudflare public DNS
    static constexpr char const * DEFAULT_INET4_TARGET = "1.1.1.1";
    static constexpr char const * DEFAULT_INET6_TARGET = "2606:4700:4700::1111";
    static constexpr std::uint16_t DEFAULT_TARGET_PORT = 80;

private:
    address_family _family;
    std::string _target;
    std::uint16_t _port;

public:
    /**
     * @param target Numeric host address to route toward. If empty, the
     *        default target for @a family is used.
     */
    IPWATCH__EXPORT outbound_socket_tracker (address_family family
        , std::chrono::milliseconds update_interval
        , std::string const & target = std::string{}
        , std::uint16_t port = DEFAULT_TARGET_PORT);

    IPWATCH__EXPORT ~outbound_socket_tracker ();

public:
    IPWATCH__EXPORT std::string get_current () override;

    std::string const & target () const noexcept
    {
        return _target;
    }
};

IPWATCH__NAMESPACE_END
