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
#include "address_tracker.hpp"
#include "error.hpp"
#include "exports.hpp"
#include "monitor.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

IPWATCH__NAMESPACE_BEGIN

enum class tracker_strategy
{
      netlink           // Kernel address notifications (netlink_tracker)
    , external_service  // HTTP address-echo service (external_service_tracker)
    , outbound_socket   // Locally bound source address (outbound_socket_tracker)
};

struct tracker_options
{
    tracker_strategy strategy {tracker_strategy::netlink};
    address_family family {address_family::inet4};

    // netlink: interface name, default route interface if empty
    std::string iface_name;

    // external_service, outbound_socket
    std::chrono::milliseconds update_interval {std::chrono::seconds{60}};

    // external_service: endpoint URL, family default if empty
    std::string service_url;
    std::chrono::milliseconds service_timeout {std::chrono::seconds{10}};

    // outbound_socket: numeric target address, family default if empty
    std::string target_addr;
    std::uint16_t target_port {80};
};

IPWATCH__EXPORT std::string to_string (tracker_strategy strategy);

/**
 * Parses strategy name: "netlink", "external" or "socket".
 *
 * @return @c false if @a name is not recognized.
 */
IPWATCH__EXPORT bool parse_strategy (std::string const & name, tracker_strategy & strategy);

/**
 * Constructs tracker for selected strategy.
 *
 * @throw ipwatch::error with errc::resolution_error (netlink strategy).
 */
IPWATCH__EXPORT std::unique_ptr<address_tracker> make_tracker (tracker_options const & opts);

IPWATCH__EXPORT monitor::tracker_factory make_tracker_factory (tracker_options const & opts);

IPWATCH__NAMESPACE_END
