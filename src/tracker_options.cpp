////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `ipwatch`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "ipwatch/tracker_options.hpp"
#include "ipwatch/external_service_tracker.hpp"
#include "ipwatch/netlink_tracker.hpp"
#include "ipwatch/outbound_socket_tracker.hpp"
#include "pfs/memory.hpp"

IPWATCH__NAMESPACE_BEGIN

std::string to_string (tracker_strategy strategy)
{
    switch (strategy) {
        case tracker_strategy::netlink:
            return "netlink";
        case tracker_strategy::external_service:
            return "external";
        case tracker_strategy::outbound_socket:
            return "socket";
    }

    return std::string{};
}

bool parse_strategy (std::string const & name, tracker_strategy & strategy)
{
    if (name == "netlink")
        strategy = tracker_strategy::netlink;
    else if (name == "external")
        strategy = tracker_strategy::external_service;
    else if (name == "socket")
        strategy = tracker_strategy::outbound_socket;
    else
        return false;

    return true;
}

std::unique_ptr<address_tracker> make_tracker (tracker_options const & opts)
{
    switch (opts.strategy) {
        case tracker_strategy::external_service:
            return pfs::make_unique<external_service_tracker>(opts.family
                , opts.update_interval, opts.service_url, opts.service_timeout);

        case tracker_strategy::outbound_socket:
            return pfs::make_unique<outbound_socket_tracker>(opts.family
                , opts.update_interval, opts.target_addr, opts.target_port);

        case tracker_strategy::netlink:
        default:
            break;
    }

    return pfs::make_unique<netlink_tracker>(opts.family, opts.iface_name);
}

monitor::tracker_factory make_tracker_factory (tracker_options const & opts)
{
    return [opts] () {
        return make_tracker(opts);
    };
}

IPWATCH__NAMESPACE_END
