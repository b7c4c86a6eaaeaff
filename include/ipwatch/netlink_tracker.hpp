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
#include "exports.hpp"
#include "interruptable.hpp"
#include "utils/netlink_socket.hpp"
#include <cstdint>
#include <string>
#include <thread>

IPWATCH__NAMESPACE_BEGIN

/**
 * Tracks addresses assigned to a network interface using kernel (rtnetlink)
 * notifications.
 *
 * Only `RTM_NEWADDR` events of the configured family with global scope on the
 * resolved interface are reported.
 */
class netlink_tracker: public address_tracker, private interruptable
{
    address_family _family;
    std::uint32_t _iface_index {0};
    std::string _iface_name;

    utils::netlink_socket _nls;
    int _epoll_id {-1};
    int _wakeup_id {-1};
    std::thread _th;

public:
    /**
     * Constructs tracker for interface @a iface_name. If @a iface_name is empty
     * the interface carrying the default route for @a family is used.
     *
     * @throw ipwatch::error with errc::resolution_error if interface can not
     *        be resolved.
     */
    IPWATCH__EXPORT netlink_tracker (address_family family, std::string const & iface_name = std::string{});
    IPWATCH__EXPORT ~netlink_tracker ();

public:
    IPWATCH__EXPORT std::string get_current () override;
    IPWATCH__EXPORT void start () override;
    IPWATCH__EXPORT void stop () override;

    std::uint32_t iface_index () const noexcept
    {
        return _iface_index;
    }

    std::string const & iface_name () const noexcept
    {
        return _iface_name;
    }

private:
    void run ();
    void release ();
};

IPWATCH__NAMESPACE_END
