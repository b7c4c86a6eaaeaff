////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2019-2026 Vladislav Trifochkin
//
// This file is part of `ipwatch`.
//
// Changelog:
//      2023.02.16 Initial version.
//      2024.04.08 Moved to `utils` namespace.
//      2026.10.19 Multicast groups selected by caller, dump requests.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "../namespace.hpp"
#include "../callback.hpp"
#include "../error.hpp"
#include "../exports.hpp"
#include <chrono>
#include <cstdint>

struct mnl_socket;
struct nlmsghdr;

IPWATCH__NAMESPACE_BEGIN

namespace utils {

/**
 * Netlink socket
 */
class netlink_socket
{
public:
    using native_type = int;
    static native_type constexpr kINVALID_SOCKET = -1;

    enum class type_enum {
        route = 0 // NETLINK_ROUTE
    };

private:
    mnl_socket * _socket { nullptr };
    std::uint32_t _seq {0};

public:
    /**
     * Constructs invalid Netlink socket.
     */
    IPWATCH__EXPORT netlink_socket ();

    /**
     * Constructs Netlink socket subscribed to multicast @a groups
     * (RTMGRP_* bit mask). Zero @a groups means request/response only socket.
     */
    IPWATCH__EXPORT netlink_socket (type_enum netlinktype, unsigned int groups = 0);

    netlink_socket (netlink_socket const &) = delete;
    netlink_socket & operator = (netlink_socket const &) = delete;

    IPWATCH__EXPORT ~netlink_socket ();

    IPWATCH__EXPORT netlink_socket (netlink_socket &&);
    IPWATCH__EXPORT netlink_socket & operator = (netlink_socket &&);

public:
    IPWATCH__EXPORT native_type native () const noexcept;

    IPWATCH__EXPORT std::uint32_t portid () const noexcept;

    /**
     * Closes socket. Socket becomes invalid.
     */
    IPWATCH__EXPORT void close ();

    /**
     * Limits blocking time of recv().
     */
    IPWATCH__EXPORT bool set_receive_timeout (std::chrono::milliseconds timeout, error * perr = nullptr);

    /**
     * Receive data from Netlink socket.
     */
    IPWATCH__EXPORT int recv (char * data, int len, error * perr = nullptr);

    /**
     * Send @a req request with @a len length on a Netlink socket.
     */
    IPWATCH__EXPORT int send (char const * req, int len, error * perr = nullptr);

    /**
     * Sends dump request of @a msg_type (RTM_GETLINK, RTM_GETROUTE,
     * RTM_GETADDR) for @a family and calls @a visitor for each message of the
     * reply.
     */
    IPWATCH__EXPORT bool dump (std::uint16_t msg_type, int family
        , callback_t<void (nlmsghdr const *)> visitor
        , error * perr = nullptr);
};

} // namespace utils

IPWATCH__NAMESPACE_END
