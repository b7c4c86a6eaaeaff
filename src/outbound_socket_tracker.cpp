////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `ipwatch`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "ipwatch/outbound_socket_tracker.hpp"
#include "pfs/endian.hpp"
#include "pfs/i18n.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cstring>

IPWATCH__NAMESPACE_BEGIN

constexpr char const * outbound_socket_tracker::DEFAULT_INET4_TARGET;
constexpr char const * outbound_socket_tracker::DEFAULT_INET6_TARGET;
constexpr std::uint16_t outbound_socket_tracker::DEFAULT_TARGET_PORT;

outbound_socket_tracker::outbound_socket_tracker (address_family family
    , std::chrono::milliseconds update_interval
    , std::string const & target
    , std::uint16_t port)
    : polling_tracker(update_interval)
    , _family(family)
    , _target(target)
    , _port(port)
{
    if (_target.empty()) {
        _target = family == address_family::inet4
            ? DEFAULT_INET4_TARGET
            : DEFAULT_INET6_TARGET;
    }
}

outbound_socket_tracker::~outbound_socket_tracker ()
{
    stop();
}

std::string outbound_socket_tracker::get_current ()
{
    sockaddr_storage target_addr;
    socklen_t target_len = 0;

    std::memset(& target_addr, 0, sizeof(target_addr));

    if (_family == address_family::inet4) {
        auto p = reinterpret_cast<sockaddr_in *>(& target_addr);
        p->sin_family = AF_INET;
        p->sin_port   = pfs::to_network_order(_port);

        if (inet_pton(AF_INET, _target.c_str(), & p->sin_addr) != 1) {
            throw error {
                  make_error_code(errc::detection_error)
                , tr::f_("bad IPv4 target address: {}", _target)
            };
        }

        target_len = sizeof(sockaddr_in);
    } else {
        auto p = reinterpret_cast<sockaddr_in6 *>(& target_addr);
        p->sin6_family = AF_INET6;
        p->sin6_port   = pfs::to_network_order(_port);

        if (inet_pton(AF_INET6, _target.c_str(), & p->sin6_addr) != 1) {
            throw error {
                  make_error_code(errc::detection_error)
                , tr::f_("bad IPv6 target address: {}", _target)
            };
        }

        target_len = sizeof(sockaddr_in6);
    }

    auto sock = ::socket(native_family(_family), SOCK_DGRAM | SOCK_CLOEXEC, 0);

    if (sock < 0) {
        throw error {
              make_error_code(errc::detection_error)
            , tr::_("create datagram socket failure")
            , pfs::system_error_text()
        };
    }

    // No packet is sent: connect() on a datagram socket only selects the route
    // and binds the source address.
    if (::connect(sock, reinterpret_cast<sockaddr *>(& target_addr), target_len) != 0) {
        auto errtext = pfs::system_error_text();
        ::close(sock);

        throw error {
              make_error_code(errc::detection_error)
            , tr::f_("no route to {}", _target)
            , errtext
        };
    }

    sockaddr_storage local_addr;
    socklen_t local_len = sizeof(local_addr);

    std::memset(& local_addr, 0, sizeof(local_addr));

    auto rc = ::getsockname(sock, reinterpret_cast<sockaddr *>(& local_addr), & local_len);
    auto errtext = rc != 0 ? pfs::system_error_text() : std::string{};

    ::close(sock);

    if (rc != 0) {
        throw error {
              make_error_code(errc::detection_error)
            , tr::_("get local socket address failure")
            , errtext
        };
    }

    char buf[INET6_ADDRSTRLEN];
    char const * result = nullptr;

    if (local_addr.ss_family == AF_INET) {
        result = inet_ntop(AF_INET, & reinterpret_cast<sockaddr_in *>(& local_addr)->sin_addr
            , buf, sizeof(buf));
    } else if (local_addr.ss_family == AF_INET6) {
        result = inet_ntop(AF_INET6, & reinterpret_cast<sockaddr_in6 *>(& local_addr)->sin6_addr
            , buf, sizeof(buf));
    }

    if (result == nullptr) {
        throw error {
              make_error_code(errc::detection_error)
            , tr::_("unexpected local socket address")
        };
    }

    return std::string{result};
}

IPWATCH__NAMESPACE_END
