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
#include "ipwatch/utils/netlink_socket.hpp"
#include "pfs/i18n.hpp"
#include <libmnl/libmnl.h>
#include <linux/rtnetlink.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <utility>
#include <vector>

IPWATCH__NAMESPACE_BEGIN

namespace utils {

// Dump replies are batched by the kernel into datagrams up to 32K
static constexpr std::size_t DUMP_BUFFER_SIZE = 32768;

static int data_cb (nlmsghdr const * nlh, void * data)
{
    auto visitor = static_cast<callback_t<void (nlmsghdr const *)> *>(data);

    if (*visitor)
        (*visitor)(nlh);

    return MNL_CB_OK;
}

netlink_socket::netlink_socket () = default;

netlink_socket::netlink_socket (type_enum netlinktype, unsigned int groups)
{
    switch (netlinktype) {
        case type_enum::route:
            _socket = mnl_socket_open(NETLINK_ROUTE);
            break;
    }

    if (_socket == nullptr)
        throw error {tr::f_("create netlink socket failure: {}", pfs::system_error_text())};

    auto rc = mnl_socket_bind(_socket, groups, MNL_SOCKET_AUTOPID);

    if (rc < 0) {
        auto errtext = pfs::system_error_text();
        mnl_socket_close(_socket);
        _socket = nullptr;
        throw error {tr::f_("bind netlink socket failure: {}", errtext)};
    }
}

netlink_socket::~netlink_socket ()
{
    close();
}

netlink_socket::netlink_socket (netlink_socket && other)
{
    this->operator = (std::move(other));
}

netlink_socket & netlink_socket::operator = (netlink_socket && other)
{
    if (this != & other) {
        close();
        _socket = other._socket;
        _seq = other._seq;
        other._socket = nullptr;
    }

    return *this;
}

netlink_socket::native_type netlink_socket::native () const noexcept
{
    if (_socket == nullptr)
        return kINVALID_SOCKET;

    return mnl_socket_get_fd(_socket);
}

std::uint32_t netlink_socket::portid () const noexcept
{
    if (_socket == nullptr)
        return 0;

    return mnl_socket_get_portid(_socket);
}

void netlink_socket::close ()
{
    if (_socket != nullptr)
        mnl_socket_close(_socket);

    _socket = nullptr;
}

bool netlink_socket::set_receive_timeout (std::chrono::milliseconds timeout, error * perr)
{
    timeval tv;
    tv.tv_sec  = static_cast<decltype(tv.tv_sec)>(timeout.count() / 1000);
    tv.tv_usec = static_cast<decltype(tv.tv_usec)>((timeout.count() % 1000) * 1000);

    auto rc = ::setsockopt(native(), SOL_SOCKET, SO_RCVTIMEO, & tv, sizeof(tv));

    if (rc != 0) {
        pfs::throw_or(perr, error {
            tr::f_("set netlink socket receive timeout failure: {}", pfs::system_error_text())
        });

        return false;
    }

    return true;
}

int netlink_socket::recv (char * data, int len, error * perr)
{
    auto n = static_cast<int>(mnl_socket_recvfrom(_socket, data, static_cast<std::size_t>(len)));

    if (n < 0) {
        pfs::throw_or(perr, error {
            tr::f_("receive data from Netlink socket failure: {}", pfs::system_error_text())
        });

        return n;
    }

    return n;
}

int netlink_socket::send (char const * req, int len, error * perr)
{
    auto n = static_cast<int>(mnl_socket_sendto(_socket, req, static_cast<std::size_t>(len)));

    if (n < 0) {
        pfs::throw_or(perr, error {
            tr::f_("send netlink request failure: {}", pfs::system_error_text())
        });

        return n;
    }

    return n;
}

bool netlink_socket::dump (std::uint16_t msg_type, int family
    , callback_t<void (nlmsghdr const *)> visitor
    , error * perr)
{
    std::vector<char> buf(DUMP_BUFFER_SIZE);

    auto nlh = mnl_nlmsg_put_header(buf.data());
    nlh->nlmsg_type  = msg_type;
    nlh->nlmsg_flags = NLM_F_REQUEST | NLM_F_DUMP;
    nlh->nlmsg_seq   = ++_seq;

    switch (msg_type) {
        case RTM_GETLINK: {
            auto ifi = static_cast<ifinfomsg *>(mnl_nlmsg_put_extra_header(nlh, sizeof(ifinfomsg)));
            ifi->ifi_family = static_cast<unsigned char>(family);
            break;
        }

        case RTM_GETROUTE: {
            auto rtm = static_cast<rtmsg *>(mnl_nlmsg_put_extra_header(nlh, sizeof(rtmsg)));
            rtm->rtm_family = static_cast<unsigned char>(family);
            break;
        }

        case RTM_GETADDR: {
            auto ifa = static_cast<ifaddrmsg *>(mnl_nlmsg_put_extra_header(nlh, sizeof(ifaddrmsg)));
            ifa->ifa_family = static_cast<unsigned char>(family);
            break;
        }

        default:
            pfs::throw_or(perr, error {
                tr::f_("unsupported netlink dump request: {}", msg_type)
            });

            return false;
    }

    auto seq = nlh->nlmsg_seq;

    if (send(reinterpret_cast<char const *>(nlh), static_cast<int>(nlh->nlmsg_len), perr) < 0)
        return false;

    auto n = recv(buf.data(), static_cast<int>(buf.size()), perr);

    while (n > 0) {
        auto rc = mnl_cb_run(buf.data(), static_cast<std::size_t>(n), seq, portid(), & data_cb, & visitor);

        if (rc == MNL_CB_ERROR) {
            pfs::throw_or(perr, error {
                tr::f_("netlink dump reply failure: {}", pfs::system_error_text())
            });

            return false;
        }

        // NLMSG_DONE reached
        if (rc == MNL_CB_STOP)
            break;

        n = recv(buf.data(), static_cast<int>(buf.size()), perr);
    }

    return n >= 0;
}

} // namespace utils

IPWATCH__NAMESPACE_END
