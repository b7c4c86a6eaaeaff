////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `ipwatch`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "ipwatch/netlink_tracker.hpp"
#include "ipwatch/utils/rtnetlink.hpp"
#include "pfs/i18n.hpp"
#include "pfs/log.hpp"
#include <libmnl/libmnl.h>
#include <linux/rtnetlink.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>
#include <cerrno>
#include <exception>
#include <vector>

IPWATCH__NAMESPACE_BEGIN

static constexpr char const * TAG = "ipwatch::netlink";

// One-shot queries never block longer
static constexpr std::chrono::milliseconds QUERY_TIMEOUT {5000};

netlink_tracker::netlink_tracker (address_family family, std::string const & iface_name)
    : _family(family)
{
    utils::netlink_socket nls {utils::netlink_socket::type_enum::route};
    std::vector<utils::route_record> routes;
    error err;

    nls.set_receive_timeout(QUERY_TIMEOUT, & err);

    auto links = err ? std::vector<utils::link_record>{} : utils::fetch_links(nls, & err);

    if (!err && iface_name.empty())
        routes = utils::fetch_routes(nls, family, & err);

    if (err) {
        throw error {
              make_error_code(errc::resolution_error)
            , tr::_("query network interfaces failure")
            , err.what()
        };
    }

    auto link = utils::resolve_interface(links, routes, family, iface_name);

    _iface_index = link.index;
    _iface_name = link.name;

    LOGI(TAG, "Using interface {} (index={}) for {} address tracking"
        , _iface_name, _iface_index, to_string(_family));
}

netlink_tracker::~netlink_tracker ()
{
    stop();
}

std::string netlink_tracker::get_current ()
{
    try {
        utils::netlink_socket nls {utils::netlink_socket::type_enum::route};
        nls.set_receive_timeout(QUERY_TIMEOUT);

        auto addrs = utils::fetch_addresses(nls, _family);

        for (auto const & rec: addrs) {
            if (utils::is_global_address(rec, _family, _iface_index))
                return rec.addr;
        }
    } catch (error const & ex) {
        throw error {
              make_error_code(errc::detection_error)
            , tr::f_("query {} address of interface {} failure", to_string(_family), _iface_name)
            , ex.what()
        };
    }

    throw error {
          make_error_code(errc::detection_error)
        , tr::f_("no global {} address assigned to interface {}", to_string(_family), _iface_name)
    };
}

void netlink_tracker::start ()
{
    if (_th.joinable()) {
        LOGW(TAG, "Tracker already started");
        return;
    }

    unsigned int groups = _family == address_family::inet4
        ? RTMGRP_IPV4_IFADDR
        : RTMGRP_IPV6_IFADDR;

    _nls = utils::netlink_socket {utils::netlink_socket::type_enum::route, groups};

    _epoll_id = epoll_create1(EPOLL_CLOEXEC);

    if (_epoll_id < 0) {
        auto errtext = pfs::system_error_text();
        release();
        throw error {tr::f_("epoll create failure: {}", errtext)};
    }

    _wakeup_id = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);

    if (_wakeup_id < 0) {
        auto errtext = pfs::system_error_text();
        release();
        throw error {tr::f_("eventfd create failure: {}", errtext)};
    }

    for (int fd: {_nls.native(), _wakeup_id}) {
        epoll_event ev;
        ev.events = EPOLLIN | EPOLLERR;
        ev.data.fd = fd;

        if (epoll_ctl(_epoll_id, EPOLL_CTL_ADD, fd, & ev) != 0) {
            auto errtext = pfs::system_error_text();
            release();
            throw error {tr::f_("epoll add socket ({}) failure: {}", fd, errtext)};
        }
    }

    _th = std::thread {& netlink_tracker::run, this};

    LOGD(TAG, "Started");
}

void netlink_tracker::stop ()
{
    interrupt();

    if (_wakeup_id >= 0) {
        std::uint64_t value = 1;

        if (::write(_wakeup_id, & value, sizeof(value)) < 0)
            LOGE(TAG, "wake up event loop failure: {}", pfs::system_error_text());
    }

    if (_th.joinable()) {
        _th.join();
        LOGD(TAG, "Stopped");
    }

    release();
}

void netlink_tracker::release ()
{
    if (_wakeup_id >= 0) {
        ::close(_wakeup_id);
        _wakeup_id = -1;
    }

    if (_epoll_id >= 0) {
        ::close(_epoll_id);
        _epoll_id = -1;
    }

    _nls.close();
}

void netlink_tracker::run ()
{
    static constexpr int MAX_EVENTS = 2;
    std::vector<char> buf(MNL_SOCKET_BUFFER_SIZE);

    while (!interrupted()) {
        epoll_event events[MAX_EVENTS];

        auto n = epoll_wait(_epoll_id, events, MAX_EVENTS, -1);

        if (n < 0) {
            // Is not a critical error, ignore it
            if (errno == EINTR)
                continue;

            LOGE(TAG, "epoll wait failure: {}", pfs::system_error_text());
            break;
        }

        for (int i = 0; i < n; i++) {
            if (events[i].data.fd != _nls.native())
                continue;

            error err;
            auto len = _nls.recv(buf.data(), static_cast<int>(buf.size()), & err);

            // Subscription is dead, recovery is up to the supervisor
            if (len < 0) {
                LOGE(TAG, "{}", err.what());
                return;
            }

            auto nlh = reinterpret_cast<nlmsghdr const *>(buf.data());

            while (mnl_nlmsg_ok(nlh, len)) {
                utils::address_record rec;

                if (utils::parse_address_message(nlh, rec)
                        && utils::is_global_address(rec, _family, _iface_index)) {

                    LOGD(TAG, "Address added to interface {}: {}", _iface_name, rec.addr);

                    try {
                        notify(rec.addr);
                    } catch (std::exception const & ex) {
                        LOGE(TAG, "address change callback failure: {}", ex.what());
                    }
                }

                nlh = mnl_nlmsg_next(nlh, & len);
            }
        }
    }
}

IPWATCH__NAMESPACE_END
