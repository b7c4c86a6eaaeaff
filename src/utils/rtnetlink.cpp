////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `ipwatch`.
//
// References:
//      1. man 7 rtnetlink
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "ipwatch/utils/rtnetlink.hpp"
#include "pfs/i18n.hpp"
#include <libmnl/libmnl.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <algorithm>
#include <utility>

IPWATCH__NAMESPACE_BEGIN

namespace utils {

template <typename MsgType>
static MsgType const * cast_payload (nlmsghdr const * nlh)
{
    if (nlh->nlmsg_len < NLMSG_LENGTH(sizeof(MsgType)))
        return nullptr;

    return static_cast<MsgType const *>(mnl_nlmsg_get_payload(nlh));
}

template <typename Visitor>
static bool foreach_attr (nlmsghdr const * nlh, std::size_t offset, Visitor && visitor)
{
    auto tail = static_cast<char const *>(mnl_nlmsg_get_payload_tail(nlh));

    for (auto attr = static_cast<nlattr const *>(mnl_nlmsg_get_payload_offset(nlh, offset))
            ; mnl_attr_ok(attr, static_cast<int>(tail - reinterpret_cast<char const *>(attr)))
            ; attr = mnl_attr_next(attr)) {

        if (!visitor(attr))
            return false;
    }

    return true;
}

static bool address_to_string (int family, nlattr const * attr, std::string & result)
{
    auto len = mnl_attr_get_payload_len(attr);
    auto data = mnl_attr_get_payload(attr);

    if (family == AF_INET && len == sizeof(in_addr)) {
        char buf[INET_ADDRSTRLEN];

        if (inet_ntop(AF_INET, data, buf, sizeof(buf)) == nullptr)
            return false;

        result = buf;
        return true;
    }

    if (family == AF_INET6 && len == sizeof(in6_addr)) {
        char buf[INET6_ADDRSTRLEN];

        if (inet_ntop(AF_INET6, data, buf, sizeof(buf)) == nullptr)
            return false;

        result = buf;
        return true;
    }

    return false;
}

bool parse_link_message (nlmsghdr const * nlh, link_record & rec)
{
    if (nlh->nlmsg_type != RTM_NEWLINK)
        return false;

    auto ifi = cast_payload<ifinfomsg>(nlh);

    if (ifi == nullptr)
        return false;

    rec.index = static_cast<std::uint32_t>(ifi->ifi_index);
    rec.name.clear();

    auto success = foreach_attr(nlh, sizeof(*ifi), [& rec] (nlattr const * attr) {
        if (mnl_attr_get_type(attr) == IFLA_IFNAME) {
            if (mnl_attr_validate(attr, MNL_TYPE_STRING) < 0)
                return false;

            rec.name = mnl_attr_get_str(attr);
        }

        return true;
    });

    return success && !rec.name.empty();
}

bool parse_route_message (nlmsghdr const * nlh, route_record & rec)
{
    if (nlh->nlmsg_type != RTM_NEWROUTE)
        return false;

    auto rtm = cast_payload<rtmsg>(nlh);

    if (rtm == nullptr)
        return false;

    rec.family    = rtm->rtm_family;
    rec.dst_len   = rtm->rtm_dst_len;
    rec.type      = rtm->rtm_type;
    rec.table     = rtm->rtm_table;
    rec.oif_index = 0;

    return foreach_attr(nlh, sizeof(*rtm), [& rec] (nlattr const * attr) {
        switch (mnl_attr_get_type(attr)) {
            // Table identifiers above 255 are passed in attribute only
            case RTA_TABLE:
                if (mnl_attr_validate(attr, MNL_TYPE_U32) < 0)
                    return false;

                rec.table = mnl_attr_get_u32(attr);
                break;

            case RTA_OIF:
                if (mnl_attr_validate(attr, MNL_TYPE_U32) < 0)
                    return false;

                rec.oif_index = mnl_attr_get_u32(attr);
                break;

            default:
                break;
        }

        return true;
    });
}

bool parse_address_message (nlmsghdr const * nlh, address_record & rec)
{
    if (nlh->nlmsg_type != RTM_NEWADDR)
        return false;

    auto ifa = cast_payload<ifaddrmsg>(nlh);

    if (ifa == nullptr)
        return false;

    rec.family = ifa->ifa_family;
    rec.index  = ifa->ifa_index;
    rec.scope  = ifa->ifa_scope;
    rec.addr.clear();

    std::string local_addr;
    std::string peer_addr;
    auto family = rec.family;

    foreach_attr(nlh, sizeof(*ifa), [family, & local_addr, & peer_addr] (nlattr const * attr) {
        switch (mnl_attr_get_type(attr)) {
            case IFA_LOCAL:
                address_to_string(family, attr, local_addr);
                break;
            case IFA_ADDRESS:
                address_to_string(family, attr, peer_addr);
                break;
            default:
                break;
        }

        return true;
    });

    // For point-to-point interfaces IFA_ADDRESS is the peer address
    rec.addr = local_addr.empty() ? std::move(peer_addr) : std::move(local_addr);

    return !rec.addr.empty();
}

bool is_default_route (route_record const & rec, address_family family) noexcept
{
    return rec.family == native_family(family)
        && rec.dst_len == 0
        && rec.type == RTN_UNICAST
        && rec.table == RT_TABLE_MAIN
        && rec.oif_index != 0;
}

bool is_global_address (address_record const & rec, address_family family
    , std::uint32_t iface_index) noexcept
{
    return rec.family == native_family(family)
        && rec.scope == RT_SCOPE_UNIVERSE
        && rec.index == iface_index
        && !rec.addr.empty();
}

std::vector<link_record> fetch_links (netlink_socket & nls, error * perr)
{
    std::vector<link_record> result;

    nls.dump(RTM_GETLINK, AF_UNSPEC, [& result] (nlmsghdr const * nlh) {
        link_record rec;

        if (parse_link_message(nlh, rec))
            result.push_back(std::move(rec));
    }, perr);

    return result;
}

std::vector<route_record> fetch_routes (netlink_socket & nls, address_family family, error * perr)
{
    std::vector<route_record> result;

    nls.dump(RTM_GETROUTE, native_family(family), [& result] (nlmsghdr const * nlh) {
        route_record rec;

        if (parse_route_message(nlh, rec))
            result.push_back(rec);
    }, perr);

    return result;
}

std::vector<address_record> fetch_addresses (netlink_socket & nls, address_family family, error * perr)
{
    std::vector<address_record> result;

    nls.dump(RTM_GETADDR, native_family(family), [& result] (nlmsghdr const * nlh) {
        address_record rec;

        if (parse_address_message(nlh, rec))
            result.push_back(std::move(rec));
    }, perr);

    return result;
}

link_record resolve_interface (std::vector<link_record> const & links
    , std::vector<route_record> const & routes
    , address_family family
    , std::string const & iface_name)
{
    if (iface_name.empty()) {
        auto route_pos = std::find_if(routes.begin(), routes.end()
            , [family] (route_record const & r) { return is_default_route(r, family); });

        if (route_pos == routes.end()) {
            throw error {
                  make_error_code(errc::resolution_error)
                , tr::f_("no interface name given and no default {} route set", to_string(family))
            };
        }

        auto oif_index = route_pos->oif_index;

        auto link_pos = std::find_if(links.begin(), links.end()
            , [oif_index] (link_record const & l) { return l.index == oif_index; });

        if (link_pos == links.end()) {
            throw error {
                  make_error_code(errc::resolution_error)
                , tr::f_("default route interface not found: index={}", oif_index)
            };
        }

        return *link_pos;
    }

    auto count = std::count_if(links.begin(), links.end()
        , [& iface_name] (link_record const & l) { return l.name == iface_name; });

    if (count != 1) {
        throw error {
              make_error_code(errc::resolution_error)
            , tr::f_("found {} interfaces matching the interface name: {}", count, iface_name)
        };
    }

    return *std::find_if(links.begin(), links.end()
        , [& iface_name] (link_record const & l) { return l.name == iface_name; });
}

} // namespace utils

IPWATCH__NAMESPACE_END
