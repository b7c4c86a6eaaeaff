////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `ipwatch`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "../namespace.hpp"
#include "../address_family.hpp"
#include "../error.hpp"
#include "../exports.hpp"
#include "netlink_socket.hpp"
#include <linux/rtnetlink.h>
#include <cstdint>
#include <string>
#include <vector>

IPWATCH__NAMESPACE_BEGIN

namespace utils {

struct link_record
{
    std::uint32_t index {0};
    std::string name;
};

struct route_record
{
    int family {0};             // AF_INET / AF_INET6
    std::uint8_t dst_len {0};   // Destination prefix length, 0 for default route
    std::uint8_t type {RTN_UNICAST};
    std::uint32_t table {RT_TABLE_MAIN};
    std::uint32_t oif_index {0}; // Output interface index, 0 if absent
};

struct address_record
{
    int family {0};
    std::uint32_t index {0};  // Interface index
    std::uint8_t scope {0};   // RT_SCOPE_*
    std::string addr;         // Textual representation
};

/**
 * Decodes RTM_NEWLINK message.
 */
IPWATCH__EXPORT bool parse_link_message (nlmsghdr const * nlh, link_record & rec);

/**
 * Decodes RTM_NEWROUTE message.
 */
IPWATCH__EXPORT bool parse_route_message (nlmsghdr const * nlh, route_record & rec);

/**
 * Decodes RTM_NEWADDR message. Local address (IFA_LOCAL) has priority over
 * peer address (IFA_ADDRESS). Other message types are rejected.
 */
IPWATCH__EXPORT bool parse_address_message (nlmsghdr const * nlh, address_record & rec);

IPWATCH__EXPORT bool is_default_route (route_record const & rec, address_family family) noexcept;

/**
 * Checks @a rec is a global scope address of @a family assigned to interface
 * @a iface_index.
 */
IPWATCH__EXPORT bool is_global_address (address_record const & rec, address_family family
    , std::uint32_t iface_index) noexcept;

IPWATCH__EXPORT std::vector<link_record> fetch_links (netlink_socket & nls, error * perr = nullptr);

IPWATCH__EXPORT std::vector<route_record> fetch_routes (netlink_socket & nls
    , address_family family, error * perr = nullptr);

IPWATCH__EXPORT std::vector<address_record> fetch_addresses (netlink_socket & nls
    , address_family family, error * perr = nullptr);

/**
 * Selects interface by @a iface_name or, if it is empty, the output interface
 * of the first default route of @a family.
 *
 * @throw ipwatch::error with errc::resolution_error if no default route found,
 *        no interface or more than one interface matches.
 */
IPWATCH__EXPORT link_record resolve_interface (std::vector<link_record> const & links
    , std::vector<route_record> const & routes
    , address_family family
    , std::string const & iface_name);

} // namespace utils

IPWATCH__NAMESPACE_END
