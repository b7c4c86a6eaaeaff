////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `ipwatch`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "tools.hpp"
#include "ipwatch/error.hpp"
#include "ipwatch/outbound_socket_tracker.hpp"
#include <atomic>

using ipwatch::address_family;
using ipwatch::outbound_socket_tracker;

TEST_CASE("default targets") {
    outbound_socket_tracker t4 {address_family::inet4, std::chrono::seconds{60}};
    outbound_socket_tracker t6 {address_family::inet6, std::chrono::seconds{60}};

    CHECK_EQ(t4.target(), std::string{outbound_socket_tracker::DEFAULT_INET4_TARGET});
    CHECK_EQ(t6.target(), std::string{outbound_socket_tracker::DEFAULT_INET6_TARGET});
}

TEST_CASE("source address towards loopback target") {
    outbound_socket_tracker t {address_family::inet4, std::chrono::seconds{60}, "127.0.0.1"};
    CHECK_EQ(t.get_current(), "127.0.0.1");
}

TEST_CASE("bad target") {
    SUBCASE("not an address") {
        outbound_socket_tracker t {address_family::inet4, std::chrono::seconds{60}, "localhost"};
        CHECK_THROWS_AS(t.get_current(), ipwatch::error);
    }

    SUBCASE("family mismatch") {
        outbound_socket_tracker t {address_family::inet4, std::chrono::seconds{60}, "::1"};

        try {
            t.get_current();
            FAIL("address detected");
        } catch (ipwatch::error const & ex) {
            CHECK_EQ(ex.code(), ipwatch::make_error_code(ipwatch::errc::detection_error));
        }
    }
}

TEST_CASE("periodic polling") {
    std::atomic<int> notify_counter {0};
    outbound_socket_tracker t {address_family::inet4, std::chrono::milliseconds{20}, "127.0.0.1"};

    t.register_callback([& notify_counter] (std::string const & addr) {
        if (addr == "127.0.0.1")
            ++notify_counter;
    });

    t.start();
    CHECK(tools::wait_atomic_counter(notify_counter, 2));
    t.stop();
}
