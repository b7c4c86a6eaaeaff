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
#include "ipwatch/netlink_tracker.hpp"
#include <atomic>
#include <chrono>

TEST_CASE("unknown interface") {
    try {
        ipwatch::netlink_tracker t {ipwatch::address_family::inet4, "no-such-iface0"};
        FAIL("interface resolved");
    } catch (ipwatch::error const & ex) {
        CHECK_EQ(ex.code(), ipwatch::make_error_code(ipwatch::errc::resolution_error));
    }
}

TEST_CASE("loopback interface") {
    ipwatch::netlink_tracker t {ipwatch::address_family::inet4, "lo"};

    CHECK_EQ(t.iface_name(), "lo");
    CHECK_GT(t.iface_index(), 0u);

    // 127.0.0.1 has host scope
    try {
        t.get_current();
        FAIL("global address found on loopback interface");
    } catch (ipwatch::error const & ex) {
        CHECK_EQ(ex.code(), ipwatch::make_error_code(ipwatch::errc::detection_error));
    }
}

TEST_CASE("start and stop") {
    std::atomic<int> notify_counter {0};
    ipwatch::netlink_tracker t {ipwatch::address_family::inet4, "lo"};

    t.register_callback([& notify_counter] (std::string const &) {
        ++notify_counter;
    });

    CHECK_NOTHROW(t.stop());

    t.start();
    tools::sleep_ms(50);

    auto start = std::chrono::steady_clock::now();
    t.stop();
    auto elapsed = std::chrono::steady_clock::now() - start;

    // Blocking receive is interrupted
    CHECK_LT(elapsed, std::chrono::seconds{2});
    CHECK_EQ(notify_counter.load(), 0);

    CHECK_NOTHROW(t.stop());
}
