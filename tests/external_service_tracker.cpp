////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `ipwatch`.
//
// Changelog:
//      2026.10.19 Initial version.
//      2026.10.20 Body is returned as is, timeout and broken transfer cases.
////////////////////////////////////////////////////////////////////////////////
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "tools.hpp"
#include "ipwatch/error.hpp"
#include "ipwatch/external_service_tracker.hpp"
#include <atomic>
#include <mutex>
#include <string>

using ipwatch::address_family;
using ipwatch::external_service_tracker;

namespace {

void check_detection_error (external_service_tracker & t)
{
    try {
        t.get_current();
        FAIL("address detected");
    } catch (ipwatch::error const & ex) {
        CHECK_EQ(ex.code(), ipwatch::make_error_code(ipwatch::errc::detection_error));
    }
}

} // namespace

TEST_CASE("default endpoints") {
    external_service_tracker t4 {address_family::inet4, std::chrono::seconds{60}};
    external_service_tracker t6 {address_family::inet6, std::chrono::seconds{60}};

    CHECK_EQ(t4.url(), std::string{external_service_tracker::DEFAULT_INET4_URL});
    CHECK_EQ(t6.url(), std::string{external_service_tracker::DEFAULT_INET6_URL});
    CHECK_EQ(t4.update_interval(), std::chrono::seconds{60});

    // Address pushed to DNS must not be forgeable on the network path
    CHECK_EQ(t4.url().compare(0, 8, "https://"), 0);
    CHECK_EQ(t6.url().compare(0, 8, "https://"), 0);
}

TEST_CASE("response body is the address") {
    SUBCASE("plain") {
        tools::http_responder server {tools::make_response(200, "OK", "198.51.100.23")};
        REQUIRE_GT(server.port(), 0);

        external_service_tracker t {address_family::inet4, std::chrono::seconds{60}
            , server.url(), std::chrono::seconds{5}};

        CHECK_EQ(t.url(), server.url());
        CHECK_EQ(t.get_current(), "198.51.100.23");
    }

    SUBCASE("body is not altered") {
        tools::http_responder server {tools::make_response(200, "OK", "2001:db8::23\n")};
        REQUIRE_GT(server.port(), 0);

        external_service_tracker t {address_family::inet6, std::chrono::seconds{60}
            , server.url(), std::chrono::seconds{5}};

        CHECK_EQ(t.get_current(), "2001:db8::23\n");
    }
}

TEST_CASE("service failures") {
    SUBCASE("error status") {
        tools::http_responder server {tools::make_response(503, "Service Unavailable", "try later")};
        REQUIRE_GT(server.port(), 0);

        external_service_tracker t {address_family::inet4, std::chrono::seconds{60}
            , server.url(), std::chrono::seconds{5}};

        check_detection_error(t);
    }

    SUBCASE("empty body") {
        tools::http_responder server {tools::make_response(200, "OK", "")};
        REQUIRE_GT(server.port(), 0);

        external_service_tracker t {address_family::inet4, std::chrono::seconds{60}
            , server.url(), std::chrono::seconds{5}};

        check_detection_error(t);
    }

    SUBCASE("service is unreachable") {
        auto port = tools::unused_loopback_port();
        REQUIRE_GT(port, 0);

        external_service_tracker t {address_family::inet4, std::chrono::seconds{60}
            , "http://127.0.0.1:" + std::to_string(port) + "/", std::chrono::seconds{5}};

        check_detection_error(t);
    }

    SUBCASE("broken chunked transfer") {
        tools::http_responder server {
              "HTTP/1.1 200 OK\r\n"
              "Transfer-Encoding: chunked\r\n"
              "Connection: close\r\n"
              "\r\n"
              "FFFFFFFFFFFFFFED\r\n"
              "203.0.113.7\r\n"
              "0\r\n"
              "\r\n"
        };

        REQUIRE_GT(server.port(), 0);

        external_service_tracker t {address_family::inet4, std::chrono::seconds{60}
            , server.url(), std::chrono::seconds{5}};

        check_detection_error(t);
    }
}

TEST_CASE("service does not respond in time") {
    tools::http_responder server {std::string{}};
    REQUIRE_GT(server.port(), 0);

    external_service_tracker t {address_family::inet4, std::chrono::seconds{60}
        , server.url(), std::chrono::milliseconds{300}};

    auto start = std::chrono::steady_clock::now();
    check_detection_error(t);
    auto elapsed = std::chrono::steady_clock::now() - start;

    CHECK_GE(elapsed, std::chrono::milliseconds{250});
    CHECK_LT(elapsed, std::chrono::seconds{3});
}

TEST_CASE("periodic polling") {
    tools::http_responder server {tools::make_response(200, "OK", "198.51.100.23")};
    REQUIRE_GT(server.port(), 0);

    std::mutex mtx;
    std::string last_addr;
    std::atomic<int> notify_counter {0};

    external_service_tracker t {address_family::inet4, std::chrono::milliseconds{30}
        , server.url(), std::chrono::seconds{5}};

    t.register_callback([&] (std::string const & addr) {
        std::unique_lock<std::mutex> locker(mtx);
        last_addr = addr;
        ++notify_counter;
    });

    t.start();
    REQUIRE(tools::wait_atomic_counter(notify_counter, 2));
    t.stop();

    std::unique_lock<std::mutex> locker(mtx);
    CHECK_EQ(last_addr, "198.51.100.23");
    CHECK_GE(server.request_count(), 2);
}
