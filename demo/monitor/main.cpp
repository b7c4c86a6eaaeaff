////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `ipwatch`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "ipwatch/monitor.hpp"
#include "ipwatch/tracker_options.hpp"
#include <pfs/argvapi.hpp>
#include <pfs/filesystem.hpp>
#include <pfs/fmt.hpp>
#include <pfs/integer.hpp>
#include <pfs/log.hpp>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <thread>
#include <signal.h>

namespace fs = pfs::filesystem;

static constexpr char const * TAG = "ipwatch-demo";

static std::atomic_bool s_quit_flag {false};

static void sigterm_handler (int /*sig*/)
{
    s_quit_flag.store(true);
}

static void print_usage (fs::path const & programName
    , std::string const & errorString = std::string{})
{
    if (!errorString.empty())
        LOGE(TAG, "{}", errorString);

    fmt::println("Usage:\n\n"
        "{0} --help | -h\n"
        "{0} [--strategy=netlink|external|socket] [--inet6] [--iface=NAME]\n"
        "\t\t[--interval=SECONDS] [--restart=SECONDS] [--url=URL] [--target=ADDR]\n\n"

        "Options:\n\n"
        "--help | -h\n"
        "\tPrint this help and exit\n"
        "--strategy=netlink|external|socket\n"
        "\tAddress detection strategy (default is netlink)\n"
        "--inet6\n"
        "\tTrack IPv6 address instead of IPv4\n"
        "--iface=NAME\n"
        "\tInterface to track by netlink strategy (default route interface by default)\n"
        "--interval=SECONDS\n"
        "\tPolling interval for external and socket strategies (default is 60)\n"
        "--restart=SECONDS\n"
        "\tTracker auto restart interval (default is 3600)\n"
        "--url=URL\n"
        "\tAddress-echo service endpoint for external strategy\n"
        "--target=ADDR\n"
        "\tNumeric address to route toward for socket strategy\n\n"

        "Examples:\n\n"
        "Track public IPv4 address polling address-echo service every 5 minutes:\n"
        "\t{0} --strategy=external --interval=300\n"
        , programName);
}

int main (int argc, char * argv[])
{
    signal(SIGINT, sigterm_handler);
    signal(SIGTERM, sigterm_handler);

    ipwatch::tracker_options opts;
    std::chrono::seconds restart_interval {3600};

    auto commandLine = pfs::make_argvapi(argc, argv);
    auto programName = commandLine.program_name();
    auto commandLineIterator = commandLine.begin();

    while (commandLineIterator.has_more()) {
        auto x = commandLineIterator.next();
        auto expectedArgError = false;

        if (x.is_option("help") || x.is_option("h")) {
            print_usage(programName);
            return EXIT_SUCCESS;
        } else if (x.is_option("strategy")) {
            if (x.has_arg()) {
                if (!ipwatch::parse_strategy(to_string(x.arg()), opts.strategy)) {
                    print_usage(programName, "Bad strategy: " + to_string(x.arg()));
                    return EXIT_FAILURE;
                }
            } else {
                expectedArgError = true;
            }
        } else if (x.is_option("inet6")) {
            opts.family = ipwatch::address_family::inet6;
        } else if (x.is_option("iface")) {
            if (x.has_arg())
                opts.iface_name = to_string(x.arg());
            else
                expectedArgError = true;
        } else if (x.is_option("interval") || x.is_option("restart")) {
            if (x.has_arg()) {
                std::error_code ec;
                auto seconds = pfs::to_integer<int>(x.arg().begin(), x.arg().end(), 1, 86400, ec);

                if (ec) {
                    print_usage(programName, "Bad interval: " + to_string(x.arg()));
                    return EXIT_FAILURE;
                }

                if (x.is_option("interval"))
                    opts.update_interval = std::chrono::seconds{seconds};
                else
                    restart_interval = std::chrono::seconds{seconds};
            } else {
                expectedArgError = true;
            }
        } else if (x.is_option("url")) {
            if (x.has_arg())
                opts.service_url = to_string(x.arg());
            else
                expectedArgError = true;
        } else if (x.is_option("target")) {
            if (x.has_arg())
                opts.target_addr = to_string(x.arg());
            else
                expectedArgError = true;
        } else {
            LOGE(TAG, "Bad arguments. Try --help option.");
            return EXIT_FAILURE;
        }

        if (expectedArgError) {
            print_usage(programName, "Expected argument for " + to_string(x.optname()));
            return EXIT_FAILURE;
        }
    }

    LOGD(TAG, "Tracking {} address using {} strategy", to_string(opts.family)
        , to_string(opts.strategy));

    ipwatch::monitor m {
          ipwatch::make_tracker_factory(opts)
        , [] (std::string const & addr) {
              LOGI(TAG, "Current address: {}", addr);
          }
        , restart_interval
    };

    m.start();

    while (!s_quit_flag.load())
        std::this_thread::sleep_for(std::chrono::milliseconds{100});

    m.stop();

    LOGD(TAG, "Finished");

    return EXIT_SUCCESS;
}
