////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `ipwatch`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "ipwatch/polling_tracker.hpp"
#include "pfs/log.hpp"
#include <exception>

IPWATCH__NAMESPACE_BEGIN

static constexpr char const * TAG = "ipwatch::polling";

polling_tracker::polling_tracker (std::chrono::milliseconds update_interval)
    : _update_interval(update_interval)
{}

polling_tracker::~polling_tracker ()
{
    stop();
}

void polling_tracker::start ()
{
    if (_th.joinable()) {
        LOGW(TAG, "Tracker already started");
        return;
    }

    _th = std::thread {& polling_tracker::run, this};

    LOGD(TAG, "Started: update interval {} ms", _update_interval.count());
}

void polling_tracker::stop ()
{
    interrupt();

    if (_th.joinable()) {
        _th.join();
        LOGD(TAG, "Stopped");
    }
}

void polling_tracker::run ()
{
    while (!interrupted_or_wait_for(_update_interval)) {
        std::string addr;

        try {
            addr = get_current();
        } catch (std::exception const & ex) {
            // Not retried here, the supervisor recreates the tracker
            LOGE(TAG, "poll failure, tracker thread finished: {}", ex.what());
            return;
        }

        try {
            notify(addr);
        } catch (std::exception const & ex) {
            LOGE(TAG, "address change callback failure: {}", ex.what());
        }
    }
}

IPWATCH__NAMESPACE_END
