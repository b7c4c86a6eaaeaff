////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `ipwatch`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "ipwatch/monitor.hpp"
#include "ipwatch/error.hpp"
#include "pfs/i18n.hpp"
#include "pfs/log.hpp"
#include <exception>
#include <utility>

IPWATCH__NAMESPACE_BEGIN

static constexpr char const * TAG = "ipwatch::monitor";

monitor::monitor (tracker_factory factory, address_callback_t callback
    , std::chrono::milliseconds autorestart_interval)
    : _tracker_factory(std::move(factory))
    , _callback(std::move(callback))
    , _autorestart_interval(autorestart_interval)
{}

monitor::~monitor ()
{
    stop();
}

void monitor::start ()
{
    std::unique_lock<std::mutex> locker(_state_mtx);

    if (_state != state_enum::idle) {
        throw error {
              make_error_code(errc::lifecycle_error)
            , _state == state_enum::running
                ? tr::_("monitor already running")
                : tr::_("monitor is stopped and can not be restarted")
        };
    }

    _state = state_enum::running;
    _th = std::thread {& monitor::run, this};

    LOGD(TAG, "Started: auto restart interval {} ms", _autorestart_interval.count());
}

void monitor::stop ()
{
    // Consumer may query the state while the supervisory thread is joined,
    // so the state lock is released before joining
    std::unique_lock<std::mutex> join_locker(_join_mtx);

    {
        std::unique_lock<std::mutex> locker(_state_mtx);

        // Never started monitor becomes unusable too
        _state = state_enum::stopped;
    }

    interrupt();

    if (_th.joinable()) {
        _th.join();
        LOGD(TAG, "Stopped");
    }
}

bool monitor::is_running () const
{
    std::unique_lock<std::mutex> locker(_state_mtx);
    return _state == state_enum::running;
}

pfs::optional<std::string> monitor::last_address () const
{
    std::unique_lock<std::mutex> locker(_addr_mtx);
    return _last_addr;
}

void monitor::run ()
{
    start_tracker();

    while (!interrupted_or_wait_for(_autorestart_interval)) {
        stop_tracker();
        LOGD(TAG, "Restarting tracker...");
        start_tracker();
    }

    stop_tracker();
}

void monitor::start_tracker ()
{
    ++_start_counter;

    try {
        if (!_tracker_factory) {
            throw error {
                  make_error_code(errc::lifecycle_error)
                , tr::_("no tracker factory")
            };
        }

        _tracker = _tracker_factory();

        if (!_tracker) {
            throw error {
                  make_error_code(errc::lifecycle_error)
                , tr::_("tracker factory produced no tracker")
            };
        }

        _tracker->register_callback([this] (std::string const & addr) {
            address_updated(addr);
        });

        _tracker->start();

        // Initial observation
        address_updated(_tracker->get_current());
    } catch (std::exception const & ex) {
        LOGE(TAG, "{}: {}", make_error_code(errc::lifecycle_error).message()
            , tr::f_("exception on starting tracker: {}", ex.what()));
    } catch (...) {
        LOGE(TAG, "{}: {}", make_error_code(errc::lifecycle_error).message()
            , tr::_("unknown exception on starting tracker"));
    }
}

void monitor::stop_tracker ()
{
    if (!_tracker)
        return;

    try {
        _tracker->stop();
    } catch (std::exception const & ex) {
        LOGE(TAG, "{}: {}", make_error_code(errc::lifecycle_error).message()
            , tr::f_("exception on stopping tracker: {}", ex.what()));
    } catch (...) {
        LOGE(TAG, "{}: {}", make_error_code(errc::lifecycle_error).message()
            , tr::_("unknown exception on stopping tracker"));
    }

    // Tracker thread is joined at this point (or never existed)
    _tracker.reset();
}

void monitor::address_updated (std::string const & addr)
{
    std::unique_lock<std::mutex> notify_locker(_notify_mtx);

    {
        std::unique_lock<std::mutex> locker(_addr_mtx);

        if (_last_addr && *_last_addr == addr)
            return;

        _last_addr = addr;
    }

    LOGI(TAG, "Address changed: {}", addr);

    if (_callback)
        _callback(addr);
}

IPWATCH__NAMESPACE_END
