////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `ipwatch`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "namespace.hpp"
#include "address_tracker.hpp"
#include "callback.hpp"
#include "exports.hpp"
#include "interruptable.hpp"
#include <pfs/optional.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

IPWATCH__NAMESPACE_BEGIN

/**
 * Supervises address tracker.
 *
 * Owns at most one tracker at a time, suppresses repeated notifications of
 * the same address and recreates the tracker every @c autorestart_interval
 * to recover from a silently dead detector. Exceptions raised while starting
 * or stopping a tracker are logged and never leave the supervisory thread.
 */
class monitor: private interruptable
{
public:
    using tracker_factory = callback_t<std::unique_ptr<address_tracker> ()>;

private:
    enum class state_enum { idle, running, stopped };

private:
    tracker_factory _tracker_factory;
    address_callback_t _callback;
    std::chrono::milliseconds _autorestart_interval;

    // Accessed from supervisory thread only
    std::unique_ptr<address_tracker> _tracker;

    std::thread _th;
    std::mutex _join_mtx;
    mutable std::mutex _state_mtx;
    state_enum _state {state_enum::idle};

    // Serializes dedup and consumer call (initial observation of the
    // supervisory thread may race with the tracker thread)
    std::mutex _notify_mtx;

    mutable std::mutex _addr_mtx;
    pfs::optional<std::string> _last_addr;

    std::atomic<std::size_t> _start_counter {0};

public:
    /**
     * @param factory Produces a fresh tracker instance on each call.
     * @param callback Consumer of distinct address changes (may be empty).
     * @param autorestart_interval Tracker recreation period.
     */
    IPWATCH__EXPORT monitor (tracker_factory factory, address_callback_t callback
        , std::chrono::milliseconds autorestart_interval);

    IPWATCH__EXPORT ~monitor ();

    monitor (monitor const &) = delete;
    monitor & operator = (monitor const &) = delete;

public:
    /**
     * Starts supervisory thread.
     *
     * @throw ipwatch::error with errc::lifecycle_error if monitor is already
     *        running or stopped.
     */
    IPWATCH__EXPORT void start ();

    /**
     * Stops supervisory thread and the current tracker. Blocks until the
     * thread has exited. Subsequent calls have no effect.
     */
    IPWATCH__EXPORT void stop ();

    IPWATCH__EXPORT bool is_running () const;

    /**
     * Last address delivered to the consumer.
     */
    IPWATCH__EXPORT pfs::optional<std::string> last_address () const;

    /**
     * Number of tracker start attempts (successful or not).
     */
    std::size_t start_count () const noexcept
    {
        return _start_counter.load();
    }

    bool has_callback () const noexcept
    {
        return static_cast<bool>(_callback);
    }

private:
    void run ();
    void start_tracker ();
    void stop_tracker ();
    void address_updated (std::string const & addr);
};

IPWATCH__NAMESPACE_END
