////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2017-2026 Vladislav Trifochkin
//
// This file is part of `ipwatch`.
//
// Changelog:
//      2025.08.08 Initial version.
//      2026.10.19 Added `interrupted_or_wait_for`.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include "namespace.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

IPWATCH__NAMESPACE_BEGIN

class interruptable
{
private:
    std::atomic_bool _interrupted {false};
    std::mutex _mtx;
    std::condition_variable _cv;

public:
    void interrupt ()
    {
        {
            std::unique_lock<std::mutex> locker(_mtx);
            _interrupted.store(true);
        }

        _cv.notify_all();
    }

    bool interrupted () const noexcept
    {
        return _interrupted.load();
    }

    /**
     * Blocks the calling thread until interrupted or @a timeout elapsed.
     *
     * @return @c true if interrupted, @c false on timeout.
     */
    bool interrupted_or_wait_for (std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> locker(_mtx);
        return _cv.wait_for(locker, timeout, [this] { return _interrupted.load(); });
    }
};

IPWATCH__NAMESPACE_END
