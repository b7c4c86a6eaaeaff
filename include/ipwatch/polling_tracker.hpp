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
#include "exports.hpp"
#include "interruptable.hpp"
#include <chrono>
#include <thread>

IPWATCH__NAMESPACE_BEGIN

/**
 * Base for trackers that periodically re-evaluate the current address.
 *
 * The first get_current() call by the timer thread occurs after the first
 * full update interval. A detection failure inside the timer thread is logged
 * and ends the thread.
 *
 * NOTE Subclasses must call stop() in their destructors: the timer thread
 * calls get_current() of the most derived class.
 */
class polling_tracker: public address_tracker, private interruptable
{
    std::chrono::milliseconds _update_interval;
    std::thread _th;

protected:
    IPWATCH__EXPORT polling_tracker (std::chrono::milliseconds update_interval);

public:
    IPWATCH__EXPORT ~polling_tracker ();

public:
    IPWATCH__EXPORT void start () override;
    IPWATCH__EXPORT void stop () override;

    std::chrono::milliseconds update_interval () const noexcept
    {
        return _update_interval;
    }

private:
    void run ();
};

IPWATCH__NAMESPACE_END
