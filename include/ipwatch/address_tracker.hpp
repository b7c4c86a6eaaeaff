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
#include "callback.hpp"
#include <string>
#include <utility>

IPWATCH__NAMESPACE_BEGIN

/**
 * Address detection strategy.
 *
 * Lifecycle: created -> started -> stopped. A stopped tracker can not be
 * started again, construct a new instance instead.
 */
class address_tracker
{
private:
    address_callback_t _callback;

protected:
    void notify (std::string const & addr) const
    {
        if (_callback)
            _callback(addr);
    }

public:
    address_tracker () = default;
    address_tracker (address_tracker const &) = delete;
    address_tracker & operator = (address_tracker const &) = delete;

    virtual ~address_tracker () {}

public:
    /**
     * Sets the address change consumer. Must be called before start().
     */
    void register_callback (address_callback_t callback)
    {
        _callback = std::move(callback);
    }

    bool has_callback () const noexcept
    {
        return static_cast<bool>(_callback);
    }

    /**
     * Determines the current address synchronously.
     *
     * @throw ipwatch::error with errc::detection_error if no address can be
     *        determined.
     */
    virtual std::string get_current () = 0;

    /**
     * Starts background detection thread.
     */
    virtual void start () = 0;

    /**
     * Stops background detection and waits the thread to finish.
     * Safe to call if start() was never called.
     */
    virtual void stop () = 0;
};

IPWATCH__NAMESPACE_END
