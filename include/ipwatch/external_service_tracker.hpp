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
#include "address_family.hpp"
#include "exports.hpp"
#include "polling_tracker.hpp"
#include <chrono>
#include <string>

IPWATCH__NAMESPACE_BEGIN

/**
 * Polls a public HTTP(S) address-echo service for the externally visible address.
 * The response body is returned as is.
 */
class external_service_tracker: public polling_tracker
{
public:
    static constexpr char const * DEFAULT_INET4_URL = "https://api.ipify.org/";
    static constexpr char const * DEFAULT_INET6_URL = "https://api6.ipify.org/";

private:
    std::string _url;
    std::chrono::milliseconds _timeout;

public:
    /**
     * @param url Address-echo endpoint. If empty, the default endpoint for
     *        @a family is used.
     */
    IPWATCH__EXPORT external_service_tracker (address_family family
        , std::chrono::milliseconds update_interval
        , std::string const & url = std::string{}
        , std::chrono::milliseconds timeout = std::chrono::seconds{10});

    IPWATCH__EXPORT ~external_service_tracker ();

public:
    IPWATCH__EXPORT std::string get_current () override;

    std::string const & url () const noexcept
    {
        return _url;
    }
};

IPWATCH__NAMESPACE_END
