////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `ipwatch`.
//
// Changelog:
//      2026.10.19 Initial version.
////////////////////////////////////////////////////////////////////////////////
#include "ipwatch/external_service_tracker.hpp"
#include "ipwatch/utils/http_client.hpp"
#include "pfs/i18n.hpp"
#include "pfs/log.hpp"

IPWATCH__NAMESPACE_BEGIN

static constexpr char const * TAG = "ipwatch::external";

constexpr char const * external_service_tracker::DEFAULT_INET4_URL;
constexpr char const * external_service_tracker::DEFAULT_INET6_URL;

external_service_tracker::external_service_tracker (address_family family
    , std::chrono::milliseconds update_interval
    , std::string const & url
    , std::chrono::milliseconds timeout)
    : polling_tracker(update_interval)
    , _url(url)
    , _timeout(timeout)
{
    if (_url.empty()) {
        _url = family == address_family::inet4
            ? DEFAULT_INET4_URL
            : DEFAULT_INET6_URL;
    }

    LOGD(TAG, "Using address-echo service: {}", _url);
}

external_service_tracker::~external_service_tracker ()
{
    stop();
}

std::string external_service_tracker::get_current ()
{
    error err;
    auto resp = utils::http_get(_url, _timeout, & err);

    if (err) {
        throw error {
              make_error_code(errc::detection_error)
            , tr::f_("request to address-echo service failure: {}", _url)
            , err.what()
        };
    }

    if (resp.status < 200 || resp.status >= 300) {
        throw error {
              make_error_code(errc::detection_error)
            , tr::f_("address-echo service {} responded with status {}", _url, resp.status)
        };
    }

    // Empty body carries no address
    if (resp.body.empty()) {
        throw error {
              make_error_code(errc::detection_error)
            , tr::f_("address-echo service {} responded with empty body", _url)
        };
    }

    return resp.body;
}

IPWATCH__NAMESPACE_END
