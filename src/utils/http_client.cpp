////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `ipwatch`.
//
// Changelog:
//      2026.10.19 Initial version.
//      2026.10.20 Requests are performed by libcurl.
////////////////////////////////////////////////////////////////////////////////
#include "ipwatch/utils/http_client.hpp"
#include "pfs/i18n.hpp"
#include <curl/curl.h>
#include <cstddef>
#include <memory>

IPWATCH__NAMESPACE_BEGIN

namespace utils {

namespace {

constexpr std::size_t MAX_BODY_SIZE = 64 * 1024;

class curl_global
{
    CURLcode _rc;

public:
    curl_global ()
        : _rc(curl_global_init(CURL_GLOBAL_DEFAULT))
    {}

    ~curl_global ()
    {
        if (_rc == CURLE_OK)
            curl_global_cleanup();
    }

    CURLcode result () const noexcept
    {
        return _rc;
    }
};

// curl_global_init() is not thread-safe, initialize once on first request
CURLcode startup ()
{
    static curl_global instance;
    return instance.result();
}

struct easy_deleter
{
    void operator () (CURL * handle) const
    {
        curl_easy_cleanup(handle);
    }
};

using easy_handle = std::unique_ptr<CURL, easy_deleter>;

// Returning less than passed aborts the transfer (CURLE_WRITE_ERROR)
std::size_t write_body (char * data, std::size_t size, std::size_t nmemb, void * userdata)
{
    auto body = static_cast<std::string *>(userdata);
    auto n = size * nmemb;

    if (body->size() + n > MAX_BODY_SIZE)
        return 0;

    body->append(data, n);
    return n;
}

} // namespace

http_response http_get (std::string const & url, std::chrono::milliseconds timeout, error * perr)
{
    auto rc = startup();

    if (rc != CURLE_OK) {
        pfs::throw_or(perr, error {
            tr::f_("libcurl initialization failure: {}", curl_easy_strerror(rc))
        });

        return http_response{};
    }

    easy_handle h {curl_easy_init()};

    if (!h) {
        pfs::throw_or(perr, error {tr::_("create libcurl handle failure")});
        return http_response{};
    }

    http_response resp;
    char errbuf[CURL_ERROR_SIZE];
    errbuf[0] = '\0';

    auto timeout_ms = static_cast<long>(timeout.count());

    curl_easy_setopt(h.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(h.get(), CURLOPT_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(h.get(), CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(h.get(), CURLOPT_NOSIGNAL, 1L); // Called from tracker threads
    curl_easy_setopt(h.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(h.get(), CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
    curl_easy_setopt(h.get(), CURLOPT_USERAGENT, "ipwatch");
    curl_easy_setopt(h.get(), CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(h.get(), CURLOPT_WRITEFUNCTION, & write_body);
    curl_easy_setopt(h.get(), CURLOPT_WRITEDATA, & resp.body);

    rc = curl_easy_perform(h.get());

    if (rc != CURLE_OK) {
        pfs::throw_or(perr, error {
            tr::f_("HTTP request to {} failure: {}", url
                , errbuf[0] != '\0' ? errbuf : curl_easy_strerror(rc))
        });

        return http_response{};
    }

    long status = 0;
    rc = curl_easy_getinfo(h.get(), CURLINFO_RESPONSE_CODE, & status);

    if (rc != CURLE_OK) {
        pfs::throw_or(perr, error {
            tr::f_("HTTP response status unavailable: {}", curl_easy_strerror(rc))
        });

        return http_response{};
    }

    resp.status = static_cast<int>(status);
    return resp;
}

} // namespace utils

IPWATCH__NAMESPACE_END
