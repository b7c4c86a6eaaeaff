////////////////////////////////////////////////////////////////////////////////
// Copyright (c) 2026 Vladislav Trifochkin
//
// This file is part of `ipwatch`.
//
// Changelog:
//      2025.03.11 Initial version.
//      2025.04.07 Moved to tools.hpp.
//      2026.10.19 Reduced to waiting helpers and loopback HTTP responder.
//      2026.10.20 Silent responder mode.
////////////////////////////////////////////////////////////////////////////////
#pragma once
#include <pfs/countdown_timer.hpp>
#include <pfs/log.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cerrno>
#include <cstring>
#include <functional>
#include <string>
#include <thread>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace tools {

inline void sleep_ms (int timeout)
{
    std::this_thread::sleep_for(std::chrono::milliseconds{timeout});
}

inline bool wait_atomic_bool (std::atomic_bool & flag
    , std::chrono::milliseconds timelimit = std::chrono::milliseconds{5000})
{
    pfs::countdown_timer<std::milli> timer {timelimit};

    while (!flag.load() && timer.remain_count() > 0)
        std::this_thread::sleep_for(std::chrono::milliseconds{10});

    return flag.load();
}

template <typename AtomicCounter>
bool wait_atomic_counter (AtomicCounter & counter
    , typename AtomicCounter::value_type limit
    , std::chrono::milliseconds timelimit = std::chrono::milliseconds{5000})
{
    pfs::countdown_timer<std::milli> timer {timelimit};

    while (counter.load() < limit && timer.remain_count() > 0)
        std::this_thread::sleep_for(std::chrono::milliseconds{10});

    return counter.load() >= limit;
}

/**
 * Binds TCP socket to ephemeral loopback port and returns the port number.
 * Nothing listens on the port after return.
 */
inline std::uint16_t unused_loopback_port ()
{
    int sock = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);

    if (sock < 0)
        return 0;

    sockaddr_in addr;
    std::memset(& addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;

    socklen_t len = sizeof(addr);
    std::uint16_t port = 0;

    if (::bind(sock, reinterpret_cast<sockaddr *>(& addr), sizeof(addr)) == 0
            && ::getsockname(sock, reinterpret_cast<sockaddr *>(& addr), & len) == 0) {
        port = ntohs(addr.sin_port);
    }

    ::close(sock);
    return port;
}

/**
 * Serves every connection on loopback interface with the same canned raw
 * HTTP response. With empty response the connection is held open without
 * reply until the peer closes it.
 */
class http_responder
{
    int _listener {-1};
    std::uint16_t _port {0};
    std::string _response;
    std::atomic_bool _finish {false};
    std::atomic<int> _request_counter {0};
    std::thread _th;

public:
    http_responder (std::string response)
        : _response(std::move(response))
    {
        _listener = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);

        if (_listener < 0)
            return;

        int on = 1;
        ::setsockopt(_listener, SOL_SOCKET, SO_REUSEADDR, & on, sizeof(on));

        sockaddr_in addr;
        std::memset(& addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;

        socklen_t len = sizeof(addr);

        if (::bind(_listener, reinterpret_cast<sockaddr *>(& addr), sizeof(addr)) < 0
                || ::listen(_listener, 8) < 0
                || ::getsockname(_listener, reinterpret_cast<sockaddr *>(& addr), & len) < 0) {
            LOGE("", "loopback HTTP responder setup failure: {}", std::strerror(errno));
            ::close(_listener);
            _listener = -1;
            return;
        }

        _port = ntohs(addr.sin_port);
        _th = std::thread {& http_responder::run, this};
    }

    ~http_responder ()
    {
        _finish = true;

        if (_th.joinable())
            _th.join();

        if (_listener >= 0)
            ::close(_listener);
    }

    std::uint16_t port () const noexcept
    {
        return _port;
    }

    std::string url (std::string const & path = std::string{"/"}) const
    {
        return "http://127.0.0.1:" + std::to_string(_port) + path;
    }

    int request_count () const noexcept
    {
        return _request_counter.load();
    }

private:
    void run ()
    {
        while (!_finish) {
            pollfd pfd {_listener, POLLIN, 0};

            if (::poll(& pfd, 1, 20) <= 0)
                continue;

            int peer = ::accept4(_listener, nullptr, nullptr, SOCK_CLOEXEC);

            if (peer < 0)
                continue;

            serve(peer);
            ::close(peer);
        }
    }

    void serve (int peer)
    {
        std::string request;
        char buf[1024];

        while (request.find("\r\n\r\n") == std::string::npos) {
            pollfd pfd {peer, POLLIN, 0};

            if (::poll(& pfd, 1, 1000) <= 0)
                return;

            auto n = ::recv(peer, buf, sizeof(buf), 0);

            if (n <= 0)
                return;

            request.append(buf, static_cast<std::size_t>(n));
        }

        ++_request_counter;

        if (_response.empty()) {
            while (!_finish) {
                pollfd pfd {peer, POLLIN, 0};

                if (::poll(& pfd, 1, 20) > 0 && ::recv(peer, buf, sizeof(buf), 0) <= 0)
                    return;
            }

            return;
        }

        std::size_t offset = 0;

        while (offset < _response.size()) {
            auto n = ::send(peer, _response.data() + offset, _response.size() - offset, MSG_NOSIGNAL);

            if (n <= 0)
                return;

            offset += static_cast<std::size_t>(n);
        }
    }
};

inline std::string make_response (int status, std::string const & reason, std::string const & body)
{
    return "HTTP/1.1 " + std::to_string(status) + " " + reason + "\r\n"
        + "Content-Type: text/plain\r\n"
        + "Content-Length: " + std::to_string(body.size()) + "\r\n"
        + "Connection: close\r\n"
        + "\r\n"
        + body;
}

} // namespace tools
