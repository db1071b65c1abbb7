/*
 * Part of the TwinGate (TG) project.
 *
 * SPDX-FileCopyrightText: 2025 TwinGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TwinGate (TG). See LICENSE for details.
 */

#include "tg/internal/tls_upgrade.hpp"

#include <condition_variable>
#include <mutex>
#include <thread>

#include <sys/socket.h>

namespace tg::internal {

namespace {

// Out-of-band handshake timeout: shuts the fd down when the deadline
// passes before disarm(). Only shutdown(2) is used here; the owner of
// the fd still closes it, so the descriptor cannot be recycled under us.
class HandshakeWatchdog {
public:
    HandshakeWatchdog(int fd, std::chrono::milliseconds timeout,
                      Log& log, const std::string& target, const std::string& peer)
        : _fd(fd)
    {
        _th = std::thread([this, timeout, &log, target, peer]() {
            std::unique_lock<std::mutex> lk(_mtx);
            if (_cv.wait_for(lk, timeout, [&]{ return _disarmed; })) return;
            _fired = true;
            log.log(target, "Connection TLS Handshake Timeout : Addr[" + peer + "]");
            (void)::shutdown(_fd, SHUT_RDWR);
        });
    }

    ~HandshakeWatchdog() { disarm(); }

    // Stops the timer. Returns true if it had already fired.
    bool disarm() {
        {
            std::lock_guard<std::mutex> lk(_mtx);
            _disarmed = true;
        }
        _cv.notify_all();
        if (_th.joinable()) _th.join();
        std::lock_guard<std::mutex> lk(_mtx);
        return _fired;
    }

private:
    int _fd;
    std::mutex _mtx;
    std::condition_variable _cv;
    bool _disarmed = false;
    bool _fired = false;
    std::thread _th;
};

} // namespace

bool upgrade_to_tls(Socket& sock, SSL_CTX* ctx, std::chrono::milliseconds timeout,
                    Log& log, const std::string& target, const std::string& peer)
{
    if (!sock.attach_tls(ctx)) {
        log.error(target, sock.last_error(), " New Connection : Addr[" + peer + "] : TLS setup failed");
        sock.close();
        return false;
    }

    // Kernel deadline bounds each read/write inside SSL_accept; the
    // watchdog bounds the handshake as a whole.
    (void)sock.set_deadline(timeout);
    bool ok;
    bool expired;
    {
        HandshakeWatchdog dog(sock.fd(), timeout, log, target, peer);
        ok = sock.handshake();
        expired = dog.disarm();
    }
    (void)sock.clear_deadline();

    if (!ok || expired) {
        log.error(target, ok ? "handshake deadline exceeded" : sock.last_error(),
                  " New Connection : Addr[" + peer + "] : Failed Handshake");
        sock.close();
        return false;
    }
    return true;
}

} // namespace tg::internal
