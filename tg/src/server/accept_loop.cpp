/*
 * Part of the TwinGate (TG) project.
 *
 * SPDX-FileCopyrightText: 2025 TwinGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TwinGate (TG). See LICENSE for details.
 */

#include "tg/server.hpp"
#include "tg/log.hpp"
#include "tg/socket.hpp"
#include "tg/internal/auth_gate.hpp"
#include "tg/internal/backoff.hpp"
#include "tg/internal/net_utils.hpp"
#include "tg/internal/tls_upgrade.hpp"
#include "tg/internal/utils.hpp"

#include <chrono>
#include <cstring>
#include <cerrno>
#include <thread>

#include <sys/types.h>
#include <sys/socket.h>
#include <poll.h>
#include <unistd.h>

namespace tg {

// How long accept waits before re-checking the running flag.
static constexpr int kAcceptPollMs = 100;

static const char* loop_target(PeerClass cls) {
    return cls == PeerClass::Client ? "tcp.clientLoop" : "tcp.clusterLoop";
}

static void sleep_after_error(Log& log, const std::string& target, internal::AcceptBackoff& backoff) {
    const auto d = backoff.next();
    log.log(target, "Temporary error received, sleeping for " +
                    std::to_string(d.count()) + "ms");
    std::this_thread::sleep_for(d);
}

// The class stops serving so is_running() and a later serve_*() see the
// truth. `owned` is false when the fd is already invalid.
void Server::stop_listener(PeerClass cls, int listen_fd, bool owned) {
    const int fd = _reg.end_serving(cls);
    if (fd == listen_fd && owned) {
        (void)::close(fd);
    }
    _cfg.log->log(loop_target(cls), "Listener lost : stopped serving");
}

void Server::accept_loop(PeerClass cls, Handler h, BaseInfo info, int listen_fd) {
    const std::string target = loop_target(cls);
    Log& log = *_cfg.log;
    log.log(target, "Started");

    internal::AcceptBackoff backoff(std::chrono::milliseconds(_cfg.accept_min_sleep_ms),
                                    std::chrono::milliseconds(_cfg.accept_max_sleep_ms));

    while (_reg.running(cls)) {
        struct pollfd pfd;
        pfd.fd      = listen_fd;
        pfd.events  = POLLIN;
        pfd.revents = 0;
        int pr = ::poll(&pfd, 1, kAcceptPollMs);
        if (pr == 0) continue;
        if (pr < 0) {
            if (errno == EINTR) continue;
            log.error(target, std::strerror(errno), "Poll Error");
            sleep_after_error(log, target, backoff);
            continue;
        }
        if (pfd.revents & POLLNVAL) {
            log.error(target, "listener is not open", "Poll Error");
            stop_listener(cls, listen_fd, false);
            break;
        }

        sockaddr_storage cli{};
        socklen_t cl = sizeof(cli);
        int fd = ::accept(listen_fd, reinterpret_cast<sockaddr*>(&cli), &cl);
        if (fd < 0) {
            const int err = errno;
            if (err == EINTR) continue;
            log.error(target, std::strerror(err), "Accept Error");
            if (internal::is_listener_gone(err)) {
                stop_listener(cls, listen_fd, err != EBADF);
                break;
            }
            if (internal::is_temporary_accept_error(err)) {
                sleep_after_error(log, target, backoff);
            }
            continue;
        }

        backoff.reset();
        handle_accepted(cls, h, info, fd,
                        internal::sockaddr_to_ip(cli), internal::sockaddr_to_port(cli));
    }

    log.log(target, "Completed");
}

void Server::handle_accepted(PeerClass cls, const Handler& h, const BaseInfo& info,
                             int fd, const std::string& peer_ip, int peer_port)
{
    const std::string target = loop_target(cls);
    const std::string peer   = peer_ip + ":" + std::to_string(peer_port);
    Log& log = *_cfg.log;

    log.log(target, " New Connection : Addr[" + peer + "]");

    if (_cfg.max_connections > 0 &&
        _reg.size(cls) >= static_cast<std::size_t>(_cfg.max_connections)) {
        log.error(target, "limit " + std::to_string(_cfg.max_connections),
                  " New Connection : Addr[" + peer + "] : Maximum connections reached");
        ::close(fd);
        return;
    }
    (void)internal::set_nodelay(fd);

    auto sock = std::make_unique<Socket>(fd);

    BaseInfo conn_info;
    conn_info.addr        = peer_ip;
    conn_info.ip          = peer_ip;
    conn_info.port        = peer_port;
    conn_info.version     = VERSION;
    conn_info.build       = info.build;
    conn_info.server_id   = internal::random_uuid();
    conn_info.max_payload = _cfg.max_payload;

    if (_tls) {
        // Runs inline: a stalled handshake holds this loop until the deadline.
        if (!internal::upgrade_to_tls(*sock, _tls->ctx(),
                                      std::chrono::milliseconds(_cfg.tls_timeout_ms),
                                      log, target, peer)) {
            return;
        }
    }

    Connection conn{std::move(sock), _cfg, info, conn_info, cls, *this, *this, _stat};

    std::shared_ptr<Provider> provider;
    try {
        provider = h(conn);
    } catch (const std::exception& e) {
        log.error(target, e.what(), " New Connection : Addr[" + peer + "] : Failed Provider Creation");
        return;
    }
    if (!provider) {
        log.error(target, "handler returned no provider",
                  " New Connection : Addr[" + peer + "] : Failed Provider Creation");
        return;
    }

    const bool client = cls == PeerClass::Client;
    internal::AuthPolicy policy;
    policy.enabled       = _cfg.authenticate;
    policy.mandatory     = _cfg.must_authenticate;
    policy.authenticator = client ? _cfg.client_auth.get() : _cfg.cluster_auth.get();
    policy.credentials   = client ? &_cfg.client_credentials : &_cfg.cluster_credentials;

    const internal::AuthVerdict verdict = internal::authorize(policy, *provider);
    if (verdict != internal::AuthVerdict::Admit) {
        const bool no_cap = verdict == internal::AuthVerdict::RejectNoAuthCapability;
        log.error(target, internal::to_string(verdict),
                  " New Connection : Addr[" + peer + "] : " +
                  (no_cap ? "Provider does not implement ClientAuth" : "Authentication failed"));
        const std::string reason = no_cap
            ? "Error: Provider has no authentication. Authentication needed"
            : "Error: Authentication failed";
        if (!provider->send_message(reason, true)) {
            log.error(target, "send failed", " New Connection : Addr[" + peer + "] : Rejection not delivered");
        }
        if (!provider->close()) {
            log.error(target, "close failed", " New Connection : Addr[" + peer + "] : Rejected provider did not close");
        }
        return;
    }

    admit(cls, provider);
}

void Server::admit(PeerClass cls, const std::shared_ptr<Provider>& p) {
    const std::string target = loop_target(cls);
    if (!_reg.admit(cls, p)) {
        _cfg.log->error(target, "duplicate provider",
                        "Provider already registered : " + p->base_info().to_string());
        return;
    }
    if (cls == PeerClass::Client) {
        _stat.increment_clients();
    }

    // Deregisters the provider and fires the disconnect hooks once it
    // reports closure. Joined by close().
    _watchers.spawn([this, cls, p]() {
        p->close_notify().wait();
        (void)_reg.remove(cls, p);
    });
}

} // namespace tg
