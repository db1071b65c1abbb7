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
#include "tg/internal/net_utils.hpp"
#include "tg/internal/utils.hpp"

#include <stdexcept>
#include <string>
#include <cstring>
#include <cerrno>
#include <utility>

#include <unistd.h>

namespace tg {

// ---------- construction ----------

Server::Server(const ServerConfig& cfg)
    : _cfg(cfg)
{
    _cfg.init_log_and_trace();

    // --- Initialize TLS context if needed ---
    if (_cfg.use_tls) {
        try {
            _tls = std::make_unique<internal::TlsContext>(_cfg);
        } catch (const std::exception& e) {
            _cfg.log->error("tg.Server", e.what(), "Error parsing tls arguments");
            throw;
        }
    }

    _sid = internal::random_uuid();
    if (_sid.empty()) {
        throw std::runtime_error("failed to generate server id: " + internal::ssl_error_queue());
    }
}

Server::~Server() {
    close();
}

// ---------- listeners ----------

void Server::serve_clients(Handler h) {
    serve(PeerClass::Client, std::move(h));
}

void Server::serve_clusters(Handler h) {
    serve(PeerClass::Cluster, std::move(h));
}

void Server::validate_auth(PeerClass cls) const {
    if (!_cfg.authenticate) return;
    const bool client = cls == PeerClass::Client;
    const auto& auth  = client ? _cfg.client_auth : _cfg.cluster_auth;
    const auto& creds = client ? _cfg.client_credentials : _cfg.cluster_credentials;
    if (!auth && creds.empty()) {
        throw std::invalid_argument(std::string("authentication enabled but no authenticator or "
                                                "credentials configured for ") + to_string(cls) + "s");
    }
}

void Server::serve(PeerClass cls, Handler h) {
    const bool client = cls == PeerClass::Client;
    const std::string target = client ? "tcp.ServeClients" : "tcp.ServeClusters";
    const std::string& addr  = client ? _cfg.addr : _cfg.clusters_addr;
    const uint16_t     port  = client ? _cfg.port : _cfg.clusters_port;
    Log& log = *_cfg.log;

    log.log(target, std::string("Started : Initializing ") + to_string(cls) +
                    " service : Addr[" + addr + "] : Port[" + std::to_string(port) + "]");

    if (!h) {
        throw std::invalid_argument(target + ": handler is empty");
    }

    std::lock_guard<std::mutex> lk(_lifecycle_mtx);
    if (_reg.running(cls)) {
        log.log(target, "Completed");
        return;
    }
    validate_auth(cls);

    int fd = -1;
    try {
        fd = internal::create_listen_socket(addr, port);
    } catch (const std::exception& e) {
        log.error(target, e.what(), "Completed");
        throw;
    }

    BaseInfo info;
    info.addr        = addr;
    info.port        = port;
    info.version     = VERSION;
    info.build       = build_id();
    info.server_id   = _sid;
    info.max_payload = _cfg.max_payload;
    (void)internal::local_endpoint(fd, info.ip, info.port);

    if (!_reg.begin_serving(cls, fd, info)) {
        ::close(fd);
        log.log(target, "Completed");
        return;
    }

    _loops.spawn([this, cls, h = std::move(h), info, fd]() {
        accept_loop(cls, h, info, fd);
    });

    log.log(target, "Completed : Listening : " + info.to_string());
}

// ---------- shutdown ----------

void Server::close() {
    std::lock_guard<std::mutex> lk(_lifecycle_mtx);
    // An accept loop that lost its listener has already stopped serving,
    // but its class may still hold providers.
    if (_reg.idle()) {
        _loops.wait();
        return;
    }

    Log& log = *_cfg.log;
    log.log("tcp.Close", "Started");

    _reg.stop_all();
    _loops.wait();

    for (int fd : _reg.take_listeners()) {
        if (::close(fd) < 0) {
            log.error("tcp.Close", std::strerror(errno), "Failed To Close Listener");
        }
    }

    for (const auto& p : _reg.members(PeerClass::Client)) {
        if (!p->close()) {
            log.error("tcp.Close", "close failed", "Failed To Close Client : " + p->base_info().to_string());
        }
    }
    for (const auto& p : _reg.members(PeerClass::Cluster)) {
        if (!p->close()) {
            log.error("tcp.Close", "close failed", "Failed To Close Cluster : " + p->base_info().to_string());
        }
    }

    // Every admitted provider reports closure; its watcher deregisters it.
    _watchers.wait();

    log.log("tcp.Close", "Completed");
}

bool Server::is_running() const {
    return _reg.any_running();
}

// ---------- broadcast ----------

bool Server::send_to_clients(const std::string& msg, bool flush) {
    return broadcast(PeerClass::Client, msg, flush);
}

bool Server::send_to_clusters(const std::string& msg, bool flush) {
    return broadcast(PeerClass::Cluster, msg, flush);
}

bool Server::broadcast(PeerClass cls, const std::string& msg, bool flush) {
    const bool client = cls == PeerClass::Client;
    const std::string target = client ? "SendToClients" : "SendToClusters";
    Log&   log   = *_cfg.log;
    Trace& trace = *_cfg.trace;

    log.log(target, "Started : Data[" + msg + "]");

    const std::string self = _reg.listener_info(cls).to_string();
    std::size_t failed = 0;

    _reg.for_each(cls, [&](const std::shared_ptr<Provider>& p) {
        const std::string peer = p->base_info().to_string();

        std::string t;
        t.reserve(msg.size() + self.size() + peer.size() + 64);
        t += "Trace: " + target + "\n";
        t += "Server: " + self + "\n";
        t += (client ? "ToClient: " : "ToCluster: ") + peer + "\n";
        t += "Data: " + msg + "\n";
        trace.trace(t);

        if (!p->send_message(msg, flush)) {
            ++failed;
            log.error(target, "send failed",
                      std::string("Failed to deliver to ") + to_string(cls) + " : Info[" + peer + "]");
        }

        trace.trace("End Trace");
    });

    log.log(target, "Completed : Failed[" + std::to_string(failed) + "]");
    return !(failed > 0 && _cfg.broadcast_reports_failures);
}

// ---------- queries and hooks ----------

InfoList Server::clients() const {
    return _reg.snapshot(PeerClass::Client);
}

InfoList Server::clusters() const {
    return _reg.snapshot(PeerClass::Cluster);
}

void Server::on_client_connect(Hook fn)     { _reg.add_connect_hook(PeerClass::Client, std::move(fn)); }
void Server::on_client_disconnect(Hook fn)  { _reg.add_disconnect_hook(PeerClass::Client, std::move(fn)); }
void Server::on_cluster_connect(Hook fn)    { _reg.add_connect_hook(PeerClass::Cluster, std::move(fn)); }
void Server::on_cluster_disconnect(Hook fn) { _reg.add_disconnect_hook(PeerClass::Cluster, std::move(fn)); }

BaseInfo Server::client_info() const {
    return _reg.listener_info(PeerClass::Client);
}

BaseInfo Server::cluster_info() const {
    return _reg.listener_info(PeerClass::Cluster);
}

} // namespace tg
