/*
 * Part of the TwinGate (TG) project.
 *
 * SPDX-FileCopyrightText: 2025 TwinGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TwinGate (TG). See LICENSE for details.
 */

#pragma once
#include <memory>
#include <mutex>
#include <string>

#include "tg/base_info.hpp"
#include "tg/provider.hpp"
#include "tg/server_config.hpp"
#include "tg/stat.hpp"
#include "tg/internal/registry.hpp"
#include "tg/internal/task_group.hpp"
#include "tg/internal/tls_ctx.hpp"

namespace tg {

// Dual-role TCP server: one listener for clients, one for cluster peers.
// Every accepted socket is (optionally) upgraded to TLS, turned into a
// Provider by the injected handler, authenticated, then registered until
// the provider reports closure.
class Server : public Broadcaster, public Connections {
public:
    // Throws std::runtime_error on unusable TLS material.
    explicit Server(const ServerConfig& cfg);
    ~Server() override;

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Bind the listener and start its accept loop. No-op while already
    // running. Throws on bind failure or on an authentication setup with
    // no credential source for the class.
    void serve_clients(Handler h);
    void serve_clusters(Handler h);

    // Stops both accept loops, closes the listeners and every registered
    // provider, and waits for their close notifications. No-op when not
    // running.
    void close();

    bool is_running() const;

    bool send_to_clients(const std::string& msg, bool flush = true) override;
    bool send_to_clusters(const std::string& msg, bool flush = true) override;

    InfoList clients() const override;
    InfoList clusters() const override;

    void on_client_connect(Hook fn);
    void on_client_disconnect(Hook fn);
    void on_cluster_connect(Hook fn);
    void on_cluster_disconnect(Hook fn);

    // Listener identities (resolved address and port once serving).
    BaseInfo client_info() const;
    BaseInfo cluster_info() const;

    const std::string& server_id() const { return _sid; }
    const ServerConfig& config() const { return _cfg; }
    Stat& stat() { return _stat; }
    const Stat& stat() const { return _stat; }

private:
    ServerConfig _cfg;
    std::string  _sid;
    Stat         _stat;
    std::unique_ptr<internal::TlsContext> _tls; // only when use_tls
    internal::Registry  _reg;
    internal::TaskGroup _loops;
    internal::TaskGroup _watchers;
    std::mutex _lifecycle_mtx; // serializes serve_*() against close()

    void serve(PeerClass cls, Handler h);
    void accept_loop(PeerClass cls, Handler h, BaseInfo info, int listen_fd);
    void stop_listener(PeerClass cls, int listen_fd, bool owned);

    // One accepted socket through TLS, handler, auth gate and admission.
    void handle_accepted(PeerClass cls, const Handler& h, const BaseInfo& info,
                         int fd, const std::string& peer_ip, int peer_port);

    void admit(PeerClass cls, const std::shared_ptr<Provider>& p);
    bool broadcast(PeerClass cls, const std::string& msg, bool flush);
    void validate_auth(PeerClass cls) const;
};

} // namespace tg
