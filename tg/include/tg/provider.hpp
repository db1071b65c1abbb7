/*
 * Part of the TwinGate (TG) project.
 *
 * SPDX-FileCopyrightText: 2025 TwinGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of TwinGate (TG). See LICENSE for details.
 */

#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "tg/base_info.hpp"
#include "tg/socket.hpp"
#include "tg/stat.hpp"
#include "tg/types.hpp"

namespace tg {

// One-shot "closed" signal. Fires once; later fire() calls are no-ops.
class CloseSignal {
public:
    void fire();
    bool fired() const;
    void wait();

    // Returns true if the signal fired within `d`.
    bool wait_for(std::chrono::milliseconds d);

private:
    mutable std::mutex _mtx;
    std::condition_variable _cv;
    bool _fired = false;
};

// Per-connection protocol implementation. Created by the server's handler
// and registered in exactly one population until close_notify() fires.
//
// Contract: once close() returns, close_notify() must fire eventually,
// since Server::close() waits for every admitted provider to report.
class Provider {
public:
    virtual ~Provider() = default;

    virtual bool close() = 0;
    virtual bool send_message(const std::string& msg, bool flush = true) = 0;
    virtual CloseSignal& close_notify() = 0;
    virtual BaseInfo base_info() const = 0;
};

// Optional capability of a Provider: credentials offered by the peer.
// Discovered with dynamic_cast when authentication is enabled.
class ClientAuth {
public:
    virtual ~ClientAuth() = default;
    virtual Credential credentials() const = 0;
};

// Pluggable per-class authentication backend.
class Authenticator {
public:
    virtual ~Authenticator() = default;
    virtual bool authenticate(const ClientAuth& who) = 0;
};

// Fan-out to a whole population.
class Broadcaster {
public:
    virtual ~Broadcaster() = default;
    virtual bool send_to_clients(const std::string& msg, bool flush = true) = 0;
    virtual bool send_to_clusters(const std::string& msg, bool flush = true) = 0;
};

// "Who is connected" queries.
class Connections {
public:
    virtual ~Connections() = default;
    virtual InfoList clients() const = 0;
    virtual InfoList clusters() const = 0;
};

struct ServerConfig;

// Everything a handler needs to turn an accepted socket into a Provider.
// The handler takes the socket with take_socket(); whatever it leaves
// behind is closed when the accept loop drops the context.
struct Connection {
    std::unique_ptr<Socket> socket;
    const ServerConfig&     config;
    BaseInfo                server_info;
    BaseInfo                connection_info;
    PeerClass               peer_class;
    Broadcaster&            broadcaster;
    Connections&            connections;
    Stat&                   stat;

    std::unique_ptr<Socket> take_socket() { return std::move(socket); }
};

// Returns nullptr (or throws std::exception) when no provider can be built.
using Handler = std::function<std::shared_ptr<Provider>(Connection&)>;

// Connect / disconnect callback.
using Hook = std::function<void(const std::shared_ptr<Provider>&)>;

} // namespace tg
